#include <iostream>
#include <string>
#include <thread>
#include <atomic>
#include <mutex>
#include <condition_variable>
#include <stdexcept>
#include <cerrno>

#include <sqlite3.h>

#include "TestSupport.hpp"
#include "Database.hpp"
#include "HashCache.hpp"
#include "FileHasher.hpp"
#include "DeduplicationEngine.hpp"
#include "FileProcessor.hpp"
#include "SessionManager.hpp"
#include "Orchestrator.hpp"
#include "FileCopier.hpp"
#include "Errors.hpp"

using namespace TestSupport;
namespace FS = std::filesystem;

namespace
{
    // Image processor whose transfers block until the test opens the gate.
    class GatedImageProcessor : public ImageProcessor
    {
    public:
        CopyOutcome Transfer(const FS::path& Source, const FS::path& Destination) const override
        {
            ++Entered;
            {
                std::unique_lock<std::mutex> Lock(GateMutex);
                Gate_CV.wait(Lock, [this] { return Open; });
            }
            return ImageProcessor::Transfer(Source, Destination);
        }

        void OpenGate()
        {
            {
                std::lock_guard<std::mutex> Lock(GateMutex);
                Open = true;
            }
            Gate_CV.notify_all();
        }

        mutable std::atomic<int> Entered{0};

    private:
        mutable std::mutex GateMutex;
        mutable std::condition_variable Gate_CV;
        bool Open = false;
    };

    // Copies the first file, then reports the destination full.
    class FillingImageProcessor : public ImageProcessor
    {
    public:
        CopyOutcome Transfer(const FS::path& Source, const FS::path& Destination) const override
        {
            if (++Entered > 1)
            {
                FileCopier::RaiseIoError("Write failed while copying " + Source.string(), ENOSPC);
            }
            return ImageProcessor::Transfer(Source, Destination);
        }

        mutable std::atomic<int> Entered{0};
    };

    // Loses the files table right after the first copy lands.
    class StoreLosingImageProcessor : public ImageProcessor
    {
    public:
        explicit StoreLosingImageProcessor(FS::path DbFile) : DbFile(std::move(DbFile)) {}

        CopyOutcome Transfer(const FS::path& Source, const FS::path& Destination) const override
        {
            CopyOutcome Outcome = ImageProcessor::Transfer(Source, Destination);
            if (++Entered == 1)
            {
                sqlite3* Raw = nullptr;
                sqlite3_open(DbFile.string().c_str(), &Raw);
                sqlite3_busy_timeout(Raw, 5000);
                sqlite3_exec(Raw, "DROP TABLE files", nullptr, nullptr, nullptr);
                sqlite3_close(Raw);
            }
            return Outcome;
        }

        mutable std::atomic<int> Entered{0};

    private:
        FS::path DbFile;
    };

    class BrokenAudioProcessor : public AudioProcessor
    {
    public:
        bool Handles(const std::string&) const override
        {
            throw std::logic_error("extension table corrupted");
        }
    };

    struct Harness
    {
        explicit Harness(const FS::path& Destination)
            : Store((Destination / "db" / "duplisort.db").string()), Cache(&Store), Hasher(&Cache),
              Dedup(Store, Hasher), Sessions(Store), Registry(ProcessorRegistry::CreateDefault())
        {
        }

        Database Store;
        HashCache Cache;
        FileHasher Hasher;
        DeduplicationEngine Dedup;
        SessionManager Sessions;
        std::unique_ptr<ProcessorRegistry> Registry;
    };

    OrchestratorOptions TestOptions(size_t Threads)
    {
        OrchestratorOptions Options;
        Options.ThreadCount = Threads;
        Options.ProgressIntervalMs = 20;
        Options.StopTimeoutSeconds = 5;
        Options.MinFreeSpaceBytes = 0;
        return Options;
    }

    // Runs Start or ResumeSession on a background thread.
    class BackgroundRun
    {
    public:
        template <typename Fn>
        explicit BackgroundRun(Fn Body)
        {
            Runner = std::thread([this, Body]()
            {
                try
                {
                    Final = Body();
                }
                catch (const DupliSortError& e)
                {
                    Failure = e.what();
                }
                Done = true;
            });
        }

        ~BackgroundRun()
        {
            if (Runner.joinable())
            {
                Runner.join();
            }
        }

        OrchestratorState Join()
        {
            Runner.join();
            return Final;
        }

        std::atomic<bool> Done{false};
        OrchestratorState Final = OrchestratorState::Idle;
        std::string Failure;

    private:
        std::thread Runner;
    };

    void WritePhotos(const FS::path& Source, int Count)
    {
        for (int i = 0; i < Count; ++i)
        {
            WriteFile(Source / ("photo" + std::to_string(i) + ".jpg"), "photo body " + std::to_string(i));
        }
    }
}

int main()
{
    std::cout << "[Test] Starting orchestrator tests..." << std::endl;

    {
        std::cout << "[Test] Scenario {a.jpg, b.jpg, c.txt}" << std::endl;
        TempDir Dir("duplisort_orch_basic");
        WriteFile(Dir / "src" / "a.jpg", "identical");
        WriteFile(Dir / "src" / "b.jpg", "identical");
        WriteFile(Dir / "src" / "c.txt", "text");

        Harness H(Dir / "dest");
        Orchestrator Runner(H.Store, H.Sessions, H.Dedup, H.Hasher, *H.Registry, TestOptions(2));
        std::atomic<int> Callbacks{0};
        Runner.SetProgressCallback([&Callbacks](const ProcessingProgress&) { ++Callbacks; });

        OrchestratorState Final = Runner.Start((Dir / "src").string(), (Dir / "dest").string());
        ProcessingProgress Progress = Runner.GetProgress();
        Check(Final == OrchestratorState::Completed && Runner.GetState() == OrchestratorState::Completed, "run completes");
        Check(Progress.Processed == 2, "two files processed");
        Check(Progress.Duplicates == 1, "one duplicate");
        Check(FS::exists(Dir / "dest" / "Documents" / "Text" / "c.txt"), "c.txt under Documents/Text");
        Check(Progress.Finished() == Progress.TotalFiles && Progress.TotalFiles == 3, "every scanned file accounted for");
        Check(Callbacks > 0, "progress callback invoked");

        auto Row = H.Sessions.GetSession(Runner.GetSessionId());
        Check(Row && Row->Status == SessionStatus::Completed && Row->EndTime.has_value(), "session completed with end time");
        Check(Row && Row->Counters.FilesProcessed == 2 && Row->Counters.Duplicates == 1, "session counters stored");
        Check(!FS::exists(Runner.SnapshotPath(Dir / "dest")), "snapshot cleared on completion");
    }

    {
        std::cout << "[Test] Accounting under concurrency" << std::endl;
        TempDir Dir("duplisort_orch_accounting");
        WritePhotos(Dir / "src", 30);
        for (int i = 0; i < 10; ++i)
        {
            WriteFile(Dir / "src" / "dups" / ("copy" + std::to_string(i) + ".jpg"), "photo body " + std::to_string(i));
        }
        for (int i = 0; i < 5; ++i)
        {
            WriteFile(Dir / "src" / "misc" / ("blob" + std::to_string(i) + ".bin"), "binary");
        }
        WriteFile(Dir / "src" / "misc" / "doc.pdf", "%PDF");

        Harness H(Dir / "dest");
        Orchestrator Runner(H.Store, H.Sessions, H.Dedup, H.Hasher, *H.Registry, TestOptions(4));
        OrchestratorState Final = Runner.Start((Dir / "src").string(), (Dir / "dest").string());
        ProcessingProgress Progress = Runner.GetProgress();

        Check(Final == OrchestratorState::Completed, "concurrent run completes");
        Check(Progress.TotalFiles == 46, "all files scanned");
        Check(Progress.Processed + Progress.Skipped + Progress.Duplicates + Progress.Errors == 46, "processed + skipped + duplicates + errors == scanned");
        Check(Progress.Duplicates == 10 && Progress.Processed == 31 && Progress.Skipped == 5, "outcome split matches content");
        Check(CountRegularFiles(Dir / "dest" / "Images") == 30, "one copy per distinct image");
        Check(H.Dedup.PendingClaims() == 0, "no claims left behind");
    }

    {
        std::cout << "[Test] Pause and resume" << std::endl;
        TempDir Dir("duplisort_orch_pause");
        WritePhotos(Dir / "src", 10);

        Harness H(Dir / "dest");
        auto Gated = std::make_unique<GatedImageProcessor>();
        GatedImageProcessor* Gate = Gated.get();
        H.Registry->Register(std::move(Gated));

        Orchestrator Runner(H.Store, H.Sessions, H.Dedup, H.Hasher, *H.Registry, TestOptions(1));
        BackgroundRun Run([&Runner, &Dir]() { return Runner.Start((Dir / "src").string(), (Dir / "dest").string()); });

        Check(WaitFor([Gate] { return Gate->Entered == 1; }, std::chrono::seconds(10)), "first transfer in flight");
        Runner.Pause();
        Check(Runner.GetState() == OrchestratorState::Paused, "state is paused");

        bool Threw = false;
        try
        {
            Runner.Pause();
        }
        catch (const OrchestratorError&)
        {
            Threw = true;
        }
        Check(Threw && Runner.GetState() == OrchestratorState::Paused, "pause while paused rejected without state change");

        Gate->OpenGate();
        std::this_thread::sleep_for(std::chrono::milliseconds(300));
        Check(Gate->Entered == 1, "no new file starts while paused");
        Check(!Run.Done, "run waits while paused");

        auto Row = H.Sessions.GetSession(Runner.GetSessionId());
        Check(Row && Row->Status == SessionStatus::Paused, "session marked paused");

        Runner.Resume();
        OrchestratorState Final = Run.Join();
        Check(Final == OrchestratorState::Completed, "run completes after resume");
        Check(Runner.GetProgress().Processed == 10, "all files processed after resume");
    }

    {
        std::cout << "[Test] Stop then resume" << std::endl;
        TempDir Dir("duplisort_orch_stop");
        WritePhotos(Dir / "src", 10);

        int64_t SessionId = 0;
        {
            Harness H(Dir / "dest");
            auto Gated = std::make_unique<GatedImageProcessor>();
            GatedImageProcessor* Gate = Gated.get();
            H.Registry->Register(std::move(Gated));

            Orchestrator Runner(H.Store, H.Sessions, H.Dedup, H.Hasher, *H.Registry, TestOptions(1));
            BackgroundRun Run([&Runner, &Dir]() { return Runner.Start((Dir / "src").string(), (Dir / "dest").string()); });

            Check(WaitFor([Gate] { return Gate->Entered == 1; }, std::chrono::seconds(10)), "transfer in flight before stop");
            Runner.Stop();
            Check(Runner.GetState() == OrchestratorState::Stopping, "state is stopping");
            Runner.Stop();
            Gate->OpenGate();

            OrchestratorState Final = Run.Join();
            Check(Final == OrchestratorState::Stopped, "run stops");
            Check(Runner.GetProgress().Processed == 1, "in-flight file finished, nothing new started");
            SessionId = Runner.GetSessionId();

            auto Row = H.Sessions.GetSession(SessionId);
            Check(Row && Row->Status == SessionStatus::Stopped, "session marked stopped");
            Check(FS::exists(Runner.SnapshotPath(Dir / "dest")), "snapshot kept for resume");
            Check(SessionManager::LoadProgress(Runner.SnapshotPath(Dir / "dest"))->State == OrchestratorState::Stopped, "snapshot records the stop");
        }

        {
            Harness H(Dir / "dest");
            Orchestrator Runner(H.Store, H.Sessions, H.Dedup, H.Hasher, *H.Registry, TestOptions(2));
            OrchestratorState Final = Runner.ResumeSession(SessionId);
            ProcessingProgress Progress = Runner.GetProgress();

            Check(Final == OrchestratorState::Completed, "resumed run completes");
            Check(Runner.GetSessionId() == SessionId, "resume keeps the session id");
            Check(Progress.AlreadyProcessed == 1 && Progress.Processed == 9, "only unfinished files processed");
            Check(CountRegularFiles(Dir / "dest" / "Images") == 10, "no file copied twice");
        }
    }

    {
        std::cout << "[Test] Invalid transitions" << std::endl;
        TempDir Dir("duplisort_orch_transitions");
        Harness H(Dir / "dest");
        Orchestrator Runner(H.Store, H.Sessions, H.Dedup, H.Hasher, *H.Registry, TestOptions(1));

        auto Rejected = [&Runner](const std::function<void()>& Request)
        {
            OrchestratorState Before = Runner.GetState();
            try
            {
                Request();
            }
            catch (const OrchestratorError&)
            {
                return Runner.GetState() == Before;
            }
            return false;
        };

        Check(Rejected([&Runner] { Runner.Pause(); }), "pause from idle rejected");
        Check(Rejected([&Runner] { Runner.Resume(); }), "resume from idle rejected");
        Runner.Stop();
        Check(Runner.GetState() == OrchestratorState::Stopped, "stop from idle stops");
        Check(Rejected([&Runner] { Runner.Stop(); }), "stop after stopped rejected");
        Check(Rejected([&Runner] { Runner.Resume(); }), "resume after stopped rejected");
    }

    {
        std::cout << "[Test] Insufficient space" << std::endl;
        TempDir Dir("duplisort_orch_space");
        WritePhotos(Dir / "src", 2);

        Harness H(Dir / "dest");
        OrchestratorOptions Options = TestOptions(1);
        Options.MinFreeSpaceBytes = 1ULL << 62;
        Orchestrator Runner(H.Store, H.Sessions, H.Dedup, H.Hasher, *H.Registry, Options);

        bool Threw = false;
        try
        {
            Runner.Start((Dir / "src").string(), (Dir / "dest").string());
        }
        catch (const InsufficientSpaceError& e)
        {
            Threw = e.RequiredBytes > e.AvailableBytes;
        }
        Check(Threw, "pre-flight check raises InsufficientSpaceError");
        Check(Runner.GetState() == OrchestratorState::Error, "state is error");
        auto Row = H.Sessions.GetSession(Runner.GetSessionId());
        Check(Row && Row->Status == SessionStatus::Error && Row->ErrorMessage.has_value(), "session records the failure");
        Check(!FS::exists(Dir / "dest" / "Images"), "nothing copied");
    }

    {
        std::cout << "[Test] Non UTF-8 file name" << std::endl;
        TempDir Dir("duplisort_orch_latin1");
        WriteFile(Dir / "src" / "caf\xe9.jpg", "latin-1 name");

        Harness H(Dir / "dest");
        Orchestrator Runner(H.Store, H.Sessions, H.Dedup, H.Hasher, *H.Registry, TestOptions(1));
        OrchestratorState Final = Runner.Start((Dir / "src").string(), (Dir / "dest").string());

        Check(Final == OrchestratorState::Completed, "run with a Latin-1 name completes");
        Check(Runner.GetProgress().Processed == 1, "file processed");
        Check(CountRegularFiles(Dir / "dest" / "Images") == 1, "file copied");
        auto Row = H.Sessions.GetSession(Runner.GetSessionId());
        Check(Row && Row->Status == SessionStatus::Completed, "session completed");
    }

    {
        std::cout << "[Test] Destination fills up mid-run" << std::endl;
        TempDir Dir("duplisort_orch_full");
        WritePhotos(Dir / "src", 10);

        Harness H(Dir / "dest");
        auto Filling = std::make_unique<FillingImageProcessor>();
        FillingImageProcessor* Disk = Filling.get();
        H.Registry->Register(std::move(Filling));

        Orchestrator Runner(H.Store, H.Sessions, H.Dedup, H.Hasher, *H.Registry, TestOptions(1));
        OrchestratorState Final = Runner.Start((Dir / "src").string(), (Dir / "dest").string());
        ProcessingProgress Progress = Runner.GetProgress();

        Check(Final == OrchestratorState::Error, "full destination ends the run in error");
        Check(Progress.Processed == 1 && Progress.Errors == 1, "one file copied, one failed");
        Check(Disk->Entered == 2, "no file started after the disk filled");
        Check(CountRegularFiles(Dir / "dest" / "Images") == 1, "only the first copy on disk");
        auto Row = H.Sessions.GetSession(Runner.GetSessionId());
        Check(Row && Row->Status == SessionStatus::Error && Row->ErrorMessage.has_value(), "session records why it stopped");
    }

    {
        std::cout << "[Test] Store lost mid-run" << std::endl;
        TempDir Dir("duplisort_orch_store");
        WritePhotos(Dir / "src", 10);

        Harness H(Dir / "dest");
        auto Losing = std::make_unique<StoreLosingImageProcessor>(Dir / "dest" / "db" / "duplisort.db");
        StoreLosingImageProcessor* Loser = Losing.get();
        H.Registry->Register(std::move(Losing));

        Orchestrator Runner(H.Store, H.Sessions, H.Dedup, H.Hasher, *H.Registry, TestOptions(1));
        OrchestratorState Final = Runner.Start((Dir / "src").string(), (Dir / "dest").string());

        Check(Final == OrchestratorState::Error, "store failure ends the run in error");
        Check(Runner.GetProgress().Processed == 0, "nothing counted as processed");
        Check(Loser->Entered == 1, "no file started after the store failed");
        Check(CountRegularFiles(Dir / "dest" / "Images") == 0, "unrecorded copy removed");
        auto Row = H.Sessions.GetSession(Runner.GetSessionId());
        Check(Row && Row->Status == SessionStatus::Error && Row->ErrorMessage.has_value(), "session records the store failure");
    }

    {
        std::cout << "[Test] Unexpected exception during scan" << std::endl;
        TempDir Dir("duplisort_orch_unexpected");
        WriteFile(Dir / "src" / "song.mp3", "audio");

        Harness H(Dir / "dest");
        H.Registry->Register(std::make_unique<BrokenAudioProcessor>());
        Orchestrator Runner(H.Store, H.Sessions, H.Dedup, H.Hasher, *H.Registry, TestOptions(1));

        bool Rethrown = false;
        try
        {
            Runner.Start((Dir / "src").string(), (Dir / "dest").string());
        }
        catch (const std::logic_error&)
        {
            Rethrown = true;
        }
        Check(Rethrown, "exception reaches the caller");
        Check(Runner.GetState() == OrchestratorState::Error, "state is error");
        auto Row = H.Sessions.GetSession(Runner.GetSessionId());
        Check(Row && Row->Status == SessionStatus::Error, "session not left running");
        Check(H.Sessions.CreateSession((Dir / "src").string(), (Dir / "dest").string(), "{}") > 0, "destination free for a new session");
    }

    {
        std::cout << "[Test] Pause after the last file" << std::endl;
        TempDir Dir("duplisort_orch_latepause");
        WritePhotos(Dir / "src", 3);

        Harness H(Dir / "dest");
        OrchestratorOptions Options = TestOptions(1);
        Options.ProgressIntervalMs = 1;
        Orchestrator Runner(H.Store, H.Sessions, H.Dedup, H.Hasher, *H.Registry, Options);

        std::atomic<bool> PauseAccepted{false};
        Runner.SetProgressCallback([&Runner, &PauseAccepted](const ProcessingProgress& Current)
        {
            if (PauseAccepted || Current.State != OrchestratorState::Processing || Current.TotalFiles == 0 ||
                Current.Finished() != Current.TotalFiles)
            {
                return;
            }
            try
            {
                Runner.Pause();
                PauseAccepted = true;
            }
            catch (const OrchestratorError&)
            {
            }
        });

        BackgroundRun Run([&Runner, &Dir]() { return Runner.Start((Dir / "src").string(), (Dir / "dest").string()); });
        Check(WaitFor([&Run, &PauseAccepted] { return Run.Done || PauseAccepted; }, std::chrono::seconds(10)), "run finished or paused");
        if (PauseAccepted)
        {
            try
            {
                Runner.Resume();
            }
            catch (const OrchestratorError&)
            {
                // Workers had already drained; the run finished on its own.
            }
        }

        OrchestratorState Final = Run.Join();
        Check(Final == OrchestratorState::Completed, "run completes");
        auto Row = H.Sessions.GetSession(Runner.GetSessionId());
        Check(Row && Row->Status == SessionStatus::Completed, "session status matches the final state");
    }

    return Finish("Orchestrator");
}
