#include <iostream>
#include <string>

#include <sqlite3.h>

#include "TestSupport.hpp"
#include "Database.hpp"
#include "HashCache.hpp"
#include "FileHasher.hpp"
#include "DeduplicationEngine.hpp"
#include "FileProcessor.hpp"
#include "SessionManager.hpp"
#include "Orchestrator.hpp"
#include "Errors.hpp"

using namespace TestSupport;
namespace FS = std::filesystem;

namespace
{
    void ForceSchemaVersion(const FS::path& DbFile, int Version)
    {
        sqlite3* Raw = nullptr;
        sqlite3_open(DbFile.string().c_str(), &Raw);
        std::string Sql = "UPDATE schema_version SET version = " + std::to_string(Version);
        sqlite3_exec(Raw, Sql.c_str(), nullptr, nullptr, nullptr);
        sqlite3_close(Raw);
    }

    OrchestratorState RunOnce(Database& Store, SessionManager& Sessions, FileHasher& Hasher, DeduplicationEngine& Dedup,
        const FS::path& Source, const FS::path& Dest, ProcessingProgress& Progress, int64_t& SessionId)
    {
        auto Registry = ProcessorRegistry::CreateDefault();

        OrchestratorOptions Options;
        Options.ThreadCount = 2;
        Options.ProgressIntervalMs = 20;
        Orchestrator Runner(Store, Sessions, Dedup, Hasher, *Registry, Options);
        OrchestratorState Final = Runner.Start(Source.string(), Dest.string());
        Progress = Runner.GetProgress();
        SessionId = Runner.GetSessionId();
        return Final;
    }
}

int main()
{
    std::cout << "[Test] Starting session manager tests..." << std::endl;

    {
        std::cout << "[Test] Session lifecycle" << std::endl;
        TempDir Dir("duplisort_sessions");
        FS::create_directories(Dir / "src");
        Database Store((Dir / "dest" / "db" / "duplisort.db").string());
        SessionManager Sessions(Store);

        const std::string Source = (Dir / "src").string();
        const std::string Dest = (Dir / "dest").string();
        int64_t First = Sessions.CreateSession(Source, Dest, "{}");
        auto Row = Sessions.GetSession(First);
        Check(Row && Row->Status == SessionStatus::Running && !Row->EndTime, "new session is running without end time");

        bool Busy = false;
        try
        {
            Sessions.CreateSession(Source, Dest, "{}");
        }
        catch (const OrchestratorError&)
        {
            Busy = true;
        }
        Check(Busy, "second active session for the same destination rejected");

        Sessions.UpdateStatus(First, SessionStatus::Stopped);
        Row = Sessions.GetSession(First);
        Check(Row && Row->Status == SessionStatus::Stopped && Row->EndTime.has_value(), "stopping stamps the end time");

        bool Reopened = false;
        try
        {
            Reopened = Sessions.OpenForResume(First).Id == First;
        }
        catch (const ResumeError&)
        {
        }
        Check(Reopened, "stopped session can be resumed");

        int64_t Second = Sessions.CreateSession(Source, Dest, "{}");
        Check(Second != First, "new session allowed once the old one stopped");
        Check(Sessions.ListSessions().size() == 2, "both sessions listed");

        auto Resumable = Sessions.FindResumable();
        Check(Resumable && Resumable->Id == Second, "running session is resumable");

        FS::remove_all(Dir / "src");
        int64_t Reported = 0;
        try
        {
            Sessions.FindResumable();
        }
        catch (const ResumeError& e)
        {
            Reported = e.SessionId;
        }
        Check(Reported == Second, "vanished source names the session in ResumeError");

        Sessions.UpdateStatus(Second, SessionStatus::Completed);
        bool Refused = false;
        try
        {
            Sessions.OpenForResume(Second);
        }
        catch (const ResumeError& e)
        {
            Refused = e.SessionId == Second;
        }
        Check(Refused, "completed session cannot be resumed");
        Check(!Sessions.FindResumable().has_value(), "nothing left to resume");
    }

    {
        std::cout << "[Test] Undo" << std::endl;
        TempDir Dir("duplisort_undo");
        WriteFile(Dir / "src" / "a.jpg", "same");
        WriteFile(Dir / "src" / "b.jpg", "same");
        WriteFile(Dir / "src" / "notes.txt", "words");
        WriteFile(Dir / "dest" / "Images" / "mine.txt", "placed by hand");

        const FS::path DbFile = Dir / "dest" / "db" / "duplisort.db";
        Database Store(DbFile.string());
        SessionManager Sessions(Store);
        // One engine across both runs, as in a long-lived process.
        HashCache Cache(&Store);
        FileHasher Hasher(&Cache);
        DeduplicationEngine Dedup(Store, Hasher);

        ProcessingProgress Progress;
        int64_t SessionId = 0;
        OrchestratorState Final = RunOnce(Store, Sessions, Hasher, Dedup, Dir / "src", Dir / "dest", Progress, SessionId);
        Check(Final == OrchestratorState::Completed && Progress.Processed == 2 && Progress.Duplicates == 1, "run copied two files");
        Check(CountRegularFiles(Dir / "dest", "db") == 3, "two copies next to the hand-placed file");

        UndoReport Preview = Sessions.Undo(SessionId, true);
        Check(Preview.FilesDeleted == 2 && Preview.FilesFailed == 0, "dry run counts the copied files");
        // Images/Originals/<year>, Images/Originals, Documents/Text, Documents
        Check(Preview.DirsDeleted == 4, "dry run counts directories that would become empty");
        Check(CountRegularFiles(Dir / "dest", "db") == 3, "dry run leaves files in place");
        Check(Sessions.GetSession(SessionId)->Status == SessionStatus::Completed, "dry run leaves the session status");

        UndoReport Done = Sessions.Undo(SessionId, false);
        Check(Done.FilesDeleted == Preview.FilesDeleted && Done.DirsDeleted == Preview.DirsDeleted, "real undo matches the preview");
        Check(Done.Errors.empty(), "undo reports no errors");
        Check(CountRegularFiles(Dir / "dest", "db") == 1, "only the hand-placed file remains");
        Check(FS::exists(Dir / "dest" / "Images" / "mine.txt"), "unrelated file kept");
        Check(!FS::exists(Dir / "dest" / "Documents"), "emptied directories removed");
        Check(FS::exists(Dir / "dest") && FS::exists(DbFile), "destination root and store kept");
        Check(Sessions.GetSession(SessionId)->Status == SessionStatus::Undone, "session marked undone");

        UndoReport Again = Sessions.Undo(SessionId, false);
        Check(Again.FilesDeleted == 0 && Again.DirsDeleted == 0, "second undo is a no-op");

        // Originals were deleted, so the next run must copy them again.
        int64_t NextId = 0;
        Final = RunOnce(Store, Sessions, Hasher, Dedup, Dir / "src", Dir / "dest", Progress, NextId);
        Check(Final == OrchestratorState::Completed && Progress.Processed == 2 && Progress.Duplicates == 1, "re-run after undo copies again");
        Check(NextId != SessionId, "re-run gets a new session");
        Check(CountRegularFiles(Dir / "dest", "db") == 3, "re-run put both copies back");

        bool Missing = false;
        try
        {
            Sessions.Undo(9999, true);
        }
        catch (const DupliSortError&)
        {
            Missing = true;
        }
        Check(Missing, "undo of an unknown session raises");
    }

    {
        std::cout << "[Test] Schema version" << std::endl;
        TempDir Dir("duplisort_schema");
        const FS::path DbFile = Dir / "duplisort.db";
        {
            Database Store(DbFile.string());
        }
        ForceSchemaVersion(DbFile, 99);

        int Found = 0;
        try
        {
            Database Store(DbFile.string());
        }
        catch (const SchemaVersionError& e)
        {
            Found = e.FoundVersion;
        }
        Check(Found == 99, "mismatched schema version refused");
    }

    {
        std::cout << "[Test] Progress snapshot" << std::endl;
        TempDir Dir("duplisort_snapshot");
        const FS::path Snapshot = Dir / "conf" / "progress.json";

        ProcessingProgress Saved;
        Saved.State = OrchestratorState::Stopped;
        Saved.SessionId = 12;
        Saved.TotalFiles = 40;
        Saved.Processed = 25;
        Saved.Duplicates = 3;
        Saved.BytesProcessed = 123456;
        Saved.CategoryCounts["Originals"] = 25;
        Saved.LastError = "disk hiccup";
        SessionManager::SaveProgress(Snapshot, Saved);

        auto Loaded = SessionManager::LoadProgress(Snapshot);
        Check(Loaded.has_value(), "snapshot written");
        Check(Loaded && Loaded->State == OrchestratorState::Stopped && Loaded->SessionId == 12, "state and session restored");
        Check(Loaded && Loaded->Processed == 25 && Loaded->BytesProcessed == 123456 && Loaded->CategoryCounts["Originals"] == 25, "counters restored");
        Check(Loaded && Loaded->LastError == "disk hiccup", "last error restored");

        // Latin-1 file name, not valid UTF-8.
        Saved.CurrentFile = "/photos/caf\xe9.jpg";
        bool Written = true;
        try
        {
            SessionManager::SaveProgress(Snapshot, Saved);
        }
        catch (const std::exception&)
        {
            Written = false;
        }
        Check(Written, "snapshot with a non UTF-8 path is written");
        Loaded = SessionManager::LoadProgress(Snapshot);
        Check(Loaded && Loaded->CurrentFile == "/photos/caf\xef\xbf\xbd.jpg", "invalid byte replaced by U+FFFD");

        WriteFile(Snapshot, "{ not json");
        bool Corrupt = false;
        try
        {
            SessionManager::LoadProgress(Snapshot);
        }
        catch (const FileAccessError&)
        {
            Corrupt = true;
        }
        Check(Corrupt, "corrupt snapshot raises FileAccessError");

        SessionManager::ClearProgress(Snapshot);
        Check(!SessionManager::LoadProgress(Snapshot).has_value(), "cleared snapshot reads as absent");
        SessionManager::ClearProgress(Snapshot);
    }

    return Finish("Session manager");
}
