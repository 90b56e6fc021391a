#include <iostream>
#include <iomanip>
#include <sstream>
#include <string>
#include <vector>
#include <optional>
#include <thread>
#include <atomic>
#include <filesystem>

#include <signal.h>
#include <pthread.h>

#include "ControlFlow.hpp"
#include "Logger.hpp"
#include "ConfigGlobal.hpp"
#include "Database.hpp"
#include "HashCache.hpp"
#include "FileHasher.hpp"
#include "FileScanner.hpp"
#include "FileProcessor.hpp"
#include "DeduplicationEngine.hpp"
#include "SessionManager.hpp"
#include "Errors.hpp"
#include "TimeUtils.hpp"
#include "PathUtils.hpp"

namespace FS = std::filesystem;

namespace
{
    // Turns SIGINT/SIGTERM into Stop, SIGUSR1 into Pause and SIGUSR2 into Resume.
    // Must be constructed before the orchestrator starts any thread so they all inherit the mask.
    class SignalWatcher
    {
    public:
        explicit SignalWatcher(Orchestrator& Target) : Target(Target)
        {
            sigemptyset(&Signals);
            sigaddset(&Signals, SIGINT);
            sigaddset(&Signals, SIGTERM);
            sigaddset(&Signals, SIGUSR1);
            sigaddset(&Signals, SIGUSR2);
            pthread_sigmask(SIG_BLOCK, &Signals, &Previous);
            Watcher = std::thread(&SignalWatcher::Loop, this);
        }

        ~SignalWatcher()
        {
            Done = true;
            if (Watcher.joinable())
            {
                Watcher.join();
            }
            pthread_sigmask(SIG_SETMASK, &Previous, nullptr);
        }

        SignalWatcher(const SignalWatcher&) = delete;
        SignalWatcher& operator=(const SignalWatcher&) = delete;

    private:
        Orchestrator& Target;
        sigset_t Signals;
        sigset_t Previous;
        std::atomic<bool> Done{false};
        std::thread Watcher;

        void Loop()
        {
            while (!Done)
            {
                timespec Timeout{0, 200 * 1000 * 1000};
                int Signal = sigtimedwait(&Signals, nullptr, &Timeout);
                if (Signal < 0)
                {
                    continue;
                }
                try
                {
                    Handle(Signal);
                }
                catch (const OrchestratorError& e)
                {
                    Log.Warn(std::string("[ControlFlow] Signal ") + std::to_string(Signal) + " ignored: " + e.what());
                    std::cerr << "\n" << e.what() << "\n";
                }
            }
        }

        void Handle(int Signal)
        {
            switch (Signal)
            {
            case SIGINT:
            case SIGTERM:
                std::cout << "\nStopping after in-flight files finish...\n";
                Log.Info("[ControlFlow] Stop signal received");
                Target.Stop();
                break;
            case SIGUSR1:
                std::cout << "\nPausing...\n";
                Target.Pause();
                break;
            case SIGUSR2:
                std::cout << "\nResuming...\n";
                Target.Resume();
                break;
            default:
                break;
            }
        }
    };

    std::string FormatBytes(uint64_t Bytes)
    {
        const char* Units[] = { "B", "KB", "MB", "GB", "TB" };
        double Value = static_cast<double>(Bytes);
        int Unit = 0;
        while (Value >= 1024.0 && Unit < 4)
        {
            Value /= 1024.0;
            ++Unit;
        }
        std::ostringstream Out;
        Out << std::fixed << std::setprecision(Unit == 0 ? 0 : 1) << Value << " " << Units[Unit];
        return Out.str();
    }
}

int ControlFlow::Run(int argc, char* argv[])
{
    ConfigGlobal::InitializeDefaults();

    CommandLine Cmd;
    try
    {
        Cmd = ParseArguments(argc, argv);
    }
    catch (const ConfigError& e)
    {
        std::cerr << "Error: " << e.what() << "\n";
        PrintUsage();
        return 1;
    }
    if (Cmd.Help || Cmd.Command.empty())
    {
        PrintUsage();
        return Cmd.Help ? 0 : 1;
    }

    if (!LoadConfig(Cmd))
    {
        return 1;
    }

    int ExitCode = 1;
    try
    {
        ExitCode = Dispatch(Cmd);
    }
    catch (const ConfigError& e)
    {
        std::cerr << "Error: " << e.what() << "\n";
        Log.Error(std::string("[ControlFlow] ") + e.what());
        PrintUsage();
    }
    catch (const ResumeError& e)
    {
        std::cerr << "Cannot resume session " << e.SessionId << ": " << e.what() << "\n";
        Log.Error(std::string("[ControlFlow] ") + e.what());
    }
    catch (const InsufficientSpaceError& e)
    {
        std::cerr << "Not enough space: " << e.what();
        if (e.RequiredBytes > 0)
        {
            std::cerr << " (need " << FormatBytes(e.RequiredBytes) << ", have " << FormatBytes(e.AvailableBytes) << ")";
        }
        std::cerr << "\n";
        Log.Error(std::string("[ControlFlow] ") + e.what());
    }
    catch (const SchemaVersionError& e)
    {
        std::cerr << "Incompatible database: " << e.what() << "\n";
        Log.Error(std::string("[ControlFlow] ") + e.what());
    }
    catch (const DupliSortError& e)
    {
        std::cerr << "Error: " << e.what() << "\n";
        Log.Error(std::string("[ControlFlow] ") + e.what());
    }
    catch (const FS::filesystem_error& e)
    {
        std::cerr << "Filesystem error: " << e.what() << "\n";
        Log.Error(std::string("[ControlFlow] Filesystem error: ") + e.what());
    }
    catch (const std::exception& e)
    {
        std::cerr << "Unexpected error: " << e.what() << "\n";
        Log.Error(std::string("[ControlFlow] Unexpected error: ") + e.what());
    }

    const std::string LogPath = Log.GetLogFilePath();
    if (!LogPath.empty())
    {
        std::cout << "Logs Saved to : " << LogPath << " (" << Log.WarningCount() << " warnings, " << Log.ErrorCount() << " errors)\n";
    }
    Log.Close();
    return ExitCode;
}

CommandLine ControlFlow::ParseArguments(int argc, char* argv[])
{
    CommandLine Cmd;
    for (int i = 1; i < argc; ++i)
    {
        const std::string Arg = argv[i];
        if (Arg == "--config")
        {
            if (i + 1 >= argc)
            {
                throw ConfigError("--config needs a file path");
            }
            Cmd.ConfigFile = argv[++i];
            Cmd.ConfigGiven = true;
        }
        else if (Arg.rfind("--config=", 0) == 0)
        {
            Cmd.ConfigFile = Arg.substr(9);
            Cmd.ConfigGiven = true;
        }
        else if (Arg == "--dry-run")
        {
            Cmd.DryRun = true;
        }
        else if (Arg == "--help" || Arg == "-h")
        {
            Cmd.Help = true;
        }
        else if (Arg.size() > 1 && Arg[0] == '-')
        {
            throw ConfigError("Unknown option '" + Arg + "'");
        }
        else if (Cmd.Command.empty())
        {
            Cmd.Command = Arg;
        }
        else
        {
            Cmd.Args.push_back(Arg);
        }
    }

    if (Cmd.DryRun && Cmd.Command != "undo")
    {
        throw ConfigError("--dry-run only applies to undo");
    }
    if (Cmd.ConfigGiven && Cmd.ConfigFile.empty())
    {
        throw ConfigError("--config needs a file path");
    }
    return Cmd;
}

int ControlFlow::ExitCodeFor(OrchestratorState State)
{
    switch (State)
    {
    case OrchestratorState::Completed:
        return 0;
    case OrchestratorState::Stopped:
        return 2;
    default:
        return 1;
    }
}

bool ControlFlow::LoadConfig(const CommandLine& Cmd)
{
    const std::string File = Cmd.ConfigGiven ? Cmd.ConfigFile : ConfigGlobal::ConfigFile;
    bool Parsed = Parser.Parse(File, Cmd.ConfigGiven);

    if (Log.Init(ConfigGlobal::LogDir))
    {
        Log.RotateLogs(ConfigGlobal::MaxLogFiles);
    }

    if (!Parsed)
    {
        for (const auto& Error : Parser.GetErrors())
        {
            std::cerr << "Config Error: " << Error << "\n";
            Log.Error(Error);
        }
        std::cerr << "Check Errors and Fix Them, Exiting\n";
        Log.Error("Check Errors and Fix Them, Exiting");
        return false;
    }

    for (const auto& Info : Parser.GetInfos())
    {
        Log.Info(Info);
    }
    Log.Info("Config Parsed Successfully.");
    return true;
}

int ControlFlow::Dispatch(const CommandLine& Cmd)
{
    const auto& Args = Cmd.Args;
    auto ExpectArgs = [&Cmd, &Args](size_t Min, size_t Max)
    {
        if (Args.size() < Min || Args.size() > Max)
        {
            throw ConfigError("Wrong number of arguments for '" + Cmd.Command + "'");
        }
    };

    Log.Info("[ControlFlow] Command: " + Cmd.Command);
    if (Cmd.Command == "start")
    {
        ExpectArgs(2, 2);
        return RunStart(Args[0], Args[1]);
    }
    if (Cmd.Command == "resume")
    {
        ExpectArgs(1, 2);
        return RunResume(Args[0], std::vector<std::string>(Args.begin() + 1, Args.end()));
    }
    if (Cmd.Command == "status")
    {
        ExpectArgs(1, 2);
        return RunStatus(Args[0], std::vector<std::string>(Args.begin() + 1, Args.end()));
    }
    if (Cmd.Command == "undo")
    {
        ExpectArgs(2, 2);
        return RunUndo(Args[0], Args[1], Cmd.DryRun);
    }
    if (Cmd.Command == "duplicates")
    {
        ExpectArgs(1, 1);
        return RunDuplicates(Args[0]);
    }
    throw ConfigError("Unknown command '" + Cmd.Command + "'");
}

std::string ControlFlow::DatabasePathFor(const std::string& DestinationRoot, bool MustExist)
{
    FS::path DbPath = ConfigGlobal::ResolveDatabasePath(DestinationRoot);
    std::error_code ec;
    if (MustExist && !FS::exists(DbPath, ec))
    {
        throw ConfigError("No DupliSort database at " + DbPath.string());
    }
    return DbPath.string();
}

void ControlFlow::PruneHashCache(HashCache& Cache)
{
    if (ConfigGlobal::CachePruneDays == 0)
    {
        return;
    }
    uint64_t Removed = Cache.Prune(ConfigGlobal::CachePruneDays);
    Log.Info("[ControlFlow] Pruned " + std::to_string(Removed) + " hash cache entries older than " +
        std::to_string(ConfigGlobal::CachePruneDays) + " days");
}

OrchestratorOptions ControlFlow::BuildOptions()
{
    OrchestratorOptions Options;
    Options.ThreadCount = ConfigGlobal::ThreadCount;
    Options.ProgressIntervalMs = ConfigGlobal::ProgressIntervalMs;
    Options.StopTimeoutSeconds = ConfigGlobal::StopTimeoutSeconds;
    Options.MinFreeSpaceBytes = ConfigGlobal::MinFreeSpaceMB * 1024ULL * 1024ULL;
    Options.SkipHidden = ConfigGlobal::SkipHidden;
    Options.SkipFilePatterns = ConfigGlobal::SkipFilePatterns;
    Options.SkipFolderPatterns = ConfigGlobal::SkipFolderPatterns;
    Options.ConfigFingerprint = ConfigFingerprint();
    Options.ProgressFileName = ConfigGlobal::ProgressFileName;
    return Options;
}

std::string ControlFlow::ConfigFingerprint()
{
    nlohmann::json Fingerprint =
    {
        {"thread_count", ConfigGlobal::ThreadCount},
        {"skip_hidden", ConfigGlobal::SkipHidden},
        {"skip_file_patterns", ConfigGlobal::SkipFilePatterns},
        {"skip_folder_patterns", ConfigGlobal::SkipFolderPatterns},
        {"min_free_space_mb", ConfigGlobal::MinFreeSpaceMB}
    };
    return Fingerprint.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

int64_t ControlFlow::ParseSessionId(const std::string& Text)
{
    try
    {
        size_t Used = 0;
        long long Id = std::stoll(Text, &Used);
        if (Used != Text.size() || Id <= 0)
        {
            throw ConfigError("Invalid session id '" + Text + "'");
        }
        return Id;
    }
    catch (const std::logic_error&)
    {
        throw ConfigError("Invalid session id '" + Text + "'");
    }
}

int ControlFlow::DriveOrchestrator(const std::string& DestinationRoot, const std::function<OrchestratorState(Orchestrator&, SessionManager&)>& Body)
{
    Database Store(DatabasePathFor(DestinationRoot, false));
    HashCache Cache(&Store);
    PruneHashCache(Cache);

    FileHasher Hasher(&Cache);
    DeduplicationEngine Dedup(Store, Hasher);
    std::unique_ptr<ProcessorRegistry> Registry = ProcessorRegistry::CreateDefault();
    SessionManager Sessions(Store);

    Orchestrator Runner(Store, Sessions, Dedup, Hasher, *Registry, BuildOptions());
    Runner.SetProgressCallback(&ControlFlow::PrintProgress);

    OrchestratorState Final;
    {
        SignalWatcher Watcher(Runner);
        Final = Body(Runner, Sessions);
    }

    std::cout << "\n";
    PrintSummary(Runner.GetProgress());
    Log.Info("[ControlFlow] Hashed " + std::to_string(Hasher.FilesRead()) + " files, " +
        std::to_string(Cache.MemoryEntries()) + " digests cached in memory");
    return ExitCodeFor(Final);
}

int ControlFlow::RunStart(const std::string& Source, const std::string& Destination)
{
    if (!Parser.ValidateRunPaths(Source, Destination))
    {
        for (const auto& Error : Parser.GetErrors())
        {
            std::cerr << "Error: " << Error << "\n";
            Log.Error(Error);
        }
        return 1;
    }

    const std::string DestinationRoot = NormalizeRoot(Destination).string();
    std::cout << "Organizing " << Source << " into " << DestinationRoot << "\n";
    return DriveOrchestrator(DestinationRoot, [&Source, &DestinationRoot](Orchestrator& Runner, SessionManager&)
    {
        return Runner.Start(Source, DestinationRoot);
    });
}

int ControlFlow::RunResume(const std::string& Destination, const std::vector<std::string>& Args)
{
    const std::string DestinationRoot = NormalizeRoot(Destination).string();
    DatabasePathFor(DestinationRoot, true);

    std::optional<int64_t> Requested;
    if (!Args.empty())
    {
        Requested = ParseSessionId(Args[0]);
    }

    return DriveOrchestrator(DestinationRoot, [&Requested, &DestinationRoot](Orchestrator& Runner, SessionManager& Sessions)
    {
        int64_t SessionId = 0;
        if (Requested)
        {
            SessionId = *Requested;
        }
        else if (auto Active = Sessions.FindResumable())
        {
            SessionId = Active->Id;
        }
        else
        {
            for (const auto& Row : Sessions.ListSessions())
            {
                if (Row.DestinationPath == DestinationRoot && (Row.Status == SessionStatus::Stopped || Row.Status == SessionStatus::Error))
                {
                    SessionId = Row.Id;
                    break;
                }
            }
        }
        if (SessionId == 0)
        {
            throw ResumeError("No resumable session for " + DestinationRoot, 0);
        }

        std::cout << "Resuming session " << SessionId << "\n";
        return Runner.ResumeSession(SessionId);
    });
}

int ControlFlow::RunStatus(const std::string& Destination, const std::vector<std::string>& Args)
{
    const std::string DestinationRoot = NormalizeRoot(Destination).string();
    Database Store(DatabasePathFor(DestinationRoot, true));
    SessionManager Sessions(Store);

    if (Args.empty())
    {
        std::vector<Session> Rows = Sessions.ListSessions();
        if (Rows.empty())
        {
            std::cout << "No sessions recorded.\n";
            return 0;
        }
        std::cout << std::left << std::setw(6) << "ID" << std::setw(11) << "STATUS" << std::setw(22) << "STARTED"
            << std::setw(11) << "PROCESSED" << std::setw(11) << "DUPLICATES" << std::setw(8) << "ERRORS" << "SOURCE\n";
        for (const auto& Row : Rows)
        {
            std::cout << std::left << std::setw(6) << Row.Id << std::setw(11) << ToString(Row.Status)
                << std::setw(22) << FormatIso(Row.StartTime) << std::setw(11) << Row.Counters.FilesProcessed
                << std::setw(11) << Row.Counters.Duplicates << std::setw(8) << Row.Counters.Errors << Row.SourcePath << "\n";
        }
        return 0;
    }

    int64_t SessionId = ParseSessionId(Args[0]);
    std::optional<Session> Row = Sessions.GetSession(SessionId);
    if (!Row)
    {
        std::cerr << "No session " << SessionId << "\n";
        return 1;
    }
    PrintSession(*Row);

    std::cout << "Records:\n";
    for (const auto& [Status, Count] : Sessions.GetStatistics(SessionId))
    {
        std::cout << "  " << std::left << std::setw(12) << Status << Count << "\n";
    }

    if (IsActiveStatus(Row->Status) || Row->Status == SessionStatus::Stopped || Row->Status == SessionStatus::Error)
    {
        try
        {
            if (auto Saved = SessionManager::LoadProgress(FS::path(DestinationRoot) / ConfigGlobal::ProgressFileName))
            {
                if (Saved->SessionId == SessionId)
                {
                    std::cout << "Last snapshot: " << Saved->Finished() << " of " << Saved->TotalFiles
                        << " files finished (" << ToString(Saved->State) << ")\n";
                }
            }
        }
        catch (const FileAccessError& e)
        {
            std::cerr << "Snapshot unreadable: " << e.what() << "\n";
            Log.Warn(std::string("[ControlFlow] ") + e.what());
        }
    }
    return 0;
}

int ControlFlow::RunUndo(const std::string& Destination, const std::string& SessionArg, bool DryRun)
{
    const std::string DestinationRoot = NormalizeRoot(Destination).string();
    int64_t SessionId = ParseSessionId(SessionArg);

    Database Store(DatabasePathFor(DestinationRoot, true));
    SessionManager Sessions(Store);

    UndoReport Report = Sessions.Undo(SessionId, DryRun);
    std::cout << (DryRun ? "Would delete " : "Deleted ") << Report.FilesDeleted << " files and "
        << Report.DirsDeleted << " empty directories\n";
    if (Report.FilesFailed > 0 || !Report.Errors.empty())
    {
        std::cout << Report.FilesFailed << " files could not be deleted:\n";
        for (const auto& Error : Report.Errors)
        {
            std::cout << "  " << Error << "\n";
        }
    }
    return Report.FilesFailed == 0 ? 0 : 1;
}

int ControlFlow::RunDuplicates(const std::string& Directory)
{
    std::error_code ec;
    if (!FS::is_directory(Directory, ec))
    {
        throw ConfigError("Not a directory: " + Directory);
    }

    ScanOptions Scan;
    Scan.SkipFilePatterns = ConfigGlobal::SkipFilePatterns;
    Scan.SkipFolderPatterns = ConfigGlobal::SkipFolderPatterns;
    Scan.IncludeHidden = !ConfigGlobal::SkipHidden;

    std::vector<std::string> Paths;
    FileScanner Scanner(Scan, nullptr);
    Scanner.Scan(NormalizeRoot(Directory).string(), [&Paths](const ScannedFileInfo& Info)
    {
        Paths.push_back(Info.Path);
        return true;
    });
    std::cout << "Hashing " << Paths.size() << " files...\n";

    HashCache Cache;
    FileHasher Hasher(&Cache);
    auto Groups = DeduplicationEngine::FindDuplicatesInSet(Paths, Hasher, ConfigGlobal::ThreadCount);

    for (const auto& [Digest, Members] : Groups)
    {
        std::cout << Digest.substr(0, 16) << " (" << Members.size() << " copies)\n";
        for (const auto& Member : Members)
        {
            std::cout << "  " << Member << "\n";
        }
    }
    std::cout << Groups.size() << " duplicate groups, " << FormatBytes(DeduplicationEngine::SpaceSaved(Groups)) << " reclaimable\n";
    Log.Info("[ControlFlow] " + std::to_string(Groups.size()) + " duplicate groups in " + Directory);
    return 0;
}

void ControlFlow::PrintUsage()
{
    std::cout <<
        "Usage: DupliSort [--config <file>] <command> ...\n"
        "  start <source> <destination>            organize source into destination\n"
        "  resume <destination> [sessionId]        continue an interrupted session\n"
        "  status <destination> [sessionId]        list sessions or show one\n"
        "  undo <destination> <sessionId> [--dry-run]\n"
        "                                          delete what a session copied\n"
        "  duplicates <directory>                  report duplicate files in place\n"
        "Signals during a run: SIGINT/SIGTERM stop, SIGUSR1 pause, SIGUSR2 resume.\n";
}

void ControlFlow::PrintProgress(const ProcessingProgress& Progress)
{
    std::ostringstream Line;
    Line << "\r[" << ToString(Progress.State) << "] " << Progress.Finished() << "/" << Progress.TotalFiles << " files | "
        << Progress.Duplicates << " duplicates | " << Progress.Errors << " errors | "
        << std::fixed << std::setprecision(1) << Progress.FilesPerSecond << " files/s | ETA "
        << static_cast<uint64_t>(Progress.EtaSeconds) << "s   ";
    std::cout << Line.str() << std::flush;
}

void ControlFlow::PrintSummary(const ProcessingProgress& Progress)
{
    std::cout << "Session " << Progress.SessionId << " " << ToString(Progress.State) << "\n"
        << "  Scanned:    " << Progress.FilesScanned << " (" << FormatBytes(Progress.BytesTotal) << ")\n"
        << "  Processed:  " << Progress.Processed << " (" << FormatBytes(Progress.BytesProcessed) << ")\n"
        << "  Duplicates: " << Progress.Duplicates << "\n"
        << "  Skipped:    " << Progress.Skipped << " (" << Progress.AlreadyProcessed << " already done)\n"
        << "  Errors:     " << Progress.Errors << "\n";
    for (const auto& [Category, Count] : Progress.CategoryCounts)
    {
        std::cout << "    " << Category << ": " << Count << "\n";
    }
    if (!Progress.LastError.empty())
    {
        std::cout << "  Last error: " << Progress.LastError << "\n";
    }
}

void ControlFlow::PrintSession(const Session& Row)
{
    std::cout << "Session " << Row.Id << " (" << ToString(Row.Status) << ")\n"
        << "  Source:      " << Row.SourcePath << "\n"
        << "  Destination: " << Row.DestinationPath << "\n"
        << "  Started:     " << FormatIso(Row.StartTime) << "\n";
    if (Row.EndTime)
    {
        std::cout << "  Ended:       " << FormatIso(*Row.EndTime) << "\n";
    }
    std::cout << "  Scanned " << Row.Counters.FilesScanned << ", processed " << Row.Counters.FilesProcessed
        << ", duplicates " << Row.Counters.Duplicates << ", skipped " << Row.Counters.FilesSkipped
        << ", errors " << Row.Counters.Errors << "\n";
    if (Row.ErrorMessage)
    {
        std::cout << "  Error: " << *Row.ErrorMessage << "\n";
    }
}
