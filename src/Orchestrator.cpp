#include "Orchestrator.hpp"
#include "Database.hpp"
#include "SessionManager.hpp"
#include "FileScanner.hpp"
#include "SpaceChecker.hpp"
#include "ThreadPool.hpp"
#include "Errors.hpp"
#include "Logger.hpp"
#include "PathUtils.hpp"

#include <thread>

namespace FS = std::filesystem;

namespace
{
    // Owns the aggregator thread. Closing the result queue lets the loop
    // drain and return, then the jthread member joins it.
    class AggregatorScope
    {
    public:
        AggregatorScope(BlockingQueue<PipelineResult>& Results, std::jthread Thread) : Results(Results), Thread(std::move(Thread)) {}
        ~AggregatorScope()
        {
            Results.Close();
        }

        AggregatorScope(const AggregatorScope&) = delete;
        AggregatorScope& operator=(const AggregatorScope&) = delete;

    private:
        BlockingQueue<PipelineResult>& Results;
        std::jthread Thread;
    };
}

Orchestrator::Orchestrator(Database& Store, SessionManager& Sessions, DeduplicationEngine& Dedup, FileHasher& Hasher,
    const ProcessorRegistry& Registry, OrchestratorOptions Options)
    : Store(Store), Sessions(Sessions), Dedup(Dedup), Hasher(Hasher), Registry(Registry), Options(std::move(Options))
{
    if (this->Options.ThreadCount == 0)
    {
        this->Options.ThreadCount = 1;
    }
    if (this->Options.ProgressIntervalMs == 0)
    {
        this->Options.ProgressIntervalMs = 1;
    }
}

FS::path Orchestrator::SnapshotPath(const FS::path& Destination) const
{
    return Destination / Options.ProgressFileName;
}

void Orchestrator::SetProgressCallback(ProgressCallback NewCallback)
{
    std::lock_guard<std::mutex> Lock(CallbackMutex);
    Callback = std::move(NewCallback);
}

OrchestratorState Orchestrator::GetState() const
{
    std::lock_guard<std::mutex> Lock(StateMutex);
    return State;
}

ProcessingProgress Orchestrator::GetProgress() const
{
    return Snapshot();
}

int64_t Orchestrator::GetSessionId() const
{
    std::lock_guard<std::mutex> Lock(ProgressMutex);
    return Progress.SessionId;
}

void Orchestrator::EnsureNotRunning() const
{
    std::lock_guard<std::mutex> Lock(StateMutex);
    if (State != OrchestratorState::Idle && !IsTerminal(State))
    {
        throw OrchestratorError("A run is already in progress (" + ToString(State) + ")");
    }
}

OrchestratorState Orchestrator::Start(const std::string& Source, const std::string& Destination)
{
    EnsureNotRunning();

    const std::string SourceRoot = NormalizeRoot(Source).string();
    const std::string DestinationRoot = NormalizeRoot(Destination).string();
    int64_t SessionId = Sessions.CreateSession(SourceRoot, DestinationRoot, Options.ConfigFingerprint);
    return Run(SessionId, SourceRoot, DestinationRoot, 0);
}

OrchestratorState Orchestrator::ResumeSession(int64_t SessionId)
{
    EnsureNotRunning();

    Session Previous = Sessions.OpenForResume(SessionId);
    try
    {
        if (auto Saved = SessionManager::LoadProgress(SnapshotPath(Previous.DestinationPath)))
        {
            Log.Info("[Orchestrator] Last snapshot of session " + std::to_string(SessionId) + ": " +
                std::to_string(Saved->Finished()) + " of " + std::to_string(Saved->TotalFiles) + " files finished (" + ToString(Saved->State) + ")");
        }
    }
    catch (const FileAccessError& e)
    {
        Log.Warn(std::string("[Orchestrator] Ignoring progress snapshot: ") + e.what());
    }

    Sessions.UpdateStatus(SessionId, SessionStatus::Running);
    Log.Info("[Orchestrator] Resuming session " + std::to_string(SessionId) + " (was " + ToString(Previous.Status) + ")");
    return Run(SessionId, Previous.SourcePath, Previous.DestinationPath, Previous.Counters.BytesProcessed);
}

void Orchestrator::BeginRun(int64_t SessionId)
{
    {
        std::lock_guard<std::mutex> Lock(StateMutex);
        if (State != OrchestratorState::Idle && !IsTerminal(State))
        {
            throw OrchestratorError("A run is already in progress (" + ToString(State) + ")");
        }
        State = OrchestratorState::Scanning;
        StopRequested = false;
        RunLevelFailure = false;
        FailureReason.clear();
        ActiveWorkers = 0;
        WorkQueue = nullptr;
    }

    std::lock_guard<std::mutex> Lock(ProgressMutex);
    Progress = ProcessingProgress{};
    Progress.SessionId = SessionId;
    RunStarted = std::chrono::steady_clock::now();
}

OrchestratorState Orchestrator::Run(int64_t SessionId, const std::string& Source, const std::string& Destination, uint64_t AlreadyCopiedBytes)
{
    BeginRun(SessionId);
    CurrentDestination = Destination;
    Log.Info("[Orchestrator] Session " + std::to_string(SessionId) + ": " + Source + " -> " + Destination +
        " with " + std::to_string(Options.ThreadCount) + " workers");

    try
    {
        std::vector<std::string> Files;
        if (ScanSource(Source, Destination, Files))
        {
            uint64_t TotalBytes = Snapshot().BytesTotal;
            uint64_t Payload = TotalBytes > AlreadyCopiedBytes ? TotalBytes - AlreadyCopiedBytes : 0;
            SpaceChecker::EnsureAvailable(Destination, Payload, Options.MinFreeSpaceBytes);

            bool Proceed = false;
            {
                std::lock_guard<std::mutex> Lock(StateMutex);
                if (!StopRequested)
                {
                    State = OrchestratorState::Processing;
                    Proceed = true;
                }
            }
            if (Proceed)
            {
                ProcessFiles(SessionId, Destination, Files);
            }
        }
    }
    catch (const std::exception& e)
    {
        Fail(SessionId, e.what());
        throw;
    }

    return Finish(SessionId);
}

bool Orchestrator::ScanSource(const std::string& Source, const std::string& Destination, std::vector<std::string>& Files)
{
    ScanOptions Scan;
    Scan.SkipFilePatterns = Options.SkipFilePatterns;
    Scan.SkipFolderPatterns = Options.SkipFolderPatterns;
    Scan.IncludeHidden = !Options.SkipHidden;

    FileScanner Scanner(Scan, &Registry);
    Scanner.SetExcludes({ Destination });

    Log.Info("[Orchestrator] Scanning " + Source);
    bool Finished = Scanner.Scan(Source, [this, &Files](const ScannedFileInfo& Info)
    {
        {
            std::lock_guard<std::mutex> Lock(StateMutex);
            if (StopRequested)
            {
                return false;
            }
        }
        Files.push_back(Info.Path);

        std::lock_guard<std::mutex> Lock(ProgressMutex);
        ++Progress.FilesScanned;
        Progress.TotalFiles = Progress.FilesScanned;
        Progress.BytesTotal += Info.Size;
        return true;
    });

    Log.Info("[Orchestrator] Scan " + std::string(Finished ? "finished" : "interrupted") + ": " + std::to_string(Files.size()) +
        " files, " + std::to_string(Scanner.SkippedEntries()) + " entries skipped");
    return Finished;
}

void Orchestrator::ProcessFiles(int64_t SessionId, const std::string& Destination, const std::vector<std::string>& Files)
{
    const size_t WorkerCount = Options.ThreadCount;
    BlockingQueue<std::string> Queue(WorkerCount * 4);
    BlockingQueue<PipelineResult> Results(WorkerCount * 16);

    PipelineOptions PipeOptions;
    PipeOptions.SessionId = SessionId;
    PipeOptions.DestinationRoot = Destination;
    PipeOptions.SkipHidden = Options.SkipHidden;
    PipeOptions.SkipFilePatterns = Options.SkipFilePatterns;

    std::vector<std::unique_ptr<Pipeline>> Pipelines;
    for (size_t i = 0; i < WorkerCount; ++i)
    {
        Pipelines.push_back(std::make_unique<Pipeline>(Store, Dedup, Hasher, Registry, PipeOptions));
    }

    {
        std::lock_guard<std::mutex> Lock(StateMutex);
        WorkQueue = &Queue;
        ActiveWorkers = WorkerCount;
    }

    AggregatorScope Aggregator(Results, std::jthread(&Orchestrator::AggregatorLoop, this, std::ref(Results), SessionId));
    {
        ThreadPool Pool(WorkerCount, "pipeline");
        for (auto& Worker : Pipelines)
        {
            Pipeline* Owned = Worker.get();
            Pool.Submit([this, Owned, &Queue, &Results]() { WorkerLoop(*Owned, Queue, Results); });
        }

        try
        {
            for (const auto& File : Files)
            {
                if (!Queue.Push(File))
                {
                    break;
                }
            }
        }
        catch (const std::exception& e)
        {
            // Unwinding here would leave the workers blocked on the queue.
            MarkRunLevelFailure(std::string("Feeding workers failed: ") + e.what());
        }
        Queue.Close();

        std::unique_lock<std::mutex> Lock(StateMutex);
        WorkersDone_CV.wait(Lock, [this] { return ActiveWorkers == 0 || StopRequested; });
        if (ActiveWorkers != 0)
        {
            // Stop requested: in-flight files are allowed to finish.
            if (!WorkersDone_CV.wait_for(Lock, std::chrono::seconds(Options.StopTimeoutSeconds), [this] { return ActiveWorkers == 0; }))
            {
                Log.Warn("[Orchestrator] " + std::to_string(ActiveWorkers) + " workers still busy " +
                    std::to_string(Options.StopTimeoutSeconds) + "s after stop, waiting for their transfers to land");
            }
        }
        WorkQueue = nullptr;
    }
}

void Orchestrator::WorkerLoop(Pipeline& Worker, BlockingQueue<std::string>& Queue, BlockingQueue<PipelineResult>& Results)
{
    try
    {
        while (WaitWhilePaused())
        {
            std::optional<std::string> Item = Queue.Pop();
            if (!Item)
            {
                break;
            }
            PipelineResult Result = Worker.Process(*Item);
            if (Result.RunLevelError)
            {
                // Before handing the result over, so this worker and its peers take no new file.
                MarkRunLevelFailure(Result.Message);
            }
            if (!Results.Push(std::move(Result)))
            {
                break;
            }
        }
    }
    catch (const std::exception& e)
    {
        MarkRunLevelFailure(std::string("Worker failed: ") + e.what());
    }

    {
        std::lock_guard<std::mutex> Lock(StateMutex);
        --ActiveWorkers;
    }
    WorkersDone_CV.notify_all();
}

bool Orchestrator::WaitWhilePaused()
{
    std::unique_lock<std::mutex> Lock(StateMutex);
    Gate_CV.wait(Lock, [this] { return State != OrchestratorState::Paused || StopRequested; });
    return !StopRequested;
}

void Orchestrator::AggregatorLoop(BlockingQueue<PipelineResult>& Results, int64_t SessionId)
{
    const auto Interval = std::chrono::milliseconds(Options.ProgressIntervalMs);
    auto LastEmit = std::chrono::steady_clock::now();

    while (true)
    {
        std::optional<PipelineResult> Result = Results.PopFor(Interval);
        if (Result)
        {
            Account(*Result);
        }
        else if (Results.IsClosed() && Results.Size() == 0)
        {
            break;
        }

        auto Now = std::chrono::steady_clock::now();
        if (Now - LastEmit >= Interval)
        {
            Emit(SessionId);
            LastEmit = Now;
        }
    }
}

void Orchestrator::Account(const PipelineResult& Result)
{
    {
        std::lock_guard<std::mutex> Lock(ProgressMutex);
        Progress.CurrentFile = Result.SourcePath;
        switch (Result.Status)
        {
        case ProcessingStatus::Completed:
            ++Progress.Processed;
            Progress.BytesProcessed += Result.Size;
            ++Progress.CategoryCounts[Result.Category];
            break;
        case ProcessingStatus::Duplicate:
            ++Progress.Duplicates;
            break;
        case ProcessingStatus::Skipped:
            ++Progress.Skipped;
            if (Result.AlreadyProcessed)
            {
                ++Progress.AlreadyProcessed;
            }
            break;
        case ProcessingStatus::Error:
            ++Progress.Errors;
            Progress.LastError = Result.SourcePath + ": " + Result.Message;
            break;
        }
    }
}

void Orchestrator::MarkRunLevelFailure(const std::string& Reason)
{
    {
        std::lock_guard<std::mutex> Lock(StateMutex);
        if (!RunLevelFailure)
        {
            FailureReason = Reason;
        }
        RunLevelFailure = true;
        StopRequested = true;
        if (WorkQueue)
        {
            WorkQueue->Close();
        }
    }
    Gate_CV.notify_all();
    WorkersDone_CV.notify_all();
    Log.Error("[Orchestrator] Run-level failure, no new files will start: " + Reason);
}

ProcessingProgress Orchestrator::Snapshot() const
{
    OrchestratorState Current = GetState();

    std::lock_guard<std::mutex> Lock(ProgressMutex);
    ProcessingProgress Copy = Progress;
    Copy.State = Current;
    Copy.ElapsedSeconds = std::chrono::duration<double>(std::chrono::steady_clock::now() - RunStarted).count();
    if (Copy.ElapsedSeconds > 0.0)
    {
        Copy.FilesPerSecond = static_cast<double>(Copy.Finished()) / Copy.ElapsedSeconds;
    }
    if (Copy.FilesPerSecond > 0.0)
    {
        Copy.EtaSeconds = static_cast<double>(Copy.Pending()) / Copy.FilesPerSecond;
    }
    return Copy;
}

SessionCounters Orchestrator::ToCounters(const ProcessingProgress& Snapshot)
{
    SessionCounters Counters;
    Counters.FilesScanned = Snapshot.FilesScanned;
    Counters.FilesProcessed = Snapshot.Processed;
    Counters.FilesSkipped = Snapshot.Skipped;
    Counters.Duplicates = Snapshot.Duplicates;
    Counters.Errors = Snapshot.Errors;
    Counters.BytesProcessed = Snapshot.BytesProcessed;
    Counters.BytesTotal = Snapshot.BytesTotal;
    return Counters;
}

void Orchestrator::Emit(int64_t SessionId)
{
    ProcessingProgress Current = Snapshot();

    try
    {
        Sessions.UpdateProgress(SessionId, ToCounters(Current));
    }
    catch (const DatabaseError& e)
    {
        MarkRunLevelFailure(std::string("Cannot store session counters: ") + e.what());
    }

    try
    {
        SessionManager::SaveProgress(SnapshotPath(CurrentDestination), Current);
    }
    catch (const FileAccessError& e)
    {
        Log.Warn(std::string("[Orchestrator] Progress snapshot not written: ") + e.what());
    }
    catch (const nlohmann::json::exception& e)
    {
        Log.Warn(std::string("[Orchestrator] Progress snapshot not serialized: ") + e.what());
    }

    ProgressCallback Notify;
    {
        std::lock_guard<std::mutex> Lock(CallbackMutex);
        Notify = Callback;
    }
    if (Notify)
    {
        try
        {
            Notify(Current);
        }
        catch (const std::exception& e)
        {
            Log.Error(std::string("[Orchestrator] Progress callback threw: ") + e.what());
        }
    }
}

void Orchestrator::RecordSessionStatus(OrchestratorState Expected, SessionStatus Status)
{
    std::lock_guard<std::mutex> StatusLock(SessionStatusMutex);
    {
        std::lock_guard<std::mutex> Lock(StateMutex);
        if (State != Expected)
        {
            // Superseded by a later transition, which records its own status.
            return;
        }
    }

    int64_t SessionId = GetSessionId();
    try
    {
        Sessions.UpdateStatus(SessionId, Status);
    }
    catch (const DatabaseError& e)
    {
        Log.Error("[Orchestrator] Could not mark session " + std::to_string(SessionId) + " " + ToString(Status) + ": " + e.what());
    }
}

void Orchestrator::SetState(OrchestratorState NewState)
{
    {
        std::lock_guard<std::mutex> Lock(StateMutex);
        State = NewState;
    }
    Gate_CV.notify_all();
}

void Orchestrator::Pause()
{
    {
        std::lock_guard<std::mutex> Lock(StateMutex);
        if (State != OrchestratorState::Processing)
        {
            throw OrchestratorError("Cannot pause while " + ToString(State));
        }
        State = OrchestratorState::Paused;
    }
    Log.Info("[Orchestrator] Paused");
    RecordSessionStatus(OrchestratorState::Paused, SessionStatus::Paused);
}

void Orchestrator::Resume()
{
    {
        std::lock_guard<std::mutex> Lock(StateMutex);
        if (State != OrchestratorState::Paused)
        {
            throw OrchestratorError("Cannot resume while " + ToString(State));
        }
        State = OrchestratorState::Processing;
    }
    Gate_CV.notify_all();
    Log.Info("[Orchestrator] Resumed");
    RecordSessionStatus(OrchestratorState::Processing, SessionStatus::Running);
}

void Orchestrator::Stop()
{
    {
        std::lock_guard<std::mutex> Lock(StateMutex);
        if (State == OrchestratorState::Stopping)
        {
            return;
        }
        if (IsTerminal(State))
        {
            throw OrchestratorError("Cannot stop, run already " + ToString(State));
        }
        if (State == OrchestratorState::Idle)
        {
            State = OrchestratorState::Stopped;
            return;
        }
        StopRequested = true;
        State = OrchestratorState::Stopping;
        if (WorkQueue)
        {
            WorkQueue->Close();
        }
    }
    Gate_CV.notify_all();
    WorkersDone_CV.notify_all();
    Log.Info("[Orchestrator] Stop requested, letting in-flight files finish");
}

void Orchestrator::Fail(int64_t SessionId, const std::string& Reason)
{
    SetState(OrchestratorState::Error);
    {
        std::lock_guard<std::mutex> Lock(ProgressMutex);
        Progress.LastError = Reason;
    }
    Log.Error("[Orchestrator] Session " + std::to_string(SessionId) + " failed: " + Reason);

    try
    {
        std::lock_guard<std::mutex> StatusLock(SessionStatusMutex);
        Sessions.UpdateStatus(SessionId, SessionStatus::Error, Reason);
    }
    catch (const DatabaseError& e)
    {
        Log.Error("[Orchestrator] Could not record failure of session " + std::to_string(SessionId) + ": " + e.what());
    }
    Emit(SessionId);
}

OrchestratorState Orchestrator::Finish(int64_t SessionId)
{
    bool Failed = false;
    bool Stopped = false;
    {
        std::lock_guard<std::mutex> Lock(StateMutex);
        Failed = RunLevelFailure;
        Stopped = StopRequested;
    }

    OrchestratorState Final = Failed ? OrchestratorState::Error : Stopped ? OrchestratorState::Stopped : OrchestratorState::Completed;
    SetState(Final);
    Emit(SessionId);

    std::optional<std::string> Reason;
    {
        std::lock_guard<std::mutex> Lock(StateMutex);
        if (RunLevelFailure)
        {
            Final = OrchestratorState::Error;
            State = Final;
            Reason = FailureReason;
        }
    }

    SessionStatus Status = SessionStatus::Completed;
    if (Final == OrchestratorState::Error)
    {
        Status = SessionStatus::Error;
    }
    else if (Final == OrchestratorState::Stopped)
    {
        Status = SessionStatus::Stopped;
    }

    try
    {
        std::lock_guard<std::mutex> StatusLock(SessionStatusMutex);
        Sessions.UpdateStatus(SessionId, Status, Reason);
    }
    catch (const DatabaseError& e)
    {
        SetState(OrchestratorState::Error);
        Log.Error("[Orchestrator] Could not close session " + std::to_string(SessionId) + ": " + e.what());
        throw;
    }

    if (Final == OrchestratorState::Completed)
    {
        try
        {
            SessionManager::ClearProgress(SnapshotPath(CurrentDestination));
        }
        catch (const FileAccessError& e)
        {
            Log.Warn(std::string("[Orchestrator] ") + e.what());
        }
    }

    ProcessingProgress Summary = Snapshot();
    Log.Info("[Orchestrator] Session " + std::to_string(SessionId) + " " + ToString(Final) + ": " +
        std::to_string(Summary.Processed) + " processed, " + std::to_string(Summary.Duplicates) + " duplicates, " +
        std::to_string(Summary.Skipped) + " skipped, " + std::to_string(Summary.Errors) + " errors of " +
        std::to_string(Summary.TotalFiles) + " files");
    return Final;
}
