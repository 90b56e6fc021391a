#pragma once

#include <string>
#include <vector>
#include <memory>
#include <mutex>
#include <condition_variable>
#include <functional>
#include <filesystem>
#include <chrono>
#include <cstdint>

#include "Progress.hpp"
#include "Pipeline.hpp"
#include "BlockingQueue.hpp"

class Database;
class SessionManager;
class DeduplicationEngine;
class FileHasher;
class ProcessorRegistry;

struct OrchestratorOptions
{
    size_t ThreadCount = 4;
    unsigned int ProgressIntervalMs = 1000;
    unsigned int StopTimeoutSeconds = 30;
    uint64_t MinFreeSpaceBytes = 0;
    bool SkipHidden = true;
    std::vector<std::string> SkipFilePatterns;
    std::vector<std::string> SkipFolderPatterns;
    std::string ConfigFingerprint;
    std::filesystem::path ProgressFileName = std::filesystem::path("conf") / "progress.json";
};

// Drives one run: scan, space check, worker pool, accounting.
// Start and ResumeSession block the calling thread until the run ends;
// Pause, Resume and Stop are meant to be called from another thread.
class Orchestrator
{
public:
    using ProgressCallback = std::function<void(const ProcessingProgress&)>;

    Orchestrator(Database& Store, SessionManager& Sessions, DeduplicationEngine& Dedup, FileHasher& Hasher,
        const ProcessorRegistry& Registry, OrchestratorOptions Options);

    Orchestrator(const Orchestrator&) = delete;
    Orchestrator& operator=(const Orchestrator&) = delete;

    // Returns the final state. Throws InsufficientSpaceError, DatabaseError,
    // OrchestratorError (already running or destination busy).
    OrchestratorState Start(const std::string& Source, const std::string& Destination);
    OrchestratorState ResumeSession(int64_t SessionId);

    // Throw OrchestratorError when the current state does not allow the request.
    void Pause();
    void Resume();
    void Stop();

    OrchestratorState GetState() const;
    ProcessingProgress GetProgress() const;
    int64_t GetSessionId() const;
    void SetProgressCallback(ProgressCallback Callback);

    std::filesystem::path SnapshotPath(const std::filesystem::path& Destination) const;

private:
    Database& Store;
    SessionManager& Sessions;
    DeduplicationEngine& Dedup;
    FileHasher& Hasher;
    const ProcessorRegistry& Registry;
    OrchestratorOptions Options;

    mutable std::mutex StateMutex;
    std::condition_variable Gate_CV;
    std::condition_variable WorkersDone_CV;
    OrchestratorState State = OrchestratorState::Idle;
    bool StopRequested = false;
    size_t ActiveWorkers = 0;
    BlockingQueue<std::string>* WorkQueue = nullptr;

    mutable std::mutex ProgressMutex;
    ProcessingProgress Progress;
    std::chrono::steady_clock::time_point RunStarted;

    std::mutex CallbackMutex;
    ProgressCallback Callback;

    // Serializes session status writes. Taken before StateMutex, never after.
    std::mutex SessionStatusMutex;

    // Guarded by StateMutex.
    bool RunLevelFailure = false;
    std::string FailureReason;

    std::filesystem::path CurrentDestination;

    void EnsureNotRunning() const;
    void BeginRun(int64_t SessionId);
    OrchestratorState Run(int64_t SessionId, const std::string& Source, const std::string& Destination, uint64_t AlreadyCopiedBytes);
    bool ScanSource(const std::string& Source, const std::string& Destination, std::vector<std::string>& Files);
    void ProcessFiles(int64_t SessionId, const std::string& Destination, const std::vector<std::string>& Files);
    void WorkerLoop(Pipeline& Worker, BlockingQueue<std::string>& Queue, BlockingQueue<PipelineResult>& Results);
    void AggregatorLoop(BlockingQueue<PipelineResult>& Results, int64_t SessionId);
    OrchestratorState Finish(int64_t SessionId);
    void Fail(int64_t SessionId, const std::string& Reason);

    bool WaitWhilePaused();
    void SetState(OrchestratorState NewState);
    void Account(const PipelineResult& Result);
    void MarkRunLevelFailure(const std::string& Reason);
    void Emit(int64_t SessionId);
    // Writes Status unless the state has moved past Expected meanwhile.
    void RecordSessionStatus(OrchestratorState Expected, SessionStatus Status);
    ProcessingProgress Snapshot() const;
    static SessionCounters ToCounters(const ProcessingProgress& Snapshot);
};
