#pragma once

#include <string>
#include <vector>
#include <map>
#include <optional>
#include <filesystem>
#include <cstdint>

#include "Records.hpp"
#include "Progress.hpp"

class Database;

struct UndoReport
{
    uint64_t FilesDeleted = 0;
    uint64_t FilesFailed = 0;
    uint64_t DirsDeleted = 0;
    std::vector<std::string> Errors;
};

class SessionManager
{
public:
    explicit SessionManager(Database& Store);

    // Throws OrchestratorError when Destination already has a running or paused session.
    int64_t CreateSession(const std::string& Source, const std::string& Destination, const std::string& Fingerprint);

    // Terminal statuses also stamp the end time.
    void UpdateStatus(int64_t SessionId, SessionStatus Status, const std::optional<std::string>& ErrorMessage = std::nullopt);
    void UpdateProgress(int64_t SessionId, const SessionCounters& Counters);

    std::optional<Session> GetSession(int64_t SessionId);
    std::vector<Session> ListSessions();

    // Most recent running or paused session. Throws ResumeError when its paths are gone.
    std::optional<Session> FindResumable();

    // Any running, paused, stopped or failed session whose paths still exist.
    Session OpenForResume(int64_t SessionId);

    // Deletes what the session copied, then the directories that became empty.
    // DryRun counts the same things without touching the disk or the store.
    UndoReport Undo(int64_t SessionId, bool DryRun);

    // FileRecord count per processing status.
    std::map<std::string, uint64_t> GetStatistics(int64_t SessionId);

    static void SaveProgress(const std::filesystem::path& SnapshotFile, const ProcessingProgress& Progress);
    static std::optional<ProcessingProgress> LoadProgress(const std::filesystem::path& SnapshotFile);
    static void ClearProgress(const std::filesystem::path& SnapshotFile);

private:
    Database& Store;

    static bool IsTerminalStatus(SessionStatus Status);
    static void CheckPathsExist(const Session& Candidate);
};
