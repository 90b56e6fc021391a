#pragma once

#include <atomic>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "Records.hpp"

struct sqlite3;

// One SQLite connection shared by every component of a run.
// All statements are serialized on ConnectionMutex; every public call is one
// logical operation and, where it writes more than one row, one transaction.
// Failures throw DatabaseError.
class Database
{
public:
    static constexpr int SchemaVersion = 1;

    explicit Database(const std::string& FilePath);
    ~Database();

    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;

    const std::string& GetFilePath() const;

    // Sessions
    int64_t InsertSession(const Session& NewSession);
    void UpdateSessionStatus(int64_t SessionId, SessionStatus Status, const std::optional<std::string>& ErrorMessage, std::optional<int64_t> EndTime);
    void UpdateSessionCounters(int64_t SessionId, const SessionCounters& Counters);
    std::optional<Session> GetSession(int64_t SessionId);
    std::vector<Session> ListSessions();
    std::optional<Session> FindActiveSession(const std::string& DestinationPath);
    std::optional<Session> MostRecentActiveSession();

    // Files
    int64_t InsertFileRecord(const FileRecord& Record);
    std::vector<int64_t> InsertFileRecords(const std::vector<FileRecord>& Records);
    bool HasCompletedRecord(int64_t SessionId, const std::string& SourcePath);
    std::vector<FileRecord> GetFileRecordsWithDestination(int64_t SessionId);
    std::map<std::string, uint64_t> CountFilesByStatus(int64_t SessionId);

    // Duplicate groups
    std::optional<DuplicateGroup> FindDuplicateGroup(const std::string& Digest, const std::string& Extension);
    // Creates the group with RecordId as original, or bumps the count of the existing one.
    bool RegisterInGroup(const std::string& Digest, const std::string& Extension, int64_t RecordId, int64_t Now);
    // Drops groups whose original belongs to SessionId. Returns rows removed.
    uint64_t DeleteGroupsOfSession(int64_t SessionId);
    // Bumped whenever groups are deleted; anything memoizing groups must drop it on change.
    uint64_t GroupGeneration() const;

    // Hash cache
    std::optional<CacheEntry> GetCacheEntry(const std::string& Path);
    void UpsertCacheEntry(const CacheEntry& Entry);
    void TouchCacheEntry(const std::string& Path, int64_t Now);
    uint64_t PruneCacheOlderThan(int64_t Cutoff);

private:
    sqlite3* Handle = nullptr;
    std::string FilePath;
    std::mutex ConnectionMutex;
    std::atomic<uint64_t> GroupGenerationCounter{0};

    void Execute(const std::string& Sql);
    void InitializeSchema();
    int64_t InsertFileRecordLocked(const FileRecord& Record);
};
