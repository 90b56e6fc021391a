#pragma once

#include <string>
#include <vector>
#include <map>
#include <unordered_map>
#include <unordered_set>
#include <optional>
#include <mutex>
#include <condition_variable>
#include <cstdint>

class Database;
class FileHasher;

struct DuplicateCheck
{
    bool IsDuplicate = false;
    std::optional<int64_t> OriginalId;
    std::string Digest;
    std::string Extension;
};

// Content-addressed duplicate detection keyed by (digest, exact extension).
// The first file registered for a key stays its original.
class DeduplicationEngine
{
public:
    DeduplicationEngine(Database& Store, FileHasher& Hasher);

    DeduplicationEngine(const DeduplicationEngine&) = delete;
    DeduplicationEngine& operator=(const DeduplicationEngine&) = delete;

    DuplicateCheck CheckDuplicate(const std::string& Path, const std::optional<std::string>& Digest = std::nullopt, const std::optional<std::string>& Extension = std::nullopt);

    // Atomic check used by concurrent pipelines. When no group exists the caller
    // receives a claim on the key and must later RegisterFile or ReleaseClaim.
    // A second caller on a claimed key waits for the claim to resolve.
    DuplicateCheck ClaimOrMatch(const std::string& Path, const std::string& Digest, const std::string& Extension);
    void ReleaseClaim(const std::string& Digest, const std::string& Extension);

    // true when a new group was created with RecordId as original
    bool RegisterFile(const std::string& Path, const std::string& Digest, const std::string& Extension, int64_t RecordId);

    size_t PendingClaims() const;

    // Lowercased extension including the dot, empty when there is none.
    static std::string ExtensionClass(const std::string& Path);

    // Groups an explicit path list by digest without touching any session state.
    // Only digests shared by two or more paths are returned.
    static std::map<std::string, std::vector<std::string>> FindDuplicatesInSet(const std::vector<std::string>& Paths, FileHasher& Hasher, size_t ThreadCount);

    // Bytes reclaimable by keeping one file per group.
    static uint64_t SpaceSaved(const std::map<std::string, std::vector<std::string>>& Groups);

private:
    Database& Store;
    FileHasher& Hasher;

    mutable std::mutex EngineMutex;
    std::condition_variable Claim_CV;
    std::unordered_set<std::string> Claims;
    std::unordered_map<std::string, int64_t> KnownOriginals;
    // Store group generation KnownOriginals was filled under.
    uint64_t SeenGeneration = 0;

    static std::string MakeKey(const std::string& Digest, const std::string& Extension);
    std::optional<int64_t> FindOriginalLocked(const std::string& Key, const std::string& Digest, const std::string& Extension);
};
