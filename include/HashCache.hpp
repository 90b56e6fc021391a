#pragma once

#include <string>
#include <unordered_map>
#include <optional>
#include <mutex>
#include <cstdint>

#include "Records.hpp"

class Database;

// Path -> digest cache, valid while the file's size and mtime are unchanged.
// Memory first, then the cache table when a Database is attached.
// The cache is advisory: store failures are logged and never surface.
class HashCache
{
public:
    HashCache() = default;
    explicit HashCache(Database* Store);

    std::optional<std::string> Lookup(const std::string& Path, uint64_t Size, int64_t MTime);
    void Store(const std::string& Path, const std::string& Digest, uint64_t Size, int64_t MTime);

    // Drops persisted entries not accessed in the last Days days. Returns rows removed.
    uint64_t Prune(unsigned int Days);

    size_t MemoryEntries() const;

private:
    mutable std::mutex HashCacheMutex;
    std::unordered_map<std::string, CacheEntry> Entries;
    Database* PersistentStore = nullptr;
};
