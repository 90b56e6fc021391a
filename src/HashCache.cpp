#include "HashCache.hpp"
#include "Database.hpp"
#include "Errors.hpp"
#include "Logger.hpp"
#include "TimeUtils.hpp"

HashCache::HashCache(Database* Store) : PersistentStore(Store)
{
}

std::optional<std::string> HashCache::Lookup(const std::string& Path, uint64_t Size, int64_t MTime)
{
    {
        std::lock_guard<std::mutex> Lock(HashCacheMutex);
        auto It = Entries.find(Path);
        if (It != Entries.end())
        {
            if (It->second.Size == Size && It->second.MTime == MTime)
            {
                It->second.LastAccessed = NowSeconds();
                return It->second.Digest;
            }
            Entries.erase(It);
            return std::nullopt;
        }
    }

    if (!PersistentStore)
    {
        return std::nullopt;
    }

    try
    {
        auto Persisted = PersistentStore->GetCacheEntry(Path);
        if (!Persisted || Persisted->Size != Size || Persisted->MTime != MTime)
        {
            return std::nullopt;
        }

        int64_t Now = NowSeconds();
        PersistentStore->TouchCacheEntry(Path, Now);
        Persisted->LastAccessed = Now;

        std::lock_guard<std::mutex> Lock(HashCacheMutex);
        Entries[Path] = *Persisted;
        return Persisted->Digest;
    }
    catch (const DatabaseError& e)
    {
        Log.Warn(std::string("[HashCache] Lookup failed for ") + Path + ": " + e.what());
        return std::nullopt;
    }
}

void HashCache::Store(const std::string& Path, const std::string& Digest, uint64_t Size, int64_t MTime)
{
    CacheEntry Entry;
    Entry.Path = Path;
    Entry.Digest = Digest;
    Entry.Size = Size;
    Entry.MTime = MTime;
    Entry.LastAccessed = NowSeconds();

    {
        std::lock_guard<std::mutex> Lock(HashCacheMutex);
        Entries[Path] = Entry;
    }

    if (!PersistentStore)
    {
        return;
    }

    try
    {
        PersistentStore->UpsertCacheEntry(Entry);
    }
    catch (const DatabaseError& e)
    {
        Log.Warn(std::string("[HashCache] Could not persist entry for ") + Path + ": " + e.what());
    }
}

uint64_t HashCache::Prune(unsigned int Days)
{
    if (!PersistentStore || Days == 0)
    {
        return 0;
    }

    int64_t Cutoff = NowSeconds() - static_cast<int64_t>(Days) * 86400;
    uint64_t Removed = PersistentStore->PruneCacheOlderThan(Cutoff);

    {
        std::lock_guard<std::mutex> Lock(HashCacheMutex);
        for (auto It = Entries.begin(); It != Entries.end(); )
        {
            if (It->second.LastAccessed < Cutoff)
            {
                It = Entries.erase(It);
                continue;
            }
            ++It;
        }
    }

    Log.Info(std::string("[HashCache] Pruned ") + std::to_string(Removed) + " entries older than " + std::to_string(Days) + " days");
    return Removed;
}

size_t HashCache::MemoryEntries() const
{
    std::lock_guard<std::mutex> Lock(HashCacheMutex);
    return Entries.size();
}
