#include "DeduplicationEngine.hpp"
#include "Database.hpp"
#include "FileHasher.hpp"
#include "ThreadPool.hpp"
#include "Errors.hpp"
#include "Logger.hpp"
#include "TimeUtils.hpp"
#include "PathUtils.hpp"

#include <algorithm>
#include <filesystem>

namespace FS = std::filesystem;

DeduplicationEngine::DeduplicationEngine(Database& Store, FileHasher& Hasher) : Store(Store), Hasher(Hasher)
{
}

std::string DeduplicationEngine::ExtensionClass(const std::string& Path)
{
    return LowercaseExtension(Path);
}

std::string DeduplicationEngine::MakeKey(const std::string& Digest, const std::string& Extension)
{
    return Digest + '|' + Extension;
}

std::optional<int64_t> DeduplicationEngine::FindOriginalLocked(const std::string& Key, const std::string& Digest, const std::string& Extension)
{
    const uint64_t Generation = Store.GroupGeneration();
    if (Generation != SeenGeneration)
    {
        KnownOriginals.clear();
        SeenGeneration = Generation;
    }

    auto It = KnownOriginals.find(Key);
    if (It != KnownOriginals.end())
    {
        return It->second;
    }

    auto Group = Store.FindDuplicateGroup(Digest, Extension);
    if (!Group)
    {
        return std::nullopt;
    }
    KnownOriginals.emplace(Key, Group->OriginalId);
    return Group->OriginalId;
}

DuplicateCheck DeduplicationEngine::CheckDuplicate(const std::string& Path, const std::optional<std::string>& Digest, const std::optional<std::string>& Extension)
{
    DuplicateCheck Result;
    Result.Digest = Digest ? *Digest : Hasher.Hash(Path);
    Result.Extension = Extension ? *Extension : ExtensionClass(Path);

    std::lock_guard<std::mutex> Lock(EngineMutex);
    Result.OriginalId = FindOriginalLocked(MakeKey(Result.Digest, Result.Extension), Result.Digest, Result.Extension);
    Result.IsDuplicate = Result.OriginalId.has_value();
    return Result;
}

DuplicateCheck DeduplicationEngine::ClaimOrMatch(const std::string& Path, const std::string& Digest, const std::string& Extension)
{
    DuplicateCheck Result;
    Result.Digest = Digest;
    Result.Extension = Extension;

    const std::string Key = MakeKey(Digest, Extension);

    std::unique_lock<std::mutex> Lock(EngineMutex);
    while (true)
    {
        Result.OriginalId = FindOriginalLocked(Key, Digest, Extension);
        if (Result.OriginalId)
        {
            Result.IsDuplicate = true;
            return Result;
        }
        if (Claims.find(Key) == Claims.end())
        {
            Claims.insert(Key);
            return Result;
        }
        Log.Info(std::string("[Dedup] Waiting on in-flight original for ") + Path);
        Claim_CV.wait(Lock, [this, &Key] { return Claims.find(Key) == Claims.end(); });
    }
}

void DeduplicationEngine::ReleaseClaim(const std::string& Digest, const std::string& Extension)
{
    {
        std::lock_guard<std::mutex> Lock(EngineMutex);
        if (Claims.erase(MakeKey(Digest, Extension)) == 0)
        {
            return;
        }
    }
    Claim_CV.notify_all();
}

bool DeduplicationEngine::RegisterFile(const std::string& Path, const std::string& Digest, const std::string& Extension, int64_t RecordId)
{
    const std::string Key = MakeKey(Digest, Extension);
    bool Created = false;
    {
        std::lock_guard<std::mutex> Lock(EngineMutex);
        try
        {
            Created = Store.RegisterInGroup(Digest, Extension, RecordId, NowSeconds());
        }
        catch (const DatabaseError&)
        {
            Claims.erase(Key);
            Claim_CV.notify_all();
            throw;
        }
        if (Created)
        {
            KnownOriginals[Key] = RecordId;
        }
        Claims.erase(Key);
    }
    Claim_CV.notify_all();

    if (Created)
    {
        Log.Info(std::string("[Dedup] New original ") + Path + " (" + Digest.substr(0, 16) + Extension + ")");
    }
    return Created;
}

size_t DeduplicationEngine::PendingClaims() const
{
    std::lock_guard<std::mutex> Lock(EngineMutex);
    return Claims.size();
}

std::map<std::string, std::vector<std::string>> DeduplicationEngine::FindDuplicatesInSet(const std::vector<std::string>& Paths, FileHasher& Hasher, size_t ThreadCount)
{
    Log.Info(std::string("[Dedup] Hashing ") + std::to_string(Paths.size()) + " files using " + std::to_string(ThreadCount) + " threads.");

    std::map<std::string, std::vector<std::string>> ByDigest;
    std::mutex ResultMutex;

    {
        ThreadPool Pool(std::max<size_t>(1, std::min(ThreadCount, Paths.size())), "hash");
        for (const auto& Path : Paths)
        {
            Pool.Submit([&Path, &Hasher, &ByDigest, &ResultMutex]()
            {
                try
                {
                    std::string Digest = Hasher.Hash(Path);
                    std::lock_guard<std::mutex> Lock(ResultMutex);
                    ByDigest[Digest].push_back(Path);
                }
                catch (const FileAccessError& e)
                {
                    Log.Warn(std::string("[Dedup] Skipping unreadable file: ") + e.what());
                }
            });
        }
        if (size_t Failed = Pool.Join())
        {
            Log.Error("[Dedup] " + std::to_string(Failed) + " hashing jobs failed");
        }
    }

    for (auto It = ByDigest.begin(); It != ByDigest.end(); )
    {
        if (It->second.size() < 2)
        {
            It = ByDigest.erase(It);
            continue;
        }
        std::sort(It->second.begin(), It->second.end());
        ++It;
    }
    return ByDigest;
}

uint64_t DeduplicationEngine::SpaceSaved(const std::map<std::string, std::vector<std::string>>& Groups)
{
    uint64_t Saved = 0;
    for (const auto& [Digest, Paths] : Groups)
    {
        if (Paths.size() < 2)
        {
            continue;
        }
        std::error_code ec;
        uintmax_t Size = FS::file_size(Paths.front(), ec);
        if (ec)
        {
            Log.Warn(std::string("[Dedup] Cannot size ") + Paths.front() + ": " + ec.message());
            continue;
        }
        Saved += static_cast<uint64_t>(Size) * (Paths.size() - 1);
    }
    return Saved;
}
