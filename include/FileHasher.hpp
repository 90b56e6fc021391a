#pragma once

#include <string>
#include <atomic>
#include <cstdint>

class HashCache;

// BLAKE3 content digest, 64 lowercase hex chars.
class FileHasher
{
public:
    static constexpr size_t ChunkSize = 64 * 1024;

    FileHasher() = default;
    explicit FileHasher(HashCache* Cache);

    // Cached digest when size and mtime match, else streams the file. Throws FileAccessError.
    std::string Hash(const std::string& Path);

    static std::string HashContents(const std::string& Path);

    uint64_t FilesRead() const;

private:
    HashCache* Cache = nullptr;
    std::atomic<uint64_t> FilesReadCount{0};
};
