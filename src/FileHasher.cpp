#include "FileHasher.hpp"
#include "HashCache.hpp"
#include "Errors.hpp"
#include "TimeUtils.hpp"

#include <blake3.h>

#include <fcntl.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <vector>

namespace FS = std::filesystem;

namespace
{
    std::string ToHex(const uint8_t* Bytes, size_t Length)
    {
        static const char Digits[] = "0123456789abcdef";
        std::string Out;
        Out.reserve(Length * 2);
        for (size_t i = 0; i < Length; ++i)
        {
            Out.push_back(Digits[Bytes[i] >> 4]);
            Out.push_back(Digits[Bytes[i] & 0x0F]);
        }
        return Out;
    }
}

FileHasher::FileHasher(HashCache* Cache) : Cache(Cache)
{
}

std::string FileHasher::Hash(const std::string& Path)
{
    std::error_code ec;
    uintmax_t Size = FS::file_size(Path, ec);
    if (ec)
    {
        throw FileAccessError("Cannot stat " + Path + ": " + ec.message());
    }
    auto WriteTime = FS::last_write_time(Path, ec);
    if (ec)
    {
        throw FileAccessError("Cannot stat " + Path + ": " + ec.message());
    }
    int64_t MTime = ToNanoseconds(WriteTime);

    if (Cache)
    {
        if (auto Cached = Cache->Lookup(Path, Size, MTime))
        {
            return *Cached;
        }
    }

    std::string Digest = HashContents(Path);
    ++FilesReadCount;

    if (Cache)
    {
        Cache->Store(Path, Digest, Size, MTime);
    }
    return Digest;
}

std::string FileHasher::HashContents(const std::string& Path)
{
    int Fd = open(Path.c_str(), O_RDONLY | O_CLOEXEC);
    if (Fd < 0)
    {
        throw FileAccessError("Cannot open " + Path + ": " + std::strerror(errno));
    }

    blake3_hasher Hasher;
    blake3_hasher_init(&Hasher);

    std::vector<uint8_t> Buffer(ChunkSize);
    while (true)
    {
        ssize_t Read = read(Fd, Buffer.data(), Buffer.size());
        if (Read < 0)
        {
            if (errno == EINTR)
            {
                continue;
            }
            int Saved = errno;
            close(Fd);
            throw FileAccessError("Read failed for " + Path + ": " + std::strerror(Saved));
        }
        if (Read == 0)
        {
            break;
        }
        blake3_hasher_update(&Hasher, Buffer.data(), static_cast<size_t>(Read));
    }
    close(Fd);

    uint8_t OutHash[BLAKE3_OUT_LEN] = { 0 };
    blake3_hasher_finalize(&Hasher, OutHash, sizeof(OutHash));
    return ToHex(OutHash, sizeof(OutHash));
}

uint64_t FileHasher::FilesRead() const
{
    return FilesReadCount.load();
}
