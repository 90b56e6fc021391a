#pragma once

#include <filesystem>
#include <cstdint>

struct SpaceInfo
{
    uint64_t TotalBytes = 0;
    uint64_t FreeBytes = 0;
    uint64_t AvailableBytes = 0;
};

class SpaceChecker
{
public:
    static constexpr unsigned BufferPercent = 10;

    // Stats the nearest existing ancestor of Path. Throws FileAccessError.
    static SpaceInfo Query(const std::filesystem::path& Path);

    // Bytes plus a safety buffer plus the configured reserve.
    static uint64_t RequiredBytes(uint64_t PayloadBytes, uint64_t ReserveBytes);

    // Throws InsufficientSpaceError when Destination cannot take PayloadBytes.
    static void EnsureAvailable(const std::filesystem::path& Destination, uint64_t PayloadBytes, uint64_t ReserveBytes);
};
