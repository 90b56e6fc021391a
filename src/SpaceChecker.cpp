#include "SpaceChecker.hpp"
#include "Errors.hpp"
#include "Logger.hpp"

namespace FS = std::filesystem;

namespace
{
    std::string ToMB(uint64_t Bytes)
    {
        return std::to_string(Bytes / (1024 * 1024)) + " MB";
    }
}

SpaceInfo SpaceChecker::Query(const FS::path& Path)
{
    FS::path Probe = FS::absolute(Path);
    std::error_code ec;
    while (!FS::exists(Probe, ec) && Probe.has_parent_path() && Probe != Probe.parent_path())
    {
        Probe = Probe.parent_path();
    }

    FS::space_info Space = FS::space(Probe, ec);
    if (ec)
    {
        throw FileAccessError("Cannot query free space of " + Probe.string() + ": " + ec.message());
    }

    SpaceInfo Info;
    Info.TotalBytes = Space.capacity;
    Info.FreeBytes = Space.free;
    Info.AvailableBytes = Space.available;
    return Info;
}

uint64_t SpaceChecker::RequiredBytes(uint64_t PayloadBytes, uint64_t ReserveBytes)
{
    return PayloadBytes + PayloadBytes / 100 * BufferPercent + ReserveBytes;
}

void SpaceChecker::EnsureAvailable(const FS::path& Destination, uint64_t PayloadBytes, uint64_t ReserveBytes)
{
    SpaceInfo Info = Query(Destination);
    uint64_t Required = RequiredBytes(PayloadBytes, ReserveBytes);

    Log.Info(std::string("[SpaceChecker] ") + Destination.string() + ": need " + ToMB(Required) + ", available " + ToMB(Info.AvailableBytes));

    if (Info.AvailableBytes < Required)
    {
        throw InsufficientSpaceError("Not enough space at " + Destination.string() + ": need " + ToMB(Required) + ", available " + ToMB(Info.AvailableBytes),
            Required, Info.AvailableBytes);
    }
}
