#pragma once

#include <string>
#include <vector>
#include <atomic>
#include <filesystem>

enum class CopyOutcome
{
    Copied,
    DestinationExists
};

class FileCopier
{
public:
    static std::atomic<bool> CopyFileRangeSupported;

    // Copies into a hidden temp file beside Destination, fsyncs it, then links it
    // into place without replacing anything. Destination is never visible half
    // written. Throws FileAccessError on I/O failure, InsufficientSpaceError when
    // the destination fills up.
    static CopyOutcome CopyAtomic(const std::filesystem::path& Source, const std::filesystem::path& Destination);

    // Companion files sharing the source's base name ("IMG_1.xmp", "IMG_1.JPG.xmp").
    static std::vector<std::filesystem::path> FindSidecars(const std::filesystem::path& Source);
    static const std::vector<std::string>& SidecarExtensions();

    // Throws InsufficientSpaceError for ENOSPC and EDQUOT, FileAccessError otherwise.
    [[noreturn]] static void RaiseIoError(const std::string& What, int Error);

    // "IMG_1.jpg" -> ".xmp" for sidecar "IMG_1.xmp", ".jpg.xmp" for "IMG_1.jpg.xmp"
    static std::string SidecarSuffix(const std::filesystem::path& Source, const std::filesystem::path& Sidecar);

private:
    static void CopyContents(int SrcFd, int DestFd, uintmax_t Size, const std::string& SourcePath);
    static std::filesystem::path MakeTempPath(const std::filesystem::path& Destination);
};
