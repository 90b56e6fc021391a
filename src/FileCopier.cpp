#include "FileCopier.hpp"
#include "Errors.hpp"
#include "Logger.hpp"

#include <fcntl.h>
#include <unistd.h>
#include <sys/stat.h>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <functional>
#include <algorithm>
#include <cctype>
#include <set>
#include <thread>
#include <vector>

namespace FS = std::filesystem;

std::atomic<bool> FileCopier::CopyFileRangeSupported{true};

namespace
{
    std::atomic<uint64_t> TempCounter{0};

    class FileDescriptor
    {
    public:
        explicit FileDescriptor(int Fd) : Fd(Fd) {}
        ~FileDescriptor()
        {
            if (Fd >= 0)
            {
                close(Fd);
            }
        }

        FileDescriptor(const FileDescriptor&) = delete;
        FileDescriptor& operator=(const FileDescriptor&) = delete;

        int Get() const { return Fd; }

        // Returns the close() result so write-back errors are not lost.
        int Release()
        {
            int Result = close(Fd);
            Fd = -1;
            return Result;
        }

    private:
        int Fd;
    };

    std::string ErrnoText(int Error)
    {
        return std::strerror(Error);
    }

    void SyncDirectory(const FS::path& Dir)
    {
        int Fd = open(Dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
        if (Fd < 0)
        {
            return;
        }
        if (fsync(Fd) != 0)
        {
            Log.Warn(std::string("[FileCopier] fsync failed on directory ") + Dir.string() + ": " + ErrnoText(errno));
        }
        close(Fd);
    }
}

void FileCopier::RaiseIoError(const std::string& What, int Error)
{
    const std::string Message = What + ": " + ErrnoText(Error);
    if (Error == ENOSPC || Error == EDQUOT)
    {
        throw InsufficientSpaceError(Message, 0, 0);
    }
    throw FileAccessError(Message);
}

void FileCopier::CopyContents(int SrcFd, int DestFd, uintmax_t Size, const std::string& SourcePath)
{
    uintmax_t Remaining = Size;

    if (CopyFileRangeSupported)
    {
        while (Remaining > 0)
        {
            ssize_t Copied = copy_file_range(SrcFd, nullptr, DestFd, nullptr, Remaining, 0);
            if (Copied < 0)
            {
                if (errno == EINTR)
                {
                    continue;
                }
                if (errno == ENOSYS || errno == EXDEV || errno == EINVAL || errno == EOPNOTSUPP)
                {
                    if (errno == ENOSYS)
                    {
                        CopyFileRangeSupported = false;
                        Log.Info(std::string("[FileCopier] copy_file_range not supported, using read/write"));
                    }
                    break;
                }
                RaiseIoError("copy_file_range failed for " + SourcePath, errno);
            }
            if (Copied == 0)
            {
                // file shrank while copying
                break;
            }
            Remaining -= static_cast<uintmax_t>(Copied);
        }
        if (Remaining == 0)
        {
            return;
        }
    }

    std::vector<char> Buffer(1024 * 1024);
    while (true)
    {
        ssize_t Read = read(SrcFd, Buffer.data(), Buffer.size());
        if (Read < 0)
        {
            if (errno == EINTR)
            {
                continue;
            }
            RaiseIoError("Read failed for " + SourcePath, errno);
        }
        if (Read == 0)
        {
            return;
        }

        ssize_t Offset = 0;
        while (Offset < Read)
        {
            ssize_t Written = write(DestFd, Buffer.data() + Offset, static_cast<size_t>(Read - Offset));
            if (Written < 0)
            {
                if (errno == EINTR)
                {
                    continue;
                }
                RaiseIoError("Write failed while copying " + SourcePath, errno);
            }
            Offset += Written;
        }
    }
}

FS::path FileCopier::MakeTempPath(const FS::path& Destination)
{
    std::string Name = "." + Destination.filename().string() + ".duplisort-" + std::to_string(getpid()) + "-" +
        std::to_string(std::hash<std::thread::id>{}(std::this_thread::get_id()) % 100000) + "-" +
        std::to_string(TempCounter.fetch_add(1)) + ".tmp";
    return Destination.parent_path() / Name;
}

CopyOutcome FileCopier::CopyAtomic(const FS::path& Source, const FS::path& Destination)
{
    std::error_code ec;
    FS::create_directories(Destination.parent_path(), ec);
    if (ec)
    {
        throw FileAccessError("Cannot create directory " + Destination.parent_path().string() + ": " + ec.message());
    }

    FileDescriptor SrcFd(open(Source.c_str(), O_RDONLY | O_CLOEXEC));
    if (SrcFd.Get() < 0)
    {
        throw FileAccessError("Failed to open source file " + Source.string() + ": " + ErrnoText(errno));
    }

    struct stat SrcStat;
    if (fstat(SrcFd.Get(), &SrcStat) != 0)
    {
        throw FileAccessError("Failed to stat source file " + Source.string() + ": " + ErrnoText(errno));
    }

    const FS::path TempPath = MakeTempPath(Destination);
    FileDescriptor DestFd(open(TempPath.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, SrcStat.st_mode & 0777));
    if (DestFd.Get() < 0)
    {
        RaiseIoError("Failed to create temp file " + TempPath.string(), errno);
    }

    auto DiscardTemp = [&TempPath]()
    {
        if (unlink(TempPath.c_str()) != 0 && errno != ENOENT)
        {
            Log.Warn(std::string("[FileCopier] Could not remove temp file ") + TempPath.string() + ": " + ErrnoText(errno));
        }
    };

    try
    {
        CopyContents(SrcFd.Get(), DestFd.Get(), static_cast<uintmax_t>(SrcStat.st_size), Source.string());

        struct timespec Times[2] = { SrcStat.st_atim, SrcStat.st_mtim };
        if (futimens(DestFd.Get(), Times) != 0)
        {
            Log.Warn(std::string("[FileCopier] Could not preserve timestamps on ") + Destination.string() + ": " + ErrnoText(errno));
        }
        if (fsync(DestFd.Get()) != 0)
        {
            RaiseIoError("fsync failed for " + TempPath.string(), errno);
        }
        if (DestFd.Release() != 0)
        {
            RaiseIoError("close failed for " + TempPath.string(), errno);
        }
    }
    catch (const DupliSortError&)
    {
        DiscardTemp();
        throw;
    }

    // link() refuses to replace an existing name.
    if (link(TempPath.c_str(), Destination.c_str()) == 0)
    {
        DiscardTemp();
        SyncDirectory(Destination.parent_path());
        return CopyOutcome::Copied;
    }

    int LinkError = errno;
    if (LinkError == EEXIST)
    {
        DiscardTemp();
        return CopyOutcome::DestinationExists;
    }

    if (LinkError == EPERM || LinkError == ENOTSUP || LinkError == EOPNOTSUPP || LinkError == EMLINK)
    {
        // No hard links on this filesystem.
        if (renameat2(AT_FDCWD, TempPath.c_str(), AT_FDCWD, Destination.c_str(), RENAME_NOREPLACE) == 0)
        {
            SyncDirectory(Destination.parent_path());
            return CopyOutcome::Copied;
        }
        int RenameError = errno;
        if (RenameError == EEXIST)
        {
            DiscardTemp();
            return CopyOutcome::DestinationExists;
        }
        DiscardTemp();
        RaiseIoError("Failed to move " + TempPath.string() + " into place", RenameError);
    }

    DiscardTemp();
    RaiseIoError("Failed to link " + Destination.string(), LinkError);
}

const std::vector<std::string>& FileCopier::SidecarExtensions()
{
    static const std::vector<std::string> Extensions = { ".xmp", ".aae", ".thm", ".srt", ".sub", ".lrc" };
    return Extensions;
}

std::vector<FS::path> FileCopier::FindSidecars(const FS::path& Source)
{
    const std::string Stem = Source.stem().string();
    const std::string Name = Source.filename().string();
    const FS::path Parent = Source.parent_path();

    // Sorted and unique, so "IMG_1" + ".xmp" is looked at once.
    std::set<FS::path> Candidates;
    for (const auto& Ext : SidecarExtensions())
    {
        std::string Upper = Ext;
        std::transform(Upper.begin(), Upper.end(), Upper.begin(), [](unsigned char c) { return std::toupper(c); });
        for (const std::string& Variant : { Ext, Upper })
        {
            Candidates.insert(Parent / (Stem + Variant));
            Candidates.insert(Parent / (Name + Variant));
        }
    }

    std::vector<FS::path> Sidecars;
    for (const auto& Candidate : Candidates)
    {
        if (Candidate == Source)
        {
            continue;
        }
        std::error_code ec;
        if (FS::is_regular_file(FS::symlink_status(Candidate, ec)))
        {
            Sidecars.push_back(Candidate);
        }
    }
    return Sidecars;
}

std::string FileCopier::SidecarSuffix(const FS::path& Source, const FS::path& Sidecar)
{
    const std::string SidecarName = Sidecar.filename().string();
    const std::string Stem = Source.stem().string();
    if (SidecarName.size() > Stem.size() && SidecarName.compare(0, Stem.size(), Stem) == 0)
    {
        return SidecarName.substr(Stem.size());
    }
    return Sidecar.extension().string();
}
