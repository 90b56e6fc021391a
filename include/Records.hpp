#pragma once

#include <cstdint>
#include <optional>
#include <string>

enum class SessionStatus
{
    Pending,
    Running,
    Paused,
    Completed,
    Stopped,
    Error,
    Undone
};

enum class ProcessingStatus
{
    Completed,
    Duplicate,
    Skipped,
    Error
};

enum class FileType
{
    Image,
    Video,
    Audio,
    Document,
    Sidecar,
    Unknown
};

std::string ToString(SessionStatus Status);
std::string ToString(ProcessingStatus Status);
std::string ToString(FileType Type);

// Throw DatabaseError on text that was never written by ToString.
SessionStatus ParseSessionStatus(const std::string& Text);
ProcessingStatus ParseProcessingStatus(const std::string& Text);
FileType ParseFileType(const std::string& Text);

bool IsActiveStatus(SessionStatus Status);

struct SessionCounters
{
    uint64_t FilesScanned = 0;
    uint64_t FilesProcessed = 0;
    uint64_t FilesSkipped = 0;
    uint64_t Duplicates = 0;
    uint64_t Errors = 0;
    uint64_t BytesProcessed = 0;
    uint64_t BytesTotal = 0;
};

struct Session
{
    int64_t Id = 0;
    std::string SourcePath;
    std::string DestinationPath;
    SessionStatus Status = SessionStatus::Pending;
    int64_t StartTime = 0;
    std::optional<int64_t> EndTime;
    SessionCounters Counters;
    std::string ConfigFingerprint;
    std::optional<std::string> ErrorMessage;
};

struct FileRecord
{
    int64_t Id = 0;
    int64_t SessionId = 0;
    std::string SourcePath;
    std::optional<std::string> DestinationPath;
    std::string Digest;
    uint64_t Size = 0;
    FileType Type = FileType::Unknown;
    std::string Extension;
    ProcessingStatus Status = ProcessingStatus::Completed;
    std::string Category;
    std::optional<int64_t> DateTaken;
    std::string CameraMake;
    std::string CameraModel;
    std::string MetadataJson;
    std::optional<std::string> ErrorMessage;
    int64_t ProcessedAt = 0;
    std::optional<int64_t> DuplicateOf;
};

struct DuplicateGroup
{
    std::string Digest;
    std::string Extension;
    int64_t OriginalId = 0;
    uint64_t DuplicateCount = 0;
    int64_t FirstSeen = 0;
    int64_t LastSeen = 0;
};

struct CacheEntry
{
    std::string Path;
    std::string Digest;
    uint64_t Size = 0;
    int64_t MTime = 0;
    int64_t LastAccessed = 0;
};
