#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

// Base of every error DupliSort raises on purpose.
class DupliSortError : public std::runtime_error
{
public:
    explicit DupliSortError(const std::string& Message) : std::runtime_error(Message) {}
};

// File level: unreadable source, unwritable destination. Recorded and skipped.
class FileAccessError : public DupliSortError
{
public:
    explicit FileAccessError(const std::string& Message) : DupliSortError(Message) {}
};

// File level: a stage could not complete (e.g. conflict resolution exhausted).
class PipelineError : public DupliSortError
{
public:
    explicit PipelineError(const std::string& Message) : DupliSortError(Message) {}
};

// Run level, raised before any worker starts.
class InsufficientSpaceError : public DupliSortError
{
public:
    InsufficientSpaceError(const std::string& Message, uint64_t Required, uint64_t Available)
        : DupliSortError(Message), RequiredBytes(Required), AvailableBytes(Available) {}

    uint64_t RequiredBytes;
    uint64_t AvailableBytes;
};

// Run level: progress cannot be trusted without the store.
class DatabaseError : public DupliSortError
{
public:
    explicit DatabaseError(const std::string& Message) : DupliSortError(Message) {}
};

class SchemaVersionError : public DatabaseError
{
public:
    SchemaVersionError(int Found, int Expected)
        : DatabaseError("Database schema version " + std::to_string(Found) + " does not match expected version " + std::to_string(Expected)),
          FoundVersion(Found), ExpectedVersion(Expected) {}

    int FoundVersion;
    int ExpectedVersion;
};

// Invalid state transition requested by a caller. No state was changed.
class OrchestratorError : public DupliSortError
{
public:
    explicit OrchestratorError(const std::string& Message) : DupliSortError(Message) {}
};

// A session looks resumable but its source or destination is gone.
class ResumeError : public DupliSortError
{
public:
    ResumeError(const std::string& Message, int64_t Id) : DupliSortError(Message), SessionId(Id) {}

    int64_t SessionId;
};

class ConfigError : public DupliSortError
{
public:
    explicit ConfigError(const std::string& Message) : DupliSortError(Message) {}
};
