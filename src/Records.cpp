#include "Records.hpp"
#include "Errors.hpp"

std::string ToString(SessionStatus Status)
{
    switch (Status)
    {
    case SessionStatus::Pending:   return "pending";
    case SessionStatus::Running:   return "running";
    case SessionStatus::Paused:    return "paused";
    case SessionStatus::Completed: return "completed";
    case SessionStatus::Stopped:   return "stopped";
    case SessionStatus::Error:     return "error";
    case SessionStatus::Undone:    return "undone";
    }
    return "unknown";
}

std::string ToString(ProcessingStatus Status)
{
    switch (Status)
    {
    case ProcessingStatus::Completed: return "completed";
    case ProcessingStatus::Duplicate: return "duplicate";
    case ProcessingStatus::Skipped:   return "skipped";
    case ProcessingStatus::Error:     return "error";
    }
    return "unknown";
}

std::string ToString(FileType Type)
{
    switch (Type)
    {
    case FileType::Image:    return "image";
    case FileType::Video:    return "video";
    case FileType::Audio:    return "audio";
    case FileType::Document: return "document";
    case FileType::Sidecar:  return "sidecar";
    case FileType::Unknown:  return "unknown";
    }
    return "unknown";
}

SessionStatus ParseSessionStatus(const std::string& Text)
{
    if (Text == "pending")   return SessionStatus::Pending;
    if (Text == "running")   return SessionStatus::Running;
    if (Text == "paused")    return SessionStatus::Paused;
    if (Text == "completed") return SessionStatus::Completed;
    if (Text == "stopped")   return SessionStatus::Stopped;
    if (Text == "error")     return SessionStatus::Error;
    if (Text == "undone")    return SessionStatus::Undone;
    throw DatabaseError("Unknown session status in database: " + Text);
}

ProcessingStatus ParseProcessingStatus(const std::string& Text)
{
    if (Text == "completed") return ProcessingStatus::Completed;
    if (Text == "duplicate") return ProcessingStatus::Duplicate;
    if (Text == "skipped")   return ProcessingStatus::Skipped;
    if (Text == "error")     return ProcessingStatus::Error;
    throw DatabaseError("Unknown file status in database: " + Text);
}

FileType ParseFileType(const std::string& Text)
{
    if (Text == "image")    return FileType::Image;
    if (Text == "video")    return FileType::Video;
    if (Text == "audio")    return FileType::Audio;
    if (Text == "document") return FileType::Document;
    if (Text == "sidecar")  return FileType::Sidecar;
    if (Text == "unknown")  return FileType::Unknown;
    throw DatabaseError("Unknown file type in database: " + Text);
}

bool IsActiveStatus(SessionStatus Status)
{
    return Status == SessionStatus::Running || Status == SessionStatus::Paused;
}
