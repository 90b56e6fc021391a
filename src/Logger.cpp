#include "Logger.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <filesystem>
#include <iostream>
#include <vector>
#include <algorithm>

Logger Log;
namespace FS = std::filesystem;

namespace
{
    const char* const LogFilePrefix = "DupliSort_Log";

    std::string FormatLocalTime(const char* Format)
    {
        std::time_t Time = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
        std::tm Local{};
        localtime_r(&Time, &Local);

        std::ostringstream Stream;
        Stream << std::put_time(&Local, Format);
        return Stream.str();
    }
}

Logger::~Logger()
{
    Close();
}

bool Logger::Init(const std::string& LogDir)
{
    std::error_code ec;
    FS::create_directories(LogDir, ec);
    if (ec)
    {
        std::cerr << "Logger: Failed to create log directory: " << LogDir << " (" << ec.message() << ")\n";
        return false;
    }

    const std::string FilePath = (FS::path(LogDir) / (LogFilePrefix + TimestampForFilename() + ".txt")).string();
    {
        std::lock_guard<std::mutex> Lock(LogWriteMutex);
        if (LogFile.is_open())
        {
            LogFile.close();
        }
        LogFile.open(FilePath, std::ios::out | std::ios::app);
        if (!LogFile.is_open())
        {
            std::cerr << "Logger: Failed to open log file: " << FilePath << "\n";
            return false;
        }
        LogDirectory = LogDir;
        LogFilePath = FilePath;
        Warnings = 0;
        Errors = 0;
    }

    Info("Run Started at " + TimestampNow());
    return true;
}

void Logger::Close()
{
    std::lock_guard<std::mutex> Lock(LogWriteMutex);
    if (LogFile.is_open())
    {
        LogFile << "[" << TimestampNow() << "] [INFO] Run Finished (" << Warnings << " warnings, " << Errors << " errors)\n";
        LogFile.close();
    }
}

void Logger::RotateLogs(unsigned int MaxFiles)
{
    std::string Directory;
    std::string Current;
    {
        std::lock_guard<std::mutex> Lock(LogWriteMutex);
        Directory = LogDirectory;
        Current = LogFilePath;
    }
    if (Directory.empty())
    {
        return;
    }

    std::vector<FS::path> Logs;
    std::error_code ec;
    for (FS::directory_iterator It(Directory, ec); !ec && It != FS::directory_iterator(); It.increment(ec))
    {
        if (It->is_regular_file() && It->path().filename().string().rfind(LogFilePrefix, 0) == 0)
        {
            Logs.push_back(It->path());
        }
    }
    if (ec)
    {
        Warn("[Logger] Could not list " + Directory + ": " + ec.message());
        return;
    }
    if (Logs.size() <= MaxFiles)
    {
        return;
    }

    // Timestamped names sort oldest first.
    std::sort(Logs.begin(), Logs.end());

    size_t Excess = Logs.size() - MaxFiles;
    for (size_t i = 0; i < Logs.size() && Excess > 0; ++i)
    {
        if (Logs[i].string() == Current)
        {
            continue;
        }
        std::error_code RemoveError;
        if (!FS::remove(Logs[i], RemoveError) && RemoveError)
        {
            Warn("[Logger] Could not remove old log " + Logs[i].string() + ": " + RemoveError.message());
        }
        --Excess;
    }
}

void Logger::Write(LogLevel Level, const std::string& Message)
{
    std::lock_guard<std::mutex> Lock(LogWriteMutex);
    if (Level == LogLevel::WARN)
    {
        ++Warnings;
    }
    else if (Level == LogLevel::ERROR)
    {
        ++Errors;
    }

    if (!LogFile.is_open())
    {
        return;
    }
    LogFile << "[" << TimestampNow() << "] [" << LevelName(Level) << "] " << Message << "\n";
    LogFile.flush();
}

void Logger::Info(const std::string& Message)
{
    Write(LogLevel::INFO, Message);
}

void Logger::Warn(const std::string& Message)
{
    Write(LogLevel::WARN, Message);
}

void Logger::Error(const std::string& Message)
{
    Write(LogLevel::ERROR, Message);
}

uint64_t Logger::WarningCount() const
{
    std::lock_guard<std::mutex> Lock(LogWriteMutex);
    return Warnings;
}

uint64_t Logger::ErrorCount() const
{
    std::lock_guard<std::mutex> Lock(LogWriteMutex);
    return Errors;
}

std::string Logger::GetLogFilePath() const
{
    std::lock_guard<std::mutex> Lock(LogWriteMutex);
    return LogFilePath;
}

std::string Logger::TimestampForFilename()
{
    return FormatLocalTime("%Y%m%d_%H%M%S");
}

std::string Logger::TimestampNow()
{
    return FormatLocalTime("%Y-%m-%d %H:%M:%S");
}

const char* Logger::LevelName(LogLevel Level)
{
    switch (Level)
    {
    case LogLevel::INFO:  return "INFO";
    case LogLevel::WARN:  return "WARN";
    case LogLevel::ERROR: return "ERROR";
    }
    return "UNKNOWN";
}
