#pragma once

#include <string>
#include <fstream>
#include <mutex>
#include <cstdint>

enum class LogLevel
{
    INFO,
    WARN,
    ERROR
};

// One timestamped file per run. Safe to call from any worker thread;
// calls before Init are dropped.
class Logger
{
public:
    Logger() = default;
    ~Logger();

    bool Init(const std::string& LogDir);
    void Close();

    void Write(LogLevel Level, const std::string& Message);
    void Info(const std::string& Message);
    void Warn(const std::string& Message);
    void Error(const std::string& Message);

    // Keeps the newest MaxFiles run logs in the log directory.
    void RotateLogs(unsigned int MaxFiles);

    uint64_t WarningCount() const;
    uint64_t ErrorCount() const;
    std::string GetLogFilePath() const;

    static std::string TimestampForFilename();

private:
    mutable std::mutex LogWriteMutex;
    std::ofstream LogFile;
    std::string LogDirectory;
    std::string LogFilePath;
    uint64_t Warnings = 0;
    uint64_t Errors = 0;

    static std::string TimestampNow();
    static const char* LevelName(LogLevel Level);
};

extern Logger Log;
