#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include <filesystem>

namespace ConfigGlobal
{
    extern std::string ConfigFile;
    extern std::string LogDir;
    extern std::string DatabaseFile;

    extern bool SkipHidden;
    extern std::vector<std::string> SkipFilePatterns;
    extern std::vector<std::string> SkipFolderPatterns;

    extern unsigned short int MaxLogFiles;
    extern unsigned short int ThreadCount;
    extern unsigned int ProgressIntervalMs;
    extern unsigned int StopTimeoutSeconds;
    extern unsigned int CachePruneDays;
    extern uint64_t MinFreeSpaceMB;

    // Fixed locations relative to the destination root.
    extern std::filesystem::path ProgressFileName;
    extern std::filesystem::path DefaultDatabaseFileName;

    void InitializeDefaults();

    // DatabaseFile if configured, else the default location inside Destination.
    std::filesystem::path ResolveDatabasePath(const std::filesystem::path& Destination);
}
