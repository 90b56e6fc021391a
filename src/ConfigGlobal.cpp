#include "ConfigGlobal.hpp"

#include <thread>

namespace ConfigGlobal
{
    std::string ConfigFile;
    std::string LogDir;
    std::string DatabaseFile;

    bool SkipHidden;
    std::vector<std::string> SkipFilePatterns;
    std::vector<std::string> SkipFolderPatterns;

    unsigned short int MaxLogFiles;
    unsigned short int ThreadCount;
    unsigned int ProgressIntervalMs;
    unsigned int StopTimeoutSeconds;
    unsigned int CachePruneDays;
    uint64_t MinFreeSpaceMB;

    std::filesystem::path ProgressFileName;
    std::filesystem::path DefaultDatabaseFileName;

    void InitializeDefaults()
    {
        ConfigFile = "Config.txt"; //Relative to the working directory unless --config is given
        LogDir = "DupliSort_Logs";
        DatabaseFile.clear(); //Empty means <Destination>/db/duplisort.db
        SkipHidden = true;
        SkipFilePatterns.clear();
        SkipFolderPatterns.clear();
        MaxLogFiles = 10;
        ThreadCount = static_cast<unsigned short int>(std::thread::hardware_concurrency());
        if (ThreadCount == 0)
        {
            ThreadCount = 4;
        }
        ProgressIntervalMs = 1000;
        StopTimeoutSeconds = 30;
        CachePruneDays = 0; //0 disables pruning
        MinFreeSpaceMB = 512;
        ProgressFileName = std::filesystem::path("conf") / "progress.json";
        DefaultDatabaseFileName = std::filesystem::path("db") / "duplisort.db";
    }

    std::filesystem::path ResolveDatabasePath(const std::filesystem::path& Destination)
    {
        if (!DatabaseFile.empty())
        {
            return DatabaseFile;
        }
        return Destination / DefaultDatabaseFileName;
    }
}
