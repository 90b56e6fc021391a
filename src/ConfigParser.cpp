#include <thread>
#include <fstream>
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <string>

#include "ConfigParser.hpp"
#include "ConfigGlobal.hpp"
#include "PathUtils.hpp"

namespace FS = std::filesystem;

namespace
{
    void Trim(std::string& Text)
    {
        Text.erase(Text.begin(), std::find_if(Text.begin(), Text.end(), [](char Ch) { return !std::isspace(static_cast<unsigned char>(Ch)); }));
        Text.erase(std::find_if(Text.rbegin(), Text.rend(), [](char Ch) { return !std::isspace(static_cast<unsigned char>(Ch)); }).base(), Text.end());
    }
}

const std::vector<std::string>& ConfigParser::GetErrors() const
{
    return Errors;
}

const std::vector<std::string>& ConfigParser::GetInfos() const
{
    return Infos;
}

void ConfigParser::Reset()
{
    Errors.clear();
    Infos.clear();

    ConfigGlobal::InitializeDefaults();
}

void ConfigParser::AddError(const std::string& Message)
{
    Errors.push_back(Message);
}

void ConfigParser::AddInfo(const std::string& Message)
{
    Infos.push_back(Message);
}

bool ConfigParser::IsParentDirectory(const std::string& Parent, const std::string& Child)
{
    std::error_code ec;
    auto ParentAbs = FS::absolute(FS::path(Parent), ec).lexically_normal();
    if (ec)
    {
        return false;
    }
    auto ChildAbs = FS::absolute(FS::path(Child), ec).lexically_normal();
    if (ec)
    {
        return false;
    }

    auto ParentIt = ParentAbs.begin();
    auto ChildIt = ChildAbs.begin();

    for (; ParentIt != ParentAbs.end() && ChildIt != ChildAbs.end(); ++ParentIt, ++ChildIt)
    {
        // "a/b/" normalizes with a trailing empty element
        if (ParentIt->empty())
        {
            return true;
        }
        if (*ParentIt != *ChildIt)
        {
            return false;
        }
    }
    return ParentIt == ParentAbs.end() || ParentIt->empty();
}

bool ConfigParser::ParseYesNo(const std::string& Value, int LineNumber, bool& Out)
{
    if (Value == "YES")
    {
        Out = true;
        return true;
    }
    if (Value == "NO")
    {
        Out = false;
        return true;
    }
    AddError("Line " + std::to_string(LineNumber) + ": Invalid Input. Use 'YES' or 'NO'.");
    return false;
}

bool ConfigParser::ParseCount(const std::string& Key, const std::string& Value, int LineNumber, unsigned long long Max, unsigned long long& Out)
{
    try
    {
        size_t Consumed = 0;
        unsigned long long ValueNum = std::stoull(Value, &Consumed);
        if (Consumed != Value.size() || Value.front() == '-')
        {
            AddError("Line " + std::to_string(LineNumber) + ": Invalid number for " + Key + ".");
            return false;
        }
        if (ValueNum == 0 || ValueNum > Max)
        {
            AddError("Line " + std::to_string(LineNumber) + ": " + Key + " must be between 1 and " + std::to_string(Max) + ".");
            return false;
        }
        Out = ValueNum;
        return true;
    }
    catch (const std::exception&)
    {
        AddError("Line " + std::to_string(LineNumber) + ": Invalid number for " + Key + ".");
        return false;
    }
}

bool ConfigParser::Parse(const std::string& FilePath, bool Required)
{
    if (!FS::exists(FilePath))
    {
        if (Required)
        {
            AddError("Config file does not exist: " + FilePath);
            return false;
        }
        AddInfo("No config file at " + FilePath + ", using defaults.");
        return true;
    }

    std::ifstream File(FilePath);
    if (!File.is_open())
    {
        AddError("Failed to open config file: " + FilePath);
        return false;
    }

    std::string Line;
    int LineNumber = 0;

    while (std::getline(File, Line))
    {
        LineNumber++;

        Trim(Line);
        if (Line.empty() || Line[0] == '#')
        {
            continue;
        }

        size_t EqualPos = Line.find('=');
        if (EqualPos == std::string::npos)
        {
            AddError("Invalid format on line " + std::to_string(LineNumber) + ": No '=' found.");
            continue;
        }

        std::string Key = Line.substr(0, EqualPos);
        std::string Value = Line.substr(EqualPos + 1);

        Key.erase(std::remove_if(Key.begin(), Key.end(), [](char Ch) { return std::isspace(static_cast<unsigned char>(Ch)); }), Key.end());
        Trim(Value);

        if (Value.empty())
        {
            AddError("Line " + std::to_string(LineNumber) + ": Empty value for '" + Key + "'.");
            continue;
        }

        unsigned long long Number = 0;

        if (Key == "Mode")
        {
            if (Value == "BG")
            {
                ConfigGlobal::ThreadCount = 2;
                AddInfo("Mode set to 'BG' (Background). ThreadCount = 2");
            }
            else if (Value == "Inter")
            {
                ConfigGlobal::ThreadCount = 4;
                AddInfo("Mode set to 'Inter' (Intermediate). ThreadCount = 4");
            }
            else if (Value == "GodSpeed")
            {
                ConfigGlobal::ThreadCount = static_cast<unsigned short int>(std::thread::hardware_concurrency() * 2);
                if (ConfigGlobal::ThreadCount == 0)
                {
                    ConfigGlobal::ThreadCount = 8;
                }
                AddInfo("Mode set to 'GodSpeed'. ThreadCount = " + std::to_string(ConfigGlobal::ThreadCount));
            }
            else
            {
                AddError("Line " + std::to_string(LineNumber) + ": Invalid Mode. Use 'BG' or 'Inter' or 'GodSpeed'.");
            }
        }

        else if (Key == "ThreadCount")
        {
            if (ParseCount(Key, Value, LineNumber, 256, Number))
            {
                ConfigGlobal::ThreadCount = static_cast<unsigned short int>(Number);
                AddInfo("ThreadCount set to " + std::to_string(Number));
            }
        }

        else if (Key == "SkipHidden")
        {
            if (ParseYesNo(Value, LineNumber, ConfigGlobal::SkipHidden))
            {
                AddInfo(ConfigGlobal::SkipHidden ? "Hidden files will be skipped." : "Hidden files will be processed.");
            }
        }

        else if (Key == "SkipFilePattern")
        {
            if (std::find(ConfigGlobal::SkipFilePatterns.begin(), ConfigGlobal::SkipFilePatterns.end(), Value) != ConfigGlobal::SkipFilePatterns.end())
            {
                AddInfo("Line " + std::to_string(LineNumber) + ": Duplicate file pattern '" + Value + "'. Ignored.");
                continue;
            }
            ConfigGlobal::SkipFilePatterns.push_back(Value);
        }

        else if (Key == "SkipFolderPattern")
        {
            if (std::find(ConfigGlobal::SkipFolderPatterns.begin(), ConfigGlobal::SkipFolderPatterns.end(), Value) != ConfigGlobal::SkipFolderPatterns.end())
            {
                AddInfo("Line " + std::to_string(LineNumber) + ": Duplicate folder pattern '" + Value + "'. Ignored.");
                continue;
            }
            ConfigGlobal::SkipFolderPatterns.push_back(Value);
        }

        else if (Key == "ProgressIntervalMs")
        {
            if (ParseCount(Key, Value, LineNumber, 3600000, Number))
            {
                ConfigGlobal::ProgressIntervalMs = static_cast<unsigned int>(Number);
                AddInfo("ProgressIntervalMs set to " + std::to_string(Number));
            }
        }

        else if (Key == "StopTimeoutSeconds")
        {
            if (ParseCount(Key, Value, LineNumber, 86400, Number))
            {
                ConfigGlobal::StopTimeoutSeconds = static_cast<unsigned int>(Number);
                AddInfo("StopTimeoutSeconds set to " + std::to_string(Number));
            }
        }

        else if (Key == "CachePruneDays")
        {
            if (ParseCount(Key, Value, LineNumber, 36500, Number))
            {
                ConfigGlobal::CachePruneDays = static_cast<unsigned int>(Number);
                AddInfo("Hash cache entries unused for " + std::to_string(Number) + " days will be pruned.");
            }
        }

        else if (Key == "MinFreeSpaceMB")
        {
            if (ParseCount(Key, Value, LineNumber, 1ULL << 40, Number))
            {
                ConfigGlobal::MinFreeSpaceMB = Number;
                AddInfo("MinFreeSpaceMB set to " + std::to_string(Number));
            }
        }

        else if (Key == "MaxLogFiles")
        {
            if (ParseCount(Key, Value, LineNumber, 65535, Number))
            {
                ConfigGlobal::MaxLogFiles = static_cast<unsigned short int>(Number);
                AddInfo("MaxLogFiles set to " + std::to_string(Number));
            }
        }

        else if (Key == "LogDir")
        {
            ConfigGlobal::LogDir = Value;
            AddInfo("LogDir set to " + Value);
        }

        else if (Key == "DatabaseFile")
        {
            if (!FS::path(Value).is_absolute())
            {
                AddError("Line " + std::to_string(LineNumber) + ": DatabaseFile path is not absolute.");
                continue;
            }
            ConfigGlobal::DatabaseFile = Value;
            AddInfo("DatabaseFile set to " + Value);
        }

        else
        {
            AddError("Line " + std::to_string(LineNumber) + ": Unknown key '" + Key + "'.");
            continue;
        }
    }

    return Errors.empty();
}

bool ConfigParser::ValidateRunPaths(const std::string& Source, const std::string& Destination)
{
    std::error_code ec;
    if (!FS::is_directory(Source, ec))
    {
        AddError("Source path is not an existing directory: " + Source);
    }
    if (FS::exists(Destination, ec) && !FS::is_directory(Destination, ec))
    {
        AddError("Destination path exists but is not a directory: " + Destination);
    }
    if (!Errors.empty())
    {
        return false;
    }

    FS::path SourceAbs = NormalizeRoot(Source);
    FS::path DestAbs = NormalizeRoot(Destination);

    if (SourceAbs == DestAbs)
    {
        AddError("Source path '" + Source + "' is the same as the destination path.");
    }
    else if (IsParentDirectory(SourceAbs.string(), DestAbs.string()))
    {
        AddError("Destination '" + DestAbs.string() + "' is inside source directory '" + SourceAbs.string() + "'. This is not allowed.");
    }
    else if (IsParentDirectory(DestAbs.string(), SourceAbs.string()))
    {
        AddError("Source '" + SourceAbs.string() + "' is inside destination directory '" + DestAbs.string() + "'. This is not allowed.");
    }
    return Errors.empty();
}
