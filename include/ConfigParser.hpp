#pragma once

#include <string>
#include <vector>

class ConfigParser
{
public:
    ConfigParser() = default;

    // Fills ConfigGlobal from Key = Value lines. A missing file is only an error when Required.
    bool Parse(const std::string& FilePath, bool Required);

    // Checks a source/destination pair handed in on the command line.
    bool ValidateRunPaths(const std::string& Source, const std::string& Destination);

    const std::vector<std::string>& GetErrors() const;
    const std::vector<std::string>& GetInfos() const;
    void Reset();

    static bool IsParentDirectory(const std::string& Parent, const std::string& Child);

private:
    void AddError(const std::string& Message);
    void AddInfo(const std::string& Message);

    bool ParseYesNo(const std::string& Value, int LineNumber, bool& Out);
    bool ParseCount(const std::string& Key, const std::string& Value, int LineNumber, unsigned long long Max, unsigned long long& Out);

    std::vector<std::string> Errors;
    std::vector<std::string> Infos;
};
