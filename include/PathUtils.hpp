#pragma once

#include <filesystem>
#include <string>
#include <vector>
#include <algorithm>
#include <cctype>

#include <fnmatch.h>

// ".JPG" -> ".jpg", no extension -> ""
inline std::string LowercaseExtension(const std::filesystem::path& Path)
{
    std::string Ext = Path.extension().string();
    std::transform(Ext.begin(), Ext.end(), Ext.begin(), [](unsigned char Ch) { return static_cast<char>(std::tolower(Ch)); });
    return Ext;
}

inline bool IsHiddenName(const std::string& Name)
{
    return !Name.empty() && Name[0] == '.' && Name != "." && Name != "..";
}

inline bool IsJunkName(const std::string& Name)
{
    return Name == ".DS_Store" || Name == "Thumbs.db" || Name == "desktop.ini";
}

// Glob match against the bare name and the full path.
inline bool MatchesAnyPattern(const std::vector<std::string>& Patterns, const std::filesystem::path& Path)
{
    const std::string Name = Path.filename().string();
    const std::string Full = Path.string();
    for (const auto& Pattern : Patterns)
    {
        if (fnmatch(Pattern.c_str(), Name.c_str(), 0) == 0 || fnmatch(Pattern.c_str(), Full.c_str(), 0) == 0)
        {
            return true;
        }
    }
    return false;
}

// Absolute, lexically normal, no trailing separator. Throws filesystem_error.
inline std::filesystem::path NormalizeRoot(const std::filesystem::path& Path)
{
    std::filesystem::path Result = std::filesystem::absolute(Path).lexically_normal();
    if (!Result.has_filename() && Result.has_relative_path())
    {
        Result = Result.parent_path();
    }
    return Result;
}
