#pragma once

#include <string>
#include <vector>
#include <functional>
#include <filesystem>
#include <cstdint>

#include "Records.hpp"

class ProcessorRegistry;

struct ScannedFileInfo
{
    std::string Path;
    uintmax_t Size = 0;
    int64_t MTime = 0;
    FileType Type = FileType::Unknown;
};

struct ScanOptions
{
    std::vector<std::string> SkipFilePatterns;
    std::vector<std::string> SkipFolderPatterns;
    bool IncludeHidden = false;
};

class FileScanner
{
public:
    // Return false to stop the walk.
    using Visitor = std::function<bool(const ScannedFileInfo&)>;

    FileScanner(const ScanOptions& Options, const ProcessorRegistry* Registry);

    void SetExcludes(const std::vector<std::string>& ExcludePaths);

    // Walks RootPath depth first, skipping symlinks. Returns false when the visitor stopped it.
    bool Scan(const std::string& RootPath, const Visitor& Visit);

    uint64_t SkippedEntries() const;

private:
    ScanOptions Options;
    const ProcessorRegistry* Registry = nullptr;
    std::vector<std::filesystem::path> Excludes;
    uint64_t Skipped = 0;

    bool IsExcluded(const std::filesystem::path& Path) const;
    bool SkipDirectory(const std::filesystem::path& Path) const;
    bool SkipFile(const std::filesystem::path& Path) const;
};
