#include <filesystem>
#include <stack>
#include <algorithm>

#include "FileScanner.hpp"
#include "FileProcessor.hpp"
#include "TimeUtils.hpp"
#include "PathUtils.hpp"
#include "Logger.hpp"

namespace FS = std::filesystem;

FileScanner::FileScanner(const ScanOptions& Options, const ProcessorRegistry* Registry) : Options(Options), Registry(Registry)
{
}

void FileScanner::SetExcludes(const std::vector<std::string>& ExcludePaths)
{
    Excludes.clear();
    for (const auto& Exclude : ExcludePaths)
    {
        Excludes.push_back(FS::absolute(Exclude).lexically_normal());
    }
}

uint64_t FileScanner::SkippedEntries() const
{
    return Skipped;
}

bool FileScanner::IsExcluded(const FS::path& Path) const
{
    const FS::path Abs = FS::absolute(Path).lexically_normal();
    return std::find(Excludes.begin(), Excludes.end(), Abs) != Excludes.end();
}

bool FileScanner::SkipDirectory(const FS::path& Path) const
{
    if (!Options.IncludeHidden && IsHiddenName(Path.filename().string()))
    {
        return true;
    }
    return MatchesAnyPattern(Options.SkipFolderPatterns, Path) || IsExcluded(Path);
}

bool FileScanner::SkipFile(const FS::path& Path) const
{
    const std::string Name = Path.filename().string();
    if (!Options.IncludeHidden && IsHiddenName(Name))
    {
        return true;
    }
    return IsJunkName(Name) || MatchesAnyPattern(Options.SkipFilePatterns, Path);
}

bool FileScanner::Scan(const std::string& RootPath, const Visitor& Visit)
{
    FS::path Root(RootPath);
    std::error_code ec;

    if (!FS::is_directory(Root, ec))
    {
        Log.Error("[FileScanner] Scan root is not a directory: " + Root.string());
        return true;
    }

    std::stack<FS::path> DirStack;
    DirStack.push(Root);
    while (!DirStack.empty())
    {
        FS::path Current = DirStack.top();
        DirStack.pop();

        // Entries of one directory are visited in name order.
        std::vector<FS::directory_entry> Entries;
        try
        {
            for (const auto& Entry : FS::directory_iterator(Current))
            {
                Entries.push_back(Entry);
            }
        }
        catch (const FS::filesystem_error& e)
        {
            Log.Error(std::string("[FileScanner] Filesystem error iterating directory: ") + e.what() + std::string(" Path: ") + Current.string());
            continue;
        }
        std::sort(Entries.begin(), Entries.end(), [](const FS::directory_entry& A, const FS::directory_entry& B)
        {
            return A.path().filename() < B.path().filename();
        });

        std::vector<FS::path> SubDirs;
        for (const auto& Entry : Entries)
        {
            try
            {
                const FS::path& AbsPath = Entry.path();
                // Skip symbolic links to avoid loops or unsupported files.
                if (Entry.is_symlink())
                {
                    Log.Info(std::string("[FileScanner] Skipping SymLink: ") + AbsPath.string());
                    ++Skipped;
                    continue;
                }
                if (Entry.is_directory())
                {
                    if (SkipDirectory(AbsPath))
                    {
                        Log.Info(std::string("[FileScanner] Skipping Excluded Directory: ") + AbsPath.string());
                        ++Skipped;
                        continue;
                    }
                    SubDirs.push_back(AbsPath);
                }
                else if (Entry.is_regular_file())
                {
                    if (SkipFile(AbsPath))
                    {
                        ++Skipped;
                        continue;
                    }
                    ScannedFileInfo Info;
                    Info.Path = AbsPath.string();
                    Info.Size = Entry.file_size();
                    Info.MTime = ToTimeT(Entry.last_write_time());
                    Info.Type = Registry ? Registry->DetectType(AbsPath) : FileType::Unknown;
                    if (!Visit(Info))
                    {
                        Log.Info("[FileScanner] Scan interrupted at " + Info.Path);
                        return false;
                    }
                }
            }
            catch (const FS::filesystem_error& e)
            {
                Log.Error(std::string("[FileScanner] Filesystem error accessing entry: ") + e.what() + std::string(" Path: ") + Entry.path().string());
            }
        }

        // Reverse so the stack pops subdirectories in name order.
        for (auto It = SubDirs.rbegin(); It != SubDirs.rend(); ++It)
        {
            DirStack.push(*It);
        }
    }
    return true;
}
