#include "FileProcessor.hpp"
#include "Errors.hpp"
#include "TimeUtils.hpp"
#include "PathUtils.hpp"

#include <set>

namespace FS = std::filesystem;

namespace
{
    const std::set<std::string> ImageExtensions =
    {
        ".jpg", ".jpeg", ".png", ".gif", ".bmp", ".tiff", ".tif", ".webp",
        ".heic", ".heif", ".avif", ".jxl"
    };

    const std::set<std::string> RawExtensions =
    {
        ".cr2", ".cr3", ".nef", ".nrw", ".arw", ".srf", ".sr2", ".dng",
        ".raf", ".orf", ".rw2", ".pef", ".srw", ".raw"
    };

    const std::set<std::string> VideoExtensions =
    {
        ".mp4", ".mov", ".avi", ".mkv", ".wmv", ".flv", ".webm", ".m4v",
        ".mpg", ".mpeg", ".3gp", ".3g2", ".mts", ".m2ts"
    };

    const std::set<std::string> AudioExtensions =
    {
        ".mp3", ".wav", ".flac", ".m4a", ".aac", ".ogg", ".opus", ".wma",
        ".amr", ".aiff", ".ape"
    };

    const std::set<std::string> VoiceNoteExtensions = { ".m4a", ".aac", ".amr" };
    const std::vector<std::string> VoiceNotePatterns = { "Recording_*", "Voice_*", "Audio_*" };
    const std::vector<std::string> ScreenshotPatterns = { "Screenshot_*", "SCR_*", "screenshot*" };

    const std::set<std::string> TextExtensions = { ".txt", ".rtf", ".md", ".markdown" };
    const std::set<std::string> WordExtensions = { ".doc", ".docx", ".odt" };
    const std::set<std::string> SheetExtensions = { ".xls", ".xlsx", ".ods", ".csv" };
    const std::set<std::string> SlideExtensions = { ".ppt", ".pptx", ".odp" };
    const std::set<std::string> CodeExtensions =
    {
        ".py", ".js", ".java", ".cpp", ".c", ".h", ".cs", ".php",
        ".html", ".css", ".xml", ".json", ".yaml", ".yml",
        ".sql", ".sh", ".bat", ".ps1", ".rb", ".go", ".rs", ".swift",
        ".kt", ".ts", ".jsx", ".tsx", ".vue", ".r", ".m", ".pl"
    };

    bool Contains(const std::set<std::string>& Set, const std::string& Ext)
    {
        return Set.find(Ext) != Set.end();
    }

    std::string YearFolder(const FileMetadata& Metadata)
    {
        if (!Metadata.DateTaken)
        {
            return "Unknown";
        }
        return std::to_string(YearOf(*Metadata.DateTaken));
    }
}

FileMetadata FileProcessor::ExtractMetadata(const FS::path& Source) const
{
    std::error_code ec;
    auto WriteTime = FS::last_write_time(Source, ec);
    if (ec)
    {
        throw FileAccessError("Cannot read timestamps of " + Source.string() + ": " + ec.message());
    }
    uintmax_t Size = FS::file_size(Source, ec);
    if (ec)
    {
        throw FileAccessError("Cannot read size of " + Source.string() + ": " + ec.message());
    }

    FileMetadata Metadata;
    Metadata.DateTaken = ToTimeT(WriteTime);
    Metadata.Extra["file_size"] = static_cast<uint64_t>(Size);
    Metadata.Extra["file_extension"] = LowercaseExtension(Source);
    Metadata.Extra["modified_time"] = FormatIso(*Metadata.DateTaken);
    Metadata.Extra["date_source"] = "mtime";
    return Metadata;
}

CopyOutcome FileProcessor::Transfer(const FS::path& Source, const FS::path& Destination) const
{
    return FileCopier::CopyAtomic(Source, Destination);
}

bool ImageProcessor::IsRaw(const std::string& Extension)
{
    return Contains(RawExtensions, Extension);
}

bool ImageProcessor::Handles(const std::string& Extension) const
{
    return Contains(ImageExtensions, Extension) || IsRaw(Extension);
}

std::string ImageProcessor::Categorize(const FS::path& Source, const FileMetadata&) const
{
    if (IsRaw(LowercaseExtension(Source)))
    {
        return "RAW";
    }
    if (MatchesAnyPattern(ScreenshotPatterns, Source.filename()))
    {
        return "Screenshots";
    }
    return "Originals";
}

FS::path ImageProcessor::DestinationPath(const FS::path& Source, const FS::path& Root, const FileMetadata& Metadata, const std::string& Category) const
{
    return Root / "Images" / Category / YearFolder(Metadata) / Source.filename();
}

bool VideoProcessor::Handles(const std::string& Extension) const
{
    return Contains(VideoExtensions, Extension);
}

std::string VideoProcessor::Categorize(const FS::path&, const FileMetadata&) const
{
    return "Videos";
}

FS::path VideoProcessor::DestinationPath(const FS::path& Source, const FS::path& Root, const FileMetadata& Metadata, const std::string&) const
{
    return Root / "Videos" / YearFolder(Metadata) / Source.filename();
}

bool AudioProcessor::Handles(const std::string& Extension) const
{
    return Contains(AudioExtensions, Extension);
}

std::string AudioProcessor::Categorize(const FS::path& Source, const FileMetadata&) const
{
    if (Contains(VoiceNoteExtensions, LowercaseExtension(Source)) && MatchesAnyPattern(VoiceNotePatterns, Source.filename()))
    {
        return "Voice Notes";
    }
    return "Music";
}

FS::path AudioProcessor::DestinationPath(const FS::path& Source, const FS::path& Root, const FileMetadata&, const std::string& Category) const
{
    return Root / "Audio" / Category / Source.filename();
}

bool DocumentProcessor::Handles(const std::string& Extension) const
{
    return Extension == ".pdf" || Contains(TextExtensions, Extension) || Contains(WordExtensions, Extension) ||
        Contains(SheetExtensions, Extension) || Contains(SlideExtensions, Extension) || Contains(CodeExtensions, Extension);
}

std::string DocumentProcessor::Categorize(const FS::path& Source, const FileMetadata&) const
{
    const std::string Ext = LowercaseExtension(Source);
    if (Ext == ".pdf")                    return "PDF";
    if (Contains(TextExtensions, Ext))    return "Text";
    if (Contains(WordExtensions, Ext))    return "Word";
    if (Contains(SheetExtensions, Ext))   return "Excel";
    if (Contains(SlideExtensions, Ext))   return "PowerPoint";
    if (Contains(CodeExtensions, Ext))    return "Code";
    return "Other";
}

FS::path DocumentProcessor::DestinationPath(const FS::path& Source, const FS::path& Root, const FileMetadata&, const std::string& Category) const
{
    return Root / "Documents" / Category / Source.filename();
}

void ProcessorRegistry::Register(std::unique_ptr<FileProcessor> Processor)
{
    FileType Type = Processor->Type();
    Processors[Type] = std::move(Processor);
}

const FileProcessor* ProcessorRegistry::Find(FileType Type) const
{
    auto It = Processors.find(Type);
    return It == Processors.end() ? nullptr : It->second.get();
}

FileType ProcessorRegistry::DetectType(const FS::path& Source) const
{
    const std::string Ext = LowercaseExtension(Source);
    if (Ext.empty())
    {
        return FileType::Unknown;
    }
    for (const auto& [Type, Processor] : Processors)
    {
        if (Processor->Handles(Ext))
        {
            return Type;
        }
    }
    return FileType::Unknown;
}

std::unique_ptr<ProcessorRegistry> ProcessorRegistry::CreateDefault()
{
    auto Registry = std::make_unique<ProcessorRegistry>();
    Registry->Register(std::make_unique<ImageProcessor>());
    Registry->Register(std::make_unique<VideoProcessor>());
    Registry->Register(std::make_unique<AudioProcessor>());
    Registry->Register(std::make_unique<DocumentProcessor>());
    return Registry;
}
