#pragma once

#include <string>
#include <vector>
#include <map>
#include <memory>
#include <optional>
#include <filesystem>
#include <cstdint>

#include <nlohmann/json.hpp>

#include "Records.hpp"
#include "FileCopier.hpp"

struct FileMetadata
{
    std::optional<int64_t> DateTaken;
    std::string CameraMake;
    std::string CameraModel;
    nlohmann::json Extra = nlohmann::json::object();
};

// Per-type business rules. The pipeline only calls through this interface.
class FileProcessor
{
public:
    virtual ~FileProcessor() = default;

    virtual FileType Type() const = 0;
    virtual bool Handles(const std::string& Extension) const = 0;

    // Filesystem facts only. Throws FileAccessError when the file cannot be stat'ed.
    virtual FileMetadata ExtractMetadata(const std::filesystem::path& Source) const;
    virtual std::string Categorize(const std::filesystem::path& Source, const FileMetadata& Metadata) const = 0;
    virtual std::filesystem::path DestinationPath(const std::filesystem::path& Source, const std::filesystem::path& Root, const FileMetadata& Metadata, const std::string& Category) const = 0;
    virtual CopyOutcome Transfer(const std::filesystem::path& Source, const std::filesystem::path& Destination) const;
};

class ImageProcessor : public FileProcessor
{
public:
    FileType Type() const override { return FileType::Image; }
    bool Handles(const std::string& Extension) const override;
    std::string Categorize(const std::filesystem::path& Source, const FileMetadata& Metadata) const override;
    std::filesystem::path DestinationPath(const std::filesystem::path& Source, const std::filesystem::path& Root, const FileMetadata& Metadata, const std::string& Category) const override;

    static bool IsRaw(const std::string& Extension);
};

class VideoProcessor : public FileProcessor
{
public:
    FileType Type() const override { return FileType::Video; }
    bool Handles(const std::string& Extension) const override;
    std::string Categorize(const std::filesystem::path& Source, const FileMetadata& Metadata) const override;
    std::filesystem::path DestinationPath(const std::filesystem::path& Source, const std::filesystem::path& Root, const FileMetadata& Metadata, const std::string& Category) const override;
};

class AudioProcessor : public FileProcessor
{
public:
    FileType Type() const override { return FileType::Audio; }
    bool Handles(const std::string& Extension) const override;
    std::string Categorize(const std::filesystem::path& Source, const FileMetadata& Metadata) const override;
    std::filesystem::path DestinationPath(const std::filesystem::path& Source, const std::filesystem::path& Root, const FileMetadata& Metadata, const std::string& Category) const override;
};

class DocumentProcessor : public FileProcessor
{
public:
    FileType Type() const override { return FileType::Document; }
    bool Handles(const std::string& Extension) const override;
    std::string Categorize(const std::filesystem::path& Source, const FileMetadata& Metadata) const override;
    std::filesystem::path DestinationPath(const std::filesystem::path& Source, const std::filesystem::path& Root, const FileMetadata& Metadata, const std::string& Category) const override;
};

// FileType -> processor. Registering a type again replaces its processor.
class ProcessorRegistry
{
public:
    ProcessorRegistry() = default;

    ProcessorRegistry(const ProcessorRegistry&) = delete;
    ProcessorRegistry& operator=(const ProcessorRegistry&) = delete;

    void Register(std::unique_ptr<FileProcessor> Processor);
    const FileProcessor* Find(FileType Type) const;

    FileType DetectType(const std::filesystem::path& Source) const;

    static std::unique_ptr<ProcessorRegistry> CreateDefault();

private:
    std::map<FileType, std::unique_ptr<FileProcessor>> Processors;
};
