#pragma once

#include <string>
#include <vector>
#include <optional>
#include <filesystem>
#include <cstdint>

#include "Records.hpp"
#include "FileProcessor.hpp"

class Database;
class DeduplicationEngine;
class FileHasher;

enum class PipelineStage
{
    Init,
    AlreadyProcessedCheck,
    SkipPatternCheck,
    TypeDetection,
    UnknownTypeFilter,
    DeduplicationCheck,
    MetadataExtraction,
    Categorization,
    PathGeneration,
    ConflictResolution,
    FileTransfer,
    Persist,
    ProgressEmit,
    Completed
};

std::string ToString(PipelineStage Stage);

struct PipelineOptions
{
    int64_t SessionId = 0;
    std::filesystem::path DestinationRoot;
    bool SkipHidden = true;
    std::vector<std::string> SkipFilePatterns;
};

struct PipelineResult
{
    std::string SourcePath;
    ProcessingStatus Status = ProcessingStatus::Completed;
    // Stage that produced the outcome.
    PipelineStage Stage = PipelineStage::Init;
    FileType Type = FileType::Unknown;
    std::string Category;
    std::optional<std::string> DestinationPath;
    uint64_t Size = 0;
    std::string Message;
    std::optional<int64_t> RecordId;
    std::vector<std::string> Sidecars;
    bool AlreadyProcessed = false;
    // Set when the store failed; the orchestrator must stop the run.
    bool RunLevelError = false;
};

// Runs one file through every stage. One instance per worker; the only shared
// collaborators are the store, the dedup engine and the hasher.
class Pipeline
{
public:
    static constexpr unsigned MaxConflictAttempts = 10000;

    Pipeline(Database& Store, DeduplicationEngine& Dedup, FileHasher& Hasher, const ProcessorRegistry& Registry, PipelineOptions Options);

    Pipeline(const Pipeline&) = delete;
    Pipeline& operator=(const Pipeline&) = delete;

    // Never throws; every failure is folded into the result.
    PipelineResult Process(const std::string& SourcePath);

    static PipelineStage Next(PipelineStage Stage);

    // Desired path if free, else "stem-1.ext", "stem-2.ext", ... Throws PipelineError when exhausted.
    static std::filesystem::path ResolveConflict(const std::filesystem::path& Desired, unsigned MaxAttempts = MaxConflictAttempts);

private:
    struct Context
    {
        std::filesystem::path Source;
        std::string Extension;
        uint64_t Size = 0;
        FileType Type = FileType::Unknown;
        const FileProcessor* Processor = nullptr;
        std::string Digest;
        bool ClaimHeld = false;
        FileMetadata Metadata;
        std::string Category;
        std::filesystem::path DesiredPath;
        std::filesystem::path Destination;
        bool Transferred = false;
        // Records for the copies are in the store.
        bool Persisted = false;
        std::vector<std::pair<std::filesystem::path, std::filesystem::path>> CopiedSidecars;
        PipelineResult Result;
    };

    Database& Store;
    DeduplicationEngine& Dedup;
    FileHasher& Hasher;
    const ProcessorRegistry& Registry;
    PipelineOptions Options;

    // nullopt = proceed to the next stage
    std::optional<ProcessingStatus> RunStage(PipelineStage Stage, Context& Ctx);

    std::optional<ProcessingStatus> CheckDuplicate(Context& Ctx);
    std::optional<ProcessingStatus> TransferFile(Context& Ctx);
    std::optional<ProcessingStatus> PersistRecords(Context& Ctx);
    void CopySidecars(Context& Ctx);
    // Removes copies made for a file whose records never reached the store.
    void DiscardCopies(Context& Ctx);

    FileRecord MakeRecord(const Context& Ctx, ProcessingStatus Status) const;
    void RecordFailure(Context& Ctx, const std::string& Message);
};
