#include "Pipeline.hpp"
#include "Database.hpp"
#include "DeduplicationEngine.hpp"
#include "FileHasher.hpp"
#include "FileCopier.hpp"
#include "Errors.hpp"
#include "Logger.hpp"
#include "TimeUtils.hpp"
#include "PathUtils.hpp"

namespace FS = std::filesystem;

std::string ToString(PipelineStage Stage)
{
    switch (Stage)
    {
    case PipelineStage::Init:                  return "Init";
    case PipelineStage::AlreadyProcessedCheck: return "AlreadyProcessedCheck";
    case PipelineStage::SkipPatternCheck:      return "SkipPatternCheck";
    case PipelineStage::TypeDetection:         return "TypeDetection";
    case PipelineStage::UnknownTypeFilter:     return "UnknownTypeFilter";
    case PipelineStage::DeduplicationCheck:    return "DeduplicationCheck";
    case PipelineStage::MetadataExtraction:    return "MetadataExtraction";
    case PipelineStage::Categorization:        return "Categorization";
    case PipelineStage::PathGeneration:        return "PathGeneration";
    case PipelineStage::ConflictResolution:    return "ConflictResolution";
    case PipelineStage::FileTransfer:          return "FileTransfer";
    case PipelineStage::Persist:               return "Persist";
    case PipelineStage::ProgressEmit:          return "ProgressEmit";
    case PipelineStage::Completed:             return "Completed";
    }
    return "Unknown";
}

Pipeline::Pipeline(Database& Store, DeduplicationEngine& Dedup, FileHasher& Hasher, const ProcessorRegistry& Registry, PipelineOptions Options)
    : Store(Store), Dedup(Dedup), Hasher(Hasher), Registry(Registry), Options(std::move(Options))
{
}

PipelineStage Pipeline::Next(PipelineStage Stage)
{
    switch (Stage)
    {
    case PipelineStage::Init:                  return PipelineStage::AlreadyProcessedCheck;
    case PipelineStage::AlreadyProcessedCheck: return PipelineStage::SkipPatternCheck;
    case PipelineStage::SkipPatternCheck:      return PipelineStage::TypeDetection;
    case PipelineStage::TypeDetection:         return PipelineStage::UnknownTypeFilter;
    case PipelineStage::UnknownTypeFilter:     return PipelineStage::DeduplicationCheck;
    case PipelineStage::DeduplicationCheck:    return PipelineStage::MetadataExtraction;
    case PipelineStage::MetadataExtraction:    return PipelineStage::Categorization;
    case PipelineStage::Categorization:        return PipelineStage::PathGeneration;
    case PipelineStage::PathGeneration:        return PipelineStage::ConflictResolution;
    case PipelineStage::ConflictResolution:    return PipelineStage::FileTransfer;
    case PipelineStage::FileTransfer:          return PipelineStage::Persist;
    case PipelineStage::Persist:               return PipelineStage::ProgressEmit;
    case PipelineStage::ProgressEmit:          return PipelineStage::Completed;
    case PipelineStage::Completed:             return PipelineStage::Completed;
    }
    return PipelineStage::Completed;
}

FS::path Pipeline::ResolveConflict(const FS::path& Desired, unsigned MaxAttempts)
{
    std::error_code ec;
    if (!FS::exists(Desired, ec))
    {
        if (ec)
        {
            throw FileAccessError("Cannot check " + Desired.string() + ": " + ec.message());
        }
        return Desired;
    }

    const FS::path Parent = Desired.parent_path();
    const std::string Stem = Desired.stem().string();
    const std::string Ext = Desired.extension().string();

    for (unsigned Attempt = 1; Attempt <= MaxAttempts; ++Attempt)
    {
        FS::path Candidate = Parent / (Stem + "-" + std::to_string(Attempt) + Ext);
        if (!FS::exists(Candidate, ec))
        {
            if (ec)
            {
                throw FileAccessError("Cannot check " + Candidate.string() + ": " + ec.message());
            }
            return Candidate;
        }
    }
    throw PipelineError("No free name for " + Desired.string() + " after " + std::to_string(MaxAttempts) + " attempts");
}

PipelineResult Pipeline::Process(const std::string& SourcePath)
{
    Context Ctx;
    Ctx.Source = SourcePath;
    Ctx.Result.SourcePath = SourcePath;

    PipelineStage Stage = PipelineStage::Init;
    try
    {
        while (Stage != PipelineStage::Completed)
        {
            Ctx.Result.Stage = Stage;
            if (auto Outcome = RunStage(Stage, Ctx))
            {
                Ctx.Result.Status = *Outcome;
                return Ctx.Result;
            }
            Stage = Next(Stage);
        }
        Ctx.Result.Stage = PipelineStage::Completed;
        Ctx.Result.Status = ProcessingStatus::Completed;
    }
    catch (const DatabaseError& e)
    {
        DiscardCopies(Ctx);
        if (Ctx.ClaimHeld)
        {
            Dedup.ReleaseClaim(Ctx.Digest, Ctx.Extension);
            Ctx.ClaimHeld = false;
        }
        Ctx.Result.Status = ProcessingStatus::Error;
        Ctx.Result.RunLevelError = true;
        Ctx.Result.Message = ToString(Ctx.Result.Stage) + ": " + e.what();
        Log.Error(std::string("[Pipeline] Database failure on ") + SourcePath + " at " + Ctx.Result.Message);
    }
    catch (const InsufficientSpaceError& e)
    {
        DiscardCopies(Ctx);
        RecordFailure(Ctx, e.what());
        // The next file would hit the same full disk.
        Ctx.Result.RunLevelError = true;
    }
    catch (const std::exception& e)
    {
        DiscardCopies(Ctx);
        RecordFailure(Ctx, e.what());
    }
    return Ctx.Result;
}

std::optional<ProcessingStatus> Pipeline::RunStage(PipelineStage Stage, Context& Ctx)
{
    switch (Stage)
    {
    case PipelineStage::Init:
    {
        std::error_code ec;
        if (!FS::is_regular_file(Ctx.Source, ec))
        {
            throw FileAccessError("Not a readable regular file: " + Ctx.Source.string() + (ec ? " (" + ec.message() + ")" : std::string()));
        }
        uintmax_t Size = FS::file_size(Ctx.Source, ec);
        if (ec)
        {
            throw FileAccessError("Cannot stat " + Ctx.Source.string() + ": " + ec.message());
        }
        Ctx.Size = Size;
        Ctx.Extension = LowercaseExtension(Ctx.Source);
        Ctx.Result.Size = Size;
        return std::nullopt;
    }

    case PipelineStage::AlreadyProcessedCheck:
        if (Store.HasCompletedRecord(Options.SessionId, Ctx.Source.string()))
        {
            Ctx.Result.AlreadyProcessed = true;
            Ctx.Result.Message = "already processed in this session";
            return ProcessingStatus::Skipped;
        }
        return std::nullopt;

    case PipelineStage::SkipPatternCheck:
    {
        const std::string Name = Ctx.Source.filename().string();
        if (Options.SkipHidden && IsHiddenName(Name))
        {
            Ctx.Result.Message = "hidden file";
            return ProcessingStatus::Skipped;
        }
        if (IsJunkName(Name))
        {
            Ctx.Result.Message = "system file";
            return ProcessingStatus::Skipped;
        }
        if (MatchesAnyPattern(Options.SkipFilePatterns, Ctx.Source))
        {
            Ctx.Result.Message = "matches skip pattern";
            return ProcessingStatus::Skipped;
        }
        return std::nullopt;
    }

    case PipelineStage::TypeDetection:
        Ctx.Type = Registry.DetectType(Ctx.Source);
        Ctx.Result.Type = Ctx.Type;
        return std::nullopt;

    case PipelineStage::UnknownTypeFilter:
        if (Ctx.Type == FileType::Unknown)
        {
            Ctx.Result.Message = "unsupported file type";
            return ProcessingStatus::Skipped;
        }
        Ctx.Processor = Registry.Find(Ctx.Type);
        if (!Ctx.Processor)
        {
            Ctx.Result.Message = "no processor for " + ToString(Ctx.Type);
            return ProcessingStatus::Skipped;
        }
        return std::nullopt;

    case PipelineStage::DeduplicationCheck:
        return CheckDuplicate(Ctx);

    case PipelineStage::MetadataExtraction:
        Ctx.Metadata = Ctx.Processor->ExtractMetadata(Ctx.Source);
        return std::nullopt;

    case PipelineStage::Categorization:
        Ctx.Category = Ctx.Processor->Categorize(Ctx.Source, Ctx.Metadata);
        Ctx.Result.Category = Ctx.Category;
        return std::nullopt;

    case PipelineStage::PathGeneration:
        Ctx.DesiredPath = Ctx.Processor->DestinationPath(Ctx.Source, Options.DestinationRoot, Ctx.Metadata, Ctx.Category);
        return std::nullopt;

    case PipelineStage::ConflictResolution:
        Ctx.Destination = ResolveConflict(Ctx.DesiredPath);
        return std::nullopt;

    case PipelineStage::FileTransfer:
        return TransferFile(Ctx);

    case PipelineStage::Persist:
        return PersistRecords(Ctx);

    case PipelineStage::ProgressEmit:
        Log.Info(std::string("[Pipeline] ") + Ctx.Source.string() + " -> " + Ctx.Destination.string());
        return std::nullopt;

    case PipelineStage::Completed:
        return ProcessingStatus::Completed;
    }
    return std::nullopt;
}

std::optional<ProcessingStatus> Pipeline::CheckDuplicate(Context& Ctx)
{
    Ctx.Digest = Hasher.Hash(Ctx.Source.string());

    DuplicateCheck Check = Dedup.ClaimOrMatch(Ctx.Source.string(), Ctx.Digest, Ctx.Extension);
    if (!Check.IsDuplicate)
    {
        Ctx.ClaimHeld = true;
        return std::nullopt;
    }

    FileRecord Record = MakeRecord(Ctx, ProcessingStatus::Duplicate);
    Record.DuplicateOf = Check.OriginalId;
    int64_t RecordId = Store.InsertFileRecord(Record);
    Dedup.RegisterFile(Ctx.Source.string(), Ctx.Digest, Ctx.Extension, RecordId);

    Ctx.Result.RecordId = RecordId;
    Ctx.Result.Message = "duplicate of record " + std::to_string(*Check.OriginalId);
    Log.Info(std::string("[Pipeline] Duplicate ") + Ctx.Source.string() + " of record " + std::to_string(*Check.OriginalId));
    return ProcessingStatus::Duplicate;
}

std::optional<ProcessingStatus> Pipeline::TransferFile(Context& Ctx)
{
    for (unsigned Attempt = 1; ; ++Attempt)
    {
        if (Ctx.Processor->Transfer(Ctx.Source, Ctx.Destination) == CopyOutcome::Copied)
        {
            break;
        }
        if (Attempt >= MaxConflictAttempts)
        {
            throw PipelineError("Destination name kept being taken: " + Ctx.DesiredPath.string());
        }
        Log.Info(std::string("[Pipeline] ") + Ctx.Destination.string() + " was taken before the copy landed, resolving again");
        Ctx.Destination = ResolveConflict(Ctx.DesiredPath);
    }

    Ctx.Transferred = true;
    Ctx.Result.DestinationPath = Ctx.Destination.string();
    CopySidecars(Ctx);
    return std::nullopt;
}

void Pipeline::CopySidecars(Context& Ctx)
{
    for (const auto& Sidecar : FileCopier::FindSidecars(Ctx.Source))
    {
        FS::path Desired = Ctx.Destination.parent_path() / (Ctx.Destination.stem().string() + FileCopier::SidecarSuffix(Ctx.Source, Sidecar));
        try
        {
            FS::path Target = ResolveConflict(Desired);
            if (FileCopier::CopyAtomic(Sidecar, Target) != CopyOutcome::Copied)
            {
                Log.Warn(std::string("[Pipeline] Sidecar target taken, not copied: ") + Target.string());
                continue;
            }
            Ctx.CopiedSidecars.emplace_back(Sidecar, Target);
        }
        catch (const InsufficientSpaceError&)
        {
            throw;
        }
        catch (const DupliSortError& e)
        {
            Log.Warn(std::string("[Pipeline] Sidecar ") + Sidecar.string() + " not copied: " + e.what());
        }
    }
}

std::optional<ProcessingStatus> Pipeline::PersistRecords(Context& Ctx)
{
    std::vector<FileRecord> Records;
    Records.push_back(MakeRecord(Ctx, ProcessingStatus::Completed));

    for (const auto& [Sidecar, Target] : Ctx.CopiedSidecars)
    {
        FileRecord Record = MakeRecord(Ctx, ProcessingStatus::Completed);
        std::error_code ec;
        Record.SourcePath = Sidecar.string();
        Record.DestinationPath = Target.string();
        Record.Digest.clear();
        Record.Size = FS::file_size(Target, ec);
        if (ec)
        {
            Record.Size = 0;
        }
        Record.Type = FileType::Sidecar;
        Record.Extension = LowercaseExtension(Sidecar);
        Record.MetadataJson = nlohmann::json{{"sidecar_of", Ctx.Source.string()}}.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
        Records.push_back(std::move(Record));
    }

    std::vector<int64_t> Ids = Store.InsertFileRecords(Records);
    Ctx.Persisted = true;
    Ctx.Result.RecordId = Ids.front();

    Dedup.RegisterFile(Ctx.Source.string(), Ctx.Digest, Ctx.Extension, Ids.front());
    Ctx.ClaimHeld = false;

    for (const auto& [Sidecar, Target] : Ctx.CopiedSidecars)
    {
        Ctx.Result.Sidecars.push_back(Target.string());
    }
    return std::nullopt;
}

FileRecord Pipeline::MakeRecord(const Context& Ctx, ProcessingStatus Status) const
{
    FileRecord Record;
    Record.SessionId = Options.SessionId;
    Record.SourcePath = Ctx.Source.string();
    if (Ctx.Transferred)
    {
        Record.DestinationPath = Ctx.Destination.string();
    }
    Record.Digest = Ctx.Digest;
    Record.Size = Ctx.Size;
    Record.Type = Ctx.Type;
    Record.Extension = Ctx.Extension;
    Record.Status = Status;
    Record.Category = Ctx.Category;
    Record.DateTaken = Ctx.Metadata.DateTaken;
    Record.CameraMake = Ctx.Metadata.CameraMake;
    Record.CameraModel = Ctx.Metadata.CameraModel;
    // Names need not be UTF-8; invalid bytes become U+FFFD.
    Record.MetadataJson = Ctx.Metadata.Extra.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    Record.ProcessedAt = NowSeconds();
    return Record;
}

void Pipeline::DiscardCopies(Context& Ctx)
{
    if (!Ctx.Transferred || Ctx.Persisted)
    {
        return;
    }

    std::vector<FS::path> Copies;
    for (const auto& [Sidecar, Target] : Ctx.CopiedSidecars)
    {
        Copies.push_back(Target);
    }
    Copies.push_back(Ctx.Destination);

    for (const auto& Copy : Copies)
    {
        std::error_code ec;
        if (FS::remove(Copy, ec))
        {
            Log.Info(std::string("[Pipeline] Removed unrecorded copy ") + Copy.string());
        }
        else if (ec)
        {
            Log.Error(std::string("[Pipeline] Could not remove unrecorded copy ") + Copy.string() + ": " + ec.message());
        }
    }

    Ctx.CopiedSidecars.clear();
    Ctx.Transferred = false;
    Ctx.Result.DestinationPath.reset();
    Ctx.Result.Sidecars.clear();
}

void Pipeline::RecordFailure(Context& Ctx, const std::string& Message)
{
    if (Ctx.ClaimHeld)
    {
        Dedup.ReleaseClaim(Ctx.Digest, Ctx.Extension);
        Ctx.ClaimHeld = false;
    }

    Ctx.Result.Status = ProcessingStatus::Error;
    Ctx.Result.Message = ToString(Ctx.Result.Stage) + ": " + Message;
    Log.Error(std::string("[Pipeline] ") + Ctx.Source.string() + " failed at " + Ctx.Result.Message);

    try
    {
        FileRecord Record = MakeRecord(Ctx, ProcessingStatus::Error);
        Record.ErrorMessage = Ctx.Result.Message;
        Ctx.Result.RecordId = Store.InsertFileRecord(Record);
    }
    catch (const DatabaseError& e)
    {
        Ctx.Result.RunLevelError = true;
        Log.Error(std::string("[Pipeline] Could not record failure of ") + Ctx.Source.string() + ": " + e.what());
    }
}
