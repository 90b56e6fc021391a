#include <iostream>
#include <string>
#include <cerrno>

#include <sqlite3.h>

#include "TestSupport.hpp"
#include "Database.hpp"
#include "HashCache.hpp"
#include "FileHasher.hpp"
#include "DeduplicationEngine.hpp"
#include "FileProcessor.hpp"
#include "Pipeline.hpp"
#include "FileCopier.hpp"
#include "SessionManager.hpp"
#include "TimeUtils.hpp"
#include "Errors.hpp"

using namespace TestSupport;
namespace FS = std::filesystem;

namespace
{
    std::string YearFolderOf(const FS::path& File)
    {
        return std::to_string(YearOf(ToTimeT(FS::last_write_time(File))));
    }

    // Drops the files table once the copy has landed, so persisting fails.
    class StoreLosingImageProcessor : public ImageProcessor
    {
    public:
        explicit StoreLosingImageProcessor(FS::path DbFile) : DbFile(std::move(DbFile)) {}

        CopyOutcome Transfer(const FS::path& Source, const FS::path& Destination) const override
        {
            CopyOutcome Outcome = ImageProcessor::Transfer(Source, Destination);
            sqlite3* Raw = nullptr;
            sqlite3_open(DbFile.string().c_str(), &Raw);
            sqlite3_busy_timeout(Raw, 5000);
            sqlite3_exec(Raw, "DROP TABLE files", nullptr, nullptr, nullptr);
            sqlite3_close(Raw);
            return Outcome;
        }

    private:
        FS::path DbFile;
    };

    template <typename ErrorType>
    bool RaisesAs(int Error)
    {
        try
        {
            FileCopier::RaiseIoError("write", Error);
        }
        catch (const ErrorType&)
        {
            return true;
        }
        catch (const DupliSortError&)
        {
        }
        return false;
    }
}

int main()
{
    std::cout << "[Test] Starting pipeline tests..." << std::endl;
    TempDir Dir("duplisort_pipeline");
    const FS::path Source = Dir / "src";
    const FS::path Dest = Dir / "dest";

    {
        const FS::path Desired = Dir / "conflict" / "photo.jpg";
        FS::create_directories(Desired.parent_path());
        Check(Pipeline::ResolveConflict(Desired) == Desired, "free name is used as is");

        WriteFile(Desired, "1");
        FS::path First = Pipeline::ResolveConflict(Desired);
        Check(First.filename() == "photo-1.jpg", "taken name gets -1 suffix");
        Check(Pipeline::ResolveConflict(Desired) == First, "resolution is stable until the name is used");

        WriteFile(First, "2");
        Check(Pipeline::ResolveConflict(Desired).filename() == "photo-2.jpg", "next free suffix chosen");

        WriteFile(Dir / "conflict" / "photo-2.jpg", "3");
        bool Exhausted = false;
        try
        {
            Pipeline::ResolveConflict(Desired, 2);
        }
        catch (const PipelineError&)
        {
            Exhausted = true;
        }
        Check(Exhausted, "bounded search raises PipelineError");

        PipelineStage Stage = PipelineStage::Init;
        int Steps = 0;
        while (Stage != PipelineStage::Completed && Steps < 50)
        {
            Stage = Pipeline::Next(Stage);
            ++Steps;
        }
        Check(Steps == 13, "stage machine reaches Completed in order");
        Check(Pipeline::Next(PipelineStage::Completed) == PipelineStage::Completed, "Completed is terminal");

        Check(RaisesAs<InsufficientSpaceError>(ENOSPC), "ENOSPC raises InsufficientSpaceError");
        Check(RaisesAs<InsufficientSpaceError>(EDQUOT), "EDQUOT raises InsufficientSpaceError");
        Check(!RaisesAs<InsufficientSpaceError>(EIO) && RaisesAs<FileAccessError>(EIO), "EIO raises FileAccessError");
    }

    WriteFile(Source / "a.jpg", "first photo");
    WriteFile(Source / "copy" / "b.jpg", "first photo");
    WriteFile(Source / "other" / "a.jpg", "second photo, same name");
    WriteFile(Source / "notes.txt", "hello");
    WriteFile(Source / "Screenshot_2024.png", "pixels");
    WriteFile(Source / "raw" / "DSC_1.cr2", "raw bytes");
    WriteFile(Source / "IMG_1.jpg", "with sidecar");
    WriteFile(Source / "IMG_1.xmp", "<xmp/>");
    WriteFile(Source / "IMG_2.jpg", "with upper case sidecar");
    WriteFile(Source / "IMG_2.XMP", "<XMP/>");
    WriteFile(Source / "archive.xyz", "???");
    WriteFile(Source / ".secret.jpg", "hidden");

    Database Store((Dest / "db" / "duplisort.db").string());
    HashCache Cache(&Store);
    FileHasher Hasher(&Cache);
    DeduplicationEngine Dedup(Store, Hasher);
    auto Registry = ProcessorRegistry::CreateDefault();
    SessionManager Sessions(Store);
    int64_t SessionId = Sessions.CreateSession(Source.string(), Dest.string(), "{}");

    PipelineOptions Options;
    Options.SessionId = SessionId;
    Options.DestinationRoot = Dest;
    Options.SkipHidden = true;
    Pipeline Worker(Store, Dedup, Hasher, *Registry, Options);

    const std::string Year = YearFolderOf(Source / "a.jpg");
    const FS::path ExpectedA = Dest / "Images" / "Originals" / Year / "a.jpg";

    {
        PipelineResult Result = Worker.Process((Source / "a.jpg").string());
        Check(Result.Status == ProcessingStatus::Completed, "image copied");
        Check(Result.DestinationPath && FS::path(*Result.DestinationPath) == ExpectedA, "image lands under Images/Originals/<year>");
        Check(ReadFile(ExpectedA) == "first photo", "copy has the source bytes");
        Check(Result.RecordId.has_value(), "record stored");
        Check(Dedup.PendingClaims() == 0, "claim released after registration");
    }

    {
        PipelineResult Result = Worker.Process((Source / "copy" / "b.jpg").string());
        Check(Result.Status == ProcessingStatus::Duplicate, "identical content flagged as duplicate");
        Check(!FS::exists(ExpectedA.parent_path() / "b.jpg"), "duplicate not copied");
        Check(Result.Stage == PipelineStage::DeduplicationCheck, "duplicate leaves at the dedup stage");
    }

    {
        PipelineResult Result = Worker.Process((Source / "other" / "a.jpg").string());
        Check(Result.Status == ProcessingStatus::Completed, "same name, different content copied");
        Check(Result.DestinationPath && FS::path(*Result.DestinationPath).filename() == "a-1.jpg", "conflict resolved with suffix");
        Check(ReadFile(ExpectedA) == "first photo", "existing destination not overwritten");
    }

    {
        PipelineResult Result = Worker.Process((Source / "a.jpg").string());
        Check(Result.Status == ProcessingStatus::Skipped && Result.AlreadyProcessed, "completed file skipped on second pass");
        Check(!FS::exists(ExpectedA.parent_path() / "a-2.jpg"), "no second copy made");
    }

    {
        PipelineResult Text = Worker.Process((Source / "notes.txt").string());
        Check(Text.Status == ProcessingStatus::Completed && FS::exists(Dest / "Documents" / "Text" / "notes.txt"), "text file under Documents/Text");

        PipelineResult Shot = Worker.Process((Source / "Screenshot_2024.png").string());
        Check(Shot.Category == "Screenshots", "screenshot categorized");

        PipelineResult Raw = Worker.Process((Source / "raw" / "DSC_1.cr2").string());
        Check(Raw.Category == "RAW" && Raw.Type == FileType::Image, "raw file categorized as RAW image");
    }

    {
        PipelineResult Result = Worker.Process((Source / "IMG_1.jpg").string());
        Check(Result.Status == ProcessingStatus::Completed && Result.Sidecars.size() == 1, "sidecar travels with its image");
        Check(FS::exists(ExpectedA.parent_path() / "IMG_1.xmp"), "sidecar next to the copied image");

        PipelineResult Alone = Worker.Process((Source / "IMG_1.xmp").string());
        Check(Alone.Status == ProcessingStatus::Skipped, "sidecar on its own is skipped");

        PipelineResult Upper = Worker.Process((Source / "IMG_2.jpg").string());
        Check(Upper.Status == ProcessingStatus::Completed && Upper.Sidecars.size() == 1, "upper case sidecar found");
        Check(ReadFile(ExpectedA.parent_path() / "IMG_2.XMP") == "<XMP/>", "upper case sidecar keeps its suffix");
    }

    {
        PipelineResult Unknown = Worker.Process((Source / "archive.xyz").string());
        Check(Unknown.Status == ProcessingStatus::Skipped && Unknown.Stage == PipelineStage::UnknownTypeFilter, "unknown type filtered");

        PipelineResult Hidden = Worker.Process((Source / ".secret.jpg").string());
        Check(Hidden.Status == ProcessingStatus::Skipped && Hidden.Stage == PipelineStage::SkipPatternCheck, "hidden file skipped");
    }

    {
        PipelineResult Missing = Worker.Process((Source / "gone.jpg").string());
        Check(Missing.Status == ProcessingStatus::Error && !Missing.RunLevelError, "missing file is a file-level error");
        Check(Missing.Stage == PipelineStage::Init && !Missing.Message.empty(), "error carries stage and message");

        auto Stats = Sessions.GetStatistics(SessionId);
        Check(Stats["error"] == 1, "error record stored");
        Check(Stats["duplicate"] == 1, "duplicate record stored");
        // a.jpg, other/a.jpg, notes.txt, screenshot, raw, IMG_1.jpg, IMG_2.jpg and their sidecars
        Check(Stats["completed"] == 9, "completed records stored (" + std::to_string(Stats["completed"]) + ")");
    }

    {
        TempDir Lost("duplisort_pipeline_lost");
        const FS::path LostSource = Lost / "src";
        const FS::path LostDest = Lost / "dest";
        const FS::path DbFile = LostDest / "db" / "duplisort.db";
        WriteFile(LostSource / "IMG_9.jpg", "copied but never recorded");
        WriteFile(LostSource / "IMG_9.xmp", "<xmp/>");

        Database LostStore(DbFile.string());
        FileHasher Uncached;
        DeduplicationEngine LostDedup(LostStore, Uncached);
        ProcessorRegistry LostRegistry;
        LostRegistry.Register(std::make_unique<StoreLosingImageProcessor>(DbFile));
        SessionManager LostSessions(LostStore);

        PipelineOptions LostOptions;
        LostOptions.SessionId = LostSessions.CreateSession(LostSource.string(), LostDest.string(), "{}");
        LostOptions.DestinationRoot = LostDest;
        Pipeline LostWorker(LostStore, LostDedup, Uncached, LostRegistry, LostOptions);

        PipelineResult Result = LostWorker.Process((LostSource / "IMG_9.jpg").string());
        Check(Result.Status == ProcessingStatus::Error && Result.RunLevelError, "failed persist is a run-level error");
        Check(!Result.DestinationPath.has_value() && Result.Sidecars.empty(), "result names no copies");
        Check(CountRegularFiles(LostDest, "db") == 0, "copy and sidecar removed when their records are lost");
        Check(LostDedup.PendingClaims() == 0, "claim released");
    }

    return Finish("Pipeline");
}
