#include "SessionManager.hpp"
#include "Database.hpp"
#include "Errors.hpp"
#include "Logger.hpp"
#include "TimeUtils.hpp"

#include <fstream>
#include <set>
#include <algorithm>
#include <iterator>

namespace FS = std::filesystem;

namespace
{
    bool IsStrictlyInside(const FS::path& Path, const FS::path& Root)
    {
        const FS::path Rel = Path.lexically_relative(Root);
        return !Rel.empty() && Rel != "." && *Rel.begin() != "..";
    }

    bool DirectoryExists(const std::string& Path)
    {
        std::error_code ec;
        return FS::is_directory(Path, ec);
    }
}

SessionManager::SessionManager(Database& Store) : Store(Store)
{
}

bool SessionManager::IsTerminalStatus(SessionStatus Status)
{
    return Status == SessionStatus::Completed || Status == SessionStatus::Stopped ||
        Status == SessionStatus::Error || Status == SessionStatus::Undone;
}

int64_t SessionManager::CreateSession(const std::string& Source, const std::string& Destination, const std::string& Fingerprint)
{
    if (auto Active = Store.FindActiveSession(Destination))
    {
        throw OrchestratorError("Destination " + Destination + " already has active session " + std::to_string(Active->Id));
    }

    Session NewSession;
    NewSession.SourcePath = Source;
    NewSession.DestinationPath = Destination;
    NewSession.Status = SessionStatus::Running;
    NewSession.StartTime = NowSeconds();
    NewSession.ConfigFingerprint = Fingerprint;

    int64_t Id = Store.InsertSession(NewSession);
    Log.Info("[SessionManager] Created session " + std::to_string(Id) + ": " + Source + " -> " + Destination);
    return Id;
}

void SessionManager::UpdateStatus(int64_t SessionId, SessionStatus Status, const std::optional<std::string>& ErrorMessage)
{
    std::optional<int64_t> EndTime;
    if (IsTerminalStatus(Status))
    {
        EndTime = NowSeconds();
    }
    Store.UpdateSessionStatus(SessionId, Status, ErrorMessage, EndTime);
    Log.Info("[SessionManager] Session " + std::to_string(SessionId) + " is now " + ToString(Status));
}

void SessionManager::UpdateProgress(int64_t SessionId, const SessionCounters& Counters)
{
    Store.UpdateSessionCounters(SessionId, Counters);
}

std::optional<Session> SessionManager::GetSession(int64_t SessionId)
{
    return Store.GetSession(SessionId);
}

std::vector<Session> SessionManager::ListSessions()
{
    return Store.ListSessions();
}

void SessionManager::CheckPathsExist(const Session& Candidate)
{
    if (!DirectoryExists(Candidate.SourcePath))
    {
        throw ResumeError("Session " + std::to_string(Candidate.Id) + " cannot resume, source is gone: " + Candidate.SourcePath, Candidate.Id);
    }
    if (!DirectoryExists(Candidate.DestinationPath))
    {
        throw ResumeError("Session " + std::to_string(Candidate.Id) + " cannot resume, destination is gone: " + Candidate.DestinationPath, Candidate.Id);
    }
}

std::optional<Session> SessionManager::FindResumable()
{
    std::optional<Session> Candidate = Store.MostRecentActiveSession();
    if (!Candidate)
    {
        return std::nullopt;
    }
    CheckPathsExist(*Candidate);
    return Candidate;
}

Session SessionManager::OpenForResume(int64_t SessionId)
{
    std::optional<Session> Candidate = Store.GetSession(SessionId);
    if (!Candidate)
    {
        throw ResumeError("No session " + std::to_string(SessionId), SessionId);
    }
    if (Candidate->Status == SessionStatus::Completed || Candidate->Status == SessionStatus::Undone || Candidate->Status == SessionStatus::Pending)
    {
        throw ResumeError("Session " + std::to_string(SessionId) + " is " + ToString(Candidate->Status) + " and cannot be resumed", SessionId);
    }
    CheckPathsExist(*Candidate);
    return *Candidate;
}

UndoReport SessionManager::Undo(int64_t SessionId, bool DryRun)
{
    std::optional<Session> Target = Store.GetSession(SessionId);
    if (!Target)
    {
        throw DupliSortError("No session " + std::to_string(SessionId) + " to undo");
    }

    const FS::path Root = FS::path(Target->DestinationPath).lexically_normal();
    const std::string Mode = DryRun ? "[dry run] " : "";
    Log.Info("[SessionManager] " + Mode + "Undoing session " + std::to_string(SessionId));

    UndoReport Report;
    std::set<FS::path> Gone;
    std::set<FS::path> Candidates;

    for (const auto& Record : Store.GetFileRecordsWithDestination(SessionId))
    {
        const FS::path File = FS::path(*Record.DestinationPath).lexically_normal();
        std::error_code ec;
        FS::file_status Status = FS::symlink_status(File, ec);
        if (Status.type() == FS::file_type::not_found)
        {
            continue;
        }
        if (ec)
        {
            ++Report.FilesFailed;
            Report.Errors.push_back(File.string() + ": " + ec.message());
            continue;
        }

        if (!DryRun)
        {
            FS::remove(File, ec);
            if (ec)
            {
                ++Report.FilesFailed;
                Report.Errors.push_back(File.string() + ": " + ec.message());
                Log.Warn("[SessionManager] Could not delete " + File.string() + ": " + ec.message());
                continue;
            }
        }
        ++Report.FilesDeleted;
        Gone.insert(File);

        for (FS::path Parent = File.parent_path(); IsStrictlyInside(Parent, Root); Parent = Parent.parent_path())
        {
            Candidates.insert(Parent);
        }
    }

    // Deepest first so a parent sees its children already gone.
    std::vector<FS::path> Dirs(Candidates.begin(), Candidates.end());
    std::sort(Dirs.begin(), Dirs.end(), [](const FS::path& A, const FS::path& B)
    {
        auto DepthA = std::distance(A.begin(), A.end());
        auto DepthB = std::distance(B.begin(), B.end());
        return DepthA != DepthB ? DepthA > DepthB : A > B;
    });

    for (const auto& Dir : Dirs)
    {
        std::error_code ec;
        if (!FS::is_directory(Dir, ec))
        {
            continue;
        }

        bool Empty = true;
        FS::directory_iterator It(Dir, ec);
        for (; !ec && It != FS::directory_iterator(); It.increment(ec))
        {
            if (Gone.find(It->path().lexically_normal()) == Gone.end())
            {
                Empty = false;
                break;
            }
        }
        if (ec)
        {
            Report.Errors.push_back(Dir.string() + ": " + ec.message());
            continue;
        }
        if (!Empty)
        {
            continue;
        }

        if (!DryRun)
        {
            FS::remove(Dir, ec);
            if (ec)
            {
                Report.Errors.push_back(Dir.string() + ": " + ec.message());
                Log.Warn("[SessionManager] Could not remove directory " + Dir.string() + ": " + ec.message());
                continue;
            }
        }
        ++Report.DirsDeleted;
        Gone.insert(Dir);
    }

    if (!DryRun && Report.FilesFailed == 0)
    {
        Store.DeleteGroupsOfSession(SessionId);
        UpdateStatus(SessionId, SessionStatus::Undone);
    }

    Log.Info("[SessionManager] " + Mode + "Undo of session " + std::to_string(SessionId) + ": " +
        std::to_string(Report.FilesDeleted) + " files, " + std::to_string(Report.DirsDeleted) + " directories, " +
        std::to_string(Report.FilesFailed) + " failures");
    return Report;
}

std::map<std::string, uint64_t> SessionManager::GetStatistics(int64_t SessionId)
{
    return Store.CountFilesByStatus(SessionId);
}

void SessionManager::SaveProgress(const FS::path& SnapshotFile, const ProcessingProgress& Progress)
{
    std::error_code ec;
    FS::create_directories(SnapshotFile.parent_path(), ec);
    if (ec)
    {
        throw FileAccessError("Cannot create " + SnapshotFile.parent_path().string() + ": " + ec.message());
    }

    FS::path TempFile = SnapshotFile;
    TempFile += ".tmp";
    {
        std::ofstream Out(TempFile, std::ios::trunc);
        if (!Out)
        {
            throw FileAccessError("Cannot write progress snapshot " + TempFile.string());
        }
        // Source paths need not be UTF-8; invalid bytes become U+FFFD.
        Out << nlohmann::json(Progress).dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
        Out.flush();
        if (!Out)
        {
            throw FileAccessError("Failed writing progress snapshot " + TempFile.string());
        }
    }

    FS::rename(TempFile, SnapshotFile, ec);
    if (ec)
    {
        throw FileAccessError("Cannot replace progress snapshot " + SnapshotFile.string() + ": " + ec.message());
    }
}

std::optional<ProcessingProgress> SessionManager::LoadProgress(const FS::path& SnapshotFile)
{
    std::error_code ec;
    if (!FS::exists(SnapshotFile, ec))
    {
        return std::nullopt;
    }

    std::ifstream In(SnapshotFile);
    if (!In)
    {
        throw FileAccessError("Cannot open progress snapshot " + SnapshotFile.string());
    }
    try
    {
        return nlohmann::json::parse(In).get<ProcessingProgress>();
    }
    catch (const nlohmann::json::exception& e)
    {
        throw FileAccessError("Corrupt progress snapshot " + SnapshotFile.string() + ": " + e.what());
    }
}

void SessionManager::ClearProgress(const FS::path& SnapshotFile)
{
    std::error_code ec;
    FS::remove(SnapshotFile, ec);
    if (ec)
    {
        throw FileAccessError("Cannot remove progress snapshot " + SnapshotFile.string() + ": " + ec.message());
    }
}
