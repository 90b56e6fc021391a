#include "Database.hpp"
#include "Errors.hpp"
#include "Logger.hpp"

#include <sqlite3.h>
#include <filesystem>

namespace FS = std::filesystem;

namespace
{
    const char* SchemaStatements[] =
    {
        "CREATE TABLE IF NOT EXISTS sessions ("
        " id INTEGER PRIMARY KEY AUTOINCREMENT,"
        " source_path TEXT NOT NULL,"
        " destination_path TEXT NOT NULL,"
        " status TEXT NOT NULL,"
        " start_time INTEGER NOT NULL,"
        " end_time INTEGER,"
        " files_scanned INTEGER NOT NULL DEFAULT 0,"
        " files_processed INTEGER NOT NULL DEFAULT 0,"
        " files_skipped INTEGER NOT NULL DEFAULT 0,"
        " duplicates_found INTEGER NOT NULL DEFAULT 0,"
        " files_error INTEGER NOT NULL DEFAULT 0,"
        " bytes_processed INTEGER NOT NULL DEFAULT 0,"
        " bytes_total INTEGER NOT NULL DEFAULT 0,"
        " config_fingerprint TEXT,"
        " error_message TEXT)",

        "CREATE TABLE IF NOT EXISTS files ("
        " id INTEGER PRIMARY KEY AUTOINCREMENT,"
        " session_id INTEGER NOT NULL REFERENCES sessions(id),"
        " source_path TEXT NOT NULL,"
        " destination_path TEXT,"
        " file_hash TEXT NOT NULL,"
        " file_size INTEGER NOT NULL,"
        " file_type TEXT NOT NULL,"
        " file_extension TEXT NOT NULL,"
        " status TEXT NOT NULL,"
        " category TEXT,"
        " date_taken INTEGER,"
        " camera_make TEXT,"
        " camera_model TEXT,"
        " metadata_json TEXT,"
        " error_message TEXT,"
        " processed_at INTEGER NOT NULL,"
        " duplicate_of INTEGER)",

        "CREATE TABLE IF NOT EXISTS duplicate_groups ("
        " file_hash TEXT NOT NULL,"
        " file_extension TEXT NOT NULL,"
        " original_file_id INTEGER NOT NULL,"
        " duplicate_count INTEGER NOT NULL DEFAULT 0,"
        " first_seen INTEGER NOT NULL,"
        " last_seen INTEGER NOT NULL,"
        " PRIMARY KEY (file_hash, file_extension))",

        "CREATE TABLE IF NOT EXISTS cache ("
        " file_path TEXT PRIMARY KEY,"
        " file_hash TEXT NOT NULL,"
        " file_size INTEGER NOT NULL,"
        " modified_time INTEGER NOT NULL,"
        " last_accessed INTEGER NOT NULL)",

        "CREATE INDEX IF NOT EXISTS idx_files_session ON files(session_id)",
        "CREATE INDEX IF NOT EXISTS idx_files_session_source ON files(session_id, source_path)",
        "CREATE INDEX IF NOT EXISTS idx_sessions_destination ON sessions(destination_path, status)",
        "CREATE INDEX IF NOT EXISTS idx_cache_accessed ON cache(last_accessed)"
    };

    const char* SessionColumns =
        "id, source_path, destination_path, status, start_time, end_time,"
        " files_scanned, files_processed, files_skipped, duplicates_found, files_error,"
        " bytes_processed, bytes_total, config_fingerprint, error_message";

    const char* FileColumns =
        "id, session_id, source_path, destination_path, file_hash, file_size, file_type,"
        " file_extension, status, category, date_taken, camera_make, camera_model,"
        " metadata_json, error_message, processed_at, duplicate_of";

    // Prepared statement, finalized on scope exit.
    class Statement
    {
    public:
        Statement(sqlite3* Db, const std::string& Sql) : Db(Db)
        {
            if (sqlite3_prepare_v2(Db, Sql.c_str(), -1, &Stmt, nullptr) != SQLITE_OK)
            {
                throw DatabaseError(std::string("Failed to prepare statement: ") + sqlite3_errmsg(Db) + " [" + Sql + "]");
            }
        }

        ~Statement()
        {
            sqlite3_finalize(Stmt);
        }

        Statement(const Statement&) = delete;
        Statement& operator=(const Statement&) = delete;

        void Bind(int Index, const std::string& Value)
        {
            Check(sqlite3_bind_text(Stmt, Index, Value.c_str(), static_cast<int>(Value.size()), SQLITE_TRANSIENT));
        }

        void Bind(int Index, int64_t Value)
        {
            Check(sqlite3_bind_int64(Stmt, Index, Value));
        }

        void Bind(int Index, const std::optional<std::string>& Value)
        {
            if (Value)
            {
                Bind(Index, *Value);
            }
            else
            {
                Check(sqlite3_bind_null(Stmt, Index));
            }
        }

        void Bind(int Index, const std::optional<int64_t>& Value)
        {
            if (Value)
            {
                Bind(Index, *Value);
            }
            else
            {
                Check(sqlite3_bind_null(Stmt, Index));
            }
        }

        // true while a row is available
        bool Step()
        {
            int Result = sqlite3_step(Stmt);
            if (Result == SQLITE_ROW)
            {
                return true;
            }
            if (Result == SQLITE_DONE)
            {
                return false;
            }
            throw DatabaseError(std::string("Statement failed: ") + sqlite3_errmsg(Db));
        }

        bool IsNull(int Column) const
        {
            return sqlite3_column_type(Stmt, Column) == SQLITE_NULL;
        }

        int64_t Int(int Column) const
        {
            return sqlite3_column_int64(Stmt, Column);
        }

        std::string Text(int Column) const
        {
            const unsigned char* Value = sqlite3_column_text(Stmt, Column);
            return Value ? reinterpret_cast<const char*>(Value) : std::string();
        }

        std::optional<std::string> OptionalText(int Column) const
        {
            if (IsNull(Column))
            {
                return std::nullopt;
            }
            return Text(Column);
        }

        std::optional<int64_t> OptionalInt(int Column) const
        {
            if (IsNull(Column))
            {
                return std::nullopt;
            }
            return Int(Column);
        }

    private:
        sqlite3* Db;
        sqlite3_stmt* Stmt = nullptr;

        void Check(int Result)
        {
            if (Result != SQLITE_OK)
            {
                throw DatabaseError(std::string("Failed to bind parameter: ") + sqlite3_errmsg(Db));
            }
        }
    };

    Session ReadSession(const Statement& Stmt)
    {
        Session Row;
        Row.Id = Stmt.Int(0);
        Row.SourcePath = Stmt.Text(1);
        Row.DestinationPath = Stmt.Text(2);
        Row.Status = ParseSessionStatus(Stmt.Text(3));
        Row.StartTime = Stmt.Int(4);
        Row.EndTime = Stmt.OptionalInt(5);
        Row.Counters.FilesScanned = static_cast<uint64_t>(Stmt.Int(6));
        Row.Counters.FilesProcessed = static_cast<uint64_t>(Stmt.Int(7));
        Row.Counters.FilesSkipped = static_cast<uint64_t>(Stmt.Int(8));
        Row.Counters.Duplicates = static_cast<uint64_t>(Stmt.Int(9));
        Row.Counters.Errors = static_cast<uint64_t>(Stmt.Int(10));
        Row.Counters.BytesProcessed = static_cast<uint64_t>(Stmt.Int(11));
        Row.Counters.BytesTotal = static_cast<uint64_t>(Stmt.Int(12));
        Row.ConfigFingerprint = Stmt.Text(13);
        Row.ErrorMessage = Stmt.OptionalText(14);
        return Row;
    }

    FileRecord ReadFileRecord(const Statement& Stmt)
    {
        FileRecord Row;
        Row.Id = Stmt.Int(0);
        Row.SessionId = Stmt.Int(1);
        Row.SourcePath = Stmt.Text(2);
        Row.DestinationPath = Stmt.OptionalText(3);
        Row.Digest = Stmt.Text(4);
        Row.Size = static_cast<uint64_t>(Stmt.Int(5));
        Row.Type = ParseFileType(Stmt.Text(6));
        Row.Extension = Stmt.Text(7);
        Row.Status = ParseProcessingStatus(Stmt.Text(8));
        Row.Category = Stmt.Text(9);
        Row.DateTaken = Stmt.OptionalInt(10);
        Row.CameraMake = Stmt.Text(11);
        Row.CameraModel = Stmt.Text(12);
        Row.MetadataJson = Stmt.Text(13);
        Row.ErrorMessage = Stmt.OptionalText(14);
        Row.ProcessedAt = Stmt.Int(15);
        Row.DuplicateOf = Stmt.OptionalInt(16);
        return Row;
    }
}

Database::Database(const std::string& FilePath) : FilePath(FilePath)
{
    std::error_code ec;
    FS::path Parent = FS::path(FilePath).parent_path();
    if (!Parent.empty())
    {
        FS::create_directories(Parent, ec);
        if (ec)
        {
            throw DatabaseError("Failed to create database directory " + Parent.string() + ": " + ec.message());
        }
    }

    int Flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
    if (sqlite3_open_v2(FilePath.c_str(), &Handle, Flags, nullptr) != SQLITE_OK)
    {
        std::string Message = Handle ? sqlite3_errmsg(Handle) : "out of memory";
        sqlite3_close(Handle);
        Handle = nullptr;
        throw DatabaseError("Failed to open database " + FilePath + ": " + Message);
    }

    try
    {
        sqlite3_busy_timeout(Handle, 5000);
        Execute("PRAGMA journal_mode=WAL");
        Execute("PRAGMA foreign_keys=ON");
        InitializeSchema();
    }
    catch (const DatabaseError&)
    {
        sqlite3_close(Handle);
        Handle = nullptr;
        throw;
    }

    Log.Info(std::string("[Database] Opened ") + FilePath + " (schema version " + std::to_string(SchemaVersion) + ")");
}

Database::~Database()
{
    if (Handle)
    {
        sqlite3_close(Handle);
    }
}

const std::string& Database::GetFilePath() const
{
    return FilePath;
}

void Database::Execute(const std::string& Sql)
{
    char* ErrorText = nullptr;
    if (sqlite3_exec(Handle, Sql.c_str(), nullptr, nullptr, &ErrorText) != SQLITE_OK)
    {
        std::string Message = ErrorText ? ErrorText : sqlite3_errmsg(Handle);
        sqlite3_free(ErrorText);
        throw DatabaseError("SQL failed: " + Message + " [" + Sql + "]");
    }
}

void Database::InitializeSchema()
{
    Execute("CREATE TABLE IF NOT EXISTS schema_version (version INTEGER NOT NULL, applied_at INTEGER NOT NULL)");

    std::optional<int64_t> Found;
    {
        Statement Query(Handle, "SELECT version FROM schema_version LIMIT 1");
        if (Query.Step())
        {
            Found = Query.Int(0);
        }
    }

    if (Found && *Found != SchemaVersion)
    {
        throw SchemaVersionError(static_cast<int>(*Found), SchemaVersion);
    }

    Execute("BEGIN IMMEDIATE");
    try
    {
        for (const char* Sql : SchemaStatements)
        {
            Execute(Sql);
        }
        if (!Found)
        {
            Statement Insert(Handle, "INSERT INTO schema_version (version, applied_at) VALUES (?, strftime('%s','now'))");
            Insert.Bind(1, static_cast<int64_t>(SchemaVersion));
            Insert.Step();
        }
        Execute("COMMIT");
    }
    catch (const DatabaseError&)
    {
        sqlite3_exec(Handle, "ROLLBACK", nullptr, nullptr, nullptr);
        throw;
    }
}

int64_t Database::InsertSession(const Session& NewSession)
{
    std::lock_guard<std::mutex> Lock(ConnectionMutex);

    Statement Insert(Handle,
        "INSERT INTO sessions (source_path, destination_path, status, start_time, end_time,"
        " files_scanned, files_processed, files_skipped, duplicates_found, files_error,"
        " bytes_processed, bytes_total, config_fingerprint, error_message)"
        " VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)");
    Insert.Bind(1, NewSession.SourcePath);
    Insert.Bind(2, NewSession.DestinationPath);
    Insert.Bind(3, ToString(NewSession.Status));
    Insert.Bind(4, NewSession.StartTime);
    Insert.Bind(5, NewSession.EndTime);
    Insert.Bind(6, static_cast<int64_t>(NewSession.Counters.FilesScanned));
    Insert.Bind(7, static_cast<int64_t>(NewSession.Counters.FilesProcessed));
    Insert.Bind(8, static_cast<int64_t>(NewSession.Counters.FilesSkipped));
    Insert.Bind(9, static_cast<int64_t>(NewSession.Counters.Duplicates));
    Insert.Bind(10, static_cast<int64_t>(NewSession.Counters.Errors));
    Insert.Bind(11, static_cast<int64_t>(NewSession.Counters.BytesProcessed));
    Insert.Bind(12, static_cast<int64_t>(NewSession.Counters.BytesTotal));
    Insert.Bind(13, NewSession.ConfigFingerprint);
    Insert.Bind(14, NewSession.ErrorMessage);
    Insert.Step();

    return sqlite3_last_insert_rowid(Handle);
}

void Database::UpdateSessionStatus(int64_t SessionId, SessionStatus Status, const std::optional<std::string>& ErrorMessage, std::optional<int64_t> EndTime)
{
    std::lock_guard<std::mutex> Lock(ConnectionMutex);

    Statement Update(Handle, "UPDATE sessions SET status = ?, error_message = COALESCE(?, error_message), end_time = ? WHERE id = ?");
    Update.Bind(1, ToString(Status));
    Update.Bind(2, ErrorMessage);
    Update.Bind(3, EndTime);
    Update.Bind(4, SessionId);
    Update.Step();

    if (sqlite3_changes(Handle) == 0)
    {
        throw DatabaseError("No session with id " + std::to_string(SessionId));
    }
}

void Database::UpdateSessionCounters(int64_t SessionId, const SessionCounters& Counters)
{
    std::lock_guard<std::mutex> Lock(ConnectionMutex);

    Statement Update(Handle,
        "UPDATE sessions SET files_scanned = ?, files_processed = ?, files_skipped = ?,"
        " duplicates_found = ?, files_error = ?, bytes_processed = ?, bytes_total = ? WHERE id = ?");
    Update.Bind(1, static_cast<int64_t>(Counters.FilesScanned));
    Update.Bind(2, static_cast<int64_t>(Counters.FilesProcessed));
    Update.Bind(3, static_cast<int64_t>(Counters.FilesSkipped));
    Update.Bind(4, static_cast<int64_t>(Counters.Duplicates));
    Update.Bind(5, static_cast<int64_t>(Counters.Errors));
    Update.Bind(6, static_cast<int64_t>(Counters.BytesProcessed));
    Update.Bind(7, static_cast<int64_t>(Counters.BytesTotal));
    Update.Bind(8, SessionId);
    Update.Step();
}

std::optional<Session> Database::GetSession(int64_t SessionId)
{
    std::lock_guard<std::mutex> Lock(ConnectionMutex);

    Statement Query(Handle, std::string("SELECT ") + SessionColumns + " FROM sessions WHERE id = ?");
    Query.Bind(1, SessionId);
    if (!Query.Step())
    {
        return std::nullopt;
    }
    return ReadSession(Query);
}

std::vector<Session> Database::ListSessions()
{
    std::lock_guard<std::mutex> Lock(ConnectionMutex);

    std::vector<Session> Sessions;
    Statement Query(Handle, std::string("SELECT ") + SessionColumns + " FROM sessions ORDER BY start_time DESC, id DESC");
    while (Query.Step())
    {
        Sessions.push_back(ReadSession(Query));
    }
    return Sessions;
}

std::optional<Session> Database::FindActiveSession(const std::string& DestinationPath)
{
    std::lock_guard<std::mutex> Lock(ConnectionMutex);

    Statement Query(Handle, std::string("SELECT ") + SessionColumns +
        " FROM sessions WHERE destination_path = ? AND status IN ('running', 'paused') ORDER BY id DESC LIMIT 1");
    Query.Bind(1, DestinationPath);
    if (!Query.Step())
    {
        return std::nullopt;
    }
    return ReadSession(Query);
}

std::optional<Session> Database::MostRecentActiveSession()
{
    std::lock_guard<std::mutex> Lock(ConnectionMutex);

    Statement Query(Handle, std::string("SELECT ") + SessionColumns +
        " FROM sessions WHERE status IN ('running', 'paused') ORDER BY start_time DESC, id DESC LIMIT 1");
    if (!Query.Step())
    {
        return std::nullopt;
    }
    return ReadSession(Query);
}

int64_t Database::InsertFileRecordLocked(const FileRecord& Record)
{
    Statement Insert(Handle,
        "INSERT INTO files (session_id, source_path, destination_path, file_hash, file_size, file_type,"
        " file_extension, status, category, date_taken, camera_make, camera_model, metadata_json,"
        " error_message, processed_at, duplicate_of)"
        " VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)");
    Insert.Bind(1, Record.SessionId);
    Insert.Bind(2, Record.SourcePath);
    Insert.Bind(3, Record.DestinationPath);
    Insert.Bind(4, Record.Digest);
    Insert.Bind(5, static_cast<int64_t>(Record.Size));
    Insert.Bind(6, ToString(Record.Type));
    Insert.Bind(7, Record.Extension);
    Insert.Bind(8, ToString(Record.Status));
    Insert.Bind(9, Record.Category);
    Insert.Bind(10, Record.DateTaken);
    Insert.Bind(11, Record.CameraMake);
    Insert.Bind(12, Record.CameraModel);
    Insert.Bind(13, Record.MetadataJson);
    Insert.Bind(14, Record.ErrorMessage);
    Insert.Bind(15, Record.ProcessedAt);
    Insert.Bind(16, Record.DuplicateOf);
    Insert.Step();

    return sqlite3_last_insert_rowid(Handle);
}

int64_t Database::InsertFileRecord(const FileRecord& Record)
{
    std::lock_guard<std::mutex> Lock(ConnectionMutex);
    return InsertFileRecordLocked(Record);
}

std::vector<int64_t> Database::InsertFileRecords(const std::vector<FileRecord>& Records)
{
    std::lock_guard<std::mutex> Lock(ConnectionMutex);

    std::vector<int64_t> Ids;
    Ids.reserve(Records.size());

    Execute("BEGIN IMMEDIATE");
    try
    {
        for (const auto& Record : Records)
        {
            Ids.push_back(InsertFileRecordLocked(Record));
        }
        Execute("COMMIT");
    }
    catch (const DatabaseError&)
    {
        sqlite3_exec(Handle, "ROLLBACK", nullptr, nullptr, nullptr);
        throw;
    }
    return Ids;
}

bool Database::HasCompletedRecord(int64_t SessionId, const std::string& SourcePath)
{
    std::lock_guard<std::mutex> Lock(ConnectionMutex);

    Statement Query(Handle, "SELECT 1 FROM files WHERE session_id = ? AND source_path = ? AND status = 'completed' LIMIT 1");
    Query.Bind(1, SessionId);
    Query.Bind(2, SourcePath);
    return Query.Step();
}

std::vector<FileRecord> Database::GetFileRecordsWithDestination(int64_t SessionId)
{
    std::lock_guard<std::mutex> Lock(ConnectionMutex);

    std::vector<FileRecord> Records;
    Statement Query(Handle, std::string("SELECT ") + FileColumns +
        " FROM files WHERE session_id = ? AND destination_path IS NOT NULL ORDER BY id");
    Query.Bind(1, SessionId);
    while (Query.Step())
    {
        Records.push_back(ReadFileRecord(Query));
    }
    return Records;
}

std::map<std::string, uint64_t> Database::CountFilesByStatus(int64_t SessionId)
{
    std::lock_guard<std::mutex> Lock(ConnectionMutex);

    std::map<std::string, uint64_t> Counts;
    Statement Query(Handle, "SELECT status, COUNT(*) FROM files WHERE session_id = ? GROUP BY status");
    Query.Bind(1, SessionId);
    while (Query.Step())
    {
        Counts[Query.Text(0)] = static_cast<uint64_t>(Query.Int(1));
    }
    return Counts;
}

std::optional<DuplicateGroup> Database::FindDuplicateGroup(const std::string& Digest, const std::string& Extension)
{
    std::lock_guard<std::mutex> Lock(ConnectionMutex);

    Statement Query(Handle,
        "SELECT file_hash, file_extension, original_file_id, duplicate_count, first_seen, last_seen"
        " FROM duplicate_groups WHERE file_hash = ? AND file_extension = ?");
    Query.Bind(1, Digest);
    Query.Bind(2, Extension);
    if (!Query.Step())
    {
        return std::nullopt;
    }

    DuplicateGroup Group;
    Group.Digest = Query.Text(0);
    Group.Extension = Query.Text(1);
    Group.OriginalId = Query.Int(2);
    Group.DuplicateCount = static_cast<uint64_t>(Query.Int(3));
    Group.FirstSeen = Query.Int(4);
    Group.LastSeen = Query.Int(5);
    return Group;
}

bool Database::RegisterInGroup(const std::string& Digest, const std::string& Extension, int64_t RecordId, int64_t Now)
{
    std::lock_guard<std::mutex> Lock(ConnectionMutex);

    Statement Insert(Handle,
        "INSERT OR IGNORE INTO duplicate_groups (file_hash, file_extension, original_file_id, duplicate_count, first_seen, last_seen)"
        " VALUES (?, ?, ?, 0, ?, ?)");
    Insert.Bind(1, Digest);
    Insert.Bind(2, Extension);
    Insert.Bind(3, RecordId);
    Insert.Bind(4, Now);
    Insert.Bind(5, Now);
    Insert.Step();

    if (sqlite3_changes(Handle) > 0)
    {
        return true;
    }

    Statement Update(Handle,
        "UPDATE duplicate_groups SET duplicate_count = duplicate_count + 1, last_seen = ?"
        " WHERE file_hash = ? AND file_extension = ?");
    Update.Bind(1, Now);
    Update.Bind(2, Digest);
    Update.Bind(3, Extension);
    Update.Step();
    return false;
}

uint64_t Database::DeleteGroupsOfSession(int64_t SessionId)
{
    std::lock_guard<std::mutex> Lock(ConnectionMutex);

    Statement Delete(Handle,
        "DELETE FROM duplicate_groups WHERE original_file_id IN (SELECT id FROM files WHERE session_id = ?)");
    Delete.Bind(1, SessionId);
    Delete.Step();
    ++GroupGenerationCounter;
    return static_cast<uint64_t>(sqlite3_changes(Handle));
}

uint64_t Database::GroupGeneration() const
{
    return GroupGenerationCounter.load();
}

std::optional<CacheEntry> Database::GetCacheEntry(const std::string& Path)
{
    std::lock_guard<std::mutex> Lock(ConnectionMutex);

    Statement Query(Handle, "SELECT file_path, file_hash, file_size, modified_time, last_accessed FROM cache WHERE file_path = ?");
    Query.Bind(1, Path);
    if (!Query.Step())
    {
        return std::nullopt;
    }

    CacheEntry Entry;
    Entry.Path = Query.Text(0);
    Entry.Digest = Query.Text(1);
    Entry.Size = static_cast<uint64_t>(Query.Int(2));
    Entry.MTime = Query.Int(3);
    Entry.LastAccessed = Query.Int(4);
    return Entry;
}

void Database::UpsertCacheEntry(const CacheEntry& Entry)
{
    std::lock_guard<std::mutex> Lock(ConnectionMutex);

    Statement Upsert(Handle,
        "INSERT OR REPLACE INTO cache (file_path, file_hash, file_size, modified_time, last_accessed)"
        " VALUES (?, ?, ?, ?, ?)");
    Upsert.Bind(1, Entry.Path);
    Upsert.Bind(2, Entry.Digest);
    Upsert.Bind(3, static_cast<int64_t>(Entry.Size));
    Upsert.Bind(4, Entry.MTime);
    Upsert.Bind(5, Entry.LastAccessed);
    Upsert.Step();
}

void Database::TouchCacheEntry(const std::string& Path, int64_t Now)
{
    std::lock_guard<std::mutex> Lock(ConnectionMutex);

    Statement Update(Handle, "UPDATE cache SET last_accessed = ? WHERE file_path = ?");
    Update.Bind(1, Now);
    Update.Bind(2, Path);
    Update.Step();
}

uint64_t Database::PruneCacheOlderThan(int64_t Cutoff)
{
    std::lock_guard<std::mutex> Lock(ConnectionMutex);

    Statement Delete(Handle, "DELETE FROM cache WHERE last_accessed < ?");
    Delete.Bind(1, Cutoff);
    Delete.Step();
    return static_cast<uint64_t>(sqlite3_changes(Handle));
}
