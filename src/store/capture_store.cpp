#include "store/capture_store.hpp"

#include <system_error>

#include <QString>
#include <QStringList>

#include <nlohmann/json.hpp>

#include <sqlite3.h>

#include "common/json_utils.hpp"

namespace mirulog {

namespace {

constexpr const char *kSchemaVersion = "1";
constexpr int kBusyTimeoutMs = 5000;

constexpr const char *kCreateCapturesTable =
    "CREATE TABLE IF NOT EXISTS captures ("
    "    id INTEGER PRIMARY KEY AUTOINCREMENT,"
    "    captured_at INTEGER NOT NULL,"
    "    window_title TEXT,"
    "    process_name TEXT,"
    "    content_hash TEXT,"
    "    image_path TEXT NOT NULL,"
    "    host_name TEXT,"
    "    session_state TEXT NOT NULL DEFAULT 'active',"
    "    status TEXT NOT NULL DEFAULT 'pending',"
    "    status_changed_at INTEGER NOT NULL,"
    "    claim_owner TEXT,"
    "    claimed_at INTEGER"
    ");";

constexpr const char *kCreateCapturesIndex =
    "CREATE INDEX IF NOT EXISTS idx_captures_status_time "
    "ON captures (status, captured_at);";

constexpr const char *kCreateAnalysisTable =
    "CREATE TABLE IF NOT EXISTS analysis ("
    "    capture_id INTEGER PRIMARY KEY,"
    "    backend TEXT NOT NULL,"
    "    model TEXT,"
    "    raw_response TEXT,"
    "    description TEXT,"
    "    primary_task TEXT,"
    "    confidence REAL,"
    "    tags TEXT,"
    "    observed_files TEXT,"
    "    observed_repositories TEXT,"
    "    observed_urls TEXT,"
    "    error_detail TEXT,"
    "    retry_count INTEGER NOT NULL DEFAULT 0,"
    "    failure_count INTEGER NOT NULL DEFAULT 0,"
    "    last_attempt_at INTEGER,"
    "    image_disposition TEXT,"
    "    archived_path TEXT,"
    "    FOREIGN KEY (capture_id) REFERENCES captures(id)"
    ");";

constexpr const char *kCreateMetaTable =
    "CREATE TABLE IF NOT EXISTS meta ("
    "    key TEXT PRIMARY KEY,"
    "    value TEXT NOT NULL"
    ");";

constexpr const char *kCaptureColumns =
    "c.id, c.captured_at, c.window_title, c.process_name, c.content_hash, "
    "c.image_path, c.host_name, c.session_state, c.status, c.status_changed_at";
constexpr int kCaptureColumnCount = 10;

constexpr const char *kAnalysisColumns =
    "a.capture_id, a.backend, a.model, a.raw_response, a.description, "
    "a.primary_task, a.confidence, a.tags, a.observed_files, "
    "a.observed_repositories, a.observed_urls, a.error_detail, a.retry_count, "
    "a.failure_count, a.last_attempt_at, a.image_disposition, a.archived_path";

std::string sqliteMessage(sqlite3 *db, const std::string &what)
{
    return what + ": " + (db ? sqlite3_errmsg(db) : "no database handle");
}

class Statement {
public:
    Statement(sqlite3 *db, const std::string &sql)
        : m_db(db)
    {
        if (sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
            throw StoreError(sqliteMessage(db, "sqlite prepare failed"));
        }
    }

    ~Statement()
    {
        if (stmt) {
            sqlite3_finalize(stmt);
        }
    }

    Statement(const Statement &) = delete;
    Statement &operator=(const Statement &) = delete;

    sqlite3_stmt *get() const
    {
        return stmt;
    }

    // Steps a statement that must not return rows.
    void execute(const char *what)
    {
        if (sqlite3_step(stmt) != SQLITE_DONE) {
            throw StoreError(sqliteMessage(m_db, what));
        }
    }

private:
    sqlite3 *m_db = nullptr;
    sqlite3_stmt *stmt = nullptr;
};

void execOrThrow(sqlite3 *db, const char *sql)
{
    char *error = nullptr;
    if (sqlite3_exec(db, sql, nullptr, nullptr, &error) != SQLITE_OK) {
        std::string message = error ? error : "sqlite exec failed";
        sqlite3_free(error);
        throw StoreError(message);
    }
}

// BEGIN IMMEDIATE so a concurrent writer is detected before any row is touched.
class Transaction {
public:
    explicit Transaction(sqlite3 *db)
        : m_db(db)
    {
        execOrThrow(m_db, "BEGIN IMMEDIATE;");
    }

    ~Transaction()
    {
        if (!m_committed) {
            sqlite3_exec(m_db, "ROLLBACK;", nullptr, nullptr, nullptr);
        }
    }

    void commit()
    {
        execOrThrow(m_db, "COMMIT;");
        m_committed = true;
    }

private:
    sqlite3 *m_db;
    bool m_committed = false;
};

int64_t toEpochMillis(std::chrono::system_clock::time_point timestamp)
{
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               timestamp.time_since_epoch())
        .count();
}

std::chrono::system_clock::time_point fromEpochMillis(int64_t value)
{
    return std::chrono::system_clock::time_point{
        std::chrono::duration_cast<std::chrono::system_clock::duration>(
            std::chrono::milliseconds{value})};
}

void bindText(sqlite3_stmt *stmt, int index, const std::string &value)
{
    sqlite3_bind_text(stmt, index, value.c_str(), -1, SQLITE_TRANSIENT);
}

void bindOptionalText(sqlite3_stmt *stmt, int index, const std::string &value)
{
    if (value.empty()) {
        sqlite3_bind_null(stmt, index);
        return;
    }
    bindText(stmt, index, value);
}

void bindStringList(sqlite3_stmt *stmt, int index, const std::vector<std::string> &values)
{
    bindText(stmt, index, nlohmann::json(values).dump());
}

std::string columnText(sqlite3_stmt *stmt, int index)
{
    const unsigned char *text = sqlite3_column_text(stmt, index);
    if (!text) {
        return {};
    }
    return reinterpret_cast<const char *>(text);
}

// Lists are stored as JSON arrays; comma separated text is accepted too.
std::vector<std::string> columnStringList(sqlite3_stmt *stmt, int index)
{
    const std::string text = columnText(stmt, index);
    if (text.empty()) {
        return {};
    }
    if (text.front() == '[') {
        try {
            const auto parsed = nlohmann::json::parse(text);
            std::vector<std::string> values;
            for (const auto &item : parsed) {
                if (item.is_string()) {
                    values.push_back(item.get<std::string>());
                }
            }
            return values;
        } catch (const nlohmann::json::parse_error &) {
            return {};
        }
    }

    std::vector<std::string> values;
    const QStringList parts = QString::fromStdString(text).split(QLatin1Char(','));
    for (const QString &part : parts) {
        const QString trimmed = part.trimmed();
        if (!trimmed.isEmpty()) {
            values.push_back(trimmed.toStdString());
        }
    }
    return values;
}

CaptureRecord readCapture(sqlite3_stmt *stmt)
{
    CaptureRecord record;
    record.id = sqlite3_column_int64(stmt, 0);
    record.capturedAt = fromEpochMillis(sqlite3_column_int64(stmt, 1));
    record.windowTitle = columnText(stmt, 2);
    record.processName = columnText(stmt, 3);
    record.contentHash = columnText(stmt, 4);
    record.imagePath = columnText(stmt, 5);
    record.hostName = columnText(stmt, 6);
    record.sessionState = parseSessionStateString(columnText(stmt, 7));
    record.status = parseStatusString(columnText(stmt, 8));
    record.statusChangedAt = fromEpochMillis(sqlite3_column_int64(stmt, 9));
    return record;
}

AnalysisResult readAnalysis(sqlite3_stmt *stmt, int offset)
{
    AnalysisResult result;
    result.captureId = sqlite3_column_int64(stmt, offset + 0);
    result.backend = columnText(stmt, offset + 1);
    result.model = columnText(stmt, offset + 2);
    result.rawResponse = columnText(stmt, offset + 3);
    result.fields.summary = columnText(stmt, offset + 4);
    result.fields.primaryTask = columnText(stmt, offset + 5);
    result.fields.confidence = sqlite3_column_double(stmt, offset + 6);
    result.fields.tags = columnStringList(stmt, offset + 7);
    result.fields.observedFiles = columnStringList(stmt, offset + 8);
    result.fields.observedRepositories = columnStringList(stmt, offset + 9);
    result.fields.observedUrls = columnStringList(stmt, offset + 10);
    result.errorDetail = columnText(stmt, offset + 11);
    result.retryCount = sqlite3_column_int(stmt, offset + 12);
    result.failureCount = sqlite3_column_int(stmt, offset + 13);
    result.lastAttemptAt = fromEpochMillis(sqlite3_column_int64(stmt, offset + 14));
    result.imageDisposition = parseDispositionString(columnText(stmt, offset + 15));
    result.archivedPath = columnText(stmt, offset + 16);
    return result;
}

// prefix is the table alias ("c.") or empty for statements without one.
std::string claimableClause(bool withLease, const std::string &prefix)
{
    std::string clause = "(" + prefix + "status = 'pending'";
    if (withLease) {
        clause += " OR (" + prefix + "status = 'analyzing' AND " + prefix
            + "claimed_at IS NOT NULL AND " + prefix + "claimed_at < ?)";
    }
    clause += ")";
    return clause;
}

} // namespace

struct CaptureStore::Impl {
    sqlite3 *db = nullptr;
    std::filesystem::path path;
    bool readOnly = false;
};

CaptureStore::CaptureStore(const std::filesystem::path &dbPath, OpenMode mode)
    : impl(std::make_unique<Impl>())
{
    impl->path = dbPath;
    impl->readOnly = mode == OpenMode::ReadOnly;

    int flags = 0;
    if (impl->readOnly) {
        if (!std::filesystem::exists(dbPath)) {
            throw StoreError("database does not exist: " + dbPath.string());
        }
        flags = SQLITE_OPEN_READONLY;
    } else {
        if (dbPath.has_parent_path()) {
            std::error_code ec;
            std::filesystem::create_directories(dbPath.parent_path(), ec);
            if (ec) {
                throw StoreError("cannot create shard directory " + dbPath.parent_path().string()
                                 + ": " + ec.message());
            }
        }
        flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE;
    }

    if (sqlite3_open_v2(dbPath.string().c_str(), &impl->db, flags, nullptr) != SQLITE_OK) {
        const std::string message = sqliteMessage(impl->db, "failed to open mirulog database");
        sqlite3_close(impl->db);
        impl->db = nullptr;
        throw StoreError(message);
    }

    try {
        sqlite3_busy_timeout(impl->db, kBusyTimeoutMs);
        if (!impl->readOnly) {
            execOrThrow(impl->db, "PRAGMA journal_mode=WAL;");
            execOrThrow(impl->db, "PRAGMA foreign_keys=ON;");
            execOrThrow(impl->db, kCreateCapturesTable);
            execOrThrow(impl->db, kCreateCapturesIndex);
            execOrThrow(impl->db, kCreateAnalysisTable);
            execOrThrow(impl->db, kCreateMetaTable);
            if (!getMeta("schema_version").has_value()) {
                setMeta("schema_version", kSchemaVersion);
            }
        }
    } catch (const std::exception &) {
        sqlite3_close(impl->db);
        impl->db = nullptr;
        throw;
    }
}

CaptureStore::~CaptureStore()
{
    if (impl && impl->db) {
        sqlite3_close(impl->db);
        impl->db = nullptr;
    }
}

const std::filesystem::path &CaptureStore::path() const
{
    return impl->path;
}

bool CaptureStore::isReadOnly() const
{
    return impl->readOnly;
}

std::int64_t CaptureStore::addCapture(const CaptureRecord &record)
{
    Statement stmt(impl->db,
                   "INSERT INTO captures (captured_at, window_title, process_name, "
                   "content_hash, image_path, host_name, session_state, status, "
                   "status_changed_at) VALUES (?, ?, ?, ?, ?, ?, ?, 'pending', ?);");
    sqlite3_bind_int64(stmt.get(), 1, toEpochMillis(record.capturedAt));
    bindOptionalText(stmt.get(), 2, record.windowTitle);
    bindOptionalText(stmt.get(), 3, record.processName);
    bindOptionalText(stmt.get(), 4, record.contentHash);
    bindText(stmt.get(), 5, record.imagePath);
    bindOptionalText(stmt.get(), 6, record.hostName);
    bindText(stmt.get(), 7, toSessionStateString(record.sessionState));
    sqlite3_bind_int64(stmt.get(), 8, toEpochMillis(record.capturedAt));
    stmt.execute("failed to insert capture");

    return sqlite3_last_insert_rowid(impl->db);
}

std::optional<CaptureRecord> CaptureStore::getCapture(std::int64_t id) const
{
    Statement stmt(impl->db,
                   std::string("SELECT ") + kCaptureColumns
                       + " FROM captures c WHERE c.id = ? LIMIT 1;");
    sqlite3_bind_int64(stmt.get(), 1, id);

    const int rc = sqlite3_step(stmt.get());
    if (rc == SQLITE_DONE) {
        return std::nullopt;
    }
    if (rc != SQLITE_ROW) {
        throw StoreError(sqliteMessage(impl->db, "failed to read capture"));
    }
    return readCapture(stmt.get());
}

std::optional<AnalysisResult> CaptureStore::getAnalysis(std::int64_t id) const
{
    Statement stmt(impl->db,
                   std::string("SELECT ") + kAnalysisColumns
                       + " FROM analysis a WHERE a.capture_id = ? LIMIT 1;");
    sqlite3_bind_int64(stmt.get(), 1, id);

    const int rc = sqlite3_step(stmt.get());
    if (rc == SQLITE_DONE) {
        return std::nullopt;
    }
    if (rc != SQLITE_ROW) {
        throw StoreError(sqliteMessage(impl->db, "failed to read analysis"));
    }
    return readAnalysis(stmt.get(), 0);
}

std::vector<CaptureRecord> CaptureStore::pendingCaptures(
    int limit,
    std::optional<std::chrono::system_clock::time_point> leaseExpiredBefore) const
{
    const std::string sql = std::string("SELECT ") + kCaptureColumns
        + " FROM captures c WHERE " + claimableClause(leaseExpiredBefore.has_value(), "c.")
        + " ORDER BY c.captured_at ASC, c.id ASC LIMIT ?;";
    Statement stmt(impl->db, sql);
    int bindIndex = 1;
    if (leaseExpiredBefore.has_value()) {
        sqlite3_bind_int64(stmt.get(), bindIndex++, toEpochMillis(*leaseExpiredBefore));
    }
    sqlite3_bind_int(stmt.get(), bindIndex, limit > 0 ? limit : -1);

    std::vector<CaptureRecord> records;
    int rc = SQLITE_ROW;
    while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
        records.push_back(readCapture(stmt.get()));
    }
    if (rc != SQLITE_DONE) {
        throw StoreError(sqliteMessage(impl->db, "failed to read pending captures"));
    }
    return records;
}

int CaptureStore::pendingCount(
    std::optional<std::chrono::system_clock::time_point> leaseExpiredBefore) const
{
    const std::string sql = "SELECT COUNT(*) FROM captures c WHERE "
        + claimableClause(leaseExpiredBefore.has_value(), "c.") + ";";
    Statement stmt(impl->db, sql);
    if (leaseExpiredBefore.has_value()) {
        sqlite3_bind_int64(stmt.get(), 1, toEpochMillis(*leaseExpiredBefore));
    }
    if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
        throw StoreError(sqliteMessage(impl->db, "failed to count pending captures"));
    }
    return sqlite3_column_int(stmt.get(), 0);
}

int CaptureStore::countByStatus(CaptureStatus status) const
{
    Statement stmt(impl->db, "SELECT COUNT(*) FROM captures WHERE status = ?;");
    bindText(stmt.get(), 1, toStatusString(status));
    if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
        throw StoreError(sqliteMessage(impl->db, "failed to count captures"));
    }
    return sqlite3_column_int(stmt.get(), 0);
}

bool CaptureStore::claimForAnalysis(
    std::int64_t id,
    const std::string &owner,
    std::chrono::system_clock::time_point now,
    std::optional<std::chrono::system_clock::time_point> leaseExpiredBefore)
{
    const std::string sql =
        "UPDATE captures SET status = 'analyzing', claim_owner = ?, "
        "claimed_at = ?, status_changed_at = ? WHERE id = ? AND "
        + claimableClause(leaseExpiredBefore.has_value(), "") + ";";
    Statement stmt(impl->db, sql);
    bindText(stmt.get(), 1, owner);
    sqlite3_bind_int64(stmt.get(), 2, toEpochMillis(now));
    sqlite3_bind_int64(stmt.get(), 3, toEpochMillis(now));
    sqlite3_bind_int64(stmt.get(), 4, id);
    if (leaseExpiredBefore.has_value()) {
        sqlite3_bind_int64(stmt.get(), 5, toEpochMillis(*leaseExpiredBefore));
    }
    stmt.execute("failed to claim capture");

    return sqlite3_changes(impl->db) == 1;
}

bool CaptureStore::markAnalyzed(const AnalysisResult &result, const std::string &owner)
{
    return finishAnalysis(result, owner, CaptureStatus::Analyzed);
}

bool CaptureStore::markFailed(const AnalysisResult &result, const std::string &owner)
{
    return finishAnalysis(result, owner, CaptureStatus::Failed);
}

bool CaptureStore::finishAnalysis(const AnalysisResult &result,
                                  const std::string &owner,
                                  CaptureStatus target)
{
    Transaction transaction(impl->db);

    Statement update(impl->db,
                     "UPDATE captures SET status = ?, status_changed_at = ?, "
                     "claim_owner = NULL, claimed_at = NULL "
                     "WHERE id = ? AND status = 'analyzing' AND claim_owner = ?;");
    bindText(update.get(), 1, toStatusString(target));
    sqlite3_bind_int64(update.get(), 2, toEpochMillis(result.lastAttemptAt));
    sqlite3_bind_int64(update.get(), 3, result.captureId);
    bindText(update.get(), 4, owner);
    update.execute("failed to update capture status");
    if (sqlite3_changes(impl->db) != 1) {
        // Rolled back by the transaction guard.
        return false;
    }

    int failureCount = 0;
    {
        Statement previous(impl->db,
                           "SELECT failure_count FROM analysis WHERE capture_id = ?;");
        sqlite3_bind_int64(previous.get(), 1, result.captureId);
        const int rc = sqlite3_step(previous.get());
        if (rc == SQLITE_ROW) {
            failureCount = sqlite3_column_int(previous.get(), 0);
        } else if (rc != SQLITE_DONE) {
            throw StoreError(sqliteMessage(impl->db, "failed to read failure count"));
        }
    }
    if (target == CaptureStatus::Failed) {
        ++failureCount;
    }

    Statement insert(impl->db,
                     "INSERT OR REPLACE INTO analysis (capture_id, backend, model, "
                     "raw_response, description, primary_task, confidence, tags, "
                     "observed_files, observed_repositories, observed_urls, "
                     "error_detail, retry_count, failure_count, last_attempt_at, "
                     "image_disposition, archived_path) "
                     "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, NULL, NULL);");
    sqlite3_bind_int64(insert.get(), 1, result.captureId);
    bindText(insert.get(), 2, result.backend);
    bindOptionalText(insert.get(), 3, result.model);
    bindOptionalText(insert.get(), 4, result.rawResponse);
    bindOptionalText(insert.get(), 5, result.fields.summary);
    bindOptionalText(insert.get(), 6, result.fields.primaryTask);
    sqlite3_bind_double(insert.get(), 7, result.fields.confidence);
    bindStringList(insert.get(), 8, result.fields.tags);
    bindStringList(insert.get(), 9, result.fields.observedFiles);
    bindStringList(insert.get(), 10, result.fields.observedRepositories);
    bindStringList(insert.get(), 11, result.fields.observedUrls);
    if (target == CaptureStatus::Failed) {
        bindText(insert.get(), 12, result.errorDetail.empty()
                                       ? std::string("unknown error")
                                       : result.errorDetail);
    } else {
        sqlite3_bind_null(insert.get(), 12);
    }
    sqlite3_bind_int(insert.get(), 13, result.retryCount);
    sqlite3_bind_int(insert.get(), 14, failureCount);
    sqlite3_bind_int64(insert.get(), 15, toEpochMillis(result.lastAttemptAt));
    insert.execute("failed to write analysis result");

    transaction.commit();
    return true;
}

void CaptureStore::recordImageDisposition(std::int64_t id,
                                          ImageDisposition disposition,
                                          const std::string &archivedPath)
{
    Statement stmt(impl->db,
                   "UPDATE analysis SET image_disposition = ?, archived_path = ? "
                   "WHERE capture_id = ?;");
    bindOptionalText(stmt.get(), 1, toDispositionString(disposition));
    bindOptionalText(stmt.get(), 2, archivedPath);
    sqlite3_bind_int64(stmt.get(), 3, id);
    stmt.execute("failed to record image disposition");
}

int CaptureStore::requeueFailed(std::optional<std::int64_t> id)
{
    std::string sql =
        "UPDATE captures SET status = 'pending', status_changed_at = ?, "
        "claim_owner = NULL, claimed_at = NULL WHERE status = 'failed'";
    if (id.has_value()) {
        sql += " AND id = ?";
    }
    sql += ";";

    Statement stmt(impl->db, sql);
    sqlite3_bind_int64(stmt.get(), 1, toEpochMillis(std::chrono::system_clock::now()));
    if (id.has_value()) {
        sqlite3_bind_int64(stmt.get(), 2, *id);
    }
    stmt.execute("failed to requeue failed captures");
    return sqlite3_changes(impl->db);
}

std::vector<CaptureEntry> CaptureStore::listEntries(
    std::optional<std::chrono::system_clock::time_point> from,
    std::optional<std::chrono::system_clock::time_point> to) const
{
    std::string sql = std::string("SELECT ") + kCaptureColumns + ", " + kAnalysisColumns
        + " FROM captures c LEFT JOIN analysis a ON a.capture_id = c.id WHERE 1 = 1";
    if (from.has_value()) {
        sql += " AND c.captured_at >= ?";
    }
    if (to.has_value()) {
        sql += " AND c.captured_at <= ?";
    }
    sql += " ORDER BY c.captured_at ASC, c.id ASC;";

    Statement stmt(impl->db, sql);
    int bindIndex = 1;
    if (from.has_value()) {
        sqlite3_bind_int64(stmt.get(), bindIndex++, toEpochMillis(*from));
    }
    if (to.has_value()) {
        sqlite3_bind_int64(stmt.get(), bindIndex++, toEpochMillis(*to));
    }

    std::vector<CaptureEntry> entries;
    int rc = SQLITE_ROW;
    while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
        CaptureEntry entry;
        entry.capture = readCapture(stmt.get());
        if (sqlite3_column_type(stmt.get(), kCaptureColumnCount) != SQLITE_NULL) {
            entry.analysis = readAnalysis(stmt.get(), kCaptureColumnCount);
        }
        entries.push_back(std::move(entry));
    }
    if (rc != SQLITE_DONE) {
        throw StoreError(sqliteMessage(impl->db, "failed to list captures"));
    }
    return entries;
}

std::optional<std::string> CaptureStore::getMeta(const std::string &key) const
{
    Statement stmt(impl->db,
                   "SELECT value FROM meta WHERE key = ? LIMIT 1;");
    bindText(stmt.get(), 1, key);

    const int rc = sqlite3_step(stmt.get());
    if (rc == SQLITE_DONE) {
        return std::nullopt;
    }
    if (rc != SQLITE_ROW) {
        throw StoreError(sqliteMessage(impl->db, "failed to read meta value"));
    }

    return columnText(stmt.get(), 0);
}

void CaptureStore::setMeta(const std::string &key, const std::string &value)
{
    Statement stmt(impl->db,
                   "INSERT OR REPLACE INTO meta (key, value) VALUES (?, ?);");
    bindText(stmt.get(), 1, key);
    bindText(stmt.get(), 2, value);
    stmt.execute("failed to set meta value");
}

bool CaptureStore::integrityCheck(std::string *message) const
{
    Statement stmt(impl->db, "PRAGMA integrity_check;");

    if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
        throw StoreError(sqliteMessage(impl->db, "integrity_check failed to return a result"));
    }

    const std::string result = columnText(stmt.get(), 0);
    if (message) {
        *message = result;
    }
    return result == "ok";
}

} // namespace mirulog
