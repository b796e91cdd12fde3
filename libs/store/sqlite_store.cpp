/**
 * @file sqlite_store.cpp
 * @brief SQLite3 implementation of the relational store
 */

#include "axiom/store.hpp"

#include <cmath>
#include <format>
#include <memory>
#include <utility>

#include <nlohmann/json.hpp>
#include <sqlite3.h>

namespace axiom::store {

namespace {

constexpr int kBusyTimeoutMs = 5000;

constexpr const char* kSchemaSql = R"sql(
PRAGMA foreign_keys = ON;

CREATE TABLE IF NOT EXISTS projects (
    id            TEXT PRIMARY KEY,
    name          TEXT NOT NULL DEFAULT '',
    owner_id      TEXT NOT NULL,
    budget_limit  REAL,
    current_usage REAL DEFAULT 0.0 CHECK (current_usage >= 0),
    created_at    TEXT NOT NULL,
    updated_at    TEXT NOT NULL
);

CREATE TABLE IF NOT EXISTS project_members (
    project_id TEXT NOT NULL REFERENCES projects(id) ON DELETE CASCADE,
    user_id    TEXT NOT NULL,
    role       TEXT NOT NULL CHECK (role IN ('viewer', 'editor', 'admin', 'owner')),
    added_at   TEXT NOT NULL,
    PRIMARY KEY (project_id, user_id)
);

CREATE TABLE IF NOT EXISTS usage_logs (
    id             INTEGER PRIMARY KEY AUTOINCREMENT,
    project_id     TEXT NOT NULL REFERENCES projects(id) ON DELETE CASCADE,
    user_id        TEXT NOT NULL,
    cost           REAL NOT NULL DEFAULT 0.0,
    operation_type TEXT NOT NULL,
    details        TEXT NOT NULL DEFAULT '{}',
    created_at     TEXT NOT NULL
);
CREATE INDEX IF NOT EXISTS idx_usage_logs_project_id ON usage_logs (project_id);
CREATE INDEX IF NOT EXISTS idx_usage_logs_user_id ON usage_logs (user_id);

CREATE TABLE IF NOT EXISTS ivcus (
    id               TEXT PRIMARY KEY,
    project_id       TEXT NOT NULL REFERENCES projects(id),
    version          INTEGER NOT NULL CHECK (version >= 1),
    status           TEXT NOT NULL CHECK (status IN ('draft', 'generating', 'verifying',
                                                     'verified', 'failed', 'deployed',
                                                     'deprecated')),
    confidence_score REAL NOT NULL DEFAULT 0.0
                     CHECK (confidence_score >= 0.0 AND confidence_score <= 1.0),
    parent_ids       TEXT NOT NULL DEFAULT '[]',
    created_at       TEXT NOT NULL,
    updated_at       TEXT NOT NULL
);
CREATE INDEX IF NOT EXISTS idx_ivcus_project_id ON ivcus (project_id);

CREATE TABLE IF NOT EXISTS proof_certificates (
    id           TEXT PRIMARY KEY,
    ivcu_id      TEXT NOT NULL REFERENCES ivcus(id),
    proof_type   TEXT NOT NULL CHECK (proof_type IN ('type_safety', 'memory_safety',
                                                     'contract_compliance', 'property_based')),
    intent_id    TEXT NOT NULL,
    code_hash    TEXT NOT NULL CHECK (length(code_hash) = 64),
    ast_hash     TEXT NOT NULL CHECK (length(ast_hash) = 64),
    hash_chain   TEXT NOT NULL,
    signature    TEXT NOT NULL,
    content_hash TEXT NOT NULL,
    document     TEXT NOT NULL,
    created_at   TEXT NOT NULL,
    UNIQUE (ivcu_id, proof_type)
);
CREATE INDEX IF NOT EXISTS proof_certificates_intent_idx ON proof_certificates (intent_id);
CREATE INDEX IF NOT EXISTS proof_certificates_hash_chain_idx ON proof_certificates (hash_chain);
)sql";

struct StatementDeleter
{
    void operator()(sqlite3_stmt* stmt) const noexcept { sqlite3_finalize(stmt); }
};

using Statement = std::unique_ptr<sqlite3_stmt, StatementDeleter>;

[[nodiscard]] Error sqlite_error(sqlite3* db, std::string_view what)
{
    return Error::make(errc::kPersistence, std::format("{}: {}", what, sqlite3_errmsg(db)));
}

[[nodiscard]] axiom::Result<Statement> prepare(sqlite3* db, std::string_view sql)
{
    sqlite3_stmt* raw = nullptr;
    if (sqlite3_prepare_v2(db, sql.data(), static_cast<int>(sql.size()), &raw, nullptr)
        != SQLITE_OK) {
        sqlite3_finalize(raw);
        return std::unexpected(sqlite_error(db, "prepare failed"));
    }
    return Statement(raw);
}

void bind_text(sqlite3_stmt* stmt, int index, std::string_view value)
{
    sqlite3_bind_text(stmt, index, value.data(), static_cast<int>(value.size()), SQLITE_TRANSIENT);
}

[[nodiscard]] std::string column_text(sqlite3_stmt* stmt, int index)
{
    const auto* text = sqlite3_column_text(stmt, index);
    if (text == nullptr) {
        return {};
    }
    return std::string(reinterpret_cast<const char*>(text),
                       static_cast<std::size_t>(sqlite3_column_bytes(stmt, index)));
}

[[nodiscard]] bool is_constraint_violation(int rc) noexcept
{
    return (rc & 0xFF) == SQLITE_CONSTRAINT;
}

[[nodiscard]] CertificateRow read_certificate_row(sqlite3_stmt* stmt)
{
    return CertificateRow{.id = column_text(stmt, 0),
                          .ivcu_id = column_text(stmt, 1),
                          .proof_type = column_text(stmt, 2),
                          .intent_id = column_text(stmt, 3),
                          .code_hash = column_text(stmt, 4),
                          .ast_hash = column_text(stmt, 5),
                          .hash_chain = column_text(stmt, 6),
                          .signature = column_text(stmt, 7),
                          .content_hash = column_text(stmt, 8),
                          .document = column_text(stmt, 9),
                          .created_at = column_text(stmt, 10)};
}

constexpr std::string_view kCertificateColumns =
    "id, ivcu_id, proof_type, intent_id, code_hash, ast_hash, hash_chain, signature, "
    "content_hash, document, created_at";

}  // namespace

axiom::Result<std::unique_ptr<SqliteStore>> SqliteStore::open(const std::string& path, NowFn now)
{
    sqlite3* db = nullptr;
    const int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
    if (sqlite3_open_v2(path.c_str(), &db, flags, nullptr) != SQLITE_OK) {
        Error error = Error::make(errc::kPersistence,
                                  std::format("Failed to open database {}: {}",
                                              path,
                                              db != nullptr ? sqlite3_errmsg(db) : "out of memory"));
        sqlite3_close(db);
        return std::unexpected(std::move(error));
    }
    sqlite3_busy_timeout(db, kBusyTimeoutMs);
    sqlite3_extended_result_codes(db, 1);
    return std::unique_ptr<SqliteStore>(new SqliteStore(db, std::move(now)));
}

SqliteStore::SqliteStore(sqlite3* db, NowFn now)
    : m_db(db)
    , m_now(now ? std::move(now) : NowFn{[] { return WallClock::now(); }})
{}

SqliteStore::~SqliteStore()
{
    sqlite3_close(m_db);
}

axiom::VoidResult SqliteStore::migrate()
{
    std::lock_guard lock(m_mutex);
    return exec_locked(kSchemaSql);
}

axiom::VoidResult SqliteStore::exec_locked(const char* sql)
{
    char* message = nullptr;
    if (sqlite3_exec(m_db, sql, nullptr, nullptr, &message) != SQLITE_OK) {
        std::string text = message != nullptr ? message : "unknown error";
        sqlite3_free(message);
        return std::unexpected(Error::make(errc::kPersistence, "exec failed: " + text));
    }
    return {};
}

std::string SqliteStore::now_text() const
{
    return common::format_rfc3339(m_now());
}

axiom::VoidResult SqliteStore::add_project(const ProjectRecord& project)
{
    if (project.id.empty() || project.owner_id.empty()) {
        return std::unexpected(Error::make(errc::kValidation, "project requires id and owner_id"));
    }
    std::lock_guard lock(m_mutex);
    auto stmt = prepare(m_db,
                        "INSERT INTO projects (id, name, owner_id, budget_limit, current_usage, "
                        "created_at, updated_at) VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?6)");
    if (!stmt) {
        return std::unexpected(stmt.error());
    }
    bind_text(stmt->get(), 1, project.id);
    bind_text(stmt->get(), 2, project.name);
    bind_text(stmt->get(), 3, project.owner_id);
    if (project.budget_limit) {
        sqlite3_bind_double(stmt->get(), 4, *project.budget_limit);
    } else {
        sqlite3_bind_null(stmt->get(), 4);
    }
    sqlite3_bind_double(stmt->get(), 5, project.current_usage);
    bind_text(stmt->get(), 6, now_text());

    const int rc = sqlite3_step(stmt->get());
    if (is_constraint_violation(rc)) {
        return std::unexpected(Error::make(errc::kConflict, "project already exists: " + project.id));
    }
    if (rc != SQLITE_DONE) {
        return std::unexpected(sqlite_error(m_db, "insert project failed"));
    }
    return {};
}

axiom::Result<ProjectRecord> SqliteStore::get_project(const std::string& project_id)
{
    std::lock_guard lock(m_mutex);
    auto stmt = prepare(
        m_db,
        "SELECT id, name, owner_id, budget_limit, current_usage FROM projects WHERE id = ?1");
    if (!stmt) {
        return std::unexpected(stmt.error());
    }
    bind_text(stmt->get(), 1, project_id);
    const int rc = sqlite3_step(stmt->get());
    if (rc == SQLITE_DONE) {
        return std::unexpected(Error::make(errc::kNotFound, "project not found: " + project_id));
    }
    if (rc != SQLITE_ROW) {
        return std::unexpected(sqlite_error(m_db, "read project failed"));
    }
    ProjectRecord record{.id = column_text(stmt->get(), 0),
                         .name = column_text(stmt->get(), 1),
                         .owner_id = column_text(stmt->get(), 2),
                         .budget_limit = std::nullopt,
                         .current_usage = sqlite3_column_double(stmt->get(), 4)};
    if (sqlite3_column_type(stmt->get(), 3) != SQLITE_NULL) {
        record.budget_limit = sqlite3_column_double(stmt->get(), 3);
    }
    return record;
}

axiom::VoidResult SqliteStore::add_member(const std::string& project_id,
                                          const std::string& user_id,
                                          const std::string& role)
{
    std::lock_guard lock(m_mutex);
    auto stmt = prepare(m_db,
                        "INSERT INTO project_members (project_id, user_id, role, added_at) "
                        "VALUES (?1, ?2, ?3, ?4) "
                        "ON CONFLICT (project_id, user_id) DO UPDATE SET role = excluded.role");
    if (!stmt) {
        return std::unexpected(stmt.error());
    }
    bind_text(stmt->get(), 1, project_id);
    bind_text(stmt->get(), 2, user_id);
    bind_text(stmt->get(), 3, role);
    bind_text(stmt->get(), 4, now_text());
    const int rc = sqlite3_step(stmt->get());
    if (is_constraint_violation(rc)) {
        return std::unexpected(Error::make(
            errc::kValidation,
            std::format("invalid membership {}/{} ({}): {}", project_id, user_id, role, sqlite3_errmsg(m_db))));
    }
    if (rc != SQLITE_DONE) {
        return std::unexpected(sqlite_error(m_db, "insert member failed"));
    }
    return {};
}

axiom::Result<std::vector<UsageLogEntry>> SqliteStore::usage_logs(const std::string& project_id)
{
    std::lock_guard lock(m_mutex);
    auto stmt = prepare(m_db,
                        "SELECT project_id, user_id, cost, operation_type, details FROM usage_logs "
                        "WHERE project_id = ?1 ORDER BY id");
    if (!stmt) {
        return std::unexpected(stmt.error());
    }
    bind_text(stmt->get(), 1, project_id);
    std::vector<UsageLogEntry> entries;
    int rc = SQLITE_ROW;
    while ((rc = sqlite3_step(stmt->get())) == SQLITE_ROW) {
        entries.push_back(UsageLogEntry{.project_id = column_text(stmt->get(), 0),
                                        .user_id = column_text(stmt->get(), 1),
                                        .cost = sqlite3_column_double(stmt->get(), 2),
                                        .operation_type = column_text(stmt->get(), 3),
                                        .details_json = column_text(stmt->get(), 4)});
    }
    if (rc != SQLITE_DONE) {
        return std::unexpected(sqlite_error(m_db, "read usage logs failed"));
    }
    return entries;
}

axiom::Result<BudgetRow> SqliteStore::read_budget(const std::string& project_id)
{
    std::lock_guard lock(m_mutex);
    auto stmt = prepare(m_db, "SELECT budget_limit, current_usage FROM projects WHERE id = ?1");
    if (!stmt) {
        return std::unexpected(stmt.error());
    }
    bind_text(stmt->get(), 1, project_id);
    const int rc = sqlite3_step(stmt->get());
    if (rc == SQLITE_DONE) {
        return std::unexpected(Error::make(errc::kNotFound, "project not found: " + project_id));
    }
    if (rc != SQLITE_ROW) {
        return std::unexpected(sqlite_error(m_db, "read budget failed"));
    }
    if (sqlite3_column_type(stmt->get(), 1) == SQLITE_NULL) {
        return std::unexpected(
            Error::make(errc::kPersistence, "current_usage is NULL for project " + project_id));
    }
    BudgetRow row{.budget_limit = std::nullopt,
                  .current_usage = sqlite3_column_double(stmt->get(), 1)};
    if (sqlite3_column_type(stmt->get(), 0) != SQLITE_NULL) {
        row.budget_limit = sqlite3_column_double(stmt->get(), 0);
    }
    return row;
}

axiom::VoidResult SqliteStore::increment_usage(const std::string& project_id, double cost)
{
    std::lock_guard lock(m_mutex);
    auto stmt = prepare(m_db,
                        "UPDATE projects SET current_usage = current_usage + ?2, updated_at = ?3 "
                        "WHERE id = ?1");
    if (!stmt) {
        return std::unexpected(stmt.error());
    }
    bind_text(stmt->get(), 1, project_id);
    sqlite3_bind_double(stmt->get(), 2, cost);
    bind_text(stmt->get(), 3, now_text());
    if (sqlite3_step(stmt->get()) != SQLITE_DONE) {
        return std::unexpected(sqlite_error(m_db, "update project usage failed"));
    }
    if (sqlite3_changes(m_db) == 0) {
        return std::unexpected(Error::make(errc::kNotFound, "project not found: " + project_id));
    }
    return {};
}

axiom::Result<std::optional<std::string>> SqliteStore::project_owner(const std::string& project_id)
{
    std::lock_guard lock(m_mutex);
    auto stmt = prepare(m_db, "SELECT owner_id FROM projects WHERE id = ?1");
    if (!stmt) {
        return std::unexpected(stmt.error());
    }
    bind_text(stmt->get(), 1, project_id);
    const int rc = sqlite3_step(stmt->get());
    if (rc == SQLITE_DONE) {
        return std::optional<std::string>{};
    }
    if (rc != SQLITE_ROW) {
        return std::unexpected(sqlite_error(m_db, "read project owner failed"));
    }
    return std::optional<std::string>{column_text(stmt->get(), 0)};
}

axiom::Result<std::optional<std::string>> SqliteStore::member_role(const std::string& project_id,
                                                                   const std::string& user_id)
{
    std::lock_guard lock(m_mutex);
    auto stmt = prepare(m_db,
                        "SELECT role FROM project_members WHERE project_id = ?1 AND user_id = ?2");
    if (!stmt) {
        return std::unexpected(stmt.error());
    }
    bind_text(stmt->get(), 1, project_id);
    bind_text(stmt->get(), 2, user_id);
    const int rc = sqlite3_step(stmt->get());
    if (rc == SQLITE_DONE) {
        return std::optional<std::string>{};
    }
    if (rc != SQLITE_ROW) {
        return std::unexpected(sqlite_error(m_db, "read membership failed"));
    }
    return std::optional<std::string>{column_text(stmt->get(), 0)};
}

axiom::VoidResult SqliteStore::append_usage_log(const UsageLogEntry& entry)
{
    std::lock_guard lock(m_mutex);
    auto stmt = prepare(m_db,
                        "INSERT INTO usage_logs (project_id, user_id, cost, operation_type, "
                        "details, created_at) VALUES (?1, ?2, ?3, ?4, ?5, ?6)");
    if (!stmt) {
        return std::unexpected(stmt.error());
    }
    bind_text(stmt->get(), 1, entry.project_id);
    bind_text(stmt->get(), 2, entry.user_id);
    sqlite3_bind_double(stmt->get(), 3, entry.cost);
    bind_text(stmt->get(), 4, entry.operation_type);
    bind_text(stmt->get(), 5, entry.details_json.empty() ? "{}" : entry.details_json);
    bind_text(stmt->get(), 6, now_text());
    if (sqlite3_step(stmt->get()) != SQLITE_DONE) {
        return std::unexpected(sqlite_error(m_db, "insert usage log failed"));
    }
    return {};
}

axiom::VoidResult SqliteStore::save_ivcu(const ivcu::IvcuRecord& record)
{
    const std::string parents = nlohmann::json(record.parent_ids).dump();
    std::lock_guard lock(m_mutex);
    auto stmt = prepare(m_db,
                        "INSERT INTO ivcus (id, project_id, version, status, confidence_score, "
                        "parent_ids, created_at, updated_at) VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?7) "
                        "ON CONFLICT (id) DO UPDATE SET status = excluded.status, "
                        "confidence_score = excluded.confidence_score, "
                        "updated_at = excluded.updated_at");
    if (!stmt) {
        return std::unexpected(stmt.error());
    }
    bind_text(stmt->get(), 1, record.id);
    bind_text(stmt->get(), 2, record.project_id);
    sqlite3_bind_int(stmt->get(), 3, record.version);
    bind_text(stmt->get(), 4, ivcu::status_name(record.status));
    sqlite3_bind_double(stmt->get(), 5, record.confidence_score);
    bind_text(stmt->get(), 6, parents);
    bind_text(stmt->get(), 7, now_text());
    const int rc = sqlite3_step(stmt->get());
    if (is_constraint_violation(rc)) {
        return std::unexpected(Error::make(
            errc::kValidation,
            std::format("IVCU {} rejected by store constraints: {}", record.id, sqlite3_errmsg(m_db))));
    }
    if (rc != SQLITE_DONE) {
        return std::unexpected(sqlite_error(m_db, "save IVCU failed"));
    }
    return {};
}

axiom::Result<ivcu::IvcuRecord> SqliteStore::load_ivcu(const std::string& id)
{
    std::lock_guard lock(m_mutex);
    auto stmt = prepare(m_db,
                        "SELECT id, project_id, version, status, confidence_score, parent_ids "
                        "FROM ivcus WHERE id = ?1");
    if (!stmt) {
        return std::unexpected(stmt.error());
    }
    bind_text(stmt->get(), 1, id);
    const int rc = sqlite3_step(stmt->get());
    if (rc == SQLITE_DONE) {
        return std::unexpected(Error::make(errc::kNotFound, "IVCU not found: " + id));
    }
    if (rc != SQLITE_ROW) {
        return std::unexpected(sqlite_error(m_db, "load IVCU failed"));
    }

    const std::string status_text = column_text(stmt->get(), 3);
    auto status = ivcu::status_from_string(status_text);
    if (!status) {
        return std::unexpected(
            Error::make(errc::kPersistence, "IVCU " + id + " has unknown status " + status_text));
    }
    ivcu::IvcuRecord record{.id = column_text(stmt->get(), 0),
                            .project_id = column_text(stmt->get(), 1),
                            .version = sqlite3_column_int(stmt->get(), 2),
                            .status = *status,
                            .confidence_score = sqlite3_column_double(stmt->get(), 4),
                            .parent_ids = {}};
    try {
        record.parent_ids =
            nlohmann::json::parse(column_text(stmt->get(), 5)).get<std::vector<std::string>>();
    } catch (const nlohmann::json::exception& ex) {
        return std::unexpected(Error::make(
            errc::kPersistence, std::format("IVCU {} has malformed parent_ids: {}", id, ex.what())));
    }
    return record;
}

axiom::VoidResult SqliteStore::insert_certificate(const CertificateRow& row)
{
    std::lock_guard lock(m_mutex);
    auto stmt = prepare(m_db,
                        std::format("INSERT INTO proof_certificates ({}) VALUES "
                                    "(?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9, ?10, ?11)",
                                    kCertificateColumns));
    if (!stmt) {
        return std::unexpected(stmt.error());
    }
    bind_text(stmt->get(), 1, row.id);
    bind_text(stmt->get(), 2, row.ivcu_id);
    bind_text(stmt->get(), 3, row.proof_type);
    bind_text(stmt->get(), 4, row.intent_id);
    bind_text(stmt->get(), 5, row.code_hash);
    bind_text(stmt->get(), 6, row.ast_hash);
    bind_text(stmt->get(), 7, row.hash_chain);
    bind_text(stmt->get(), 8, row.signature);
    bind_text(stmt->get(), 9, row.content_hash);
    bind_text(stmt->get(), 10, row.document);
    bind_text(stmt->get(), 11, row.created_at.empty() ? now_text() : row.created_at);

    const int rc = sqlite3_step(stmt->get());
    if (rc == SQLITE_CONSTRAINT_UNIQUE || rc == SQLITE_CONSTRAINT_PRIMARYKEY) {
        return std::unexpected(Error::make(
            errc::kConflict,
            std::format("certificate already issued for IVCU {} ({})", row.ivcu_id, row.proof_type)));
    }
    if (is_constraint_violation(rc)) {
        return std::unexpected(Error::make(
            errc::kValidation,
            std::format("certificate rejected by store constraints: {}", sqlite3_errmsg(m_db))));
    }
    if (rc != SQLITE_DONE) {
        return std::unexpected(sqlite_error(m_db, "insert certificate failed"));
    }
    return {};
}

axiom::Result<CertificateRow> SqliteStore::find_certificate(const std::string& id)
{
    std::lock_guard lock(m_mutex);
    auto stmt = prepare(
        m_db, std::format("SELECT {} FROM proof_certificates WHERE id = ?1", kCertificateColumns));
    if (!stmt) {
        return std::unexpected(stmt.error());
    }
    bind_text(stmt->get(), 1, id);
    const int rc = sqlite3_step(stmt->get());
    if (rc == SQLITE_DONE) {
        return std::unexpected(Error::make(errc::kNotFound, "certificate not found: " + id));
    }
    if (rc != SQLITE_ROW) {
        return std::unexpected(sqlite_error(m_db, "read certificate failed"));
    }
    return read_certificate_row(stmt->get());
}

axiom::Result<std::optional<CertificateRow>> SqliteStore::find_certificate_for(
    const std::string& ivcu_id,
    const std::string& proof_type)
{
    std::lock_guard lock(m_mutex);
    auto stmt = prepare(m_db,
                        std::format("SELECT {} FROM proof_certificates "
                                    "WHERE ivcu_id = ?1 AND proof_type = ?2",
                                    kCertificateColumns));
    if (!stmt) {
        return std::unexpected(stmt.error());
    }
    bind_text(stmt->get(), 1, ivcu_id);
    bind_text(stmt->get(), 2, proof_type);
    const int rc = sqlite3_step(stmt->get());
    if (rc == SQLITE_DONE) {
        return std::optional<CertificateRow>{};
    }
    if (rc != SQLITE_ROW) {
        return std::unexpected(sqlite_error(m_db, "read certificate failed"));
    }
    return std::optional<CertificateRow>{read_certificate_row(stmt->get())};
}

}  // namespace axiom::store
