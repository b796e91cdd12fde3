#pragma once

/**
 * @file store.hpp
 * @brief Relational store: repositories consumed by the gates and the SQLite implementation
 *
 * Tables: projects, project_members, usage_logs, ivcus, proof_certificates.
 * proof_certificates carries UNIQUE(ivcu_id, proof_type).
 */

#include "axiom/common.hpp"
#include "axiom/ivcu.hpp"

#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

struct sqlite3;

namespace axiom::store {

struct ProjectRecord
{
    std::string id;
    std::string name;
    std::string owner_id;
    std::optional<double> budget_limit;  ///< NULL means "use the configured default"
    double current_usage = 0.0;
};

/// Budget columns as read by BudgetGuard
struct BudgetRow
{
    std::optional<double> budget_limit;
    double current_usage = 0.0;
};

struct UsageLogEntry
{
    std::string project_id;
    std::string user_id;
    double cost = 0.0;
    std::string operation_type;
    std::string details_json;  ///< Canonical JSON of the typed usage details
};

/// Persisted proof certificate row; document is the canonical certificate JSON
struct CertificateRow
{
    std::string id;
    std::string ivcu_id;
    std::string proof_type;
    std::string intent_id;
    std::string code_hash;
    std::string ast_hash;
    std::string hash_chain;
    std::string signature;
    std::string content_hash;
    std::string document;
    std::string created_at;
};

class ProjectRepository
{
public:
    virtual ~ProjectRepository() = default;

    /// NotFoundError if the project does not exist, PersistenceError on read failure
    [[nodiscard]] virtual axiom::Result<BudgetRow> read_budget(const std::string& project_id) = 0;

    /**
     * current_usage += cost in a single UPDATE statement.
     * @return NotFoundError if no row was updated
     */
    [[nodiscard]] virtual axiom::VoidResult increment_usage(const std::string& project_id,
                                                           double cost) = 0;

    /// Owner id, or nullopt when the project does not exist
    [[nodiscard]] virtual axiom::Result<std::optional<std::string>> project_owner(
        const std::string& project_id) = 0;
};

class MembershipRepository
{
public:
    virtual ~MembershipRepository() = default;

    /// Explicit membership role label, or nullopt when there is no row
    [[nodiscard]] virtual axiom::Result<std::optional<std::string>> member_role(
        const std::string& project_id,
        const std::string& user_id) = 0;
};

class UsageLogRepository
{
public:
    virtual ~UsageLogRepository() = default;

    [[nodiscard]] virtual axiom::VoidResult append_usage_log(const UsageLogEntry& entry) = 0;
};

class IvcuRepository
{
public:
    virtual ~IvcuRepository() = default;

    /// Insert, or update status and confidence of an existing row
    [[nodiscard]] virtual axiom::VoidResult save_ivcu(const ivcu::IvcuRecord& record) = 0;

    [[nodiscard]] virtual axiom::Result<ivcu::IvcuRecord> load_ivcu(const std::string& id) = 0;
};

class CertificateRepository
{
public:
    virtual ~CertificateRepository() = default;

    /// ConflictError if (ivcu_id, proof_type) or id already exists; never overwrites
    [[nodiscard]] virtual axiom::VoidResult insert_certificate(const CertificateRow& row) = 0;

    [[nodiscard]] virtual axiom::Result<CertificateRow> find_certificate(const std::string& id) = 0;

    [[nodiscard]] virtual axiom::Result<std::optional<CertificateRow>> find_certificate_for(
        const std::string& ivcu_id,
        const std::string& proof_type) = 0;
};

/**
 * SQLite3-backed store. One connection, serialized; safe to share across threads.
 */
class SqliteStore : public ProjectRepository,
                    public MembershipRepository,
                    public UsageLogRepository,
                    public IvcuRepository,
                    public CertificateRepository
{
public:
    using NowFn = std::function<WallClock::time_point()>;

    /**
     * Open (or create) the database. ":memory:" opens a private in-memory database.
     */
    [[nodiscard]] static axiom::Result<std::unique_ptr<SqliteStore>> open(const std::string& path,
                                                                          NowFn now = {});

    ~SqliteStore() override;
    SqliteStore(const SqliteStore&) = delete;
    SqliteStore& operator=(const SqliteStore&) = delete;

    /// Create every table and index if missing
    [[nodiscard]] axiom::VoidResult migrate();

    [[nodiscard]] axiom::VoidResult add_project(const ProjectRecord& project);
    [[nodiscard]] axiom::Result<ProjectRecord> get_project(const std::string& project_id);
    [[nodiscard]] axiom::VoidResult add_member(const std::string& project_id,
                                               const std::string& user_id,
                                               const std::string& role);
    [[nodiscard]] axiom::Result<std::vector<UsageLogEntry>> usage_logs(const std::string& project_id);

    axiom::Result<BudgetRow> read_budget(const std::string& project_id) override;
    axiom::VoidResult increment_usage(const std::string& project_id, double cost) override;
    axiom::Result<std::optional<std::string>> project_owner(const std::string& project_id) override;

    axiom::Result<std::optional<std::string>> member_role(const std::string& project_id,
                                                          const std::string& user_id) override;

    axiom::VoidResult append_usage_log(const UsageLogEntry& entry) override;

    axiom::VoidResult save_ivcu(const ivcu::IvcuRecord& record) override;
    axiom::Result<ivcu::IvcuRecord> load_ivcu(const std::string& id) override;

    axiom::VoidResult insert_certificate(const CertificateRow& row) override;
    axiom::Result<CertificateRow> find_certificate(const std::string& id) override;
    axiom::Result<std::optional<CertificateRow>> find_certificate_for(
        const std::string& ivcu_id,
        const std::string& proof_type) override;

private:
    SqliteStore(sqlite3* db, NowFn now);

    [[nodiscard]] axiom::VoidResult exec_locked(const char* sql);
    [[nodiscard]] std::string now_text() const;

    sqlite3* m_db;
    NowFn m_now;
    std::mutex m_mutex;
};

}  // namespace axiom::store
