#pragma once

/**
 * @file ivcu.hpp
 * @brief IVCU lifecycle state machine and lineage arena
 *
 * Lifecycle:
 *   draft -> generating -> verifying -> {verified | failed}
 *   verified -> deployed
 *   {draft, generating, verifying, verified} -> deprecated (supersession)
 *
 * A failed unit is never resurrected: retry() creates version + 1 whose
 * parent_ids names the failed unit.
 */

#include "axiom/common.hpp"

#include <map>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace axiom::ivcu {

enum class Status { kDraft, kGenerating, kVerifying, kVerified, kFailed, kDeployed, kDeprecated };

[[nodiscard]] std::string_view status_name(Status status) noexcept;
[[nodiscard]] std::optional<Status> status_from_string(std::string_view text) noexcept;

/// deployed, failed and deprecated admit no further transitions
[[nodiscard]] bool is_terminal(Status status) noexcept;

[[nodiscard]] bool can_transition(Status from, Status to) noexcept;

struct IvcuRecord
{
    std::string id;
    std::string project_id;
    int version = 1;
    Status status = Status::kDraft;
    double confidence_score = 0.0;        ///< In [0, 1]
    std::vector<std::string> parent_ids;  ///< Predecessors, oldest first
};

/// Outcome reported by one verifier tier
struct VerifierResult
{
    std::string name;
    int tier = 1;
    bool passed = false;
    double confidence = 0.0;  ///< In [0, 1]
};

struct VerificationPolicy
{
    double confidence_threshold = 0.8;
};

/**
 * Apply one lifecycle transition.
 * @return ValidationError if the edge is not in the lifecycle graph
 */
[[nodiscard]] axiom::VoidResult transition(IvcuRecord& record, Status to);

/**
 * Mean confidence across verifiers; an empty set aggregates to 0.
 * @return ValidationError if any confidence lies outside [0, 1]
 */
[[nodiscard]] axiom::Result<double> aggregate_confidence(std::span<const VerifierResult> results);

/**
 * Leave the verifying state: verified when every verifier passed and the
 * aggregated confidence meets the policy threshold, failed otherwise.
 * @return The status reached, or ValidationError if the record is not verifying
 */
[[nodiscard]] axiom::Result<Status> complete_verification(IvcuRecord& record,
                                                          std::span<const VerifierResult> results,
                                                          const VerificationPolicy& policy);

/**
 * Arena of IVCU records keyed by id. Thread-safe; accessors return copies.
 */
class IvcuRegistry
{
public:
    IvcuRegistry() = default;
    IvcuRegistry(const IvcuRegistry&) = delete;
    IvcuRegistry& operator=(const IvcuRegistry&) = delete;

    /// New draft at version 1
    [[nodiscard]] axiom::Result<IvcuRecord> create(const std::string& project_id);

    /// Insert a record loaded from persistence; ConflictError if the id exists
    [[nodiscard]] axiom::VoidResult adopt(IvcuRecord record);

    [[nodiscard]] axiom::Result<IvcuRecord> get(const std::string& id) const;

    [[nodiscard]] axiom::Result<IvcuRecord> transition(const std::string& id, Status to);

    [[nodiscard]] axiom::Result<IvcuRecord> complete_verification(
        const std::string& id,
        std::span<const VerifierResult> results,
        const VerificationPolicy& policy);

    /**
     * Store record in place of the cached unit if that unit is still in status
     * expected. Used to publish a change only after it has been persisted, and
     * to roll it back when persisting fails.
     * @return ConflictError if the cached unit moved on, NotFoundError if absent
     */
    [[nodiscard]] axiom::VoidResult replace(const IvcuRecord& record, Status expected);

    /**
     * Successor of a failed unit: version + 1, parent_ids = {failed id}, draft.
     * A failed unit may be retried once.
     */
    [[nodiscard]] axiom::Result<IvcuRecord> retry(const std::string& failed_id);

    /**
     * Deprecate a non-terminal unit and create its draft successor.
     * @return The successor
     */
    [[nodiscard]] axiom::Result<IvcuRecord> supersede(const std::string& id);

    /**
     * Ancestors reachable through parent_ids, nearest first, each listed once.
     */
    [[nodiscard]] axiom::Result<std::vector<std::string>> lineage(const std::string& id) const;

    [[nodiscard]] std::size_t size() const;

private:
    [[nodiscard]] axiom::Result<IvcuRecord> make_successor_locked(const IvcuRecord& parent);

    mutable std::mutex m_mutex;
    std::map<std::string, IvcuRecord, std::less<>> m_records;
    std::map<std::string, std::string, std::less<>> m_successor_of;
};

}  // namespace axiom::ivcu
