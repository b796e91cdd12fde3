/**
 * @file ivcu.cpp
 * @brief IVCU lifecycle transitions and lineage arena
 */

#include "axiom/ivcu.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <deque>
#include <format>
#include <set>
#include <utility>

namespace axiom::ivcu {

namespace {

struct Edge
{
    Status from;
    Status to;
};

constexpr std::array kEdges = {
    Edge{     .from = Status::kDraft, .to = Status::kGenerating},
    Edge{.from = Status::kGenerating,  .to = Status::kVerifying},
    Edge{ .from = Status::kVerifying,   .to = Status::kVerified},
    Edge{ .from = Status::kVerifying,     .to = Status::kFailed},
    Edge{  .from = Status::kVerified,   .to = Status::kDeployed},
};

[[nodiscard]] bool valid_confidence(double value) noexcept
{
    return std::isfinite(value) && value >= 0.0 && value <= 1.0;
}

}  // namespace

std::string_view status_name(Status status) noexcept
{
    switch (status) {
        case Status::kDraft:
            return "draft";
        case Status::kGenerating:
            return "generating";
        case Status::kVerifying:
            return "verifying";
        case Status::kVerified:
            return "verified";
        case Status::kFailed:
            return "failed";
        case Status::kDeployed:
            return "deployed";
        case Status::kDeprecated:
            return "deprecated";
    }
    return "unknown";
}

std::optional<Status> status_from_string(std::string_view text) noexcept
{
    for (Status s : {Status::kDraft,
                     Status::kGenerating,
                     Status::kVerifying,
                     Status::kVerified,
                     Status::kFailed,
                     Status::kDeployed,
                     Status::kDeprecated}) {
        if (status_name(s) == text) {
            return s;
        }
    }
    return std::nullopt;
}

bool is_terminal(Status status) noexcept
{
    return status == Status::kDeployed || status == Status::kFailed
           || status == Status::kDeprecated;
}

bool can_transition(Status from, Status to) noexcept
{
    if (to == Status::kDeprecated) {
        return !is_terminal(from);
    }
    return std::ranges::any_of(kEdges,
                               [&](const Edge& e) noexcept { return e.from == from && e.to == to; });
}

axiom::VoidResult transition(IvcuRecord& record, Status to)
{
    if (!can_transition(record.status, to)) {
        return std::unexpected(Error::make(errc::kValidation,
                                           std::format("IVCU {} cannot move from {} to {}",
                                                       record.id,
                                                       status_name(record.status),
                                                       status_name(to))));
    }
    if (to == Status::kVerified || to == Status::kFailed) {
        return std::unexpected(Error::make(
            errc::kValidation, "verified and failed are reached through complete_verification"));
    }
    record.status = to;
    return {};
}

axiom::Result<double> aggregate_confidence(std::span<const VerifierResult> results)
{
    if (results.empty()) {
        return 0.0;
    }
    double sum = 0.0;
    for (const auto& r : results) {
        if (!valid_confidence(r.confidence)) {
            return std::unexpected(Error::make(
                errc::kValidation,
                std::format("verifier {} reported confidence {} outside [0, 1]", r.name, r.confidence)));
        }
        sum += r.confidence;
    }
    return sum / static_cast<double>(results.size());
}

axiom::Result<Status> complete_verification(IvcuRecord& record,
                                            std::span<const VerifierResult> results,
                                            const VerificationPolicy& policy)
{
    if (record.status != Status::kVerifying) {
        return std::unexpected(
            Error::make(errc::kValidation,
                        std::format("IVCU {} is {}, verification can only complete from verifying",
                                    record.id,
                                    status_name(record.status))));
    }
    auto confidence = aggregate_confidence(results);
    if (!confidence) {
        return std::unexpected(confidence.error());
    }

    const bool all_passed = !results.empty()
                            && std::ranges::all_of(results, &VerifierResult::passed);
    const Status outcome = all_passed && *confidence >= policy.confidence_threshold
                               ? Status::kVerified
                               : Status::kFailed;
    record.confidence_score = *confidence;
    record.status = outcome;
    return outcome;
}

axiom::Result<IvcuRecord> IvcuRegistry::create(const std::string& project_id)
{
    if (project_id.empty()) {
        return std::unexpected(Error::make(errc::kValidation, "IVCU requires a project id"));
    }
    auto id = common::random_uuid();
    if (!id) {
        return std::unexpected(id.error());
    }
    IvcuRecord record{.id = *id, .project_id = project_id};

    std::lock_guard lock(m_mutex);
    m_records.emplace(record.id, record);
    return record;
}

axiom::VoidResult IvcuRegistry::adopt(IvcuRecord record)
{
    if (record.id.empty() || record.version < 1 || !valid_confidence(record.confidence_score)) {
        return std::unexpected(
            Error::make(errc::kValidation, "Adopted IVCU record is malformed: " + record.id));
    }
    auto id = record.id;
    std::lock_guard lock(m_mutex);
    auto [it, inserted] = m_records.try_emplace(id, std::move(record));
    if (!inserted) {
        return std::unexpected(Error::make(errc::kConflict, "IVCU already registered: " + id));
    }
    for (const auto& parent : it->second.parent_ids) {
        m_successor_of.try_emplace(parent, it->first);
    }
    return {};
}

axiom::Result<IvcuRecord> IvcuRegistry::get(const std::string& id) const
{
    std::lock_guard lock(m_mutex);
    auto it = m_records.find(id);
    if (it == m_records.end()) {
        return std::unexpected(Error::make(errc::kNotFound, "IVCU not found: " + id));
    }
    return it->second;
}

axiom::Result<IvcuRecord> IvcuRegistry::transition(const std::string& id, Status to)
{
    std::lock_guard lock(m_mutex);
    auto it = m_records.find(id);
    if (it == m_records.end()) {
        return std::unexpected(Error::make(errc::kNotFound, "IVCU not found: " + id));
    }
    if (auto result = ivcu::transition(it->second, to); !result) {
        return std::unexpected(result.error());
    }
    return it->second;
}

axiom::Result<IvcuRecord> IvcuRegistry::complete_verification(
    const std::string& id,
    std::span<const VerifierResult> results,
    const VerificationPolicy& policy)
{
    std::lock_guard lock(m_mutex);
    auto it = m_records.find(id);
    if (it == m_records.end()) {
        return std::unexpected(Error::make(errc::kNotFound, "IVCU not found: " + id));
    }
    if (auto status = ivcu::complete_verification(it->second, results, policy); !status) {
        return std::unexpected(status.error());
    }
    return it->second;
}

axiom::VoidResult IvcuRegistry::replace(const IvcuRecord& record, Status expected)
{
    std::lock_guard lock(m_mutex);
    auto it = m_records.find(record.id);
    if (it == m_records.end()) {
        return std::unexpected(Error::make(errc::kNotFound, "IVCU not found: " + record.id));
    }
    if (it->second.status != expected) {
        return std::unexpected(Error::make(errc::kConflict,
                                           std::format("IVCU {} is {}, expected {}",
                                                       record.id,
                                                       status_name(it->second.status),
                                                       status_name(expected))));
    }
    it->second = record;
    return {};
}

axiom::Result<IvcuRecord> IvcuRegistry::retry(const std::string& failed_id)
{
    std::lock_guard lock(m_mutex);
    auto it = m_records.find(failed_id);
    if (it == m_records.end()) {
        return std::unexpected(Error::make(errc::kNotFound, "IVCU not found: " + failed_id));
    }
    if (it->second.status != Status::kFailed) {
        return std::unexpected(Error::make(errc::kValidation,
                                           std::format("Only failed IVCUs can be retried; {} is {}",
                                                       failed_id,
                                                       status_name(it->second.status))));
    }
    return make_successor_locked(it->second);
}

axiom::Result<IvcuRecord> IvcuRegistry::supersede(const std::string& id)
{
    std::lock_guard lock(m_mutex);
    auto it = m_records.find(id);
    if (it == m_records.end()) {
        return std::unexpected(Error::make(errc::kNotFound, "IVCU not found: " + id));
    }
    IvcuRecord& old_record = it->second;
    if (!can_transition(old_record.status, Status::kDeprecated)) {
        return std::unexpected(Error::make(
            errc::kValidation,
            std::format("IVCU {} is {} and cannot be superseded", id, status_name(old_record.status))));
    }
    auto successor = make_successor_locked(old_record);
    if (!successor) {
        return successor;
    }
    old_record.status = Status::kDeprecated;
    return successor;
}

axiom::Result<std::vector<std::string>> IvcuRegistry::lineage(const std::string& id) const
{
    std::lock_guard lock(m_mutex);
    auto it = m_records.find(id);
    if (it == m_records.end()) {
        return std::unexpected(Error::make(errc::kNotFound, "IVCU not found: " + id));
    }

    std::vector<std::string> ancestors;
    std::set<std::string, std::less<>> seen{id};
    std::deque<std::string> frontier(it->second.parent_ids.begin(), it->second.parent_ids.end());
    while (!frontier.empty()) {
        std::string current = std::move(frontier.front());
        frontier.pop_front();
        if (!seen.insert(current).second) {
            continue;
        }
        ancestors.push_back(current);
        if (auto parent = m_records.find(current); parent != m_records.end()) {
            frontier.insert(frontier.end(),
                            parent->second.parent_ids.begin(),
                            parent->second.parent_ids.end());
        }
    }
    return ancestors;
}

std::size_t IvcuRegistry::size() const
{
    std::lock_guard lock(m_mutex);
    return m_records.size();
}

axiom::Result<IvcuRecord> IvcuRegistry::make_successor_locked(const IvcuRecord& parent)
{
    if (auto existing = m_successor_of.find(parent.id); existing != m_successor_of.end()) {
        return std::unexpected(Error::make(
            errc::kConflict,
            std::format("IVCU {} already has successor {}", parent.id, existing->second)));
    }
    auto id = common::random_uuid();
    if (!id) {
        return std::unexpected(id.error());
    }
    IvcuRecord successor{.id = *id,
                         .project_id = parent.project_id,
                         .version = parent.version + 1,
                         .status = Status::kDraft,
                         .confidence_score = 0.0,
                         .parent_ids = {parent.id}};
    m_successor_of.emplace(parent.id, successor.id);
    m_records.emplace(successor.id, successor);
    return successor;
}

}  // namespace axiom::ivcu
