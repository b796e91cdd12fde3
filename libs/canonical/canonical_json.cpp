/**
 * @file canonical_json.cpp
 * @brief Canonical JSON serialization
 */

#include "axiom/canonical_json.hpp"

#include <algorithm>
#include <format>
#include <string_view>
#include <ranges>
#include <vector>

namespace axiom::canonical {

namespace {

[[nodiscard]] Error float_error(std::string_view path)
{
    return Error::make(errc::kValidation,
                       std::format("Floating point numbers not allowed in canonical JSON at: {}", path));
}

/**
 * @brief Copy j with object keys in byte order, rejecting floats on the way
 */
[[nodiscard]] axiom::Result<nlohmann::json> canonical_copy(const nlohmann::json& j, const std::string& path)
{
    switch (j.type()) {
        case nlohmann::json::value_t::number_float:
            return std::unexpected(float_error(path));
        case nlohmann::json::value_t::object: {
            std::vector<std::string_view> keys;
            keys.reserve(j.size());
            for (const auto& [key, _] : j.items()) {
                keys.emplace_back(key);
            }
            std::ranges::sort(keys);

            nlohmann::json out = nlohmann::json::object();
            for (std::string_view key : keys) {
                const std::string name(key);
                auto member = canonical_copy(j.at(name), std::format("{}.{}", path, name));
                if (!member) {
                    return member;
                }
                out.emplace(name, std::move(*member));
            }
            return out;
        }
        case nlohmann::json::value_t::array: {
            nlohmann::json out = nlohmann::json::array();
            for (auto [i, elem] : std::views::enumerate(j)) {
                auto item = canonical_copy(elem, std::format("{}[{}]", path, i));
                if (!item) {
                    return item;
                }
                out.push_back(std::move(*item));
            }
            return out;
        }
        default:
            return j;
    }
}

}  // namespace

axiom::Result<std::string> canonicalize(const nlohmann::json& j)
{
    auto sorted = canonical_copy(j, "$");
    if (!sorted) {
        return std::unexpected(sorted.error());
    }
    try {
        return sorted->dump(-1, ' ', false, nlohmann::json::error_handler_t::strict);
    } catch (const nlohmann::json::exception& ex) {
        // strict handler rejects invalid UTF-8
        return std::unexpected(
            Error::make(errc::kValidation, std::string("Cannot canonicalize JSON: ") + ex.what()));
    }
}

axiom::Result<std::string> hash_canonical(const nlohmann::json& j)
{
    auto canonical = canonicalize(j);
    if (!canonical) {
        return std::unexpected(canonical.error());
    }
    return common::sha256_prefixed(*canonical);
}

axiom::Result<std::string> digest_canonical(const nlohmann::json& j)
{
    auto canonical = canonicalize(j);
    if (!canonical) {
        return std::unexpected(canonical.error());
    }
    return common::sha256(*canonical);
}

axiom::VoidResult validate_for_canonical(const nlohmann::json& j)
{
    if (auto sorted = canonical_copy(j, "$"); !sorted) {
        return std::unexpected(sorted.error());
    }
    return {};
}

}  // namespace axiom::canonical
