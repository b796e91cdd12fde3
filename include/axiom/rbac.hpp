#pragma once

/**
 * @file rbac.hpp
 * @brief Project-scoped role-based access control
 *
 * Role hierarchy: viewer < editor < admin < owner.
 * A project owner without an explicit membership row holds the owner role.
 */

#include "axiom/auth.hpp"
#include "axiom/common.hpp"
#include "axiom/store.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace axiom::rbac {

enum class Role { kViewer = 0, kEditor = 1, kAdmin = 2, kOwner = 3 };

enum class Permission {
    kProjectRead,
    kProjectEdit,
    kProjectDelete,
    kTeamManage,
    kCostView,
    kBudgetApprove,
};

[[nodiscard]] std::string_view role_name(Role role) noexcept;
[[nodiscard]] std::optional<Role> role_from_string(std::string_view text) noexcept;

/// "project:read", "project:edit", "project:delete", "team:manage", "cost:view", "budget:approve"
[[nodiscard]] std::string_view permission_name(Permission permission) noexcept;
[[nodiscard]] std::optional<Permission> permission_from_string(std::string_view text) noexcept;

[[nodiscard]] bool is_role_at_least(Role user, Role required) noexcept;
[[nodiscard]] bool has_permission(Role role, Permission permission) noexcept;

class Authorizer
{
public:
    Authorizer(store::MembershipRepository& members, store::ProjectRepository& projects);

    /**
     * Effective role of a principal on a project.
     * @return AuthorizationError when the principal is neither a member nor the owner,
     *         NotFoundError when the project does not exist, PersistenceError on store failure
     */
    [[nodiscard]] axiom::Result<Role> resolve_role(const auth::Principal& principal,
                                                   const std::string& project_id);

    /**
     * @return The effective role, AuthorizationError if it lacks permission
     */
    [[nodiscard]] axiom::Result<Role> authorize(const auth::Principal& principal,
                                                const std::string& project_id,
                                                Permission permission);

    /**
     * @return The effective role, AuthorizationError if it ranks below required
     */
    [[nodiscard]] axiom::Result<Role> require_role(const auth::Principal& principal,
                                                   const std::string& project_id,
                                                   Role required);

private:
    store::MembershipRepository& m_members;
    store::ProjectRepository& m_projects;
};

}  // namespace axiom::rbac
