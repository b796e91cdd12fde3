/**
 * @file authorizer.cpp
 * @brief Role tables and membership-based authorization
 */

#include "axiom/rbac.hpp"

#include <algorithm>
#include <array>
#include <format>

namespace axiom::rbac {

namespace {

constexpr std::array kRoles = {Role::kViewer, Role::kEditor, Role::kAdmin, Role::kOwner};

constexpr std::array kPermissions = {Permission::kProjectRead,
                                     Permission::kProjectEdit,
                                     Permission::kProjectDelete,
                                     Permission::kTeamManage,
                                     Permission::kCostView,
                                     Permission::kBudgetApprove};

constexpr std::array kViewerPermissions = {Permission::kProjectRead};

constexpr std::array kEditorPermissions = {Permission::kProjectRead,
                                           Permission::kProjectEdit,
                                           Permission::kCostView};

[[nodiscard]] Error forbidden(const std::string& project_id, std::string_view detail)
{
    return Error::make(errc::kAuthorization,
                       std::format("insufficient permissions on project {}: {}", project_id, detail));
}

}  // namespace

std::string_view role_name(Role role) noexcept
{
    switch (role) {
        case Role::kViewer:
            return "viewer";
        case Role::kEditor:
            return "editor";
        case Role::kAdmin:
            return "admin";
        case Role::kOwner:
            return "owner";
    }
    return "unknown";
}

std::optional<Role> role_from_string(std::string_view text) noexcept
{
    for (Role role : kRoles) {
        if (role_name(role) == text) {
            return role;
        }
    }
    return std::nullopt;
}

std::string_view permission_name(Permission permission) noexcept
{
    switch (permission) {
        case Permission::kProjectRead:
            return "project:read";
        case Permission::kProjectEdit:
            return "project:edit";
        case Permission::kProjectDelete:
            return "project:delete";
        case Permission::kTeamManage:
            return "team:manage";
        case Permission::kCostView:
            return "cost:view";
        case Permission::kBudgetApprove:
            return "budget:approve";
    }
    return "unknown";
}

std::optional<Permission> permission_from_string(std::string_view text) noexcept
{
    for (Permission permission : kPermissions) {
        if (permission_name(permission) == text) {
            return permission;
        }
    }
    return std::nullopt;
}

bool is_role_at_least(Role user, Role required) noexcept
{
    return static_cast<int>(user) >= static_cast<int>(required);
}

bool has_permission(Role role, Permission permission) noexcept
{
    switch (role) {
        case Role::kViewer:
            return std::ranges::find(kViewerPermissions, permission) != kViewerPermissions.end();
        case Role::kEditor:
            return std::ranges::find(kEditorPermissions, permission) != kEditorPermissions.end();
        case Role::kAdmin:
        case Role::kOwner:
            return true;
    }
    return false;
}

Authorizer::Authorizer(store::MembershipRepository& members, store::ProjectRepository& projects)
    : m_members(members)
    , m_projects(projects)
{}

axiom::Result<Role> Authorizer::resolve_role(const auth::Principal& principal,
                                             const std::string& project_id)
{
    auto membership = m_members.member_role(project_id, principal.id);
    if (!membership) {
        return std::unexpected(Error::make(errc::kPersistence,
                                           "membership lookup failed: " + membership.error().message));
    }
    if (membership->has_value()) {
        auto role = role_from_string(**membership);
        if (!role) {
            return std::unexpected(Error::make(
                errc::kPersistence,
                std::format("membership of {} on {} has unknown role {}", principal.id, project_id, **membership)));
        }
        return *role;
    }

    auto owner = m_projects.project_owner(project_id);
    if (!owner) {
        return std::unexpected(Error::make(errc::kPersistence,
                                           "project lookup failed: " + owner.error().message));
    }
    if (!owner->has_value()) {
        return std::unexpected(Error::make(errc::kNotFound, "project not found: " + project_id));
    }
    if (**owner == principal.id) {
        return Role::kOwner;
    }
    return std::unexpected(Error::make(
        errc::kAuthorization, std::format("access denied: {} is not a member of project {}", principal.id, project_id)));
}

axiom::Result<Role> Authorizer::authorize(const auth::Principal& principal,
                                          const std::string& project_id,
                                          Permission permission)
{
    auto role = resolve_role(principal, project_id);
    if (!role) {
        return role;
    }
    if (!has_permission(*role, permission)) {
        return std::unexpected(forbidden(
            project_id,
            std::format("role {} lacks {}", role_name(*role), permission_name(permission))));
    }
    return role;
}

axiom::Result<Role> Authorizer::require_role(const auth::Principal& principal,
                                             const std::string& project_id,
                                             Role required)
{
    auto role = resolve_role(principal, project_id);
    if (!role) {
        return role;
    }
    if (!is_role_at_least(*role, required)) {
        return std::unexpected(forbidden(
            project_id,
            std::format("role {} is below {}", role_name(*role), role_name(required))));
    }
    return role;
}

}  // namespace axiom::rbac
