#pragma once

#include <chronicle/schema/permission.hpp>
#include <chronicle/schema/role.hpp>

#include <optional>
#include <span>
#include <string_view>

namespace chronicle::governor {

/// Fixed grant set of a role.
std::span<const chronicle::schema::permission_t> permissions_for(
    const chronicle::schema::role_t role);

bool has_permission(const chronicle::schema::role_t role,
                    const chronicle::schema::permission_t permission);

/// Permission a `{subject}.{action}` command needs, or std::nullopt for an
/// action the matrix does not know.
std::optional<chronicle::schema::permission_t> required_permission(
    const std::string_view subject,
    const std::string_view action);

/// Weakest role holding `permission`; used in denial reasons.
chronicle::schema::role_t minimum_role(
    const chronicle::schema::permission_t permission);

}  // namespace chronicle::governor
