/// @file access.hpp
/// @brief Access roles and the per-document AccessControlTable.

#pragma once

#include <collab-cpp/types.hpp>

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string_view>

namespace collab_cpp {

/// Access roles for a shared document, in increasing order of privilege.
///
/// The enumerator values form a total order: owner satisfies every
/// requirement, editor satisfies editor and viewer, viewer only viewer.
enum class Role : std::uint8_t {
    viewer = 0,  ///< May read and annotate.
    editor = 1,  ///< May also apply edits.
    owner = 2,   ///< Full control.
};

/// Convert a Role to its string representation.
constexpr auto to_string_view(Role role) noexcept -> std::string_view {
    switch (role) {
        case Role::viewer: return "viewer";
        case Role::editor: return "editor";
        case Role::owner:  return "owner";
    }
    return "unknown";
}

/// Parse a role name produced by to_string_view().
constexpr auto role_from_string(std::string_view name) noexcept -> std::optional<Role> {
    if (name == "viewer") return Role::viewer;
    if (name == "editor") return Role::editor;
    if (name == "owner") return Role::owner;
    return std::nullopt;
}

/// True if a user holding `granted` may do what `required` allows.
constexpr auto satisfies(Role granted, Role required) noexcept -> bool {
    return static_cast<std::uint8_t>(granted) >= static_cast<std::uint8_t>(required);
}

/// Map of user → role for a single document.
///
/// Pure data: no events, no logging. DocumentStore owns one table per
/// document and seeds it with the creator as owner.
///
/// Not thread-safe; see DocumentStore.
class AccessControlTable {
public:
    AccessControlTable() = default;

    /// Create a table whose only entry is `owner` with Role::owner.
    explicit AccessControlTable(const UserId& owner);

    /// Insert or overwrite the role of a user.
    void grant(const UserId& user, Role role);

    /// The role held by a user, or nullopt if the user has no entry.
    auto role_of(const UserId& user) const -> std::optional<Role>;

    /// False for users with no entry; otherwise satisfies(role, required).
    auto has_access(const UserId& user, Role required) const -> bool;

    /// The user the table was seeded with, if any.
    auto owner() const -> std::optional<UserId> { return owner_; }

    auto size() const -> std::size_t { return entries_.size(); }

    auto entries() const -> const std::map<UserId, Role>& { return entries_; }

private:
    std::map<UserId, Role> entries_;
    std::optional<UserId> owner_;
};

}  // namespace collab_cpp
