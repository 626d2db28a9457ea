#include <collab-cpp/access.hpp>

namespace collab_cpp {

AccessControlTable::AccessControlTable(const UserId& owner)
    : owner_{owner} {
    entries_[owner] = Role::owner;
}

void AccessControlTable::grant(const UserId& user, Role role) {
    entries_[user] = role;
}

auto AccessControlTable::role_of(const UserId& user) const -> std::optional<Role> {
    auto it = entries_.find(user);
    if (it == entries_.end()) return std::nullopt;
    return it->second;
}

auto AccessControlTable::has_access(const UserId& user, Role required) const -> bool {
    auto role = role_of(user);
    return role && satisfies(*role, required);
}

}  // namespace collab_cpp
