/*
 * role_authority.cc -- role to permission mapping with inheritance
 *
 * Copyright (C) 2026 The Clearance developers
 *
 * This file is part of the Clearance library libclearance. Please see README
 * for terms of use.
 */

#include <algorithm>
#include <cctype>
#include <mutex>

#include "clearance/debug.hh"
#include "clearance/role_authority.hh"

namespace clearance {

RoleTable
default_role_table(void) {
  using P = Permission;
  RoleTable t;

  t[Role::super_admin] = { all_permissions(), {} };

  t[Role::admin] = {
    { P::claim_view, P::claim_create, P::claim_edit, P::claim_delete,
      P::claim_approve,
      P::member_view, P::member_create, P::member_edit, P::member_delete,
      P::policy_view, P::policy_create, P::policy_edit, P::policy_delete,
      P::admin_view, P::admin_manage_users,
      P::analytics_view, P::analytics_export },
    { Role::user, Role::viewer }
  };

  t[Role::user] = {
    { P::claim_view, P::claim_create, P::claim_edit,
      P::member_view, P::member_create, P::member_edit,
      P::policy_view, P::analytics_view },
    { Role::viewer }
  };

  t[Role::viewer] = {
    { P::claim_view, P::member_view, P::policy_view },
    {}
  };

  t[Role::auditor] = {
    { P::claim_view, P::member_view, P::policy_view,
      P::admin_view_audit, P::analytics_view },
    {}
  };

  return t;
}

RoleAuthority::RoleAuthority(void) : table(default_role_table()) {}

RoleAuthority::RoleAuthority(RoleTable t) : table(std::move(t)) {}

/* Adds the direct permissions of @p role to @p out. */
void
RoleAuthority::collect(Role role, PermissionSet &out) const {
  const auto &entry{table.find(role)};
  if (entry != table.end()) {
    out.insert(entry->second.permissions.begin(),
               entry->second.permissions.end());
  }
}

bool
RoleAuthority::has_permission(const Roles &roles, Permission permission) const {
  if (permission == Permission::unknown)
    return false;

  std::shared_lock<std::shared_mutex> guard(lock);
  for (Role role : roles) {
    const auto &entry{table.find(role)};
    if (entry == table.end())
      continue;

    if (entry->second.permissions.count(permission))
      return true;

    for (Role inherited : entry->second.inherited) {
      const auto &parent{table.find(inherited)};
      if (parent != table.end() && parent->second.permissions.count(permission))
        return true;
    }
  }
  return false;
}

PermissionSet
RoleAuthority::permission_closure(const Roles &roles) const {
  PermissionSet result;

  std::shared_lock<std::shared_mutex> guard(lock);
  for (Role role : roles) {
    const auto &entry{table.find(role)};
    if (entry == table.end())
      continue;

    collect(role, result);
    for (Role inherited : entry->second.inherited) {
      collect(inherited, result);
    }
  }
  return result;
}

bool
RoleAuthority::can_access(const Roles &roles, const std::string &resource_type,
                          const std::string &action) const {
  std::string name{resource_type + ":" + action};
  std::transform(name.begin(), name.end(), name.begin(),
                 [](unsigned char c) { return std::tolower(c); });

  Permission permission = parse_permission(name);
  if (permission == Permission::unknown) {
    log(CLEARANCE_LOG_DEBUG, "can_access: unknown permission %s\n", name.c_str());
    return false;
  }
  return has_permission(roles, permission);
}

RolePermissionSet
RoleAuthority::role_permissions(Role role) const {
  std::shared_lock<std::shared_mutex> guard(lock);
  const auto &entry{table.find(role)};
  return entry != table.end() ? entry->second : RolePermissionSet{};
}

bool
RoleAuthority::grant(Role role, Permission permission) {
  if (role == Role::unknown || permission == Permission::unknown)
    return false;

  log(CLEARANCE_LOG_INFO, "grant %s to role %s\n",
      to_string(permission), to_string(role));

  std::unique_lock<std::shared_mutex> guard(lock);
  table[role].permissions.insert(permission);
  return true;
}

bool
RoleAuthority::revoke(Role role, Permission permission) {
  std::unique_lock<std::shared_mutex> guard(lock);
  const auto &entry{table.find(role)};
  if (entry == table.end())
    return false;

  if (entry->second.permissions.erase(permission) == 0)
    return false;

  log(CLEARANCE_LOG_INFO, "revoked %s from role %s\n",
      to_string(permission), to_string(role));
  return true;
}

} /* namespace clearance */
