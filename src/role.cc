/*
 * role.cc -- roles and permissions known to the Clearance library
 *
 * Copyright (C) 2026 The Clearance developers
 *
 * This file is part of the Clearance library libclearance. Please see README
 * for terms of use.
 */

#include "clearance/role.hh"

namespace clearance {

static const char *roleNames[] = {
  "super_admin", "admin", "user", "viewer", "auditor"
};

/* must follow the order of enum class Permission */
static const char *permissionNames[] = {
  "claim:view", "claim:create", "claim:edit", "claim:delete", "claim:approve",
  "member:view", "member:create", "member:edit", "member:delete",
  "policy:view", "policy:create", "policy:edit", "policy:delete",
  "admin:view", "admin:manage_users", "admin:manage_roles",
  "admin:view_audit", "admin:system_config",
  "analytics:view", "analytics:export"
};

static_assert(sizeof(roleNames)/sizeof(roleNames[0])
              == static_cast<size_t>(Role::unknown),
              "role name table out of sync");
static_assert(sizeof(permissionNames)/sizeof(permissionNames[0])
              == static_cast<size_t>(Permission::unknown),
              "permission name table out of sync");

const Roles &
all_roles(void) {
  static const Roles roles = [] {
    Roles r;
    for (size_t idx = 0; idx < static_cast<size_t>(Role::unknown); idx++) {
      r.push_back(static_cast<Role>(idx));
    }
    return r;
  }();
  return roles;
}

const PermissionSet &
all_permissions(void) {
  static const PermissionSet permissions = [] {
    PermissionSet p;
    for (size_t idx = 0; idx < static_cast<size_t>(Permission::unknown); idx++) {
      p.insert(static_cast<Permission>(idx));
    }
    return p;
  }();
  return permissions;
}

Role
parse_role(const std::string &s) {
  for (size_t idx = 0; idx < sizeof(roleNames)/sizeof(roleNames[0]); idx++) {
    if (s == roleNames[idx]) {
      return static_cast<Role>(idx);
    }
  }
  return Role::unknown;
}

Permission
parse_permission(const std::string &s) {
  for (size_t idx = 0; idx < sizeof(permissionNames)/sizeof(permissionNames[0]); idx++) {
    if (s == permissionNames[idx]) {
      return static_cast<Permission>(idx);
    }
  }
  return Permission::unknown;
}

const char *
to_string(Role role) {
  return role < Role::unknown ? roleNames[static_cast<size_t>(role)] : "unknown";
}

const char *
to_string(Permission permission) {
  return permission < Permission::unknown
    ? permissionNames[static_cast<size_t>(permission)] : "unknown";
}

Roles
roles_from_value(const Value &roles) {
  Roles result;
  if (!roles.is_list())
    return result;

  for (const auto &elem : roles.as_list()) {
    if (elem.is_string()) {
      Role r = parse_role(elem.as_string());
      if (r != Role::unknown) {
        result.push_back(r);
      }
    }
  }
  return result;
}

} /* namespace clearance */
