/*
 * role_authority.hh -- role to permission mapping with inheritance
 *
 * Copyright (C) 2026 The Clearance developers
 *
 * This file is part of the Clearance library libclearance. Please see README
 * for terms of use.
 */

#ifndef _CLEARANCE_ROLE_AUTHORITY_HH_
#define _CLEARANCE_ROLE_AUTHORITY_HH_ 1

#include <map>
#include <shared_mutex>
#include <string>

#include "clearance/role.hh"

namespace clearance {

/**
 * The permissions granted directly to a role and the roles it
 * inherits from.
 */
struct RolePermissionSet {
  PermissionSet permissions;
  Roles inherited;
};

using RoleTable = std::map<Role, RolePermissionSet>;

/** The built-in role table. */
RoleTable default_role_table(void);

/**
 * Answers permission questions for sets of roles.
 *
 * Inheritance is resolved at query time and is exactly one level
 * deep: a role carries its own permissions and the direct permissions
 * of the roles listed in its @c inherited field, but not what those
 * roles inherit in turn.
 */
class RoleAuthority {
public:
  RoleAuthority(void);
  explicit RoleAuthority(RoleTable table);
  RoleAuthority(const RoleAuthority &) = delete;
  RoleAuthority &operator=(const RoleAuthority &) = delete;

  /**
   * Returns @c true if any of @p roles carries @p permission either
   * directly or through one of its inherited roles. Unknown roles
   * carry nothing, Permission::unknown is never granted.
   */
  bool has_permission(const Roles &roles, Permission permission) const;

  /**
   * Returns the union of direct and inherited permissions of all
   * @p roles.
   */
  PermissionSet permission_closure(const Roles &roles) const;

  /**
   * Checks the permission "<resource_type>:<action>". The name is
   * compared in lower case. Returns @c false if the name does not
   * denote a known permission.
   */
  bool can_access(const Roles &roles, const std::string &resource_type,
                  const std::string &action) const;

  /** Returns a copy of the record for @p role (empty if none). */
  RolePermissionSet role_permissions(Role role) const;

  /**
   * Adds @p permission to the direct permissions of @p role. Returns
   * @c false if @p role or @p permission is unknown.
   */
  bool grant(Role role, Permission permission);

  /**
   * Removes @p permission from the direct permissions of @p role.
   * Returns @c true if the permission was present.
   */
  bool revoke(Role role, Permission permission);

private:
  mutable std::shared_mutex lock;
  RoleTable table;

  void collect(Role role, PermissionSet &out) const;
};

} /* namespace clearance */

#endif /* _CLEARANCE_ROLE_AUTHORITY_HH_ */
