/*
 * role.hh -- roles and permissions known to the Clearance library
 *
 * Copyright (C) 2026 The Clearance developers
 *
 * This file is part of the Clearance library libclearance. Please see README
 * for terms of use.
 */

#ifndef _CLEARANCE_ROLE_HH_
#define _CLEARANCE_ROLE_HH_ 1

#include <cstdint>
#include <set>
#include <string>
#include <vector>

#include "clearance/value.hh"

namespace clearance {

/** Identity categories a subject can be assigned to. */
enum class Role : uint8_t {
  super_admin,
  admin,
  user,
  viewer,
  auditor,
  unknown                       /**< result of parsing an unknown name */
};

/**
 * Capabilities scoped to a resource type and verb. The textual form
 * is "<resource>:<verb>".
 */
enum class Permission : uint8_t {
  claim_view,
  claim_create,
  claim_edit,
  claim_delete,
  claim_approve,

  member_view,
  member_create,
  member_edit,
  member_delete,

  policy_view,
  policy_create,
  policy_edit,
  policy_delete,

  admin_view,
  admin_manage_users,
  admin_manage_roles,
  admin_view_audit,
  admin_system_config,

  analytics_view,
  analytics_export,

  unknown                       /**< result of parsing an unknown name */
};

using Roles = std::vector<Role>;
using PermissionSet = std::set<Permission>;

/** All roles except Role::unknown. */
const Roles &all_roles(void);

/** All permissions except Permission::unknown. */
const PermissionSet &all_permissions(void);

/** Parses @p s. Never fails: unrecognized names yield Role::unknown. */
Role parse_role(const std::string &s);

/** Parses @p s. Never fails: unrecognized names yield Permission::unknown. */
Permission parse_permission(const std::string &s);

/* Canonical names; "unknown" for the unknown variants. */
const char *to_string(Role role);
const char *to_string(Permission permission);

/**
 * Extracts the known roles from the attribute @p roles which is
 * expected to be a list of role names. Elements that are not strings
 * or do not name a known role are dropped.
 */
Roles roles_from_value(const Value &roles);

} /* namespace clearance */

#endif /* _CLEARANCE_ROLE_HH_ */
