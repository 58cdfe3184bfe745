/*
 * test_role_authority.cc -- role to permission resolution
 *
 * Copyright (C) 2026 The Clearance developers
 *
 * This file is part of the Clearance library libclearance. Please see README
 * for terms of use.
 */

#include <catch2/catch.hpp>
#include "test.hh"

using namespace clearance;

SCENARIO( "Parse role and permission names", "[roles]" ) {
  GIVEN("the canonical names") {
    THEN("every role and permission round-trips through its name") {
      for (Role r : all_roles()) {
        REQUIRE(parse_role(to_string(r)) == r);
      }
      for (Permission p : all_permissions()) {
        REQUIRE(parse_permission(to_string(p)) == p);
      }
      REQUIRE(all_permissions().size() == 20);
    }
  }

  GIVEN("names that are not known") {
    THEN("parsing yields the unknown variants") {
      REQUIRE(parse_role("pilot") == Role::unknown);
      REQUIRE(parse_role("Admin") == Role::unknown);
      REQUIRE(parse_permission("claim:fly") == Permission::unknown);
      REQUIRE(parse_permission("claim") == Permission::unknown);
      REQUIRE(std::string(to_string(Permission::unknown)) == "unknown");
    }
  }

  GIVEN("a roles attribute with unknown entries") {
    const Value roles{ "admin", "pilot", 3, "auditor" };

    WHEN("the roles are extracted") {
      const Roles r = roles_from_value(roles);
      THEN("only the known role names remain") {
        REQUIRE(r == Roles{ Role::admin, Role::auditor });
      }
    }
    WHEN("the attribute is not a list") {
      THEN("there are no roles") {
        REQUIRE(roles_from_value(Value("admin")).empty());
        REQUIRE(roles_from_value(Value()).empty());
      }
    }
  }
}

SCENARIO( "Role hierarchy is resolved one level deep", "[roles]" ) {
  GIVEN("a three-level hierarchy admin -> user -> viewer") {
    RoleTable table;
    table[Role::viewer] = { { Permission::claim_view }, {} };
    table[Role::user] = { { Permission::claim_create }, { Role::viewer } };
    table[Role::admin] = { { Permission::admin_view }, { Role::user } };
    table[Role::auditor] = { {}, {} };
    RoleAuthority authority{table};

    THEN("direct permissions are granted") {
      REQUIRE(authority.has_permission({ Role::viewer }, Permission::claim_view));
      REQUIRE(authority.has_permission({ Role::admin }, Permission::admin_view));
    }
    THEN("permissions of an inherited role are granted") {
      REQUIRE(authority.has_permission({ Role::user }, Permission::claim_view));
      REQUIRE(authority.has_permission({ Role::admin }, Permission::claim_create));
    }
    THEN("permissions two levels up are not granted") {
      REQUIRE_FALSE(authority.has_permission({ Role::admin }, Permission::claim_view));
      REQUIRE(authority.permission_closure({ Role::admin })
              == PermissionSet{ Permission::admin_view, Permission::claim_create });
    }
    THEN("inheritance does not flow downwards") {
      REQUIRE_FALSE(authority.has_permission({ Role::viewer }, Permission::claim_create));
    }
    THEN("a role without permissions carries nothing") {
      for (Permission p : all_permissions()) {
        REQUIRE_FALSE(authority.has_permission({ Role::auditor }, p));
      }
      REQUIRE(authority.permission_closure({ Role::auditor }).empty());
    }
    THEN("roles missing from the table carry nothing") {
      REQUIRE_FALSE(authority.has_permission({ Role::super_admin }, Permission::claim_view));
      REQUIRE_FALSE(authority.has_permission({ Role::unknown }, Permission::claim_view));
      REQUIRE_FALSE(authority.has_permission({}, Permission::claim_view));
    }
    THEN("several roles are combined") {
      REQUIRE(authority.has_permission({ Role::auditor, Role::viewer },
                                       Permission::claim_view));
      REQUIRE(authority.permission_closure({ Role::viewer, Role::admin }).size() == 3);
    }
  }
}

SCENARIO( "Built-in role table", "[roles]" ) {
  GIVEN("the default authority") {
    RoleAuthority authority;

    THEN("super_admin holds every permission") {
      REQUIRE(authority.permission_closure({ Role::super_admin }) == all_permissions());
    }
    THEN("user reaches every permission of viewer") {
      for (Permission p : authority.role_permissions(Role::viewer).permissions) {
        REQUIRE(authority.has_permission({ Role::user }, p));
      }
    }
    THEN("admin reaches every permission of user and viewer") {
      for (Role inherited : { Role::user, Role::viewer }) {
        for (Permission p : authority.role_permissions(inherited).permissions) {
          REQUIRE(authority.has_permission({ Role::admin }, p));
        }
      }
    }
    THEN("administrative permissions stay with the privileged roles") {
      REQUIRE_FALSE(authority.has_permission({ Role::admin }, Permission::admin_system_config));
      REQUIRE_FALSE(authority.has_permission({ Role::user }, Permission::claim_approve));
      REQUIRE(authority.has_permission({ Role::auditor }, Permission::admin_view_audit));
      REQUIRE_FALSE(authority.has_permission({ Role::viewer }, Permission::analytics_view));
    }
    THEN("the unknown permission is never granted") {
      REQUIRE_FALSE(authority.has_permission({ Role::super_admin }, Permission::unknown));
    }
  }
}

SCENARIO( "Check access by resource type and action", "[roles]" ) {
  GIVEN("the default authority") {
    RoleAuthority authority;

    THEN("the permission name is assembled and compared in lower case") {
      REQUIRE(authority.can_access({ Role::viewer }, "claim", "view"));
      REQUIRE(authority.can_access({ Role::viewer }, "CLAIM", "View"));
      REQUIRE_FALSE(authority.can_access({ Role::viewer }, "claim", "edit"));
      REQUIRE(authority.can_access({ Role::admin }, "admin", "manage_users"));
    }
    THEN("unknown permissions are denied") {
      REQUIRE_FALSE(authority.can_access({ Role::super_admin }, "claim", "fly"));
      REQUIRE_FALSE(authority.can_access({ Role::super_admin }, "ship", "view"));
      REQUIRE_FALSE(authority.can_access({ Role::super_admin }, "", ""));
    }
  }
}

SCENARIO( "Grant and revoke permissions at runtime", "[roles]" ) {
  GIVEN("the default authority") {
    RoleAuthority authority;
    REQUIRE_FALSE(authority.has_permission({ Role::auditor }, Permission::analytics_export));

    WHEN("a permission is granted") {
      REQUIRE(authority.grant(Role::auditor, Permission::analytics_export));

      THEN("the role carries it") {
        REQUIRE(authority.has_permission({ Role::auditor }, Permission::analytics_export));
      }

      AND_WHEN("it is revoked again") {
        REQUIRE(authority.revoke(Role::auditor, Permission::analytics_export));

        THEN("the role no longer carries it") {
          REQUIRE_FALSE(authority.has_permission({ Role::auditor },
                                                 Permission::analytics_export));
          REQUIRE_FALSE(authority.revoke(Role::auditor, Permission::analytics_export));
        }
      }
    }

    WHEN("a permission of an inherited role is revoked") {
      REQUIRE(authority.revoke(Role::viewer, Permission::policy_view));

      THEN("roles that carry it themselves keep it") {
        REQUIRE_FALSE(authority.has_permission({ Role::viewer }, Permission::policy_view));
        REQUIRE(authority.has_permission({ Role::user }, Permission::policy_view));
      }
    }

    WHEN("unknown roles or permissions are granted") {
      THEN("the grant is refused") {
        REQUIRE_FALSE(authority.grant(Role::unknown, Permission::claim_view));
        REQUIRE_FALSE(authority.grant(Role::viewer, Permission::unknown));
      }
    }
  }
}
