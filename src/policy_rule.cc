/*
 * policy_rule.cc -- ABAC policy rules
 *
 * Copyright (C) 2026 The Clearance developers
 *
 * This file is part of the Clearance library libclearance. Please see README
 * for terms of use.
 */

#include "clearance/policy_rule.hh"

namespace clearance {

std::optional<Effect>
parse_effect(const std::string &s) {
  if (s == "allow")
    return Effect::Allow;
  if (s == "deny")
    return Effect::Deny;
  return std::nullopt;
}

const char *
to_string(Effect e) {
  return e == Effect::Allow ? "allow" : "deny";
}

void
PolicyUpdate::apply(PolicyRule &rule) const {
  if (name)
    rule.name = *name;
  if (effect)
    rule.effect = *effect;
  if (conditions)
    rule.conditions = *conditions;
  if (actions)
    rule.actions = *actions;
  if (resources)
    rule.resources = *resources;
  if (priority)
    rule.priority = *priority;
  if (enabled)
    rule.enabled = *enabled;
}

PolicyRules
default_policies(void) {
  PolicyRules rules;

  /* The right-hand sides below are literal strings, not references
   * to other attributes. */
  PolicyRule owner_edit;
  owner_edit.id = "claim-owner-edit";
  owner_edit.name = "Claim Owner Edit Policy";
  owner_edit.effect = Effect::Allow;
  owner_edit.conditions = {
    Condition::equals("resource.owner_id", "user.id"),
    Condition::equals("action", "claim:edit")
  };
  owner_edit.actions = { "claim:edit" };
  owner_edit.resources = { "claim/*" };
  owner_edit.priority = 100;
  rules.push_back(std::move(owner_edit));

  PolicyRule regional;
  regional.id = "regional-data-access";
  regional.name = "Regional Data Access Policy";
  regional.effect = Effect::Allow;
  regional.conditions = {
    Condition::equals("user.region", "resource.region"),
    Condition::member_of("action", { "claim:view", "member:view" })
  };
  regional.actions = { "claim:view", "member:view" };
  regional.resources = { "claim/*", "member/*" };
  regional.priority = 90;
  rules.push_back(std::move(regional));

  PolicyRule business_hours;
  business_hours.id = "business-hours-access";
  business_hours.name = "Business Hours Access Policy";
  business_hours.effect = Effect::Allow;
  business_hours.conditions = {
    Condition::where("context.hour", { { Operator::gte, 9 },
                                       { Operator::lte, 17 } }),
    Condition::where("context.day_of_week",
                     { { Operator::in, Value{ 1, 2, 3, 4, 5 } } }),
    Condition::where("user.role", { { Operator::ne, "admin" } })
  };
  business_hours.actions = { ANY_ACTION };
  business_hours.resources = { "*" };
  business_hours.priority = 50;
  rules.push_back(std::move(business_hours));

  PolicyRule compliance;
  compliance.id = "compliance-data-access";
  compliance.name = "Compliance Data Access Policy";
  compliance.effect = Effect::Allow;
  compliance.conditions = {
    Condition::equals("resource.data_classification", "compliance"),
    Condition::equals("user.compliance_access", true),
    Condition::where("user.role", { { Operator::in, Value{ "auditor", "admin" } } })
  };
  compliance.actions = { "claim:view", "member:view", "policy:view" };
  compliance.resources = { "*" };
  compliance.priority = 200;
  rules.push_back(std::move(compliance));

  return rules;
}

} /* namespace clearance */
