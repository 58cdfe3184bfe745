/*
 * policy_rule.hh -- ABAC policy rules
 *
 * Copyright (C) 2026 The Clearance developers
 *
 * This file is part of the Clearance library libclearance. Please see README
 * for terms of use.
 */

#ifndef _CLEARANCE_POLICY_RULE_HH_
#define _CLEARANCE_POLICY_RULE_HH_ 1

#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "clearance/condition.hh"

namespace clearance {

enum class Effect : uint8_t { Allow, Deny };

/** Parses "allow" or "deny". */
std::optional<Effect> parse_effect(const std::string &s);
const char *to_string(Effect e);

/** Matches every action when listed in PolicyRule::actions. */
constexpr const char *ANY_ACTION = "*";

/**
 * One ABAC rule. A rule applies to a request if the requested action
 * is listed in @c actions (or @c actions contains "*"). It matches if
 * additionally all @c conditions hold.
 *
 * The resource patterns are kept with the rule but do not restrict
 * where it applies.
 */
struct PolicyRule {
  std::string id;
  std::string name;
  Effect effect = Effect::Deny;
  Conditions conditions;
  std::set<std::string> actions;
  std::set<std::string> resources;
  int priority = 0;
  bool enabled = true;

  /** Returns @c true if this rule applies to @p action. */
  bool applies_to(const std::string &action) const {
    return actions.count(ANY_ACTION) || actions.count(action);
  }
};

using PolicyRules = std::vector<PolicyRule>;

/**
 * A partial modification of a PolicyRule. Only the fields that are
 * set are applied. A rule's id cannot be changed.
 */
struct PolicyUpdate {
  std::optional<std::string> name;
  std::optional<Effect> effect;
  std::optional<Conditions> conditions;
  std::optional<std::set<std::string>> actions;
  std::optional<std::set<std::string>> resources;
  std::optional<int> priority;
  std::optional<bool> enabled;

  bool empty(void) const {
    return !name && !effect && !conditions && !actions && !resources
      && !priority && !enabled;
  }

  /** Applies the fields present in this update to @p rule. */
  void apply(PolicyRule &rule) const;
};

/**
 * The built-in rule set: claim owners may edit (100), regional
 * access (90), business hours for non-admins (50) and compliance data
 * for auditors and admins (200).
 */
PolicyRules default_policies(void);

} /* namespace clearance */

#endif /* _CLEARANCE_POLICY_RULE_HH_ */
