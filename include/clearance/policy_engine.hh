/*
 * policy_engine.hh -- two-phase RBAC/ABAC policy decision
 *
 * Copyright (C) 2026 The Clearance developers
 *
 * This file is part of the Clearance library libclearance. Please see README
 * for terms of use.
 */

#ifndef _CLEARANCE_POLICY_ENGINE_HH_
#define _CLEARANCE_POLICY_ENGINE_HH_ 1

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>

#include "clearance/clearance.hh"
#include "clearance/policy_rule.hh"
#include "clearance/role_authority.hh"

namespace clearance {

/** The outcome of PolicyEngine::decide(). */
struct Decision {
  bool allowed = false;
  std::string rule_id;          /**< the matching rule, empty if none */
  std::string reason;
};

/**
 * Evaluates access requests in two phases. The RBAC gate checks
 * whether the subject's roles carry the permission named by the
 * requested action. Only if it passes, the ABAC rules that apply to
 * the action are tried in order of descending priority; the first
 * enabled rule whose conditions hold decides. Everything else is a
 * deny.
 *
 * evaluate() and decide() may be called from any number of threads
 * while rules are added, updated or removed. Each evaluation works on
 * an immutable snapshot of the rule list.
 */
class PolicyEngine {
public:
  using Clock = std::function<std::chrono::system_clock::time_point(void)>;

  /**
   * Creates an engine without rules that uses @p authority for the
   * RBAC gate. @p authority must outlive the engine.
   */
  explicit PolicyEngine(const RoleAuthority &authority);
  PolicyEngine(const PolicyEngine &) = delete;
  PolicyEngine &operator=(const PolicyEngine &) = delete;

  /**
   * Returns @c true if @p action is allowed for the subject described
   * by @p user on the resource described by @p resource. The
   * subject's roles are read from the list @p user["roles"]. If
   * @p context is not given, it is filled with the current "hour",
   * "day_of_week" (Monday is 0) and "timestamp" (Unix time, UTC).
   */
  bool evaluate(const Attributes &user, const Attributes &resource,
                const std::string &action,
                const std::optional<Attributes> &context = std::nullopt) const;

  /** Like evaluate() but reports which rule decided and why. */
  Decision decide(const Attributes &user, const Attributes &resource,
                  const std::string &action,
                  const std::optional<Attributes> &context = std::nullopt) const;

  /**
   * Adds @p rule to the rule set. A rule with the same id is
   * replaced.
   */
  void add_policy(PolicyRule rule);

  /** Removes the rule @p id. Unknown ids are ignored. */
  void remove_policy(const std::string &id);

  /**
   * Applies @p update to the rule @p id.
   *
   * @return CLEARANCE_OK on success, CLEARANCE_ERROR_NOT_FOUND if
   *         there is no rule @p id.
   */
  result_t update_policy(const std::string &id, const PolicyUpdate &update);

  /** Replaces the whole rule set with @p rules. */
  void replace_policies(PolicyRules rules);

  /** The current rules in evaluation order. */
  PolicyRules policies(void) const;

  std::optional<PolicyRule> find_policy(const std::string &id) const;

  size_t policy_count(void) const;

  /** Sets the time source for synthesized contexts. */
  void set_clock(Clock clock);

  /** Builds the context used when evaluate() is called without one. */
  Attributes default_context(void) const;

private:
  using Snapshot = std::shared_ptr<const PolicyRules>;

  const RoleAuthority &authority;

  /* guards rules and clock; evaluations only hold it to copy */
  mutable std::shared_mutex lock;
  Snapshot rules;
  Clock clock;

  Snapshot snapshot(void) const;
  void install(PolicyRules next);
};

} /* namespace clearance */

#endif /* _CLEARANCE_POLICY_ENGINE_HH_ */
