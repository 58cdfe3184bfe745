/*
 * policy_engine.cc -- two-phase RBAC/ABAC policy decision
 *
 * Copyright (C) 2026 The Clearance developers
 *
 * This file is part of the Clearance library libclearance. Please see README
 * for terms of use.
 */

#include <algorithm>
#include <ctime>
#include <mutex>

#include "clearance/debug.hh"
#include "clearance/policy_engine.hh"

namespace clearance {

PolicyEngine::PolicyEngine(const RoleAuthority &auth)
  : authority(auth),
    rules(std::make_shared<const PolicyRules>()),
    clock([] { return std::chrono::system_clock::now(); }) {
}

PolicyEngine::Snapshot
PolicyEngine::snapshot(void) const {
  std::shared_lock<std::shared_mutex> guard(lock);
  return rules;
}

/* Sorts @p next by descending priority and makes it the active rule
 * set. The caller must hold the exclusive lock. */
void
PolicyEngine::install(PolicyRules next) {
  std::stable_sort(next.begin(), next.end(),
                   [](const PolicyRule &a, const PolicyRule &b) {
                     return a.priority > b.priority;
                   });
  rules = std::make_shared<const PolicyRules>(std::move(next));
}

Attributes
PolicyEngine::default_context(void) const {
  Clock now;
  {
    std::shared_lock<std::shared_mutex> guard(lock);
    now = clock;
  }

  const std::time_t t = std::chrono::system_clock::to_time_t(now());
  struct tm tm;
  gmtime_r(&t, &tm);

  return Attributes{
    { "hour", tm.tm_hour },
    { "day_of_week", (tm.tm_wday + 6) % 7 },
    { "timestamp", static_cast<long long>(t) }
  };
}

bool
PolicyEngine::evaluate(const Attributes &user, const Attributes &resource,
                       const std::string &action,
                       const std::optional<Attributes> &context) const {
  return decide(user, resource, action, context).allowed;
}

Decision
PolicyEngine::decide(const Attributes &user, const Attributes &resource,
                     const std::string &action,
                     const std::optional<Attributes> &context) const {
  Decision decision;
  Attributes synthesized;
  if (!context)
    synthesized = default_context();
  const Attributes &ctx_attrs = context ? *context : synthesized;

  /* coarse RBAC gate */
  const Roles roles = roles_from_value(lookup(user, "roles"));
  const Permission permission = parse_permission(action);
  if (permission == Permission::unknown) {
    decision.reason = "unknown permission " + action;
  } else if (!authority.has_permission(roles, permission)) {
    decision.reason = "roles do not carry " + action;
  }
  if (!decision.reason.empty()) {
    log(CLEARANCE_LOG_DEBUG, "deny %s: %s\n", action.c_str(),
        decision.reason.c_str());
    return decision;
  }

  /* the snapshot is ordered by priority already */
  const Snapshot current = snapshot();
  const EvaluationContext ctx{user, resource, ctx_attrs, action};

  for (const auto &rule : *current) {
    if (!rule.enabled || !rule.applies_to(action))
      continue;

    if (evaluate_conditions(rule.conditions, ctx)) {
      decision.allowed = rule.effect == Effect::Allow;
      decision.rule_id = rule.id;
      decision.reason = std::string("matched ") + to_string(rule.effect)
        + " rule " + rule.id;
      log(CLEARANCE_LOG_DEBUG, "%s %s: rule %s (priority %d)\n",
          decision.allowed ? "allow" : "deny", action.c_str(),
          rule.id.c_str(), rule.priority);
      return decision;
    }
  }

  decision.reason = "no rule matched";
  log(CLEARANCE_LOG_DEBUG, "deny %s: no rule matched\n", action.c_str());
  return decision;
}

void
PolicyEngine::add_policy(PolicyRule rule) {
  std::unique_lock<std::shared_mutex> guard(lock);
  PolicyRules next(*rules);

  /* a replaced rule keeps its position among rules of equal priority */
  auto old = std::find_if(next.begin(), next.end(),
                          [&rule](const PolicyRule &r) { return r.id == rule.id; });
  if (old != next.end()) {
    log(CLEARANCE_LOG_NOTICE, "replace rule %s\n", rule.id.c_str());
    *old = std::move(rule);
  } else {
    log(CLEARANCE_LOG_INFO, "add rule %s (%s, priority %d)\n",
        rule.id.c_str(), to_string(rule.effect), rule.priority);
    next.push_back(std::move(rule));
  }

  install(std::move(next));
}

void
PolicyEngine::remove_policy(const std::string &id) {
  std::unique_lock<std::shared_mutex> guard(lock);
  PolicyRules next(*rules);

  auto old = std::remove_if(next.begin(), next.end(),
                            [&id](const PolicyRule &r) { return r.id == id; });
  if (old == next.end()) {
    log(CLEARANCE_LOG_DEBUG, "remove: no rule %s\n", id.c_str());
    return;
  }

  log(CLEARANCE_LOG_INFO, "remove rule %s\n", id.c_str());
  next.erase(old, next.end());
  install(std::move(next));
}

result_t
PolicyEngine::update_policy(const std::string &id, const PolicyUpdate &update) {
  std::unique_lock<std::shared_mutex> guard(lock);
  PolicyRules next(*rules);

  auto rule = std::find_if(next.begin(), next.end(),
                           [&id](const PolicyRule &r) { return r.id == id; });
  if (rule == next.end()) {
    log(CLEARANCE_LOG_WARNING, "update: no rule %s\n", id.c_str());
    return CLEARANCE_ERROR_NOT_FOUND;
  }

  log(CLEARANCE_LOG_INFO, "update rule %s\n", id.c_str());
  update.apply(*rule);
  install(std::move(next));
  return CLEARANCE_OK;
}

void
PolicyEngine::replace_policies(PolicyRules rules_in) {
  PolicyRules next;
  next.reserve(rules_in.size());

  /* a later rule replaces an earlier one with the same id */
  for (auto &rule : rules_in) {
    auto old = std::find_if(next.begin(), next.end(),
                            [&rule](const PolicyRule &r) { return r.id == rule.id; });
    if (old != next.end()) {
      log(CLEARANCE_LOG_WARNING, "duplicate rule %s, using last definition\n",
          rule.id.c_str());
      next.erase(old);
    }
    next.push_back(std::move(rule));
  }

  log(CLEARANCE_LOG_INFO, "install %zu rules\n", next.size());

  std::unique_lock<std::shared_mutex> guard(lock);
  install(std::move(next));
}

PolicyRules
PolicyEngine::policies(void) const {
  return *snapshot();
}

std::optional<PolicyRule>
PolicyEngine::find_policy(const std::string &id) const {
  const Snapshot current = snapshot();
  auto rule = std::find_if(current->begin(), current->end(),
                           [&id](const PolicyRule &r) { return r.id == id; });
  if (rule == current->end())
    return std::nullopt;
  return *rule;
}

size_t
PolicyEngine::policy_count(void) const {
  return snapshot()->size();
}

void
PolicyEngine::set_clock(Clock c) {
  std::unique_lock<std::shared_mutex> guard(lock);
  clock = std::move(c);
}

} /* namespace clearance */
