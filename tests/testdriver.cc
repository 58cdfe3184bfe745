/*
 * testdriver.cc -- Clearance unit tests
 *
 * Copyright (C) 2026 The Clearance developers
 *
 * This file is part of the Clearance library libclearance. Please see README
 * for terms of use.
 */

#define CATCH_CONFIG_RUNNER
#include <catch2/catch.hpp>
#include "test.hh"

using namespace clearance;

/* 2024-01-01T00:00:00Z was a Monday. */
static constexpr std::time_t first_monday = 1704067200;

PolicyEngine::Clock
fixed_clock(int day_of_week, int hour) {
  const std::time_t t = first_monday + day_of_week * 86400 + hour * 3600;
  return [t] { return std::chrono::system_clock::from_time_t(t); };
}

json_ptr
parse_json(const std::string &text) {
  json_error_t error;
  json_ptr j{json_loads(text.c_str(), 0, &error)};
  INFO(error.text);
  REQUIRE(j != nullptr);
  return j;
}

PolicyRule
make_rule(const std::string &id, Effect effect, int priority,
          std::set<std::string> actions) {
  PolicyRule rule;
  rule.id = id;
  rule.name = id;
  rule.effect = effect;
  rule.priority = priority;
  rule.actions = std::move(actions);
  return rule;
}

void test_log_off(void) {
  set_log_level(CLEARANCE_LOG_EMERG);
}

void test_log_on(void) {
  set_log_level(CLEARANCE_LOG_WARNING);
}

int main(int argc, char* argv[]) {
  /* many tests provoke warnings on purpose */
  test_log_off();
  int result = Catch::Session().run( argc, argv );

  return result;
}
