/*
 * test.hh -- common declarations for Clearance unit tests
 *
 * Copyright (C) 2026 The Clearance developers
 *
 * This file is part of the Clearance library libclearance. Please see README
 * for terms of use.
 */

#ifndef TEST_HH_
#define TEST_HH_

#include <chrono>
#include <ctime>
#include <set>
#include <string>

#include "clearance/clearance.hh"
#include "clearance/rules_json.hh"

void test_log_off(void);
void test_log_on(void);

/**
 * Returns a clock that always reports the given @p hour (UTC) of the
 * day @p day_of_week, where Monday is 0.
 */
clearance::PolicyEngine::Clock fixed_clock(int day_of_week, int hour);

/* Parses @p text as JSON. Fails the current test on syntax errors. */
clearance::json_ptr parse_json(const std::string &text);

/* A rule for @p actions without conditions. */
clearance::PolicyRule make_rule(const std::string &id, clearance::Effect effect,
                                int priority,
                                std::set<std::string> actions = { "*" });

#endif /* TEST_HH_ */
