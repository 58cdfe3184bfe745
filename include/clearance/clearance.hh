/*
 * clearance.hh -- main header file for the Clearance access-control library
 *
 * Copyright (C) 2026 The Clearance developers
 *
 * This file is part of the Clearance library libclearance. Please see README
 * for terms of use.
 */

#ifndef _CLEARANCE_CLEARANCE_HH_
#define _CLEARANCE_CLEARANCE_HH_ 1

namespace clearance {

typedef enum {
  CLEARANCE_OK,
  CLEARANCE_ERROR_INTERNAL_ERROR,
  CLEARANCE_ERROR_BAD_REQUEST     = 0x10,
  CLEARANCE_ERROR_NOT_FOUND       = 0x14
} result_t;

/** Returns a printable name for @p res. */
const char *result_name(result_t res);

} /* namespace clearance */

#include "clearance/libclearance.h"
#include "clearance/debug.hh"
#include "clearance/value.hh"
#include "clearance/role.hh"
#include "clearance/role_authority.hh"
#include "clearance/condition.hh"
#include "clearance/policy_rule.hh"
#include "clearance/policy_engine.hh"

#endif /* _CLEARANCE_CLEARANCE_HH_ */
