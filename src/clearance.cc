/*
 * clearance.cc -- common definitions for the Clearance library
 *
 * Copyright (C) 2026 The Clearance developers
 *
 * This file is part of the Clearance library libclearance. Please see README
 * for terms of use.
 */

#include "clearance/clearance.hh"

namespace clearance {

const char *
result_name(result_t res) {
  switch (res) {
  case CLEARANCE_OK: return "ok";
  case CLEARANCE_ERROR_INTERNAL_ERROR: return "internal error";
  case CLEARANCE_ERROR_BAD_REQUEST: return "bad request";
  case CLEARANCE_ERROR_NOT_FOUND: return "not found";
  }
  return "unknown error";
}

} /* namespace clearance */
