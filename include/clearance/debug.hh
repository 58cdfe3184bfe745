/*
 * debug.hh -- logging facility for the Clearance library
 *
 * Copyright (C) 2026 The Clearance developers
 *
 * This file is part of the Clearance library libclearance. Please see README
 * for terms of use.
 */

#ifndef _CLEARANCE_DEBUG_HH_
#define _CLEARANCE_DEBUG_HH_ 1

#include <string>

namespace clearance {

/** Pre-defined log levels akin to what is used in \b syslog. */
typedef enum {
  CLEARANCE_LOG_EMERG=0,
  CLEARANCE_LOG_ALERT,
  CLEARANCE_LOG_CRIT,
  CLEARANCE_LOG_ERR,
  CLEARANCE_LOG_WARNING,
  CLEARANCE_LOG_NOTICE,
  CLEARANCE_LOG_INFO,
  CLEARANCE_LOG_DEBUG
} log_t;

/** Returns the current log level. */
log_t get_log_level(void);

/** Sets the log level to the specified value. */
void set_log_level(log_t level);

/**
 * Parses a log level given either by name ("debug", "warning",
 * ...) or as a syslog number. Returns @c false and leaves @p level
 * untouched if @p s names no level.
 */
bool log_level_from_string(const std::string &s, log_t &level);

typedef void (*log_handler_t) (log_t level, const char *message);

/** Add a custom log callback, use nullptr to reset default handler */
void set_log_handler(log_handler_t handler);

#if (defined(__GNUC__))
void log(log_t level,
         const char *format, ...) __attribute__ ((format(printf, 2, 3)));
#else
void log(log_t level, const char *format, ...);
#endif

} /* namespace clearance */

#endif /* _CLEARANCE_DEBUG_HH_ */
