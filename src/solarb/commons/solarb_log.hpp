/**
 * @file solarb_log.hpp
 * @brief Logger facility with pluggable sink
 *
 * Pretty standard logging with log_info(), log_debug() macros and so on.
 * The usual stuff.
 *
 * Features to mention:
 * - the output of the logging is delegated to a sink callable. A default sink
 *   prints to std::clog; the Python extension replaces it with a delegate
 *   that forwards to Python's standard logging framework,
 *   using the function log_register_sink(callable)
 * - single-branch runtime triggering of log statements
 * - remove (not minimize) runtime impact of log statement parameter
 *   evaluation when log is not triggered
 * - uses boost::format in a more log-context friendly fashion
 */

#pragma once

#include <boost/format.hpp>
#include <functional>
#include <string>

typedef enum {
    log_level_trace,
    log_level_debug,
    log_level_info,
    log_level_warning,
    log_level_error,
} log_level;

typedef std::function<void(log_level, const char *)> log_sink_t;

/**
 * @brief returns true if the specified log @p lvl triggers the currently set log threshold
 */
bool log_trigger(log_level lvl);

/**
 * @brief returns the currently set log level threshold
 */
log_level log_get_level();

/**
 * @brief sets the log level threshold
 */
void log_set_level(log_level lvl);

/**
 * @brief Injects a delegate as the log data sink
 *
 * An empty @p sink restores the default std::clog sink.
 */
void log_register_sink(log_sink_t sink);

/**
 * @brief printable name of @p lvl
 */
const char *log_level_name(log_level lvl);


void log_emit_ll(log_level lvl, const std::string &msg);

// argument counting preprocessor machinery follows

#define SOLARB_NARG(...)  SOLARB_NARG_I(__VA_ARGS__, SOLARB_RSEQ_N())
#define SOLARB_NARG_I(...) SOLARB_ARG_N(__VA_ARGS__)
#define SOLARB_ARG_N( \
      _1, _2, _3, _4, _5, _6, _7, _8, _9,_10, \
     _11,_12,_13,_14,_15,_16,_17,_18,_19,_20, \
     _21,_22,_23,_24,_25,_26,_27,_28,_29,_30, \
     _31,_32,N,...) N
#define SOLARB_RSEQ_N() \
     32,31,30,                      \
     29,28,27,26,25,24,23,22,21,20, \
     19,18,17,16,15,14,13,12,11,10, \
     9,8,7,6,5,4,3,2,1,0

#define SOLARB_VFUNC_(name, n) name##n
#define SOLARB_VFUNC(name, n) SOLARB_VFUNC_(name, n)


#define log_emit_2(lvl, msg)                                                          if(log_trigger(lvl)) log_emit_ll(lvl, boost::str(boost::format(msg)))
#define log_emit_3(lvl, msg, a1)                                                      if(log_trigger(lvl)) log_emit_ll(lvl, boost::str(boost::format(msg) % a1))
#define log_emit_4(lvl, msg, a1, a2)                                                  if(log_trigger(lvl)) log_emit_ll(lvl, boost::str(boost::format(msg) % a1 % a2))
#define log_emit_5(lvl, msg, a1, a2, a3)                                              if(log_trigger(lvl)) log_emit_ll(lvl, boost::str(boost::format(msg) % a1 % a2 % a3))
#define log_emit_6(lvl, msg, a1, a2, a3, a4)                                          if(log_trigger(lvl)) log_emit_ll(lvl, boost::str(boost::format(msg) % a1 % a2 % a3 % a4))
#define log_emit_7(lvl, msg, a1, a2, a3, a4, a5)                                      if(log_trigger(lvl)) log_emit_ll(lvl, boost::str(boost::format(msg) % a1 % a2 % a3 % a4 % a5))
#define log_emit_8(lvl, msg, a1, a2, a3, a4, a5, a6)                                  if(log_trigger(lvl)) log_emit_ll(lvl, boost::str(boost::format(msg) % a1 % a2 % a3 % a4 % a5 % a6))
#define log_emit_9(lvl, msg, a1, a2, a3, a4, a5, a6, a7)                              if(log_trigger(lvl)) log_emit_ll(lvl, boost::str(boost::format(msg) % a1 % a2 % a3 % a4 % a5 % a6 % a7))
#define log_emit_10(lvl, msg, a1, a2, a3, a4, a5, a6, a7, a8)                         if(log_trigger(lvl)) log_emit_ll(lvl, boost::str(boost::format(msg) % a1 % a2 % a3 % a4 % a5 % a6 % a7 % a8))
#define log_emit_11(lvl, msg, a1, a2, a3, a4, a5, a6, a7, a8, a9)                     if(log_trigger(lvl)) log_emit_ll(lvl, boost::str(boost::format(msg) % a1 % a2 % a3 % a4 % a5 % a6 % a7 % a8 % a9))
#define log_emit_12(lvl, msg, a1, a2, a3, a4, a5, a6, a7, a8, a9, a10)                if(log_trigger(lvl)) log_emit_ll(lvl, boost::str(boost::format(msg) % a1 % a2 % a3 % a4 % a5 % a6 % a7 % a8 % a9 % a10))
#define log_emit(...) SOLARB_VFUNC(log_emit_, SOLARB_NARG(__VA_ARGS__)) (__VA_ARGS__)

// here, use these:
#define log_trace(...)   log_emit(log_level_trace  , __VA_ARGS__)
#define log_debug(...)   log_emit(log_level_debug  , __VA_ARGS__)
#define log_info(...)    log_emit(log_level_info   , __VA_ARGS__)
#define log_warning(...) log_emit(log_level_warning, __VA_ARGS__)
#define log_error(...)   log_emit(log_level_error  , __VA_ARGS__)
