/**
 * Copyright - See the COPYRIGHT that is included with this distribution.
 * trustgen is distributed subject to a Software License Agreement found
 * in file LICENSE that is included with this distribution.
 */

#ifndef TRUSTGEN_LOG_H
#define TRUSTGEN_LOG_H

#include <atomic>

#include <compilerDependencies.h>

#include <trustgen/version.h>

namespace trustgen {

enum struct Level {
    Crit  = 10,
    Err   = 20,
    Warn  = 30,
    Info  = 40,
    Debug = 50,
};

/** A named logger.
 *
 *  Always defined with static storage duration through DEFINE_LOGGER().
 *  The effective level is computed on first use from $TRUSTGEN_LOG
 *  and any logger_level_set() calls which match the logger name.
 */
struct logger {
    const char * const name;
    std::atomic<int> lvl;

    constexpr logger(const char *name) :name(name), lvl{-1} {}

    TRUSTGEN_API
    int init();

    inline bool test(Level lvl) {
        auto cur = this->lvl.load(std::memory_order_relaxed);
        if(cur==-1)
            cur = init();
        return cur>=int(lvl);
    }
};

#define DEFINE_LOGGER(VAR, NAME) static ::trustgen::logger VAR{NAME}

namespace detail {

TRUSTGEN_API
void _log_printf(unsigned rawlevel, const char *fmt, ...) EPICS_PRINTF_STYLE(2,3);

} // namespace detail

/* Note: FMT must be a string literal and must be followed by at least one argument.
 * eg.
 *   log_info_printf(_log, "Done%s", "\n");
 */
#define log_printf(LOGGER, LVL, FMT, ...) do{ \
    if((LOGGER).test(LVL)) \
        ::trustgen::detail::_log_printf(unsigned(LVL), "%s " FMT, (LOGGER).name, __VA_ARGS__); \
}while(0)

#define log_crit_printf(LOGGER, FMT, ...)  log_printf(LOGGER, ::trustgen::Level::Crit, FMT, __VA_ARGS__)
#define log_err_printf(LOGGER, FMT, ...)   log_printf(LOGGER, ::trustgen::Level::Err, FMT, __VA_ARGS__)
#define log_warn_printf(LOGGER, FMT, ...)  log_printf(LOGGER, ::trustgen::Level::Warn, FMT, __VA_ARGS__)
#define log_info_printf(LOGGER, FMT, ...)  log_printf(LOGGER, ::trustgen::Level::Info, FMT, __VA_ARGS__)
#define log_debug_printf(LOGGER, FMT, ...) log_printf(LOGGER, ::trustgen::Level::Debug, FMT, __VA_ARGS__)

/** Set level for all loggers whose name matches a glob pattern.
 *
 *  eg. logger_level_set("trustgen.*", Level::Debug)
 *
 *  Later calls take precedence over earlier calls, and over $TRUSTGEN_LOG
 */
TRUSTGEN_API
void logger_level_set(const char *pattern, Level lvl);

//! Remove all pattern configuration.  All loggers revert to Level::Warn
TRUSTGEN_API
void logger_level_clear();

/** (re)Apply configuration from $TRUSTGEN_LOG
 *
 *  A comma separated list of "<glob>=<LEVEL>" where LEVEL is one of
 *  CRIT, ERR, WARN, INFO, or DEBUG.  eg.
 *
 *  @code
 *    TRUSTGEN_LOG="trustgen.*=INFO,trustgen.bundle=DEBUG"
 *  @endcode
 */
TRUSTGEN_API
void logger_config_env();

} // namespace trustgen

#endif // TRUSTGEN_LOG_H
