/**
 * Copyright - See the COPYRIGHT that is included with this distribution.
 * trustgen is distributed subject to a Software License Agreement found
 * in file LICENSE that is included with this distribution.
 */

#include <map>
#include <string>
#include <utility>
#include <vector>

#include <stdarg.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>

#include <epicsMutex.h>
#include <epicsGuard.h>
#include <epicsString.h>
#include <epicsTime.h>
#include <errlog.h>

#include <trustgen/log.h>
#include "utilpvt.h"

typedef epicsGuard<epicsMutex> Guard;

namespace trustgen {

namespace {

constexpr int defaultLevel = int(Level::Warn);

struct logger_gbl_t {
    epicsMutex lock;
    // registered loggers by name.  name collisions are allowed
    std::multimap<std::string, logger*> loggers;
    // glob pattern -> level.  Later entries take precedence.
    std::vector<std::pair<std::string, int>> config;

    int levelFor(const char *name) const {
        int lvl = defaultLevel;
        for(const auto& pair : config) {
            if(epicsStrGlobMatch(name, pair.first.c_str()))
                lvl = pair.second;
        }
        return lvl;
    }

    void set(const std::string& pattern, int lvl) {
        // a repeated pattern moves to the end
        for(auto it = config.begin(); it!=config.end(); ) {
            if(it->first==pattern)
                it = config.erase(it);
            else
                ++it;
        }
        config.emplace_back(pattern, lvl);

        for(auto& pair : loggers) {
            pair.second->lvl.store(levelFor(pair.second->name), std::memory_order_relaxed);
        }
    }
} *logger_gbl;

int parseLevel(const std::string& lvl)
{
    if(lvl=="CRIT")
        return int(Level::Crit);
    else if(lvl=="ERR" || lvl=="ERROR")
        return int(Level::Err);
    else if(lvl=="WARN" || lvl=="WARNING")
        return int(Level::Warn);
    else if(lvl=="INFO")
        return int(Level::Info);
    else if(lvl=="DEBUG")
        return int(Level::Debug);
    return -1;
}

const char* levelName(unsigned lvl)
{
    switch(lvl) {
    case unsigned(Level::Crit): return "CRIT";
    case unsigned(Level::Err): return "ERR";
    case unsigned(Level::Warn): return "WARN";
    case unsigned(Level::Info): return "INFO";
    case unsigned(Level::Debug): return "DEBUG";
    default: return "\?\?\?";
    }
}

void logger_env_apply(logger_gbl_t& gbl)
{
    const char *env = getenv("TRUSTGEN_LOG");
    if(!env || !*env)
        return;

    for(const auto& item : impl::splitList(env)) {
        auto sep(item.find_first_of('='));
        if(sep==std::string::npos) {
            fprintf(stderr, "TRUSTGEN_LOG ignores \"%s\".  Expected <glob>=<LEVEL>\n", item.c_str());
            continue;
        }
        auto pattern(impl::trim(item.substr(0, sep)));
        auto lvl(parseLevel(impl::trim(item.substr(sep+1))));
        if(pattern.empty() || lvl<0) {
            fprintf(stderr, "TRUSTGEN_LOG ignores \"%s\".  Expected <glob>=<LEVEL>\n", item.c_str());
            continue;
        }
        gbl.set(pattern, lvl);
    }
}

void logger_prepare()
{
    logger_gbl = new logger_gbl_t;
    logger_env_apply(*logger_gbl);
}

} // namespace

int logger::init()
{
    impl::threadOnce<&logger_prepare>();

    Guard G(logger_gbl->lock);
    auto cur = lvl.load(std::memory_order_relaxed);
    if(cur==-1) {
        logger_gbl->loggers.emplace(name, this);
        cur = logger_gbl->levelFor(name);
        lvl.store(cur, std::memory_order_relaxed);
    }
    return cur;
}

void logger_level_set(const char *pattern, Level lvl)
{
    impl::threadOnce<&logger_prepare>();

    Guard G(logger_gbl->lock);
    logger_gbl->set(pattern, int(lvl));
}

void logger_level_clear()
{
    impl::threadOnce<&logger_prepare>();

    Guard G(logger_gbl->lock);
    logger_gbl->config.clear();
    for(auto& pair : logger_gbl->loggers) {
        pair.second->lvl.store(defaultLevel, std::memory_order_relaxed);
    }
}

void logger_config_env()
{
    impl::threadOnce<&logger_prepare>();

    Guard G(logger_gbl->lock);
    logger_env_apply(*logger_gbl);
}

namespace detail {

void _log_printf(unsigned rawlevel, const char *fmt, ...)
{
    char stamp[sizeof("2025-10-10T12:34:56.123")];
    epicsTimeStamp now;
    if(epicsTimeGetCurrent(&now) || !epicsTimeToStrftime(stamp, sizeof(stamp), "%Y-%m-%dT%H:%M:%S.%03f", &now))
        strcpy(stamp, "<no time>");

    std::vector<char> msg(256u);
    for(unsigned i=0; i<2u; i++) {
        va_list args;
        va_start(args, fmt);
        auto n = vsnprintf(msg.data(), msg.size(), fmt, args);
        va_end(args);
        if(n<0) {
            msg.assign(1u, '\0');
            break;
        } else if(size_t(n)<msg.size()) {
            break;
        }
        msg.resize(size_t(n)+1u);
    }

    errlogPrintf("%s %s %s", stamp, levelName(rawlevel), msg.data());
}

} // namespace detail
} // namespace trustgen
