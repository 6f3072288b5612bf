/**
 * Copyright - See the COPYRIGHT that is included with this distribution.
 * trustgen is distributed subject to a Software License Agreement found
 * in file LICENSE that is included with this distribution.
 */

#ifndef CLIUTIL_H
#define CLIUTIL_H

#include <vector>
#include <string>
#include <stdexcept>
#include <map> // for std::pair

namespace trustgen {

struct ArgVal {
    std::string value;
    bool defined = false;

    ArgVal() = default;
    ArgVal(std::nullptr_t) {}
    ArgVal(const std::string& value) :value(value), defined(true) {}
    ArgVal(const char* value) :value(value), defined(true) {}

    inline explicit
    operator bool() const { return defined; }

    inline
    const std::string& operator*() const {
        if(defined)
            return value;
        throw std::logic_error("Undefined argument value");
    }
};

/** getopt() wrapper
 *
 *  On an unknown option, or missing option argument, success is false.
 */
struct GetOpt {
    GetOpt(int argc, char *argv[], const char *spec);

    const char *argv0;
    std::vector<std::string> positional;
    std::vector<std::pair<char, ArgVal>> arguments;
    bool success = false;
};

// Apply -v or -d verbosity.  Also applies $TRUSTGEN_LOG
void setupLogging(unsigned verbosity);

} // namespace trustgen

#endif // CLIUTIL_H
