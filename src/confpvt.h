/**
 * Copyright - See the COPYRIGHT that is included with this distribution.
 * trustgen is distributed subject to a Software License Agreement found
 * in file LICENSE that is included with this distribution.
 */

#ifndef CONFPVT_H
#define CONFPVT_H

#include <string>
#include <utility>
#include <vector>

#include "ossl.h"

namespace trustgen {
namespace impl {

/** An OpenSSL style configuration file.  cf. "man 5 config"
 *
 *  All errors throw ConfigError
 */
class ConfFile {
    ossl::owned_ptr<CONF> conf;
public:
    const std::string path;

    explicit ConfFile(const std::string& path);

    bool hasSection(const std::string& name) const;
    // NULL if not set.  Falls back to the default section
    const char* lookup(const std::string& section, const char *name) const;
    std::string get(const std::string& section, const char *name, const std::string& def) const;
    std::string require(const std::string& section, const char *name) const;
    unsigned getUnsigned(const std::string& section, const char *name, unsigned def) const;
    bool getBool(const std::string& section, const char *name, bool def) const;
    // entries in file order
    std::vector<std::pair<std::string, std::string>> section(const std::string& name) const;
};

} // namespace impl
} // namespace trustgen

#endif // CONFPVT_H
