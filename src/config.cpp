/**
 * Copyright - See the COPYRIGHT that is included with this distribution.
 * trustgen is distributed subject to a Software License Agreement found
 * in file LICENSE that is included with this distribution.
 */

#include <cerrno>
#include <climits>
#include <cstdlib>
#include <set>

#include <openssl/err.h>

#include <trustgen/log.h>
#include <trustgen/provision.h>
#include "confpvt.h"
#include "utilpvt.h"

DEFINE_LOGGER(_log, "trustgen.config");

namespace trustgen {
using namespace ossl;
using impl::SB;

namespace impl {

ConfFile::ConfFile(const std::string& path)
    :conf(NCONF_new(nullptr))
    ,path(path)
{
    long eline = -1;
    if(NCONF_load(conf.get(), path.c_str(), &eline)<=0) {
        SB msg;
        msg<<"Unable to parse \""<<path<<"\"";
        if(eline>0)
            msg<<" at line "<<eline;
        throw ConfigError(SSLError(msg).what());
    }
    log_debug_printf(_log, "Read %s\n", path.c_str());
}

bool ConfFile::hasSection(const std::string& name) const
{
    ERR_set_mark();
    auto sect(NCONF_get_section(conf.get(), name.c_str()));
    ERR_pop_to_mark();
    return sect!=nullptr;
}

const char* ConfFile::lookup(const std::string& section, const char *name) const
{
    ERR_set_mark();
    // missing values push an error, which is not an error here
    auto val(NCONF_get_string(conf.get(), section.c_str(), name));
    ERR_pop_to_mark();
    return val;
}

std::string ConfFile::get(const std::string& section, const char *name, const std::string& def) const
{
    auto val(lookup(section, name));
    return val ? trim(val) : def;
}

std::string ConfFile::require(const std::string& section, const char *name) const
{
    auto val(get(section, name, std::string()));
    if(val.empty())
        throw ConfigError(SB()<<path<<" : ["<<section<<"] requires "<<name);
    return val;
}

unsigned ConfFile::getUnsigned(const std::string& section, const char *name, unsigned def) const
{
    auto val(get(section, name, std::string()));
    if(val.empty())
        return def;

    char *end = nullptr;
    errno = 0;
    auto num(strtoul(val.c_str(), &end, 10));
    if(errno || !end || *end!='\0' || val[0]=='-' || num>UINT_MAX)
        throw ConfigError(SB()<<path<<" : ["<<section<<"] "<<name<<" = \""<<val<<"\" is not an unsigned integer");
    return unsigned(num);
}

bool ConfFile::getBool(const std::string& section, const char *name, bool def) const
{
    auto val(get(section, name, std::string()));
    if(val.empty())
        return def;
    else if(val=="yes" || val=="YES" || val=="true" || val=="1")
        return true;
    else if(val=="no" || val=="NO" || val=="false" || val=="0")
        return false;
    throw ConfigError(SB()<<path<<" : ["<<section<<"] "<<name<<" = \""<<val<<"\" is not yes or no");
}

std::vector<std::pair<std::string, std::string>> ConfFile::section(const std::string& name) const
{
    ERR_set_mark();
    auto sect(NCONF_get_section(conf.get(), name.c_str()));
    ERR_pop_to_mark();
    if(!sect)
        throw ConfigError(SB()<<path<<" : missing section ["<<name<<"]");

    std::vector<std::pair<std::string, std::string>> ret;
    for(int i=0, N=sk_CONF_VALUE_num(sect); i<N; i++) {
        auto ent(sk_CONF_VALUE_value(sect, i));
        ret.emplace_back(ent->name, ent->value ? trim(ent->value) : std::string());
    }
    return ret;
}

} // namespace impl

namespace {

/* As "openssl req", a prefix ending with '.', ':', or ',' allows a field name
 * to be repeated.  eg. "0.OU" and "1.OU"
 */
std::string fieldName(const std::string& name)
{
    auto sep(name.find_last_of(".:,"));
    if(sep==std::string::npos || sep+1u==name.size())
        return name;
    return name.substr(sep+1u);
}

// "@alt_names" -> "DNS:a,DNS:b" from "DNS.1 = a" and "DNS.2 = b"
std::string expandSectionRef(const impl::ConfFile& conf, const std::string& value)
{
    if(value.empty() || value[0]!='@')
        return value;

    std::string ret;
    for(const auto& ent : conf.section(value.substr(1))) {
        auto type(ent.first.substr(0, ent.first.find_first_of('.')));
        if(!ret.empty())
            ret.push_back(',');
        ret += type;
        ret.push_back(':');
        ret += ent.second;
    }
    if(ret.empty())
        throw ConfigError(SB()<<conf.path<<" : section ["<<value.substr(1)<<"] is empty");
    return ret;
}

PartyPlan readParty(const impl::ConfFile& conf, const std::string& name, const std::string& basedir)
{
    if(!conf.hasSection(name))
        throw ConfigError(SB()<<conf.path<<" : missing section ["<<name<<"]");

    PartyPlan party;
    party.name = name;
    party.label = conf.get(name, "label", name);
    party.subject = SubjectConfig::fromFile(impl::joinPath(basedir, conf.require(name, "subject")));
    party.key = impl::joinPath(basedir, conf.require(name, "key"));
    party.cert = impl::joinPath(basedir, conf.require(name, "cert"));
    party.bundle = impl::joinPath(basedir, conf.require(name, "bundle"));
    party.legacy_bundle = impl::joinPath(basedir, conf.get(name, "legacy_bundle", std::string()));
    party.password_file = impl::joinPath(basedir, conf.require(name, "password_file"));
    party.consumers = impl::splitList(conf.get(name, "consumers", std::string()));
    return party;
}

void validateParty(const PartyPlan& party, const CapabilityTable& caps)
{
    if(party.name.empty())
        throw ConfigError("Party name must not be empty");
    if(party.label.empty())
        throw ConfigError(SB()<<"["<<party.name<<"] label must not be empty");

    party.subject.validate();

    if(party.key.empty() || party.cert.empty() || party.bundle.empty() || party.password_file.empty())
        throw ConfigError(SB()<<"["<<party.name<<"] requires key, cert, bundle, and password_file");

    if(needsLegacy(party.consumers, caps) && party.legacy_bundle.empty())
        throw ConfigError(SB()<<"["<<party.name<<"] has a legacy-only consumer, but no legacy_bundle");
}

} // namespace

SubjectConfig SubjectConfig::fromFile(const std::string& path)
{
    impl::ConfFile conf(path);

    SubjectConfig ret;
    ret.origin = path;

    for(const auto& ent : conf.section(conf.require("req", "distinguished_name"))) {
        ret.name.emplace_back(fieldName(ent.first), ent.second);
    }

    auto extsect(conf.get("req", "x509_extensions", std::string()));
    if(!extsect.empty()) {
        for(const auto& ent : conf.section(extsect)) {
            ret.extensions.emplace_back(ent.first, expandSectionRef(conf, ent.second));
        }
    }

    ret.digest = conf.get("req", "default_md", ret.digest);
    ret.key_bits = int(conf.getUnsigned("req", "default_bits", unsigned(ret.key_bits)));
    ret.validity_days = conf.getUnsigned("req", "default_days", ret.validity_days);

    ret.validate();
    return ret;
}

ProvisionPlan ProvisionPlan::fromFile(const std::string& path, const std::string& basedir)
{
    impl::ConfFile conf(path);
    const auto base(basedir.empty() ? impl::dirName(path) : basedir);

    ProvisionPlan plan;

    if(conf.hasSection("consumers")) {
        for(const auto& ent : conf.section("consumers")) {
            try {
                plan.capabilities[ent.first] = parseBundleMode(ent.second);
            } catch(ConfigError& e) {
                throw ConfigError(SB()<<path<<" : [consumers] "<<ent.first<<" : "<<e.what());
            }
        }
    }

    auto sname(conf.require("provision", "server"));
    auto cname(conf.require("provision", "client"));
    if(sname==cname)
        throw ConfigError(SB()<<path<<" : server and client must be different sections");

    plan.server = readParty(conf, sname, base);
    plan.client = readParty(conf, cname, base);

    if(conf.lookup("provision", "validity_days")) {
        auto days(conf.getUnsigned("provision", "validity_days", maxValidityDays));
        plan.server.subject.validity_days = plan.client.subject.validity_days = days;
    }

    plan.fingerprint_format = parseFingerprintFormat(conf.get("provision", "fingerprint_format", "colon"));
    plan.allowlist_label = conf.get("provision", "allowlist_label", cname);
    plan.shared_password = conf.getBool("provision", "shared_password", false);

    plan.allowlist = impl::joinPath(base, conf.require(sname, "allowlist"));
    plan.trusted_peer = impl::joinPath(base, conf.require(cname, "trusted_peer"));

    try {
        plan.validate();
    } catch(ConfigError& e) {
        throw ConfigError(SB()<<path<<" : "<<e.what());
    }

    log_debug_printf(_log, "Plan %s server=%s client=%s\n", path.c_str(), sname.c_str(), cname.c_str());
    return plan;
}

void ProvisionPlan::validate() const
{
    if(server.name==client.name)
        throw ConfigError("Server and client must be different parties");

    validateParty(server, capabilities);
    validateParty(client, capabilities);

    if(allowlist.empty())
        throw ConfigError(SB()<<"["<<server.name<<"] requires allowlist");
    if(trusted_peer.empty())
        throw ConfigError(SB()<<"["<<client.name<<"] requires trusted_peer");

    if(allowlist_label.empty())
        throw ConfigError("Allowlist label must not be empty");
    for(auto c : allowlist_label) {
        if(c==' ' || c=='\t' || c=='\r' || c=='\n')
            throw ConfigError(SB()<<"Allowlist label \""<<allowlist_label<<"\" must not contain whitespace");
    }

    if(!shared_password && server.password_file==client.password_file)
        throw ConfigError(SB()<<"Server and client share password file \""<<server.password_file
                          <<"\".  Set shared_password = yes if this is necessary");

    std::set<std::string> inputs;
    for(const auto party : {&server, &client}) {
        inputs.insert(party->password_file);
        if(!party->subject.origin.empty())
            inputs.insert(party->subject.origin);
    }

    std::set<std::string> outputs;
    auto output = [&outputs, &inputs](const std::string& path) {
        if(path.empty())
            return;
        if(inputs.count(path))
            throw ConfigError(SB()<<"Output \""<<path<<"\" would overwrite an input");
        if(!outputs.insert(path).second)
            throw ConfigError(SB()<<"Output \""<<path<<"\" named more than once");
    };
    for(const auto party : {&server, &client}) {
        output(party->key);
        output(party->cert);
        output(party->bundle);
        output(party->legacy_bundle);
    }
    output(allowlist);
    output(trusted_peer);
}

} // namespace trustgen
