/**
 * Copyright - See the COPYRIGHT that is included with this distribution.
 * trustgen is distributed subject to a Software License Agreement found
 * in file LICENSE that is included with this distribution.
 */

#include <cctype>

#include <openssl/evp.h>
#include <openssl/x509.h>

#include <trustgen/allowlist.h>
#include <trustgen/log.h>
#include "ossl.h"
#include "utilpvt.h"

DEFINE_LOGGER(_log, "trustgen.allowlist");

namespace trustgen {
using namespace ossl;
using impl::SB;

namespace {

bool hasSpace(const std::string& s)
{
    for(auto c : s) {
        if(std::isspace(static_cast<unsigned char>(c)))
            return true;
    }
    return false;
}

bool isFingerprint(const std::string& s)
{
    if(s.empty())
        return false;
    for(auto c : s) {
        if(c!=':' && !std::isxdigit(static_cast<unsigned char>(c)))
            return false;
    }
    return true;
}

} // namespace

const char* to_string(FingerprintFormat fmt)
{
    switch(fmt) {
    case FingerprintFormat::Colon: return "colon";
    case FingerprintFormat::Plain: return "plain";
    }
    return "<invalid>";
}

FingerprintFormat parseFingerprintFormat(const std::string& fmt)
{
    if(fmt=="colon")
        return FingerprintFormat::Colon;
    else if(fmt=="plain")
        return FingerprintFormat::Plain;
    throw ConfigError(SB()<<"Unknown fingerprint format \""<<fmt<<"\".  Expected colon or plain");
}

std::string formatFingerprint(const unsigned char *digest, size_t len, FingerprintFormat fmt)
{
    const char *hex = fmt==FingerprintFormat::Colon ? "0123456789ABCDEF" : "0123456789abcdef";
    std::string ret;
    ret.reserve(len*3u);
    for(size_t i=0; i<len; i++) {
        if(i && fmt==FingerprintFormat::Colon)
            ret.push_back(':');
        ret.push_back(hex[digest[i]>>4u]);
        ret.push_back(hex[digest[i]&0xfu]);
    }
    return ret;
}

std::string fingerprint(const X509* cert, FingerprintFormat fmt)
{
    if(!cert)
        throw Error("NULL certificate");

    unsigned char md[EVP_MAX_MD_SIZE];
    unsigned int mdlen = 0u;
    // digest of DER encoding
    if(!X509_digest(cert, EVP_sha256(), md, &mdlen))
        throw Error(SSLError("X509_digest").what());

    return formatFingerprint(md, mdlen, fmt);
}

std::string TrustRecord::line() const
{
    return SB()<<label<<' '<<fingerprint;
}

TrustAllowlist TrustAllowlist::load(const std::string& path)
{
    TrustAllowlist ret;

    if(!impl::fileExists(path)) {
        log_debug_printf(_log, "No allowlist %s.  Starting empty\n", path.c_str());
        return ret;
    }

    std::string content;
    try {
        content = impl::readFile(path);
    } catch(std::runtime_error& e) {
        throw ExportError(path, e.what());
    }

    size_t lineno = 0u;
    size_t pos = 0u;
    while(pos<content.size()) {
        lineno++;
        auto eol(content.find_first_of('\n', pos));
        if(eol==std::string::npos)
            eol = content.size();
        auto line(content.substr(pos, eol-pos));
        pos = eol+1u;

        if(!line.empty() && line[line.size()-1u]=='\r')
            line.resize(line.size()-1u);
        if(impl::trim(line).empty())
            continue;

        auto sep(line.find_first_of(' '));
        if(sep==std::string::npos || sep==0u)
            throw ExportError(path, SB()<<path<<":"<<lineno<<" : expected \"<label> <fingerprint>\"");

        TrustRecord rec;
        rec.label = line.substr(0, sep);
        rec.fingerprint = line.substr(sep+1u);

        if(hasSpace(rec.label) || !isFingerprint(rec.fingerprint))
            throw ExportError(path, SB()<<path<<":"<<lineno<<" : malformed record \""<<line<<"\"");

        if(ret.find(rec.label)) {
            log_warn_printf(_log, "%s:%zu : ignore duplicate entry for %s\n", path.c_str(), lineno, rec.label.c_str());
            continue;
        }
        ret.recs.push_back(std::move(rec));
    }

    return ret;
}

bool TrustAllowlist::upsert(const std::string& label, const std::string& fingerprint)
{
    if(label.empty() || hasSpace(label))
        throw ExportError(std::string(), SB()<<"Invalid allowlist label \""<<label<<"\"");
    if(!isFingerprint(fingerprint))
        throw ExportError(std::string(), SB()<<"Invalid fingerprint \""<<fingerprint<<"\" for "<<label);

    for(auto& rec : recs) {
        if(rec.label==label) {
            if(rec.fingerprint==fingerprint)
                return false;
            log_info_printf(_log, "Replace %s %s -> %s\n", label.c_str(),
                            rec.fingerprint.c_str(), fingerprint.c_str());
            rec.fingerprint = fingerprint;
            return true;
        }
    }

    TrustRecord rec;
    rec.label = label;
    rec.fingerprint = fingerprint;
    recs.push_back(std::move(rec));
    log_info_printf(_log, "Add %s %s\n", label.c_str(), fingerprint.c_str());
    return true;
}

bool TrustAllowlist::erase(const std::string& label)
{
    for(auto it(recs.begin()), end(recs.end()); it!=end; ++it) {
        if(it->label==label) {
            recs.erase(it);
            return true;
        }
    }
    return false;
}

const TrustRecord* TrustAllowlist::find(const std::string& label) const
{
    for(const auto& rec : recs) {
        if(rec.label==label)
            return &rec;
    }
    return nullptr;
}

std::string TrustAllowlist::str() const
{
    std::string ret;
    for(const auto& rec : recs) {
        ret += rec.line();
        ret.push_back('\n');
    }
    return ret;
}

void TrustAllowlist::save(const std::string& path) const
{
    try {
        impl::AtomicFile out(path, 0644);
        out.write(str());
        out.commit();
    } catch(std::runtime_error& e) {
        throw ExportError(path, e.what());
    }
}

TrustRecord exportFingerprint(const X509* cert, const std::string& label,
                              const std::string& path, FingerprintFormat fmt)
{
    auto fp(fingerprint(cert, fmt));

    auto list(TrustAllowlist::load(path));
    try {
        list.upsert(label, fp);
    } catch(ExportError& e) {
        throw ExportError(path, e.what());
    }
    list.save(path);

    log_info_printf(_log, "%s : %s %s\n", path.c_str(), label.c_str(), fp.c_str());

    auto rec(list.find(label));
    return *rec;
}

} // namespace trustgen
