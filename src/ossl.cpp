/**
 * Copyright - See the COPYRIGHT that is included with this distribution.
 * trustgen is distributed subject to a Software License Agreement found
 * in file LICENSE that is included with this distribution.
 */

#include <cassert>
#include <ostream>
#include <sstream>

#include <openssl/err.h>
#include <openssl/provider.h>

#include <trustgen/log.h>
#include "ossl.h"
#include "utilpvt.h"

#if OPENSSL_VERSION_NUMBER < 0x30000000L
#  error OpenSSL >= 3.0 required
#endif

DEFINE_LOGGER(_setup, "trustgen.ossl.setup");

namespace trustgen {

Error::Error(const std::string& msg) :std::runtime_error(msg) {}
Error::~Error() {}

ConfigError::ConfigError(const std::string& msg) :Error(msg) {}
ConfigError::~ConfigError() {}

GenerationError::GenerationError(const std::string& msg) :Error(msg) {}
GenerationError::~GenerationError() {}

PackagingError::PackagingError(const std::string& msg) :Error(msg) {}
PackagingError::~PackagingError() {}

ExportError::ExportError(const std::string& path, const std::string& msg)
    :Error(msg)
    ,_path(path)
{}
ExportError::~ExportError() {}

namespace ossl {

namespace {
struct OSSLGbl {
    OSSL_PROVIDER *defprov = nullptr;
    OSSL_PROVIDER *legacy = nullptr;
} *ossl_gbl;

void OSSLGbl_init()
{
    ossl_gbl = new OSSLGbl;
    // explicitly loading any provider disables implicit load of "default"
    ossl_gbl->defprov = OSSL_PROVIDER_load(nullptr, "default");
    if(!ossl_gbl->defprov) {
        std::string msg(SSLError("Unable to load OpenSSL \"default\" provider").what());
        log_crit_printf(_setup, "%s\n", msg.c_str());
    }
    ossl_gbl->legacy = OSSL_PROVIDER_load(nullptr, "legacy");
    if(!ossl_gbl->legacy) {
        // not fatal until RC2 or 3DES are needed
        std::string msg(SSLError("Unable to load OpenSSL \"legacy\" provider").what());
        log_warn_printf(_setup, "%s\n", msg.c_str());
    } else {
        log_debug_printf(_setup, "Loaded OpenSSL legacy provider%s", "\n");
    }
}
} // namespace

void providers_setup()
{
    impl::threadOnce<&OSSLGbl_init>();
}

bool legacy_available()
{
    providers_setup();
    return !!ossl_gbl->legacy;
}

void _must_equal(int line, int expect, int actual, const char *expr)
{
    if(expect!=actual)
        throw SSLError(impl::SB()<<line<<": "<<expect<<"!="<<actual<<" : "<<expr);
}

std::shared_ptr<EVP_PKEY> share(owned_ptr<EVP_PKEY>&& key)
{
    std::shared_ptr<EVP_PKEY> ret(key.get(), &EVP_PKEY_free);
    key.release();
    return ret;
}

std::shared_ptr<X509> share(owned_ptr<X509>&& cert)
{
    std::shared_ptr<X509> ret(cert.get(), &X509_free);
    cert.release();
    return ret;
}

SSLError::SSLError(const std::string &msg)
    :std::runtime_error([&msg]() -> std::string {
        std::ostringstream strm;
        const char *file = nullptr;
        int line = 0;
        const char *data = nullptr;
        int flags = 0;
        while(auto err = ERR_get_error_all(&file, &line, nullptr, &data, &flags)) {
            strm<<file<<':'<<line<<':'<<ERR_reason_error_string(err);
            if(data && (flags&ERR_TXT_STRING))
                strm<<':'<<data;
            strm<<", ";
        }
        strm<<msg;
        return strm.str();
}())
{}

SSLError::~SSLError() {}

std::ostream& operator<<(std::ostream& strm, const ShowX509& cert) {
    if(cert.cert) {
        auto name = X509_get_subject_name(cert.cert);
        auto issuer = X509_get_issuer_name(cert.cert);
        assert(name);
        owned_ptr<BIO> io(BIO_new(BIO_s_mem()));
        (void)BIO_printf(io.get(), "subject:");
        (void)X509_NAME_print(io.get(), name, 1024);
        (void)BIO_printf(io.get(), " issuer:");
        (void)X509_NAME_print(io.get(), issuer, 1024);
        if(auto atm = X509_get0_notBefore(cert.cert)) {
            (void)BIO_printf(io.get(), " from: ");
            ASN1_TIME_print(io.get(), atm);
        }
        if(auto atm = X509_get0_notAfter(cert.cert)) {
            (void)BIO_printf(io.get(), " until: ");
            ASN1_TIME_print(io.get(), atm);
        }
        {
            char *str = nullptr;
            if(auto len = BIO_get_mem_data(io.get(), &str)) {
                strm.write(str, len);
            }
        }
    } else {
        strm<<"NULL";
    }
    return strm;
}

} // namespace ossl
} // namespace trustgen
