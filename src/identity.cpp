/**
 * Copyright - See the COPYRIGHT that is included with this distribution.
 * trustgen is distributed subject to a Software License Agreement found
 * in file LICENSE that is included with this distribution.
 */

#include <algorithm>
#include <cctype>
#include <ctime>

#include <unistd.h>

#include <openssl/err.h>
#include <openssl/pem.h>

#include <trustgen/identity.h>
#include <trustgen/log.h>
#include "ossl.h"
#include "utilpvt.h"

DEFINE_LOGGER(_log, "trustgen.identity");

namespace trustgen {
using namespace ossl;
using impl::SB;

namespace {

// digests acceptable for the self-signature.  SHA-1 and MD5 are refused.
const char * const permittedDigests[] = {"sha256", "sha384", "sha512"};

std::string lowercase(std::string s)
{
    std::transform(s.begin(), s.end(), s.begin(), [](char c) {
        return char(std::tolower(static_cast<unsigned char>(c)));
    });
    return s;
}

const char* permittedDigest(const std::string& name)
{
    auto lname(lowercase(name));
    for(auto digest : permittedDigests) {
        if(lname==digest)
            return digest;
    }
    return nullptr;
}

/* Understanding X509_EXTENSION in openssl...
 * Each NID_* has a corresponding const X509V3_EXT_METHOD
 * in a crypto/x509/v3_*.c which defines the expected type of the void* value arg.
 *
 * Use X509V3_CTX automates building these values in the correct way,
 * and than calls low level X509_add1_ext_i2d()
 *
 * see also "man x509v3_config" for explaination of "expr" string.
 */
void add_extension(X509* cert, const std::string& name, const std::string& expr)
{
    X509V3_CTX xctx;
    X509V3_set_ctx_nodb(&xctx);
    // self-signed, so issuer and subject are the same
    X509V3_set_ctx(&xctx, cert, cert, nullptr, nullptr, 0);

    auto raw(X509V3_EXT_nconf(nullptr, &xctx, name.c_str(), expr.c_str()));
    if(!raw)
        throw SSLError(SB()<<"Unable to encode extension "<<name<<" = "<<expr);
    owned_ptr<X509_EXTENSION> ext(raw);
    MUST(1, X509_add_ext(cert, ext.get(), -1));
}

bool has_extension(const SubjectConfig& subject, int nid)
{
    for(const auto& ext : subject.extensions) {
        if(OBJ_txt2nid(ext.first.c_str())==nid)
            return true;
    }
    return false;
}

} // namespace

SubjectConfig SubjectConfig::commonName(const std::string& cn)
{
    SubjectConfig ret;
    ret.name.emplace_back("CN", cn);
    return ret;
}

void SubjectConfig::validate() const
{
    const std::string where(origin.empty() ? std::string() : std::string(SB()<<origin<<" : "));

    if(validity_days==0u)
        throw ConfigError(SB()<<where<<"Certificate validity must be at least one day");
    if(validity_days>maxValidityDays)
        throw ConfigError(SB()<<where<<"Certificate validity "<<validity_days
                          <<" days exceeds consumer limit of "<<maxValidityDays<<" days");

    if(!permittedDigest(digest))
        throw ConfigError(SB()<<where<<"Signature digest \""<<digest<<"\" not permitted.  Use sha256, sha384, or sha512");

    if(key_bits!=rsaKeyBits)
        throw ConfigError(SB()<<where<<"RSA key size "<<key_bits<<" not permitted.  Must be "<<rsaKeyBits);

    if(name.empty())
        throw ConfigError(SB()<<where<<"Empty subject name");

    try {
        // trial encoding catches eg. countryName longer than two characters
        owned_ptr<X509_NAME> trial(X509_NAME_new());
        for(const auto& ent : name) {
            if(ent.first.empty() || OBJ_txt2nid(ent.first.c_str())==NID_undef) {
                ERR_clear_error();
                throw ConfigError(SB()<<where<<"Unknown subject field \""<<ent.first<<"\"");
            }
            if(ent.second.empty())
                throw ConfigError(SB()<<where<<"Empty value for subject field "<<ent.first);
            if(1!=X509_NAME_add_entry_by_txt(trial.get(), ent.first.c_str(), MBSTRING_UTF8,
                                             reinterpret_cast<const unsigned char*>(ent.second.c_str()),
                                             -1, -1, 0))
            {
                throw ConfigError(SSLError(SB()<<where<<"Malformed subject field "
                                           <<ent.first<<"="<<ent.second).what());
            }
        }

        for(const auto& ext : extensions) {
            if(ext.first.empty() || OBJ_txt2nid(ext.first.c_str())==NID_undef) {
                ERR_clear_error();
                throw ConfigError(SB()<<where<<"Unknown extension \""<<ext.first<<"\"");
            }
            X509V3_CTX xctx;
            X509V3_set_ctx_nodb(&xctx);
            X509V3_set_ctx_test(&xctx);
            auto raw(X509V3_EXT_nconf(nullptr, &xctx, ext.first.c_str(), ext.second.c_str()));
            if(!raw)
                throw ConfigError(SSLError(SB()<<where<<"Malformed extension "
                                           <<ext.first<<" = "<<ext.second).what());
            X509_EXTENSION_free(raw);
        }

    } catch(SSLError& e) {
        throw ConfigError(SB()<<where<<e.what());
    }
}

Identity generateIdentity(const std::string& label, const SubjectConfig& subject)
{
    if(label.empty())
        throw ConfigError("Identity label must not be empty");
    subject.validate();

    log_debug_printf(_log, "Generating RSA-%d key for %s\n", subject.key_bits, label.c_str());

    try {
        providers_setup();

        auto md(EVP_get_digestbyname(permittedDigest(subject.digest)));
        if(!md)
            throw SSLError(SB()<<"Digest "<<subject.digest<<" not available");

        // generate public/private key pair
        owned_ptr<EVP_PKEY> key;
        {
            owned_ptr<EVP_PKEY_CTX> kctx(EVP_PKEY_CTX_new_id(EVP_PKEY_RSA, nullptr));
            MUST(1, EVP_PKEY_keygen_init(kctx.get()));
            MUST(1, EVP_PKEY_CTX_set_rsa_keygen_bits(kctx.get(), subject.key_bits));
            MUST(1, EVP_PKEY_keygen(kctx.get(), key.acquire()));
        }

        // start assembling certificate
        owned_ptr<X509> cert(X509_new());
        MUST(1, X509_set_version(cert.get(), X509_VERSION_3));

        MUST(1, X509_set_pubkey(cert.get(), key.get()));

        {
            auto sub(X509_get_subject_name(cert.get()));
            for(const auto& ent : subject.name) {
                MUST(1, X509_NAME_add_entry_by_txt(sub, ent.first.c_str(), MBSTRING_UTF8,
                                                   reinterpret_cast<const unsigned char*>(ent.second.c_str()),
                                                   -1, -1, 0));
            }
        }

        // self-signed
        MUST(1, X509_set_issuer_name(cert.get(), X509_get_subject_name(cert.get())));

        // both ends of the validity range from the same instant
        {
            time_t now(time(nullptr));
            owned_ptr<ASN1_TIME> before(ASN1_TIME_adj(nullptr, now, 0, 0));
            owned_ptr<ASN1_TIME> after(ASN1_TIME_adj(nullptr, now, int(subject.validity_days), 0));
            MUST(1, X509_set1_notBefore(cert.get(), before.get()));
            MUST(1, X509_set1_notAfter(cert.get(), after.get()));
        }

        // random positive serial number, as "openssl req -x509"
        {
            owned_ptr<BIGNUM> bn(BN_new());
            MUST(1, BN_rand(bn.get(), 159, BN_RAND_TOP_ANY, BN_RAND_BOTTOM_ANY));
            owned_ptr<ASN1_INTEGER> sn(BN_to_ASN1_INTEGER(bn.get(), nullptr));
            MUST(1, X509_set_serialNumber(cert.get(), sn.get()));
        }

        // certificate extensions...
        // see RFC5280

        // authorityKeyIdentifier=keyid needs subjectKeyIdentifier of the issuer (ourself)
        if(!has_extension(subject, NID_subject_key_identifier))
            add_extension(cert.get(), "subjectKeyIdentifier", "hash");

        if(subject.extensions.empty())
            add_extension(cert.get(), "basicConstraints", "CA:FALSE");

        for(const auto& ext : subject.extensions)
            add_extension(cert.get(), ext.first, ext.second);

        if(!has_extension(subject, NID_authority_key_identifier))
            add_extension(cert.get(), "authorityKeyIdentifier", "keyid:always");

        if(X509_sign(cert.get(), key.get(), md)==0)
            throw SSLError("Failed to sign cert");

        // self-signed round trip
        if(X509_verify(cert.get(), key.get())!=1)
            throw SSLError("Self-signature does not verify");

        log_info_printf(_log, "Generated %s %s\n", label.c_str(),
                        std::string(SB()<<ShowX509{cert.get()}).c_str());

        Identity ret;
        ret.label = label;
        ret.key = share(std::move(key));
        ret.cert = share(std::move(cert));
        return ret;

    } catch(SSLError& e) {
        throw GenerationError(SB()<<"Unable to generate identity for \""<<label<<"\" : "<<e.what());
    }
}

void writeIdentity(const Identity& id, const std::string& keyfile, const std::string& certfile)
{
    if(!id)
        throw GenerationError(SB()<<"Identity \""<<id.label<<"\" lacks key or certificate");
    if(keyfile.empty() || certfile.empty())
        throw GenerationError(SB()<<"Identity \""<<id.label<<"\" needs both key and certificate file names");
    if(keyfile==certfile)
        throw GenerationError(SB()<<"Private key and certificate must be written to different files : "<<keyfile);

    try {
        impl::AtomicFile keyout(keyfile, 0600);
        {
            // secure heap.  cleansed when freed
            owned_ptr<BIO> mem(BIO_new(BIO_s_secmem()));
            MUST(1, PEM_write_bio_PrivateKey(mem.get(), id.key.get(), nullptr, nullptr, 0, nullptr, nullptr));
            char *data = nullptr;
            auto len(BIO_get_mem_data(mem.get(), &data));
            if(len<=0)
                throw SSLError("PEM_write_bio_PrivateKey() produces nothing");
            keyout.write(data, size_t(len));
        }

        impl::AtomicFile certout(certfile, 0644);
        certout.write(certificatePEM(id.cert.get()));

        keyout.finish();
        certout.finish();

        keyout.commit();
        try {
            certout.commit();
        } catch(std::exception&) {
            // a key without its certificate is not usable
            (void)::unlink(keyfile.c_str());
            throw;
        }

        log_info_printf(_log, "Wrote %s key %s and certificate %s\n",
                        id.label.c_str(), keyfile.c_str(), certfile.c_str());

    } catch(SSLError& e) {
        throw GenerationError(SB()<<"Unable to encode \""<<id.label<<"\" : "<<e.what());
    } catch(std::runtime_error& e) {
        throw GenerationError(e.what());
    }
}

std::shared_ptr<X509> readCertificate(const std::string& certfile)
{
    BIO *raw = BIO_new_file(certfile.c_str(), "r");
    if(!raw)
        throw Error(SSLError(SB()<<"Unable to open \""<<certfile<<"\"").what());
    owned_ptr<BIO> fp(raw);

    owned_ptr<X509> cert;
    if(!PEM_read_bio_X509(fp.get(), cert.acquire(), nullptr, nullptr))
        throw Error(SSLError(SB()<<"Unable to read certificate from \""<<certfile<<"\"").what());
    return share(std::move(cert));
}

std::shared_ptr<EVP_PKEY> readPrivateKey(const std::string& keyfile)
{
    BIO *raw = BIO_new_file(keyfile.c_str(), "r");
    if(!raw)
        throw Error(SSLError(SB()<<"Unable to open \""<<keyfile<<"\"").what());
    owned_ptr<BIO> fp(raw);

    owned_ptr<EVP_PKEY> key;
    if(!PEM_read_bio_PrivateKey(fp.get(), key.acquire(), nullptr, nullptr))
        throw Error(SSLError(SB()<<"Unable to read private key from \""<<keyfile<<"\"").what());
    return share(std::move(key));
}

std::string certificatePEM(const X509* cert)
{
    try {
        owned_ptr<BIO> mem(BIO_new(BIO_s_mem()));
        MUST(1, PEM_write_bio_X509(mem.get(), const_cast<X509*>(cert)));
        char *data = nullptr;
        auto len(BIO_get_mem_data(mem.get(), &data));
        return std::string(data, size_t(len));
    } catch(SSLError& e) {
        throw Error(e.what());
    }
}

std::pair<int, int> validityPeriod(const X509* cert)
{
    int days = 0, secs = 0;
    if(!ASN1_TIME_diff(&days, &secs, X509_get0_notBefore(cert), X509_get0_notAfter(cert)))
        throw Error(SSLError("Invalid certificate validity range").what());
    return std::make_pair(days, secs);
}

std::string describeCertificate(const X509* cert)
{
    return SB()<<ShowX509{cert};
}

} // namespace trustgen
