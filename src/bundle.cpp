/**
 * Copyright - See the COPYRIGHT that is included with this distribution.
 * trustgen is distributed subject to a Software License Agreement found
 * in file LICENSE that is included with this distribution.
 */

#include <errno.h>
#include <string.h>
#include <fcntl.h>
#include <unistd.h>

#include <openssl/crypto.h>
#include <openssl/err.h>

#include <trustgen/bundle.h>
#include <trustgen/log.h>
#include "ossl.h"
#include "utilpvt.h"

DEFINE_LOGGER(_log, "trustgen.bundle");

namespace trustgen {
using namespace ossl;
using impl::SB;

namespace {

// longest accepted password file content
constexpr size_t maxPassword = 4095u;

void checkInputs(const Identity& id, const Secret& password)
{
    if(!id)
        throw PackagingError(SB()<<"Bundle for \""<<id.label<<"\" needs both key and certificate");
    if(password.empty())
        throw PackagingError(SB()<<"Bundle password for \""<<id.label<<"\" must not be empty");
    if(X509_check_private_key(id.cert.get(), id.key.get())!=1) {
        ERR_clear_error();
        throw PackagingError(SB()<<"Private key does not match certificate of \""<<id.label<<"\"");
    }
}

std::string algName(const X509_ALGOR *alg)
{
    const ASN1_OBJECT *aobj = nullptr;
    int ptype = 0;
    const void *pval = nullptr;
    X509_ALGOR_get0(&aobj, &ptype, &pval, alg);

    auto nid(OBJ_obj2nid(aobj));
    if(nid==NID_pbes2 && ptype==V_ASN1_SEQUENCE) {
        // name the underlying cipher.  cf. "openssl pkcs12 -info"
        auto raw = static_cast<PBE2PARAM*>(ASN1_item_unpack(static_cast<const ASN1_STRING*>(pval),
                                                            ASN1_ITEM_rptr(PBE2PARAM)));
        if(raw) {
            owned_ptr<PBE2PARAM> pbe2(raw);
            auto cipher(OBJ_obj2nid(pbe2->encryption->algorithm));
            return SB()<<"PBES2/"<<OBJ_nid2sn(cipher);
        }
        ERR_clear_error();
    }
    if(nid==NID_undef)
        return "<unknown>";
    return OBJ_nid2ln(nid);
}

bool isLegacyAlg(const X509_ALGOR *alg)
{
    const ASN1_OBJECT *aobj = nullptr;
    X509_ALGOR_get0(&aobj, nullptr, nullptr, alg);
    switch(OBJ_obj2nid(aobj)) {
    case NID_pbe_WithSHA1And128BitRC4:
    case NID_pbe_WithSHA1And40BitRC4:
    case NID_pbe_WithSHA1And3_Key_TripleDES_CBC:
    case NID_pbe_WithSHA1And2_Key_TripleDES_CBC:
    case NID_pbe_WithSHA1And128BitRC2_CBC:
    case NID_pbe_WithSHA1And40BitRC2_CBC:
        return true;
    default:
        return false;
    }
}

// DER encoding of the private key.  Cleansed when freed
struct KeyDER {
    unsigned char *der = nullptr;
    int len = 0;
    explicit KeyDER(const EVP_PKEY *key)
        :len(i2d_PrivateKey(key, &der))
    {
        if(len<=0 || !der)
            throw SSLError("i2d_PrivateKey");
    }
    ~KeyDER() { OPENSSL_clear_free(der, size_t(len>0 ? len : 0)); }
    KeyDER(const KeyDER&) = delete;
    KeyDER& operator=(const KeyDER&) = delete;
};

// EVP_PKEY_eq() compares only public components
bool samePrivateKey(const EVP_PKEY *a, const EVP_PKEY *b)
{
    KeyDER A(a), B(b);
    return A.len==B.len && CRYPTO_memcmp(A.der, B.der, size_t(A.len))==0;
}

owned_ptr<PKCS12> parseDER(const std::string& der)
{
    auto p = reinterpret_cast<const unsigned char*>(der.data());
    auto raw = d2i_PKCS12(nullptr, &p, long(der.size()));
    if(!raw)
        throw SSLError("Not a PKCS#12 bundle");
    return owned_ptr<PKCS12>(raw);
}

void verifyMAC(PKCS12 *p12, const Secret& password)
{
    if(PKCS12_mac_present(p12) && !PKCS12_verify_mac(p12, password.c_str(), -1))
        throw SSLError("MAC verification failed.  Wrong password?");
}

} // namespace

const char* to_string(BundleMode mode)
{
    switch(mode) {
    case BundleMode::Modern: return "modern";
    case BundleMode::Legacy: return "legacy";
    }
    return "<invalid>";
}

BundleMode parseBundleMode(const std::string& mode)
{
    if(mode=="modern")
        return BundleMode::Modern;
    else if(mode=="legacy")
        return BundleMode::Legacy;
    throw ConfigError(SB()<<"Unknown bundle mode \""<<mode<<"\".  Expected modern or legacy");
}

Secret::Secret(const std::string& value)
    :Secret(value.data(), value.size())
{}

Secret::Secret(const char *value, size_t len)
{
    if(len) {
        buf.reserve(len+1u);
        buf.assign(value, value+len);
        buf.push_back('\0');
    }
}

Secret::Secret(Secret&& o) noexcept
    :buf(std::move(o.buf))
{
    o.buf.clear();
}

Secret& Secret::operator=(Secret&& o) noexcept
{
    if(this!=&o) {
        clear();
        buf = std::move(o.buf);
        o.buf.clear();
    }
    return *this;
}

Secret::~Secret()
{
    clear();
}

void Secret::clear()
{
    if(!buf.empty())
        OPENSSL_cleanse(buf.data(), buf.size());
    buf.clear();
}

bool Secret::operator==(const Secret& o) const
{
    return size()==o.size() && CRYPTO_memcmp(c_str(), o.c_str(), size())==0;
}

Secret readPassword(const std::string& path)
{
    int fd = ::open(path.c_str(), O_RDONLY|O_CLOEXEC);
    if(fd<0) {
        auto err = errno;
        throw PackagingError(SB()<<"Unable to open password file \""<<path<<"\" : "<<strerror(err));
    }

    char buf[maxPassword+1u];
    size_t len = 0u;
    // close and cleanse on all paths
    struct Cleanup {
        int fd;
        char *buf;
        size_t size;
        ~Cleanup() {
            (void)::close(fd);
            OPENSSL_cleanse(buf, size);
        }
    } cleanup{fd, buf, sizeof(buf)};

    while(len<sizeof(buf)) {
        auto n = ::read(fd, buf+len, sizeof(buf)-len);
        if(n<0 && errno==EINTR) {
            continue;
        } else if(n<0) {
            auto err = errno;
            throw PackagingError(SB()<<"Unable to read password file \""<<path<<"\" : "<<strerror(err));
        } else if(n==0) {
            break;
        }
        len += size_t(n);
    }

    if(len>maxPassword)
        throw PackagingError(SB()<<"Password file \""<<path<<"\" longer than "<<maxPassword<<" bytes");

    if(len && buf[len-1u]=='\n') {
        len--;
        if(len && buf[len-1u]=='\r')
            len--;
    }

    if(len==0u)
        throw PackagingError(SB()<<"Empty password in \""<<path<<"\"");
    if(memchr(buf, '\0', len))
        throw PackagingError(SB()<<"Password file \""<<path<<"\" contains a nil character");

    log_debug_printf(_log, "Read password from %s\n", path.c_str());

    return Secret(buf, len);
}

bool needsLegacy(const std::vector<std::string>& consumers, const CapabilityTable& table)
{
    bool legacy = false;
    for(const auto& consumer : consumers) {
        auto it(table.find(consumer));
        if(it==table.end())
            throw ConfigError(SB()<<"Consumer \""<<consumer<<"\" does not appear in capability table");
        if(it->second==BundleMode::Legacy) {
            log_debug_printf(_log, "Consumer %s requires legacy PKCS#12\n", consumer.c_str());
            legacy = true;
        }
    }
    return legacy;
}

std::string encodeBundle(const Identity& id, const Secret& password, BundleMode mode)
{
    checkInputs(id, password);

    try {
        providers_setup();

        int nid_key, nid_cert;
        const EVP_MD *mac;
        switch(mode) {
        case BundleMode::Modern:
            nid_key = nid_cert = NID_aes_256_cbc;
            mac = EVP_sha256();
            break;
        case BundleMode::Legacy:
            if(!legacy_available())
                throw PackagingError(SB()<<"Legacy bundle for \""<<id.label<<"\" needs the OpenSSL \"legacy\" provider, which could not be loaded");
            nid_key = NID_pbe_WithSHA1And3_Key_TripleDES_CBC;
            nid_cert = NID_pbe_WithSHA1And40BitRC2_CBC;
            mac = EVP_sha1();
            break;
        default:
            throw std::logic_error("Invalid BundleMode");
        }

        owned_ptr<PKCS12> p12;
        {
            // MAC omitted (mac_iter=-1) here so that its digest can be chosen below
            auto raw = PKCS12_create_ex(password.c_str(),
                                        id.label.empty() ? nullptr : id.label.c_str(),
                                        id.key.get(),
                                        id.cert.get(),
                                        nullptr,
                                        nid_key, nid_cert,
                                        PKCS12_DEFAULT_ITER, -1, 0,
                                        nullptr, nullptr);
            if(!raw)
                throw SSLError(SB()<<"PKCS12_create_ex() "<<to_string(mode));
            p12.reset(raw);
        }

        MUST(1, PKCS12_set_mac(p12.get(), password.c_str(), -1, nullptr, 0, PKCS12_DEFAULT_ITER, mac));

        owned_ptr<unsigned char> buf;
        auto buflen = i2d_PKCS12(p12.get(), buf.acquire());
        if(buflen<=0)
            throw SSLError("i2d_PKCS12");

        return std::string(reinterpret_cast<const char*>(buf.get()), size_t(buflen));

    } catch(SSLError& e) {
        throw PackagingError(SB()<<"Unable to encode "<<to_string(mode)<<" bundle for \""<<id.label<<"\" : "<<e.what());
    }
}

Identity decodeBundle(const std::string& der, const Secret& password)
{
    try {
        providers_setup();

        auto p12(parseDER(der));
        verifyMAC(p12.get(), password);

        owned_ptr<EVP_PKEY> key;
        owned_ptr<X509> cert;
        owned_ptr<STACK_OF(X509)> CAs;

        if(!PKCS12_parse(p12.get(), password.c_str(), key.acquire(), cert.acquire(), CAs.acquire()))
            throw SSLError("Unable to decrypt PKCS#12 bundle");

        if(!key || !cert)
            throw SSLError("PKCS#12 bundle lacks key or certificate");

        Identity ret;
        {
            int len = 0;
            if(auto alias = X509_alias_get0(cert.get(), &len))
                ret.label = std::string(reinterpret_cast<const char*>(alias), size_t(len));
        }
        ret.key = share(std::move(key));
        ret.cert = share(std::move(cert));
        return ret;

    } catch(SSLError& e) {
        throw PackagingError(e.what());
    }
}

void packBundle(const Identity& id, const Secret& password, BundleMode mode, const std::string& path)
{
    auto der(encodeBundle(id, password, mode));

    // read back before writing.  Some consumers will only tell us by failing to connect.
    {
        auto check(decodeBundle(der, password));
        bool same;
        try {
            same = X509_cmp(check.cert.get(), id.cert.get())==0
                    && samePrivateKey(check.key.get(), id.key.get());
        } catch(SSLError& e) {
            throw PackagingError(SB()<<"Unable to compare "<<to_string(mode)<<" bundle for \""<<id.label<<"\" : "<<e.what());
        }
        if(!same) {
            ERR_clear_error();
            throw PackagingError(SB()<<to_string(mode)<<" bundle for \""<<id.label<<"\" decodes to a different key or certificate");
        }
    }

    try {
        impl::AtomicFile out(path, 0600);
        out.write(der);
        out.commit();
    } catch(std::runtime_error& e) {
        throw PackagingError(e.what());
    }

    log_info_printf(_log, "Wrote %s bundle %s for %s\n", to_string(mode), path.c_str(), id.label.c_str());
}

Identity loadBundle(const std::string& path, const Secret& password)
{
    std::string der;
    try {
        der = impl::readFile(path);
    } catch(std::runtime_error& e) {
        throw PackagingError(e.what());
    }

    try {
        auto ret(decodeBundle(der, password));
        log_debug_printf(_log, "Loaded bundle %s for %s\n", path.c_str(), ret.label.c_str());
        return ret;
    } catch(PackagingError& e) {
        throw PackagingError(SB()<<"\""<<path<<"\" : "<<e.what());
    }
}

BundleInfo describeBundle(const std::string& path, const Secret& password)
{
    std::string der;
    try {
        der = impl::readFile(path);
    } catch(std::runtime_error& e) {
        throw PackagingError(e.what());
    }

    try {
        providers_setup();

        auto p12(parseDER(der));
        verifyMAC(p12.get(), password);

        BundleInfo info;
        bool legacy = false;

        if(PKCS12_mac_present(p12.get())) {
            const X509_ALGOR *macalg = nullptr;
            const ASN1_INTEGER *iter = nullptr;
            PKCS12_get0_mac(nullptr, &macalg, nullptr, &iter, p12.get());
            if(macalg) {
                const ASN1_OBJECT *aobj = nullptr;
                X509_ALGOR_get0(&aobj, nullptr, nullptr, macalg);
                info.mac_digest = OBJ_nid2sn(OBJ_obj2nid(aobj));
            }
            // absent iterations field means one
            info.mac_iterations = iter ? ASN1_INTEGER_get(iter) : 1;
        }

        owned_ptr<STACK_OF(PKCS7)> safes(PKCS12_unpack_authsafes(p12.get()));

        for(int i=0, N=sk_PKCS7_num(safes.get()); i<N; i++) {
            auto p7 = sk_PKCS7_value(safes.get(), i);
            auto type(OBJ_obj2nid(p7->type));

            if(type==NID_pkcs7_encrypted) {
                // PKCS12_create() puts certificates in encrypted data
                auto alg = p7->d.encrypted->enc_data->algorithm;
                info.cert_alg = algName(alg);
                legacy |= isLegacyAlg(alg);

            } else if(type==NID_pkcs7_data) {
                // and the already shrouded key in plain data
                owned_ptr<STACK_OF(PKCS12_SAFEBAG)> bags(PKCS12_unpack_p7data(p7));
                for(int j=0, M=sk_PKCS12_SAFEBAG_num(bags.get()); j<M; j++) {
                    auto bag = sk_PKCS12_SAFEBAG_value(bags.get(), j);
                    if(PKCS12_SAFEBAG_get_nid(bag)!=NID_pkcs8ShroudedKeyBag)
                        continue;
                    const X509_ALGOR *alg = nullptr;
                    X509_SIG_get0(PKCS12_SAFEBAG_get0_pkcs8(bag), &alg, nullptr);
                    info.key_alg = algName(alg);
                    legacy |= isLegacyAlg(alg);
                }
            }
        }

        info.mode = legacy ? BundleMode::Legacy : BundleMode::Modern;
        return info;

    } catch(SSLError& e) {
        throw PackagingError(SB()<<"\""<<path<<"\" : "<<e.what());
    }
}

} // namespace trustgen
