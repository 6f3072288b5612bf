/**
 * Copyright - See the COPYRIGHT that is included with this distribution.
 * trustgen is distributed subject to a Software License Agreement found
 * in file LICENSE that is included with this distribution.
 */

#ifndef TRUSTGEN_OSSL_H
#define TRUSTGEN_OSSL_H

#include <iosfwd>
#include <memory>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <typeinfo>

#include <openssl/asn1.h>
#include <openssl/bio.h>
#include <openssl/bn.h>
#include <openssl/conf.h>
#include <openssl/evp.h>
#include <openssl/pkcs12.h>
#include <openssl/x509.h>
#include <openssl/x509v3.h>

#include <trustgen/trustgen.h>

namespace trustgen {
namespace ossl {

// cleanup hooks for use with std::unique_ptr
template<typename T>
struct ssl_delete;
#define DEFINE_DELETE(TYPE) \
    template<> \
    struct ssl_delete<TYPE> { \
        inline void operator()(TYPE* fp) { if(fp) TYPE ## _free(fp); } \
    }
DEFINE_DELETE(BIO);
DEFINE_DELETE(ASN1_OBJECT);
DEFINE_DELETE(ASN1_INTEGER);
static_assert(std::is_same<ASN1_INTEGER, ASN1_TIME>::value, "");
DEFINE_DELETE(PKCS12);
DEFINE_DELETE(PKCS7);
DEFINE_DELETE(PBE2PARAM);
DEFINE_DELETE(EVP_PKEY_CTX);
DEFINE_DELETE(EVP_PKEY);
DEFINE_DELETE(X509);
DEFINE_DELETE(X509_NAME);
DEFINE_DELETE(X509_EXTENSION);
#undef DEFINE_DELETE
template<>
struct ssl_delete<BIGNUM> {
    inline void operator()(BIGNUM* bn) { if(bn) BN_free(bn); }
};
template<>
struct ssl_delete<CONF> {
    inline void operator()(CONF* conf) { if(conf) NCONF_free(conf); }
};
template<>
struct ssl_delete<unsigned char> {
    inline void operator()(unsigned char *buf) { if(buf) OPENSSL_free(buf); }
};
template<>
struct ssl_delete<STACK_OF(X509)> {
    inline void operator()(STACK_OF(X509)* sk) { if(sk) sk_X509_pop_free(sk, &X509_free); }
};
template<>
struct ssl_delete<STACK_OF(PKCS7)> {
    inline void operator()(STACK_OF(PKCS7)* sk) { if(sk) sk_PKCS7_pop_free(sk, &PKCS7_free); }
};
template<>
struct ssl_delete<STACK_OF(PKCS12_SAFEBAG)> {
    inline void operator()(STACK_OF(PKCS12_SAFEBAG)* sk) { if(sk) sk_PKCS12_SAFEBAG_pop_free(sk, &PKCS12_SAFEBAG_free); }
};

/** Collects, and clears, the OpenSSL error queue into the exception message.
 *
 *  Components translate SSLError into one of the public Error kinds
 *  at their boundary.
 */
struct SSLError : public std::runtime_error {
    explicit
    SSLError(const std::string& msg);
    virtual ~SSLError();
};

// ~= std::unique_ptr with a NULL check in the ctor
template<typename T>
struct owned_ptr : public std::unique_ptr<T, ssl_delete<T>>
{
    constexpr owned_ptr() {}
    constexpr owned_ptr(std::nullptr_t np) : std::unique_ptr<T, ssl_delete<T>>(np) {}
    explicit owned_ptr(T* ptr) : std::unique_ptr<T, ssl_delete<T>>(ptr) {
        if(!*this)
            throw SSLError(std::string("Can't alloc ")+typeid(ptr).name());
    }

    // for functions which return a pointer in an argument
    //   int some(T** presult); // store *presult = output
    // use like
    //   owned_ptr<T> x;
    //   some(x.acquire());
    struct acquisition {
        owned_ptr<T>* o;
        T* ptr = nullptr;
        operator T** () { return &ptr; }
        constexpr acquisition(owned_ptr<T>* o) :o(o) {}
        ~acquisition() {
            o->reset(ptr);
        }
    };
    acquisition acquire() { return acquisition{this}; }
};

// many openssl calls return 1 (or sometimes zero) on success.
void _must_equal(int line, int expect, int actual, const char *expr);
#define _MUST_STR(STR) #STR
#define MUST(EXPECT, ...) ::trustgen::ossl::_must_equal(__LINE__, EXPECT, __VA_ARGS__, _MUST_STR(__VA_ARGS__))

// adopt into the shared_ptr held by Identity
std::shared_ptr<EVP_PKEY> share(owned_ptr<EVP_PKEY>&& key);
std::shared_ptr<X509> share(owned_ptr<X509>&& cert);

/** Load the "default" and "legacy" providers into the default library context.
 *
 *  Once any provider is loaded explicitly, "default" is no longer loaded implicitly.
 *  So both are loaded together.  A missing "legacy" provider is not an error
 *  until a legacy algorithm is requested.
 */
void providers_setup();

//! Was the "legacy" provider loaded?  Calls providers_setup()
bool legacy_available();

// print subject, issuer, and validity range
struct ShowX509 { const X509* cert; };
std::ostream& operator<<(std::ostream& strm, const ShowX509& cert);

} // namespace ossl
} // namespace trustgen

#endif // TRUSTGEN_OSSL_H
