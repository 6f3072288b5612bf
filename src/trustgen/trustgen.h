/**
 * Copyright - See the COPYRIGHT that is included with this distribution.
 * trustgen is distributed subject to a Software License Agreement found
 * in file LICENSE that is included with this distribution.
 */

#ifndef TRUSTGEN_TRUSTGEN_H
#define TRUSTGEN_TRUSTGEN_H

#include <memory>
#include <stdexcept>
#include <string>

#include <openssl/types.h>

#include <trustgen/version.h>

namespace trustgen {

/** Longest certificate validity accepted by any consumer.
 *
 *  Apple platforms reject TLS server certificates valid for more than 825 days.
 */
constexpr unsigned maxValidityDays = 825u;

//! RSA modulus size for all generated keys
constexpr int rsaKeyBits = 4096;

//! Base of all errors thrown by trustgen
struct TRUSTGEN_API Error : public std::runtime_error {
    explicit Error(const std::string& msg);
    virtual ~Error();
};

//! Invalid subject, validity, digest, or provisioning plan.  Raised before any key is generated.
struct TRUSTGEN_API ConfigError : public Error {
    explicit ConfigError(const std::string& msg);
    virtual ~ConfigError();
};

//! Key generation, certificate signing, or writing of key/certificate failed.
struct TRUSTGEN_API GenerationError : public Error {
    explicit GenerationError(const std::string& msg);
    virtual ~GenerationError();
};

//! A PKCS#12 bundle could not be produced or loaded.
struct TRUSTGEN_API PackagingError : public Error {
    explicit PackagingError(const std::string& msg);
    virtual ~PackagingError();
};

//! Allowlist or trust store file could not be read or written.
struct TRUSTGEN_API ExportError : public Error {
    ExportError(const std::string& path, const std::string& msg);
    virtual ~ExportError();

    //! The file which could not be read or written
    const std::string& path() const { return _path; }
private:
    std::string _path;
};

/** The key pair and self-signed certificate of one party.
 *
 *  Created by generateIdentity() or loadBundle().  Not modified afterwards.
 */
struct TRUSTGEN_API Identity {
    //! Party name.  Also used as the PKCS#12 friendlyName
    std::string label;
    std::shared_ptr<EVP_PKEY> key;
    std::shared_ptr<X509> cert;

    //! Has both key and certificate
    explicit operator bool() const { return key && cert; }
};

} // namespace trustgen

#endif // TRUSTGEN_TRUSTGEN_H
