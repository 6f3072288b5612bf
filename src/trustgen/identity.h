/**
 * Copyright - See the COPYRIGHT that is included with this distribution.
 * trustgen is distributed subject to a Software License Agreement found
 * in file LICENSE that is included with this distribution.
 */

#ifndef TRUSTGEN_IDENTITY_H
#define TRUSTGEN_IDENTITY_H

#include <string>
#include <utility>
#include <vector>

#include <trustgen/trustgen.h>

namespace trustgen {

/** Subject and validity of a self-signed certificate.
 *
 *  Usually read from an "openssl req" style configuration file.
 *
 *  @code
 *  [req]
 *  distinguished_name = req_distinguished_name
 *  x509_extensions = v3_req
 *  default_md = sha256
 *
 *  [req_distinguished_name]
 *  O = MyCompany
 *  CN = signer.local
 *
 *  [v3_req]
 *  extendedKeyUsage = serverAuth
 *  subjectAltName = @alt_names
 *
 *  [alt_names]
 *  DNS.1 = signer.local
 *  @endcode
 */
struct TRUSTGEN_API SubjectConfig {
    //! Distinguished name entries, in order.  eg. {"CN", "signer.local"}
    std::vector<std::pair<std::string, std::string>> name;
    /** x509v3_config style extensions, in order.  eg. {"extendedKeyUsage", "serverAuth"}
     *
     *  When empty, basicConstraints=CA:FALSE is added.
     *  subjectKeyIdentifier and authorityKeyIdentifier are added unless given.
     */
    std::vector<std::pair<std::string, std::string>> extensions;
    //! notAfter - notBefore.  1 through maxValidityDays
    unsigned validity_days = maxValidityDays;
    //! Self-signature digest.  One of sha256, sha384, or sha512
    std::string digest = "sha256";
    //! Must be rsaKeyBits
    int key_bits = rsaKeyBits;
    //! Where this configuration came from, for error messages
    std::string origin;

    //! Subject with only a commonName
    static SubjectConfig commonName(const std::string& cn);

    /** Parse an "openssl req" style configuration file.
     *
     *  @throws ConfigError if the file can not be parsed, or if validate() fails
     */
    static SubjectConfig fromFile(const std::string& path);

    /** Check against consumer constraints.
     *
     *  @throws ConfigError on unknown or malformed subject field, empty subject,
     *          validity longer than maxValidityDays, a digest other than SHA-2,
     *          or a key size other than rsaKeyBits.
     */
    void validate() const;
};

/** Generate a new RSA key pair and a certificate self-signed by it.
 *
 *  SubjectConfig::validate() is called before any key material is generated.
 *  notBefore is the current time and notAfter is exactly validity_days later.
 *
 *  @throws ConfigError from SubjectConfig::validate()
 *  @throws GenerationError on any failure to generate or sign.
 */
TRUSTGEN_API
Identity generateIdentity(const std::string& label, const SubjectConfig& subject);

/** Write private key (PKCS#8 PEM, unencrypted, mode 0600) and certificate (PEM)
 *  to separate files.
 *
 *  Both files are written to temporaries first.  Neither is left in place
 *  unless both are written.
 *
 *  @throws GenerationError
 */
TRUSTGEN_API
void writeIdentity(const Identity& id, const std::string& keyfile, const std::string& certfile);

//! Read PEM certificate.  @throws Error
TRUSTGEN_API
std::shared_ptr<X509> readCertificate(const std::string& certfile);

//! Read PEM private key.  @throws Error
TRUSTGEN_API
std::shared_ptr<EVP_PKEY> readPrivateKey(const std::string& keyfile);

//! PEM encoding of a certificate
TRUSTGEN_API
std::string certificatePEM(const X509* cert);

/** Time between notBefore and notAfter.
 *
 *  @returns (days, seconds) with seconds < 86400
 */
TRUSTGEN_API
std::pair<int, int> validityPeriod(const X509* cert);

//! Subject, issuer and validity for display
TRUSTGEN_API
std::string describeCertificate(const X509* cert);

} // namespace trustgen

#endif // TRUSTGEN_IDENTITY_H
