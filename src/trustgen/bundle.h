/**
 * Copyright - See the COPYRIGHT that is included with this distribution.
 * trustgen is distributed subject to a Software License Agreement found
 * in file LICENSE that is included with this distribution.
 */

#ifndef TRUSTGEN_BUNDLE_H
#define TRUSTGEN_BUNDLE_H

#include <map>
#include <string>
#include <vector>

#include <trustgen/trustgen.h>

namespace trustgen {

/** PKCS#12 algorithm suite.
 *
 *  Always selected explicitly, never left to the OpenSSL default of the day.
 */
enum class BundleMode {
    /** PBES2 (PBKDF2 w/ HMAC-SHA256) with AES-256-CBC for key and certificate bags.
     *  HMAC-SHA256 integrity.
     */
    Modern,
    /** pbeWithSHA1And3-KeyTripleDES-CBC key bag, pbeWithSHA1And40BitRC2-CBC certificate bag.
     *  HMAC-SHA1 integrity.  What "openssl pkcs12 -export -legacy" writes.
     *  The only suite some native frameworks (eg. Apple Security Framework) can parse.
     */
    Legacy,
};

TRUSTGEN_API
const char* to_string(BundleMode mode);

/** Parse "modern" or "legacy"
 *  @throws ConfigError
 */
TRUSTGEN_API
BundleMode parseBundleMode(const std::string& mode);

/** A bundle password.
 *
 *  Storage is cleansed on destruction.  Never logged.
 */
class TRUSTGEN_API Secret {
    std::vector<char> buf; // includes trailing nil when !empty()
public:
    Secret() = default;
    explicit Secret(const std::string& value);
    Secret(const char *value, size_t len);
    Secret(Secret&& o) noexcept;
    Secret& operator=(Secret&& o) noexcept;
    Secret(const Secret&) = delete;
    Secret& operator=(const Secret&) = delete;
    ~Secret();

    void clear();
    bool empty() const { return buf.size()<=1u; }
    size_t size() const { return empty() ? 0u : buf.size()-1u; }
    const char* c_str() const { return empty() ? "" : buf.data(); }

    bool operator==(const Secret& o) const;
    bool operator!=(const Secret& o) const { return !(*this==o); }
};

/** Read a password file.
 *
 *  The file holds a single secret value.  One trailing newline ("\n" or "\r\n") is removed.
 *  Any further trailing newlines are kept as part of the password,
 *  where shell "$(cat file)" would strip them all.
 *
 *  @throws PackagingError if the file can not be read, or the password is empty.
 */
TRUSTGEN_API
Secret readPassword(const std::string& path);

//! Consumer name -> the PKCS#12 suite that consumer is able to parse
typedef std::map<std::string, BundleMode> CapabilityTable;

/** Does any of these consumers require a Legacy bundle?
 *
 *  @throws ConfigError if a consumer name does not appear in the table.
 */
TRUSTGEN_API
bool needsLegacy(const std::vector<std::string>& consumers, const CapabilityTable& table);

/** Write a password protected PKCS#12 bundle of key and certificate.
 *
 *  The key must match the certificate.  The encoded bundle is decoded again,
 *  and compared with the inputs, before anything is written.
 *  The friendlyName is taken from Identity::label.
 *
 *  @throws PackagingError.  Nothing is written.
 */
TRUSTGEN_API
void packBundle(const Identity& id, const Secret& password, BundleMode mode, const std::string& path);

/** Encode, but do not write, a PKCS#12 bundle.
 *
 *  @throws PackagingError
 */
TRUSTGEN_API
std::string encodeBundle(const Identity& id, const Secret& password, BundleMode mode);

/** Decrypt a PKCS#12 bundle file.
 *
 *  @throws PackagingError for unreadable file, wrong password, or missing key or certificate.
 */
TRUSTGEN_API
Identity loadBundle(const std::string& path, const Secret& password);

//! Decode an in-memory PKCS#12 bundle.  @throws PackagingError
TRUSTGEN_API
Identity decodeBundle(const std::string& der, const Secret& password);

//! Algorithms found in a PKCS#12 bundle
struct TRUSTGEN_API BundleInfo {
    //! eg. "PBES2/AES-256-CBC" or "pbeWithSHA1And3-KeyTripleDES-CBC"
    std::string key_alg;
    //! eg. "PBES2/AES-256-CBC" or "pbeWithSHA1And40BitRC2-CBC"
    std::string cert_alg;
    //! eg. "SHA256" or "SHA1".  Empty if no MAC
    std::string mac_digest;
    long mac_iterations = 0;
    //! Legacy if any bag uses a PKCS#12 v1 PBE algorithm
    BundleMode mode = BundleMode::Modern;
};

/** Inspect algorithms used by a bundle.  The MAC is verified with the password.
 *
 *  @throws PackagingError
 */
TRUSTGEN_API
BundleInfo describeBundle(const std::string& path, const Secret& password);

} // namespace trustgen

#endif // TRUSTGEN_BUNDLE_H
