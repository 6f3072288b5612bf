/**
 * Copyright - See the COPYRIGHT that is included with this distribution.
 * trustgen is distributed subject to a Software License Agreement found
 * in file LICENSE that is included with this distribution.
 */

#ifndef TRUSTGEN_ALLOWLIST_H
#define TRUSTGEN_ALLOWLIST_H

#include <string>
#include <vector>

#include <trustgen/trustgen.h>

namespace trustgen {

//! Textual form of a SHA-256 fingerprint
enum class FingerprintFormat {
    //! Upper case hex pairs separated by ':'.  As printed by "openssl x509 -fingerprint -sha256"
    Colon,
    //! Lower case hex, no separators
    Plain,
};

TRUSTGEN_API
const char* to_string(FingerprintFormat fmt);

/** Parse "colon" or "plain"
 *  @throws ConfigError
 */
TRUSTGEN_API
FingerprintFormat parseFingerprintFormat(const std::string& fmt);

//! Format digest bytes
TRUSTGEN_API
std::string formatFingerprint(const unsigned char *digest, size_t len, FingerprintFormat fmt);

/** SHA-256 digest of the DER encoded certificate.
 *  @throws Error
 */
TRUSTGEN_API
std::string fingerprint(const X509* cert, FingerprintFormat fmt);

//! One line of a TrustAllowlist
struct TRUSTGEN_API TrustRecord {
    std::string label;
    std::string fingerprint;

    //! "<label> <fingerprint>" without newline
    std::string line() const;
};

/** The client certificates a server will accept.
 *
 *  One record per line, "<label> <fingerprint>\n", kept in the order
 *  records were first added.  Each label appears at most once.
 */
class TRUSTGEN_API TrustAllowlist {
    std::vector<TrustRecord> recs;
public:
    /** Read an allowlist file.  A missing file is an empty list.  Blank lines are ignored.
     *
     *  Should a label appear more than once, the first line is kept.
     *
     *  @throws ExportError if the file can not be read, or has a malformed line.
     */
    static TrustAllowlist load(const std::string& path);

    /** Set the fingerprint for label.
     *
     *  Replaces an existing record in place, or appends a new record.
     *
     *  @returns true if the list changed.
     *  @throws ExportError on an empty label, or a label or fingerprint containing whitespace.
     */
    bool upsert(const std::string& label, const std::string& fingerprint);

    //! Remove the record for label.  @returns true if found
    bool erase(const std::string& label);

    //! NULL if label not present
    const TrustRecord* find(const std::string& label) const;

    const std::vector<TrustRecord>& records() const { return recs; }
    size_t size() const { return recs.size(); }

    //! File content
    std::string str() const;

    /** Replace file content by way of a temporary.
     *  @throws ExportError
     */
    void save(const std::string& path) const;
};

/** Write, or replace, the allowlist entry for a certificate.
 *
 *  Idempotent.  Running again with a regenerated certificate replaces the stale entry.
 *
 *  @returns The record written
 *  @throws ExportError
 */
TRUSTGEN_API
TrustRecord exportFingerprint(const X509* cert, const std::string& label,
                              const std::string& path, FingerprintFormat fmt);

} // namespace trustgen

#endif // TRUSTGEN_ALLOWLIST_H
