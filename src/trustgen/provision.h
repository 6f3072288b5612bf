/**
 * Copyright - See the COPYRIGHT that is included with this distribution.
 * trustgen is distributed subject to a Software License Agreement found
 * in file LICENSE that is included with this distribution.
 */

#ifndef TRUSTGEN_PROVISION_H
#define TRUSTGEN_PROVISION_H

#include <exception>
#include <string>
#include <vector>

#include <trustgen/trustgen.h>
#include <trustgen/identity.h>
#include <trustgen/bundle.h>
#include <trustgen/allowlist.h>

namespace trustgen {

//! Outputs and inputs of one party
struct TRUSTGEN_API PartyPlan {
    //! Plan section name.  eg. "web3signer"
    std::string name;
    //! PKCS#12 friendlyName.  Defaults to name
    std::string label;
    SubjectConfig subject;
    //! Private key (PEM) output
    std::string key;
    //! Certificate (PEM) output
    std::string cert;
    //! Modern PKCS#12 bundle output
    std::string bundle;
    //! Legacy PKCS#12 bundle output.  Needed only if some consumer is legacy-only
    std::string legacy_bundle;
    //! Holds the bundle password
    std::string password_file;
    //! Names from ProvisionPlan::capabilities
    std::vector<std::string> consumers;
};

/** Everything needed to provision a Server/Client pair.
 *
 *  @code
 *  [provision]
 *  server = web3signer
 *  client = lighthouse
 *
 *  [consumers]
 *  web3signer-java = modern
 *  lighthouse-macos = legacy
 *
 *  [web3signer]
 *  subject = web3signer/config
 *  key = web3signer/key.key
 *  cert = web3signer/cert.pem
 *  bundle = web3signer/key.p12
 *  password_file = web3signer/password.txt
 *  consumers = web3signer-java
 *  allowlist = web3signer/known_clients.txt
 *
 *  [lighthouse]
 *  subject = lighthouse/config
 *  key = lighthouse/key.key
 *  cert = lighthouse/cert.pem
 *  bundle = lighthouse/key.p12
 *  legacy_bundle = lighthouse/key_legacy.p12
 *  password_file = lighthouse/password.txt
 *  consumers = lighthouse-macos
 *  trusted_peer = lighthouse/web3signer.pem
 *  @endcode
 */
struct TRUSTGEN_API ProvisionPlan {
    PartyPlan server, client;
    CapabilityTable capabilities;
    //! Server's TrustAllowlist, which will hold the Client fingerprint
    std::string allowlist;
    //! Allowlist label of the Client.  Defaults to client.name
    std::string allowlist_label;
    //! Where Client's trust store expects Server's certificate
    std::string trusted_peer;
    FingerprintFormat fingerprint_format = FingerprintFormat::Colon;
    //! Permit both parties to use the same password file
    bool shared_password = false;

    /** Read a plan file.
     *
     *  Relative paths are resolved against basedir, or the directory containing the plan.
     *
     *  @throws ConfigError
     */
    static ProvisionPlan fromFile(const std::string& path, const std::string& basedir = std::string());

    //! @throws ConfigError
    void validate() const;
};

//! Number of steps in a provisioning run
constexpr unsigned provisionSteps = 6u;

//! eg. "generate identity"
TRUSTGEN_API
const char* stepName(unsigned step);

/** A provisioning step failed.
 *
 *  Outputs of earlier steps are left in place.
 */
struct TRUSTGEN_API ProvisionError : public Error {
    ProvisionError(unsigned step, const std::string& party, const std::string& msg,
                   std::exception_ptr cause);
    virtual ~ProvisionError();

    //! 1 through provisionSteps
    unsigned step() const { return _step; }
    const std::string& party() const { return _party; }
    //! The ConfigError, GenerationError, PackagingError, or ExportError
    std::exception_ptr cause() const { return _cause; }
private:
    unsigned _step;
    std::string _party;
    std::exception_ptr _cause;
};

//! A file produced by provision()
struct TRUSTGEN_API Artifact {
    unsigned step;
    std::string party;
    //! eg. "key", "cert", "modern bundle"
    std::string kind;
    std::string path;
};

struct TRUSTGEN_API ProvisionReport {
    std::vector<Artifact> artifacts;
    //! Entry written to the Server allowlist
    TrustRecord client_record;
    bool server_legacy = false;
    bool client_legacy = false;
};

/** Provision Server and Client in order.
 *
 *  1. generate Server identity
 *  2. package Server bundles
 *  3. export Server certificate to the Client trust store
 *  4. generate Client identity
 *  5. package Client bundles
 *  6. export Client fingerprint to the Server allowlist
 *
 *  @throws ConfigError from ProvisionPlan::validate(), before step 1
 *  @throws ProvisionError on the first failing step.  Later steps are not attempted.
 */
TRUSTGEN_API
ProvisionReport provision(const ProvisionPlan& plan);

} // namespace trustgen

#endif // TRUSTGEN_PROVISION_H
