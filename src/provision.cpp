/**
 * Copyright - See the COPYRIGHT that is included with this distribution.
 * trustgen is distributed subject to a Software License Agreement found
 * in file LICENSE that is included with this distribution.
 */

#include <trustgen/log.h>
#include <trustgen/provision.h>
#include "utilpvt.h"

DEFINE_LOGGER(_log, "trustgen.provision");

namespace trustgen {
using impl::SB;

namespace {

template<typename Fn>
void runStep(unsigned step, const std::string& party, Fn&& fn)
{
    log_info_printf(_log, "Step %u/%u %s : %s\n", step, provisionSteps, party.c_str(), stepName(step));
    try {
        fn();
        log_info_printf(_log, "Step %u/%u %s : %s complete\n", step, provisionSteps, party.c_str(), stepName(step));
    } catch(Error& e) {
        log_err_printf(_log, "Step %u/%u %s : %s failed : %s\n",
                       step, provisionSteps, party.c_str(), stepName(step), e.what());
        throw ProvisionError(step, party,
                             SB()<<"Step "<<step<<" ("<<stepName(step)<<") failed for "<<party<<" : "<<e.what(),
                             std::current_exception());
    }
}

void generateParty(unsigned step, const PartyPlan& party, Identity& id, ProvisionReport& report)
{
    // always from scratch.  Nothing from an earlier run is reused.
    id = generateIdentity(party.label, party.subject);
    writeIdentity(id, party.key, party.cert);

    report.artifacts.push_back(Artifact{step, party.name, "key", party.key});
    report.artifacts.push_back(Artifact{step, party.name, "cert", party.cert});
}

bool packageParty(unsigned step, const PartyPlan& party, const Identity& id,
                  const CapabilityTable& caps, const Secret& password, ProvisionReport& report)
{
    packBundle(id, password, BundleMode::Modern, party.bundle);
    report.artifacts.push_back(Artifact{step, party.name, "modern bundle", party.bundle});

    bool legacy = needsLegacy(party.consumers, caps);
    if(legacy) {
        packBundle(id, password, BundleMode::Legacy, party.legacy_bundle);
        report.artifacts.push_back(Artifact{step, party.name, "legacy bundle", party.legacy_bundle});

    } else if(!party.legacy_bundle.empty() && impl::fileExists(party.legacy_bundle)) {
        log_warn_printf(_log, "%s : no consumer needs legacy bundle.  %s is from an earlier run and is now stale\n",
                        party.name.c_str(), party.legacy_bundle.c_str());
    }
    return legacy;
}

void exportPeerCertificate(const Identity& server, const std::string& path)
{
    try {
        impl::AtomicFile out(path, 0644);
        out.write(certificatePEM(server.cert.get()));
        out.commit();
    } catch(Error&) {
        throw;
    } catch(std::runtime_error& e) {
        throw ExportError(path, e.what());
    }
}

} // namespace

const char* stepName(unsigned step)
{
    switch(step) {
    case 1u: return "generate identity";
    case 2u: return "package bundles";
    case 3u: return "export certificate to peer trust store";
    case 4u: return "generate identity";
    case 5u: return "package bundles";
    case 6u: return "export fingerprint to allowlist";
    default: return "<invalid step>";
    }
}

ProvisionError::ProvisionError(unsigned step, const std::string& party, const std::string& msg,
                               std::exception_ptr cause)
    :Error(msg)
    ,_step(step)
    ,_party(party)
    ,_cause(cause)
{}

ProvisionError::~ProvisionError() {}

ProvisionReport provision(const ProvisionPlan& plan)
{
    plan.validate();

    const auto& sname = plan.server.name;
    const auto& cname = plan.client.name;

    ProvisionReport report;
    Identity server, client;
    Secret serverPass;

    runStep(1u, sname, [&]() {
        generateParty(1u, plan.server, server, report);
    });

    runStep(2u, sname, [&]() {
        serverPass = readPassword(plan.server.password_file);
        report.server_legacy = packageParty(2u, plan.server, server, plan.capabilities, serverPass, report);
    });

    runStep(3u, sname, [&]() {
        exportPeerCertificate(server, plan.trusted_peer);
        report.artifacts.push_back(Artifact{3u, sname, "trusted peer cert", plan.trusted_peer});
    });

    // Server key is no longer needed
    server.key.reset();

    runStep(4u, cname, [&]() {
        generateParty(4u, plan.client, client, report);
    });

    runStep(5u, cname, [&]() {
        auto clientPass(readPassword(plan.client.password_file));
        if(!plan.shared_password && clientPass==serverPass)
            throw PackagingError(SB()<<sname<<" and "<<cname<<" use the same bundle password."
                                 "  Set shared_password = yes if this is necessary");
        serverPass.clear();

        report.client_legacy = packageParty(5u, plan.client, client, plan.capabilities, clientPass, report);
    });

    runStep(6u, cname, [&]() {
        report.client_record = exportFingerprint(client.cert.get(), plan.allowlist_label,
                                                 plan.allowlist, plan.fingerprint_format);
        report.artifacts.push_back(Artifact{6u, cname, "allowlist", plan.allowlist});
    });

    log_info_printf(_log, "Provisioned %s and %s\n", sname.c_str(), cname.c_str());

    return report;
}

} // namespace trustgen
