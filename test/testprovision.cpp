/**
 * Copyright - See the COPYRIGHT that is included with this distribution.
 * trustgen is distributed subject to a Software License Agreement found
 * in file LICENSE that is included with this distribution.
 */

#include <openssl/x509.h>

#include <testMain.h>
#include <epicsUnitTest.h>

#include <trustgen/unittest.h>
#include <trustgen/provision.h>

#include "testutil.h"

using namespace trustgen;

namespace {

const char planHead[] =
    "[provision]\n"
    "server = web3signer\n"
    "client = lighthouse\n";

const char planBody[] =
    "\n"
    "[consumers]\n"
    "web3signer-java = modern\n"
    "lighthouse-linux = modern\n"
    "lighthouse-macos = legacy\n"
    "\n"
    "[web3signer]\n"
    "subject = web3signer/config\n"
    "key = web3signer/key.key\n"
    "cert = web3signer/cert.pem\n"
    "bundle = web3signer/key.p12\n"
    "legacy_bundle = web3signer/key_legacy.p12\n"
    "password_file = web3signer/password.txt\n"
    "consumers = web3signer-java\n"
    "allowlist = web3signer/known_clients.txt\n"
    "\n"
    "[lighthouse]\n"
    "subject = lighthouse/config\n"
    "key = lighthouse/key.key\n"
    "cert = lighthouse/cert.pem\n"
    "bundle = lighthouse/key.p12\n"
    "legacy_bundle = lighthouse/key_legacy.p12\n"
    "password_file = lighthouse/password.txt\n"
    "consumers = lighthouse-linux, lighthouse-macos\n"
    "trusted_peer = lighthouse/web3signer.pem\n";

/* Lay out a working directory.
 *   <dir>/plan.cnf
 *   <dir>/web3signer/config
 *   <dir>/web3signer/password.txt
 *   <dir>/lighthouse/config
 *   <dir>/lighthouse/password.txt
 */
void layout(const TempDir& tmp, const std::string& extra = std::string(), const std::string& body = planBody)
{
    for(auto dir : {"web3signer", "lighthouse"}) {
        if(::mkdir((tmp/dir).c_str(), 0755) && errno!=EEXIST)
            throw std::runtime_error("mkdir "+(tmp/dir));
    }

    writeText(tmp/"plan.cnf", std::string(planHead)+extra+body);

    writeText(tmp/"web3signer/config",
              "[req]\n"
              "distinguished_name = dn\n"
              "x509_extensions = v3_req\n"
              "\n"
              "[dn]\n"
              "O = Web3Signer\n"
              "CN = web3signer\n"
              "\n"
              "[v3_req]\n"
              "extendedKeyUsage = serverAuth\n"
              "subjectAltName = @alt_names\n"
              "\n"
              "[alt_names]\n"
              "DNS.1 = localhost\n"
              "IP.1 = 127.0.0.1\n");
    writeText(tmp/"web3signer/password.txt", "signer-secret\n");

    writeText(tmp/"lighthouse/config",
              "[req]\n"
              "distinguished_name = dn\n"
              "\n"
              "[dn]\n"
              "CN = lighthouse\n");
    writeText(tmp/"lighthouse/password.txt", "p@ss\n");
}

std::string allowlistLine(const std::string& certfile)
{
    auto cert(readCertificate(certfile));
    return "lighthouse "+fingerprint(cert.get(), FingerprintFormat::Colon);
}

void testPlanFile()
{
    testDiag("%s", __func__);
    TempDir tmp;
    layout(tmp, "validity_days = 400\n");

    auto plan(ProvisionPlan::fromFile(tmp/"plan.cnf"));

    testEq(plan.server.name, "web3signer");
    testEq(plan.server.label, "web3signer");
    testEq(plan.client.name, "lighthouse");
    testEq(plan.server.key, tmp/"web3signer/key.key");
    testEq(plan.client.legacy_bundle, tmp/"lighthouse/key_legacy.p12");
    testEq(plan.allowlist, tmp/"web3signer/known_clients.txt");
    testEq(plan.trusted_peer, tmp/"lighthouse/web3signer.pem");
    testEq(plan.allowlist_label, "lighthouse");
    testTrue(plan.fingerprint_format==FingerprintFormat::Colon);
    testFalse(plan.shared_password);
    testEq(plan.capabilities.size(), 3u);
    if(testEq(plan.client.consumers.size(), 2u)) {
        testEq(plan.client.consumers[0], "lighthouse-linux");
        testEq(plan.client.consumers[1], "lighthouse-macos");
    }
    testEq(plan.server.subject.validity_days, 400u);
    testEq(plan.client.subject.validity_days, 400u);
    testEq(plan.server.subject.extensions.size(), 2u);

    // plan kept apart from the directory it describes
    testEq(::mkdir((tmp/"plans").c_str(), 0755), 0);
    writeText(tmp/"plans/plan.cnf", readText(tmp/"plan.cnf"));

    testThrows<ConfigError>([&tmp]() {
        ProvisionPlan::fromFile(tmp/"plans/plan.cnf");
    })<<"subject config relative to plans/";

    auto moved(ProvisionPlan::fromFile(tmp/"plans/plan.cnf", tmp.path));
    testEq(moved.server.key, tmp/"web3signer/key.key");
    testEq(moved.server.subject.origin, tmp/"web3signer/config");
}

void testPlanErrors()
{
    testDiag("%s", __func__);
    TempDir tmp;

    layout(tmp, "validity_days = 900\n");
    testThrows<ConfigError>([&tmp]() {
        ProvisionPlan::fromFile(tmp/"plan.cnf");
    })<<"validity_days = 900";

    layout(tmp, "fingerprint_format = base64\n");
    testThrows<ConfigError>([&tmp]() {
        ProvisionPlan::fromFile(tmp/"plan.cnf");
    })<<"fingerprint_format = base64";

    layout(tmp, "allowlist_label = light house\n");
    testThrows<ConfigError>([&tmp]() {
        ProvisionPlan::fromFile(tmp/"plan.cnf");
    })<<"label with space";

    testThrows<ConfigError>([&tmp]() {
        ProvisionPlan::fromFile(tmp/"nonexistent.cnf");
    })<<"missing plan";

    layout(tmp);
    {
        auto plan(ProvisionPlan::fromFile(tmp/"plan.cnf"));

        auto bad(plan);
        bad.client.legacy_bundle.clear();
        testThrows<ConfigError>([&bad]() { bad.validate(); })<<"legacy consumer without legacy_bundle";

        bad = plan;
        bad.server.consumers.push_back("web3signer-windows");
        testThrows<ConfigError>([&bad]() { bad.validate(); })<<"unknown consumer";

        bad = plan;
        bad.client.password_file = bad.server.password_file;
        testThrows<ConfigError>([&bad]() { bad.validate(); })<<"same password file";
        bad.shared_password = true;
        bad.validate();
        testPass("same password file with shared_password");

        bad = plan;
        bad.client.bundle = bad.server.bundle;
        testThrows<ConfigError>([&bad]() { bad.validate(); })<<"same bundle output";

        bad = plan;
        bad.trusted_peer = bad.server.cert;
        testThrows<ConfigError>([&bad]() { bad.validate(); })<<"trusted_peer overwrites server cert";

        bad = plan;
        bad.trusted_peer = bad.client.password_file;
        testThrows<ConfigError>([&bad]() { bad.validate(); })<<"trusted_peer overwrites client password";

        bad = plan;
        bad.allowlist = bad.server.subject.origin;
        testThrows<ConfigError>([&bad]() { bad.validate(); })<<"allowlist overwrites server subject config";

        bad = plan;
        bad.client.key = bad.server.password_file;
        testThrows<ConfigError>([&bad]() { bad.validate(); })<<"client key overwrites server password";

        bad = plan;
        bad.client.subject.digest = "sha1";
        testThrows<ConfigError>([&bad]() { bad.validate(); })<<"client digest sha1";

        bad = plan;
        bad.client.name = bad.server.name;
        testThrows<ConfigError>([&bad]() { bad.validate(); })<<"client is server";
    }

    writeText(tmp/"noclient.cnf",
              "[provision]\n"
              "server = web3signer\n");
    testThrows<ConfigError>([&tmp]() {
        ProvisionPlan::fromFile(tmp/"noclient.cnf");
    })<<"no client";
}

void testProvision()
{
    testDiag("%s", __func__);
    TempDir tmp;
    layout(tmp);

    auto plan(ProvisionPlan::fromFile(tmp/"plan.cnf"));
    auto report(provision(plan));

    testFalse(report.server_legacy);
    testTrue(report.client_legacy);

    if(testEq(report.artifacts.size(), 9u)) {
        unsigned prev = 1u;
        bool ordered = true;
        for(const auto& art : report.artifacts) {
            ordered &= art.step>=prev;
            prev = art.step;
            testOk(exists(art.path), "%u %s %s exists", art.step, art.kind.c_str(), art.path.c_str());
        }
        testTrue(ordered)<<" artifacts in step order";
        testEq(report.artifacts[0].party, "web3signer");
        testEq(report.artifacts[8].step, 6u);
        testEq(report.artifacts[8].path, plan.allowlist);
    }

    testFalse(exists(tmp/"web3signer/key_legacy.p12"))<<" server has no legacy consumer";
    testTrue(exists(tmp/"lighthouse/key_legacy.p12"));

    testEq(fileMode(tmp/"web3signer/key.key"), 0600);
    testEq(fileMode(tmp/"lighthouse/key.key"), 0600);
    testEq(fileMode(tmp/"lighthouse/key.p12"), 0600);

    // Client trusts Server
    testEq(readText(tmp/"lighthouse/web3signer.pem"), readText(tmp/"web3signer/cert.pem"));

    // Server accepts Client
    testEq(readText(tmp/"web3signer/known_clients.txt"), allowlistLine(tmp/"lighthouse/cert.pem")+"\n");
    testEq(report.client_record.line(), allowlistLine(tmp/"lighthouse/cert.pem"));

    {
        auto server(loadBundle(tmp/"web3signer/key.p12", Secret("signer-secret")));
        testEq(server.label, "web3signer");
        testEq(X509_cmp(server.cert.get(), readCertificate(tmp/"web3signer/cert.pem").get()), 0);
        testEq(validityPeriod(server.cert.get()).first, 825);

        auto client(loadBundle(tmp/"lighthouse/key.p12", Secret("p@ss")));
        auto legacy(loadBundle(tmp/"lighthouse/key_legacy.p12", Secret("p@ss")));
        testEq(legacy.label, "lighthouse");
        testEq(X509_cmp(client.cert.get(), legacy.cert.get()), 0);
        auto keyDER(privateKeyDER(readPrivateKey(tmp/"lighthouse/key.key").get()));
        testTrue(!keyDER.empty());
        testTrue(privateKeyDER(client.key.get())==keyDER)<<" modern bundle holds lighthouse/key.key";
        testTrue(privateKeyDER(legacy.key.get())==keyDER)<<" legacy bundle holds lighthouse/key.key";

        testTrue(describeBundle(tmp/"lighthouse/key_legacy.p12", Secret("p@ss")).mode==BundleMode::Legacy);
        testTrue(describeBundle(tmp/"lighthouse/key.p12", Secret("p@ss")).mode==BundleMode::Modern);
    }

    // again.  Everything is replaced, and the allowlist holds only the new fingerprint
    auto firstLine(report.client_record.line());
    auto firstServer(readText(tmp/"web3signer/cert.pem"));

    auto report2(provision(plan));

    testNotEq(report2.client_record.line(), firstLine);
    testEq(readText(tmp/"web3signer/known_clients.txt"), report2.client_record.line()+"\n");
    testNotEq(readText(tmp/"web3signer/cert.pem"), firstServer);
    testEq(readText(tmp/"lighthouse/web3signer.pem"), readText(tmp/"web3signer/cert.pem"));
}

void testFailMidway()
{
    testDiag("%s", __func__);
    TempDir tmp;
    layout(tmp);

    auto plan(ProvisionPlan::fromFile(tmp/"plan.cnf"));

    // Client password lost after the plan is checked
    testEq(::unlink((tmp/"lighthouse/password.txt").c_str()), 0);

    try {
        provision(plan);
        testFail("Unexpected success");
    } catch(ProvisionError& e) {
        testEq(e.step(), 5u);
        testEq(e.party(), "lighthouse");
        testOk(std::string(e.what()).find("package bundles")!=std::string::npos, "%s", e.what());
        try {
            std::rethrow_exception(e.cause());
        } catch(PackagingError& cause) {
            testPass("cause %s", cause.what());
        } catch(std::exception& cause) {
            testFail("Unexpected cause %s", cause.what());
        }
    }

    // outputs of earlier steps are left in place
    testTrue(exists(tmp/"web3signer/key.key"));
    testTrue(exists(tmp/"web3signer/cert.pem"));
    testTrue(exists(tmp/"web3signer/key.p12"));
    testTrue(exists(tmp/"lighthouse/web3signer.pem"));
    testTrue(exists(tmp/"lighthouse/key.key"));
    testTrue(exists(tmp/"lighthouse/cert.pem"));
    // later steps not attempted
    testFalse(exists(tmp/"lighthouse/key.p12"));
    testFalse(exists(tmp/"lighthouse/key_legacy.p12"));
    testFalse(exists(tmp/"web3signer/known_clients.txt"));
}

void testSamePassword()
{
    testDiag("%s", __func__);
    TempDir tmp;
    layout(tmp);

    // distinct files holding one value
    writeText(tmp/"web3signer/password.txt", "p@ss\n");
    writeText(tmp/"lighthouse/password.txt", "p@ss\n");

    auto plan(ProvisionPlan::fromFile(tmp/"plan.cnf"));

    try {
        provision(plan);
        testFail("Unexpected success");
    } catch(ProvisionError& e) {
        testEq(e.step(), 5u);
        testEq(e.party(), "lighthouse");
        try {
            std::rethrow_exception(e.cause());
        } catch(PackagingError& cause) {
            testOk(std::string(cause.what()).find("same bundle password")!=std::string::npos,
                   "cause %s", cause.what());
        } catch(std::exception& cause) {
            testFail("Unexpected cause %s", cause.what());
        }
    }

    testTrue(exists(tmp/"web3signer/key.p12"));
    testFalse(exists(tmp/"lighthouse/key.p12"))<<" client not packaged";
    testFalse(exists(tmp/"lighthouse/key_legacy.p12"));
    testFalse(exists(tmp/"web3signer/known_clients.txt"));

    // accepted when asked for
    layout(tmp, "shared_password = yes\n");
    writeText(tmp/"web3signer/password.txt", "p@ss\n");
    writeText(tmp/"lighthouse/password.txt", "p@ss\n");

    auto shared(ProvisionPlan::fromFile(tmp/"plan.cnf"));
    testTrue(shared.shared_password);
    provision(shared);

    auto client(loadBundle(tmp/"lighthouse/key.p12", Secret("p@ss")));
    testEq(client.label, "lighthouse");
    testTrue(exists(tmp/"web3signer/known_clients.txt"));
}

void testStepNames()
{
    testDiag("%s", __func__);
    testEq(std::string(stepName(1u)), "generate identity");
    testEq(std::string(stepName(3u)), "export certificate to peer trust store");
    testEq(std::string(stepName(6u)), "export fingerprint to allowlist");
    testEq(std::string(stepName(7u)), "<invalid step>");
}

} // namespace

MAIN(testprovision)
{
    testPlan(0);
    testSetup();
    testStepNames();
    testPlanFile();
    testPlanErrors();
    testProvision();
    testFailMidway();
    testSamePassword();
    return testDone();
}
