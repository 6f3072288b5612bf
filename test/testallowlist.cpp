/**
 * Copyright - See the COPYRIGHT that is included with this distribution.
 * trustgen is distributed subject to a Software License Agreement found
 * in file LICENSE that is included with this distribution.
 */

#include <cctype>

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/x509.h>

#include <testMain.h>
#include <epicsUnitTest.h>

#include <trustgen/unittest.h>
#include <trustgen/identity.h>
#include <trustgen/allowlist.h>

#include "testutil.h"

using namespace trustgen;

namespace {

Identity makeIdentity(const char *name)
{
    auto subject(SubjectConfig::commonName(name));
    subject.validity_days = 30u;
    return generateIdentity(name, subject);
}

// SHA-256 of DER, computed separately from X509_digest()
std::string derDigest(const X509* cert)
{
    unsigned char *der = nullptr;
    auto len = i2d_X509(cert, &der);
    if(len<=0)
        throw std::runtime_error("i2d_X509");

    unsigned char md[EVP_MAX_MD_SIZE];
    unsigned int mdlen = 0u;
    auto ok = EVP_Digest(der, size_t(len), md, &mdlen, EVP_sha256(), nullptr);
    OPENSSL_free(der);
    if(!ok)
        throw std::runtime_error("EVP_Digest");
    return formatFingerprint(md, mdlen, FingerprintFormat::Plain);
}

void testFormat()
{
    testDiag("%s", __func__);

    const unsigned char digest[] = {0xaa, 0xbb, 0xcc, 0xdd, 0xee, 0xff};

    testEq(formatFingerprint(digest, sizeof(digest), FingerprintFormat::Colon), "AA:BB:CC:DD:EE:FF");
    testEq(formatFingerprint(digest, sizeof(digest), FingerprintFormat::Plain), "aabbccddeeff");
    testEq(formatFingerprint(digest, 0u, FingerprintFormat::Colon), "");

    TrustRecord rec;
    rec.label = "lighthouse";
    rec.fingerprint = formatFingerprint(digest, sizeof(digest), FingerprintFormat::Plain);
    testEq(rec.line(), "lighthouse aabbccddeeff");

    testEq(to_string(FingerprintFormat::Colon), std::string("colon"));
    testEq(to_string(FingerprintFormat::Plain), std::string("plain"));
    testTrue(parseFingerprintFormat("colon")==FingerprintFormat::Colon);
    testTrue(parseFingerprintFormat("plain")==FingerprintFormat::Plain);
    testThrows<ConfigError>([]() {
        parseFingerprintFormat("base64");
    });
}

void testCertFingerprint(const Identity& id)
{
    testDiag("%s", __func__);

    auto colon(fingerprint(id.cert.get(), FingerprintFormat::Colon));
    auto plain(fingerprint(id.cert.get(), FingerprintFormat::Plain));

    testEq(colon.size(), 32u*3u-1u);
    testEq(plain.size(), 64u);
    testEq(plain, derDigest(id.cert.get()));

    std::string stripped;
    for(auto c : colon) {
        if(c!=':')
            stripped.push_back(char(std::tolower(static_cast<unsigned char>(c))));
    }
    testEq(stripped, plain);

    // stable
    testEq(fingerprint(id.cert.get(), FingerprintFormat::Colon), colon);
}

void testLoad()
{
    testDiag("%s", __func__);
    TempDir tmp;

    {
        auto list(TrustAllowlist::load(tmp/"missing.txt"));
        testEq(list.size(), 0u);
        testEq(list.str(), "");
    }

    writeText(tmp/"known_clients.txt",
              "alpha AA:BB\r\n"
              "\n"
              "beta ccdd\n"
              "alpha EE:FF\n"
              "gamma 01:23");
    {
        auto list(TrustAllowlist::load(tmp/"known_clients.txt"));
        if(testEq(list.size(), 3u)) {
            testEq(list.records()[0].line(), "alpha AA:BB");
            testEq(list.records()[1].line(), "beta ccdd");
            testEq(list.records()[2].line(), "gamma 01:23");
        }
        testEq(list.str(), "alpha AA:BB\nbeta ccdd\ngamma 01:23\n");
        testTrue(list.find("beta")!=nullptr);
        testTrue(list.find("delta")==nullptr);
    }

    writeText(tmp/"nofp.txt", "alpha AA:BB\nlighthouse\n");
    try {
        TrustAllowlist::load(tmp/"nofp.txt");
        testFail("Unexpected success");
    } catch(ExportError& e) {
        testEq(e.path(), tmp/"nofp.txt");
        testOk(std::string(e.what()).find(":2")!=std::string::npos, "line number in \"%s\"", e.what());
    }

    writeText(tmp/"notHex.txt", "lighthouse not:hex\n");
    testThrows<ExportError>([&tmp]() {
        TrustAllowlist::load(tmp/"notHex.txt");
    })<<"fingerprint not hex";

    writeText(tmp/"extra.txt", "lighthouse AA:BB extra\n");
    testThrows<ExportError>([&tmp]() {
        TrustAllowlist::load(tmp/"extra.txt");
    })<<"three fields";
}

void testUpsert()
{
    testDiag("%s", __func__);

    TrustAllowlist list;
    testTrue(list.upsert("alpha", "AA:BB"));
    testTrue(list.upsert("beta", "CC:DD"));
    testFalse(list.upsert("alpha", "AA:BB"))<<" unchanged";
    testTrue(list.upsert("alpha", "EE:FF"))<<" replaced";
    testEq(list.str(), "alpha EE:FF\nbeta CC:DD\n");

    testTrue(list.erase("alpha"));
    testFalse(list.erase("alpha"));
    testEq(list.str(), "beta CC:DD\n");

    testThrows<ExportError>([&list]() {
        list.upsert("", "AA:BB");
    })<<"empty label";
    testThrows<ExportError>([&list]() {
        list.upsert("two words", "AA:BB");
    })<<"label with space";
    testThrows<ExportError>([&list]() {
        list.upsert("gamma", "");
    })<<"empty fingerprint";
    testEq(list.size(), 1u);
}

void testExport(const Identity& first, const Identity& second)
{
    testDiag("%s", __func__);
    TempDir tmp;
    const auto path(tmp/"known_clients.txt");

    auto rec(exportFingerprint(first.cert.get(), "lighthouse", path, FingerprintFormat::Colon));
    auto expect("lighthouse "+fingerprint(first.cert.get(), FingerprintFormat::Colon));
    testEq(rec.line(), expect);
    testEq(readText(path), expect+"\n");

    // idempotent
    auto rec2(exportFingerprint(first.cert.get(), "lighthouse", path, FingerprintFormat::Colon));
    testEq(rec2.line(), expect);
    testEq(readText(path), expect+"\n");

    // other entries are kept, in order
    writeText(path, "prysm 00:11\n"+expect+"\nteku 22:33\n");

    // regenerated certificate replaces the stale entry
    auto rec3(exportFingerprint(second.cert.get(), "lighthouse", path, FingerprintFormat::Colon));
    auto replaced("lighthouse "+fingerprint(second.cert.get(), FingerprintFormat::Colon));
    testEq(rec3.line(), replaced);
    testEq(readText(path), "prysm 00:11\n"+replaced+"\nteku 22:33\n");
    testOk(readText(path).find(rec.fingerprint)==std::string::npos, "Old fingerprint removed");

    // new label appended
    exportFingerprint(first.cert.get(), "nimbus", path, FingerprintFormat::Plain);
    testEq(readText(path), "prysm 00:11\n"+replaced+"\nteku 22:33\n"
                           "nimbus "+fingerprint(first.cert.get(), FingerprintFormat::Plain)+"\n");
    testFalse(exists(path+".tmp"));

    const auto unwritable(tmp/"nonexistent/known_clients.txt");
    try {
        exportFingerprint(first.cert.get(), "lighthouse", unwritable, FingerprintFormat::Colon);
        testFail("Unexpected success");
    } catch(ExportError& e) {
        testEq(e.path(), unwritable);
    }

    testThrows<ExportError>([&]() {
        exportFingerprint(first.cert.get(), "bad label", path, FingerprintFormat::Colon);
    })<<"label with space";
}

} // namespace

MAIN(testallowlist)
{
    testPlan(0);
    testSetup();
    testFormat();
    testLoad();
    testUpsert();
    {
        auto first(makeIdentity("lighthouse"));
        auto second(makeIdentity("lighthouse"));
        testCertFingerprint(first);
        testExport(first, second);
    }
    return testDone();
}
