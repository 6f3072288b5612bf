/**
 * Copyright - See the COPYRIGHT that is included with this distribution.
 * trustgen is distributed subject to a Software License Agreement found
 * in file LICENSE that is included with this distribution.
 */

#include <iostream>
#include <exception>

#include <errlog.h>

#include <trustgen/identity.h>
#include <trustgen/bundle.h>
#include <trustgen/allowlist.h>

#include "cliutil.h"

using namespace trustgen;

namespace {

void usage(const char* argv0) {
    std::cerr<<"Usage: "<<argv0<<" [-h] [-p <pwfile>] [-f colon|plain] <file>\n"
               "\n"
               "    Show a PEM certificate, or the content of a PKCS#12 bundle.\n"
               "\n"
               "    -h           - Show this message.\n"
               "    -p <pwfile>  - <file> is a PKCS#12 bundle protected by the password\n"
               "                   in <pwfile>.  Without, <file> is a PEM certificate.\n"
               "    -f <format>  - Fingerprint format.  colon or plain.  (default: colon)\n"
               ;
}

void showCert(const X509* cert, FingerprintFormat fmt)
{
    auto period(validityPeriod(cert));
    std::cout<<describeCertificate(cert)<<"\n"
             <<"Validity: "<<period.first<<" days";
    if(period.second)
        std::cout<<" "<<period.second<<" seconds";
    std::cout<<"\n"
               "SHA256 Fingerprint: "<<fingerprint(cert, fmt)<<"\n";
}

} // namespace

int main(int argc, char *argv[])
{
    try {
        GetOpt opts(argc, argv, "hp:f:");
        if(!opts.success) {
            usage(argv[0]);
            return 1;
        }

        std::string pwfile;
        auto fmt = FingerprintFormat::Colon;

        for(const auto& arg : opts.arguments) {
            switch(arg.first) {
            case 'h':
                usage(argv[0]);
                return 0;
            case 'p':
                pwfile = *arg.second;
                break;
            case 'f':
                fmt = parseFingerprintFormat(*arg.second);
                break;
            }
        }

        if(opts.positional.size()!=1u) {
            usage(argv[0]);
            std::cerr<<"\nExpected exactly one file\n";
            return 1;
        }
        const auto& file = opts.positional[0];

        setupLogging(0u);

        if(pwfile.empty()) {
            auto cert(readCertificate(file));
            showCert(cert.get(), fmt);

        } else {
            auto password(readPassword(pwfile));
            auto info(describeBundle(file, password));
            auto id(loadBundle(file, password));

            std::cout<<"Bundle: "<<to_string(info.mode)<<"\n"
                       "Key bag: "<<info.key_alg<<"\n"
                       "Certificate bag: "<<info.cert_alg<<"\n"
                       "MAC: "<<(info.mac_digest.empty() ? std::string("<none>") : info.mac_digest)
                     <<" iterations="<<info.mac_iterations<<"\n"
                       "friendlyName: "<<id.label<<"\n";
            showCert(id.cert.get(), fmt);
        }

        errlogFlush();
        return 0;

    } catch(std::exception& e) {
        errlogFlush();
        std::cerr<<"Error: "<<e.what()<<"\n";
        return 1;
    }
}
