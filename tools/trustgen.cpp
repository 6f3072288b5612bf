/**
 * Copyright - See the COPYRIGHT that is included with this distribution.
 * trustgen is distributed subject to a Software License Agreement found
 * in file LICENSE that is included with this distribution.
 */

#include <iostream>
#include <exception>

#include <errlog.h>

#include <trustgen/version.h>
#include <trustgen/provision.h>

#include "cliutil.h"

using namespace trustgen;

namespace {

void usage(const char* argv0) {
    std::cerr<<"Usage: "<<argv0<<" [-hVvd] [-C <dir>] <plan.cnf>\n"
               "\n"
               "    Provision a mutually authenticated TLS Server/Client pair.\n"
               "    Writes keys, certificates, PKCS#12 bundles, and trust material\n"
               "    listed in the plan file.  Existing outputs are replaced.\n"
               "\n"
               "    -h        - Show this message.\n"
               "    -V        - Print version and exit.\n"
               "    -v        - Log progress.\n"
               "    -d        - Log debug details.  Implies -v\n"
               "    -C <dir>  - Resolve relative paths in plan against <dir>.\n"
               "                (default: directory containing <plan.cnf>)\n"
               ;
}

} // namespace

int main(int argc, char *argv[])
{
    try {
        GetOpt opts(argc, argv, "hVvdC:");
        if(!opts.success) {
            usage(argv[0]);
            return 1;
        }

        unsigned verbosity = 0u;
        std::string basedir;

        for(const auto& arg : opts.arguments) {
            switch(arg.first) {
            case 'h':
                usage(argv[0]);
                return 0;
            case 'V':
                std::cout<<version_str()<<"\n";
                if(version_int()!=TRUSTGEN_VERSION)
                    std::cerr<<"Warning: built against headers for version "
                             <<std::hex<<TRUSTGEN_VERSION<<", library is "<<version_int()<<std::dec<<"\n";
                return 0;
            case 'v':
                if(verbosity<1u)
                    verbosity = 1u;
                break;
            case 'd':
                verbosity = 2u;
                break;
            case 'C':
                basedir = *arg.second;
                if(basedir.empty())
                    throw std::runtime_error("-C argument must not be empty");
                break;
            }
        }

        if(opts.positional.size()!=1u) {
            usage(argv[0]);
            std::cerr<<"\nExpected exactly one plan file\n";
            return 1;
        }

        setupLogging(verbosity);

        auto plan(ProvisionPlan::fromFile(opts.positional[0], basedir));

        auto report(provision(plan));

        for(const auto& art : report.artifacts) {
            std::cout<<art.step<<" "<<art.party<<" "<<art.kind<<" "<<art.path<<"\n";
        }
        std::cout<<"allowlist: "<<report.client_record.line()<<"\n";

        errlogFlush();
        return 0;

    } catch(ProvisionError& e) {
        errlogFlush();
        std::cerr<<"Error: "<<e.what()<<"\n";
        std::cerr<<"Outputs of steps before "<<e.step()<<" are complete\n";
        return 1;

    } catch(std::exception& e) {
        errlogFlush();
        std::cerr<<"Error: "<<e.what()<<"\n";
        return 1;
    }
}
