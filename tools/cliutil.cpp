/**
 * Copyright - See the COPYRIGHT that is included with this distribution.
 * trustgen is distributed subject to a Software License Agreement found
 * in file LICENSE that is included with this distribution.
 */

#include <epicsGetopt.h>

#include <trustgen/log.h>

#include "cliutil.h"

namespace trustgen {

GetOpt::GetOpt(int argc, char *argv[], const char *spec)
    :argv0(argv[0])
{
    int opt;
    bool ok = true;
    while ((opt = getopt(argc, argv, spec)) != -1) {
        switch(opt) {
        case '?':
        case ':':
            ok = false;
            break;
        default:
            arguments.emplace_back(char(opt), optarg ? ArgVal(optarg) : ArgVal(nullptr));
            break;
        }
    }

    for(int i=optind; i<argc; i++)
        positional.emplace_back(argv[i]);

    success = ok;
}

void setupLogging(unsigned verbosity)
{
    logger_config_env();
    if(verbosity>=2u)
        logger_level_set("trustgen.*", Level::Debug);
    else if(verbosity==1u)
        logger_level_set("trustgen.*", Level::Info);
}

} // namespace trustgen
