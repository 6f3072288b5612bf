/**
 * Copyright - See the COPYRIGHT that is included with this distribution.
 * trustgen is distributed subject to a Software License Agreement found
 * in file LICENSE that is included with this distribution.
 */

#include <errlog.h>

#include <trustgen/log.h>
#include <trustgen/unittest.h>

namespace trustgen {

void testSetup()
{
    // log output interleaves with test output
    errlogInit2(1024*64, 0);
    logger_config_env();
}

testCase::testCase()
    :result(Nothing)
{}

testCase::testCase(bool result)
    :result(result ? Pass : Fail)
{}

testCase::testCase(testCase&& o) noexcept
    :result(o.result)
{
    msg<<o.msg.str();
    o.result = Nothing;
}

testCase& testCase::operator=(testCase&& o) noexcept
{
    if(this!=&o) {
        result = o.result;
        o.result = Nothing;
        msg.str(std::string());
        msg<<o.msg.str();
    }
    return *this;
}

testCase::~testCase()
{
    if(result==Nothing)
        return;

    std::string msg(this->msg.str());
    testOk(result==Pass, "%s", msg.c_str());
}

testCase& testCase::setPass(bool v)
{
    result = v ? Pass : Fail;
    return *this;
}

} // namespace trustgen
