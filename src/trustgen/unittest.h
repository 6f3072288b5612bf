/**
 * Copyright - See the COPYRIGHT that is included with this distribution.
 * trustgen is distributed subject to a Software License Agreement found
 * in file LICENSE that is included with this distribution.
 */

#ifndef TRUSTGEN_UNITTEST_H
#define TRUSTGEN_UNITTEST_H

/** @file trustgen/unittest.h
 *
 *  Helpers for use with epicsUnitTest.h
 *
 *  @code
 *  #include <testMain.h>
 *  #include <epicsUnitTest.h>
 *  #include <trustgen/unittest.h>
 *
 *  MAIN(mytest) {
 *      testPlan(0);
 *      testSetup();
 *      testEq(1, 1);
 *      return testDone();
 *  }
 *  @endcode
 */

#include <sstream>
#include <string>
#include <typeinfo>

#include <epicsUnitTest.h>

#include <trustgen/version.h>

namespace trustgen {

//! Prepare for testing.  Call after testPlan()
TRUSTGEN_API
void testSetup();

/** A test result.  Reported through testOk() when destroyed.
 *
 *  @code
 *    testCase(a==b)<<"some message "<<42;
 *  @endcode
 */
class TRUSTGEN_API testCase
{
    enum {
        Nothing, // no result yet
        Pass,
        Fail,
    } result;
    std::ostringstream msg;
public:
    testCase();
    explicit testCase(bool result);
    testCase(const testCase&) = delete;
    testCase& operator=(const testCase&) = delete;
    testCase(testCase&& o) noexcept;
    testCase& operator=(testCase&& o) noexcept;
    ~testCase();

    explicit operator bool() const { return result==Pass; }

    //! Override the pass/fail result
    testCase& setPass(bool v);

    template<typename T>
    inline testCase& operator<<(const T& v) {
        msg<<v;
        return *this;
    }
};

namespace detail {

template<typename LHS, typename RHS>
testCase _testEq(const char *sLHS, const LHS& lhs, const char *sRHS, const RHS& rhs)
{
    testCase ret(lhs==rhs);
    ret<<sLHS<<" (\""<<lhs<<"\") == "<<sRHS<<" (\""<<rhs<<"\") ";
    return ret;
}

template<typename LHS, typename RHS>
testCase _testNotEq(const char *sLHS, const LHS& lhs, const char *sRHS, const RHS& rhs)
{
    testCase ret(!(lhs==rhs));
    ret<<sLHS<<" (\""<<lhs<<"\") != "<<sRHS<<" (\""<<rhs<<"\") ";
    return ret;
}

} // namespace detail

//! Check equality.  Both sides must be printable with std::ostream
#define testEq(LHS, RHS) ::trustgen::detail::_testEq(#LHS, LHS, #RHS, RHS)
#define testNotEq(LHS, RHS) ::trustgen::detail::_testNotEq(#LHS, LHS, #RHS, RHS)

#define testTrue(B) ::trustgen::testCase(!!(B))<<" " #B
#define testFalse(B) ::trustgen::testCase(!(B))<<" !" #B

/** Run fn and expect it to throw Exception
 *
 *  @code
 *    testThrows<std::runtime_error>([]() {
 *        throw std::runtime_error("expected");
 *    });
 *  @endcode
 */
template<typename Exception, typename FN>
testCase testThrows(FN fn)
{
    testCase ret(false);
    try {
        fn();
        ret<<"Unexpected success - ";
    } catch(Exception& e) {
        ret.setPass(true)<<"Expected exception \""<<e.what()<<"\" - ";
    } catch(std::exception& e) {
        ret<<"Unexpected exception "<<typeid(e).name()<<" \""<<e.what()<<"\" - ";
    }
    return ret;
}

} // namespace trustgen

#endif // TRUSTGEN_UNITTEST_H
