#if !defined UDP_DISPATCHER_TEST_HPP
#define UDP_DISPATCHER_TEST_HPP

#include "Test.hpp"
#include "TestCases.hpp"
#include "TestMacros.hpp"

TEST_CASES_BEGIN(UdpDispatcher_test)

    TEST(DefaultGracePeriod)
    TEST(GracePeriodAfterSuccess)
    TEST(GracePeriodAfterShortWrite)
    TEST(GracePeriodAfterException)
    TEST(GracePeriodAfterOpenFailure)
    TEST(Loopback)
    TEST(MalformedDestinations)

TEST_CASES_END(UdpDispatcher_test)

#endif
