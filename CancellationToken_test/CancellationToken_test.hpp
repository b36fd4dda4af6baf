#if !defined CANCELLATION_TOKEN_TEST_HPP
#define CANCELLATION_TOKEN_TEST_HPP

#include "Test.hpp"
#include "TestCases.hpp"
#include "TestMacros.hpp"

TEST_CASES_BEGIN(CancellationToken_test)

    TEST(NotCancelledInitially)
    TEST(UncancelledSleepRunsFull)
    TEST(CancelWakesSleeper)
    TEST(CancelledTokenDoesNotSleep)

TEST_CASES_END(CancellationToken_test)

#endif
