#if !defined WAKE_RELAY_TEST_HPP
#define WAKE_RELAY_TEST_HPP

#include "Test.hpp"
#include "TestCases.hpp"
#include "TestMacros.hpp"

TEST_CASES_BEGIN(WakeRelay_test)

    TEST(MissingDefaultFile)
    TEST(ServesUntilDestroyed)

TEST_CASES_END(WakeRelay_test)

#endif
