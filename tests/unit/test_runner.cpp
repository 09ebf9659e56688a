#include "test_framework.hpp"

namespace
{
void throws_int()
{
    throw 42;
}

void fails_assertion()
{
    SX_T_ASSERT(1 + 1 == 3, "arithmetic");
}

void passes()
{
}
} // namespace

void test_non_standard_exception_fails_one_case()
{
    std::string why;
    const sx_test::test_case crashing{"throws int", __FILE__, throws_int};
    SX_T_ASSERT(!sx_test::run_case(crashing, why), "a thrown int fails the case");
    SX_T_ASSERT(why == "non-standard exception", "failure reason: " << why);

    why.clear();
    const sx_test::test_case fine{"passes", __FILE__, passes};
    SX_T_ASSERT(sx_test::run_case(fine, why), "runner keeps going after a crashing case");
    SX_T_ASSERT(why.empty(), "passing case leaves no reason");
}
SVCEXCHANGE_TEST_CASE(test_non_standard_exception_fails_one_case, "Runner: non-standard exceptions fail one case");

void test_assertion_failure_carries_message()
{
    std::string why;
    const sx_test::test_case failing{"fails", __FILE__, fails_assertion};
    SX_T_ASSERT(!sx_test::run_case(failing, why), "failed assertion fails the case");
    SX_T_ASSERT(why == "arithmetic", "assertion message kept: " << why);
}
SVCEXCHANGE_TEST_CASE(test_assertion_failure_carries_message, "Runner: assertion message reaches the report");
