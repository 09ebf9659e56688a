#pragma once
#include <functional>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace sx_test
{

using test_fn = std::function<void()>;

struct test_case
{
    std::string name;
    const char *file;
    test_fn run;
};

inline std::vector<test_case> &registry()
{
    static std::vector<test_case> cases;
    return cases;
}

inline bool enroll(const char *name, const char *file, test_fn fn)
{
    registry().push_back({name, file, std::move(fn)});
    return true;
}

// Thrown by SX_T_ASSERT, caught per test by the runner
struct assertion_failure : std::runtime_error
{
    using std::runtime_error::runtime_error;
};

// Runs one case. Any exception, standard or not, fails the case only.
inline bool run_case(const test_case &test, std::string &failure)
{
    try
    {
        test.run();
        return true;
    }
    catch (const std::exception &e)
    {
        failure = e.what();
    }
    catch (...)
    {
        failure = "non-standard exception";
    }
    return false;
}

} // namespace sx_test

// Registers `func` under `desc` during static initialization
#define SVCEXCHANGE_TEST_CASE(func, desc) \
    static const bool func##_enrolled = sx_test::enroll(desc, __FILE__, func)

#define SX_T_ASSERT(cond, msg)                                                                   \
    do                                                                                           \
    {                                                                                            \
        if (!(cond))                                                                             \
        {                                                                                        \
            std::ostringstream sx_msg_;                                                          \
            sx_msg_ << msg;                                                                      \
            std::cerr << "\n  " << __FILE__ << ":" << __LINE__ << ": " << #cond << "\n    "     \
                      << sx_msg_.str() << std::endl;                                             \
            throw sx_test::assertion_failure(sx_msg_.str());                                     \
        }                                                                                        \
    } while (0)

#define SX_T_ASSERT_EQ(actual, expected, msg) \
    SX_T_ASSERT((actual) == (expected), msg << " (expected " << (expected) << ", got " << (actual) << ")")
