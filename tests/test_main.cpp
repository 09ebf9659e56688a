#include "test_framework.hpp"

#include <iomanip>

#define COLOR_RESET "\033[0m"
#define COLOR_GREEN "\033[1;32m"
#define COLOR_RED "\033[1;31m"
#define COLOR_YELLOW "\033[1;33m"
#define COLOR_CYAN "\033[1;36m"

namespace
{
void report_failure(const sx_test::test_case &test, const std::string &why, std::vector<std::string> &failures)
{
    std::cout << COLOR_RED << "[  FAILED  ] " << COLOR_RESET << std::left << std::setw(48) << test.name
              << " (" << COLOR_YELLOW << why << COLOR_RESET << ")" << std::endl;
    failures.push_back(test.name + "  [" + test.file + "]");
}
} // namespace

// Usage: svcExchange_tests [name-filter]
int main(int argc, char **argv)
{
    const char *filter = (argc > 1) ? argv[1] : nullptr;
    const auto &cases = sx_test::registry();

    std::cout << COLOR_CYAN << "===========================================" << COLOR_RESET << std::endl;
    std::cout << "    svcExchange Test Suite" << std::endl;
    std::cout << "    Registered: " << cases.size();
    if (filter != nullptr)
    {
        std::cout << "  (filter: \"" << filter << "\")";
    }
    std::cout << std::endl;
    std::cout << COLOR_CYAN << "===========================================" << COLOR_RESET << std::endl;

    int passed = 0;
    std::vector<std::string> failures;

    for (const auto &test : cases)
    {
        if (filter != nullptr && test.name.find(filter) == std::string::npos)
        {
            continue;
        }
        std::cout << "[ RUN      ] " << test.name << std::endl;
        std::string why;
        if (sx_test::run_case(test, why))
        {
            std::cout << COLOR_GREEN << "[       OK ] " << COLOR_RESET << test.name << std::endl;
            passed++;
        }
        else
        {
            report_failure(test, why, failures);
        }
    }

    std::cout << COLOR_CYAN << "===========================================" << COLOR_RESET << std::endl;
    if (failures.empty())
    {
        std::cout << COLOR_GREEN << "  ALL TESTS PASSED (" << passed << "/" << passed << ")" << COLOR_RESET << std::endl;
        return 0;
    }

    std::cout << COLOR_RED << "  TESTS FAILED: " << failures.size() << " | Passed: " << passed << COLOR_RESET << std::endl;
    for (const auto &name : failures)
    {
        std::cout << "    " << name << std::endl;
    }
    return 1;
}
