#include "ifed_test_harness.hpp"
#include "ifed_lexer_tests.hpp"
#include "ifed_parser_tests.hpp"
#include "ifed_document_tests.hpp"
#include "ifed_serializer_tests.hpp"
#include "ifed_editor_tests.hpp"
#include "ifed_diff_tests.hpp"
#include "ifed_integration_tests.hpp"

#include <iostream>

namespace ifed::tests
{
    std::vector<test_result> results;
    char const * last_error = "";
}

bool first = true;

void run_tests( std::string suite_name, void(*pf_tests)() )
{
    if (!first)
        std::cout << '\n';
    else first = false;

    std::cout << suite_name << '\n';
    std::cout << std::string(suite_name.length(), '=') << '\n';
    pf_tests();
}

int main()
{
    using namespace ifed::tests;

    #ifdef IFED_TESTS_LEXER__
        run_tests("Lexer", run_lexer_tests);
    #endif

    #ifdef IFED_TESTS_PARSER__
        run_tests("Parser", run_parser_tests);
    #endif

    #ifdef IFED_TESTS_DOCUMENT__
        run_tests("Document", run_document_tests);
    #endif

    #ifdef IFED_TESTS_SERIALIZER__
        run_tests("Serialization", run_serializer_tests);
    #endif

    #ifdef IFED_TESTS_EDITOR__
        run_tests("Editor", run_editor_tests);
    #endif

    #ifdef IFED_TESTS_DIFF__
        run_tests("Diff", run_diff_tests);
    #endif

    #ifdef IFED_TESTS_INTEGRATION__
        run_tests("Integration", run_integration_tests);
    #endif

    auto failed = std::ranges::count_if(results, [](test_result const & r) { return !r.passed; });

    std::cout << '\n' << results.size() - static_cast<size_t>(failed) << '/' << results.size() << " passed\n";
    return failed == 0 ? 0 : 1;
}
