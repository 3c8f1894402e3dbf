#include "dxf_test_harness.hpp"
#include "dxf_scanner_tests.hpp"
#include "dxf_value_tests.hpp"
#include "dxf_structure_tests.hpp"
#include "dxf_entity_tests.hpp"
#include "dxf_section_tests.hpp"
#include "dxf_serializer_tests.hpp"
#include "dxf_integration_tests.hpp"

#include <iostream>

namespace dxf::tests
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
    using namespace dxf::tests;

    #ifdef DXF_TESTS_SCANNER__
        run_tests("Scanner", run_scanner_tests);
    #endif

    #ifdef DXF_TESTS_VALUES__
        run_tests("Values", run_value_tests);
    #endif

    #ifdef DXF_TESTS_STRUCTURE__
        run_tests("Structural grammars", run_structure_tests);
    #endif

    #ifdef DXF_TESTS_ENTITIES__
        run_tests("Entities", run_entity_tests);
    #endif

    #ifdef DXF_TESTS_SECTIONS__
        run_tests("Sections", run_section_tests);
    #endif

    #ifdef DXF_TESTS_SERIALIZER__
        run_tests("Serialization", run_serializer_tests);
    #endif

    #ifdef DXF_TESTS_INTEGRATION__
        run_tests("Integration", run_integration_tests);
    #endif

    size_t failed = 0;
    for (auto const & r : results)
    {
        if (!r.passed)
            ++failed;
    }

    std::cout << '\n' << results.size() - failed << " of " << results.size() << " tests passed\n";
    return failed == 0 ? 0 : 1;
}
