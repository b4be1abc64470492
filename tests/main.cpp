#include <iostream>
#include <exception>
// Assert-based smoke harness first, then every GoogleTest case compiled into this binary.
// We only link GTest::gtest (not gtest_main), so main dispatches RUN_ALL_TESTS itself.
#include <gtest/gtest.h>

void run_pegtl_grammar_smoke_test();
int run_diagnostics_json_tests();
void run_env_tests();

int main(int argc, char** argv){
    try{
        run_pegtl_grammar_smoke_test();
        // JSON rendering of diagnostics and records
        if(run_diagnostics_json_tests()!=0) return 1;
        // PDXLOC_* configuration
        run_env_tests();
    }catch(const std::exception& e){ std::cerr << "[pdxloc-tests] exception: " << e.what() << "\n"; return 1; }

    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
