#include <iostream>
#include <exception>
#include "test_env.hpp"
// Only GTest::gtest is linked (not gtest_main): the assert harness runs first,
// then every GoogleTest suite compiled into this binary.
#include <gtest/gtest.h>

void run_lexer_smoke_test();
int run_diagnostics_json_tests();
void run_env_tests();

int main(int argc, char** argv){
    try{
        run_lexer_smoke_test();
        run_diagnostics_json_tests();
        run_env_tests();
    }catch(const std::exception& e){ std::cerr << "[cook] exception: " << e.what() << "\n"; return 1; }

    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
