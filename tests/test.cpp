#include "tests/test_suite.hpp"

void target_tests();
void rule_key_tests();
void graph_tests();
void resolver_tests();
void cache_tests();
void engine_tests();
void manifest_tests();
void alias_tests();
void integration_tests();

int main() {
    target_tests();
    rule_key_tests();
    graph_tests();
    resolver_tests();
    cache_tests();
    engine_tests();
    manifest_tests();
    alias_tests();
    integration_tests();

    const auto &counters = keel::testing::counters();
    std::cout << "\n" << counters.passed << "/" << counters.run << " tests passed\n";
    return counters.passed == counters.run ? 0 : 1;
}
