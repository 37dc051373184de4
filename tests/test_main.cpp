#include <iostream>

int test_json();
int test_json_errors();
int test_log();
int test_file_io();
int test_digests();
int test_engine_config();
int test_function_registry();
int test_builtin_functions();
int test_rules_engine();
int test_transaction_manager();
int test_turn_engine();
int test_serialization();
int test_state_delta();
int test_state_validation();
int test_history();
int test_sqlite_store();
int test_json_snapshot_store();

int main() {
  int fails = 0;
  fails += test_json();
  fails += test_json_errors();
  fails += test_log();
  fails += test_file_io();
  fails += test_digests();
  fails += test_engine_config();
  fails += test_function_registry();
  fails += test_builtin_functions();
  fails += test_rules_engine();
  fails += test_transaction_manager();
  fails += test_turn_engine();
  fails += test_serialization();
  fails += test_state_delta();
  fails += test_state_validation();
  fails += test_history();
  fails += test_sqlite_store();
  fails += test_json_snapshot_store();

  if (fails == 0) {
    std::cout << "All tests passed\n";
    return 0;
  }
  std::cerr << fails << " tests failed\n";
  return 1;
}
