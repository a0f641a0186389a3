#include <iostream>

int test_args();
int test_jobs();
int test_log_sinks();
int test_config();
int test_json_writer();
int test_text_parse();
int test_location_catalog();
int test_location_graph();
int test_cargo_mission();
int test_mission_ledger();
int test_option_scorer();
int test_route_builder();
int test_route_json();
int test_mission_request();
int test_route_planner();

int main() {
  int fails = 0;

  fails += test_args();
  fails += test_jobs();
  fails += test_log_sinks();
  fails += test_config();
  fails += test_json_writer();
  fails += test_text_parse();
  fails += test_location_catalog();
  fails += test_location_graph();
  fails += test_cargo_mission();
  fails += test_mission_ledger();
  fails += test_option_scorer();
  fails += test_route_builder();
  fails += test_route_json();
  fails += test_mission_request();
  fails += test_route_planner();

  if (fails == 0) {
    std::cout << "[haul_tests] ALL PASS\n";
    return 0;
  }

  std::cerr << "[haul_tests] FAILS=" << fails << "\n";
  return 1;
}
