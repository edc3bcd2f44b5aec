#include <iostream>

void run_config_benchmark();
void run_statistics_benchmark();
void run_report_benchmark();

int main() {
  std::cout << "stabcheck benchmarks\n";
  run_config_benchmark();
  run_statistics_benchmark();
  run_report_benchmark();
  return 0;
}
