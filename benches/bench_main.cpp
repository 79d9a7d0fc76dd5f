#include <iostream>

void run_config_benchmark();
void run_parser_benchmarks();
void run_sessions_benchmark();

int main() {
  std::cout << "codexbridge benchmarks\n";
  run_config_benchmark();
  run_parser_benchmarks();
  run_sessions_benchmark();
  return 0;
}
