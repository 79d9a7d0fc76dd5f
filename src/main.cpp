#include "codexbridge/cli/commands.hpp"

int main(int argc, char **argv) { return codexbridge::cli::run_cli(argc, argv); }
