#include "teledrop/cli/commands.hpp"

int main(int argc, char **argv) { return teledrop::cli::run_cli(argc, argv); }
