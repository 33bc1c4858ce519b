#include "commands/doctor.h"
#include "commands/lint.h"
#include "commands/next_id.h"

#include <iostream>
#include <string>

namespace {

void print_usage() {
  std::cerr << "Usage: kira_cli <command> [options]\n"
               "\n"
               "Commands:\n"
               "  lint      Check work items for issues\n"
               "  doctor    Fix duplicate IDs, date formats and field issues\n"
               "  next-id   Print the next available work item ID\n"
               "\n"
               "Run 'kira_cli <command> --help' for command options.\n";
}

}  // namespace

int main(int argc, char* argv[]) {
  if (argc < 2) {
    print_usage();
    return 1;
  }

  const std::string subcommand = argv[1];
  if (subcommand == "lint") {
    return cmd_lint(argc, argv);
  }
  if (subcommand == "doctor") {
    return cmd_doctor(argc, argv);
  }
  if (subcommand == "next-id") {
    return cmd_next_id(argc, argv);
  }
  if (subcommand == "help" || subcommand == "--help" || subcommand == "-h") {
    print_usage();
    return 0;
  }

  std::cerr << "Unknown command: " << subcommand << "\n";
  print_usage();
  return 1;
}
