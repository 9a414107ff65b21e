#include "commands/info.hpp"
#include "commands/init.hpp"
#include "commands/validate.hpp"

#include <exception>
#include <iostream>
#include <string>

static int print_usage() {
    std::cerr
        << "usage:\n"
        << "  pwf validate <files...> [options]\n"
        << "  pwf history <files...> [options]\n"
        << "  pwf init [path] [--history]\n"
        << "  pwf info\n"
        << "  pwf help\n";
    return 1;
}

static int print_validate_help(const std::string& cmd) {
    std::cerr
        << "usage:\n"
        << "  pwf " << cmd << " <files...> [options]\n"
        << "\n"
        << "options:\n"
        << "  -f, --format <fmt>           pretty | json | compact (default: pretty)\n"
        << "  -s, --strict                 treat warnings as errors\n"
        << "  -q, --quiet                  only print errors\n";
    return 0;
}

static int print_init_help() {
    std::cerr
        << "usage:\n"
        << "  pwf init [path] [options]\n"
        << "\n"
        << "options:\n"
        << "  --history                    write a history export template (default: history.yaml)\n"
        << "                               otherwise writes a plan template (default: plan.yaml)\n";
    return 0;
}

int main(int argc, char** argv) {
    if (argc < 2) return print_usage();

    const std::string cmd = argv[1];

    if (cmd == "help" || cmd == "--help") {
        print_usage();
        return 0;
    }

    // subcommand help
    const bool wants_help = argc >= 3 && std::string(argv[2]) == "--help";
    if ((cmd == "validate" || cmd == "history") && wants_help) return print_validate_help(cmd);
    if (cmd == "init" && wants_help) return print_init_help();

    try {
        if (cmd == "validate") return cmd_validate(argc - 1, argv + 1);
        if (cmd == "history")  return cmd_history(argc - 1, argv + 1);
        if (cmd == "init")     return cmd_init(argc - 1, argv + 1);
        if (cmd == "info")     return cmd_info();
    } catch (const std::exception& e) {
        std::cerr << "[error] " << e.what() << "\n";
        return 1;
    }

    std::cerr << "unknown command\n";
    return print_usage();
}
