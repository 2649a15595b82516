#include <iostream>
#include <string>

#include "cli_common.hpp"
#include "logging.hpp"

void print_usage(const char* program_name) {
    std::cerr << "Usage: " << program_name << " <command> [options] <source>\n";
    std::cerr << "\n";
    std::cerr << "Tokenizes corvid source files.\n";
    std::cerr << "\n";
    std::cerr << "Commands:\n";
    std::cerr << "  lex     Print the token table\n";
    std::cerr << "  json    Write the token stream as JSON (-o required)\n";
    std::cerr << "  check   Only report whether the file tokenizes\n";
    std::cerr << "\n";
    std::cerr << "Options:\n";
    std::cerr << "  -o, --output <file>   Output file\n";
    std::cerr << "  -c, --config <file>   JSON configuration (\"lexer\" section)\n";
    std::cerr << "  -v, --verbose         Debug logging\n";
    std::cerr << "  -h, --help            Show help\n";
    std::cerr << "\n";
    std::cerr << "Environment:\n";
    std::cerr << "  CORVID_LOG_LEVEL - Set log level (trace, debug, info, warn, error, off)\n";
}

int main(int argc, char* argv[]) {
    auto log = corvid::logging::get_logger();

    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    std::string command = argv[1];
    if (command == "--help" || command == "-h") {
        print_usage(argv[0]);
        return 0;
    }

    log->debug("Running command: {}", command);

    if (command == "lex") {
        return corvid::cli::command_lex(argc, argv);
    }
    if (command == "json") {
        return corvid::cli::command_json(argc, argv);
    }
    if (command == "check") {
        return corvid::cli::command_check(argc, argv);
    }

    std::cerr << "Unknown command: " << command << "\n\n";
    print_usage(argv[0]);
    return 1;
}
