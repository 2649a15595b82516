#ifndef CORVID_CLI_COMMON_HPP
#define CORVID_CLI_COMMON_HPP

#include <lexer/lexer.hpp>
#include <serialization/config_json.hpp>
#include <serialization/json_serialization.hpp>
#include <common/logging.hpp>
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>

namespace corvid::cli {

// Common context for all CLI commands
struct CommandContext {
    std::string input_path;
    std::string output_path;
    std::optional<std::string> config_path;
    bool verbose = false;
    bool help = false;
};

// Parse the arguments following the command name
inline CommandContext parse_common_args(int argc, char** argv, int start_idx) {
    CommandContext ctx;

    for (int i = start_idx; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "-v" || arg == "--verbose") {
            ctx.verbose = true;
        } else if (arg == "-o" || arg == "--output") {
            if (i + 1 >= argc) {
                throw std::runtime_error("-o/--output requires an argument");
            }
            ctx.output_path = argv[++i];
        } else if (arg == "-c" || arg == "--config") {
            if (i + 1 >= argc) {
                throw std::runtime_error("-c/--config requires an argument");
            }
            ctx.config_path = argv[++i];
        } else if (arg == "-h" || arg == "--help") {
            ctx.help = true;
        } else if (!arg.empty() && arg[0] != '-') {
            if (!ctx.input_path.empty()) {
                throw std::runtime_error("Unexpected positional argument: " + arg);
            }
            ctx.input_path = arg;
        } else {
            throw std::runtime_error("Unknown option: " + arg);
        }
    }

    if (ctx.verbose) {
        logging::get_logger()->set_level(spdlog::level::debug);
    }

    return ctx;
}

// Read entire file to string, bytes unchanged
inline std::string read_file(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw std::runtime_error("Cannot open file: " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

inline void write_file(const std::string& path, const std::string& content) {
    std::ofstream file(path, std::ios::binary);
    if (!file) {
        throw std::runtime_error("Cannot write to file: " + path);
    }
    file << content;
}

// Lexer settings from -c/--config, or the defaults
inline lexer::LexerConfig load_lexer_config(const CommandContext& ctx) {
    if (!ctx.config_path.has_value()) {
        return lexer::LexerConfig{};
    }
    nlohmann::json document = json::read_json_file(ctx.config_path.value());
    logging::get_logger()->info("Loaded configuration from: {}", ctx.config_path.value());
    return lexer::lexer_config_from_document(document);
}

// Reports a lexical error the way compilers do: one positioned line on stderr
inline int report_lex_error(const lexer::LexError& error) {
    logging::get_logger()->debug("Lexical error ({})", lexer::lex_error_kind_name(error.kind));
    std::cerr << error.message() << "\n";
    return 1;
}

// Command function declarations
int command_lex(int argc, char** argv);
int command_json(int argc, char** argv);
int command_check(int argc, char** argv);

}  // namespace corvid::cli

#endif // CORVID_CLI_COMMON_HPP
