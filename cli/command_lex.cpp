#include "cli_common.hpp"

namespace corvid::cli {

int command_lex(int argc, char** argv) {
    auto log = corvid::logging::get_logger();

    try {
        CommandContext ctx = parse_common_args(argc, argv, 2);

        if (ctx.help || ctx.input_path.empty()) {
            std::cerr << "Usage: corvid lex <source> [-o <output.txt>] [-c <config.json>] [-v]\n";
            std::cerr << "Prints one line per token: <line>:<col>   <kind>   <text>\n";
            return ctx.help ? 0 : 1;
        }

        log->info("Lexing: {}", ctx.input_path);

        lexer::LexerConfig config = load_lexer_config(ctx);
        std::string source = read_file(ctx.input_path);

        lexer::LexResult result = lexer::lex(ctx.input_path, source, config);
        if (!result) {
            return report_lex_error(result.error());
        }

        const lexer::TokenStream& tokens = result.tokens();
        std::string table = tokens.to_string();

        if (ctx.output_path.empty()) {
            std::cout << table;
        } else {
            write_file(ctx.output_path, table);
            std::cerr << "Wrote " << ctx.output_path << " (" << tokens.size() << " tokens)\n";
        }

        log->info("Lexed {} tokens over {} lines", tokens.size(), tokens.line_count());
        return 0;

    } catch (const std::exception& e) {
        log->error("Error: {}", e.what());
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

}  // namespace corvid::cli
