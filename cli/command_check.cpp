#include "cli_common.hpp"

namespace corvid::cli {

int command_check(int argc, char** argv) {
    auto log = corvid::logging::get_logger();

    try {
        CommandContext ctx = parse_common_args(argc, argv, 2);

        if (ctx.help || ctx.input_path.empty()) {
            std::cerr << "Usage: corvid check <source> [-c <config.json>]\n";
            return ctx.help ? 0 : 1;
        }

        lexer::LexerConfig config = load_lexer_config(ctx);
        std::string source = read_file(ctx.input_path);

        lexer::LexResult result = lexer::lex(ctx.input_path, source, config);
        if (!result) {
            return report_lex_error(result.error());
        }

        log->info("{}: ok ({} tokens)", ctx.input_path, result.tokens().size());
        return 0;

    } catch (const std::exception& e) {
        log->error("Error: {}", e.what());
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

}  // namespace corvid::cli
