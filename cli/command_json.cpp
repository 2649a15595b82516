#include "cli_common.hpp"
#include <serialization/token_json.hpp>

namespace corvid::cli {

int command_json(int argc, char** argv) {
    auto log = corvid::logging::get_logger();

    try {
        CommandContext ctx = parse_common_args(argc, argv, 2);

        if (ctx.help || ctx.input_path.empty() || ctx.output_path.empty()) {
            std::cerr << "Usage: corvid json <source> -o <tokens.json> [-c <config.json>]\n";
            std::cerr << "Options:\n";
            std::cerr << "  -c, --config <file>   Configuration file with a \"lexer\" section\n";
            return ctx.help ? 0 : 1;
        }

        log->info("Dumping tokens of: {}", ctx.input_path);

        lexer::LexerConfig config = load_lexer_config(ctx);
        std::string source = read_file(ctx.input_path);

        json::SerializedData data;
        data.timestamp = json::get_timestamp();
        data.source_file = ctx.input_path;
        data.config = {{"lexer", config}};

        lexer::LexResult result = lexer::lex(ctx.input_path, source, config);
        if (!result) {
            // The error document is still written so tooling can pick it up
            data.step = "error";
            data.data = lexer::lex_error_to_json(result.error());
            json::write_json_file(ctx.output_path, data.to_json());
            return report_lex_error(result.error());
        }

        const lexer::TokenStream& tokens = result.tokens();
        data.step = "tokens";
        data.data = lexer::token_stream_to_json(tokens);
        data.stats = {
            {"token_count", tokens.size()},
            {"line_count", tokens.line_count()},
            {"byte_count", source.size()}
        };

        json::write_json_file(ctx.output_path, data.to_json());

        log->info("Wrote tokens to {}", ctx.output_path);
        std::cerr << "Wrote " << ctx.output_path << " (" << tokens.size() << " tokens)\n";

        return 0;

    } catch (const std::exception& e) {
        log->error("Error: {}", e.what());
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

}  // namespace corvid::cli
