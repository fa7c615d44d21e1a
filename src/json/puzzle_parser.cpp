#include "puzzle_parser.hpp"
#include "parser.hpp"
#include <stdexcept>
#include <cstdio>

namespace queens_csp {
namespace json {

namespace {

size_t to_count(const char* member, const std::optional<int64_t>& value) {
    if (!value) {
        throw std::runtime_error(std::string("Missing member: ") + member);
    }
    if (*value < 0) {
        throw std::runtime_error(std::string(member) + " must not be negative: " +
                                 std::to_string(*value));
    }
    return static_cast<size_t>(*value);
}

Puzzle to_puzzle(const ParserContext& ctx) {
    Puzzle puzzle;
    puzzle.rows = to_count("rows", ctx.rows);
    puzzle.cols = to_count("cols", ctx.cols);

    if (!ctx.colors) {
        throw std::runtime_error("Missing member: colors");
    }
    puzzle.colors = *ctx.colors;

    if (!ctx.idx_to_color) {
        throw std::runtime_error("Missing member: idxToColor");
    }
    puzzle.idx_to_color.reserve(ctx.idx_to_color->size());
    for (auto color : *ctx.idx_to_color) {
        if (color < 0) {
            throw std::runtime_error("idxToColor entry must not be negative: " +
                                     std::to_string(color));
        }
        puzzle.idx_to_color.push_back(static_cast<size_t>(color));
    }

    return puzzle;
}

}  // namespace

Puzzle parse_file(const std::string& filename) {
    FILE* file = fopen(filename.c_str(), "r");
    if (!file) {
        throw std::runtime_error("Cannot open file: " + filename);
    }

    yyscan_t scanner;
    yylex_init(&scanner);
    yyset_in(file, scanner);

    ParserContext ctx;
    int result = yyparse(scanner, &ctx);

    yylex_destroy(scanner);
    fclose(file);

    if (result != 0 || ctx.has_error) {
        throw std::runtime_error("Parse error: " + ctx.error_message);
    }

    return to_puzzle(ctx);
}

Puzzle parse_string(const std::string& input) {
    yyscan_t scanner;
    yylex_init(&scanner);

    YY_BUFFER_STATE buffer = yy_scan_string(input.c_str(), scanner);

    ParserContext ctx;
    int result = yyparse(scanner, &ctx);

    yy_delete_buffer(buffer, scanner);
    yylex_destroy(scanner);

    if (result != 0 || ctx.has_error) {
        throw std::runtime_error("Parse error: " + ctx.error_message);
    }

    return to_puzzle(ctx);
}

std::string to_json(const std::vector<size_t>& solution) {
    std::string out = "[";
    for (size_t i = 0; i < solution.size(); ++i) {
        if (i > 0) out += ",";
        out += std::to_string(solution[i]);
    }
    out += "]";
    return out;
}

} // namespace json
} // namespace queens_csp
