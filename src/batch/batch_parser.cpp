/**
 * @file batch_parser.cpp
 * @brief 生成パーサーを呼び出すバッチスクリプトの読み込み口
 */
#include "pluscode/batch/script.hpp"
#include "parser.hpp"
#include <cstdio>
#include <memory>
#include <stdexcept>
#include <string>

namespace pluscode {
namespace batch {

namespace {

/**
 * @brief 再入可能スキャナの所有者
 *
 * yylex_destroy は読み込み中のバッファも解放する。
 */
class Scanner {
public:
    Scanner() {
        if (yylex_init(&scanner_) != 0) {
            throw std::runtime_error("Cannot initialize scanner");
        }
    }
    ~Scanner() { yylex_destroy(scanner_); }

    Scanner(const Scanner&) = delete;
    Scanner& operator=(const Scanner&) = delete;

    yyscan_t get() const { return scanner_; }

private:
    yyscan_t scanner_ = nullptr;
};

using FileHandle = std::unique_ptr<FILE, int (*)(FILE*)>;

/**
 * @brief 入力を設定済みのスキャナでスクリプト全体を構文解析
 * @param source エラーメッセージに載せる入力名
 */
std::unique_ptr<Script> run_parser(const Scanner& scanner, const std::string& source) {
    ParserContext ctx;
    int result = yyparse(scanner.get(), &ctx);

    if (result != 0 || ctx.has_error) {
        throw std::runtime_error("Parse error in " + source + ": " + ctx.error_message +
                                 " (after " + std::to_string(ctx.script->size()) +
                                 " commands)");
    }
    return std::move(ctx.script);
}

} // namespace

std::unique_ptr<Script> parse_file(const std::string& filename) {
    FileHandle file(std::fopen(filename.c_str(), "r"), &std::fclose);
    if (!file) {
        throw std::runtime_error("Cannot open file: " + filename);
    }

    Scanner scanner;
    yyset_in(file.get(), scanner.get());
    return run_parser(scanner, filename);
}

std::unique_ptr<Script> parse_string(const std::string& input) {
    Scanner scanner;
    yy_scan_string(input.c_str(), scanner.get());
    return run_parser(scanner, "<string>");
}

} // namespace batch
} // namespace pluscode
