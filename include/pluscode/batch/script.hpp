/**
 * @file script.hpp
 * @brief バッチ変換スクリプトの中間表現
 */
#ifndef PLUSCODE_BATCH_SCRIPT_HPP
#define PLUSCODE_BATCH_SCRIPT_HPP

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace pluscode {
namespace batch {

/**
 * @brief コマンドの種類
 */
enum class CommandKind {
    Encode,
    Decode,
    Shorten,
    Recover,
    Validate
};

/**
 * @brief スクリプト中の 1 文
 */
struct Command {
    CommandKind kind = CommandKind::Encode;
    std::string code;                // decode/shorten/recover/validate
    double latitude = 0.0;           // encode/shorten/recover
    double longitude = 0.0;          // encode/shorten/recover
    std::optional<int> code_length;  // encode のみ（省略時は既定値）
    int line = 0;                    // ソース上の行番号
};

/**
 * @brief コマンド名を取得（"encode" など）
 */
const char* command_name(CommandKind kind);

/**
 * @brief バッチスクリプト
 */
class Script {
public:
    Script() = default;

    /**
     * @brief コマンドを末尾に追加
     */
    void add_command(Command command);

    /**
     * @brief 記述順のコマンド一覧を取得
     */
    const std::vector<Command>& commands() const { return commands_; }

    size_t size() const { return commands_.size(); }
    bool empty() const { return commands_.empty(); }

private:
    std::vector<Command> commands_;
};

/**
 * @brief スクリプトファイルをパース
 * @param filename ファイル名
 * @return パースされたスクリプト
 * @throws std::runtime_error ファイルが開けない場合、パースエラー時
 */
std::unique_ptr<Script> parse_file(const std::string& filename);

/**
 * @brief スクリプト文字列をパース
 * @param input 入力文字列
 * @return パースされたスクリプト
 * @throws std::runtime_error パースエラー時
 */
std::unique_ptr<Script> parse_string(const std::string& input);

} // namespace batch
} // namespace pluscode

#endif // PLUSCODE_BATCH_SCRIPT_HPP
