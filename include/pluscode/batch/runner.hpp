/**
 * @file runner.hpp
 * @brief バッチスクリプトの実行
 */
#ifndef PLUSCODE_BATCH_RUNNER_HPP
#define PLUSCODE_BATCH_RUNNER_HPP

#include "pluscode/batch/script.hpp"
#include "pluscode/constants.hpp"
#include <ostream>

namespace pluscode {
namespace batch {

/**
 * @brief 実行統計
 */
struct RunnerStats {
    size_t command_count = 0;
    size_t error_count = 0;
};

/**
 * @brief スクリプトのコマンドを順に実行し、結果を 1 行ずつ出力する
 *
 * 失敗したコマンドは "ERROR <error_name>" を出力して次へ進む。
 * 診断メッセージは "% " で始まる行としてログストリームに書く。
 */
class Runner {
public:
    /**
     * @param out 結果の出力先
     * @param log 診断メッセージの出力先
     */
    Runner(std::ostream& out, std::ostream& log);

    /**
     * @brief スクリプトを実行
     * @return 失敗したコマンドの数
     */
    size_t run(const Script& script);

    /**
     * @brief 統計情報を取得
     */
    const RunnerStats& stats() const { return stats_; }

    /**
     * @brief verbose モードを有効/無効にする
     */
    void set_verbose(bool enabled) { verbose_ = enabled; }

    /**
     * @brief 桁数を省略した encode に使う桁数を設定
     */
    void set_default_code_length(int code_length) { default_code_length_ = code_length; }

private:
    std::ostream& out_;
    std::ostream& log_;
    RunnerStats stats_;
    bool verbose_ = false;
    int default_code_length_ = PAIR_CODE_LENGTH;

    /**
     * @brief 1 コマンドを実行
     * @return 成功したら true
     */
    bool execute(const Command& command);
};

} // namespace batch
} // namespace pluscode

#endif // PLUSCODE_BATCH_RUNNER_HPP
