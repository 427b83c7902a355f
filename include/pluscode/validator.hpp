/**
 * @file validator.hpp
 * @brief コード文字列の妥当性判定
 */
#ifndef PLUSCODE_VALIDATOR_HPP
#define PLUSCODE_VALIDATOR_HPP

#include <string>

namespace pluscode {

/**
 * @brief コードが妥当かどうか
 *
 * 全ての文字が文字セット・区切り文字・パディング文字のいずれかで、
 * 区切り文字がちょうど 1 つ、8 桁目以内の偶数位置にあること。
 * パディングは区切り文字が 8 桁目にあるときだけ許され、
 * 偶数個連続して区切り文字の直前で終わらなければならない。
 */
bool is_valid(const std::string& code);

/**
 * @brief 妥当な短縮コードかどうか（区切り文字が 8 桁目より前）
 */
bool is_short(const std::string& code);

/**
 * @brief 妥当なフルコードかどうか
 *
 * 先頭の緯度桁・経度桁が有効な座標範囲に収まることも確認する。
 */
bool is_full(const std::string& code);

} // namespace pluscode

#endif // PLUSCODE_VALIDATOR_HPP
