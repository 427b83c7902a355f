/**
 * @file shortener.hpp
 * @brief 参照位置を使ったコードの短縮と復元
 */
#ifndef PLUSCODE_SHORTENER_HPP
#define PLUSCODE_SHORTENER_HPP

#include "pluscode/error.hpp"
#include <string>

namespace pluscode {

/**
 * @brief フルコードの先頭桁を参照位置に基づいて取り除く
 *
 * 参照位置がコードの中心に近いほど多くの桁を取り除ける。
 * どの解像度でも安全に短縮できない場合はコードをそのまま返す。
 *
 * @param code フルコード（パディングなし）
 * @param latitude 参照緯度
 * @param longitude 参照経度
 */
Result<std::string> shorten(const std::string& code, double latitude, double longitude);

/**
 * @brief 短縮コードから参照位置に最も近いフルコードを復元
 *
 * フルコードが渡された場合は大文字化して返す。
 *
 * @param code 短縮コードまたはフルコード
 * @param reference_latitude 参照緯度
 * @param reference_longitude 参照経度
 */
Result<std::string> recover_nearest(const std::string& code,
                                    double reference_latitude,
                                    double reference_longitude);

} // namespace pluscode

#endif // PLUSCODE_SHORTENER_HPP
