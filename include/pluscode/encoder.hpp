/**
 * @file encoder.hpp
 * @brief 位置から Plus Code への符号化
 */
#ifndef PLUSCODE_ENCODER_HPP
#define PLUSCODE_ENCODER_HPP

#include "pluscode/constants.hpp"
#include "pluscode/error.hpp"
#include <cstdint>
#include <string>

namespace pluscode {

/**
 * @brief 位置を指定桁数のコードに符号化
 * @param latitude 緯度（範囲外は切り詰め）
 * @param longitude 経度（範囲外は折り返し）
 * @param code_length 桁数（2, 4, 6, 8, 10 以上。15 を超える値は 15 扱い）
 * @return コード文字列、桁数が不正なら ErrorCode::InvalidCodeLength
 */
Result<std::string> encode(double latitude, double longitude,
                           int code_length = PAIR_CODE_LENGTH);

/**
 * @brief 整数表現の位置をコードに符号化
 *
 * location_to_integers() の結果を直接受け取る下位 API。
 */
Result<std::string> encode_integers(int64_t latitude, int64_t longitude, int code_length);

} // namespace pluscode

#endif // PLUSCODE_ENCODER_HPP
