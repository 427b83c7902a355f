/**
 * @file constants.hpp
 * @brief Plus Code の固定定数と文字セット
 */
#ifndef PLUSCODE_CONSTANTS_HPP
#define PLUSCODE_CONSTANTS_HPP

#include <cstdint>
#include <cstddef>

namespace pluscode {

namespace detail {

constexpr int64_t ipow(int64_t base, int exp) {
    int64_t result = 1;
    for (int i = 0; i < exp; ++i) {
        result *= base;
    }
    return result;
}

} // namespace detail

/// コードを 2 つに区切る区切り文字
inline constexpr char SEPARATOR = '+';

/// 区切り文字の前に置く桁数
inline constexpr size_t SEPARATOR_POSITION = 8;

/// パディング文字
inline constexpr char PADDING_CHARACTER = '0';

/// 符号化に使う文字セット（位置が桁の値）
inline constexpr char CODE_ALPHABET[] = "23456789CFGHJMPQRVWX";

inline constexpr int64_t ENCODING_BASE = 20;

inline constexpr int64_t LATITUDE_MAX = 90;
inline constexpr int64_t LONGITUDE_MAX = 180;

inline constexpr int MIN_DIGIT_COUNT = 2;
inline constexpr int MAX_DIGIT_COUNT = 15;

/// 緯度経度ペアで符号化する最大桁数（約 13.5m 四方）
inline constexpr int PAIR_CODE_LENGTH = 10;

/// グリッド細分化の桁数
inline constexpr int GRID_CODE_LENGTH = MAX_DIGIT_COUNT - PAIR_CODE_LENGTH;

inline constexpr int64_t GRID_COLUMNS = 4;
inline constexpr int64_t GRID_ROWS = 5;

/// ペア部の先頭桁の位取り（最終桁を 1 としたとき）
inline constexpr int64_t PAIR_FIRST_PLACE_VALUE =
    detail::ipow(ENCODING_BASE, PAIR_CODE_LENGTH / 2 - 1);

/// ペア部の精度の逆数
inline constexpr int64_t PAIR_PRECISION = detail::ipow(ENCODING_BASE, 3);

inline constexpr int64_t GRID_LAT_FIRST_PLACE_VALUE = detail::ipow(GRID_ROWS, GRID_CODE_LENGTH - 1);
inline constexpr int64_t GRID_LNG_FIRST_PLACE_VALUE = detail::ipow(GRID_COLUMNS, GRID_CODE_LENGTH - 1);

/// 緯度にこの値を掛けると最小精度の整数倍になる
inline constexpr int64_t FINAL_LAT_PRECISION =
    PAIR_PRECISION * detail::ipow(GRID_ROWS, MAX_DIGIT_COUNT - PAIR_CODE_LENGTH);

/// 経度にこの値を掛けると最小精度の整数倍になる
inline constexpr int64_t FINAL_LNG_PRECISION =
    PAIR_PRECISION * detail::ipow(GRID_COLUMNS, MAX_DIGIT_COUNT - PAIR_CODE_LENGTH);

/// 短縮できるコードの最小桁数
inline constexpr int MIN_TRIMMABLE_CODE_LEN = 6;

/// ペア各桁の解像度（度）
inline constexpr double PAIR_RESOLUTIONS[] = {20.0, 1.0, 0.05, 0.0025, 0.000125};
inline constexpr int PAIR_RESOLUTION_COUNT = 5;

/**
 * @brief 文字の桁の値を返す（大文字小文字を区別しない）
 * @return 文字セットに含まれなければ -1
 */
constexpr int digit_value(char c) {
    if (c >= 'a' && c <= 'z') {
        c = static_cast<char>(c - 'a' + 'A');
    }
    for (int i = 0; i < ENCODING_BASE; ++i) {
        if (CODE_ALPHABET[i] == c) return i;
    }
    return -1;
}

} // namespace pluscode

#endif // PLUSCODE_CONSTANTS_HPP
