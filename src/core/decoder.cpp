#include "pluscode/decoder.hpp"
#include "pluscode/constants.hpp"
#include "pluscode/validator.hpp"
#include <algorithm>
#include <cmath>

namespace pluscode {

namespace {

// 浮動小数点の誤差を小数点以下 14 桁で丸める
double round_coordinate(double value) {
    return std::round(value * 1e14) / 1e14;
}

} // namespace

Result<CodeArea> decode(const std::string& code) {
    if (!is_valid(code)) {
        return ErrorCode::InvalidCode;
    }
    if (!is_full(code)) {
        return ErrorCode::FullCodeExpected;
    }

    // 区切り文字とパディングを除いた桁の値（最大 15 桁）
    int digits[MAX_DIGIT_COUNT];
    int digit_count = 0;
    for (char c : code) {
        if (c == SEPARATOR || c == PADDING_CHARACTER) continue;
        digits[digit_count++] = digit_value(c);
        if (digit_count == MAX_DIGIT_COUNT) break;
    }

    // ペア部: 範囲の最小値から積み上げる
    int64_t normal_lat = -LATITUDE_MAX * PAIR_PRECISION;
    int64_t normal_lng = -LONGITUDE_MAX * PAIR_PRECISION;
    int pair_digits = std::min(digit_count, PAIR_CODE_LENGTH);
    int64_t place_value = PAIR_FIRST_PLACE_VALUE;
    for (int i = 0; i < pair_digits; i += 2) {
        normal_lat += digits[i] * place_value;
        normal_lng += digits[i + 1] * place_value;
        if (i < pair_digits - 2) {
            place_value /= ENCODING_BASE;
        }
    }

    double lat_precision = static_cast<double>(place_value) / PAIR_PRECISION;
    double lng_precision = static_cast<double>(place_value) / PAIR_PRECISION;

    // グリッド部: 各桁を 5 行 x 4 列のセルとして解釈
    int64_t grid_lat = 0;
    int64_t grid_lng = 0;
    if (digit_count > PAIR_CODE_LENGTH) {
        int64_t row_place_value = GRID_LAT_FIRST_PLACE_VALUE;
        int64_t col_place_value = GRID_LNG_FIRST_PLACE_VALUE;
        for (int i = PAIR_CODE_LENGTH; i < digit_count; ++i) {
            int64_t row = digits[i] / GRID_COLUMNS;
            int64_t col = digits[i] % GRID_COLUMNS;
            grid_lat += row * row_place_value;
            grid_lng += col * col_place_value;
            if (i < digit_count - 1) {
                row_place_value /= GRID_ROWS;
                col_place_value /= GRID_COLUMNS;
            }
        }
        lat_precision = static_cast<double>(row_place_value) / FINAL_LAT_PRECISION;
        lng_precision = static_cast<double>(col_place_value) / FINAL_LNG_PRECISION;
    }

    double lat = static_cast<double>(normal_lat) / PAIR_PRECISION +
                 static_cast<double>(grid_lat) / FINAL_LAT_PRECISION;
    double lng = static_cast<double>(normal_lng) / PAIR_PRECISION +
                 static_cast<double>(grid_lng) / FINAL_LNG_PRECISION;

    return CodeArea::from_bounds(round_coordinate(lat),
                                 round_coordinate(lng),
                                 round_coordinate(lat + lat_precision),
                                 round_coordinate(lng + lng_precision),
                                 digit_count);
}

} // namespace pluscode
