#include "pluscode/encoder.hpp"
#include "pluscode/coordinate.hpp"
#include <algorithm>

namespace pluscode {

namespace {

// 負の値でも桁が 0..divisor-1 に収まるよう床関数で除算する
int64_t floor_div(int64_t value, int64_t divisor) {
    int64_t quotient = value / divisor;
    if (value % divisor != 0 && value < 0) {
        --quotient;
    }
    return quotient;
}

int64_t floor_mod(int64_t value, int64_t divisor) {
    int64_t remainder = value % divisor;
    return remainder < 0 ? remainder + divisor : remainder;
}

} // namespace

Result<std::string> encode(double latitude, double longitude, int code_length) {
    LocationIntegers location = location_to_integers(latitude, longitude);
    return encode_integers(location.latitude, location.longitude, code_length);
}

Result<std::string> encode_integers(int64_t latitude, int64_t longitude, int code_length) {
    if (code_length < MIN_DIGIT_COUNT ||
        (code_length < PAIR_CODE_LENGTH && code_length % 2 == 1)) {
        return ErrorCode::InvalidCodeLength;
    }
    const size_t length = static_cast<size_t>(std::min(code_length, MAX_DIGIT_COUNT));

    // 下位桁から順に埋める
    char digits[MAX_DIGIT_COUNT];

    if (code_length > PAIR_CODE_LENGTH) {
        for (int i = MAX_DIGIT_COUNT - 1; i >= PAIR_CODE_LENGTH; --i) {
            int64_t lat_digit = floor_mod(latitude, GRID_ROWS);
            int64_t lng_digit = floor_mod(longitude, GRID_COLUMNS);
            digits[i] = CODE_ALPHABET[lat_digit * GRID_COLUMNS + lng_digit];
            latitude = floor_div(latitude, GRID_ROWS);
            longitude = floor_div(longitude, GRID_COLUMNS);
        }
    } else {
        // グリッド部の精度を捨てる
        latitude = floor_div(latitude, detail::ipow(GRID_ROWS, GRID_CODE_LENGTH));
        longitude = floor_div(longitude, detail::ipow(GRID_COLUMNS, GRID_CODE_LENGTH));
    }

    for (int i = PAIR_CODE_LENGTH - 2; i >= 0; i -= 2) {
        digits[i] = CODE_ALPHABET[floor_mod(latitude, ENCODING_BASE)];
        digits[i + 1] = CODE_ALPHABET[floor_mod(longitude, ENCODING_BASE)];
        latitude = floor_div(latitude, ENCODING_BASE);
        longitude = floor_div(longitude, ENCODING_BASE);
    }

    std::string code;
    if (length >= SEPARATOR_POSITION) {
        code.assign(digits, SEPARATOR_POSITION);
        code += SEPARATOR;
        code.append(digits + SEPARATOR_POSITION, length - SEPARATOR_POSITION);
    } else {
        code.assign(digits, length);
        code.append(SEPARATOR_POSITION - length, PADDING_CHARACTER);
        code += SEPARATOR;
    }
    return code;
}

} // namespace pluscode
