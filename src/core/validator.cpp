#include "pluscode/validator.hpp"
#include "pluscode/constants.hpp"
#include <algorithm>

namespace pluscode {

namespace {

bool is_code_character(char c) {
    return c == SEPARATOR || c == PADDING_CHARACTER || digit_value(c) >= 0;
}

/**
 * @brief パディング部分の検査
 *
 * パディングは先頭以外から始まる偶数個の連続で、
 * コードは区切り文字で終わっていなければならない。
 */
bool is_valid_padding(const std::string& code, size_t separator) {
    // 短縮コードにはパディングを付けられない
    if (separator < SEPARATOR_POSITION) return false;

    size_t pad_start = code.find(PADDING_CHARACTER);
    if (pad_start == 0) return false;

    size_t pad_end = code.rfind(PADDING_CHARACTER);
    if ((pad_end - pad_start + 1) % 2 == 1) return false;
    for (size_t i = pad_start; i <= pad_end; ++i) {
        if (code[i] != PADDING_CHARACTER) return false;
    }

    return code.back() == SEPARATOR;
}

} // namespace

bool is_valid(const std::string& code) {
    size_t separator = code.find(SEPARATOR);
    if (separator == std::string::npos) return false;
    if (code.find(SEPARATOR, separator + 1) != std::string::npos) return false;
    if (code.size() == 1) return false;

    if (separator > SEPARATOR_POSITION || separator % 2 == 1) return false;

    if (code.find(PADDING_CHARACTER) != std::string::npos) {
        if (!is_valid_padding(code, separator)) return false;
    } else if (code.size() - separator - 1 == 1) {
        // 区切り文字の後ろに 1 文字だけというのは不可
        return false;
    }

    return std::all_of(code.begin(), code.end(), is_code_character);
}

bool is_short(const std::string& code) {
    return is_valid(code) && code.find(SEPARATOR) < SEPARATOR_POSITION;
}

bool is_full(const std::string& code) {
    if (!is_valid(code) || is_short(code)) return false;

    // 先頭の緯度桁が 180 度の範囲に収まるか
    int first_lat_value = digit_value(code[0]) * static_cast<int>(ENCODING_BASE);
    if (first_lat_value >= LATITUDE_MAX * 2) return false;

    if (code.size() > 1) {
        // 先頭の経度桁が 360 度の範囲に収まるか
        int first_lng_value = digit_value(code[1]) * static_cast<int>(ENCODING_BASE);
        if (first_lng_value >= LONGITUDE_MAX * 2) return false;
    }
    return true;
}

} // namespace pluscode
