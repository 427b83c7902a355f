#include "pluscode/shortener.hpp"
#include "pluscode/constants.hpp"
#include "pluscode/coordinate.hpp"
#include "pluscode/decoder.hpp"
#include "pluscode/encoder.hpp"
#include "pluscode/validator.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>

namespace pluscode {

namespace {

std::string to_upper(std::string code) {
    std::transform(code.begin(), code.end(), code.begin(), [](unsigned char c) {
        return static_cast<char>(std::toupper(c));
    });
    return code;
}

} // namespace

Result<std::string> shorten(const std::string& code, double latitude, double longitude) {
    if (!is_full(code)) {
        return ErrorCode::FullCodeExpected;
    }
    if (code.find(PADDING_CHARACTER) != std::string::npos) {
        return ErrorCode::CannotShortenPaddedCodes;
    }

    std::string clean_code = to_upper(code);
    Result<CodeArea> area = decode(clean_code);
    if (!area) {
        return area.error();
    }
    if (area->code_length < MIN_TRIMMABLE_CODE_LEN) {
        return ErrorCode::CodeLengthTooSmall;
    }

    latitude = clip_latitude(latitude);
    longitude = normalize_longitude(longitude);

    // 参照位置がコードの中心からどれだけ離れているか
    double code_range = std::max(std::abs(area->latitude_center - latitude),
                                 std::abs(area->longitude_center - longitude));

    // 細かい解像度から順に、隣接セルと区別できる余裕 (0.3 倍) があるか調べる
    for (int i = PAIR_RESOLUTION_COUNT - 2; i >= 0; --i) {
        if (code_range < PAIR_RESOLUTIONS[i] * 0.3) {
            return clean_code.substr(static_cast<size_t>((i + 1) * 2));
        }
    }
    return clean_code;
}

Result<std::string> recover_nearest(const std::string& code,
                                    double reference_latitude,
                                    double reference_longitude) {
    if (is_full(code)) {
        return to_upper(code);
    }
    if (!is_short(code)) {
        return ErrorCode::InvalidCode;
    }

    reference_latitude = clip_latitude(reference_latitude);
    reference_longitude = normalize_longitude(reference_longitude);

    std::string clean_code = to_upper(code);

    // 補う桁数と、その桁が表す領域の大きさ（度）
    const size_t padding_length = SEPARATOR_POSITION - clean_code.find(SEPARATOR);
    const double resolution = std::pow(static_cast<double>(ENCODING_BASE),
                                       2.0 - static_cast<double>(padding_length) / 2.0);
    const double half_resolution = resolution / 2.0;

    // 参照位置のコードの先頭桁で補って復号する
    Result<std::string> reference_code = encode(reference_latitude, reference_longitude);
    if (!reference_code) {
        return reference_code.error();
    }
    Result<CodeArea> area = decode(reference_code->substr(0, padding_length) + clean_code);
    if (!area) {
        return area.error();
    }

    // 参照位置との差が半セルを越える軸は 1 セル分ずらす
    const double lat_max = static_cast<double>(LATITUDE_MAX);
    double latitude_center = area->latitude_center;
    if (reference_latitude + half_resolution < latitude_center &&
        latitude_center - resolution >= -lat_max) {
        latitude_center -= resolution;
    } else if (reference_latitude - half_resolution > latitude_center &&
               latitude_center + resolution <= lat_max) {
        latitude_center += resolution;
    }

    double longitude_center = area->longitude_center;
    if (reference_longitude + half_resolution < longitude_center) {
        longitude_center -= resolution;
    } else if (reference_longitude - half_resolution > longitude_center) {
        longitude_center += resolution;
    }

    return encode(latitude_center, longitude_center, area->code_length);
}

} // namespace pluscode
