#include "pluscode/coordinate.hpp"
#include "pluscode/constants.hpp"
#include <algorithm>
#include <cmath>

namespace pluscode {

double clip_latitude(double latitude) {
    return std::min(static_cast<double>(LATITUDE_MAX),
                    std::max(-static_cast<double>(LATITUDE_MAX), latitude));
}

double normalize_longitude(double longitude) {
    const double max = static_cast<double>(LONGITUDE_MAX);
    if (longitude >= -max && longitude < max) {
        return longitude;
    }
    double shifted = std::fmod(longitude + max, 2 * max);
    if (shifted < 0) {
        shifted += 2 * max;
    }
    // -1e-20 + 360 のような丸めで上端に届いた場合
    if (shifted >= 2 * max) {
        shifted -= 2 * max;
    }
    return shifted - max;
}

LocationIntegers location_to_integers(double latitude, double longitude) {
    // 整数値の double のまま切り詰め・剰余を行い、int64 への変換時の桁あふれを防ぐ
    constexpr double lat_range = static_cast<double>(2 * LATITUDE_MAX * FINAL_LAT_PRECISION);
    constexpr double lng_range = static_cast<double>(2 * LONGITUDE_MAX * FINAL_LNG_PRECISION);

    // 非有限値は 0 度として扱う（緯度の無限大は切り詰めで処理できる）
    if (std::isnan(latitude)) {
        latitude = 0.0;
    }
    if (!std::isfinite(longitude)) {
        longitude = 0.0;
    }

    double lat_val = std::floor(latitude * static_cast<double>(FINAL_LAT_PRECISION));
    lat_val += static_cast<double>(LATITUDE_MAX * FINAL_LAT_PRECISION);
    if (lat_val < 0) {
        lat_val = 0;
    } else if (lat_val >= lat_range) {
        lat_val = lat_range - 1;
    }

    double lng_val = std::floor(longitude * static_cast<double>(FINAL_LNG_PRECISION));
    if (!std::isfinite(lng_val)) {
        // 掛け算があふれる大きさなら先に 1 周分へ戻す
        lng_val = std::floor(normalize_longitude(longitude) * static_cast<double>(FINAL_LNG_PRECISION));
    }
    lng_val += static_cast<double>(LONGITUDE_MAX * FINAL_LNG_PRECISION);
    if (lng_val < 0 || lng_val >= lng_range) {
        lng_val = std::fmod(lng_val, lng_range);
        if (lng_val < 0) {
            lng_val += lng_range;
        }
    }

    LocationIntegers result;
    result.latitude = static_cast<int64_t>(lat_val);
    result.longitude = static_cast<int64_t>(lng_val);
    return result;
}

} // namespace pluscode
