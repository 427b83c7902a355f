/**
 * @file code_area.hpp
 * @brief 復号結果の矩形領域
 */
#ifndef PLUSCODE_CODE_AREA_HPP
#define PLUSCODE_CODE_AREA_HPP

#include "pluscode/constants.hpp"
#include <algorithm>

namespace pluscode {

/**
 * @brief コードが表す矩形領域
 *
 * 南西端 (lo) と北東端 (hi)、中心、元になったコードの桁数を保持する。
 * 中心は北端 90 度・東端 180 度を越えないように切り詰める。
 */
struct CodeArea {
    double latitude_lo = 0.0;
    double longitude_lo = 0.0;
    double latitude_hi = 0.0;
    double longitude_hi = 0.0;
    double latitude_center = 0.0;
    double longitude_center = 0.0;
    int code_length = 0;

    /**
     * @brief 端点から領域を作成（中心は自動計算）
     */
    static CodeArea from_bounds(double latitude_lo, double longitude_lo,
                                double latitude_hi, double longitude_hi,
                                int code_length) {
        CodeArea area;
        area.latitude_lo = latitude_lo;
        area.longitude_lo = longitude_lo;
        area.latitude_hi = latitude_hi;
        area.longitude_hi = longitude_hi;
        area.latitude_center = std::min(latitude_lo + (latitude_hi - latitude_lo) / 2,
                                        static_cast<double>(LATITUDE_MAX));
        area.longitude_center = std::min(longitude_lo + (longitude_hi - longitude_lo) / 2,
                                         static_cast<double>(LONGITUDE_MAX));
        area.code_length = code_length;
        return area;
    }
};

} // namespace pluscode

#endif // PLUSCODE_CODE_AREA_HPP
