/**
 * @file coordinate.hpp
 * @brief 緯度経度の正規化と固定小数点整数への変換
 */
#ifndef PLUSCODE_COORDINATE_HPP
#define PLUSCODE_COORDINATE_HPP

#include <cstdint>

namespace pluscode {

/**
 * @brief 緯度を [-90, 90] に切り詰める
 */
double clip_latitude(double latitude);

/**
 * @brief 経度を [-180, 180) に正規化する
 *
 * 何周分はみ出していても 1 回の剰余で戻す。
 */
double normalize_longitude(double longitude);

/**
 * @brief 最小精度を 1 単位とした緯度経度の整数表現
 *
 * latitude  は [0, 2*90*FINAL_LAT_PRECISION)
 * longitude は [0, 2*180*FINAL_LNG_PRECISION)
 */
struct LocationIntegers {
    int64_t latitude = 0;
    int64_t longitude = 0;
};

/**
 * @brief 度単位の位置を整数表現に変換
 *
 * 緯度は範囲内に切り詰め、経度は周期的に折り返す。
 * NaN の緯度、非有限の経度は 0 度として扱う。
 * @param latitude 緯度
 * @param longitude 経度
 */
LocationIntegers location_to_integers(double latitude, double longitude);

} // namespace pluscode

#endif // PLUSCODE_COORDINATE_HPP
