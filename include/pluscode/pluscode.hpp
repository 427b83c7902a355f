/**
 * @file pluscode.hpp
 * @brief Plus Code コーデックの公開ヘッダ一式
 */
#ifndef PLUSCODE_PLUSCODE_HPP
#define PLUSCODE_PLUSCODE_HPP

#include "pluscode/constants.hpp"
#include "pluscode/error.hpp"
#include "pluscode/code_area.hpp"
#include "pluscode/coordinate.hpp"
#include "pluscode/validator.hpp"
#include "pluscode/encoder.hpp"
#include "pluscode/decoder.hpp"
#include "pluscode/shortener.hpp"

#endif // PLUSCODE_PLUSCODE_HPP
