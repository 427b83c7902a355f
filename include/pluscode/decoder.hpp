/**
 * @file decoder.hpp
 * @brief Plus Code から矩形領域への復号
 */
#ifndef PLUSCODE_DECODER_HPP
#define PLUSCODE_DECODER_HPP

#include "pluscode/code_area.hpp"
#include "pluscode/error.hpp"
#include <string>

namespace pluscode {

/**
 * @brief フルコードを復号
 * @return コードが表す領域。不正なコードは ErrorCode::InvalidCode、
 *         短縮コードは ErrorCode::FullCodeExpected
 */
Result<CodeArea> decode(const std::string& code);

} // namespace pluscode

#endif // PLUSCODE_DECODER_HPP
