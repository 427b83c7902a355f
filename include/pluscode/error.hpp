/**
 * @file error.hpp
 * @brief エラー種別と結果型
 */
#ifndef PLUSCODE_ERROR_HPP
#define PLUSCODE_ERROR_HPP

#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

namespace pluscode {

/**
 * @brief 符号化・復号の失敗理由
 */
enum class ErrorCode {
    InvalidCode,              // 不正なコード
    FullCodeExpected,         // フルコードが必要
    CannotShortenPaddedCodes, // パディング付きコードは短縮できない
    CodeLengthTooSmall,       // 短縮するには桁数が足りない
    InvalidCodeLength         // 指定できないコード長
};

/**
 * @brief エラー種別の識別名（"invalid_code" など）を取得
 */
const char* error_name(ErrorCode error);

/**
 * @brief 値またはエラーを保持する結果型
 *
 * 公開関数は例外を投げず、失敗を ErrorCode として返す。
 * エラーを持つ結果に value() を呼ぶのは呼び出し側の誤りで、
 * std::logic_error を投げる。
 */
template <typename T>
class Result {
public:
    Result(T value) : data_(std::move(value)) {}
    Result(ErrorCode error) : data_(error) {}

    /**
     * @brief 成功したかどうか
     */
    bool ok() const { return std::holds_alternative<T>(data_); }

    explicit operator bool() const { return ok(); }

    /**
     * @brief 成功時の値を取得
     * @throws std::logic_error エラーを保持している場合
     */
    const T& value() const {
        if (!ok()) {
            throw std::logic_error(std::string("Result holds error: ") +
                                   error_name(std::get<ErrorCode>(data_)));
        }
        return std::get<T>(data_);
    }

    const T& operator*() const { return value(); }
    const T* operator->() const { return &value(); }

    /**
     * @brief 失敗時のエラー種別を取得
     * @throws std::logic_error 値を保持している場合
     */
    ErrorCode error() const {
        if (ok()) {
            throw std::logic_error("Result holds a value");
        }
        return std::get<ErrorCode>(data_);
    }

    T value_or(T fallback) const {
        return ok() ? std::get<T>(data_) : std::move(fallback);
    }

private:
    std::variant<T, ErrorCode> data_;
};

} // namespace pluscode

#endif // PLUSCODE_ERROR_HPP
