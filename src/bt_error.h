#pragma once

/**
 * @file bt_error.h
 * @brief Error reporting shared by the btcore primitives
 *
 * Fallible operations return std::optional (or bool) and take an optional
 * BtError* out-parameter that receives the failure reason.
 */

#include <string>

namespace btcore {

enum class BtErrorCode {
    None = 0,
    InvalidFormat,          ///< Malformed identifier text or bytes
    InvalidConfiguration,   ///< Impossible (total, piece, block) length triple or bad config value
    OutOfRange,             ///< Piece/block index or absolute offset outside the geometry
    InvalidBlock            ///< Block offset or length claim that does not match the geometry
};

/**
 * @brief Get a short name for an error code
 */
const char* bt_error_code_to_string(BtErrorCode code);

struct BtError {
    BtErrorCode code = BtErrorCode::None;
    std::string message;

    BtError() = default;
    BtError(BtErrorCode c, const std::string& msg) : code(c), message(msg) {}

    bool ok() const { return code == BtErrorCode::None; }

    /**
     * @brief Formats as "<code name>: <message>"
     */
    std::string to_string() const;
};

namespace detail {

/**
 * @brief Fill the out-parameter if the caller supplied one
 */
inline void set_error(BtError* error, BtErrorCode code, const std::string& message) {
    if (error) {
        error->code = code;
        error->message = message;
    }
}

} // namespace detail

} // namespace btcore
