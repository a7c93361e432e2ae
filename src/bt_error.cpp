#include "bt_error.h"

namespace btcore {

const char* bt_error_code_to_string(BtErrorCode code) {
    switch (code) {
        case BtErrorCode::None: return "None";
        case BtErrorCode::InvalidFormat: return "InvalidFormat";
        case BtErrorCode::InvalidConfiguration: return "InvalidConfiguration";
        case BtErrorCode::OutOfRange: return "OutOfRange";
        case BtErrorCode::InvalidBlock: return "InvalidBlock";
        default: return "Unknown";
    }
}

std::string BtError::to_string() const {
    if (message.empty()) {
        return bt_error_code_to_string(code);
    }
    return std::string(bt_error_code_to_string(code)) + ": " + message;
}

} // namespace btcore
