#include "bt_peer_id.h"
#include "bt_entropy.h"

#include <algorithm>
#include <iomanip>
#include <sstream>

namespace btcore {

Id20 generate_peer_id(EntropySource& source, const std::string& prefix) {
    Id20::Bytes bytes{};

    size_t prefix_len = (std::min)(prefix.size(), BT_ID20_SIZE);
    for (size_t i = 0; i < prefix_len; ++i) {
        bytes[i] = static_cast<uint8_t>(prefix[i]);
    }

    if (prefix_len < BT_ID20_SIZE) {
        source.fill(bytes.data() + prefix_len, BT_ID20_SIZE - prefix_len);
    }

    return Id20(bytes);
}

Id20 generate_peer_id(const std::string& prefix) {
    return generate_peer_id(system_entropy(), prefix);
}

std::optional<AzureusPeerId> decode_peer_id(const Id20& id) {
    const auto& b = id.bytes();
    if (b[0] != '-' || b[7] != '-') {
        return std::nullopt;
    }

    auto is_alnum = [](uint8_t c) {
        return (c >= '0' && c <= '9') || (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z');
    };
    auto is_printable = [](uint8_t c) { return c >= 32 && c < 127; };

    // Some clients use '~' or '-' as the second client code character
    if (!is_alnum(b[1]) || !is_printable(b[2])) {
        return std::nullopt;
    }
    for (size_t i = 3; i < 7; ++i) {
        if (!is_alnum(b[i])) {
            return std::nullopt;
        }
    }

    AzureusPeerId result;
    result.client_id.assign(reinterpret_cast<const char*>(b.data()) + 1, 2);
    result.version.assign(reinterpret_cast<const char*>(b.data()) + 3, 4);
    return result;
}

std::string peer_id_to_string(const Id20& id) {
    std::ostringstream oss;
    for (uint8_t byte : id.bytes()) {
        if (byte >= 32 && byte < 127) {
            oss << static_cast<char>(byte);
        } else {
            oss << "\\x" << std::hex << std::setw(2) << std::setfill('0')
                << static_cast<int>(byte) << std::dec;
        }
    }
    return oss.str();
}

} // namespace btcore
