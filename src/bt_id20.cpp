#include "bt_id20.h"
#include "bt_entropy.h"

#include <algorithm>
#include <stdexcept>

namespace btcore {

namespace {

constexpr size_t BITS_IN_ID20 = BT_ID20_SIZE * 8;

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // namespace

std::optional<Id20> Id20::from_bytes(const uint8_t* data, size_t size, BtError* error) {
    if (data == nullptr || size != BT_ID20_SIZE) {
        detail::set_error(error, BtErrorCode::InvalidFormat,
                          "expected " + std::to_string(BT_ID20_SIZE) + " bytes, got " +
                          std::to_string(data == nullptr ? 0 : size));
        return std::nullopt;
    }

    Bytes bytes;
    std::copy(data, data + BT_ID20_SIZE, bytes.begin());
    return Id20(bytes);
}

std::optional<Id20> Id20::from_hex(const std::string& hex, BtError* error) {
    if (hex.size() != BT_ID20_HEX_SIZE) {
        detail::set_error(error, BtErrorCode::InvalidFormat,
                          "expected " + std::to_string(BT_ID20_HEX_SIZE) +
                          " hex characters, got " + std::to_string(hex.size()));
        return std::nullopt;
    }

    Bytes bytes;
    for (size_t i = 0; i < BT_ID20_SIZE; ++i) {
        int hi = hex_value(hex[i * 2]);
        int lo = hex_value(hex[i * 2 + 1]);
        if (hi < 0 || lo < 0) {
            size_t bad = hi < 0 ? i * 2 : i * 2 + 1;
            detail::set_error(error, BtErrorCode::InvalidFormat,
                              "non-hex character at position " + std::to_string(bad));
            return std::nullopt;
        }
        bytes[i] = static_cast<uint8_t>((hi << 4) | lo);
    }

    return Id20(bytes);
}

Id20 Id20::random(EntropySource& source) {
    Bytes bytes;
    source.fill(bytes.data(), bytes.size());
    return Id20(bytes);
}

Id20 Id20::random() {
    return random(system_entropy());
}

std::string Id20::to_hex() const {
    static constexpr char hex_chars[] = "0123456789abcdef";
    std::string hex;
    hex.reserve(BT_ID20_HEX_SIZE);
    for (uint8_t byte : bytes_) {
        hex += hex_chars[byte >> 4];
        hex += hex_chars[byte & 0x0f];
    }
    return hex;
}

bool Id20::is_zero() const noexcept {
    for (uint8_t byte : bytes_) {
        if (byte != 0) return false;
    }
    return true;
}

Id20 Id20::distance(const Id20& other) const noexcept {
    Bytes result;
    for (size_t i = 0; i < BT_ID20_SIZE; ++i) {
        result[i] = bytes_[i] ^ other.bytes_[i];
    }
    return Id20(result);
}

bool Id20::get_bit(size_t index) const {
    if (index >= BITS_IN_ID20) {
        throw std::out_of_range("Id20 bit index " + std::to_string(index) + " out of range");
    }
    return (bytes_[index / 8] >> (7 - index % 8)) & 1;
}

Id20 Id20::with_bit(size_t index, bool value) const {
    if (index >= BITS_IN_ID20) {
        throw std::out_of_range("Id20 bit index " + std::to_string(index) + " out of range");
    }
    Bytes result = bytes_;
    uint8_t mask = static_cast<uint8_t>(1u << (7 - index % 8));
    if (value) {
        result[index / 8] |= mask;
    } else {
        result[index / 8] &= static_cast<uint8_t>(~mask);
    }
    return Id20(result);
}

std::ostream& operator<<(std::ostream& os, const Id20& id) {
    return os << id.to_hex();
}

} // namespace btcore
