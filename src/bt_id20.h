#pragma once

/**
 * @file bt_id20.h
 * @brief 20-byte identifier used for info hashes and peer ids
 *
 * Id20 is an immutable value: construct it from raw bytes, from its 40
 * character hex form, or from random bytes. On the wire it is always the raw
 * 20 bytes; hex is for display and logging only.
 */

#include "bt_types.h"
#include "bt_error.h"

#include <array>
#include <cstdint>
#include <cstddef>
#include <functional>
#include <optional>
#include <ostream>
#include <string>

namespace btcore {

class EntropySource;

class Id20 {
public:
    using Bytes = std::array<uint8_t, BT_ID20_SIZE>;

    /**
     * @brief All-zero identifier
     */
    Id20() noexcept : bytes_{} {}

    explicit Id20(const Bytes& bytes) noexcept : bytes_(bytes) {}

    //=========================================================================
    // Construction
    //=========================================================================

    static Id20 from_bytes(const Bytes& bytes) noexcept { return Id20(bytes); }

    /**
     * @brief Build from a buffer of unknown size (e.g. a wire message field)
     * @return Identifier, or empty with InvalidFormat if size != 20
     */
    static std::optional<Id20> from_bytes(const uint8_t* data, size_t size,
                                          BtError* error = nullptr);

    /**
     * @brief Parse 40 hexadecimal characters (either case)
     * @return Identifier, or empty with InvalidFormat
     */
    static std::optional<Id20> from_hex(const std::string& hex, BtError* error = nullptr);

    /**
     * @brief Random identifier drawn from `source`
     * @throws std::runtime_error if the source has no randomness available
     */
    static Id20 random(EntropySource& source);

    /**
     * @brief Random identifier drawn from the process-wide system source
     */
    static Id20 random();

    //=========================================================================
    // Accessors
    //=========================================================================

    const Bytes& bytes() const noexcept { return bytes_; }
    const uint8_t* data() const noexcept { return bytes_.data(); }
    static constexpr size_t size() noexcept { return BT_ID20_SIZE; }

    /**
     * @brief Lowercase, zero padded, exactly 40 characters
     */
    std::string to_hex() const;

    bool is_zero() const noexcept;

    //=========================================================================
    // DHT helpers
    //=========================================================================

    /**
     * @brief XOR distance (Kademlia metric)
     */
    Id20 distance(const Id20& other) const noexcept;

    /**
     * @brief Bit `index` counting from the most significant bit of byte 0
     * @throws std::out_of_range if index >= 160
     */
    bool get_bit(size_t index) const;

    /**
     * @brief Copy of this identifier with bit `index` set to `value`
     * @throws std::out_of_range if index >= 160
     */
    Id20 with_bit(size_t index, bool value) const;

    bool operator==(const Id20& other) const noexcept { return bytes_ == other.bytes_; }
    bool operator!=(const Id20& other) const noexcept { return bytes_ != other.bytes_; }
    bool operator<(const Id20& other) const noexcept { return bytes_ < other.bytes_; }
    bool operator<=(const Id20& other) const noexcept { return bytes_ <= other.bytes_; }
    bool operator>(const Id20& other) const noexcept { return bytes_ > other.bytes_; }
    bool operator>=(const Id20& other) const noexcept { return bytes_ >= other.bytes_; }

private:
    Bytes bytes_;
};

std::ostream& operator<<(std::ostream& os, const Id20& id);

} // namespace btcore

namespace std {

template <>
struct hash<btcore::Id20> {
    size_t operator()(const btcore::Id20& id) const noexcept {
        // FNV-1a over all 20 bytes
        uint64_t h = 14695981039346656037ULL;
        for (uint8_t byte : id.bytes()) {
            h ^= byte;
            h *= 1099511628211ULL;
        }
        return static_cast<size_t>(h);
    }
};

} // namespace std
