#pragma once

/**
 * @file bt_lengths.h
 * @brief Piece/block/byte-offset addressing for a torrent's content
 *
 * Lengths translates between the three coordinate systems used by the
 * transfer protocol: piece index, block index within a piece, and absolute
 * byte offset into the (possibly multi-file) content. Every piece except the
 * last has the nominal piece length; every block except the last block of a
 * piece has the nominal block length.
 *
 * A Lengths is validated once at construction and immutable afterwards, so a
 * single instance can be shared read-only (see LengthsPtr) by storage,
 * protocol and progress tracking code on any number of threads.
 */

#include "bt_types.h"
#include "bt_error.h"

#include <cstdint>
#include <cstddef>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace btcore {

class Lengths;

using LengthsPtr = std::shared_ptr<const Lengths>;

/**
 * @brief A piece index already checked against a Lengths instance
 *
 * Only Lengths::validate_piece_index() (and Lengths::last_piece()) can make
 * one, so the accessors taking a ValidPieceIndex cannot fail. Using an index
 * with a different Lengths than the one that validated it is a programming
 * error.
 */
class ValidPieceIndex {
public:
    uint32_t get() const noexcept { return index_; }

    bool operator==(const ValidPieceIndex& other) const noexcept { return index_ == other.index_; }
    bool operator!=(const ValidPieceIndex& other) const noexcept { return index_ != other.index_; }
    bool operator<(const ValidPieceIndex& other) const noexcept { return index_ < other.index_; }

private:
    friend class Lengths;
    explicit ValidPieceIndex(uint32_t index) noexcept : index_(index) {}

    uint32_t index_;
};

/**
 * @brief Half-open range [first, last) of absolute block indices
 */
struct BlockRange {
    uint32_t first;
    uint32_t last;

    uint32_t size() const { return last - first; }
    bool contains(uint32_t absolute_index) const {
        return absolute_index >= first && absolute_index < last;
    }
};

class Lengths {
public:
    //=========================================================================
    // Construction
    //=========================================================================

    /**
     * @brief Validate a size triple and build the geometry
     *
     * Fails with InvalidConfiguration if any length is zero or if the piece
     * or block count does not fit in 32 bits. total_length <= piece_length is
     * allowed and gives a single piece. A block_length longer than a piece
     * is allowed too: that piece then consists of one block of the piece's
     * own length.
     *
     * @param total_length Total bytes across all files
     * @param piece_length Nominal piece length
     * @param block_length Nominal block length (defaults to 16 KB)
     * @param error Optional output for error information
     */
    static std::optional<Lengths> create(uint64_t total_length, uint32_t piece_length,
                                         uint32_t block_length = BT_BLOCK_SIZE,
                                         BtError* error = nullptr);

    /**
     * @brief create() wrapped in a shared, read-only handle
     * @return Handle, or nullptr on failure (details in `error`)
     */
    static LengthsPtr create_shared(uint64_t total_length, uint32_t piece_length,
                                    uint32_t block_length = BT_BLOCK_SIZE,
                                    BtError* error = nullptr);

    //=========================================================================
    // Totals
    //=========================================================================

    uint64_t total_length() const { return total_length_; }
    uint32_t default_piece_length() const { return piece_length_; }
    uint32_t default_block_length() const { return block_length_; }
    uint32_t piece_count() const { return piece_count_; }
    uint32_t last_piece_length() const { return last_piece_length_; }

    /**
     * @brief Number of blocks in every piece but the last
     */
    uint32_t default_blocks_per_piece() const { return blocks_per_piece_; }

    /**
     * @brief Number of blocks across all pieces
     */
    uint32_t total_blocks() const { return total_blocks_; }

    /**
     * @brief Bytes needed for a one-bit-per-piece bitfield
     */
    size_t piece_bitfield_bytes() const { return (static_cast<size_t>(piece_count_) + 7) / 8; }

    /**
     * @brief Bytes needed for a one-bit-per-block bitfield
     */
    size_t block_bitfield_bytes() const { return (static_cast<size_t>(total_blocks_) + 7) / 8; }

    //=========================================================================
    // Trusted Accessors
    //=========================================================================

    std::optional<ValidPieceIndex> validate_piece_index(uint32_t piece) const;
    ValidPieceIndex last_piece() const { return ValidPieceIndex(piece_count_ - 1); }

    uint32_t piece_length(ValidPieceIndex piece) const;
    uint32_t block_count(ValidPieceIndex piece) const;
    uint64_t piece_offset(ValidPieceIndex piece) const;
    BlockRange block_range(ValidPieceIndex piece) const;

    /**
     * @brief All blocks of a piece, in order
     */
    std::vector<BlockInfo> block_infos(ValidPieceIndex piece) const;

    /**
     * @brief Index and length of every piece, in order
     */
    std::vector<PieceInfo> piece_infos() const;

    //=========================================================================
    // Checked Accessors
    //=========================================================================
    // These fail with OutOfRange when piece >= piece_count() or
    // block >= block_count(piece).

    std::optional<uint32_t> piece_length(uint32_t piece, BtError* error = nullptr) const;
    std::optional<uint32_t> block_count(uint32_t piece, BtError* error = nullptr) const;
    std::optional<uint32_t> block_length(uint32_t piece, uint32_t block, BtError* error = nullptr) const;
    std::optional<uint64_t> piece_offset(uint32_t piece, BtError* error = nullptr) const;
    std::optional<uint64_t> block_offset(uint32_t piece, uint32_t block, BtError* error = nullptr) const;
    std::optional<BlockInfo> block_info(uint32_t piece, uint32_t block, BtError* error = nullptr) const;

    /**
     * @brief Translate an absolute byte offset into (piece, offset in piece)
     *
     * Fails with OutOfRange when absolute_offset >= total_length().
     */
    std::optional<PiecePosition> offset_to_piece(uint64_t absolute_offset, BtError* error = nullptr) const;

    //=========================================================================
    // Peer Input Validation
    //=========================================================================

    /**
     * @brief Check a claimed block length against the geometry
     *
     * Returns true only when `length` equals block_length(piece, block)
     * exactly. Indices out of range give OutOfRange, any other mismatch gives
     * InvalidBlock. Peer supplied lengths must pass through here (or
     * block_from_request()) before a buffer is sized from them.
     */
    bool validate_block(uint32_t piece, uint32_t block, uint32_t length, BtError* error = nullptr) const;

    /**
     * @brief Map a wire-level (index, begin, length) triple to a block
     *
     * `begin` is the byte offset within the piece as carried by request,
     * cancel and piece messages. It must fall on a block boundary inside the
     * piece, and `length` must match that block's length exactly.
     */
    std::optional<BlockInfo> block_from_request(uint32_t piece, uint32_t begin, uint32_t length,
                                                BtError* error = nullptr) const;

    std::string to_string() const;

private:
    Lengths(uint64_t total_length, uint32_t piece_length, uint32_t block_length,
            uint32_t piece_count, uint32_t total_blocks);

    uint32_t block_length_in_piece(uint32_t piece_len, uint32_t block) const;
    bool check_piece(uint32_t piece, BtError* error) const;
    bool check_block(uint32_t piece, uint32_t block, BtError* error) const;

    uint64_t total_length_;
    uint32_t piece_length_;
    uint32_t block_length_;
    uint32_t piece_count_;
    uint32_t last_piece_length_;
    uint32_t blocks_per_piece_;
    uint32_t last_piece_blocks_;
    uint32_t total_blocks_;
};

std::ostream& operator<<(std::ostream& os, const Lengths& lengths);

} // namespace btcore
