#pragma once

/**
 * @file bt_types.h
 * @brief Core BitTorrent constants and plain coordinate types for btcore
 *
 * Constants and the small value types that the addressing engine hands out:
 * piece positions, per-piece summaries and block coordinates.
 */

#include <cstdint>
#include <cstddef>
#include <functional>

namespace btcore {

//=============================================================================
// Constants
//=============================================================================

/// Size of an info hash / peer id in bytes (SHA-1 digest length)
constexpr size_t BT_ID20_SIZE = 20;

/// Length of the hex text form of a 20 byte identifier
constexpr size_t BT_ID20_HEX_SIZE = BT_ID20_SIZE * 2;

/// Standard block size in bytes (16 KB)
constexpr uint32_t BT_BLOCK_SIZE = 16384;

/// Maximum block size most clients will serve (32 KB)
constexpr uint32_t BT_MAX_BLOCK_SIZE = 32768;

/// Azureus-style peer id prefix used by btcore (BEP 20)
constexpr char BT_PEER_ID_PREFIX[] = "-BC0100-";

//=============================================================================
// Coordinate Types
//=============================================================================

/**
 * @brief An absolute byte offset translated into piece coordinates
 */
struct PiecePosition {
    uint32_t piece;     ///< Piece index
    uint32_t offset;    ///< Offset within the piece

    PiecePosition() : piece(0), offset(0) {}
    PiecePosition(uint32_t p, uint32_t off) : piece(p), offset(off) {}

    bool operator==(const PiecePosition& other) const {
        return piece == other.piece && offset == other.offset;
    }

    bool operator!=(const PiecePosition& other) const {
        return !(*this == other);
    }
};

/**
 * @brief Index and actual length of one piece
 */
struct PieceInfo {
    uint32_t index;
    uint32_t length;

    PieceInfo() : index(0), length(0) {}
    PieceInfo(uint32_t i, uint32_t len) : index(i), length(len) {}

    bool operator==(const PieceInfo& other) const {
        return index == other.index && length == other.length;
    }
};

/**
 * @brief Represents a block within a piece
 *
 * `offset` is relative to the start of the piece (the "begin" field of a
 * request message), `absolute_index` counts blocks across all pieces.
 */
struct BlockInfo {
    uint32_t piece_index;       ///< Index of the piece
    uint32_t block_index;       ///< Index of the block within the piece
    uint32_t absolute_index;    ///< Index of the block across the whole content
    uint32_t offset;            ///< Offset within the piece
    uint32_t length;            ///< Length of the block

    BlockInfo() : piece_index(0), block_index(0), absolute_index(0), offset(0), length(0) {}
    BlockInfo(uint32_t piece, uint32_t block, uint32_t absolute, uint32_t off, uint32_t len)
        : piece_index(piece), block_index(block), absolute_index(absolute), offset(off), length(len) {}

    bool operator==(const BlockInfo& other) const {
        return piece_index == other.piece_index
            && block_index == other.block_index
            && absolute_index == other.absolute_index
            && offset == other.offset
            && length == other.length;
    }

    bool operator!=(const BlockInfo& other) const {
        return !(*this == other);
    }

    bool operator<(const BlockInfo& other) const {
        if (piece_index != other.piece_index) return piece_index < other.piece_index;
        if (offset != other.offset) return offset < other.offset;
        return length < other.length;
    }
};

/**
 * @brief Hash function for BlockInfo (for use in unordered containers)
 *
 * Within one geometry the absolute index already identifies a block.
 */
struct BlockInfoHash {
    size_t operator()(const BlockInfo& b) const {
        return std::hash<uint64_t>()(
            (static_cast<uint64_t>(b.absolute_index) << 32) | b.length
        );
    }
};

} // namespace btcore
