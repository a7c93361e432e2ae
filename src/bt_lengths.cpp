#include "bt_lengths.h"
#include "logger.h"

#include <limits>
#include <sstream>

#define LOG_LENGTHS_DEBUG(message) LOG_DEBUG("lengths", message)

namespace btcore {

namespace {

template <typename T>
constexpr T ceil_div(T numerator, T denominator) {
    return numerator / denominator + (numerator % denominator != 0 ? 1 : 0);
}

} // namespace

//=============================================================================
// Construction
//=============================================================================

Lengths::Lengths(uint64_t total_length, uint32_t piece_length, uint32_t block_length,
                 uint32_t piece_count, uint32_t total_blocks)
    : total_length_(total_length)
    , piece_length_(piece_length)
    , block_length_(block_length)
    , piece_count_(piece_count)
    , last_piece_length_(static_cast<uint32_t>(
          total_length - static_cast<uint64_t>(piece_length) * (piece_count - 1)))
    , blocks_per_piece_(static_cast<uint32_t>(ceil_div<uint64_t>(piece_length, block_length)))
    , last_piece_blocks_(static_cast<uint32_t>(ceil_div<uint64_t>(last_piece_length_, block_length)))
    , total_blocks_(total_blocks) {
}

std::optional<Lengths> Lengths::create(uint64_t total_length, uint32_t piece_length,
                                       uint32_t block_length, BtError* error) {
    if (total_length == 0) {
        detail::set_error(error, BtErrorCode::InvalidConfiguration, "total length is zero");
        return std::nullopt;
    }
    if (piece_length == 0) {
        detail::set_error(error, BtErrorCode::InvalidConfiguration, "piece length is zero");
        return std::nullopt;
    }
    if (block_length == 0) {
        detail::set_error(error, BtErrorCode::InvalidConfiguration, "block length is zero");
        return std::nullopt;
    }

    const uint64_t max_index = std::numeric_limits<uint32_t>::max();

    uint64_t piece_count = ceil_div<uint64_t>(total_length, piece_length);
    if (piece_count > max_index) {
        detail::set_error(error, BtErrorCode::InvalidConfiguration,
                          "piece count " + std::to_string(piece_count) + " does not fit in 32 bits");
        return std::nullopt;
    }

    uint64_t last_piece_length = total_length - static_cast<uint64_t>(piece_length) * (piece_count - 1);
    uint64_t total_blocks = (piece_count - 1) * ceil_div<uint64_t>(piece_length, block_length)
                          + ceil_div<uint64_t>(last_piece_length, block_length);
    if (total_blocks > max_index) {
        detail::set_error(error, BtErrorCode::InvalidConfiguration,
                          "block count " + std::to_string(total_blocks) + " does not fit in 32 bits");
        return std::nullopt;
    }

    Lengths lengths(total_length, piece_length, block_length,
                    static_cast<uint32_t>(piece_count), static_cast<uint32_t>(total_blocks));

    if (block_length > piece_length) {
        LOG_LENGTHS_DEBUG("Block length " << block_length << " exceeds piece length "
                          << piece_length << ", every piece is a single block");
    } else if (block_length > lengths.last_piece_length()) {
        LOG_LENGTHS_DEBUG("Block length " << block_length << " exceeds last piece length "
                          << lengths.last_piece_length() << ", last piece is a single block");
    }
    LOG_LENGTHS_DEBUG("Computed lengths: " << lengths);

    return lengths;
}

LengthsPtr Lengths::create_shared(uint64_t total_length, uint32_t piece_length,
                                  uint32_t block_length, BtError* error) {
    auto lengths = create(total_length, piece_length, block_length, error);
    if (!lengths) {
        return nullptr;
    }
    return std::make_shared<const Lengths>(std::move(*lengths));
}

//=============================================================================
// Trusted Accessors
//=============================================================================

std::optional<ValidPieceIndex> Lengths::validate_piece_index(uint32_t piece) const {
    if (piece >= piece_count_) {
        return std::nullopt;
    }
    return ValidPieceIndex(piece);
}

uint32_t Lengths::piece_length(ValidPieceIndex piece) const {
    return piece.get() == piece_count_ - 1 ? last_piece_length_ : piece_length_;
}

uint32_t Lengths::block_count(ValidPieceIndex piece) const {
    return piece.get() == piece_count_ - 1 ? last_piece_blocks_ : blocks_per_piece_;
}

uint64_t Lengths::piece_offset(ValidPieceIndex piece) const {
    // Only the last piece is short, so the nominal length gives every offset
    return static_cast<uint64_t>(piece_length_) * piece.get();
}

BlockRange Lengths::block_range(ValidPieceIndex piece) const {
    uint32_t first = piece.get() * blocks_per_piece_;
    return BlockRange{first, first + block_count(piece)};
}

std::vector<BlockInfo> Lengths::block_infos(ValidPieceIndex piece) const {
    const uint32_t piece_len = piece_length(piece);
    const uint32_t count = block_count(piece);
    const uint32_t first = block_range(piece).first;

    std::vector<BlockInfo> result;
    result.reserve(count);
    for (uint32_t b = 0; b < count; ++b) {
        result.emplace_back(piece.get(), b, first + b, b * block_length_,
                            block_length_in_piece(piece_len, b));
    }
    return result;
}

std::vector<PieceInfo> Lengths::piece_infos() const {
    std::vector<PieceInfo> result;
    result.reserve(piece_count_);
    for (uint32_t p = 0; p < piece_count_; ++p) {
        result.emplace_back(p, piece_length(ValidPieceIndex(p)));
    }
    return result;
}

uint32_t Lengths::block_length_in_piece(uint32_t piece_len, uint32_t block) const {
    // Caller guarantees block < ceil(piece_len / block_length_)
    uint32_t start = block * block_length_;
    uint32_t remaining = piece_len - start;
    return remaining < block_length_ ? remaining : block_length_;
}

//=============================================================================
// Checked Accessors
//=============================================================================

bool Lengths::check_piece(uint32_t piece, BtError* error) const {
    if (piece >= piece_count_) {
        detail::set_error(error, BtErrorCode::OutOfRange,
                          "piece " + std::to_string(piece) + " out of range (piece count " +
                          std::to_string(piece_count_) + ")");
        return false;
    }
    return true;
}

bool Lengths::check_block(uint32_t piece, uint32_t block, BtError* error) const {
    if (!check_piece(piece, error)) {
        return false;
    }
    uint32_t count = block_count(ValidPieceIndex(piece));
    if (block >= count) {
        detail::set_error(error, BtErrorCode::OutOfRange,
                          "block " + std::to_string(block) + " out of range for piece " +
                          std::to_string(piece) + " (block count " + std::to_string(count) + ")");
        return false;
    }
    return true;
}

std::optional<uint32_t> Lengths::piece_length(uint32_t piece, BtError* error) const {
    if (!check_piece(piece, error)) {
        return std::nullopt;
    }
    return piece_length(ValidPieceIndex(piece));
}

std::optional<uint32_t> Lengths::block_count(uint32_t piece, BtError* error) const {
    if (!check_piece(piece, error)) {
        return std::nullopt;
    }
    return block_count(ValidPieceIndex(piece));
}

std::optional<uint32_t> Lengths::block_length(uint32_t piece, uint32_t block, BtError* error) const {
    if (!check_block(piece, block, error)) {
        return std::nullopt;
    }
    return block_length_in_piece(piece_length(ValidPieceIndex(piece)), block);
}

std::optional<uint64_t> Lengths::piece_offset(uint32_t piece, BtError* error) const {
    if (!check_piece(piece, error)) {
        return std::nullopt;
    }
    return piece_offset(ValidPieceIndex(piece));
}

std::optional<uint64_t> Lengths::block_offset(uint32_t piece, uint32_t block, BtError* error) const {
    if (!check_block(piece, block, error)) {
        return std::nullopt;
    }
    return piece_offset(ValidPieceIndex(piece)) + static_cast<uint64_t>(block_length_) * block;
}

std::optional<BlockInfo> Lengths::block_info(uint32_t piece, uint32_t block, BtError* error) const {
    if (!check_block(piece, block, error)) {
        return std::nullopt;
    }
    ValidPieceIndex index(piece);
    return BlockInfo(piece, block, block_range(index).first + block, block * block_length_,
                     block_length_in_piece(piece_length(index), block));
}

std::optional<PiecePosition> Lengths::offset_to_piece(uint64_t absolute_offset, BtError* error) const {
    if (absolute_offset >= total_length_) {
        detail::set_error(error, BtErrorCode::OutOfRange,
                          "offset " + std::to_string(absolute_offset) + " out of range (total length " +
                          std::to_string(total_length_) + ")");
        return std::nullopt;
    }
    return PiecePosition(static_cast<uint32_t>(absolute_offset / piece_length_),
                         static_cast<uint32_t>(absolute_offset % piece_length_));
}

//=============================================================================
// Peer Input Validation
//=============================================================================

bool Lengths::validate_block(uint32_t piece, uint32_t block, uint32_t length, BtError* error) const {
    auto expected = block_length(piece, block, error);
    if (!expected) {
        return false;
    }
    if (length != *expected) {
        LOG_LENGTHS_DEBUG("Rejecting block " << block << " of piece " << piece
                          << ": claimed length " << length << ", expected " << *expected);
        detail::set_error(error, BtErrorCode::InvalidBlock,
                          "block " + std::to_string(block) + " of piece " + std::to_string(piece) +
                          " has length " + std::to_string(*expected) + ", claimed " +
                          std::to_string(length));
        return false;
    }
    return true;
}

std::optional<BlockInfo> Lengths::block_from_request(uint32_t piece, uint32_t begin, uint32_t length,
                                                     BtError* error) const {
    if (!check_piece(piece, error)) {
        return std::nullopt;
    }
    if (begin % block_length_ != 0) {
        LOG_LENGTHS_DEBUG("Rejecting unaligned block offset " << begin << " in piece " << piece);
        detail::set_error(error, BtErrorCode::InvalidBlock,
                          "offset " + std::to_string(begin) + " is not a multiple of block length " +
                          std::to_string(block_length_));
        return std::nullopt;
    }

    uint32_t block = begin / block_length_;
    if (!validate_block(piece, block, length, error)) {
        return std::nullopt;
    }

    ValidPieceIndex index(piece);
    return BlockInfo(piece, block, block_range(index).first + block, begin, length);
}

std::string Lengths::to_string() const {
    std::ostringstream oss;
    oss << *this;
    return oss.str();
}

std::ostream& operator<<(std::ostream& os, const Lengths& lengths) {
    return os << "Lengths{total_length=" << lengths.total_length()
              << ", piece_length=" << lengths.default_piece_length()
              << ", block_length=" << lengths.default_block_length()
              << ", piece_count=" << lengths.piece_count()
              << ", last_piece_length=" << lengths.last_piece_length()
              << ", total_blocks=" << lengths.total_blocks() << "}";
}

} // namespace btcore
