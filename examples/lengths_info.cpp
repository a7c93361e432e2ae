/**
 * @file lengths_info.cpp
 * @brief Print the piece/block geometry of a content set
 *
 * Computes piece count, per-piece block layout and byte ranges for a given
 * total length and piece length, and optionally resolves an absolute byte
 * offset to its piece and block.
 *
 * Usage:
 *   lengths_info <total_length> <piece_length> [offset] [--config <file>] [--blocks]
 *
 * Example:
 *   lengths_info 1000 400 --blocks
 *   lengths_info 734003200 262144 123456789 --config btcore.json
 */

#include "bt_config.h"
#include "bt_id20.h"
#include "bt_lengths.h"
#include "bt_peer_id.h"
#include "logger.h"

#include <cstdint>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

using namespace btcore;

static void print_usage(const char* program) {
    std::cerr << "Usage: " << program << " <total_length> <piece_length> [offset] [--config <file>] [--blocks]\n"
              << "\n"
              << "  total_length   Total bytes across all files\n"
              << "  piece_length   Nominal piece length in bytes\n"
              << "  offset         Absolute byte offset to resolve\n"
              << "  --config       JSON configuration (block length, peer id prefix, logging)\n"
              << "  --blocks       List every block of the first and last piece\n"
              << "\n"
              << "Example:\n"
              << "  " << program << " 1000 400 --blocks\n";
}

static bool parse_u64(const std::string& text, uint64_t& out) {
    if (text.empty() || text[0] == '-') return false;
    char* end = nullptr;
    unsigned long long value = std::strtoull(text.c_str(), &end, 10);
    if (end == nullptr || *end != '\0') return false;
    out = value;
    return true;
}

static std::string format_bytes(uint64_t bytes) {
    const char* units[] = {"B", "KiB", "MiB", "GiB", "TiB"};
    double value = static_cast<double>(bytes);
    int unit = 0;
    while (value >= 1024.0 && unit < 4) {
        value /= 1024.0;
        ++unit;
    }
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << value << " " << units[unit];
    return oss.str();
}

static void print_piece_blocks(const Lengths& lengths, ValidPieceIndex piece) {
    std::cout << "  piece " << piece.get() << " (" << lengths.piece_length(piece) << " bytes at offset "
              << lengths.piece_offset(piece) << ")\n";
    for (const BlockInfo& block : lengths.block_infos(piece)) {
        std::cout << "    block " << std::setw(4) << block.block_index
                  << "  abs " << std::setw(8) << block.absolute_index
                  << "  begin " << std::setw(10) << block.offset
                  << "  length " << block.length << "\n";
    }
}

int main(int argc, char* argv[]) {
    std::string config_path;
    bool list_blocks = false;
    std::vector<std::string> positional;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg == "--blocks") {
            list_blocks = true;
        } else if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else {
            positional.push_back(arg);
        }
    }

    if (positional.size() < 2 || positional.size() > 3) {
        print_usage(argv[0]);
        return 1;
    }

    CoreConfig config;
    if (!config_path.empty()) {
        BtError error;
        auto loaded = load_config_file(config_path, &error);
        if (!loaded) {
            std::cerr << "Invalid configuration: " << error.to_string() << "\n";
            return 1;
        }
        config = *loaded;
    }
    apply_logging_config(config);

    uint64_t total_length = 0;
    uint64_t piece_length = 0;
    if (!parse_u64(positional[0], total_length) || !parse_u64(positional[1], piece_length) ||
        piece_length > UINT32_MAX) {
        std::cerr << "Lengths must be non-negative integers (piece length at most " << UINT32_MAX << ")\n";
        return 1;
    }

    BtError error;
    LengthsPtr lengths = Lengths::create_shared(total_length, static_cast<uint32_t>(piece_length),
                                                config.block_length, &error);
    if (!lengths) {
        std::cerr << "Cannot build geometry: " << error.to_string() << "\n";
        return 1;
    }

    std::cout << "Total length:       " << lengths->total_length() << " (" << format_bytes(lengths->total_length()) << ")\n"
              << "Piece length:       " << lengths->default_piece_length() << "\n"
              << "Block length:       " << lengths->default_block_length() << "\n"
              << "Pieces:             " << lengths->piece_count() << "\n"
              << "Last piece length:  " << lengths->last_piece_length() << "\n"
              << "Blocks per piece:   " << lengths->default_blocks_per_piece() << "\n"
              << "Blocks in last:     " << lengths->block_count(lengths->last_piece()) << "\n"
              << "Total blocks:       " << lengths->total_blocks() << "\n"
              << "Piece bitfield:     " << lengths->piece_bitfield_bytes() << " bytes\n"
              << "Example peer id:    " << peer_id_to_string(generate_peer_id(config.peer_id_prefix)) << "\n";

    if (list_blocks) {
        std::cout << "\nBlocks:\n";
        ValidPieceIndex first = *lengths->validate_piece_index(0);
        print_piece_blocks(*lengths, first);
        if (lengths->last_piece() != first) {
            print_piece_blocks(*lengths, lengths->last_piece());
        }
    }

    if (positional.size() == 3) {
        uint64_t offset = 0;
        if (!parse_u64(positional[2], offset)) {
            std::cerr << "Offset must be a non-negative integer\n";
            return 1;
        }

        auto position = lengths->offset_to_piece(offset, &error);
        if (!position) {
            std::cerr << "Cannot resolve offset: " << error.to_string() << "\n";
            return 1;
        }

        uint32_t block = position->offset / lengths->default_block_length();
        auto info = lengths->block_info(position->piece, block, &error);
        if (!info) {
            std::cerr << "Cannot resolve block: " << error.to_string() << "\n";
            return 1;
        }

        std::cout << "\nOffset " << offset << " is byte " << position->offset << " of piece " << position->piece
                  << ", block " << info->block_index << " (absolute block " << info->absolute_index
                  << ", " << info->length << " bytes)\n";
    }

    return 0;
}
