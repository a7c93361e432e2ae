#include "bt_entropy.h"
#include "logger.h"

#include <array>
#include <stdexcept>

#define LOG_ENTROPY_ERROR(message) LOG_ERROR("entropy", message)

namespace btcore {

void SystemEntropySource::seed_locked() {
    try {
        std::random_device rd;
        std::array<uint32_t, 8> seed_data;
        for (auto& word : seed_data) {
            word = rd();
        }
        std::seed_seq seq(seed_data.begin(), seed_data.end());
        engine_.seed(seq);
        seeded_ = true;
    } catch (const std::exception& e) {
        LOG_ENTROPY_ERROR("No source of randomness available: " << e.what());
        throw std::runtime_error(std::string("no source of randomness available: ") + e.what());
    }
}

void SystemEntropySource::fill(uint8_t* data, size_t size) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!seeded_) {
        seed_locked();
    }

    size_t i = 0;
    while (i < size) {
        uint64_t word = engine_();
        for (int b = 0; b < 8 && i < size; ++b, ++i) {
            data[i] = static_cast<uint8_t>(word & 0xff);
            word >>= 8;
        }
    }
}

EntropySource& system_entropy() {
    static SystemEntropySource instance;
    return instance;
}

} // namespace btcore
