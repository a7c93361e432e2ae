#pragma once

/**
 * @file bt_entropy.h
 * @brief Injectable source of random bytes
 *
 * Identifier generation takes an EntropySource& instead of reaching for a
 * global generator, so tests can supply deterministic bytes.
 */

#include <cstdint>
#include <cstddef>
#include <mutex>
#include <random>

namespace btcore {

class EntropySource {
public:
    virtual ~EntropySource() = default;

    /**
     * @brief Fill `size` bytes at `data` with random values
     * @throws std::runtime_error if no randomness is available
     */
    virtual void fill(uint8_t* data, size_t size) = 0;
};

/**
 * @brief Operating system seeded generator
 *
 * Seeds a std::mt19937_64 from std::random_device on first use. fill() is
 * serialized so one instance can be shared by all threads.
 */
class SystemEntropySource : public EntropySource {
public:
    SystemEntropySource() = default;

    SystemEntropySource(const SystemEntropySource&) = delete;
    SystemEntropySource& operator=(const SystemEntropySource&) = delete;

    void fill(uint8_t* data, size_t size) override;

private:
    void seed_locked();

    std::mutex mutex_;
    std::mt19937_64 engine_;
    bool seeded_ = false;
};

/**
 * @brief Process-wide SystemEntropySource
 */
EntropySource& system_entropy();

} // namespace btcore
