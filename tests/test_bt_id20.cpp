#include <gtest/gtest.h>
#include "bt_id20.h"
#include "bt_entropy.h"

#include <algorithm>
#include <set>
#include <sstream>
#include <stdexcept>
#include <thread>
#include <unordered_set>
#include <vector>

using namespace btcore;

//=============================================================================
// Helper Functions
//=============================================================================

// Emits 0, 1, 2, ... so generated ids are predictable
class CountingEntropySource : public EntropySource {
public:
    void fill(uint8_t* data, size_t size) override {
        for (size_t i = 0; i < size; ++i) {
            data[i] = next_++;
        }
    }

private:
    uint8_t next_ = 0;
};

class FailingEntropySource : public EntropySource {
public:
    void fill(uint8_t*, size_t) override {
        throw std::runtime_error("entropy exhausted");
    }
};

static const std::string SAMPLE_HEX = "0123456789abcdef0123456789abcdef01234567";

static Id20 sample_id() {
    auto id = Id20::from_hex(SAMPLE_HEX);
    EXPECT_TRUE(id.has_value());
    return *id;
}

//=============================================================================
// Construction Tests
//=============================================================================

TEST(BtId20Test, DefaultIsZero) {
    Id20 id;
    EXPECT_TRUE(id.is_zero());
    EXPECT_EQ(id.to_hex(), std::string(40, '0'));
}

TEST(BtId20Test, FromBytesArray) {
    Id20::Bytes bytes{};
    bytes[0] = 0xab;
    bytes[19] = 0x01;
    Id20 id = Id20::from_bytes(bytes);

    EXPECT_EQ(id.bytes(), bytes);
    EXPECT_FALSE(id.is_zero());
    EXPECT_EQ(id.to_hex(), "ab00000000000000000000000000000000000001");
}

TEST(BtId20Test, FromBytesBuffer) {
    std::vector<uint8_t> data(20);
    for (size_t i = 0; i < data.size(); ++i) {
        data[i] = static_cast<uint8_t>(i * 3);
    }

    auto id = Id20::from_bytes(data.data(), data.size());
    ASSERT_TRUE(id.has_value());
    EXPECT_TRUE(std::equal(data.begin(), data.end(), id->data()));
}

TEST(BtId20Test, FromBytesWrongSize) {
    std::vector<uint8_t> data(21, 0x11);
    BtError error;

    EXPECT_FALSE(Id20::from_bytes(data.data(), 19, &error).has_value());
    EXPECT_EQ(error.code, BtErrorCode::InvalidFormat);

    error = BtError();
    EXPECT_FALSE(Id20::from_bytes(data.data(), 21, &error).has_value());
    EXPECT_EQ(error.code, BtErrorCode::InvalidFormat);

    error = BtError();
    EXPECT_FALSE(Id20::from_bytes(nullptr, 20, &error).has_value());
    EXPECT_EQ(error.code, BtErrorCode::InvalidFormat);
}

//=============================================================================
// Hex Tests
//=============================================================================

TEST(BtId20Test, HexRoundTrip) {
    Id20 id = sample_id();
    EXPECT_EQ(id.to_hex(), SAMPLE_HEX);
    EXPECT_EQ(id.bytes()[0], 0x01);
    EXPECT_EQ(id.bytes()[19], 0x67);

    CountingEntropySource source;
    for (int i = 0; i < 10; ++i) {
        Id20 random = Id20::random(source);
        auto parsed = Id20::from_hex(random.to_hex());
        ASSERT_TRUE(parsed.has_value());
        EXPECT_EQ(*parsed, random);
    }
}

TEST(BtId20Test, HexAcceptsUppercase) {
    auto id = Id20::from_hex("0123456789ABCDEF0123456789ABCDEF01234567");
    ASSERT_TRUE(id.has_value());
    EXPECT_EQ(*id, sample_id());
    // Output is always lowercase
    EXPECT_EQ(id->to_hex(), SAMPLE_HEX);
}

TEST(BtId20Test, HexZeroPadded) {
    Id20::Bytes bytes{};
    bytes[5] = 0x0f;
    std::string hex = Id20(bytes).to_hex();
    EXPECT_EQ(hex.size(), 40u);
    EXPECT_EQ(hex.substr(10, 2), "0f");
}

TEST(BtId20Test, HexWrongLength) {
    BtError error;
    EXPECT_FALSE(Id20::from_hex(SAMPLE_HEX.substr(0, 39), &error).has_value());
    EXPECT_EQ(error.code, BtErrorCode::InvalidFormat);

    error = BtError();
    EXPECT_FALSE(Id20::from_hex(SAMPLE_HEX + "0", &error).has_value());
    EXPECT_EQ(error.code, BtErrorCode::InvalidFormat);

    error = BtError();
    EXPECT_FALSE(Id20::from_hex("", &error).has_value());
    EXPECT_EQ(error.code, BtErrorCode::InvalidFormat);
}

TEST(BtId20Test, HexInvalidCharacters) {
    std::string zz;
    for (int i = 0; i < 20; ++i) {
        zz += "zz";
    }

    BtError error;
    EXPECT_FALSE(Id20::from_hex(zz, &error).has_value());
    EXPECT_EQ(error.code, BtErrorCode::InvalidFormat);
    EXPECT_NE(error.message.find("position 0"), std::string::npos);

    std::string bad = SAMPLE_HEX;
    bad[25] = 'g';
    error = BtError();
    EXPECT_FALSE(Id20::from_hex(bad, &error).has_value());
    EXPECT_NE(error.message.find("position 25"), std::string::npos);
}

//=============================================================================
// Random Tests
//=============================================================================

TEST(BtId20Test, RandomUsesSource) {
    CountingEntropySource source;
    Id20 first = Id20::random(source);
    Id20 second = Id20::random(source);

    EXPECT_EQ(first.to_hex(), "000102030405060708090a0b0c0d0e0f10111213");
    EXPECT_EQ(second.bytes()[0], 20);
    EXPECT_NE(first, second);
}

TEST(BtId20Test, RandomPropagatesEntropyFailure) {
    FailingEntropySource source;
    EXPECT_THROW(Id20::random(source), std::runtime_error);
}

TEST(BtId20Test, SystemRandomIsDistinct) {
    std::set<Id20> ids;
    for (int i = 0; i < 100; ++i) {
        ids.insert(Id20::random());
    }
    EXPECT_EQ(ids.size(), 100u);
}

TEST(BtId20Test, SystemRandomFromManyThreads) {
    std::vector<std::vector<Id20>> results(4);
    std::vector<std::thread> threads;
    for (size_t t = 0; t < results.size(); ++t) {
        threads.emplace_back([&results, t]() {
            for (int i = 0; i < 50; ++i) {
                results[t].push_back(Id20::random(system_entropy()));
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    std::unordered_set<Id20> all;
    for (const auto& ids : results) {
        all.insert(ids.begin(), ids.end());
    }
    EXPECT_EQ(all.size(), 200u);
}

//=============================================================================
// Comparison Tests
//=============================================================================

TEST(BtId20Test, OrderingIsLexicographic) {
    Id20::Bytes low{};
    Id20::Bytes high{};
    low[19] = 0xff;
    high[0] = 0x01;

    EXPECT_LT(Id20(low), Id20(high));
    EXPECT_GT(Id20(high), Id20(low));
    EXPECT_LE(Id20(low), Id20(low));
    EXPECT_GE(Id20(high), Id20(high));
    EXPECT_NE(Id20(low), Id20(high));
}

TEST(BtId20Test, HashMatchesEquality) {
    std::hash<Id20> hasher;
    Id20 a = sample_id();
    Id20 b = *Id20::from_hex(SAMPLE_HEX);
    EXPECT_EQ(hasher(a), hasher(b));
    EXPECT_NE(hasher(a), hasher(Id20()));
}

TEST(BtId20Test, StreamOutputIsHex) {
    std::ostringstream oss;
    oss << sample_id();
    EXPECT_EQ(oss.str(), SAMPLE_HEX);
}

//=============================================================================
// DHT Helper Tests
//=============================================================================

TEST(BtId20Test, DistanceIsXor) {
    Id20 a = sample_id();
    EXPECT_TRUE(a.distance(a).is_zero());
    EXPECT_EQ(a.distance(Id20()), a);

    CountingEntropySource source;
    Id20 b = Id20::random(source);
    EXPECT_EQ(a.distance(b), b.distance(a));
    EXPECT_EQ(a.distance(b).bytes()[1], 0x23 ^ 0x01);
}

TEST(BtId20Test, BitsAreMostSignificantFirst) {
    Id20 id = Id20().with_bit(0, true);
    EXPECT_EQ(id.bytes()[0], 0x80);
    EXPECT_TRUE(id.get_bit(0));
    EXPECT_FALSE(id.get_bit(1));

    id = id.with_bit(159, true);
    EXPECT_EQ(id.bytes()[19], 0x01);
    EXPECT_TRUE(id.get_bit(159));

    id = id.with_bit(0, false);
    EXPECT_EQ(id.bytes()[0], 0x00);
}

TEST(BtId20Test, BitIndexOutOfRange) {
    Id20 id;
    EXPECT_THROW(id.get_bit(160), std::out_of_range);
    EXPECT_THROW(id.with_bit(160, true), std::out_of_range);
}
