#include <gtest/gtest.h>
#include "bt_peer_id.h"
#include "bt_entropy.h"

#include <cstring>
#include <stdexcept>

using namespace btcore;

//=============================================================================
// Helper Functions
//=============================================================================

// Always returns the same byte so the random part of a peer id is known
class FixedEntropySource : public EntropySource {
public:
    explicit FixedEntropySource(uint8_t value) : value_(value) {}

    void fill(uint8_t* data, size_t size) override {
        std::memset(data, value_, size);
        requested_ += size;
    }

    size_t requested() const { return requested_; }

private:
    uint8_t value_;
    size_t requested_ = 0;
};

class FailingEntropySource : public EntropySource {
public:
    void fill(uint8_t*, size_t) override {
        throw std::runtime_error("entropy exhausted");
    }
};

//=============================================================================
// Generation Tests
//=============================================================================

TEST(BtPeerIdTest, GenerateWithDefaultPrefix) {
    FixedEntropySource source('x');
    Id20 peer_id = generate_peer_id(source);

    EXPECT_EQ(peer_id_to_string(peer_id), "-BC0100-xxxxxxxxxxxx");
    EXPECT_EQ(source.requested(), 12u);
}

TEST(BtPeerIdTest, GenerateWithCustomPrefix) {
    FixedEntropySource source(0x00);
    Id20 peer_id = generate_peer_id(source, "-qB4630-");

    EXPECT_EQ(std::memcmp(peer_id.data(), "-qB4630-", 8), 0);
    for (size_t i = 8; i < 20; ++i) {
        EXPECT_EQ(peer_id.bytes()[i], 0);
    }
}

TEST(BtPeerIdTest, GenerateWithLongPrefixTruncates) {
    FixedEntropySource source('x');
    Id20 peer_id = generate_peer_id(source, "ABCDEFGHIJKLMNOPQRSTUVWXYZ");

    EXPECT_EQ(peer_id_to_string(peer_id), "ABCDEFGHIJKLMNOPQRST");
    EXPECT_EQ(source.requested(), 0u);
}

TEST(BtPeerIdTest, GenerateWithEmptyPrefixIsFullyRandom) {
    FixedEntropySource source(0xaa);
    Id20 peer_id = generate_peer_id(source, "");

    EXPECT_EQ(peer_id.to_hex(), std::string(40, 'a'));
    EXPECT_EQ(source.requested(), 20u);
}

TEST(BtPeerIdTest, GeneratePropagatesEntropyFailure) {
    FailingEntropySource source;
    EXPECT_THROW(generate_peer_id(source), std::runtime_error);
}

TEST(BtPeerIdTest, SystemGeneratedIdsDiffer) {
    Id20 a = generate_peer_id();
    Id20 b = generate_peer_id();

    EXPECT_NE(a, b);
    EXPECT_EQ(std::memcmp(a.data(), BT_PEER_ID_PREFIX, 8), 0);
    EXPECT_EQ(std::memcmp(b.data(), BT_PEER_ID_PREFIX, 8), 0);
}

//=============================================================================
// Decoding Tests
//=============================================================================

TEST(BtPeerIdTest, DecodeAzureusStyle) {
    FixedEntropySource source('1');
    auto decoded = decode_peer_id(generate_peer_id(source, "-qB4630-"));

    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded->client_id, "qB");
    EXPECT_EQ(decoded->version, "4630");
}

TEST(BtPeerIdTest, DecodeOwnPrefix) {
    auto decoded = decode_peer_id(generate_peer_id());

    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded->client_id, "BC");
    EXPECT_EQ(decoded->version, "0100");
}

TEST(BtPeerIdTest, DecodeAllowsPunctuationAsSecondCodeCharacter) {
    FixedEntropySource source('z');
    auto decoded = decode_peer_id(generate_peer_id(source, "-A~0100-"));

    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded->client_id, "A~");
}

TEST(BtPeerIdTest, DecodeRejectsOtherStyles) {
    FixedEntropySource source('z');

    // Shadow-style id
    EXPECT_FALSE(decode_peer_id(generate_peer_id(source, "M7-2-2--")).has_value());
    // Missing trailing dash
    EXPECT_FALSE(decode_peer_id(generate_peer_id(source, "-BC01000")).has_value());
    // Non-alphanumeric version
    EXPECT_FALSE(decode_peer_id(generate_peer_id(source, "-BC01.0-")).has_value());
    // All zero
    EXPECT_FALSE(decode_peer_id(Id20()).has_value());
}

//=============================================================================
// Display Tests
//=============================================================================

TEST(BtPeerIdTest, ToStringEscapesNonPrintable) {
    Id20::Bytes bytes{};
    const char* prefix = "-BC0100-";
    std::memcpy(bytes.data(), prefix, 8);
    bytes[8] = 0x00;
    bytes[9] = 0xff;
    for (size_t i = 10; i < 20; ++i) {
        bytes[i] = 'a';
    }

    EXPECT_EQ(peer_id_to_string(Id20(bytes)), "-BC0100-\\x00\\xffaaaaaaaaaa");
}
