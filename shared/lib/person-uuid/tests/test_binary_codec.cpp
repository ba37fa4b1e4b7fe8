/**
 * @file test_binary_codec.cpp
 * @brief Unit tests for the person UUID bit layout
 */

#include <gtest/gtest.h>
#include <person/uuid/binary_codec.h>
#include "exception/exceptions.h"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/ostream_sink.h>
#include <sstream>
#include <vector>

using namespace person::uuid;
using shared::util::Uuid;
using shared::util::UuidUtil;

class BinaryCodecTest : public ::testing::Test {
protected:
    std::vector<IdentityRecord> samples_;

    void SetUp() override {
        samples_ = {
            IdentityRecord(5568099963ULL),
            IdentityRecord(165568099963ULL, 12),
            IdentityRecord(194106177753ULL, 99),
            IdentityRecord(181505269272ULL),
            IdentityRecord(197010632391ULL, 999),
            IdentityRecord(7010632391ULL, 1),
            IdentityRecord(3020002568ULL, 3),
            IdentityRecord(200002291235ULL, 500),
        };
    }

    static Uuid uuidOf(const std::string& text) {
        auto uuid = UuidUtil::parse(text);
        EXPECT_TRUE(uuid.has_value()) << text;
        return uuid.value_or(Uuid{});
    }
};

// ============================================================================
// encode
// ============================================================================

TEST_F(BinaryCodecTest, Encode_Orgnr) {
    Uuid uuid = encode(IdentityRecord(5568099963ULL));
    EXPECT_EQ(uuid.msb, 0x0055680999631000ULL);
    EXPECT_EQ(uuid.lsb, 0x9000d59a20d06c1aULL);
}

TEST_F(BinaryCodecTest, Encode_SerialIsDecimal) {
    Uuid uuid = encode(IdentityRecord(194106177753ULL, 99));
    EXPECT_EQ(uuid.msb & layout::MSB_SERIAL_MASK, 0x099ULL);
    EXPECT_EQ(UuidUtil::toString(uuid), "19410617-7753-1099-9001-d59a20d06c1a");
}

TEST_F(BinaryCodecTest, Encode_TypeCodes) {
    EXPECT_EQ(UuidUtil::toString(encode(IdentityRecord(5568099963ULL))),
              "00556809-9963-1000-9000-d59a20d06c1a");
    EXPECT_EQ(UuidUtil::toString(encode(IdentityRecord(181505269272ULL))),
              "18150526-9272-1000-9001-d59a20d06c1a");
    EXPECT_EQ(UuidUtil::toString(encode(IdentityRecord(197010632391ULL, 999))),
              "19701063-2391-1999-9002-d59a20d06c1a");
    EXPECT_EQ(UuidUtil::toString(encode(IdentityRecord(3020002568ULL, 3))),
              "00302000-2568-1003-9003-d59a20d06c1a");
}

TEST_F(BinaryCodecTest, Encode_AlwaysConformant) {
    for (const auto& record : samples_) {
        EXPECT_TRUE(isConformant(encode(record))) << record.toString();
    }
}

// ============================================================================
// decode
// ============================================================================

TEST_F(BinaryCodecTest, Decode_RoundTrip) {
    for (const auto& record : samples_) {
        Uuid uuid = encode(record);
        EXPECT_EQ(decode(uuid.msb, uuid.lsb), record) << record.toString();
    }
}

TEST_F(BinaryCodecTest, Decode_TypeComesFromLayout) {
    IdentityRecord record = decode(uuidOf("19410617-7753-1000-9001-d59a20d06c1a"));
    EXPECT_EQ(record.getNumber(), 194106177753ULL);
    EXPECT_EQ(record.getSerial(), 0u);
    EXPECT_EQ(record.getType(), IdType::PERSNR);
}

TEST_F(BinaryCodecTest, Decode_DoesNotRevalidateDate) {
    // 1900-02-29 does not exist but the check digit is right
    IdentityRecord record = decode(uuidOf("19000229-1235-1000-9001-d59a20d06c1a"));
    EXPECT_EQ(record.getNumber(), 190002291235ULL);
    EXPECT_EQ(record.getType(), IdType::PERSNR);
}

TEST_F(BinaryCodecTest, Decode_TypeMatchesClassification) {
    for (const auto& record : samples_) {
        IdentityRecord decoded = decode(encode(record));
        EXPECT_EQ(decoded.getType(), IdentityRecord(decoded.getNumber()).getType());
    }
}

TEST_F(BinaryCodecTest, Decode_BadChecksum) {
    EXPECT_THROW(decode(uuidOf("00556809-9964-1000-9000-d59a20d06c1a")), common::ChecksumMismatchException);
}

TEST_F(BinaryCodecTest, Decode_HexDigitInNumber) {
    EXPECT_THROW(decode(uuidOf("00556809-996a-1000-9000-d59a20d06c1a")), common::NonConformantBinaryException);
}

TEST_F(BinaryCodecTest, Decode_HexDigitInSerial) {
    EXPECT_THROW(decode(uuidOf("00556809-9963-100f-9000-d59a20d06c1a")), common::NonConformantBinaryException);
}

TEST_F(BinaryCodecTest, Decode_TypeCodeOutOfRange) {
    EXPECT_THROW(decode(uuidOf("00556809-9963-1000-9004-d59a20d06c1a")), common::NonConformantBinaryException);
}

TEST_F(BinaryCodecTest, Decode_RejectionsAreLogged) {
    auto previous = spdlog::default_logger();
    std::ostringstream captured;
    auto logger = std::make_shared<spdlog::logger>(
        "decode-capture", std::make_shared<spdlog::sinks::ostream_sink_mt>(captured));
    logger->set_level(spdlog::level::debug);
    spdlog::set_default_logger(logger);

    EXPECT_THROW(decode(uuidOf("00556809-9963-1000-9004-d59a20d06c1a")), common::NonConformantBinaryException);
    EXPECT_THROW(decode(uuidOf("00556809-9963-1000-9000-d49a20d06c1a")), common::NonConformantBinaryException);

    spdlog::set_default_logger(previous);
    EXPECT_NE(captured.str().find("Bad type code 4"), std::string::npos) << captured.str();
    EXPECT_NE(captured.str().find("Not a person UUID"), std::string::npos) << captured.str();
}

TEST_F(BinaryCodecTest, Decode_OtherRevisionNode) {
    EXPECT_THROW(decode(uuidOf("00556809-9963-1000-9000-d49a20d06c1a")), common::NonConformantBinaryException);
}

// ============================================================================
// isConformant
// ============================================================================

TEST_F(BinaryCodecTest, IsConformant_AllTypes) {
    EXPECT_TRUE(isConformant(uuidOf("00556809-9963-1000-9000-d59a20d06c1a")));
    EXPECT_TRUE(isConformant(uuidOf("19410617-7753-1000-9001-d59a20d06c1a")));
    EXPECT_TRUE(isConformant(uuidOf("19701063-2391-1000-9002-d59a20d06c1a")));
    EXPECT_TRUE(isConformant(uuidOf("00302000-2568-1000-9003-d59a20d06c1a")));
}

TEST_F(BinaryCodecTest, IsConformant_WrongNode) {
    EXPECT_FALSE(isConformant(uuidOf("00302000-2568-1000-9003-d49a20d06c1a"))) << "Other revision node";
    EXPECT_FALSE(isConformant(uuidOf("00302000-2568-1000-9003-d59a20d06c1b"))) << "Last node digit";
    EXPECT_FALSE(isConformant(uuidOf("00302000-2568-1000-9003-e59a20d06c1a"))) << "First node digit";
}

TEST_F(BinaryCodecTest, IsConformant_WrongVersion) {
    EXPECT_FALSE(isConformant(uuidOf("00302000-2568-2000-9003-d59a20d06c1a")));
    EXPECT_FALSE(isConformant(uuidOf("00302000-2568-4000-9003-d59a20d06c1a")));
}

TEST_F(BinaryCodecTest, IsConformant_WrongReservedBits) {
    EXPECT_FALSE(isConformant(uuidOf("00302000-2568-1000-8003-d59a20d06c1a")));
    EXPECT_FALSE(isConformant(uuidOf("00302000-2568-1000-9103-d59a20d06c1a")));
    EXPECT_FALSE(isConformant(uuidOf("00302000-2568-1000-9013-d59a20d06c1a")));
}

TEST_F(BinaryCodecTest, IsConformant_ForeignUuids) {
    EXPECT_FALSE(isConformant(uuidOf("b5097d86-e118-11e7-80c1-9a214cf093ae"))) << "Version 1 UUID";
    EXPECT_FALSE(isConformant(uuidOf("5bd4bb5a-d57d-4612-9b8f-f0ad3154cfbd"))) << "Version 4 UUID";
    EXPECT_FALSE(isConformant(uuidOf("00000000-0000-0000-0000-000000000000"))) << "Nil UUID";
}

TEST_F(BinaryCodecTest, IsConformant_AgreesWithDecode) {
    const char* candidates[] = {
        "00556809-9963-1000-9000-d59a20d06c1a",
        "00556809-9964-1000-9000-d59a20d06c1a",
        "00556809-996a-1000-9000-d59a20d06c1a",
        "00556809-9963-10a0-9000-d59a20d06c1a",
        "00556809-9963-1000-9005-d59a20d06c1a",
        "19000229-1235-1000-9001-d59a20d06c1a",
    };
    for (const char* text : candidates) {
        Uuid uuid = uuidOf(text);
        bool decodes = true;
        try {
            decode(uuid);
        } catch (const common::PersonUuidException&) {
            decodes = false;
        }
        EXPECT_EQ(isConformant(uuid), decodes) << text;
    }
}

// ============================================================================
// Single bit flips in the fixed fields
// ============================================================================

TEST_F(BinaryCodecTest, BitFlip_VersionNybble) {
    Uuid uuid = encode(IdentityRecord(194106177753ULL, 99));
    for (int bit = 12; bit < 16; bit++) {
        EXPECT_FALSE(isConformant(uuid.msb ^ (1ULL << bit), uuid.lsb)) << "msb bit " << bit;
    }
}

TEST_F(BinaryCodecTest, BitFlip_VariantReservedAndNode) {
    Uuid uuid = encode(IdentityRecord(194106177753ULL, 99));
    for (int bit = 0; bit < 64; bit++) {
        uint64_t flipped = uuid.lsb ^ (1ULL << bit);
        if ((layout::LSB_MASK >> bit) & 1) {
            EXPECT_FALSE(isConformant(uuid.msb, flipped)) << "lsb bit " << bit;
        }
    }
}

TEST_F(BinaryCodecTest, BitFlip_TypeField) {
    Uuid uuid = encode(IdentityRecord(194106177753ULL, 99));
    // PERSNR (1) flips to ORGNR (0) or GDNR (3); 5 and 9 are not type codes
    EXPECT_TRUE(isConformant(uuid.msb, uuid.lsb ^ (1ULL << 48)));
    EXPECT_TRUE(isConformant(uuid.msb, uuid.lsb ^ (1ULL << 49)));
    EXPECT_FALSE(isConformant(uuid.msb, uuid.lsb ^ (1ULL << 50)));
    EXPECT_FALSE(isConformant(uuid.msb, uuid.lsb ^ (1ULL << 51)));
}
