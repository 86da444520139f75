#include "chanfs/transfer/block_codec.hpp"

#include <gtest/gtest.h>

using chanfs::ErrorCode;
using chanfs::transfer::BlockCodec;

TEST(BlockCodecTest, NamesAreDecimalIndices) {
    EXPECT_EQ(BlockCodec::block_name(1), "1");
    EXPECT_EQ(BlockCodec::block_name(12), "12");
    EXPECT_STREQ(BlockCodec::kFirstBlockName, "1");

    auto encoded = BlockCodec::encode(3, {0x01, 0x02});
    EXPECT_EQ(encoded.name, "3");
    EXPECT_EQ(encoded.payload.size(), 2u);
}

TEST(BlockCodecTest, DecodeReportsIndexAndPayloadSize) {
    chanfs::transport::Attachment attachment{"17", 4096, "memory://1/2"};
    auto info = BlockCodec::decode(attachment);
    ASSERT_TRUE(info.is_ok());
    EXPECT_EQ(info.value().index, 17u);
    EXPECT_EQ(info.value().payload_size, 4096u);
}

TEST(BlockCodecTest, RejectsMalformedNames) {
    for (const char* name : {"", "0", "-1", "1a", " 1", "report.pdf", "99999999999999999999999"}) {
        auto index = BlockCodec::parse_index(name);
        ASSERT_TRUE(index.is_error()) << name;
        EXPECT_EQ(index.error().code, ErrorCode::MalformedBlockName) << name;
    }
}

TEST(BlockCodecTest, TopicCarriesDecimalSize) {
    EXPECT_EQ(BlockCodec::encode_topic(0), "0");
    EXPECT_EQ(BlockCodec::encode_topic(10485710), "10485710");

    auto size = BlockCodec::decode_topic("507");
    ASSERT_TRUE(size.is_ok());
    EXPECT_EQ(size.value(), 507u);

    auto bad = BlockCodec::decode_topic("my holiday photos");
    ASSERT_TRUE(bad.is_error());
    EXPECT_EQ(bad.error().code, ErrorCode::SizeMismatch);

    EXPECT_TRUE(BlockCodec::decode_topic("").is_error());
}
