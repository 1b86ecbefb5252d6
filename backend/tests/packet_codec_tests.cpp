#include <gtest/gtest.h>
#include "protocol/PacketCodec.hpp"
#include "core/ErrorCatalog.hpp"
#include "test_frames.hpp"

using namespace ipscout;
using namespace ipscout::protocol;

static const MacBytes kMac = {0xa0, 0x29, 0x19, 0x3e, 0xab, 0x91};
static const Ipv4Bytes kIp = {192, 168, 1, 100};

TEST(PacketCodec, RequestLayout) {
    auto f = encode_request(kMac, kIp);
    ASSERT_EQ(f.size(), 94u);

    EXPECT_EQ(f[0], 0x00); EXPECT_EQ(f[1], 0x01); EXPECT_EQ(f[2], 0x00); EXPECT_EQ(f[3], 0x2a);
    EXPECT_EQ(f[4], 0x00); EXPECT_EQ(f[5], 0x0d);
    for (size_t i = 6; i < 12; ++i) EXPECT_EQ(f[i], 0x00) << "offset " << i;
    for (size_t i = 0; i < 6; ++i) EXPECT_EQ(f[12 + i], kMac[i]);
    for (size_t i = 0; i < 4; ++i) EXPECT_EQ(f[18 + i], kIp[i]);
    EXPECT_EQ(f[24], 0x20);
    EXPECT_EQ(f[32], 0x13);
    EXPECT_EQ(f[kClassFilterOffset], kClassFilterAll);
    EXPECT_EQ(f[36], 0x01);
    for (size_t i = 37; i < 48; ++i) EXPECT_EQ(f[i], 0x00) << "offset " << i;
    EXPECT_EQ(f[48], 0xff); EXPECT_EQ(f[49], 0xf0);
    EXPECT_EQ(f[50], 0x00); EXPECT_EQ(f[51], 0x26);
    EXPECT_EQ(f[88], 0x00); EXPECT_EQ(f[89], 0xb8);
    EXPECT_EQ(f[90], 0xff); EXPECT_EQ(f[91], 0xff);
    EXPECT_EQ(f[92], 0x11); EXPECT_EQ(f[93], 0x70);
}

TEST(PacketCodec, RequestIsDeterministic) {
    EXPECT_EQ(encode_request(kMac, kIp), encode_request(kMac, kIp));
    Ipv4Bytes other = {10, 0, 0, 7};
    auto f = encode_request(kMac, other);
    EXPECT_EQ(f[18], 10);
    EXPECT_EQ(f[21], 7);
    EXPECT_EQ(f[kClassFilterOffset], kClassFilterAll);
}

TEST(PacketCodec, RequestRejectsBadAddressLengths) {
    std::vector<uint8_t> mac5 = {1, 2, 3, 4, 5};
    std::vector<uint8_t> mac6 = {1, 2, 3, 4, 5, 6};
    std::vector<uint8_t> ip3 = {10, 0, 0};
    std::vector<uint8_t> ip4 = {10, 0, 0, 1};
    try {
        encode_request(mac5, ip4);
        FAIL() << "expected InvalidAddress";
    } catch (const Error& e) {
        EXPECT_EQ(e.kind(), ErrorKind::InvalidAddress);
        EXPECT_EQ(e.code(), errors::E2100_INVALID_ADDRESS);
    }
    EXPECT_THROW(encode_request(mac6, ip3), Error);
    EXPECT_NO_THROW(encode_request(mac6, ip4));
}

TEST(PacketCodec, DecodingRequestEchoesRequester) {
    auto f = encode_request(kMac, kIp);
    auto attrs = decode_response(f.data(), f.size());
    EXPECT_EQ(attrs.requester_mac, kMac);
    EXPECT_EQ(attrs.requester_ip, kIp);
    EXPECT_EQ(attrs.command, 0x000d);
}

TEST(PacketCodec, DecodesTlvsUntilTerminator) {
    auto frame = test_support::FrameBuilder("d4:2d:c5:14:c5:70")
        .ip(tags::IpAddress, "192.168.1.101")
        .str(tags::ModelName, "WV-S1234")
        .tlv(0x77, {0xde, 0xad})
        .finish();
    // bytes after the terminator are not TLVs
    frame.insert(frame.end(), {0x00, 0x20, 0x00, 0x04, 1, 2, 3, 4});

    auto attrs = decode_response(frame);
    EXPECT_EQ(mac_to_string(attrs.responder_mac), "d4:2d:c5:14:c5:70");
    ASSERT_TRUE(attrs.has(tags::IpAddress));
    EXPECT_EQ((*attrs.find(tags::IpAddress)), (std::vector<uint8_t>{192, 168, 1, 101}));
    ASSERT_TRUE(attrs.has(0x77));
    EXPECT_EQ(attrs.find(0x77)->size(), 2u);
    EXPECT_EQ(attrs.values.size(), 3u);
}

TEST(PacketCodec, MissingTerminatorEndsAtDatagramEnd) {
    auto frame = test_support::FrameBuilder("d4:2d:c5:14:c5:70")
        .ip(tags::IpAddress, "10.1.2.3")
        .finish(false);
    frame.push_back(0x00);  // stray byte, too short for a TLV header
    auto attrs = decode_response(frame);
    EXPECT_TRUE(attrs.has(tags::IpAddress));
}

TEST(PacketCodec, RejectsMalformedFrames) {
    std::vector<uint8_t> tiny(10, 0);
    try {
        decode_response(tiny);
        FAIL() << "expected MalformedFrame";
    } catch (const Error& e) {
        EXPECT_EQ(e.kind(), ErrorKind::MalformedFrame);
        EXPECT_EQ(e.code(), errors::E2200_MALFORMED_FRAME);
    }

    auto wrong_id = test_support::FrameBuilder("d4:2d:c5:14:c5:70").finish();
    wrong_id[1] = 0x07;
    EXPECT_THROW(decode_response(wrong_id), Error);

    auto overrun = test_support::FrameBuilder("d4:2d:c5:14:c5:70").finish(false);
    overrun.insert(overrun.end(), {0x00, 0xa7, 0x00, 0x40, 'x', 'y'});
    EXPECT_THROW(decode_response(overrun), Error);

    EXPECT_THROW(decode_response(nullptr, 0), Error);
}

TEST(PacketCodec, PreambleOnlyFrameHasNoAttributes) {
    auto frame = test_support::FrameBuilder("00:11:22:33:44:55").finish(false);
    auto attrs = decode_response(frame);
    EXPECT_TRUE(attrs.values.empty());
}
