/*
src/protocol/PacketCodec.cpp
Byte layout of the vendor discovery request and the TLV walk over replies.
All multi-byte integers on the wire are big-endian.
*/
#include "protocol/PacketCodec.hpp"
#include "core/ErrorCatalog.hpp"

#include <algorithm>

namespace ipscout::protocol {

namespace {

constexpr std::array<uint8_t, 4> kHeader = {0x00, 0x01, 0x00, 0x2a};
constexpr std::array<uint8_t, 8> kCommand = {0x00, 0x0d, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00};
constexpr std::array<uint8_t, 11> kFlags = {0x00, 0x00, 0x20, 0x11, 0x1e, 0x11, 0x23, 0x1f, 0x1e, 0x19, 0x13};
constexpr std::array<uint8_t, 4> kCritical = {0x00, 0x00, kClassFilterAll, 0x01};
constexpr uint16_t kCategoryAll = 0xfff0;
constexpr std::array<uint16_t, 20> kRequestedTags = {
    0x26, 0x20, 0x21, 0x22, 0x23, 0x25, 0x28, 0x40, 0x41, 0x42,
    0x44, 0xa5, 0xa6, 0xa7, 0xa8, 0xad, 0xb3, 0xb4, 0xb7, 0xb8
};
constexpr uint16_t kTrailer = 0x1170;

uint16_t read_u16(const uint8_t* p) {
    return static_cast<uint16_t>((p[0] << 8) | p[1]);
}

struct Writer {
    RequestFrame& out;
    size_t pos = 0;

    template <size_t N>
    void bytes(const std::array<uint8_t, N>& b) {
        std::copy(b.begin(), b.end(), out.begin() + pos);
        pos += N;
    }
    void zeros(size_t n) {
        std::fill(out.begin() + pos, out.begin() + pos + n, 0);
        pos += n;
    }
    void u16(uint16_t v) {
        out[pos++] = static_cast<uint8_t>(v >> 8);
        out[pos++] = static_cast<uint8_t>(v & 0xff);
    }
};

} // namespace

RequestFrame encode_request(const MacBytes& source_mac, const Ipv4Bytes& source_ip) {
    RequestFrame frame{};
    Writer w{frame};
    w.bytes(kHeader);       // 0-3
    w.bytes(kCommand);      // 4-11
    w.bytes(source_mac);    // 12-17
    w.bytes(source_ip);     // 18-21
    w.bytes(kFlags);        // 22-32
    w.bytes(kCritical);     // 33-36
    w.zeros(11);            // 37-47
    w.u16(kCategoryAll);    // 48-49
    for (uint16_t tag : kRequestedTags) w.u16(tag);  // 50-89
    w.u16(kTerminatorTag);  // 90-91
    w.u16(kTrailer);        // 92-93
    return frame;
}

RequestFrame encode_request(const std::vector<uint8_t>& source_mac, const std::vector<uint8_t>& source_ip) {
    if (source_mac.size() != 6) throw Error(ErrorKind::InvalidAddress, errors::D2100_MAC_LENGTH);
    if (source_ip.size() != 4) throw Error(ErrorKind::InvalidAddress, errors::D2100_IP_LENGTH);
    MacBytes mac;
    Ipv4Bytes ip;
    std::copy(source_mac.begin(), source_mac.end(), mac.begin());
    std::copy(source_ip.begin(), source_ip.end(), ip.begin());
    return encode_request(mac, ip);
}

AttributeSet decode_response(const uint8_t* data, size_t size) {
    if (data == nullptr || size < kPreambleSize) throw Error(ErrorKind::MalformedFrame, errors::D2200_TOO_SHORT);
    if (read_u16(data) != kProtocolId) throw Error(ErrorKind::MalformedFrame, errors::D2200_BAD_PROTOCOL_ID);

    AttributeSet out;
    out.message_type = read_u16(data + 2);
    out.command = read_u16(data + 4);
    std::copy(data + 6, data + 12, out.responder_mac.begin());
    std::copy(data + 12, data + 18, out.requester_mac.begin());
    std::copy(data + 18, data + 22, out.requester_ip.begin());

    size_t offset = kPreambleSize;
    while (offset + 4 <= size) {
        uint16_t tag = read_u16(data + offset);
        if (tag == kTerminatorTag) break;
        uint16_t length = read_u16(data + offset + 2);
        if (offset + 4 + length > size) throw Error(ErrorKind::MalformedFrame, errors::D2200_TLV_OVERRUN);
        out.values[tag].assign(data + offset + 4, data + offset + 4 + length);
        offset += 4 + length;
    }
    return out;
}

AttributeSet decode_response(const std::vector<uint8_t>& frame) {
    return decode_response(frame.data(), frame.size());
}

} // namespace ipscout::protocol
