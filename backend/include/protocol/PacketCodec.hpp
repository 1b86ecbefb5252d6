#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <map>
#include <vector>

#include "protocol/DeviceDescriptor.hpp"

namespace ipscout::protocol {

inline constexpr uint16_t kDiscoveryPort = 10670;  // devices listen here
inline constexpr uint16_t kSourcePort = 10669;     // replies are sent back to this port
inline constexpr size_t kRequestSize = 94;
inline constexpr size_t kPreambleSize = 48;
inline constexpr size_t kMaxDatagram = 4096;
inline constexpr uint16_t kProtocolId = 0x0001;
inline constexpr uint16_t kTerminatorTag = 0xffff;

// Device-class filter byte inside the critical segment (request offset 35).
// 0x02 enables all classes; any other value silences recorders.
inline constexpr size_t kClassFilterOffset = 35;
inline constexpr uint8_t kClassFilterAll = 0x02;

namespace tags {
inline constexpr uint16_t NetworkMode = 0x00;
inline constexpr uint16_t IpAddress = 0x20;
inline constexpr uint16_t SubnetMask = 0x21;
inline constexpr uint16_t Gateway = 0x22;
inline constexpr uint16_t HttpPort = 0x25;
inline constexpr uint16_t DeviceTypeCode = 0xa6;
inline constexpr uint16_t DeviceName = 0xa7;
inline constexpr uint16_t ModelName = 0xa8;
inline constexpr uint16_t FirmwareVersion = 0xa9;
inline constexpr uint16_t ChannelCount = 0xc0;  // doubles as the recorder identification tag
inline constexpr uint16_t StorageCapacity = 0xc1;
inline constexpr uint16_t SerialNumber = 0xd1;
} // namespace tags

using RequestFrame = std::array<uint8_t, kRequestSize>;

// Fixed preamble fields plus every TLV record found in one response.
struct AttributeSet {
    uint16_t message_type = 0;
    uint16_t command = 0;
    MacBytes responder_mac{};
    MacBytes requester_mac{};
    Ipv4Bytes requester_ip{};
    std::map<uint16_t, std::vector<uint8_t>> values;

    bool has(uint16_t tag) const { return values.count(tag) != 0; }
    const std::vector<uint8_t>* find(uint16_t tag) const {
        auto it = values.find(tag);
        return it == values.end() ? nullptr : &it->second;
    }
};

RequestFrame encode_request(const MacBytes& source_mac, const Ipv4Bytes& source_ip);
// Throws Error(InvalidAddress) unless mac has 6 bytes and ip has 4.
RequestFrame encode_request(const std::vector<uint8_t>& source_mac, const std::vector<uint8_t>& source_ip);

// Pure: throws Error(MalformedFrame), never touches caller state.
AttributeSet decode_response(const uint8_t* data, size_t size);
AttributeSet decode_response(const std::vector<uint8_t>& frame);

} // namespace ipscout::protocol
