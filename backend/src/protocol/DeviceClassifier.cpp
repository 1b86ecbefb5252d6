#include "protocol/DeviceClassifier.hpp"
#include "core/ErrorCatalog.hpp"

#include <algorithm>

namespace ipscout::protocol {

static const char* const kRecorderPrefixes[] = {"NX", "WJ"};

static bool is_continuation(uint8_t b) { return (b & 0xc0) == 0x80; }

// Drops every byte that does not belong to a well-formed UTF-8 sequence.
// Firmware names are sometimes Latin-1 or Shift-JIS.
std::string drop_invalid_utf8(const std::vector<uint8_t>& raw) {
    std::string out;
    out.reserve(raw.size());
    size_t i = 0;
    while (i < raw.size()) {
        uint8_t b = raw[i];
        size_t len = 0;
        uint8_t lo = 0x80, hi = 0xbf;
        if (b < 0x80) len = 1;
        else if (b >= 0xc2 && b <= 0xdf) len = 2;
        else if (b >= 0xe0 && b <= 0xef) {
            len = 3;
            if (b == 0xe0) lo = 0xa0;       // overlong
            else if (b == 0xed) hi = 0x9f;  // surrogates
        } else if (b >= 0xf0 && b <= 0xf4) {
            len = 4;
            if (b == 0xf0) lo = 0x90;
            else if (b == 0xf4) hi = 0x8f;
        }

        bool ok = len > 0 && i + len <= raw.size();
        if (ok && len > 1) {
            ok = raw[i + 1] >= lo && raw[i + 1] <= hi;
            for (size_t k = 2; ok && k < len; ++k) ok = is_continuation(raw[i + k]);
        }
        if (!ok) {
            ++i;
            continue;
        }
        out.append(raw.begin() + i, raw.begin() + i + len);
        i += len;
    }
    return out;
}

static std::string read_string(const AttributeSet& attrs, uint16_t tag, const std::string& fallback) {
    auto v = attrs.find(tag);
    if (!v) return fallback;
    std::string s = drop_invalid_utf8(*v);
    // NUL padded, sometimes with stray spaces
    auto nul = s.find('\0');
    if (nul != std::string::npos) s.erase(nul);
    auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return fallback;
    auto last = s.find_last_not_of(" \t\r\n");
    s = s.substr(first, last - first + 1);
    return s.empty() ? fallback : s;
}

static std::optional<Ipv4Bytes> read_ipv4(const AttributeSet& attrs, uint16_t tag) {
    auto v = attrs.find(tag);
    if (!v || v->size() != 4) return std::nullopt;
    return Ipv4Bytes{(*v)[0], (*v)[1], (*v)[2], (*v)[3]};
}

static std::optional<uint16_t> read_u16(const AttributeSet& attrs, uint16_t tag) {
    auto v = attrs.find(tag);
    if (!v || v->size() != 2) return std::nullopt;
    return static_cast<uint16_t>(((*v)[0] << 8) | (*v)[1]);
}

static bool all_zero(const MacBytes& mac) {
    return std::all_of(mac.begin(), mac.end(), [](uint8_t b) { return b == 0; });
}

bool has_recorder_model_prefix(const std::string& model_name) {
    for (const char* p : kRecorderPrefixes) {
        if (model_name.rfind(p, 0) == 0) return true;
    }
    return false;
}

DeviceDescriptor classify(const AttributeSet& attrs) {
    if (all_zero(attrs.responder_mac)) throw Error(ErrorKind::IncompleteAttributes, errors::D2210_MISSING_MAC);
    auto ip = read_ipv4(attrs, tags::IpAddress);
    if (!ip) throw Error(ErrorKind::IncompleteAttributes, errors::D2210_MISSING_IP);

    DeviceDescriptor d;
    d.hardware_address = mac_to_string(attrs.responder_mac);
    d.ip_address = ipv4_to_string(*ip);

    auto subnet = read_ipv4(attrs, tags::SubnetMask);
    d.subnet_mask = subnet ? ipv4_to_string(*subnet) : "255.255.255.0";
    auto gateway = read_ipv4(attrs, tags::Gateway);
    d.gateway = gateway ? ipv4_to_string(*gateway) : "0.0.0.0";
    d.http_port = read_u16(attrs, tags::HttpPort).value_or(80);

    d.model_name = read_string(attrs, tags::ModelName, "Unknown");
    d.device_name = read_string(attrs, tags::DeviceName, "Device");
    d.firmware_version = read_string(attrs, tags::FirmwareVersion, "Unknown");
    d.serial_number = read_string(attrs, tags::SerialNumber, "Unknown");

    if (auto mode = attrs.find(tags::NetworkMode); mode && !mode->empty()) {
        d.network_mode = network_mode_from_code((*mode)[0]);
    }
    if (auto code = attrs.find(tags::DeviceTypeCode); code && !code->empty()) {
        d.device_type_code = (*code)[0];
    }

    auto channels = read_u16(attrs, tags::ChannelCount);
    bool identified = false;
    if (auto raw = attrs.find(tags::ChannelCount)) {
        identified = std::any_of(raw->begin(), raw->end(), [](uint8_t b) { return b != 0; });
    }

    if (identified || has_recorder_model_prefix(d.model_name)) {
        RecorderInfo rec;
        if (identified) rec.channel_count = channels;
        rec.storage_capacity = read_u16(attrs, tags::StorageCapacity);
        d.kind = rec;
    } else {
        d.kind = CameraInfo{};
    }
    return d;
}

} // namespace ipscout::protocol
