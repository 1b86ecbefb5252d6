#include "protocol/DeviceDescriptor.hpp"
#include "core/ErrorCatalog.hpp"

#include <cctype>
#include <cstdio>

namespace ipscout::protocol {

std::string mac_to_string(const MacBytes& mac) {
    char buf[18];
    std::snprintf(buf, sizeof(buf), "%02x:%02x:%02x:%02x:%02x:%02x",
                  mac[0], mac[1], mac[2], mac[3], mac[4], mac[5]);
    return buf;
}

static int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    return -1;
}

MacBytes parse_mac(const std::string& text) {
    // aa:bb:cc:dd:ee:ff or aa-bb-cc-dd-ee-ff
    if (text.size() != 17) throw Error(ErrorKind::InvalidAddress, errors::D2100_MAC_SYNTAX);
    MacBytes out{};
    for (size_t i = 0; i < 6; ++i) {
        size_t p = i * 3;
        int hi = hex_value(text[p]);
        int lo = hex_value(text[p + 1]);
        if (hi < 0 || lo < 0) throw Error(ErrorKind::InvalidAddress, errors::D2100_MAC_SYNTAX);
        if (i < 5 && text[p + 2] != ':' && text[p + 2] != '-') {
            throw Error(ErrorKind::InvalidAddress, errors::D2100_MAC_SYNTAX);
        }
        out[i] = static_cast<uint8_t>((hi << 4) | lo);
    }
    return out;
}

std::string normalize_mac(const std::string& text) {
    return mac_to_string(parse_mac(text));
}

std::string ipv4_to_string(const Ipv4Bytes& ip) {
    return std::to_string(ip[0]) + "." + std::to_string(ip[1]) + "." +
           std::to_string(ip[2]) + "." + std::to_string(ip[3]);
}

Ipv4Bytes parse_ipv4(const std::string& text) {
    Ipv4Bytes out{};
    size_t pos = 0;
    for (size_t i = 0; i < 4; ++i) {
        if (pos >= text.size() || !std::isdigit(static_cast<unsigned char>(text[pos]))) {
            throw Error(ErrorKind::InvalidAddress, errors::D2100_IP_SYNTAX);
        }
        int v = 0;
        size_t digits = 0;
        while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
            v = v * 10 + (text[pos] - '0');
            ++pos;
            if (++digits > 3 || v > 255) throw Error(ErrorKind::InvalidAddress, errors::D2100_IP_SYNTAX);
        }
        out[i] = static_cast<uint8_t>(v);
        if (i < 3) {
            if (pos >= text.size() || text[pos] != '.') throw Error(ErrorKind::InvalidAddress, errors::D2100_IP_SYNTAX);
            ++pos;
        }
    }
    if (pos != text.size()) throw Error(ErrorKind::InvalidAddress, errors::D2100_IP_SYNTAX);
    return out;
}

NetworkMode network_mode_from_code(uint8_t code) {
    switch (code) {
        case 0: return NetworkMode::DHCP;
        case 2: return NetworkMode::Static;
        case 4: return NetworkMode::AutoIP;
        case 5: return NetworkMode::AutoAdvanced;
        default: return NetworkMode::Unknown;
    }
}

std::string network_mode_name(NetworkMode mode) {
    switch (mode) {
        case NetworkMode::DHCP: return "DHCP";
        case NetworkMode::Static: return "Static";
        case NetworkMode::AutoIP: return "Auto (AutoIP)";
        case NetworkMode::AutoAdvanced: return "Auto Advanced";
        case NetworkMode::Unknown: break;
    }
    return "Unknown";
}

NetworkMode network_mode_from_name(const std::string& name) {
    if (name == "DHCP") return NetworkMode::DHCP;
    if (name == "Static") return NetworkMode::Static;
    if (name == "Auto (AutoIP)") return NetworkMode::AutoIP;
    if (name == "Auto Advanced") return NetworkMode::AutoAdvanced;
    return NetworkMode::Unknown;
}

nlohmann::json to_json(const DeviceDescriptor& d) {
    nlohmann::json j = {
        {"device_type", kind_name(d.kind)},
        {"mac_address", d.hardware_address},
        {"serial_number", d.serial_number},
        {"model_name", d.model_name},
        {"device_name", d.device_name},
        {"firmware_version", d.firmware_version},
        {"ip_address", d.ip_address},
        {"subnet_mask", d.subnet_mask},
        {"gateway", d.gateway},
        {"http_port", d.http_port},
        {"network_mode", network_mode_name(d.network_mode)}
    };
    if (auto rec = std::get_if<RecorderInfo>(&d.kind)) {
        j["channel_count"] = rec->channel_count ? nlohmann::json(*rec->channel_count) : nlohmann::json(nullptr);
        j["storage_capacity"] = rec->storage_capacity ? nlohmann::json(*rec->storage_capacity) : nlohmann::json(nullptr);
    }
    if (d.device_type_code) j["device_type_code"] = *d.device_type_code;
    return j;
}

} // namespace ipscout::protocol
