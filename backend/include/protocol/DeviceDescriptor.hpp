#pragma once
#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <nlohmann/json.hpp>

namespace ipscout::protocol {

using MacBytes = std::array<uint8_t, 6>;
using Ipv4Bytes = std::array<uint8_t, 4>;

/** @brief "d4:2d:c5:14:c5:70" (lowercase, colon separated) */
std::string mac_to_string(const MacBytes& mac);
/** @brief Accepts ':' or '-' separators, any case. Throws Error(InvalidAddress). */
MacBytes parse_mac(const std::string& text);
/** @brief Canonical lowercase colon form of a user-supplied address. */
std::string normalize_mac(const std::string& text);

std::string ipv4_to_string(const Ipv4Bytes& ip);
/** @brief Throws Error(InvalidAddress) unless text is a dotted quad. */
Ipv4Bytes parse_ipv4(const std::string& text);

enum class NetworkMode { DHCP, Static, AutoIP, AutoAdvanced, Unknown };

NetworkMode network_mode_from_code(uint8_t code);
std::string network_mode_name(NetworkMode mode);
NetworkMode network_mode_from_name(const std::string& name);

struct CameraInfo {};

struct RecorderInfo {
    std::optional<uint16_t> channel_count;
    std::optional<uint16_t> storage_capacity;
};

// Decided once by the classifier; downstream code visits this instead of
// re-inspecting model names.
using DeviceKind = std::variant<CameraInfo, RecorderInfo>;

inline bool is_recorder(const DeviceKind& kind) { return std::holds_alternative<RecorderInfo>(kind); }
inline const char* kind_name(const DeviceKind& kind) { return is_recorder(kind) ? "recorder" : "camera"; }

struct DeviceDescriptor {
    std::string hardware_address;
    std::string serial_number;
    std::string model_name;
    std::string device_name;
    std::string firmware_version;
    std::string ip_address;
    std::string subnet_mask;
    std::string gateway;
    uint16_t http_port = 80;
    NetworkMode network_mode = NetworkMode::Unknown;
    DeviceKind kind;
    // raw value of tag 0xa6, informational only
    std::optional<uint8_t> device_type_code;
};

nlohmann::json to_json(const DeviceDescriptor& d);

} // namespace ipscout::protocol
