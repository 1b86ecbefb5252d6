#pragma once
#include <string>
#include "protocol/DeviceDescriptor.hpp"

namespace ipscout::net {

struct LocalIdentity {
    protocol::MacBytes mac{};
    protocol::Ipv4Bytes ip{};
    std::string interface_name;
};

// Sender MAC/IPv4 written into the discovery request. "0.0.0.0" picks the
// first non-loopback IPv4 interface that is up. Never throws; falls back to
// fixed values when the host cannot be queried.
LocalIdentity resolve_local_identity(const std::string& interface_address);

} // namespace ipscout::net
