#include "net/LocalIdentity.hpp"

#include <arpa/inet.h>
#include <ifaddrs.h>
#include <net/if.h>
#include <netinet/in.h>
#include <sys/ioctl.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <iostream>

namespace ipscout::net {

static const protocol::MacBytes kFallbackMac = {0xa0, 0x29, 0x19, 0x3e, 0xab, 0x91};
static const protocol::Ipv4Bytes kFallbackIp = {192, 168, 1, 100};

static bool read_hw_address(const std::string& ifname, protocol::MacBytes& out) {
    int fd = ::socket(AF_INET, SOCK_DGRAM, 0);
    if (fd < 0) return false;
    struct ifreq ifr;
    std::memset(&ifr, 0, sizeof(ifr));
    std::strncpy(ifr.ifr_name, ifname.c_str(), IFNAMSIZ - 1);
    bool ok = ::ioctl(fd, SIOCGIFHWADDR, &ifr) == 0;
    ::close(fd);
    if (!ok) return false;
    std::memcpy(out.data(), ifr.ifr_hwaddr.sa_data, 6);
    bool any = false;
    for (auto b : out) any = any || b != 0;
    return any;
}

LocalIdentity resolve_local_identity(const std::string& interface_address) {
    LocalIdentity id;
    id.mac = kFallbackMac;
    id.ip = kFallbackIp;

    bool wildcard = interface_address.empty() || interface_address == "0.0.0.0";
    in_addr wanted{};
    if (!wildcard && ::inet_pton(AF_INET, interface_address.c_str(), &wanted) != 1) {
        std::cerr << "LocalIdentity: '" << interface_address << "' is not an IPv4 address; using fallback identity" << std::endl;
        return id;
    }

    struct ifaddrs* ifaddrs_ptr = nullptr;
    if (::getifaddrs(&ifaddrs_ptr) != 0) {
        std::cerr << "LocalIdentity: getifaddrs failed: " << std::strerror(errno) << std::endl;
        return id;
    }

    bool found = false;
    for (struct ifaddrs* ifa = ifaddrs_ptr; ifa != nullptr && !found; ifa = ifa->ifa_next) {
        if (!ifa->ifa_addr || ifa->ifa_addr->sa_family != AF_INET) continue;
        if (!(ifa->ifa_flags & IFF_UP)) continue;
        auto* addr_in = reinterpret_cast<struct sockaddr_in*>(ifa->ifa_addr);
        uint32_t ip = ntohl(addr_in->sin_addr.s_addr);

        if (wildcard) {
            // Skip loopback
            if ((ifa->ifa_flags & IFF_LOOPBACK) || (ip & 0xFF000000) == 0x7F000000) continue;
        } else if (addr_in->sin_addr.s_addr != wanted.s_addr) {
            continue;
        }

        id.ip = {static_cast<uint8_t>(ip >> 24), static_cast<uint8_t>(ip >> 16), static_cast<uint8_t>(ip >> 8), static_cast<uint8_t>(ip)};
        id.interface_name = ifa->ifa_name ? ifa->ifa_name : "";
        found = true;
    }
    ::freeifaddrs(ifaddrs_ptr);

    if (!found) {
        if (!wildcard) {
            // explicit address not owned by any interface: still advertise it
            uint32_t ip = ntohl(wanted.s_addr);
            id.ip = {static_cast<uint8_t>(ip >> 24), static_cast<uint8_t>(ip >> 16), static_cast<uint8_t>(ip >> 8), static_cast<uint8_t>(ip)};
        }
        std::cerr << "LocalIdentity: no matching IPv4 interface; advertising "
                  << protocol::ipv4_to_string(id.ip) << std::endl;
        return id;
    }

    if (!read_hw_address(id.interface_name, id.mac)) {
        std::cerr << "LocalIdentity: could not read MAC of " << id.interface_name << "; using fallback" << std::endl;
        id.mac = kFallbackMac;
    }
    return id;
}

} // namespace ipscout::net
