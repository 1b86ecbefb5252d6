#pragma once
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <unordered_set>
#include <vector>

#include "protocol/DeviceDescriptor.hpp"
#include "protocol/PacketCodec.hpp"

namespace ipscout::net {

struct DiscoveryOptions {
    // local address to bind/broadcast from; "0.0.0.0" for all interfaces
    std::string interface_address = "0.0.0.0";
    std::chrono::milliseconds timeout{3000};
    std::string target_address = "255.255.255.255";
    uint16_t target_port = protocol::kDiscoveryPort;
    // 0 binds an ephemeral port
    uint16_t bind_port = protocol::kSourcePort;
    bool verbose = false;
};

struct DiscoveryResult {
    std::vector<protocol::DeviceDescriptor> devices;  // at most one per hardware address
    int error_count = 0;   // datagrams that failed decode or classify
    int responses = 0;     // datagrams received
    int duplicates = 0;
    bool cancelled = false;
};

// Decodes, classifies and de-duplicates datagrams for one run. Never throws
// on bad input; failures only bump error_count.
class ResponseCollector {
public:
    explicit ResponseCollector(bool verbose = false) : verbose_(verbose) {}

    // true if the datagram produced a new device
    bool offer(const uint8_t* data, size_t size, const std::string& sender = {});

    const DiscoveryResult& result() const { return result_; }
    DiscoveryResult take() { return std::move(result_); }

private:
    bool verbose_;
    std::unordered_set<std::string> seen_;
    DiscoveryResult result_;
};

/**
 * @brief One discovery run: broadcast a request, collect replies until the
 * timeout elapses or cancel() is called.
 *
 * run() may be called once per session. It throws Error(SocketError) when the
 * socket cannot be opened or bound; nothing else escapes. cancel() is safe to
 * call from any thread, before or during run(); a cancelled run returns the
 * devices collected so far.
 */
class DiscoverySession {
public:
    explicit DiscoverySession(DiscoveryOptions opts);
    ~DiscoverySession();

    DiscoverySession(const DiscoverySession&) = delete;
    DiscoverySession& operator=(const DiscoverySession&) = delete;

    DiscoveryResult run();
    void cancel();

private:
    struct Impl;
    std::unique_ptr<Impl> impl;
};

} // namespace ipscout::net
