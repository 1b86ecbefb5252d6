#include "net/DiscoverySession.hpp"
#include "net/LocalIdentity.hpp"
#include "protocol/DeviceClassifier.hpp"
#include "core/ErrorCatalog.hpp"

#include <array>
#include <atomic>
#include <iostream>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/udp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>

namespace asio = boost::asio;
using udp = asio::ip::udp;

namespace ipscout::net {

bool ResponseCollector::offer(const uint8_t* data, size_t size, const std::string& sender) {
    result_.responses += 1;
    try {
        auto attrs = protocol::decode_response(data, size);
        auto device = protocol::classify(attrs);
        if (!seen_.insert(device.hardware_address).second) {
            result_.duplicates += 1;
            if (verbose_) {
                std::cerr << "DiscoverySession: duplicate response from " << device.hardware_address << std::endl;
            }
            return false;
        }
        if (verbose_) {
            std::cerr << "DiscoverySession: " << protocol::kind_name(device.kind) << " " << device.model_name
                      << " (" << device.hardware_address << ") at " << device.ip_address << std::endl;
        }
        result_.devices.push_back(std::move(device));
        return true;
    } catch (const Error& e) {
        result_.error_count += 1;
        if (verbose_) {
            std::cerr << "DiscoverySession: dropped " << size << " byte datagram"
                      << (sender.empty() ? "" : " from " + sender) << ": " << e.what() << std::endl;
        }
        return false;
    }
}

struct DiscoverySession::Impl {
    DiscoveryOptions opts;
    asio::io_context ioc;
    udp::socket socket;
    asio::steady_timer deadline;
    std::atomic<bool> cancel_requested{false};
    std::atomic<bool> started{false};
    ResponseCollector collector;
    std::array<uint8_t, protocol::kMaxDatagram> buffer{};
    udp::endpoint sender;

    explicit Impl(DiscoveryOptions o)
    : opts(std::move(o)), ioc(), socket(ioc), deadline(ioc), collector(opts.verbose) {}

    void open_and_bind() {
        boost::system::error_code ec;
        auto bind_addr = asio::ip::make_address_v4(opts.interface_address, ec);
        if (ec) throw Error(ErrorKind::SocketError, "bad interface address '" + opts.interface_address + "'");

        socket.open(udp::v4(), ec);
        if (ec) throw Error(ErrorKind::SocketError, "open failed: " + ec.message());
        socket.set_option(asio::socket_base::broadcast(true), ec);
        if (ec) throw Error(ErrorKind::SocketError, "set_option(broadcast) failed: " + ec.message());
        socket.set_option(asio::socket_base::reuse_address(true), ec);
        if (ec) throw Error(ErrorKind::SocketError, "set_option(reuse_address) failed: " + ec.message());

        socket.bind(udp::endpoint(bind_addr, opts.bind_port), ec);
        if (ec == asio::error::address_in_use && opts.bind_port != 0) {
            std::cerr << "DiscoverySession: port " << opts.bind_port << " in use, binding to any port" << std::endl;
            socket.bind(udp::endpoint(bind_addr, 0), ec);
        }
        if (ec) throw Error(ErrorKind::SocketError, "bind failed: " + ec.message());
    }

    void send_request() {
        auto identity = resolve_local_identity(opts.interface_address);
        auto frame = protocol::encode_request(identity.mac, identity.ip);

        boost::system::error_code ec;
        auto target = asio::ip::make_address_v4(opts.target_address, ec);
        if (ec) {
            std::cerr << "DiscoverySession: bad target address '" << opts.target_address << "'" << std::endl;
            return;
        }
        socket.send_to(asio::buffer(frame), udp::endpoint(target, opts.target_port), 0, ec);
        if (ec) {
            // no retry; the listen window still runs
            std::cerr << "DiscoverySession: send failed: " << ec.message() << std::endl;
        } else if (opts.verbose) {
            std::cerr << "DiscoverySession: sent " << frame.size() << " bytes to "
                      << opts.target_address << ":" << opts.target_port << std::endl;
        }
    }

    void stop_listening() {
        boost::system::error_code ec;
        deadline.cancel();
        socket.close(ec);
    }

    void do_receive() {
        socket.async_receive_from(asio::buffer(buffer), sender,
            [this](boost::system::error_code ec, std::size_t n) {
                if (ec) {
                    // operation_aborted: deadline hit or cancelled
                    if (ec != asio::error::operation_aborted && ec != asio::error::bad_descriptor) {
                        std::cerr << "DiscoverySession: receive error: " << ec.message() << std::endl;
                        if (socket.is_open()) do_receive();
                    }
                    return;
                }
                collector.offer(buffer.data(), n, sender.address().to_string());
                if (socket.is_open()) do_receive();
            });
    }
};

DiscoverySession::DiscoverySession(DiscoveryOptions opts)
: impl(std::make_unique<Impl>(std::move(opts))) {}

DiscoverySession::~DiscoverySession() = default;

DiscoveryResult DiscoverySession::run() {
    if (impl->started.exchange(true)) {
        throw Error(ErrorKind::SocketError, "discovery session already used");
    }
    impl->open_and_bind();

    if (impl->opts.verbose) {
        std::cerr << "DiscoverySession: listening on " << impl->socket.local_endpoint().address().to_string()
                  << ":" << impl->socket.local_endpoint().port()
                  << " for " << impl->opts.timeout.count() << " ms" << std::endl;
    }

    if (!impl->cancel_requested.load()) {
        impl->send_request();

        impl->deadline.expires_after(impl->opts.timeout);
        impl->deadline.async_wait([this](boost::system::error_code ec) {
            if (!ec) impl->stop_listening();
        });
        impl->do_receive();
        impl->ioc.run();
    }

    boost::system::error_code ignored;
    impl->socket.close(ignored);

    DiscoveryResult out = impl->collector.take();
    out.cancelled = impl->cancel_requested.load();
    std::cerr << "DiscoverySession: " << out.devices.size() << " device(s), "
              << out.responses << " response(s), " << out.error_count << " dropped"
              << (out.cancelled ? " (cancelled)" : "") << std::endl;
    return out;
}

void DiscoverySession::cancel() {
    impl->cancel_requested.store(true);
    asio::post(impl->ioc, [this]() { impl->stop_listening(); });
}

} // namespace ipscout::net
