#include "ControlServer.hpp"
#include "RegistryProtocol.hpp"
#include "DeviceRegistry.hpp"
#include "ScanCoordinator.hpp"
#include "core/ErrorCatalog.hpp"
#include "core/Config.hpp"
#include <iostream>
#include <chrono>
// Boost.Beast / Asio for WebSocket
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <mutex>
#include <set>

namespace beast = boost::beast;
namespace websocket = beast::websocket;
namespace asio = boost::asio;
using tcp = asio::ip::tcp;
using json = nlohmann::json;

namespace ipscout {

using WsStream = websocket::stream<tcp::socket>;

struct ControlServer::Impl {
    asio::io_context ioc;
    tcp::acceptor acceptor;
    std::mutex sessions_m;
    std::set<std::shared_ptr<WsStream>> sessions;

    explicit Impl(int port): ioc(), acceptor(ioc) {
        boost::system::error_code ec;
        acceptor.open(tcp::v4(), ec);
        if (ec) throw Error(ErrorKind::SocketError, "acceptor.open failed: " + ec.message());
        acceptor.set_option(asio::socket_base::reuse_address(true), ec);
        if (ec) {
            std::cerr << "ControlServer: set_option failed: " << ec.message() << std::endl;
        }
        acceptor.bind(tcp::endpoint(tcp::v4(), (unsigned short)port), ec);
        if (ec) throw Error(ErrorKind::SocketError, "bind to port " + std::to_string(port) + " failed: " + ec.message());
        acceptor.listen(asio::socket_base::max_listen_connections, ec);
        if (ec) throw Error(ErrorKind::SocketError, "listen failed: " + ec.message());
    }

    void add_session(std::shared_ptr<WsStream> s) {
        std::lock_guard<std::mutex> lk(sessions_m);
        sessions.insert(s);
        std::cerr << "ControlServer: client connected (count=" << sessions.size() << ")" << std::endl;
    }
    void remove_session(std::shared_ptr<WsStream> s) {
        std::lock_guard<std::mutex> lk(sessions_m);
        sessions.erase(s);
        std::cerr << "ControlServer: client disconnected (count=" << sessions.size() << ")" << std::endl;
    }
    template<typename Fn>
    void for_each_session(Fn&& fn) {
        std::lock_guard<std::mutex> lk(sessions_m);
        for (auto &s : sessions) fn(s);
    }

    // writes run on the event thread, which is the only one polling ioc
    static void send(std::shared_ptr<WsStream> s, std::string payload) {
        asio::post(s->get_executor(), [s, payload = std::move(payload)]() {
            boost::system::error_code ec;
            s->text(true);
            s->write(asio::buffer(payload), ec);
            // a failed write surfaces again in the session's read loop
        });
    }
};

static json rpc_error(const json& id, int code, const std::string& message) {
    return {
        {"type", "rpc_result"},
        {"id", id},
        {"ok", false},
        {"error", {{"code", code}, {"message", message}}}
    };
}

static std::string require_mac(const json& params) {
    if (!params.is_object() || !params.contains("mac") || !params["mac"].is_string()) {
        throw Error(ErrorKind::InvalidArgument, errors::D2400_MISSING_MAC);
    }
    return protocol::normalize_mac(params["mac"].get<std::string>());
}

ControlServer::ControlServer(int p, DeviceRegistry& reg, ScanCoordinator& sc,
                                 net::DiscoveryOptions opts)
: port(p), running(false), registry(reg), scans(sc), scan_options(std::move(opts)),
  protocol(std::make_unique<RegistryProtocol>(reg, sc)) {}

ControlServer::~ControlServer() {
    stop();
}

void ControlServer::start() {
    if (running) return;
    impl = std::make_shared<Impl>(port);
    running = true;

    event_thread = std::thread([this](){ run_event_loop(); });
    auto_scan_thread = std::thread([this](){ auto_scan_loop(); });
    std::cerr << "ControlServer: listening on port " << bound_port() << std::endl;
}

void ControlServer::stop() {
    running = false;
    if (auto_scan_thread.joinable()) auto_scan_thread.join();
    // the scan_complete callback holds this; it must finish first
    scans.cancel();
    scans.wait();
    if (event_thread.joinable()) event_thread.join();
}

uint16_t ControlServer::bound_port() const {
    if (!impl) return 0;
    boost::system::error_code ec;
    auto ep = impl->acceptor.local_endpoint(ec);
    return ec ? 0 : ep.port();
}

void ControlServer::run_event_loop() {
    try {
        auto& ioc = impl->ioc;
        auto& acceptor = impl->acceptor;

        std::function<void()> do_accept;
        do_accept = [&]() {
            auto socket = std::make_shared<tcp::socket>(ioc);
            acceptor.async_accept(*socket, [this, socket, &do_accept](boost::system::error_code ec) {
                if (ec) {
                    if (running) std::cerr << "ControlServer: accept error: " << ec.message() << std::endl;
                } else {
                    auto ws = std::make_shared<WsStream>(std::move(*socket));
                    ws->async_accept([this, ws](boost::system::error_code ec) {
                        if (ec) {
                            std::cerr << "ControlServer: websocket accept failed: " << ec.message() << std::endl;
                            return;
                        }
                        impl->add_session(ws);
                        auto buffer = std::make_shared<beast::flat_buffer>();
                        auto do_read = std::make_shared<std::function<void()>>();
                        *do_read = [this, ws, buffer, do_read]() {
                            ws->async_read(*buffer, [this, ws, buffer, do_read](boost::system::error_code ec, std::size_t) {
                                if (ec) {
                                    impl->remove_session(ws);
                                    // break the self-reference so the session can be freed
                                    *do_read = nullptr;
                                    return;
                                }
                                auto data = beast::buffers_to_string(buffer->data());
                                buffer->consume(buffer->size());
                                json reply;
                                json msg = json::parse(data, nullptr, false);
                                if (msg.is_discarded()) {
                                    reply = rpc_error(nullptr, errors::E2400_CONTROL_REJECTED,
                                                      errors::format_message(ErrorKind::InvalidArgument, "request is not JSON"));
                                } else {
                                    reply = handle_control(msg);
                                }
                                Impl::send(ws, reply.dump());
                                (*do_read)();
                            });
                        };
                        (*do_read)();
                    });
                }
                if (running) do_accept();
            });
        };

        do_accept();

        while (running) {
            try {
                impl->ioc.poll();
            } catch (const std::exception& e) {
                std::cerr << "ControlServer: I/O context error: " << e.what() << std::endl;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        }

        boost::system::error_code ec;
        acceptor.close(ec);
        impl->for_each_session([&](std::shared_ptr<WsStream> s){
            boost::system::error_code cec;
            s->close(websocket::close_code::normal, cec);
        });

    } catch (const std::exception& e) {
        std::cerr << "ControlServer: run_event_loop exception: " << e.what() << std::endl;
    }
}

json ControlServer::handle_control(const json& msg) {
    if (!msg.is_object() || !msg.contains("type") || msg["type"] != "rpc") {
        return rpc_error(nullptr, errors::E2400_CONTROL_REJECTED,
                         errors::format_message(ErrorKind::InvalidArgument, errors::D2400_INVALID_REQUEST));
    }
    if (!msg.contains("id")) {
        return rpc_error(nullptr, errors::E2400_CONTROL_REJECTED,
                         errors::format_message(ErrorKind::InvalidArgument, errors::D2400_RPC_MISSING_ID));
    }
    const json& id = msg["id"];
    if (!msg.contains("method") || !msg["method"].is_string()) {
        return rpc_error(id, errors::E2400_CONTROL_REJECTED,
                         errors::format_message(ErrorKind::InvalidArgument, errors::D2400_RPC_MISSING_METHOD));
    }
    auto method = msg["method"].get<std::string>();
    json params = msg.contains("params") ? msg["params"] : json::object();

    try {
        json result = dispatch(method, params);
        return {{"type", "rpc_result"}, {"id", id}, {"ok", true}, {"result", result}};
    } catch (const Error& e) {
        return rpc_error(id, e.code(), e.what());
    } catch (const json::exception& e) {
        return rpc_error(id, errors::E2400_CONTROL_REJECTED,
                         errors::format_message(ErrorKind::InvalidArgument, e.what()));
    } catch (const std::exception& e) {
        std::cerr << "ControlServer: " << method << " failed: " << e.what() << std::endl;
        return rpc_error(id, errors::E2400_CONTROL_REJECTED, e.what());
    }
}

json ControlServer::dispatch(const std::string& method, const json& params) {
    auto now = Clock::now();

    if (method == "scan") {
        start_scan(params);
        return {{"started", true}};
    }
    if (method == "scan.cancel") {
        bool was_running = scans.in_progress();
        scans.cancel();
        return {{"cancelled", was_running}};
    }
    if (method == "devices.list") {
        auto key = SortKey::LastSeen;
        if (params.is_object() && params.contains("sort")) key = sort_key_from_string(params["sort"].get<std::string>());
        return protocol->build_device_list(key, now);
    }
    if (method == "devices.get") {
        auto mac = require_mac(params);
        json out = protocol->build_device_detail(mac, now);
        if (out.is_null()) throw Error(ErrorKind::NotFound, mac);
        return out;
    }
    if (method == "devices.history") {
        auto mac = require_mac(params);
        json out = protocol->build_history(mac);
        if (out.is_null()) throw Error(ErrorKind::NotFound, mac);
        return out;
    }
    if (method == "stats") {
        return protocol->build_stats(now, auto_scan_on, auto_scan_interval_s);
    }
    if (method == "conflicts") {
        return protocol->build_conflicts();
    }
    if (method == "autoscan.set") {
        bool enabled = auto_scan_on;
        int interval = auto_scan_interval_s;
        if (params.is_object() && params.contains("enabled")) enabled = params["enabled"].get<bool>();
        if (params.is_object() && params.contains("interval_s")) interval = interval_from_seconds(params["interval_s"].get<double>());
        set_auto_scan(enabled, interval);
        return {{"enabled", enabled}, {"interval_s", interval}};
    }
    if (method == "export") {
        return protocol->build_export(now);
    }
    throw Error(ErrorKind::InvalidArgument, std::string(errors::D2400_RPC_UNKNOWN_METHOD) + ": " + method);
}

void ControlServer::start_scan(const json& params) {
    auto opts = scan_options;
    if (params.is_object() && params.contains("timeout_s")) {
        opts.timeout = timeout_from_seconds(params["timeout_s"].get<double>());
    }
    scans.start_async(opts, [this](const ScanOutcome& outcome) {
        broadcast(protocol->build_scan_complete(outcome));
    });
}

void ControlServer::set_auto_scan(bool enabled, int interval_s) {
    auto_scan_interval_s = interval_s;
    auto_scan_on = enabled;
    std::cerr << "ControlServer: auto-scan " << (enabled ? "on" : "off")
              << " (interval=" << interval_s << "s)" << std::endl;
}

void ControlServer::broadcast(const json& msg) {
    if (!impl) return;
    auto payload = msg.dump();
    impl->for_each_session([&](std::shared_ptr<WsStream> s){
        Impl::send(s, payload);
    });
}

void ControlServer::auto_scan_loop() {
    auto last = std::chrono::steady_clock::now();
    while (running) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        if (!auto_scan_on) {
            last = std::chrono::steady_clock::now();
            continue;
        }
        auto now = std::chrono::steady_clock::now();
        if (now - last < std::chrono::seconds(auto_scan_interval_s.load())) continue;
        last = now;
        try {
            start_scan(json::object());
            std::cerr << "ControlServer: auto-scan started" << std::endl;
        } catch (const Error& e) {
            if (e.kind() != ErrorKind::ScanAlreadyInProgress) {
                std::cerr << "ControlServer: auto-scan failed: " << e.what() << std::endl;
            }
        }
    }
}

} // namespace ipscout
