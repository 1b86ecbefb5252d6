#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>
#include <cstdlib>
#include <iostream>
#include <string>
#include <nlohmann/json.hpp>

namespace beast = boost::beast;
namespace websocket = beast::websocket;
namespace net = boost::asio;
using tcp = net::ip::tcp;
using json = nlohmann::json;

struct WsUrl {
    std::string host;
    std::string port;
    std::string target;
};

static bool parse_ws_url(const std::string& url, WsUrl& out) {
    // ws://host[:port][/path]
    std::string s = url;
    const std::string prefix = "ws://";
    if (s.rfind(prefix, 0) != 0) return false;
    s = s.substr(prefix.size());

    std::string hostport;
    auto slash = s.find('/');
    if (slash == std::string::npos) {
        hostport = s;
        out.target = "/";
    } else {
        hostport = s.substr(0, slash);
        out.target = s.substr(slash);
        if (out.target.empty()) out.target = "/";
    }

    auto colon = hostport.find(':');
    if (colon == std::string::npos) {
        out.host = hostport;
        out.port = "9001";
    } else {
        out.host = hostport.substr(0, colon);
        out.port = hostport.substr(colon + 1);
        if (out.port.empty()) out.port = "9001";
    }

    return !out.host.empty();
}

static std::string next_id() {
    static uint64_t n = 0;
    return "req_" + std::to_string(++n);
}

int main(int argc, char** argv) {
    if (argc < 3) {
        std::cerr << "Usage: " << argv[0] << " ws://host:port method [params_json] [--wait-scan]\n";
        std::cerr << "Example:\n";
        std::cerr << "  " << argv[0] << " ws://localhost:9001 devices.list '{\"sort\":\"ip\"}'\n";
        std::cerr << "  " << argv[0] << " ws://localhost:9001 devices.history '{\"mac\":\"d4:2d:c5:14:c5:70\"}'\n";
        std::cerr << "  " << argv[0] << " ws://localhost:9001 scan '{}' --wait-scan\n";
        return 2;
    }

    const std::string ws_url = argv[1];
    const std::string method = argv[2];
    json params = json::object();
    bool wait_scan = false;
    for (int i = 3; i < argc; ++i) {
        std::string a(argv[i]);
        if (a == "--wait-scan") { wait_scan = true; continue; }
        params = json::parse(a, nullptr, false);
        if (params.is_discarded()) {
            std::cerr << "Invalid params_json: " << a << "\n";
            return 2;
        }
    }

    WsUrl u;
    if (!parse_ws_url(ws_url, u)) {
        std::cerr << "Invalid ws url (expected ws://host:port/path): " << ws_url << "\n";
        return 2;
    }

    try {
        net::io_context ioc;
        tcp::resolver resolver{ioc};
        websocket::stream<tcp::socket> ws{ioc};

        auto const results = resolver.resolve(u.host, u.port);
        net::connect(ws.next_layer(), results);
        ws.handshake(u.host + ":" + u.port, u.target);

        const std::string id = next_id();
        json req = {
            {"type", "rpc"},
            {"id", id},
            {"method", method},
            {"params", params},
        };

        ws.write(net::buffer(req.dump()));

        int rc = 0;
        bool have_reply = false;
        beast::flat_buffer buffer;
        for (;;) {
            buffer.clear();
            ws.read(buffer);
            json msg = json::parse(beast::buffers_to_string(buffer.data()), nullptr, false);
            if (msg.is_discarded() || !msg.is_object()) continue;

            auto type = msg.value("type", std::string{});
            if (type == "rpc_result" && msg.contains("id") && msg["id"] == id) {
                std::cout << msg.dump(2) << std::endl;
                have_reply = true;
                if (!msg.value("ok", false)) {
                    rc = 1;
                    break;
                }
                if (!(wait_scan && method == "scan")) break;
            } else if (type == "scan_complete" && have_reply) {
                std::cout << msg.dump(2) << std::endl;
                if (!msg.value("ok", false)) rc = 1;
                break;
            }
        }

        beast::error_code ec;
        ws.close(websocket::close_code::normal, ec);
        return rc;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
