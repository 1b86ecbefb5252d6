#include <gtest/gtest.h>
#include "net/DiscoverySession.hpp"
#include "core/ErrorCatalog.hpp"
#include "test_frames.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/udp.hpp>
#include <array>
#include <chrono>
#include <mutex>
#include <thread>

using namespace ipscout;
using namespace ipscout::net;
using test_support::camera_frame;
using test_support::FrameBuilder;

namespace asio = boost::asio;
using udp = asio::ip::udp;

namespace {

// Answers the first request it receives with a canned list of datagrams.
class FakeResponder {
public:
    explicit FakeResponder(std::vector<std::vector<uint8_t>> replies = {})
    : socket(ioc, udp::endpoint(asio::ip::make_address_v4("127.0.0.1"), 0)), replies(std::move(replies)) {
        socket.async_receive_from(asio::buffer(buf), peer, [this](boost::system::error_code ec, std::size_t n) {
            if (ec) return;
            {
                std::lock_guard<std::mutex> lk(m);
                request.assign(buf.begin(), buf.begin() + n);
            }
            for (const auto& r : this->replies) {
                boost::system::error_code sec;
                socket.send_to(asio::buffer(r), peer, 0, sec);
            }
        });
        worker = std::thread([this]() { ioc.run_for(std::chrono::seconds(3)); });
    }

    ~FakeResponder() {
        ioc.stop();
        if (worker.joinable()) worker.join();
    }

    uint16_t port() const { return socket.local_endpoint().port(); }

    std::vector<uint8_t> received() {
        std::lock_guard<std::mutex> lk(m);
        return request;
    }

private:
    std::mutex m;
    std::vector<uint8_t> request;
    asio::io_context ioc;
    udp::socket socket;
    std::vector<std::vector<uint8_t>> replies;
    std::array<uint8_t, 2048> buf{};
    udp::endpoint peer;
    std::thread worker;
};

DiscoveryOptions loopback_options(uint16_t target_port, std::chrono::milliseconds timeout) {
    DiscoveryOptions o;
    o.interface_address = "127.0.0.1";
    o.target_address = "127.0.0.1";
    o.target_port = target_port;
    o.bind_port = 0;
    o.timeout = timeout;
    return o;
}

} // namespace

TEST(ResponseCollector, CountsBadDatagramsAndDuplicates) {
    ResponseCollector c;
    auto a = camera_frame("d4:2d:c5:14:c5:70", "192.168.1.101");
    std::vector<uint8_t> garbage = {0xde, 0xad, 0xbe, 0xef};
    auto no_ip = FrameBuilder("00:80:45:00:00:05").str(protocol::tags::ModelName, "WV-X").finish();

    EXPECT_TRUE(c.offer(a.data(), a.size(), "192.168.1.101"));
    EXPECT_FALSE(c.offer(garbage.data(), garbage.size()));
    EXPECT_FALSE(c.offer(no_ip.data(), no_ip.size()));
    EXPECT_FALSE(c.offer(a.data(), a.size()));

    const auto& r = c.result();
    EXPECT_EQ(r.responses, 4);
    EXPECT_EQ(r.error_count, 2);
    EXPECT_EQ(r.duplicates, 1);
    ASSERT_EQ(r.devices.size(), 1u);
    EXPECT_EQ(r.devices[0].hardware_address, "d4:2d:c5:14:c5:70");
}

TEST(DiscoverySession, CollectsRepliesOverLoopback) {
    auto nvr = FrameBuilder("00:80:45:00:00:03")
        .ip(protocol::tags::IpAddress, "192.168.1.3")
        .str(protocol::tags::ModelName, "NX510")
        .u16_value(protocol::tags::ChannelCount, 32)
        .finish();
    std::vector<std::vector<uint8_t>> replies = {
        camera_frame("d4:2d:c5:14:c5:70", "192.168.1.101"),
        {0x01, 0x02, 0x03},
        camera_frame("d4:2d:c5:14:c5:70", "192.168.1.101"),
        nvr,
    };
    FakeResponder responder(replies);

    DiscoverySession session(loopback_options(responder.port(), std::chrono::milliseconds(700)));
    auto result = session.run();

    auto request = responder.received();
    ASSERT_EQ(request.size(), protocol::kRequestSize);
    EXPECT_EQ(request[protocol::kClassFilterOffset], protocol::kClassFilterAll);

    EXPECT_FALSE(result.cancelled);
    EXPECT_EQ(result.responses, 4);
    EXPECT_EQ(result.error_count, 1);
    EXPECT_EQ(result.duplicates, 1);
    ASSERT_EQ(result.devices.size(), 2u);
    EXPECT_EQ(result.devices[0].hardware_address, "d4:2d:c5:14:c5:70");
    EXPECT_FALSE(protocol::is_recorder(result.devices[0].kind));
    EXPECT_TRUE(protocol::is_recorder(result.devices[1].kind));
}

TEST(DiscoverySession, CancelEndsListeningEarly) {
    // nothing answers on this port
    FakeResponder silent;
    DiscoverySession session(loopback_options(silent.port(), std::chrono::seconds(10)));

    auto start = std::chrono::steady_clock::now();
    std::thread canceller([&]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        session.cancel();
    });
    auto result = session.run();
    canceller.join();

    EXPECT_TRUE(result.cancelled);
    EXPECT_TRUE(result.devices.empty());
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(5));
}

TEST(DiscoverySession, CancelBeforeRunReturnsImmediately) {
    DiscoverySession session(loopback_options(9, std::chrono::seconds(10)));
    session.cancel();
    auto start = std::chrono::steady_clock::now();
    auto result = session.run();
    EXPECT_TRUE(result.cancelled);
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(2));
}

TEST(DiscoverySession, TimeoutWithNoRepliesIsEmpty) {
    FakeResponder silent;
    DiscoverySession session(loopback_options(silent.port(), std::chrono::milliseconds(200)));
    auto result = session.run();
    EXPECT_FALSE(result.cancelled);
    EXPECT_TRUE(result.devices.empty());
    EXPECT_EQ(result.error_count, 0);
}

TEST(DiscoverySession, SocketErrors) {
    auto opts = loopback_options(9, std::chrono::milliseconds(100));
    opts.interface_address = "not-an-address";
    DiscoverySession bad(opts);
    try {
        bad.run();
        FAIL() << "expected SocketError";
    } catch (const Error& e) {
        EXPECT_EQ(e.kind(), ErrorKind::SocketError);
        EXPECT_EQ(e.code(), errors::E2300_SOCKET_ERROR);
    }

    DiscoverySession once(loopback_options(9, std::chrono::milliseconds(50)));
    once.run();
    EXPECT_THROW(once.run(), Error);
}
