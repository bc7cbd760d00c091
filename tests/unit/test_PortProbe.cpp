#include <catch2/catch_test_macros.hpp>

#include "infrastructure/network/AsioContext.hpp"
#include "infrastructure/network/PortProbe.hpp"

#include <asio.hpp>

#include <atomic>
#include <future>
#include <thread>

using namespace netsweep::core;
using namespace netsweep::infra;

namespace {

asio::ip::tcp::endpoint loopback(uint16_t port = 0) {
    return {asio::ip::make_address("127.0.0.1"), port};
}

// Binds and releases an ephemeral port so nothing is listening on it.
uint16_t closedPort(asio::io_context& io) {
    asio::ip::tcp::acceptor acceptor(io, loopback());
    auto port = acceptor.local_endpoint().port();
    acceptor.close();
    return port;
}

} // namespace

TEST_CASE("PortProbe on loopback", "[PortProbe]") {
    AsioContext context(2);
    context.start();
    PortProbe probe(context);

    asio::ip::tcp::acceptor listener(context.getContext(), loopback());
    uint16_t openPort = listener.local_endpoint().port();
    uint16_t unusedPort = closedPort(context.getContext());

    SECTION("Listening port is reported open") {
        auto open = probe.probePorts("127.0.0.1", {openPort}, std::chrono::milliseconds(1000));
        REQUIRE(open == PortSet{openPort});
    }

    SECTION("Closed port is not reported") {
        auto open = probe.probePorts("127.0.0.1", {openPort, unusedPort},
                                     std::chrono::milliseconds(1000));
        REQUIRE(open == PortSet{openPort});
    }

    SECTION("Duplicate ports are probed once") {
        auto open = probe.probePorts("127.0.0.1", {openPort, openPort},
                                     std::chrono::milliseconds(1000));
        REQUIRE(open == PortSet{openPort});
    }
}

TEST_CASE("PortProbe degenerate input", "[PortProbe]") {
    AsioContext context(1);
    context.start();
    PortProbe probe(context);

    SECTION("Malformed address yields no open ports") {
        REQUIRE(probe.probePorts("not-an-address", {22}, std::chrono::milliseconds(200)).empty());
    }

    SECTION("Empty port list yields no open ports") {
        REQUIRE(probe.probePorts("127.0.0.1", {}, std::chrono::milliseconds(200)).empty());
    }

    SECTION("Port 0 is skipped") {
        REQUIRE(probe.probePorts("127.0.0.1", {0}, std::chrono::milliseconds(200)).empty());
    }
}

TEST_CASE("PortProbe invokes the callback exactly once", "[PortProbe]") {
    AsioContext context(2);
    context.start();
    PortProbe probe(context);

    asio::ip::tcp::acceptor listener(context.getContext(), loopback());
    uint16_t openPort = listener.local_endpoint().port();

    std::atomic<int> invocations{0};
    std::promise<void> done;
    probe.probePortsAsync("127.0.0.1", {openPort}, std::chrono::milliseconds(200),
                          [&](const PortSet&) {
                              if (++invocations == 1) {
                                  done.set_value();
                              }
                          });

    REQUIRE(done.get_future().wait_for(std::chrono::seconds(2)) == std::future_status::ready);

    // Past the deadline; the timer must not fire a second completion.
    std::this_thread::sleep_for(std::chrono::milliseconds(300));
    REQUIRE(invocations == 1);
}
