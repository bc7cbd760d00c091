#pragma once

#include "core/services/ILivenessProbe.hpp"
#include "infrastructure/network/AsioContext.hpp"

#include <array>
#include <asio.hpp>
#include <atomic>
#include <memory>
#include <vector>

namespace netsweep::infra {

/**
 * @brief Decides whether an address is live using ICMP echo and TCP connects.
 *
 * An ICMP echo request and a TCP connect to every given port are started at
 * once under a single deadline. The first answer wins: an echo reply, an
 * accepted connection or an actively refused connection all mean Up. When
 * every attempt has failed, or the deadline passes, the address is Down.
 * Implements core::ILivenessProbe.
 *
 * @note ICMP needs a raw socket (CAP_NET_RAW or root on Linux). Without it the
 *       probe silently falls back to TCP-only liveness.
 */
class LivenessProbe : public core::ILivenessProbe {
public:
    /**
     * @brief Constructs a LivenessProbe.
     * @param context AsioContext whose threads run the probes.
     * @param useIcmp Whether to attempt ICMP echo at all.
     */
    explicit LivenessProbe(AsioContext& context, bool useIcmp = true);

    void probeAsync(const std::string& address, const std::vector<uint16_t>& tcpPorts,
                    std::chrono::milliseconds timeout, LivenessCallback callback) override;

    /**
     * @brief Whether raw ICMP sockets could be opened so far.
     */
    [[nodiscard]] bool icmpAvailable() const { return icmpAvailable_.load(); }

    // ICMP helpers
    static uint16_t calculateChecksum(const uint8_t* data, size_t length);
    static std::vector<uint8_t> buildIcmpEchoRequest(uint16_t identifier, uint16_t sequence);

    /**
     * @brief Checks whether a raw IPv4 datagram is the echo reply we wait for.
     * @param datagram Received bytes, starting with the IPv4 header.
     * @param length Number of valid bytes.
     */
    static bool isMatchingEchoReply(const uint8_t* datagram, size_t length, uint16_t identifier,
                                    uint16_t sequence);

private:
    using Strand = asio::strand<asio::io_context::executor_type>;

    struct ProbeState {
        explicit ProbeState(Strand s) : strand(std::move(s)), timer(strand) {}

        Strand strand;
        asio::steady_timer timer;
        std::vector<std::shared_ptr<asio::ip::tcp::socket>> sockets;
        std::shared_ptr<asio::ip::icmp::socket> icmpSocket;
        std::vector<uint8_t> echoRequest;
        std::array<uint8_t, 1500> receiveBuffer{};
        asio::ip::icmp::endpoint replySender;
        asio::ip::address_v4 target;
        uint16_t sequence{0};
        size_t pending{0};
        bool completed{false};
        LivenessCallback callback;
    };

    void startIcmp(const std::shared_ptr<ProbeState>& state);
    static void awaitEchoReply(const std::shared_ptr<ProbeState>& state, uint16_t identifier);
    static void attemptDone(const std::shared_ptr<ProbeState>& state, bool answered);
    static void finish(const std::shared_ptr<ProbeState>& state, core::DeviceStatus status);

    AsioContext& context_;
    bool useIcmp_;
    std::atomic<bool> icmpAvailable_{true};
    std::atomic<uint16_t> sequenceNumber_{0};
    uint16_t identifier_;
};

} // namespace netsweep::infra
