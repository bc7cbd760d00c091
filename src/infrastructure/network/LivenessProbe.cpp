#include "infrastructure/network/LivenessProbe.hpp"

#include <spdlog/spdlog.h>

#include <cstring>
#include <random>
#include <set>

namespace netsweep::infra {

namespace {

constexpr uint8_t ICMP_ECHO_REQUEST = 8;
constexpr uint8_t ICMP_ECHO_REPLY = 0;
constexpr size_t ICMP_HEADER_SIZE = 8;
constexpr size_t ECHO_PACKET_SIZE = 64;

} // namespace

LivenessProbe::LivenessProbe(AsioContext& context, bool useIcmp)
    : context_(context), useIcmp_(useIcmp) {
    std::random_device rd;
    identifier_ = static_cast<uint16_t>(rd() & 0xFFFF);
    spdlog::debug("LivenessProbe initialized with ICMP identifier {}", identifier_);
}

uint16_t LivenessProbe::calculateChecksum(const uint8_t* data, size_t length) {
    uint32_t sum = 0;

    while (length > 1) {
        sum += (static_cast<uint16_t>(data[0]) << 8) | data[1];
        data += 2;
        length -= 2;
    }

    if (length == 1) {
        sum += static_cast<uint16_t>(data[0]) << 8;
    }

    while (sum >> 16) {
        sum = (sum & 0xFFFF) + (sum >> 16);
    }

    return static_cast<uint16_t>(~sum);
}

std::vector<uint8_t> LivenessProbe::buildIcmpEchoRequest(uint16_t identifier, uint16_t sequence) {
    std::vector<uint8_t> packet(ECHO_PACKET_SIZE, 0);

    packet[0] = ICMP_ECHO_REQUEST;
    packet[1] = 0;
    packet[4] = static_cast<uint8_t>(identifier >> 8);
    packet[5] = static_cast<uint8_t>(identifier & 0xFF);
    packet[6] = static_cast<uint8_t>(sequence >> 8);
    packet[7] = static_cast<uint8_t>(sequence & 0xFF);

    auto now = std::chrono::steady_clock::now().time_since_epoch().count();
    std::memcpy(&packet[ICMP_HEADER_SIZE], &now, sizeof(now));

    uint16_t checksum = calculateChecksum(packet.data(), packet.size());
    packet[2] = static_cast<uint8_t>(checksum >> 8);
    packet[3] = static_cast<uint8_t>(checksum & 0xFF);

    return packet;
}

bool LivenessProbe::isMatchingEchoReply(const uint8_t* datagram, size_t length,
                                        uint16_t identifier, uint16_t sequence) {
    if (length < 20 + ICMP_HEADER_SIZE) {
        return false;
    }

    size_t ipHeaderLen = static_cast<size_t>((datagram[0] & 0x0F) * 4);
    if (ipHeaderLen < 20 || length < ipHeaderLen + ICMP_HEADER_SIZE) {
        return false;
    }

    const uint8_t* icmp = datagram + ipHeaderLen;
    if (icmp[0] != ICMP_ECHO_REPLY) {
        return false;
    }

    uint16_t recvId = static_cast<uint16_t>((icmp[4] << 8) | icmp[5]);
    uint16_t recvSeq = static_cast<uint16_t>((icmp[6] << 8) | icmp[7]);
    return recvId == identifier && recvSeq == sequence;
}

void LivenessProbe::probeAsync(const std::string& address, const std::vector<uint16_t>& tcpPorts,
                               std::chrono::milliseconds timeout, LivenessCallback callback) {
    auto state = std::make_shared<ProbeState>(asio::make_strand(context_.getContext()));
    state->callback = std::move(callback);

    asio::error_code ec;
    state->target = asio::ip::make_address_v4(address, ec);
    if (ec) {
        spdlog::debug("Liveness probe skipped for '{}': {}", address, ec.message());
        asio::post(state->strand, [state]() { finish(state, core::DeviceStatus::Down); });
        return;
    }

    std::set<uint16_t> ports(tcpPorts.begin(), tcpPorts.end());
    ports.erase(0);

    asio::post(state->strand, [this, state, ports, timeout]() {
        state->timer.expires_after(timeout);
        state->timer.async_wait([state](const asio::error_code& timerEc) {
            if (timerEc == asio::error::operation_aborted) {
                return;
            }
            finish(state, core::DeviceStatus::Down);
        });

        if (useIcmp_ && icmpAvailable_) {
            startIcmp(state);
        }

        for (uint16_t port : ports) {
            auto socket = std::make_shared<asio::ip::tcp::socket>(state->strand);
            state->sockets.push_back(socket);
            ++state->pending;

            socket->async_connect(asio::ip::tcp::endpoint(state->target, port),
                                  [state, socket](const asio::error_code& connectEc) {
                                      if (state->completed) {
                                          return;
                                      }
                                      // A refused connection still proves the host answered.
                                      bool answered =
                                          !connectEc || connectEc == asio::error::connection_refused;
                                      asio::error_code ignored;
                                      socket->close(ignored);
                                      attemptDone(state, answered);
                                  });
        }

        if (state->pending == 0) {
            finish(state, core::DeviceStatus::Down);
        }
    });
}

void LivenessProbe::startIcmp(const std::shared_ptr<ProbeState>& state) {
    auto socket = std::make_shared<asio::ip::icmp::socket>(state->strand);

    asio::error_code ec;
    socket->open(asio::ip::icmp::v4(), ec);
    if (ec) {
        if (icmpAvailable_.exchange(false)) {
            spdlog::warn("ICMP echo unavailable ({}), using TCP-only liveness", ec.message());
        }
        return;
    }

    state->icmpSocket = socket;
    state->sequence = sequenceNumber_++;
    state->echoRequest = buildIcmpEchoRequest(identifier_, state->sequence);
    ++state->pending;

    uint16_t identifier = identifier_;
    socket->async_send_to(asio::buffer(state->echoRequest),
                          asio::ip::icmp::endpoint(state->target, 0),
                          [state, identifier](const asio::error_code& sendEc, std::size_t) {
                              if (state->completed) {
                                  return;
                              }
                              if (sendEc) {
                                  attemptDone(state, false);
                                  return;
                              }
                              awaitEchoReply(state, identifier);
                          });
}

void LivenessProbe::awaitEchoReply(const std::shared_ptr<ProbeState>& state, uint16_t identifier) {
    state->icmpSocket->async_receive_from(
        asio::buffer(state->receiveBuffer), state->replySender,
        [state, identifier](const asio::error_code& recvEc, std::size_t length) {
            if (state->completed) {
                return;
            }
            if (recvEc) {
                attemptDone(state, false);
                return;
            }

            // Raw sockets see every ICMP datagram; keep listening until ours arrives.
            if (state->replySender.address() == asio::ip::address(state->target) &&
                isMatchingEchoReply(state->receiveBuffer.data(), length, identifier,
                                    state->sequence)) {
                attemptDone(state, true);
                return;
            }
            awaitEchoReply(state, identifier);
        });
}

void LivenessProbe::attemptDone(const std::shared_ptr<ProbeState>& state, bool answered) {
    if (state->completed) {
        return;
    }
    if (answered) {
        finish(state, core::DeviceStatus::Up);
        return;
    }
    if (--state->pending == 0) {
        finish(state, core::DeviceStatus::Down);
    }
}

void LivenessProbe::finish(const std::shared_ptr<ProbeState>& state, core::DeviceStatus status) {
    if (state->completed) {
        return;
    }
    state->completed = true;

    state->timer.cancel();
    for (auto& socket : state->sockets) {
        asio::error_code ignored;
        socket->close(ignored);
    }
    state->sockets.clear();
    if (state->icmpSocket) {
        asio::error_code ignored;
        state->icmpSocket->close(ignored);
    }

    auto callback = std::move(state->callback);
    if (callback) {
        callback(status);
    }
}

} // namespace netsweep::infra
