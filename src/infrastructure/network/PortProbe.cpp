#include "infrastructure/network/PortProbe.hpp"

#include <spdlog/spdlog.h>

namespace netsweep::infra {

PortProbe::PortProbe(AsioContext& context) : context_(context) {}

void PortProbe::probePortsAsync(const std::string& address, const std::vector<uint16_t>& ports,
                                std::chrono::milliseconds timeoutPerPort, PortsCallback callback) {
    auto state = std::make_shared<ProbeState>(asio::make_strand(context_.getContext()));
    state->callback = std::move(callback);

    asio::error_code ec;
    auto target = asio::ip::make_address(address, ec);
    core::PortSet uniquePorts(ports.begin(), ports.end());
    uniquePorts.erase(0);

    if (ec || uniquePorts.empty()) {
        if (ec) {
            spdlog::debug("Port probe skipped for '{}': {}", address, ec.message());
        }
        asio::post(state->strand, [state]() { finish(state); });
        return;
    }

    asio::post(state->strand, [state, target, uniquePorts, timeoutPerPort]() {
        state->pending = uniquePorts.size();

        state->timer.expires_after(timeoutPerPort);
        state->timer.async_wait([state](const asio::error_code& timerEc) {
            if (timerEc == asio::error::operation_aborted) {
                return;
            }
            finish(state);
        });

        for (uint16_t port : uniquePorts) {
            auto socket = std::make_shared<asio::ip::tcp::socket>(state->strand);
            state->sockets.push_back(socket);

            socket->async_connect(asio::ip::tcp::endpoint(target, port),
                                  [state, socket, port](const asio::error_code& connectEc) {
                                      if (state->completed) {
                                          return;
                                      }
                                      if (!connectEc) {
                                          state->open.insert(port);
                                      }
                                      asio::error_code ignored;
                                      socket->close(ignored);

                                      if (--state->pending == 0) {
                                          finish(state);
                                      }
                                  });
        }
    });
}

void PortProbe::finish(const std::shared_ptr<ProbeState>& state) {
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

    auto callback = std::move(state->callback);
    if (callback) {
        callback(state->open);
    }
}

} // namespace netsweep::infra
