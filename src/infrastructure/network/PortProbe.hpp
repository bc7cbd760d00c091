#pragma once

#include "core/services/IPortProbe.hpp"
#include "infrastructure/network/AsioContext.hpp"

#include <asio.hpp>
#include <memory>
#include <vector>

namespace netsweep::infra {

/**
 * @brief TCP connect prober for the ports of a single address.
 *
 * Every port gets its own non-blocking connect; all of them share one
 * deadline timer, so a call completes within timeoutPerPort no matter how
 * many ports are tested. Refused, unreachable and timed-out ports are simply
 * absent from the result. Implements core::IPortProbe.
 */
class PortProbe : public core::IPortProbe {
public:
    /**
     * @brief Constructs a PortProbe.
     * @param context AsioContext whose threads run the connects.
     */
    explicit PortProbe(AsioContext& context);

    void probePortsAsync(const std::string& address, const std::vector<uint16_t>& ports,
                         std::chrono::milliseconds timeoutPerPort,
                         PortsCallback callback) override;

private:
    using Strand = asio::strand<asio::io_context::executor_type>;

    // All handlers of one call run on the state's strand.
    struct ProbeState {
        explicit ProbeState(Strand s) : strand(std::move(s)), timer(strand) {}

        Strand strand;
        asio::steady_timer timer;
        std::vector<std::shared_ptr<asio::ip::tcp::socket>> sockets;
        core::PortSet open;
        size_t pending{0};
        bool completed{false};
        PortsCallback callback;
    };

    static void finish(const std::shared_ptr<ProbeState>& state);

    AsioContext& context_;
};

} // namespace netsweep::infra
