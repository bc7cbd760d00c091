#include "infrastructure/network/HostnameDetailFetcher.hpp"

#include "core/types/Errors.hpp"

#include <spdlog/spdlog.h>

#include <future>
#include <memory>

namespace netsweep::infra {

HostnameDetailFetcher::HostnameDetailFetcher(AsioContext& context,
                                             std::chrono::milliseconds timeout)
    : context_(context), timeout_(timeout) {}

core::DeviceDetail HostnameDetailFetcher::fetch(const std::string& address) {
    asio::error_code ec;
    auto target = asio::ip::make_address(address, ec);
    if (ec) {
        throw core::DetailUnavailableError(address, "malformed address");
    }

    auto resolver = std::make_shared<asio::ip::tcp::resolver>(context_.getContext());
    auto promise = std::make_shared<std::promise<std::string>>();
    auto future = promise->get_future();

    resolver->async_resolve(
        asio::ip::tcp::endpoint(target, 0),
        [resolver, promise](const asio::error_code& resolveEc,
                            asio::ip::tcp::resolver::results_type results) {
            if (resolveEc || results.empty()) {
                promise->set_value(std::string{});
                return;
            }
            promise->set_value(results.begin()->host_name());
        });

    if (future.wait_for(timeout_) != std::future_status::ready) {
        resolver->cancel();
        throw core::DetailUnavailableError(address, "reverse lookup timed out");
    }

    auto hostname = future.get();
    if (hostname.empty() || hostname == target.to_string()) {
        throw core::DetailUnavailableError(address, "no reverse DNS record");
    }

    spdlog::debug("Resolved {} to {}", address, hostname);

    core::DeviceDetail detail;
    detail["hostname"] = hostname;
    detail["source"] = std::string("reverse_dns");
    return detail;
}

} // namespace netsweep::infra
