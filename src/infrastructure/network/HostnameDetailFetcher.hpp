#pragma once

#include "core/services/IDetailFetcher.hpp"
#include "infrastructure/network/AsioContext.hpp"

#include <chrono>

namespace netsweep::infra {

/**
 * @brief Detail fetcher backed by a reverse DNS lookup.
 *
 * Reports the attributes "hostname" and "source". The lookup runs through an
 * Asio resolver and is abandoned after the configured timeout.
 */
class HostnameDetailFetcher : public core::IDetailFetcher {
public:
    /**
     * @brief Constructs the fetcher.
     * @param context AsioContext used to run resolver completions.
     * @param timeout Maximum time to wait for the lookup.
     */
    HostnameDetailFetcher(AsioContext& context, std::chrono::milliseconds timeout);

    /**
     * @brief Resolves the PTR name of an address.
     * @throws core::DetailUnavailableError if the address is malformed, has no
     *         PTR record, or the lookup times out.
     */
    core::DeviceDetail fetch(const std::string& address) override;

private:
    AsioContext& context_;
    std::chrono::milliseconds timeout_;
};

} // namespace netsweep::infra
