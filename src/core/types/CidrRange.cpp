#include "core/types/CidrRange.hpp"

#include "core/types/Errors.hpp"

#include <asio/ip/address.hpp>
#include <asio/ip/address_v4.hpp>

#include <algorithm>
#include <cctype>
#include <optional>

namespace netsweep::core {

namespace {

std::optional<uint32_t> parseIpv4(const std::string& text) {
    asio::error_code ec;
    auto address = asio::ip::make_address_v4(text, ec);
    if (ec) {
        return std::nullopt;
    }
    return address.to_uint();
}

} // namespace

std::string CidrRange::const_iterator::operator*() const {
    return asio::ip::address_v4(static_cast<uint32_t>(current_)).to_string();
}

CidrRange::CidrRange(uint32_t network, int prefix) : network_(network), prefix_(prefix) {
    uint64_t blockSize = uint64_t{1} << (32 - prefix_);
    uint64_t base = network_;
    uint64_t broadcast = base + blockSize - 1;

    if (prefix_ >= 31) {
        first_ = base;
        last_ = broadcast;
    } else {
        first_ = base + 1;
        last_ = broadcast - 1;
    }
}

CidrRange CidrRange::parse(const std::string& cidr) {
    auto slash = cidr.find('/');
    if (slash == std::string::npos) {
        throw InvalidRangeError("missing prefix length in '" + cidr + "'");
    }

    auto addressPart = cidr.substr(0, slash);
    auto prefixPart = cidr.substr(slash + 1);

    if (prefixPart.empty() || prefixPart.size() > 2 ||
        !std::all_of(prefixPart.begin(), prefixPart.end(),
                     [](unsigned char c) { return std::isdigit(c) != 0; })) {
        throw InvalidRangeError("bad prefix length in '" + cidr + "'");
    }

    int prefix = std::stoi(prefixPart);
    if (prefix > 32) {
        throw InvalidRangeError("prefix length out of range in '" + cidr + "'");
    }

    auto address = parseIpv4(addressPart);
    if (!address) {
        asio::error_code ec;
        auto any = asio::ip::make_address(addressPart, ec);
        if (!ec && any.is_v6()) {
            throw InvalidRangeError("IPv6 ranges are not supported: '" + cidr + "'");
        }
        throw InvalidRangeError("bad address in '" + cidr + "'");
    }

    uint32_t mask = prefix == 0 ? 0u : ~uint32_t{0} << (32 - prefix);
    return CidrRange(*address & mask, prefix);
}

bool CidrRange::contains(const std::string& address) const {
    auto value = parseIpv4(address);
    if (!value) {
        return false;
    }
    return *value >= first_ && *value <= last_;
}

std::string CidrRange::toString() const {
    return asio::ip::address_v4(network_).to_string() + "/" + std::to_string(prefix_);
}

bool addressLess(const std::string& lhs, const std::string& rhs) {
    auto l = parseIpv4(lhs);
    auto r = parseIpv4(rhs);
    if (l && r) {
        return *l < *r;
    }
    if (l != r) {
        // IPv4 addresses sort ahead of anything else
        return l.has_value();
    }
    return lhs < rhs;
}

} // namespace netsweep::core
