/**
 * @file CidrRange.hpp
 * @brief IPv4 CIDR block parsing and host address enumeration.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <iterator>
#include <string>

namespace netsweep::core {

/**
 * @brief An IPv4 CIDR block that enumerates its usable host addresses.
 *
 * The network address and the broadcast address are excluded. A /31 block
 * yields both of its addresses (point-to-point link) and a /32 block yields
 * its single address. Iteration is lazy and can be restarted any number of
 * times; the range holds no iteration state.
 */
class CidrRange {
public:
    /**
     * @brief Forward iterator producing dotted-quad address strings.
     */
    class const_iterator {
    public:
        using iterator_category = std::forward_iterator_tag;
        using value_type = std::string;
        using difference_type = std::ptrdiff_t;
        using pointer = void;
        using reference = std::string;

        const_iterator() = default;
        explicit const_iterator(uint64_t current) : current_(current) {}

        std::string operator*() const;

        const_iterator& operator++() {
            ++current_;
            return *this;
        }

        const_iterator operator++(int) {
            auto copy = *this;
            ++current_;
            return copy;
        }

        bool operator==(const const_iterator& other) const = default;

    private:
        uint64_t current_{0};
    };

    /**
     * @brief Parses a CIDR block such as "192.168.0.0/24".
     *
     * Host bits set in the address part are ignored, so "192.168.0.1/24"
     * denotes the same block as "192.168.0.0/24".
     *
     * @param cidr Text of the form a.b.c.d/prefix with prefix in [0, 32].
     * @return The parsed range.
     * @throws InvalidRangeError if the text is malformed or not IPv4.
     */
    static CidrRange parse(const std::string& cidr);

    [[nodiscard]] const_iterator begin() const { return const_iterator(first_); }
    [[nodiscard]] const_iterator end() const { return const_iterator(last_ + 1); }

    /**
     * @brief Number of host addresses the range enumerates.
     */
    [[nodiscard]] std::size_t size() const { return static_cast<std::size_t>(last_ + 1 - first_); }

    [[nodiscard]] bool empty() const { return size() == 0; }

    /**
     * @brief Checks whether an address is one of the enumerated hosts.
     * @param address Dotted-quad IPv4 address.
     */
    [[nodiscard]] bool contains(const std::string& address) const;

    [[nodiscard]] int prefixLength() const { return prefix_; }

    /**
     * @brief Returns the canonical form of the block ("192.168.0.0/24").
     */
    [[nodiscard]] std::string toString() const;

private:
    CidrRange(uint32_t network, int prefix);

    uint32_t network_{0};
    int prefix_{32};
    uint64_t first_{0};
    uint64_t last_{0};
};

/**
 * @brief Orders addresses numerically when both are IPv4, lexically otherwise.
 */
bool addressLess(const std::string& lhs, const std::string& rhs);

/**
 * @brief Comparator wrapper around addressLess() for ordered containers.
 */
struct AddressLess {
    bool operator()(const std::string& lhs, const std::string& rhs) const {
        return addressLess(lhs, rhs);
    }
};

} // namespace netsweep::core
