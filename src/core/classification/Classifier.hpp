/**
 * @file Classifier.hpp
 * @brief Rule-table device role classification.
 *
 * Roles are derived from the set of open ports and, when available, the
 * detail attributes of a device. Rules are evaluated in table order and the
 * first match wins; a device matching no rule is Unknown.
 */

#pragma once

#include "core/types/Device.hpp"

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace netsweep::core {

/**
 * @brief Port sets and attribute hints used to build the default rule table.
 */
struct ClassifierConfig {
    PortSet voipPorts{5060, 5061};                    ///< SIP signalling ports
    std::vector<PortSet> switchPortSets{{23, 161}};   ///< Port combinations typical of switches
    PortSet serverPorts{22, 80, 443, 3306, 8080};     ///< Any of these marks a server
    std::vector<std::string> voipVendors{"polycom", "yealink", "grandstream", "avaya",
                                         "snom",    "mitel",   "fanvil"};
    std::vector<std::string> serverHostnameHints{"server", "web"};

    bool operator==(const ClassifierConfig& other) const = default;
};

/**
 * @brief One entry of the classification table.
 */
struct ClassificationRule {
    /**
     * @brief Predicate over the open ports and optional detail attributes.
     *
     * The detail pointer is null when no detail is known for the device.
     */
    using Predicate = std::function<bool(const PortSet& openPorts, const DeviceDetail* detail)>;

    std::string name; ///< Short identifier used in logs
    DeviceRole role{DeviceRole::Unknown};
    Predicate matches;
};

/**
 * @brief Derives device roles from an ordered rule table.
 *
 * classify() is a pure function of its arguments: it performs no I/O and
 * keeps no state between calls.
 */
class Classifier {
public:
    /**
     * @brief Constructs a classifier with the default rule table.
     */
    Classifier();

    /**
     * @brief Constructs a classifier with the default rules built from config.
     */
    explicit Classifier(const ClassifierConfig& config);

    /**
     * @brief Constructs a classifier with an explicit rule table.
     */
    explicit Classifier(std::vector<ClassificationRule> rules);

    /**
     * @brief Builds the default table: VOIP, then Switch, then Server.
     * @param config Port sets and hints to use.
     * @return Rules in priority order.
     */
    static std::vector<ClassificationRule> defaultRules(const ClassifierConfig& config = {});

    /**
     * @brief Classifies a device.
     * @param openPorts Ports found open.
     * @param detail Detail attributes, if known.
     * @return Role of the first matching rule, or Unknown.
     */
    [[nodiscard]] DeviceRole classify(const PortSet& openPorts,
                                      const std::optional<DeviceDetail>& detail) const;

    /**
     * @brief Finds the first rule matching the inputs.
     * @return Pointer into the table, or nullptr if no rule matches.
     */
    [[nodiscard]] const ClassificationRule* firstMatch(const PortSet& openPorts,
                                                       const std::optional<DeviceDetail>& detail) const;

    /**
     * @brief Appends a rule with the lowest priority.
     */
    void addRule(ClassificationRule rule);

    [[nodiscard]] const std::vector<ClassificationRule>& rules() const { return rules_; }

    // Predicate builders for rule tables.
    static ClassificationRule::Predicate anyPortOf(PortSet ports);
    static ClassificationRule::Predicate allPortsOf(PortSet ports);
    static ClassificationRule::Predicate detailEquals(std::string key, std::string value);
    static ClassificationRule::Predicate detailContainsAny(std::string key,
                                                           std::vector<std::string> needles);
    static ClassificationRule::Predicate anyOf(std::vector<ClassificationRule::Predicate> predicates);

private:
    std::vector<ClassificationRule> rules_;
};

} // namespace netsweep::core
