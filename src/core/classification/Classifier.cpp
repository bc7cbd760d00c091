#include "core/classification/Classifier.hpp"

#include <algorithm>
#include <cctype>

namespace netsweep::core {

namespace {

std::string toLower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

// Detail lookups compare text case-insensitively; non-string values are rendered first.
std::optional<std::string> detailText(const DeviceDetail* detail, const std::string& key) {
    if (detail == nullptr) {
        return std::nullopt;
    }
    auto it = detail->find(key);
    if (it == detail->end()) {
        return std::nullopt;
    }
    return toLower(detailValueToString(it->second));
}

} // namespace

Classifier::Classifier() : Classifier(ClassifierConfig{}) {}

Classifier::Classifier(const ClassifierConfig& config) : rules_(defaultRules(config)) {}

Classifier::Classifier(std::vector<ClassificationRule> rules) : rules_(std::move(rules)) {}

std::vector<ClassificationRule> Classifier::defaultRules(const ClassifierConfig& config) {
    std::vector<ClassificationRule> rules;

    rules.push_back({"voip", DeviceRole::VOIP,
                     anyOf({anyPortOf(config.voipPorts), detailEquals("device_class", "voip"),
                            detailContainsAny("vendor", config.voipVendors)})});

    std::vector<ClassificationRule::Predicate> switchPredicates;
    for (const auto& combo : config.switchPortSets) {
        switchPredicates.push_back(allPortsOf(combo));
    }
    switchPredicates.push_back(detailEquals("device_class", "switch"));
    rules.push_back({"switch", DeviceRole::Switch, anyOf(std::move(switchPredicates))});

    rules.push_back({"server", DeviceRole::Server,
                     anyOf({anyPortOf(config.serverPorts),
                            detailContainsAny("hostname", config.serverHostnameHints)})});

    return rules;
}

DeviceRole Classifier::classify(const PortSet& openPorts,
                                const std::optional<DeviceDetail>& detail) const {
    const auto* rule = firstMatch(openPorts, detail);
    return rule != nullptr ? rule->role : DeviceRole::Unknown;
}

const ClassificationRule* Classifier::firstMatch(const PortSet& openPorts,
                                                 const std::optional<DeviceDetail>& detail) const {
    const DeviceDetail* detailPtr = detail ? &*detail : nullptr;
    for (const auto& rule : rules_) {
        if (rule.matches && rule.matches(openPorts, detailPtr)) {
            return &rule;
        }
    }
    return nullptr;
}

void Classifier::addRule(ClassificationRule rule) {
    rules_.push_back(std::move(rule));
}

ClassificationRule::Predicate Classifier::anyPortOf(PortSet ports) {
    return [ports = std::move(ports)](const PortSet& open, const DeviceDetail*) {
        return std::any_of(ports.begin(), ports.end(),
                           [&open](uint16_t port) { return open.count(port) != 0; });
    };
}

ClassificationRule::Predicate Classifier::allPortsOf(PortSet ports) {
    return [ports = std::move(ports)](const PortSet& open, const DeviceDetail*) {
        return !ports.empty() && std::includes(open.begin(), open.end(), ports.begin(), ports.end());
    };
}

ClassificationRule::Predicate Classifier::detailEquals(std::string key, std::string value) {
    return [key = std::move(key), value = toLower(std::move(value))](const PortSet&,
                                                                     const DeviceDetail* detail) {
        auto text = detailText(detail, key);
        return text && *text == value;
    };
}

ClassificationRule::Predicate Classifier::detailContainsAny(std::string key,
                                                            std::vector<std::string> needles) {
    for (auto& needle : needles) {
        needle = toLower(needle);
    }
    return [key = std::move(key), needles = std::move(needles)](const PortSet&,
                                                                const DeviceDetail* detail) {
        auto text = detailText(detail, key);
        if (!text) {
            return false;
        }
        return std::any_of(needles.begin(), needles.end(), [&text](const std::string& needle) {
            return !needle.empty() && text->find(needle) != std::string::npos;
        });
    };
}

ClassificationRule::Predicate Classifier::anyOf(
    std::vector<ClassificationRule::Predicate> predicates) {
    return [predicates = std::move(predicates)](const PortSet& open, const DeviceDetail* detail) {
        return std::any_of(predicates.begin(), predicates.end(),
                           [&](const auto& predicate) { return predicate(open, detail); });
    };
}

} // namespace netsweep::core
