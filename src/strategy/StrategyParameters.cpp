#include "strategy/StrategyParameters.h"

#include <cmath>
#include <sstream>
#include <stdexcept>

namespace quantbench {
namespace strategy {

namespace {
bool matchesType(const ParameterValue& value, ParameterType type) {
    switch (type) {
        case ParameterType::NUMBER:
            return std::holds_alternative<double>(value);
        case ParameterType::INTEGER:
            return std::holds_alternative<double>(value) &&
                   std::floor(std::get<double>(value)) == std::get<double>(value);
        case ParameterType::BOOLEAN:
            return std::holds_alternative<bool>(value);
        case ParameterType::STRING:
            return std::holds_alternative<std::string>(value);
    }
    return false;
}

const ParameterValue& findOrThrow(const std::map<std::string, ParameterValue>& values,
                                  const std::string& name) {
    auto it = values.find(name);
    if (it == values.end()) {
        throw std::invalid_argument("Unknown strategy parameter: " + name);
    }
    return it->second;
}
}

const char* toString(ParameterType type) {
    switch (type) {
        case ParameterType::NUMBER: return "number";
        case ParameterType::INTEGER: return "integer";
        case ParameterType::BOOLEAN: return "boolean";
        case ParameterType::STRING: return "string";
    }
    return "unknown";
}

double StrategyParameters::getNumber(const std::string& name) const {
    const auto& value = findOrThrow(values_, name);
    if (!std::holds_alternative<double>(value)) {
        throw std::invalid_argument("Strategy parameter is not a number: " + name);
    }
    return std::get<double>(value);
}

int StrategyParameters::getInt(const std::string& name) const {
    return static_cast<int>(std::lround(getNumber(name)));
}

bool StrategyParameters::getBool(const std::string& name) const {
    const auto& value = findOrThrow(values_, name);
    if (!std::holds_alternative<bool>(value)) {
        throw std::invalid_argument("Strategy parameter is not a boolean: " + name);
    }
    return std::get<bool>(value);
}

const std::string& StrategyParameters::getString(const std::string& name) const {
    const auto& value = findOrThrow(values_, name);
    if (!std::holds_alternative<std::string>(value)) {
        throw std::invalid_argument("Strategy parameter is not a string: " + name);
    }
    return std::get<std::string>(value);
}

double StrategyParameters::getNumberOr(const std::string& name, double fallback) const {
    auto it = values_.find(name);
    if (it == values_.end() || !std::holds_alternative<double>(it->second)) {
        return fallback;
    }
    return std::get<double>(it->second);
}

std::vector<std::string> StrategyParameters::validate(const std::vector<ParameterSpec>& schema) const {
    std::vector<std::string> errors;

    for (const auto& [name, value] : values_) {
        bool known = false;
        for (const auto& spec : schema) {
            if (spec.name == name) {
                known = true;
                break;
            }
        }
        if (!known) {
            errors.push_back("Unknown parameter '" + name + "'");
        }
    }

    for (const auto& spec : schema) {
        auto it = values_.find(spec.name);
        if (it == values_.end()) {
            continue;
        }
        if (!matchesType(it->second, spec.type)) {
            errors.push_back("Parameter '" + spec.name + "' must be " + toString(spec.type));
            continue;
        }
        if (std::holds_alternative<double>(it->second)) {
            const double v = std::get<double>(it->second);
            if (spec.min && v < *spec.min) {
                std::ostringstream oss;
                oss << "Parameter '" << spec.name << "' below minimum " << *spec.min;
                errors.push_back(oss.str());
            }
            if (spec.max && v > *spec.max) {
                std::ostringstream oss;
                oss << "Parameter '" << spec.name << "' above maximum " << *spec.max;
                errors.push_back(oss.str());
            }
        }
    }
    return errors;
}

StrategyParameters StrategyParameters::resolve(const std::vector<ParameterSpec>& schema) const {
    const auto errors = validate(schema);
    if (!errors.empty()) {
        std::string message = "Invalid strategy parameters:";
        for (const auto& e : errors) {
            message += " " + e + ";";
        }
        throw std::invalid_argument(message);
    }

    StrategyParameters resolved;
    for (const auto& spec : schema) {
        auto it = values_.find(spec.name);
        resolved.values_[spec.name] = (it != values_.end()) ? it->second : spec.default_value;
    }
    return resolved;
}

} // namespace strategy
} // namespace quantbench
