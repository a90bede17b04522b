#pragma once

#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace quantbench {
namespace strategy {

using ParameterValue = std::variant<double, bool, std::string>;

enum class ParameterType {
    NUMBER,
    INTEGER,
    BOOLEAN,
    STRING
};

// One entry of a strategy's parameter schema
struct ParameterSpec {
    std::string name;
    ParameterType type = ParameterType::NUMBER;
    ParameterValue default_value = 0.0;
    std::optional<double> min;
    std::optional<double> max;
    std::string description;
};

// String-keyed typed parameter map. resolve() checks it against a schema once,
// after which the typed getters do not fail for schema keys.
class StrategyParameters {
public:
    StrategyParameters() = default;

    void set(const std::string& name, double value) { values_[name] = value; }
    void set(const std::string& name, int value) { values_[name] = static_cast<double>(value); }
    void set(const std::string& name, bool value) { values_[name] = value; }
    void set(const std::string& name, const std::string& value) { values_[name] = value; }
    void set(const std::string& name, const char* value) { values_[name] = std::string(value); }
    void set(const std::string& name, const ParameterValue& value) { values_[name] = value; }

    bool contains(const std::string& name) const { return values_.count(name) > 0; }
    bool empty() const { return values_.empty(); }
    const std::map<std::string, ParameterValue>& values() const { return values_; }

    // Throw std::invalid_argument when the key is missing or holds another type
    double getNumber(const std::string& name) const;
    int getInt(const std::string& name) const;
    bool getBool(const std::string& name) const;
    const std::string& getString(const std::string& name) const;

    double getNumberOr(const std::string& name, double fallback) const;

    // Fills defaults and validates every value against the schema.
    // Throws std::invalid_argument listing all problems.
    StrategyParameters resolve(const std::vector<ParameterSpec>& schema) const;
    std::vector<std::string> validate(const std::vector<ParameterSpec>& schema) const;

private:
    std::map<std::string, ParameterValue> values_;
};

const char* toString(ParameterType type);

} // namespace strategy
} // namespace quantbench
