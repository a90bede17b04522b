#pragma once

#include "strategy/IStrategy.h"
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace quantbench {
namespace strategy {

using StrategyFactory = std::function<std::shared_ptr<IStrategy>()>;

// Maps strategy ids to factories. Owned by the caller; nothing in the
// backtest core looks strategies up globally.
class StrategyRegistry {
public:
    void registerStrategy(const std::string& id, StrategyFactory factory);

    // Fresh instance per call, nullptr for unknown ids
    std::shared_ptr<IStrategy> create(const std::string& id) const;
    StrategyFactory factoryFor(const std::string& id) const;

    bool contains(const std::string& id) const;
    std::vector<std::string> ids() const;

    // Adds the strategies shipped in this library
    void registerBuiltins();

private:
    mutable std::mutex mutex_;
    std::map<std::string, StrategyFactory> factories_;
};

} // namespace strategy
} // namespace quantbench
