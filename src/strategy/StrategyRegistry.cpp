#include "strategy/StrategyRegistry.h"
#include "strategy/SmaCrossStrategy.h"
#include "common/Logger.h"

#include <stdexcept>

namespace quantbench {
namespace strategy {

void StrategyRegistry::registerStrategy(const std::string& id, StrategyFactory factory) {
    if (!factory) {
        throw std::invalid_argument("Strategy factory is empty: " + id);
    }
    std::lock_guard<std::mutex> lock(mutex_);
    factories_[id] = std::move(factory);
    LOG_INFO("Strategy registered: {}", id);
}

std::shared_ptr<IStrategy> StrategyRegistry::create(const std::string& id) const {
    StrategyFactory factory = factoryFor(id);
    if (!factory) {
        return nullptr;
    }
    return factory();
}

StrategyFactory StrategyRegistry::factoryFor(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = factories_.find(id);
    if (it == factories_.end()) {
        return StrategyFactory();
    }
    return it->second;
}

bool StrategyRegistry::contains(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return factories_.count(id) > 0;
}

std::vector<std::string> StrategyRegistry::ids() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> out;
    out.reserve(factories_.size());
    for (const auto& [id, _] : factories_) {
        out.push_back(id);
    }
    return out;
}

void StrategyRegistry::registerBuiltins() {
    registerStrategy(SmaCrossStrategy::ID, []() {
        return std::make_shared<SmaCrossStrategy>();
    });
}

} // namespace strategy
} // namespace quantbench
