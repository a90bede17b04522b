#pragma once

#include "common/Types.h"
#include "strategy/StrategyParameters.h"
#include <map>
#include <string>
#include <vector>

namespace quantbench {
namespace strategy {

enum class SignalType {
    NONE,           // no signal
    LONG,
    SHORT,
    EXIT_LONG,
    EXIT_SHORT
};

struct Signal {
    SignalType type;
    double price;
    double confidence;      // 0.0 ~ 1.0
    std::string reason;
    long long timestamp;

    Signal()
        : type(SignalType::NONE)
        , price(0.0)
        , confidence(0.0)
        , timestamp(0)
    {}

    Signal(SignalType t, double p, const std::string& why = "")
        : type(t)
        , price(p)
        , confidence(1.0)
        , reason(why)
        , timestamp(0)
    {}

    bool isNone() const { return type == SignalType::NONE; }
};

// Named indicator series, aligned with the candles they were computed from
struct IndicatorResult {
    std::map<std::string, std::vector<double>> series;

    bool has(const std::string& name) const { return series.count(name) > 0; }

    // Last value of a series, or fallback when missing/empty
    double last(const std::string& name, double fallback = 0.0) const {
        auto it = series.find(name);
        if (it == series.end() || it->second.empty()) return fallback;
        return it->second.back();
    }
};

// Read-only view of an open position handed to populateExitSignal
struct PositionSnapshot {
    std::string id;
    TradeDirection direction = TradeDirection::LONG;
    double avg_entry_price = 0.0;
    double total_size = 0.0;
    double unrealized_pnl = 0.0;
    long long opened_at = 0;
    int opened_at_index = 0;
};

struct StrategyInfo {
    std::string id;
    std::string name;
    int min_candles_required = 1;
    std::vector<ParameterSpec> parameters;
};

// Strategy collaborator. The engine sees only candles already processed.
class IStrategy {
public:
    virtual ~IStrategy() = default;

    virtual StrategyInfo getInfo() const = 0;

    // Called once per run before the first candle; throws std::invalid_argument on bad params
    virtual void initialize(const StrategyParameters& params) = 0;

    virtual IndicatorResult populateIndicators(const std::vector<Candle>& candles) = 0;

    virtual Signal populateEntrySignal(
        const std::vector<Candle>& candles,
        const IndicatorResult& indicators,
        double current_price
    ) = 0;

    virtual Signal populateExitSignal(
        const std::vector<Candle>& candles,
        const IndicatorResult& indicators,
        const PositionSnapshot& position
    ) {
        (void)candles;
        (void)indicators;
        (void)position;
        return Signal();
    }
};

inline const char* toString(SignalType type) {
    switch (type) {
        case SignalType::NONE: return "NONE";
        case SignalType::LONG: return "LONG";
        case SignalType::SHORT: return "SHORT";
        case SignalType::EXIT_LONG: return "EXIT_LONG";
        case SignalType::EXIT_SHORT: return "EXIT_SHORT";
    }
    return "NONE";
}

} // namespace strategy
} // namespace quantbench
