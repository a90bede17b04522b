#include "common/Config.h"
#include "common/Logger.h"

#include <filesystem>
#include <fstream>
#include <stdexcept>

namespace quantbench {

namespace {

template <typename T>
std::optional<T> optionalValue(const nlohmann::json& j, const char* key) {
    if (!j.contains(key) || j.at(key).is_null()) return std::nullopt;
    return j.at(key).get<T>();
}

std::string joinProblems(const std::vector<std::string>& problems) {
    std::string out;
    for (const auto& p : problems) {
        if (!out.empty()) out += "; ";
        out += p;
    }
    return out;
}

strategy::TacticsSet parseTactics(const nlohmann::json& t) {
    strategy::TacticsSet tactics;
    tactics.id = t.value("id", tactics.id);
    tactics.name = t.value("name", tactics.name);
    tactics.use_stop_loss = t.value("use_stop_loss", false);
    tactics.use_take_profit = t.value("use_take_profit", false);

    if (t.contains("entry")) {
        const auto& e = t["entry"];
        tactics.entry.position_sizing = strategy::sizingModeFromString(e.value("position_sizing", "PERCENT"));
        tactics.entry.position_size = e.value("position_size", 10.0);
        tactics.entry.leverage = e.value("leverage", 1.0);
    }

    if (t.contains("take_profit")) {
        const auto& tp = t["take_profit"];
        tactics.take_profit.type = strategy::takeProfitTypeFromString(tp.value("type", "FIXED_TP"));
        tactics.take_profit.tp_price = optionalValue<double>(tp, "tp_price");
        tactics.take_profit.tp_percent = optionalValue<double>(tp, "tp_percent");
        tactics.take_profit.max_holding_minutes = optionalValue<double>(tp, "max_holding_minutes");
        if (tp.contains("targets")) {
            for (const auto& item : tp["targets"]) {
                strategy::TakeProfitTargetSpec target;
                target.price = optionalValue<double>(item, "price");
                target.profit_percent = optionalValue<double>(item, "profit_percent");
                target.close_percent = item.value("close_percent", 100.0);
                tactics.take_profit.targets.push_back(target);
            }
        }
    }

    if (t.contains("stop_loss")) {
        const auto& sl = t["stop_loss"];
        tactics.stop_loss.type = strategy::stopLossTypeFromString(sl.value("type", "PERCENT"));
        tactics.stop_loss.sl_price = optionalValue<double>(sl, "sl_price");
        tactics.stop_loss.sl_percent = optionalValue<double>(sl, "sl_percent");
        tactics.stop_loss.atr_multiplier = optionalValue<double>(sl, "atr_multiplier");
        tactics.stop_loss.atr_period = sl.value("atr_period", 14);
        tactics.stop_loss.move_to_breakeven_after = optionalValue<double>(sl, "move_to_breakeven_after");
    }

    if (t.contains("trailing_stop")) {
        const auto& tr = t["trailing_stop"];
        tactics.trailing.enabled = tr.value("enabled", false);
        tactics.trailing.type = strategy::trailingTypeFromString(tr.value("type", "PERCENT"));
        tactics.trailing.value = tr.value("value", 1.0);
        tactics.trailing.atr_period = tr.value("atr_period", 14);
        tactics.trailing.atr_multiplier = tr.value("atr_multiplier", 2.0);
        tactics.trailing.activation_profit = optionalValue<double>(tr, "activation_profit");
        tactics.trailing.activation_price = optionalValue<double>(tr, "activation_price");
        tactics.trailing.activation_after_tp = optionalValue<int>(tr, "activation_after_tp");
    }
    return tactics;
}

strategy::StrategyParameters parseStrategyParams(const nlohmann::json& p) {
    strategy::StrategyParameters params;
    for (auto it = p.begin(); it != p.end(); ++it) {
        const auto& v = it.value();
        if (v.is_boolean()) {
            params.set(it.key(), v.get<bool>());
        } else if (v.is_number()) {
            params.set(it.key(), v.get<double>());
        } else if (v.is_string()) {
            params.set(it.key(), v.get<std::string>());
        } else {
            throw std::invalid_argument("strategy_params." + it.key() + " must be a number, boolean or string");
        }
    }
    return params;
}

} // namespace

Config& Config::getInstance() {
    static Config instance;
    return instance;
}

void Config::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    backtest_config_ = backtest::BacktestConfig();
    walk_forward_config_ = backtest::WalkForwardConfig();
    monte_carlo_config_ = backtest::MonteCarloConfig();
    log_level_ = "info";
    log_dir_ = "logs";
    console_only_ = false;
}

void Config::load(const std::string& config_path) {
    if (!std::filesystem::exists(config_path)) {
        LOG_WARN("Config file not found: {}, using defaults", config_path);
        return;
    }

    std::ifstream file(config_path);
    if (!file.is_open()) {
        LOG_WARN("Config file could not be opened: {}, using defaults", config_path);
        return;
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error("Malformed config file " + config_path + ": " + e.what());
    }

    loadFromJson(j);
    LOG_INFO("Config loaded: {}", config_path);
}

void Config::loadFromJson(const nlohmann::json& j) {
    backtest::BacktestConfig bt;
    backtest::WalkForwardConfig wf;
    backtest::MonteCarloConfig mc;
    std::string log_level = "info";
    std::string log_dir = "logs";
    bool console_only = false;

    try {
        if (j.contains("backtest")) {
            const auto& b = j["backtest"];
            bt.id = b.value("id", bt.id);
            bt.name = b.value("name", bt.name);
            bt.symbol = b.value("symbol", bt.symbol);
            bt.timeframe = b.value("timeframe", bt.timeframe);
            bt.start_date = b.value("start_date", 0LL);
            bt.end_date = b.value("end_date", 0LL);
            bt.initial_balance = b.value("initial_balance", 10000.0);
            bt.currency = b.value("currency", bt.currency);
            bt.strategy_id = b.value("strategy_id", bt.strategy_id);
            bt.fee_percent = b.value("fee_percent", 0.1);
            bt.slippage_percent = b.value("slippage_percent", 0.0);
            bt.max_leverage = b.value("max_leverage", 10.0);
            bt.margin_mode = backtest::marginModeFromString(b.value("margin_mode", "ISOLATED"));
            bt.allow_short = b.value("allow_short", true);
            bt.max_drawdown = optionalValue<double>(b, "max_drawdown");
            bt.max_open_positions = b.value("max_open_positions", 3);
            bt.record_debug_logs = b.value("record_debug_logs", false);
        }

        if (j.contains("tactics")) {
            bt.tactics = parseTactics(j["tactics"]);
        }

        if (j.contains("strategy_params")) {
            bt.strategy_params = parseStrategyParams(j["strategy_params"]);
        }

        if (j.contains("walk_forward")) {
            const auto& w = j["walk_forward"];
            wf.train_period_days = w.value("train_period_days", 90);
            wf.test_period_days = w.value("test_period_days", 30);
            wf.step_period_days = w.value("step_period_days", 30);
            wf.min_trades = w.value("min_trades", 10);
            wf.optimize_on_train = w.value("optimize_on_train", true);
        }

        if (j.contains("monte_carlo")) {
            const auto& m = j["monte_carlo"];
            mc.iterations = m.value("iterations", 1000);
            mc.ruin_threshold = m.value("ruin_threshold", 0.5);
            mc.initial_equity = m.value("initial_equity", bt.initial_balance);
            mc.seed = optionalValue<std::uint32_t>(m, "seed");
        }

        if (j.contains("logging")) {
            const auto& l = j["logging"];
            log_level = l.value("level", log_level);
            log_dir = l.value("dir", log_dir);
            console_only = l.value("console_only", false);
        }
    } catch (const nlohmann::json::exception& e) {
        throw std::invalid_argument(std::string("Invalid config value: ") + e.what());
    }

    std::vector<std::string> problems = bt.validate();
    for (const auto& p : wf.validate()) problems.push_back(p);
    if (mc.iterations < 0) problems.push_back("monte_carlo.iterations must be >= 0");
    if (mc.ruin_threshold <= 0.0 || mc.ruin_threshold > 1.0) {
        problems.push_back("monte_carlo.ruin_threshold must be in (0, 1]");
    }
    if (mc.initial_equity <= 0.0) problems.push_back("monte_carlo.initial_equity must be > 0");
    if (!problems.empty()) {
        throw std::invalid_argument("Invalid config: " + joinProblems(problems));
    }

    std::lock_guard<std::mutex> lock(mutex_);
    backtest_config_ = bt;
    walk_forward_config_ = wf;
    monte_carlo_config_ = mc;
    log_level_ = log_level;
    log_dir_ = log_dir;
    console_only_ = console_only;
}

backtest::BacktestConfig Config::getBacktestConfig() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return backtest_config_;
}

backtest::WalkForwardConfig Config::getWalkForwardConfig() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return walk_forward_config_;
}

backtest::MonteCarloConfig Config::getMonteCarloConfig() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return monte_carlo_config_;
}

std::string Config::getLogLevel() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return log_level_;
}

std::string Config::getLogDir() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return log_dir_;
}

bool Config::isConsoleOnly() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return console_only_;
}

} // namespace quantbench
