#include "common/Logger.h"
#include <filesystem>
#include <sstream>
#include <iomanip>
#include <stdexcept>

namespace quantbench {

Logger& Logger::getInstance() {
    static Logger instance;
    return instance;
}

void Logger::initialize(const std::string& log_dir, const std::string& level, bool console_only) {
    if (initialized_) return;

    try {
        auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console_sink->set_pattern("[%Y-%m-%d %H:%M:%S] [%^%l%$] %v");

        std::vector<spdlog::sink_ptr> sinks{console_sink};
        std::filesystem::path logs_path = std::filesystem::absolute(log_dir);
        if (!console_only) {
            std::filesystem::create_directories(logs_path);
            auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                (logs_path / "quantbench.log").string(), 1024 * 1024 * 10, 3
            );
            sinks.push_back(file_sink);
        }

        main_logger_ = std::make_shared<spdlog::logger>("quantbench", sinks.begin(), sinks.end());
        main_logger_->flush_on(spdlog::level::warn);
        setLevel(level);

        if (!console_only) {
            trade_logger_ = spdlog::daily_logger_mt("quantbench_trades", (logs_path / "trades.log").string());
            trade_logger_->set_pattern("%v");
        }

        initialized_ = true;
        main_logger_->info("Logger initialized");
        if (!console_only) {
            main_logger_->info("Log directory: {}", logs_path.string());
        }
    } catch (const std::exception& ex) {
        main_logger_.reset();
        trade_logger_.reset();
        throw std::runtime_error(std::string("Log init failed: ") + ex.what());
    }
}

void Logger::setLevel(const std::string& level) {
    if (!main_logger_) return;
    // from_str maps unknown names to off; keep info for typos instead
    auto parsed = spdlog::level::from_str(level);
    if (parsed == spdlog::level::off && level != "off") {
        parsed = spdlog::level::info;
    }
    main_logger_->set_level(parsed);
}

void Logger::logTrade(const std::string& symbol, const std::string& direction,
                      double entry_price, double exit_price, double size,
                      double net_pnl, const std::string& close_reason) {
    if (trade_logger_) {
        std::ostringstream oss;
        oss << symbol << "," << direction << ","
            << std::fixed << std::setprecision(8) << entry_price << ","
            << std::fixed << std::setprecision(8) << exit_price << ","
            << std::fixed << std::setprecision(8) << size << ","
            << std::fixed << std::setprecision(2) << net_pnl << ","
            << close_reason;
        trade_logger_->info(oss.str());
    }
}

} // namespace quantbench
