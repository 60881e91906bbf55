#include "logging.hpp"
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <vector>
#include <memory>
#include <iostream>
#include <cstdlib>
#include <chrono>       // For timestamp in filename
#include <sstream>      // For formatting filename
#include <iomanip>      // For std::put_time
#include <filesystem>   // For creating the log directory
#include <algorithm>    // For std::min, std::transform
#include <cctype>       // For std::tolower
#include <stdexcept>

namespace core {
namespace logging {

    static std::shared_ptr<spdlog::logger> global_logger;

    namespace {

        const char* kLoggerName = "BacktestLogger";

        // Build logs/<base>_<UTC stamp>.log, falling back to the working directory
        std::string makeLogFilePath(const std::string& base_log_filename) {
            std::string log_dir = "logs";
            try {
                if (!std::filesystem::exists(log_dir)) {
                    std::filesystem::create_directories(log_dir);
                    std::cout << "[Logging] Created log directory: " << log_dir << std::endl;
                }
            } catch (const std::filesystem::filesystem_error& fs_err) {
                std::cerr << "[Logging] Error creating log directory '" << log_dir << "': " << fs_err.what() << std::endl;
                log_dir = "."; // Fallback
            }

            auto now = std::chrono::system_clock::now();
            auto itt = std::chrono::system_clock::to_time_t(now);
            std::tm utc_tm;
            #ifdef _WIN32
                gmtime_s(&utc_tm, &itt);
            #else
                gmtime_r(&itt, &utc_tm);
            #endif

            std::ostringstream filename_oss;
            filename_oss << base_log_filename << "_" << std::put_time(&utc_tm, "%Y%m%d_%H%M%SZ") << ".log";
            return log_dir + "/" + filename_oss.str();
        }

    } // namespace

    void initialize(const std::string& base_log_filename,
                    spdlog::level::level_enum console_level,
                    spdlog::level::level_enum file_level)
    {
        try {
            // --- Check Environment Variable for Override ---
            const char* env_level_cstr = std::getenv("SPDLOG_LEVEL");
            if (env_level_cstr) {
                std::string env_level_str(env_level_cstr);
                spdlog::level::level_enum env_level = level_from_string(env_level_str);
                console_level = env_level;
                file_level = env_level;
                std::cout << "[Logging] Overriding log level from SPDLOG_LEVEL environment variable to: "
                          << env_level_str << std::endl;
            }

            const std::string utc_pattern = "[%Y-%m-%d %H:%M:%S.%e%z] [%^%l%$] [%n] %v";

            // --- Create Sinks ---
            std::vector<spdlog::sink_ptr> sinks;
            auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
            console_sink->set_level(console_level);
            console_sink->set_pattern(utc_pattern);
            sinks.push_back(console_sink);

            spdlog::level::level_enum logger_level = console_level;
            if (!base_log_filename.empty()) {
                std::string log_file_path = makeLogFilePath(base_log_filename);
                std::cout << "[Logging] Log file path: " << log_file_path << std::endl;

                auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                    log_file_path, 1024 * 1024 * 10, 5, true);
                file_sink->set_level(file_level);
                file_sink->set_pattern(utc_pattern);
                sinks.push_back(file_sink);
                logger_level = std::min(console_level, file_level);
            }

            // --- Create Logger ---
            // Re-initialization replaces the previously registered logger
            spdlog::drop(kLoggerName);
            global_logger = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
            global_logger->set_level(logger_level);
            spdlog::register_logger(global_logger);
            spdlog::set_default_logger(global_logger);
            spdlog::flush_on(spdlog::level::err);

            #ifdef NDEBUG
                const char* build_type_str = "Release";
            #else
                const char* build_type_str = "Debug";
            #endif

            getLogger()->info("Logging initialized (Build Type: {}). Console: {}, File: {} (UTC)",
                              build_type_str,
                              spdlog::level::to_string_view(console_level),
                              base_log_filename.empty() ? spdlog::string_view_t("disabled")
                                                        : spdlog::level::to_string_view(file_level));

        } catch (const spdlog::spdlog_ex& ex) {
             std::cerr << "Log initialization failed: " << ex.what() << std::endl;
        } catch (const std::filesystem::filesystem_error& fs_err) {
             std::cerr << "Log initialization failed (Filesystem Error): " << fs_err.what() << std::endl;
        }
    }

    std::shared_ptr<spdlog::logger>& getLogger() {
        if (!global_logger) {
             throw std::runtime_error("Logger accessed before initialization. Call core::logging::initialize() first.");
        }
        return global_logger;
    }

    spdlog::level::level_enum level_from_string(const std::string& level_str) {
        std::string lower_str = level_str;
        std::transform(lower_str.begin(), lower_str.end(), lower_str.begin(),
            [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
        if (lower_str == "trace") return spdlog::level::trace;
        if (lower_str == "debug") return spdlog::level::debug;
        if (lower_str == "info") return spdlog::level::info;
        if (lower_str == "warn" || lower_str == "warning") return spdlog::level::warn;
        if (lower_str == "error" || lower_str == "err") return spdlog::level::err;
        if (lower_str == "critical" || lower_str == "crit") return spdlog::level::critical;
        if (lower_str == "off") return spdlog::level::off;
        std::cerr << "[Logging] Unrecognized log level string: '" << level_str << "'. Defaulting to 'info'." << std::endl;
        return spdlog::level::info;
    }

} // namespace logging
} // namespace core
