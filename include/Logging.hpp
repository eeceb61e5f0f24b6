#pragma once

#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <mutex>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/null_sink.h>
#include <spdlog/spdlog.h>

/**
 * @brief Process wide analysis logger.
 *
 * Records go to logs/pws_analysis.log, or to the directory named by
 * PWS_LOG_DIR. PWS_LOG_LEVEL (trace, debug, info, warn, err, critical, off)
 * overrides the default debug level. Worker threads share the logger, so the
 * pattern carries the thread id.
 */
class Logger {
public:
  static std::shared_ptr<spdlog::logger> getInstance() {
    static std::once_flag flag;
    static std::shared_ptr<spdlog::logger> instance;

    std::call_once(flag, []() {
      const char *dir = std::getenv("PWS_LOG_DIR");
      const std::filesystem::path logDir = dir ? dir : "logs";
      try {
        std::filesystem::create_directories(logDir);
        instance = spdlog::basic_logger_mt(
            "pws_analysis", (logDir / "pws_analysis.log").string());
        instance->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [tid %t] %v");
        const char *level = std::getenv("PWS_LOG_LEVEL");
        instance->set_level(level ? spdlog::level::from_str(level)
                                  : spdlog::level::debug);
        instance->flush_on(spdlog::level::warn);
      } catch (const spdlog::spdlog_ex &ex) {
        std::cerr << "Analysis log unavailable: " << ex.what() << std::endl;
        instance = spdlog::null_logger_mt("pws_analysis_null");
      } catch (const std::filesystem::filesystem_error &ex) {
        std::cerr << "Cannot create " << logDir << ": " << ex.what()
                  << std::endl;
        instance = spdlog::null_logger_mt("pws_analysis_null");
      }
    });

    return instance;
  }
};
