#pragma once

/**
 * @file logger.hpp
 * @brief Process-wide logger used by the reference tracking core and the CLI
 *
 * Messages go to stderr (colored when attached to a terminal), to an
 * optional log file and to registered callbacks. Callbacks let the host
 * mirror log lines into its own sink.
 */

#include <format>
#include <fstream>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace LinkKeeper::core {

enum class LogLevel { Trace, Debug, Info, Warning, Error, Fatal, Off };

/**
 * @brief Parse a level name ("trace", "debug", "info", "warning"/"warn",
 *        "error", "fatal", "off"), case-insensitive
 */
[[nodiscard]] std::optional<LogLevel> parseLogLevel(std::string_view name);

[[nodiscard]] const char* logLevelName(LogLevel level);

class Logger {
public:
  static Logger& instance();

  Logger(const Logger&) = delete;
  Logger& operator=(const Logger&) = delete;

  void setLevel(LogLevel level);
  [[nodiscard]] LogLevel getLevel() const;

  /**
   * @brief Append log lines to a file in addition to stderr
   * @return false if the file could not be opened
   */
  bool setOutputFile(const std::string& path);
  void closeOutputFile();

  /**
   * @brief Silence stderr output (file and callbacks still receive lines)
   */
  void setConsoleEnabled(bool enabled);

  using LogCallback = std::function<void(LogLevel, const std::string&)>;
  void addLogCallback(LogCallback callback);
  void clearLogCallbacks();

  void log(LogLevel level, std::string_view message);

  void trace(std::string_view message);
  void debug(std::string_view message);
  void info(std::string_view message);
  void warning(std::string_view message);
  void error(std::string_view message);
  void fatal(std::string_view message);

  template <typename... Args> void trace(std::format_string<Args...> fmt, Args&&... args) {
    trace(std::format(fmt, std::forward<Args>(args)...));
  }

  template <typename... Args> void debug(std::format_string<Args...> fmt, Args&&... args) {
    debug(std::format(fmt, std::forward<Args>(args)...));
  }

  template <typename... Args> void info(std::format_string<Args...> fmt, Args&&... args) {
    info(std::format(fmt, std::forward<Args>(args)...));
  }

  template <typename... Args> void warning(std::format_string<Args...> fmt, Args&&... args) {
    warning(std::format(fmt, std::forward<Args>(args)...));
  }

  template <typename... Args> void error(std::format_string<Args...> fmt, Args&&... args) {
    error(std::format(fmt, std::forward<Args>(args)...));
  }

private:
  Logger();
  ~Logger();

  [[nodiscard]] std::string getCurrentTimestamp() const;

  LogLevel m_level;
  std::ofstream m_fileStream;
  mutable std::mutex m_mutex;
  bool m_useColors;
  bool m_consoleEnabled = true;
  std::vector<LogCallback> m_callbacks;
};

} // namespace LinkKeeper::core

#define LINKKEEPER_LOG_TRACE(...) ::LinkKeeper::core::Logger::instance().trace(__VA_ARGS__)
#define LINKKEEPER_LOG_DEBUG(...) ::LinkKeeper::core::Logger::instance().debug(__VA_ARGS__)
#define LINKKEEPER_LOG_INFO(...) ::LinkKeeper::core::Logger::instance().info(__VA_ARGS__)
#define LINKKEEPER_LOG_WARN(...) ::LinkKeeper::core::Logger::instance().warning(__VA_ARGS__)
#define LINKKEEPER_LOG_ERROR(...) ::LinkKeeper::core::Logger::instance().error(__VA_ARGS__)
#define LINKKEEPER_LOG_FATAL(...) ::LinkKeeper::core::Logger::instance().fatal(__VA_ARGS__)
