#pragma once

/**
 * @file operation_log.hpp
 * @brief Structured operation records for the external logging sink
 *
 * The core reports what it did (references found, links rewritten,
 * renames handled) as OperationRecord values. A sink decides where they
 * go; the default one forwards them to the Logger.
 */

#include "LinkKeeper/core/logger.hpp"

#include <map>
#include <string>

namespace LinkKeeper::refs {

enum class OperationType {
  FindReference,
  UpdateReference,
  UpdateDisplayText,
  Rename,
  Move,
  PluginError
};

[[nodiscard]] const char* operationTypeName(OperationType type);

struct OperationRecord {
  core::LogLevel level = core::LogLevel::Info;
  OperationType operation = OperationType::FindReference;
  std::string message;
  std::string documentPath;
  std::string assetPath;
  std::map<std::string, std::string> details;
};

/**
 * @brief Receiver of operation records
 *
 * Implementations may throw; the core calls them through
 * emitOperation(), which contains any failure.
 */
class IOperationLogSink {
public:
  virtual ~IOperationLogSink() = default;
  virtual void record(const OperationRecord& record) = 0;
};

/**
 * @brief Forwards records to core::Logger
 *
 * Info records are written at Debug level unless debugOperations is on,
 * so a normal run only shows warnings and errors.
 */
class LoggerOperationSink : public IOperationLogSink {
public:
  explicit LoggerOperationSink(bool debugOperations = false)
      : m_debugOperations(debugOperations) {}

  void record(const OperationRecord& record) override;

  void setDebugOperations(bool enabled) { m_debugOperations = enabled; }

private:
  bool m_debugOperations;
};

/**
 * @brief Deliver a record to a sink without letting the sink fail the caller
 * @param sink Target sink, may be nullptr
 */
void emitOperation(IOperationLogSink* sink, const OperationRecord& record);

} // namespace LinkKeeper::refs
