#include "LinkKeeper/refs/operation_log.hpp"

#include <exception>

namespace LinkKeeper::refs {

const char* operationTypeName(OperationType type) {
  switch (type) {
  case OperationType::FindReference:
    return "FIND_REFERENCE";
  case OperationType::UpdateReference:
    return "UPDATE_REFERENCE";
  case OperationType::UpdateDisplayText:
    return "UPDATE_DISPLAY_TEXT";
  case OperationType::Rename:
    return "RENAME";
  case OperationType::Move:
    return "MOVE";
  case OperationType::PluginError:
    return "PLUGIN_ERROR";
  }
  return "UNKNOWN";
}

void LoggerOperationSink::record(const OperationRecord& record) {
  std::string line = std::string("[") + operationTypeName(record.operation) + "] " + record.message;
  if (!record.documentPath.empty()) {
    line += " doc=" + record.documentPath;
  }
  if (!record.assetPath.empty()) {
    line += " asset=" + record.assetPath;
  }
  for (const auto& [key, value] : record.details) {
    line += " " + key + "=" + value;
  }

  core::LogLevel level = record.level;
  if (level == core::LogLevel::Info && !m_debugOperations) {
    level = core::LogLevel::Debug;
  }
  core::Logger::instance().log(level, line);
}

void emitOperation(IOperationLogSink* sink, const OperationRecord& record) {
  if (!sink) {
    return;
  }
  try {
    sink->record(record);
  } catch (const std::exception& e) {
    LINKKEEPER_LOG_WARN(std::string("Operation log sink failed: ") + e.what());
  }
}

} // namespace LinkKeeper::refs
