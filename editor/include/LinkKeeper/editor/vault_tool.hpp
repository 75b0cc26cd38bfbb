#pragma once

/**
 * @file vault_tool.hpp
 * @brief Command-line front-end for the reference tracking core
 *
 * Commands:
 * - find <vault> <asset>                    list every link to an asset
 * - refs <vault> <asset>                    list notes embedding an asset
 * - rename <vault> <old> <new>              move an asset and rewrite links
 * - edit <vault> <note> <line> <asset>      change caption/size of one link
 *        [--text <caption>] [--size <W|WxH>]
 *
 * Configuration is read from <vault>/.linkkeeper.json and the file given
 * with --config.
 */

#include "LinkKeeper/core/result.hpp"
#include "LinkKeeper/core/types.hpp"
#include "LinkKeeper/editor/interfaces/IFileSystem.hpp"
#include "LinkKeeper/runtime/config_manager.hpp"

#include <functional>
#include <iosfwd>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace LinkKeeper::refs {
class VaultLinkResolver;
class IStructuralHintProvider;
class LoggerOperationSink;
} // namespace LinkKeeper::refs

namespace LinkKeeper::editor {

class VaultCorpus;
class ReferenceService;

enum class ToolCommand { None, Find, Refs, Rename, Edit };

/**
 * @brief Parsed command line
 */
struct ToolOptions {
  ToolCommand command = ToolCommand::None;
  std::vector<std::string> arguments; // positional arguments after the command
  std::string configOverride;         // --config <path>
  std::optional<std::string> text;    // --text <caption>
  std::optional<std::string> size;    // --size <W|WxH>
  bool noHints = false;               // --no-hints
  bool verbose = false;               // --verbose
  bool help = false;                  // --help
  bool version = false;               // --version
  std::string parseError;             // first problem found while parsing
};

/**
 * @brief Error reported to the user
 */
struct ToolError {
  std::string code;
  std::string message;
  std::string details;
  std::string suggestion;

  [[nodiscard]] std::string format() const;
};

/**
 * @brief Exit codes of the CLI
 */
enum ToolExitCode : i32 {
  ExitOk = 0,
  ExitFailure = 1,       // nothing was done
  ExitPartialFailure = 2 // some documents could not be read or written
};

using OnToolError = std::function<void(const ToolError&)>;

class VaultTool {
public:
  explicit VaultTool(IFileSystem& fileSystem);
  VaultTool(IFileSystem& fileSystem, std::ostream& out);
  ~VaultTool();

  VaultTool(const VaultTool&) = delete;
  VaultTool& operator=(const VaultTool&) = delete;

  /**
   * @brief Parse arguments (argv[0] is skipped)
   */
  [[nodiscard]] static ToolOptions parseArgs(int argc, char* argv[]);
  [[nodiscard]] static ToolOptions parseArgs(const std::vector<std::string>& args);

  /**
   * @brief Parse and execute
   * @return Process exit code
   */
  i32 run(int argc, char* argv[]);
  i32 run(const ToolOptions& options);

  void setOnError(OnToolError callback) { m_onError = std::move(callback); }
  [[nodiscard]] const ToolError& getLastError() const { return m_lastError; }

  static void printHelp(std::ostream& out, const char* programName);
  static void printVersion(std::ostream& out);

private:
  Result<void> initializeConfig(const std::string& vaultPath);
  Result<void> initializeLogging();
  void initializeServices(const std::string& vaultPath);

  i32 runFind();
  i32 runRefs();
  i32 runRename();
  i32 runEdit();

  [[nodiscard]] Result<std::string> vaultPathArgument(const std::string& argument,
                                                      const char* what) const;

  i32 fail(const std::string& code, const std::string& message,
           const std::string& details = "", const std::string& suggestion = "");

  IFileSystem& m_fileSystem;
  std::ostream& m_out;
  ToolOptions m_options;
  ToolError m_lastError;
  OnToolError m_onError;

  runtime::ConfigManager m_configManager;
  std::unique_ptr<VaultCorpus> m_corpus;
  std::unique_ptr<refs::VaultLinkResolver> m_resolver;
  std::unique_ptr<refs::IStructuralHintProvider> m_hints;
  std::unique_ptr<refs::LoggerOperationSink> m_logSink;
  std::unique_ptr<ReferenceService> m_service;
};

} // namespace LinkKeeper::editor
