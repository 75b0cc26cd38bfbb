/**
 * @file vault_tool.cpp
 * @brief VaultTool implementation
 */

#include "LinkKeeper/editor/vault_tool.hpp"
#include "LinkKeeper/core/logger.hpp"
#include "LinkKeeper/editor/reference_edit_service.hpp"
#include "LinkKeeper/editor/reference_service.hpp"
#include "LinkKeeper/editor/vault_corpus.hpp"
#include "LinkKeeper/refs/link_resolver.hpp"
#include "LinkKeeper/refs/link_syntax.hpp"
#include "LinkKeeper/refs/markdown_structure_scanner.hpp"
#include "LinkKeeper/refs/operation_log.hpp"
#include "LinkKeeper/refs/vault_path.hpp"

#include <charconv>
#include <iostream>
#include <set>

namespace LinkKeeper::editor {

namespace {

struct CommandSpec {
  const char* name;
  ToolCommand command;
  usize arity;
};

constexpr CommandSpec kCommands[] = {
    {"find", ToolCommand::Find, 2},
    {"refs", ToolCommand::Refs, 2},
    {"rename", ToolCommand::Rename, 3},
    {"edit", ToolCommand::Edit, 4},
};

const CommandSpec* findCommand(ToolCommand command) {
  for (const auto& spec : kCommands) {
    if (spec.command == command) {
      return &spec;
    }
  }
  return nullptr;
}

std::optional<u32> parseLineNumber(const std::string& text) {
  u32 value = 0;
  auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
  if (ec != std::errc() || ptr != text.data() + text.size() || value == 0) {
    return std::nullopt;
  }
  return value;
}

} // namespace

std::string ToolError::format() const {
  std::string result = "[" + code + "] " + message;
  if (!details.empty()) {
    result += "\nDetails: " + details;
  }
  if (!suggestion.empty()) {
    result += "\nSuggestion: " + suggestion;
  }
  return result;
}

VaultTool::VaultTool(IFileSystem& fileSystem) : VaultTool(fileSystem, std::cout) {}

VaultTool::VaultTool(IFileSystem& fileSystem, std::ostream& out)
    : m_fileSystem(fileSystem), m_out(out) {}

VaultTool::~VaultTool() = default;

// ============================================================================
// Argument parsing
// ============================================================================

ToolOptions VaultTool::parseArgs(int argc, char* argv[]) {
  std::vector<std::string> args;
  for (int i = 1; i < argc; ++i) {
    args.emplace_back(argv[i]);
  }
  return parseArgs(args);
}

ToolOptions VaultTool::parseArgs(const std::vector<std::string>& args) {
  ToolOptions opts;
  bool commandSeen = false;

  auto setError = [&opts](const std::string& message) {
    if (opts.parseError.empty()) {
      opts.parseError = message;
    }
  };

  for (usize i = 0; i < args.size(); ++i) {
    const std::string& arg = args[i];
    const bool hasValue = i + 1 < args.size();

    if (arg == "-h" || arg == "--help") {
      opts.help = true;
    } else if (arg == "--version") {
      opts.version = true;
    } else if (arg == "--verbose" || arg == "-v") {
      opts.verbose = true;
    } else if (arg == "--no-hints") {
      opts.noHints = true;
    } else if (arg == "--config") {
      if (hasValue) {
        opts.configOverride = args[++i];
      } else {
        setError("--config needs a file path");
      }
    } else if (arg == "--text") {
      if (hasValue) {
        opts.text = args[++i];
      } else {
        setError("--text needs a caption");
      }
    } else if (arg == "--size") {
      if (hasValue) {
        opts.size = args[++i];
      } else {
        setError("--size needs a value such as 800 or 800x600");
      }
    } else if (arg.size() > 1 && arg.front() == '-') {
      setError("Unknown option: " + arg);
    } else if (!commandSeen) {
      commandSeen = true;
      for (const auto& spec : kCommands) {
        if (arg == spec.name) {
          opts.command = spec.command;
        }
      }
      if (opts.command == ToolCommand::None) {
        setError("Unknown command: " + arg);
      }
    } else {
      opts.arguments.push_back(arg);
    }
  }

  if (opts.command != ToolCommand::None) {
    const CommandSpec* spec = findCommand(opts.command);
    if (opts.arguments.size() != spec->arity) {
      setError(std::string(spec->name) + " expects " + std::to_string(spec->arity) +
               " argument(s), got " + std::to_string(opts.arguments.size()));
    }
  }
  if ((opts.text || opts.size) && opts.command != ToolCommand::Edit) {
    setError("--text and --size only apply to the edit command");
  }

  return opts;
}

void VaultTool::printVersion(std::ostream& out) {
  out << "linkkeeper version " << LINKKEEPER_VERSION_STRING << "\n";
  out << "Keeps image links intact when assets are renamed or moved\n";
}

void VaultTool::printHelp(std::ostream& out, const char* programName) {
  out << "Usage: " << programName << " <command> <vault> [arguments] [options]\n\n";
  out << "Commands:\n";
  out << "  find <vault> <asset>                 List every link to an asset\n";
  out << "  refs <vault> <asset>                 List notes embedding an asset\n";
  out << "  rename <vault> <old> <new>           Move an asset and rewrite its links\n";
  out << "  edit <vault> <note> <line> <asset>   Change caption/size of one link\n\n";
  out << "Options:\n";
  out << "  --config <path>   Extra configuration file (JSON)\n";
  out << "  --text <caption>  New caption for edit (\"\" removes it)\n";
  out << "  --size <W|WxH>    New size for edit\n";
  out << "  --no-hints        Ignore document structure, scan text only\n";
  out << "  -v, --verbose     Verbose logging\n";
  out << "  -h, --help        Show this help message\n";
  out << "  --version         Show version information\n\n";
  out << "Asset and note paths are relative to the vault root.\n";
  out << "Per-vault settings are read from <vault>/" << runtime::ConfigManager::VAULT_CONFIG_FILE
      << "\n";
}

// ============================================================================
// Running
// ============================================================================

i32 VaultTool::run(int argc, char* argv[]) {
  ToolOptions options = parseArgs(argc, argv);
  if (options.help) {
    printHelp(m_out, argc > 0 ? argv[0] : "linkkeeper");
    return ExitOk;
  }
  return run(options);
}

i32 VaultTool::run(const ToolOptions& options) {
  m_options = options;

  if (m_options.help) {
    printHelp(m_out, "linkkeeper");
    return ExitOk;
  }
  if (m_options.version) {
    printVersion(m_out);
    return ExitOk;
  }
  if (!m_options.parseError.empty()) {
    return fail("USAGE", m_options.parseError, "", "Run with --help for usage");
  }
  if (m_options.command == ToolCommand::None) {
    return fail("USAGE", "No command given", "", "Run with --help for usage");
  }

  const std::string& vaultPath = m_options.arguments.front();
  if (!m_fileSystem.directoryExists(vaultPath)) {
    return fail("NO_VAULT", "Vault directory does not exist", vaultPath,
                "Pass the folder that contains your notes");
  }

  auto result = initializeConfig(vaultPath);
  if (result.isError()) {
    return fail("CONFIG", "Failed to load configuration", result.error(),
                "Check that the configuration file is valid JSON");
  }

  result = initializeLogging();
  if (result.isError()) {
    return fail("LOGGING", "Failed to initialize logging", result.error(),
                "Check logging.file in the configuration");
  }

  initializeServices(vaultPath);

  switch (m_options.command) {
  case ToolCommand::Find:
    return runFind();
  case ToolCommand::Refs:
    return runRefs();
  case ToolCommand::Rename:
    return runRename();
  case ToolCommand::Edit:
    return runEdit();
  case ToolCommand::None:
    break;
  }
  return ExitFailure;
}

Result<void> VaultTool::initializeConfig(const std::string& vaultPath) {
  auto result = m_configManager.initialize(vaultPath);
  if (result.isError()) {
    return result;
  }

  std::optional<std::string> overridePath;
  if (!m_options.configOverride.empty()) {
    overridePath = m_options.configOverride;
  }
  return m_configManager.loadConfig(overridePath);
}

Result<void> VaultTool::initializeLogging() {
  auto& logger = core::Logger::instance();
  const auto& settings = m_configManager.getConfig().logging;

  if (m_options.verbose) {
    logger.setLevel(core::LogLevel::Debug);
  } else {
    logger.setLevel(core::parseLogLevel(settings.level).value_or(core::LogLevel::Info));
  }

  if (!settings.file.empty() && !logger.setOutputFile(settings.file)) {
    return Result<void>::error("Cannot open log file: " + settings.file);
  }
  return Result<void>::ok();
}

void VaultTool::initializeServices(const std::string& vaultPath) {
  const auto& config = m_configManager.getConfig();

  m_corpus = std::make_unique<VaultCorpus>(m_fileSystem, vaultPath, config);
  m_resolver = std::make_unique<refs::VaultLinkResolver>(m_corpus->listAllFiles());

  if (config.scan.useStructuralHints && !m_options.noHints) {
    m_hints = std::make_unique<refs::MarkdownStructureScanner>();
  } else {
    m_hints = std::make_unique<refs::NullHintProvider>();
  }

  m_logSink = std::make_unique<refs::LoggerOperationSink>(config.logging.debugOperations ||
                                                          m_options.verbose);
  m_service =
      std::make_unique<ReferenceService>(*m_corpus, *m_resolver, *m_hints, m_logSink.get());
  m_service->applyConfig(config);

  LINKKEEPER_LOG_DEBUG("Vault " + m_corpus->vaultRoot() + ": " +
                       std::to_string(m_resolver->fileCount()) + " file(s)");
}

// ============================================================================
// Commands
// ============================================================================

i32 VaultTool::runFind() {
  auto asset = vaultPathArgument(m_options.arguments[1], "asset");
  if (asset.isError()) {
    return fail("BAD_PATH", asset.error());
  }
  if (!m_resolver->contains(asset.value())) {
    LINKKEEPER_LOG_WARN("Asset " + asset.value() + " is not in the vault");
  }

  auto occurrences = m_service->findReferences(refs::AssetIdentity(asset.value()));
  std::set<std::string> documents;
  for (const auto& occurrence : occurrences) {
    documents.insert(occurrence.file);
    m_out << occurrence.file << ":" << occurrence.line + 1 << ":" << occurrence.startCol + 1
          << ": " << occurrence.rawMatch << "\n";
  }
  m_out << occurrences.size() << " reference(s) in " << documents.size() << " note(s)\n";

  return m_service->finder().lastStatistics().documentsFailed > 0 ? ExitPartialFailure : ExitOk;
}

i32 VaultTool::runRefs() {
  auto asset = vaultPathArgument(m_options.arguments[1], "asset");
  if (asset.isError()) {
    return fail("BAD_PATH", asset.error());
  }

  auto documents = m_service->findReferencingDocuments(refs::AssetIdentity(asset.value()));
  for (const auto& document : documents) {
    m_out << document.documentPath << "\t#" << document.ordinal + 1 << "\tline "
          << document.line + 1 << "\n";
  }
  m_out << documents.size() << " note(s) embed " << asset.value() << "\n";

  return m_service->finder().lastStatistics().documentsFailed > 0 ? ExitPartialFailure : ExitOk;
}

i32 VaultTool::runRename() {
  auto oldPath = vaultPathArgument(m_options.arguments[1], "old asset");
  if (oldPath.isError()) {
    return fail("BAD_PATH", oldPath.error());
  }

  auto newPath = refs::PathValidator::validateAndSanitize(m_options.arguments[2]);
  if (!newPath || newPath->empty()) {
    return fail("INVALID_NAME", "Invalid target path", m_options.arguments[2],
                "Avoid <>:\"|?* and reserved names such as CON or NUL");
  }

  const auto& config = m_configManager.getConfig();
  if (!config.isAsset(oldPath.value())) {
    return fail("NOT_ASSET", "Not an asset: " + oldPath.value(), "",
                "Add the extension to assets.extensions in the configuration");
  }

  const std::string oldAbsolute = m_corpus->absolutePath(oldPath.value());
  const std::string newAbsolute = m_corpus->absolutePath(*newPath);
  if (!m_fileSystem.fileExists(oldAbsolute)) {
    return fail("NOT_FOUND", "Asset does not exist", oldAbsolute);
  }
  if (m_fileSystem.fileExists(newAbsolute)) {
    return fail("EXISTS", "Target already exists", newAbsolute,
                "Pick another name or remove the existing file first");
  }

  const std::string newFolder = m_fileSystem.getParentDirectory(newAbsolute);
  if (!newFolder.empty() && !m_fileSystem.directoryExists(newFolder) &&
      !m_fileSystem.createDirectories(newFolder)) {
    return fail("MOVE", "Cannot create folder", newFolder);
  }

  auto moved = m_fileSystem.moveFile(oldAbsolute, newAbsolute);
  if (moved.isError()) {
    return fail("MOVE", "Failed to move asset", moved.error());
  }
  m_resolver->renameFile(oldPath.value(), *newPath);

  auto result = m_service->handleRename(oldPath.value(), *newPath);
  for (const auto& outcome : result.outcomes) {
    switch (outcome.status) {
    case refs::FileRewriteStatus::Updated:
      m_out << "updated " << outcome.documentPath << " (" << outcome.occurrencesRewritten
            << " link(s))\n";
      break;
    case refs::FileRewriteStatus::ReadFailed:
    case refs::FileRewriteStatus::WriteFailed:
      m_out << refs::fileRewriteStatusName(outcome.status) << " " << outcome.documentPath << ": "
            << outcome.error << "\n";
      break;
    case refs::FileRewriteStatus::Unchanged:
      break;
    }
  }
  m_out << "Renamed " << oldPath.value() << " -> " << *newPath << ": "
        << result.occurrencesRewritten << " link(s) in " << result.updatedFileCount
        << " note(s)\n";

  return result.failedFileCount() > 0 ? ExitPartialFailure : ExitOk;
}

i32 VaultTool::runEdit() {
  auto note = vaultPathArgument(m_options.arguments[1], "note");
  if (note.isError()) {
    return fail("BAD_PATH", note.error());
  }
  auto line = parseLineNumber(m_options.arguments[2]);
  if (!line) {
    return fail("USAGE", "Line must be a positive number", m_options.arguments[2]);
  }
  auto asset = vaultPathArgument(m_options.arguments[3], "asset");
  if (asset.isError()) {
    return fail("BAD_PATH", asset.error());
  }
  if (!m_options.text && !m_options.size) {
    return fail("USAGE", "Nothing to edit", "", "Pass --text and/or --size");
  }

  std::optional<u32> width;
  std::optional<u32> height;
  if (m_options.size) {
    u32 w = 0;
    if (!refs::parseSizeSegment(*m_options.size, w, height)) {
      return fail("USAGE", "Invalid size: " + *m_options.size, "", "Use W or WxH, e.g. 800x600");
    }
    width = w;
  }

  ReferenceEditService editService(*m_corpus, *m_resolver, m_logSink.get());
  auto outcome = editService.editOccurrence(note.value(), *line - 1,
                                            refs::AssetIdentity(asset.value()), m_options.text,
                                            width, height);
  if (outcome.isError()) {
    return fail("EDIT", "Failed to edit link", outcome.error());
  }

  if (outcome.value().changed()) {
    m_out << "- " << outcome.value().oldLine << "\n";
    m_out << "+ " << outcome.value().newLine << "\n";
  } else {
    m_out << "Link already up to date\n";
  }
  return ExitOk;
}

// ============================================================================
// Helpers
// ============================================================================

Result<std::string> VaultTool::vaultPathArgument(const std::string& argument,
                                                 const char* what) const {
  auto normalized = refs::normalizeVaultPath(argument);
  if (!normalized || normalized->empty()) {
    return Result<std::string>::error(std::string("Invalid ") + what + " path: " + argument);
  }
  return Result<std::string>::ok(*normalized);
}

i32 VaultTool::fail(const std::string& code, const std::string& message,
                    const std::string& details, const std::string& suggestion) {
  m_lastError = ToolError{code, message, details, suggestion};
  LINKKEEPER_LOG_DEBUG("[Tool] " + m_lastError.format());
  if (m_onError) {
    m_onError(m_lastError);
  }
  return ExitFailure;
}

} // namespace LinkKeeper::editor
