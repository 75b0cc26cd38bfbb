/**
 * @file linkkeeper_main.cpp
 * @brief linkkeeper command-line tool - Main Entry Point
 *
 * Usage:
 *   linkkeeper find ~/Notes attachments/photo.png
 *   linkkeeper rename ~/Notes attachments/photo.png trips/2024/photo.png
 *   linkkeeper edit ~/Notes trips/rome.md 12 trips/2024/photo.png --text "Rome" --size 800
 *   linkkeeper --help
 */

#include "LinkKeeper/editor/interfaces/QtFileSystem.hpp"
#include "LinkKeeper/editor/vault_tool.hpp"

#include <iostream>

namespace {

int runVaultTool(int argc, char* argv[]) {
  LinkKeeper::editor::QtFileSystem fileSystem;
  LinkKeeper::editor::VaultTool tool(fileSystem);

  tool.setOnError([](const LinkKeeper::editor::ToolError& error) {
    std::cerr << "Error: " << error.message << "\n";
    if (!error.details.empty()) {
      std::cerr << "  " << error.details << "\n";
    }
    if (!error.suggestion.empty()) {
      std::cerr << "Hint: " << error.suggestion << "\n";
    }
  });

  return tool.run(argc, argv);
}

} // namespace

int main(int argc, char* argv[]) {
  return runVaultTool(argc, argv);
}
