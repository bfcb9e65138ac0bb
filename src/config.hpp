#pragma once

/*here you can change the default field and the rc file name*/

#ifndef MS_DEFAULT_ROWS
#define MS_DEFAULT_ROWS 10
#endif
#ifndef MS_DEFAULT_COLS
#define MS_DEFAULT_COLS 10
#endif
#ifndef MS_DEFAULT_MINES
#define MS_DEFAULT_MINES 10
#endif

#define MS_MAX_ROWS 99
#define MS_MAX_COLS 99

#define MS_RC_NAME ".minesweeprc"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include "cmd_registry.hpp"

struct GameConfig {
  unsigned rows = MS_DEFAULT_ROWS;
  unsigned cols = MS_DEFAULT_COLS;
  unsigned mines = MS_DEFAULT_MINES;
  bool enable_color = true;
  std::optional<uint32_t> seed;
};

// Registers the "set ..." commands that write into cfg; bad values leave cfg
// unchanged.
void register_config_commands(CommandRegistry& registry, GameConfig& cfg);

// One rc line: comments/blank lines are skipped, a leading ':' is allowed.
// Unknown commands and bad values set msg.
void apply_config_line(const CommandRegistry& registry, std::string line, std::string& msg);

// Returns false only when the file exists but can not be read; msg keeps the
// last warning otherwise.
bool load_config_file(const std::filesystem::path& path, GameConfig& cfg, std::string& msg);

std::optional<std::filesystem::path> default_config_path();
