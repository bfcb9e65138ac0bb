#include "terminal.hpp"
#include "ncurses_terminal.hpp"
#include "app.hpp"
#include "config.hpp"
#include <filesystem>
#include <iostream>
#include <optional>
#include <utility>
#include <unistd.h>

int main(int argc, char** argv) {
  if (!isatty(STDOUT_FILENO)) {
    std::cerr << "minesweep: stdout is not a terminal\n";
    return 1;
  }
  std::optional<std::filesystem::path> rc;
  if (argc >= 2) rc = std::filesystem::path(argv[1]);
  else rc = default_config_path();

  GameConfig cfg;
  std::string message;
  if (rc && !load_config_file(*rc, cfg, message)) {
    std::cerr << "minesweep: " << message << "\n";
    return 1;
  }
  std::string err;
  auto game = GameSession::create(cfg, err);
  if (!game) {
    std::cerr << "minesweep: " << err << "\n";
    return 1;
  }

  Terminal term;
  NcursesTerminal backend;
  App app(backend, std::move(*game), cfg.enable_color);
  app.message = message;
  app.run();
  return 0;
}
