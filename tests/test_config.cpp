#include "config.hpp"
#include "file_reader.hpp"
#include <cassert>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>
#include <unistd.h>

static std::filesystem::path temp_file(const std::string& name, const std::string& content) {
  auto p = std::filesystem::temp_directory_path() / (name + "." + std::to_string(::getpid()));
  std::ofstream out(p, std::ios::binary);
  out << content;
  return p;
}

static void test_set_commands() {
  GameConfig cfg;
  std::string msg;
  CommandRegistry reg;
  register_config_commands(reg, cfg);

  apply_config_line(reg, "set rows 12", msg);
  assert(cfg.rows == 12);
  apply_config_line(reg, "  :set cols=20  ", msg);
  assert(cfg.cols == 20);
  apply_config_line(reg, "set mines 30", msg);
  assert(cfg.mines == 30);
  apply_config_line(reg, "set color off", msg);
  assert(!cfg.enable_color);
  apply_config_line(reg, "set color", msg);
  assert(cfg.enable_color);
  apply_config_line(reg, "set seed 42", msg);
  assert(cfg.seed && *cfg.seed == 42);
  assert(msg.empty());

  apply_config_line(reg, "# set rows 3", msg);
  apply_config_line(reg, "\" set rows 3", msg);
  apply_config_line(reg, "// set rows 3", msg);
  apply_config_line(reg, "", msg);
  assert(cfg.rows == 12);
  assert(msg.empty());
}

static void test_bad_values_are_reported() {
  GameConfig cfg;
  std::string msg;
  CommandRegistry reg;
  register_config_commands(reg, cfg);

  apply_config_line(reg, "set rows 0", msg);
  assert(cfg.rows == MS_DEFAULT_ROWS);
  assert(msg.rfind("set rows", 0) == 0);
  msg.clear();
  apply_config_line(reg, "set cols 100", msg);
  assert(cfg.cols == MS_DEFAULT_COLS);
  assert(!msg.empty());
  msg.clear();
  apply_config_line(reg, "set mines ten", msg);
  assert(cfg.mines == MS_DEFAULT_MINES);
  assert(!msg.empty());
  msg.clear();
  apply_config_line(reg, "set color maybe", msg);
  assert(cfg.enable_color);
  assert(msg == "set color: use :set color on|off");
  apply_config_line(reg, "set seed -1", msg);
  assert(!cfg.seed);
  assert(msg == "set seed: use :set seed <number>");
  apply_config_line(reg, "set speed 3", msg);
  assert(msg == "unknown option: speed");
  apply_config_line(reg, "quit", msg);
  assert(msg == "unknown command: quit");
}

static void test_load_file() {
  auto p = temp_file("minesweeprc_test", "# field\r\nset rows 16\r\nset cols 30\nset mines 99\nset colour on");
  GameConfig cfg;
  std::string msg;
  assert(load_config_file(p, cfg, msg));
  assert(cfg.rows == 16);
  assert(cfg.cols == 30);
  assert(cfg.mines == 99);
  assert(msg == "unknown option: colour");
  std::filesystem::remove(p);

  GameConfig untouched;
  msg.clear();
  assert(load_config_file(p, untouched, msg));
  assert(untouched.rows == MS_DEFAULT_ROWS);
  assert(msg.empty());
}

static void test_readlines() {
  std::vector<std::string> lines;
  std::string msg;
  auto p = temp_file("minesweep_lines", "a\r\n\nlast");
  assert(mmap_readlines(p, lines, msg));
  assert(lines.size() == 3);
  assert(lines[0] == "a");
  assert(lines[1].empty());
  assert(lines[2] == "last");
  std::filesystem::remove(p);

  auto empty = temp_file("minesweep_empty", "");
  assert(mmap_readlines(empty, lines, msg));
  assert(lines.empty());
  std::filesystem::remove(empty);

  assert(!mmap_readlines(empty, lines, msg));
  assert(msg.rfind("can not open file", 0) == 0);
}

int main() {
  test_set_commands();
  test_bad_values_are_reported();
  test_load_file();
  test_readlines();
  return 0;
}
