#include "config.hpp"
#include "file_reader.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <sstream>
#include <vector>

static bool parse_unsigned(const std::string& s, unsigned long max, unsigned long& out) {
  if (s.empty() || s.size() > 10) return false;
  bool digits = std::all_of(s.begin(), s.end(), [](unsigned char c){ return std::isdigit(c) != 0; });
  if (!digits) return false;
  unsigned long long v = std::stoull(s);
  if (v > max) return false;
  out = static_cast<unsigned long>(v);
  return true;
}

static void register_dimension(CommandRegistry& registry, const std::string& name, unsigned& field,
                               unsigned long lo, unsigned long hi) {
  std::string usage = "set " + name + " <" + std::to_string(lo) + "-" + std::to_string(hi) + ">";
  registry.register_command("set " + name, usage, [&field, lo, hi](const std::vector<std::string>& args){
    unsigned long v = 0;
    if (args.empty() || !parse_unsigned(args[0], hi, v) || v < lo) return false;
    field = static_cast<unsigned>(v);
    return true;
  });
}

void register_config_commands(CommandRegistry& registry, GameConfig& cfg) {
  register_dimension(registry, "rows", cfg.rows, 1, MS_MAX_ROWS);
  register_dimension(registry, "cols", cfg.cols, 1, MS_MAX_COLS);
  register_dimension(registry, "mines", cfg.mines, 0, MS_MAX_ROWS * MS_MAX_COLS);
  registry.register_command("set color", "set color on|off", [&cfg](const std::vector<std::string>& args){
    if (args.empty()) { cfg.enable_color = !cfg.enable_color; return true; }
    if (args[0] == "on") { cfg.enable_color = true; return true; }
    if (args[0] == "off") { cfg.enable_color = false; return true; }
    return false;
  });
  registry.register_command("set seed", "set seed <number>", [&cfg](const std::vector<std::string>& args){
    unsigned long v = 0;
    if (args.empty() || !parse_unsigned(args[0], 0xffffffffUL, v)) return false;
    cfg.seed = static_cast<uint32_t>(v);
    return true;
  });
}

static void report(const CommandRegistry& registry, CommandRegistry::Result r,
                   const std::string& name, const std::string& unknown, std::string& msg) {
  if (r == CommandRegistry::Result::Unknown) msg = unknown;
  else if (r == CommandRegistry::Result::BadArgs) msg = name + ": use :" + registry.usage(name);
}

void apply_config_line(const CommandRegistry& registry, std::string s, std::string& msg) {
  auto isspace_fn = [](unsigned char c){ return std::isspace(c) != 0; };
  size_t i = 0; while (i < s.size() && isspace_fn((unsigned char)s[i])) i++;
  size_t j = s.size(); while (j > i && isspace_fn((unsigned char)s[j-1])) j--;
  s = (j > i) ? s.substr(i, j - i) : std::string();
  if (s.empty()) return;
  if (s[0] == '#' || s[0] == '"') return;
  if (s.size() >= 2 && s[0] == '/' && s[1] == '/') return;
  if (s[0] == ':') s.erase(s.begin());

  std::istringstream iss(s);
  std::string cmd; iss >> cmd;
  std::vector<std::string> args; std::string a; while (iss >> a) args.push_back(a);
  if (cmd == "set" && !args.empty()) {
    std::string name = args[0];
    std::vector<std::string> subargs;
    size_t eq = name.find('=');
    if (eq != std::string::npos) {
      subargs.push_back(name.substr(eq + 1));
      name = name.substr(0, eq);
    }
    subargs.insert(subargs.end(), args.begin() + 1, args.end());
    std::string full = "set " + name;
    report(registry, registry.execute(full, subargs), full, "unknown option: " + name, msg);
    return;
  }
  report(registry, registry.execute(cmd, args), cmd, "unknown command: " + cmd, msg);
}

bool load_config_file(const std::filesystem::path& path, GameConfig& cfg, std::string& msg) {
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) return true;
  std::vector<std::string> lines;
  if (!mmap_readlines(path, lines, msg)) return false;
  CommandRegistry registry;
  register_config_commands(registry, cfg);
  for (const auto& line : lines) apply_config_line(registry, line, msg);
  return true;
}

std::optional<std::filesystem::path> default_config_path() {
  const char* home = std::getenv("HOME");
  if (!home) return std::nullopt;
  return std::filesystem::path(home) / MS_RC_NAME;
}
