#include "config.hpp"
#include <cctype>
#include <cstdlib>
#include <sstream>
#include <utility>
#include "file_reader.hpp"

static bool parse_switch(const std::vector<std::string>& args, bool current, bool& out) {
  if (args.empty()) { out = !current; return true; }
  if (args[0] == "on" || args[0] == "true" || args[0] == "1") { out = true; return true; }
  if (args[0] == "off" || args[0] == "false" || args[0] == "0") { out = false; return true; }
  return false;
}

Config::Config() { register_commands(); }

void Config::register_commands() {
  auto flag = [this](const char* name, bool Settings::*field) {
    registry.register_command(std::string("set ") + name, [this, name, field](const std::vector<std::string>& args, std::string& msg) {
      bool v = false;
      if (!parse_switch(args, settings.*field, v)) { msg = std::string("set ") + name + ": use on|off"; return false; }
      settings.*field = v;
      return true;
    });
  };
  flag("center", &Settings::center);
  flag("hints", &Settings::hints);
  flag("require_slides", &Settings::require_slides);

  registry.register_command("set scroll_step", [this](const std::vector<std::string>& args, std::string& msg) {
    if (args.size() != 1) { msg = "set scroll_step: use set scroll_step <n>"; return false; }
    int n = 0;
    for (char c : args[0]) {
      if (!std::isdigit(static_cast<unsigned char>(c)) || n > 1000) { msg = "set scroll_step: not a number: " + args[0]; return false; }
      n = n * 10 + (c - '0');
    }
    if (n < 1) { msg = "set scroll_step: must be at least 1"; return false; }
    settings.scroll_step = n;
    return true;
  });
  registry.register_command("set on_error", [this](const std::vector<std::string>& args, std::string& msg) {
    if (args.size() == 1 && args[0] == "skip") { settings.on_error = MalformedPolicy::Skip; return true; }
    if (args.size() == 1 && args[0] == "abort") { settings.on_error = MalformedPolicy::Abort; return true; }
    msg = "set on_error: use skip|abort";
    return false;
  });
  registry.register_command("set extension", [this](const std::vector<std::string>& args, std::string& msg) {
    if (args.size() != 1 || args[0].empty()) { msg = "set extension: use set extension .md"; return false; }
    settings.extension = args[0][0] == '.' ? args[0] : "." + args[0];
    return true;
  });
}

bool Config::execute_line(const std::string& line, std::string& msg) {
  auto isspace_fn = [](unsigned char c){ return std::isspace(c) != 0; };
  std::string s = line;
  size_t i = 0; while (i < s.size() && isspace_fn((unsigned char)s[i])) i++;
  size_t j = s.size(); while (j > i && isspace_fn((unsigned char)s[j-1])) j--;
  s = (j > i) ? s.substr(i, j - i) : std::string();
  if (s.empty()) return true;
  if (s[0] == '#' || s[0] == '"') return true;
  if (s.size() >= 2 && s[0] == '/' && s[1] == '/') return true;
  if (s[0] == ':') s.erase(s.begin());

  std::istringstream iss(s);
  std::string cmd; iss >> cmd;
  std::vector<std::string> args; std::string a; while (iss >> a) args.push_back(a);
  std::string name = cmd;
  if (cmd == "set" && !args.empty()) {
    std::string opt = args[0];
    std::string value;
    size_t eq = opt.find('=');
    if (eq != std::string::npos) {
      value = opt.substr(eq + 1);
      opt = opt.substr(0, eq);
    }
    name = "set " + opt;
    std::vector<std::string> subargs;
    if (!value.empty()) subargs.push_back(value);
    for (size_t k = 1; k < args.size(); ++k) subargs.push_back(args[k]);
    args = std::move(subargs);
  }
  switch (registry.execute(name, args, msg)) {
    case CommandRegistry::Result::Ok: return true;
    case CommandRegistry::Result::Unknown: msg = "unknown command: " + name; return false;
    case CommandRegistry::Result::Failed: return false;
  }
  return false;
}

bool Config::load_rc(const std::filesystem::path& path, std::vector<std::string>& diagnostics) {
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) return true;
  std::string text, msg;
  if (!mmap_read_text(path, text, msg)) { diagnostics.push_back(msg); return false; }
  bool ok = true;
  int lineno = 0;
  for (const std::string& line : split_lines(text)) {
    lineno++;
    std::string m;
    if (!execute_line(line, m)) {
      diagnostics.push_back(path.string() + ":" + std::to_string(lineno) + ": " + m);
      ok = false;
    }
  }
  return ok;
}

std::optional<std::filesystem::path> default_rc_path() {
  const char* home = std::getenv("HOME");
  if (!home) return std::nullopt;
  return std::filesystem::path(home) / ".msliderc";
}
