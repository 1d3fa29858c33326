#include "prompt_config.hpp"
#include "cmd_registry.hpp"
#include "file_reader.hpp"
#include "debug_log.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <sstream>

RenderConfig RenderConfig::default_colored() {
  RenderConfig c;
  c.prompt_prefix = StyleSheet::with_fg(Color::Green);
  c.answer = StyleSheet::with_fg(Color::Cyan);
  c.text_input.attr = Attr::Bold;
  c.highlighted_cursor.fg = Color::Black;
  c.highlighted_cursor.bg = Color::Grey;
  c.error = StyleSheet::with_fg(Color::Red);
  c.help = StyleSheet::with_fg(Color::Cyan);
  c.selected_option = StyleSheet::with_fg(Color::Cyan);
  c.continuation = StyleSheet::with_fg(Color::DarkGrey);
  c.checked = StyleSheet::with_fg(Color::Green);
  c.canceled = StyleSheet::with_fg(Color::DarkGrey);
  return c;
}

RenderConfig RenderConfig::empty() {
  RenderConfig c;
  c.highlighted_cursor.attr = Attr::Reverse;
  return c;
}

PromptConfig PromptConfig::defaults() {
  PromptConfig cfg;
  const char* no_color = std::getenv("NO_COLOR");
  if (no_color && *no_color) cfg.render = RenderConfig::empty();
  return cfg;
}

static std::string to_lower(std::string s) {
  for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return s;
}

bool parse_color(const std::string& name, Color& out) {
  static const std::pair<const char*, Color> table[] = {
    {"default", Color::Reset}, {"reset", Color::Reset},
    {"black", Color::Black}, {"darkred", Color::DarkRed}, {"darkgreen", Color::DarkGreen},
    {"darkyellow", Color::DarkYellow}, {"darkblue", Color::DarkBlue},
    {"darkmagenta", Color::DarkMagenta}, {"darkcyan", Color::DarkCyan},
    {"grey", Color::Grey}, {"gray", Color::Grey}, {"darkgrey", Color::DarkGrey}, {"darkgray", Color::DarkGrey},
    {"red", Color::Red}, {"green", Color::Green}, {"yellow", Color::Yellow}, {"blue", Color::Blue},
    {"magenta", Color::Magenta}, {"cyan", Color::Cyan}, {"white", Color::White},
  };
  std::string v = to_lower(name);
  for (const auto& [n, c] : table) {
    if (v == n) { out = c; return true; }
  }
  return false;
}

static std::string set_on_off(const std::vector<std::string>& args, bool& flag, const char* name) {
  if (args.empty()) { flag = !flag; return ""; }
  std::string v = to_lower(args[0]);
  if (v == "on" || v == "1" || v == "true") { flag = true; return ""; }
  if (v == "off" || v == "0" || v == "false") { flag = false; return ""; }
  return std::string("set ") + name + ": use set " + name + " on|off";
}

static void register_options(CommandRegistry& registry, PromptConfig& cfg) {
  registry.register_command("set page_size", [&cfg](const std::vector<std::string>& args) -> std::string {
    if (args.empty()) return "set page_size: use set page_size=<n>";
    const std::string& s = args[0];
    bool digits = !s.empty() && std::all_of(s.begin(), s.end(), [](unsigned char c){ return std::isdigit(c) != 0; });
    if (!digits || s.size() > 6) return "set page_size: size must be a number";
    size_t n = static_cast<size_t>(std::stoul(s));
    if (n < 1) return "set page_size: size must be >= 1";
    cfg.page_size = n;
    return "";
  });
  registry.register_command("set vim_mode", [&cfg](const std::vector<std::string>& args) {
    return set_on_off(args, cfg.vim_mode, "vim_mode");
  });
  registry.register_command("set color", [&cfg](const std::vector<std::string>& args) {
    bool on = true;
    std::string m = set_on_off(args.empty() ? std::vector<std::string>{"on"} : args, on, "color");
    if (!m.empty()) return m;
    cfg.render = on ? RenderConfig::default_colored() : RenderConfig::empty();
    return std::string();
  });
  registry.register_command("set prompt_prefix", [&cfg](const std::vector<std::string>& args) -> std::string {
    if (args.empty()) return "set prompt_prefix: use set prompt_prefix <text>";
    cfg.render.prompt_prefix_text = args[0];
    cfg.render.answered_prefix_text = args[0];
    return "";
  });

  struct Role { const char* name; StyleSheet RenderConfig::* sheet; };
  static const Role roles[] = {
    {"prompt_prefix_color", &RenderConfig::prompt_prefix},
    {"answer_color", &RenderConfig::answer},
    {"default_value_color", &RenderConfig::default_value},
    {"error_color", &RenderConfig::error},
    {"help_color", &RenderConfig::help},
    {"selected_option_color", &RenderConfig::selected_option},
    {"continuation_color", &RenderConfig::continuation},
    {"checked_color", &RenderConfig::checked},
    {"canceled_color", &RenderConfig::canceled},
  };
  for (const auto& role : roles) {
    std::string name = role.name;
    auto sheet = role.sheet;
    registry.register_command("set " + name, [&cfg, name, sheet](const std::vector<std::string>& args) -> std::string {
      if (args.empty()) return "set " + name + ": use set " + name + " <color>";
      Color c;
      if (!parse_color(args[0], c)) return "set " + name + ": unknown color " + args[0];
      if (c == Color::Reset) (cfg.render.*sheet).fg.reset();
      else (cfg.render.*sheet).fg = c;
      return "";
    });
  }
}

static std::string trim(const std::string& s) {
  auto isspace_fn = [](unsigned char c){ return std::isspace(c) != 0; };
  size_t i = 0; while (i < s.size() && isspace_fn(static_cast<unsigned char>(s[i]))) i++;
  size_t j = s.size(); while (j > i && isspace_fn(static_cast<unsigned char>(s[j - 1]))) j--;
  return s.substr(i, j - i);
}

void apply_rc_lines(PromptConfig& cfg,
                    const std::vector<std::string>& lines,
                    std::vector<std::string>& messages) {
  CommandRegistry registry;
  register_options(registry, cfg);
  int lineno = 0;
  for (const std::string& raw : lines) {
    lineno++;
    std::string s = trim(raw);
    if (s.empty() || s[0] == '#' || s[0] == '"') continue;
    if (s[0] == ':') s.erase(s.begin());
    std::istringstream iss(s);
    std::string cmd; iss >> cmd;
    std::vector<std::string> args; std::string a; while (iss >> a) args.push_back(a);
    std::string m;
    if (cmd == "set" && !args.empty()) {
      std::string opt = args[0];
      std::string name = opt;
      std::string value;
      size_t eq = opt.find('=');
      if (eq != std::string::npos) {
        name = opt.substr(0, eq);
        value = opt.substr(eq + 1);
      }
      std::vector<std::string> subargs;
      if (!value.empty()) subargs.push_back(value);
      for (size_t i = 1; i < args.size(); ++i) subargs.push_back(args[i]);
      m = registry.execute("set " + name, subargs);
    } else {
      m = "unknown command: " + cmd;
    }
    if (!m.empty()) messages.push_back("line " + std::to_string(lineno) + ": " + m);
  }
}

static std::optional<std::filesystem::path> rc_path() {
  const char* env = std::getenv(MP_RC_ENV);
  if (env && *env) return std::filesystem::path(env);
  const char* home = std::getenv("HOME");
  if (!home) return std::nullopt;
  return std::filesystem::path(home) / MP_RC_FILE_NAME;
}

PromptConfig load_prompt_config(std::vector<std::string>& messages) {
  PromptConfig cfg = PromptConfig::defaults();
  auto p = rc_path();
  std::error_code ec;
  if (!p || !std::filesystem::exists(*p, ec)) return cfg;
  std::vector<std::string> lines; std::string msg;
  if (!mmap_readlines(*p, lines, msg)) {
    messages.push_back(msg);
    debug_log("config: " + msg);
    return cfg;
  }
  size_t before = messages.size();
  apply_rc_lines(cfg, lines, messages);
  for (size_t i = before; i < messages.size(); ++i) debug_log("config: " + p->string() + " " + messages[i]);
  return cfg;
}
