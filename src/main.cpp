#include "confirm_prompt.hpp"
#include "password_prompt.hpp"
#include "select_prompt.hpp"
#include "text_prompt.hpp"
#include <cstdio>
#include <string>
#include <vector>

template <typename T>
static bool report(const PromptResult<T>& r) {
  if (r.ok()) return true;
  std::fprintf(stderr, "%s", prompt_status_name(r.status));
  if (!r.message.empty()) std::fprintf(stderr, ": %s", r.message.c_str());
  std::fprintf(stderr, "\n");
  return false;
}

int main() {
  std::vector<std::string> messages;
  PromptConfig cfg = load_prompt_config(messages);
  for (const auto& m : messages) std::fprintf(stderr, "mpromptrc: %s\n", m.c_str());

  static const std::vector<std::string> names = {
    "Ada", "Alan", "Barbara", "Bjarne", "Dennis", "Edsger", "Grace", "Ken", "Linus", "Margaret",
  };
  TextPrompt name("What's your name?");
  name.config = cfg;
  name.help_message = "type to see suggestions";
  name.validators.push_back([](const std::string& s) {
    return s.empty() ? Validation::Invalid("name can not be empty") : Validation::Valid();
  });
  name.suggester = [](const std::string& input) {
    std::vector<std::string> out;
    if (input.empty()) return out;
    for (const auto& n : names) {
      if (default_option_filter(input, n, 0)) out.push_back(n);
    }
    return out;
  };
  auto name_r = name.prompt();
  if (!report(name_r)) return 1;

  PasswordPrompt pass("Choose a password:");
  pass.config = cfg;
  pass.display_mode = PasswordDisplayMode::Masked;
  pass.enable_display_toggle = true;
  pass.help_message = "Ctrl-R shows the password";
  pass.validators.push_back([](const std::string& s) {
    return s.size() < 4 ? Validation::Invalid("use at least 4 characters") : Validation::Valid();
  });
  auto pass_r = pass.prompt();
  if (!report(pass_r)) return 1;

  SelectPrompt lang("Favourite language?", {"C", "C++", "Go", "Haskell", "OCaml", "Python", "Rust", "Zig", "Ada", "Lisp"});
  lang.config = cfg;
  auto lang_r = lang.prompt();
  if (!report(lang_r)) return 1;

  MultiSelectPrompt tools("Which tools do you use?", {"gdb", "valgrind", "perf", "strace", "cmake", "make", "ninja"});
  tools.config = cfg;
  tools.default_selections = {4};
  tools.validators.push_back([](const std::vector<ListOption>& sel) {
    return sel.empty() ? Validation::Invalid("pick at least one") : Validation::Valid();
  });
  auto tools_r = tools.prompt();
  if (!report(tools_r)) return 1;

  ConfirmPrompt ok("Save these answers?");
  ok.config = cfg;
  ok.default_value = true;
  auto ok_r = ok.prompt();
  if (!report(ok_r)) return 1;

  std::printf("name=%s language=%s tools=%zu save=%s\n", name_r.value->c_str(),
              lang_r.value->value.c_str(), tools_r.value->size(), *ok_r.value ? "yes" : "no");
  return 0;
}
