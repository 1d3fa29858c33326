#include "select_prompt.hpp"
#include "option_list.hpp"
#include "prompt_driver.hpp"
#include "renderer.hpp"
#include <cctype>

static std::string ascii_lower(const std::string& s) {
  std::string out = s;
  for (auto& c : out) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return out;
}

bool default_option_filter(const std::string& filter, const std::string& option, size_t) {
  return ascii_lower(option).find(ascii_lower(filter)) != std::string::npos;
}

class SelectPromptState {
public:
  using Answer = ListOption;
  using InnerAction = SelectPromptAction;

  explicit SelectPromptState(const SelectPrompt& p)
      : p_(p), list_(p.options, p.filter, p.starting_cursor) {}

  const std::string& message() const { return p_.message; }
  const std::string& error() const { return error_; }
  KeyConfig key_config() const { return KeyConfig{p_.config.vim_mode, false}; }

  std::optional<std::string> check_config() const {
    if (p_.options.empty()) return std::string("available options can not be empty");
    if (p_.starting_cursor >= p_.options.size())
      return "starting cursor index " + std::to_string(p_.starting_cursor) +
             " is out-of-bounds for length " + std::to_string(p_.options.size()) + " of options";
    if (p_.config.page_size == 0) return std::string("page size must be greater than zero");
    return std::nullopt;
  }

  void render(Renderer& r) const {
    r.print_prompt_input(p_.message, std::nullopt, list_.filter_input());
    PageWindow w = list_.window(p_.config.page_size);
    Page<std::string> page;
    for (size_t i = 0; i < w.length; ++i) page.content.push_back(p_.options[list_.visible()[w.start + i]]);
    page.offset = w.start;
    page.selection = w.selection;
    page.first = w.first;
    page.last = w.last;
    r.print_options(page);
    if (p_.help_message) r.print_help(*p_.help_message);
  }

  void handle(const SelectPromptAction& a) {
    using K = SelectPromptAction::Kind;
    switch (a.kind) {
      case K::FilterInput: list_.apply_filter_input(a.input); break;
      case K::MoveUp: list_.move_up(); break;
      case K::MoveDown: list_.move_down(); break;
      case K::PageUp: list_.page_up(p_.config.page_size); break;
      case K::PageDown: list_.page_down(p_.config.page_size); break;
      case K::MoveToStart: list_.move_to_start(); break;
      case K::MoveToEnd: list_.move_to_end(); break;
    }
  }

  SubmitOutcome submit() {
    std::optional<size_t> idx = list_.current();
    if (!idx) return SubmitOutcome::Ignored;
    answer_ = ListOption{*idx, p_.options[*idx]};
    return SubmitOutcome::Accepted;
  }

  ListOption answer() const { return answer_; }

  std::string format_answer(const ListOption& a) const {
    return p_.formatter ? p_.formatter(a) : a.value;
  }

private:
  const SelectPrompt& p_;
  OptionList list_;
  std::string error_;
  ListOption answer_;
};

static_assert(PromptState<SelectPromptState>, "SelectPromptState must satisfy the driver contract");

PromptResult<ListOption> SelectPrompt::prompt(ITerminal& term) const {
  SelectPromptState state(*this);
  return run_prompt(state, term, config.render);
}

PromptResult<ListOption> SelectPrompt::prompt() const {
  return with_default_terminal([this](ITerminal& term) { return prompt(term); });
}
