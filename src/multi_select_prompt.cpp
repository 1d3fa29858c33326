#include "select_prompt.hpp"
#include "option_list.hpp"
#include "prompt_driver.hpp"
#include "renderer.hpp"

class MultiSelectPromptState {
public:
  using Answer = std::vector<ListOption>;
  using InnerAction = MultiSelectPromptAction;

  explicit MultiSelectPromptState(const MultiSelectPrompt& p)
      : p_(p), list_(p.options, p.filter, p.starting_cursor), checked_(p.options.size(), false) {
    for (size_t i : p.default_selections) {
      if (i < checked_.size()) checked_[i] = true;
    }
  }

  const std::string& message() const { return p_.message; }
  const std::string& error() const { return error_; }
  KeyConfig key_config() const { return KeyConfig{p_.config.vim_mode, false}; }

  std::optional<std::string> check_config() const {
    size_t n = p_.options.size();
    if (n == 0) return std::string("available options can not be empty");
    if (p_.starting_cursor >= n)
      return "starting cursor index " + std::to_string(p_.starting_cursor) +
             " is out-of-bounds for length " + std::to_string(n) + " of options";
    for (size_t i : p_.default_selections) {
      if (i >= n) return "index " + std::to_string(i) + " is out-of-bounds for length " +
                         std::to_string(n) + " of options";
    }
    if (p_.config.page_size == 0) return std::string("page size must be greater than zero");
    return std::nullopt;
  }

  void render(Renderer& r) const {
    if (!error_.empty()) r.print_error_message(error_);
    r.print_prompt_input(p_.message, std::nullopt, list_.filter_input());
    PageWindow w = list_.window(p_.config.page_size);
    for (size_t i = 0; i < w.length; ++i) {
      size_t idx = list_.visible()[w.start + i];
      r.print_multi_option(i == w.selection, checked_[idx], p_.options[idx]);
    }
    if (p_.help_message) r.print_help(*p_.help_message);
  }

  void handle(const MultiSelectPromptAction& a) {
    using K = MultiSelectPromptAction::Kind;
    switch (a.kind) {
      case K::FilterInput: list_.apply_filter_input(a.input); break;
      case K::MoveUp: list_.move_up(); break;
      case K::MoveDown: list_.move_down(); break;
      case K::PageUp: list_.page_up(p_.config.page_size); break;
      case K::PageDown: list_.page_down(p_.config.page_size); break;
      case K::MoveToStart: list_.move_to_start(); break;
      case K::MoveToEnd: list_.move_to_end(); break;
      case K::ToggleCurrentOption:
        if (auto idx = list_.current()) {
          checked_[*idx] = !checked_[*idx];
          after_selection_change();
        }
        break;
      case K::SelectAll:
        for (size_t idx : list_.visible()) checked_[idx] = true;
        after_selection_change();
        break;
      case K::ClearSelections:
        for (size_t idx : list_.visible()) checked_[idx] = false;
        after_selection_change();
        break;
    }
  }

  SubmitOutcome submit() {
    std::vector<ListOption> selected;
    for (size_t i = 0; i < checked_.size(); ++i) {
      if (checked_[i]) selected.push_back(ListOption{i, p_.options[i]});
    }
    Validation v = run_validators(p_.validators, selected);
    if (!v.valid) {
      error_ = v.message;
      return SubmitOutcome::Rejected;
    }
    answer_ = std::move(selected);
    return SubmitOutcome::Accepted;
  }

  std::vector<ListOption> answer() const { return answer_; }

  std::string format_answer(const std::vector<ListOption>& a) const {
    if (p_.formatter) return p_.formatter(a);
    std::string out;
    for (size_t i = 0; i < a.size(); ++i) {
      if (i > 0) out += ", ";
      out += a[i].value;
    }
    return out;
  }

private:
  void after_selection_change() {
    error_.clear();
    if (!p_.keep_filter) list_.clear_filter();
  }

  const MultiSelectPrompt& p_;
  OptionList list_;
  std::vector<bool> checked_;
  std::string error_;
  std::vector<ListOption> answer_;
};

static_assert(PromptState<MultiSelectPromptState>, "MultiSelectPromptState must satisfy the driver contract");

PromptResult<std::vector<ListOption>> MultiSelectPrompt::prompt(ITerminal& term) const {
  MultiSelectPromptState state(*this);
  return run_prompt(state, term, config.render);
}

PromptResult<std::vector<ListOption>> MultiSelectPrompt::prompt() const {
  return with_default_terminal([this](ITerminal& term) { return prompt(term); });
}
