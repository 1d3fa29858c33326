#include "text_prompt.hpp"
#include <algorithm>
#include "input_buffer.hpp"
#include "pager.hpp"
#include "prompt_driver.hpp"
#include "renderer.hpp"

static const char* SUGGESTION_HELP = "↑↓ to move, tab to autocomplete, enter to submit";

class TextPromptState {
public:
  using Answer = std::string;
  using InnerAction = TextPromptAction;

  explicit TextPromptState(const TextPrompt& p)
      : p_(p), input_(p.initial_value ? *p.initial_value : std::string()) {
    refresh_suggestions();
  }

  const std::string& message() const { return p_.message; }
  const std::string& error() const { return error_; }
  KeyConfig key_config() const { return KeyConfig{p_.config.vim_mode, false}; }

  std::optional<std::string> check_config() const {
    if (p_.config.page_size == 0) return std::string("page size must be greater than zero");
    return std::nullopt;
  }

  void render(Renderer& r) const {
    if (!error_.empty()) r.print_error_message(error_);
    r.print_prompt_input(p_.message, p_.default_value, input_);
    if (!suggestions_.empty()) {
      Page<std::string> page = make_page(suggestions_, p_.config.page_size, cursor_ ? *cursor_ : 0);
      if (!cursor_) page.selection = page.content.size();
      r.print_options(page);
    }
    if (p_.help_message) r.print_help(*p_.help_message);
    else if (!suggestions_.empty()) r.print_help(SUGGESTION_HELP);
  }

  void handle(const TextPromptAction& a) {
    using K = TextPromptAction::Kind;
    size_t n = suggestions_.size();
    switch (a.kind) {
      case K::ValueInput:
        if (input_.apply(a.input)) {
          error_.clear();
          refresh_suggestions();
        }
        break;
      case K::MoveToSuggestionAbove:
        if (n == 0) break;
        cursor_ = (!cursor_ || *cursor_ == 0) ? n - 1 : *cursor_ - 1;
        break;
      case K::MoveToSuggestionBelow:
        if (n == 0) break;
        cursor_ = (!cursor_ || *cursor_ + 1 >= n) ? 0 : *cursor_ + 1;
        break;
      case K::MoveToSuggestionPageUp:
        if (n == 0) break;
        cursor_ = (!cursor_ || *cursor_ < p_.config.page_size) ? 0 : *cursor_ - p_.config.page_size;
        break;
      case K::MoveToSuggestionPageDown:
        if (n == 0) break;
        cursor_ = std::min(n - 1, (cursor_ ? *cursor_ : 0) + p_.config.page_size);
        break;
      case K::UseCurrentSuggestion:
        if (n == 0) break;
        input_.set_content(suggestions_[cursor_ ? *cursor_ : 0]);
        error_.clear();
        refresh_suggestions();
        break;
    }
  }

  SubmitOutcome submit() {
    std::string value = cursor_ && *cursor_ < suggestions_.size() ? suggestions_[*cursor_] : input_.content();
    if (value.empty() && p_.default_value) value = *p_.default_value;
    Validation v = run_validators(p_.validators, value);
    if (!v.valid) {
      error_ = v.message;
      return SubmitOutcome::Rejected;
    }
    answer_ = std::move(value);
    return SubmitOutcome::Accepted;
  }

  std::string answer() const { return answer_; }

  std::string format_answer(const std::string& a) const {
    return p_.formatter ? p_.formatter(a) : a;
  }

private:
  void refresh_suggestions() {
    cursor_.reset();
    suggestions_.clear();
    if (p_.suggester) suggestions_ = p_.suggester(input_.content());
  }

  const TextPrompt& p_;
  InputBuffer input_;
  std::vector<std::string> suggestions_;
  std::optional<size_t> cursor_;
  std::string error_;
  std::string answer_;
};

static_assert(PromptState<TextPromptState>, "TextPromptState must satisfy the driver contract");

PromptResult<std::string> TextPrompt::prompt(ITerminal& term) const {
  TextPromptState state(*this);
  return run_prompt(state, term, config.render);
}

PromptResult<std::string> TextPrompt::prompt() const {
  return with_default_terminal([this](ITerminal& term) { return prompt(term); });
}
