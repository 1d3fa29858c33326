#include "confirm_prompt.hpp"
#include "input_buffer.hpp"
#include "prompt_driver.hpp"
#include "renderer.hpp"
#include <cctype>

std::optional<bool> parse_confirmation(const std::string& input) {
  std::string v;
  for (char c : input) v.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  if (v == "y" || v == "yes") return true;
  if (v == "n" || v == "no") return false;
  return std::nullopt;
}

class ConfirmPromptState {
public:
  using Answer = bool;
  using InnerAction = InputAction;

  explicit ConfirmPromptState(const ConfirmPrompt& p) : p_(p) {}

  const std::string& message() const { return p_.message; }
  const std::string& error() const { return error_; }
  KeyConfig key_config() const { return KeyConfig{p_.config.vim_mode, false}; }
  std::optional<std::string> check_config() const { return std::nullopt; }

  void render(Renderer& r) const {
    if (!error_.empty()) r.print_error_message(error_);
    r.print_prompt_input(p_.message, hint(), input_);
    if (p_.help_message) r.print_help(*p_.help_message);
  }

  void handle(const InputAction& a) {
    if (input_.apply(a)) error_.clear();
  }

  SubmitOutcome submit() {
    std::string text = input_.content();
    std::optional<bool> parsed = text.empty() ? p_.default_value : parse_confirmation(text);
    if (!parsed) {
      error_ = p_.error_message.empty() ? Validation::Invalid().message : p_.error_message;
      return SubmitOutcome::Rejected;
    }
    answer_ = *parsed;
    return SubmitOutcome::Accepted;
  }

  bool answer() const { return answer_; }

  std::string format_answer(const bool& a) const {
    if (p_.formatter) return p_.formatter(a);
    return a ? "Yes" : "No";
  }

private:
  std::optional<std::string> hint() const {
    if (p_.placeholder) return p_.placeholder;
    if (!p_.default_value) return std::string("y/n");
    return std::string(*p_.default_value ? "Y/n" : "y/N");
  }

  const ConfirmPrompt& p_;
  InputBuffer input_;
  std::string error_;
  bool answer_ = false;
};

static_assert(PromptState<ConfirmPromptState>, "ConfirmPromptState must satisfy the driver contract");

PromptResult<bool> ConfirmPrompt::prompt(ITerminal& term) const {
  ConfirmPromptState state(*this);
  return run_prompt(state, term, config.render);
}

PromptResult<bool> ConfirmPrompt::prompt() const {
  return with_default_terminal([this](ITerminal& term) { return prompt(term); });
}
