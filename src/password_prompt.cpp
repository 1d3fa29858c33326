#include "password_prompt.hpp"
#include "input_buffer.hpp"
#include "prompt_driver.hpp"
#include "renderer.hpp"

static constexpr char32_t MASK_CHAR = U'*';

class PasswordPromptState {
public:
  using Answer = std::string;
  using InnerAction = PasswordPromptAction;

  explicit PasswordPromptState(const PasswordPrompt& p) : p_(p), mode_(p.display_mode) {}

  const std::string& message() const { return p_.message; }
  const std::string& error() const { return error_; }
  KeyConfig key_config() const { return KeyConfig{p_.config.vim_mode, p_.enable_display_toggle}; }
  std::optional<std::string> check_config() const { return std::nullopt; }

  void render(Renderer& r) const {
    if (!error_.empty()) r.print_error_message(error_);
    const std::string& msg = confirming_ ? p_.confirmation_message : p_.message;
    switch (mode_) {
      case PasswordDisplayMode::Hidden: r.print_prompt(msg, std::nullopt, std::nullopt); break;
      case PasswordDisplayMode::Masked: r.print_prompt_input(msg, std::nullopt, input_.masked(MASK_CHAR)); break;
      case PasswordDisplayMode::Full: r.print_prompt_input(msg, std::nullopt, input_); break;
    }
    if (p_.help_message) r.print_help(*p_.help_message);
  }

  void handle(const PasswordPromptAction& a) {
    switch (a.kind) {
      case PasswordPromptAction::Kind::ValueInput:
        if (input_.apply(a.input)) error_.clear();
        break;
      case PasswordPromptAction::Kind::ToggleDisplayMode:
        if (mode_ == PasswordDisplayMode::Full) mode_ = p_.display_mode == PasswordDisplayMode::Full
                                                          ? PasswordDisplayMode::Masked : p_.display_mode;
        else mode_ = PasswordDisplayMode::Full;
        break;
    }
  }

  SubmitOutcome submit() {
    std::string value = input_.content();
    if (confirming_) {
      if (value == first_) {
        answer_ = std::move(value);
        return SubmitOutcome::Accepted;
      }
      error_ = p_.confirmation_error_message;
      return SubmitOutcome::Mismatch;
    }
    Validation v = run_validators(p_.validators, value);
    if (!v.valid) {
      error_ = v.message;
      return SubmitOutcome::Rejected;
    }
    if (!p_.enable_confirmation) {
      answer_ = std::move(value);
      return SubmitOutcome::Accepted;
    }
    first_ = std::move(value);
    input_.clear();
    error_.clear();
    confirming_ = true;
    return SubmitOutcome::NextStage;
  }

  std::string answer() const { return answer_; }

  std::string format_answer(const std::string& a) const {
    return p_.formatter ? p_.formatter(a) : std::string("********");
  }

private:
  const PasswordPrompt& p_;
  PasswordDisplayMode mode_;
  InputBuffer input_;
  bool confirming_ = false;
  std::string first_;
  std::string error_;
  std::string answer_;
};

static_assert(PromptState<PasswordPromptState>, "PasswordPromptState must satisfy the driver contract");

PromptResult<std::string> PasswordPrompt::prompt(ITerminal& term) const {
  PasswordPromptState state(*this);
  return run_prompt(state, term, config.render);
}

PromptResult<std::string> PasswordPrompt::prompt() const {
  return with_default_terminal([this](ITerminal& term) { return prompt(term); });
}
