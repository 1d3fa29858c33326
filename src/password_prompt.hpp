#pragma once
/*
 * PasswordPrompt
 *
 * Purpose: masked entry, optionally re-typed once for confirmation.
 * Confirmation: validators run on the first entry only; a mismatching second
 *               entry ends the prompt with ConfirmationMismatch (no retry).
 */
#include <optional>
#include <string>
#include <vector>
#include "iterminal.hpp"
#include "prompt_config.hpp"
#include "prompt_result.hpp"

enum class PasswordDisplayMode { Hidden, Masked, Full };

struct PasswordPrompt {
  std::string message;
  std::optional<std::string> help_message;
  PasswordDisplayMode display_mode = PasswordDisplayMode::Hidden;
  bool enable_display_toggle = false;  // Ctrl-R cycles hidden/masked → full → back
  bool enable_confirmation = true;
  std::string confirmation_message = "Confirmation:";
  std::string confirmation_error_message = "The answers don't match.";
  std::vector<Validator<std::string>> validators;
  Formatter<std::string> formatter;
  PromptConfig config = PromptConfig::defaults();

  explicit PasswordPrompt(std::string msg) : message(std::move(msg)) {}

  PasswordPrompt& without_confirmation() { enable_confirmation = false; return *this; }

  PromptResult<std::string> prompt(ITerminal& term) const;
  PromptResult<std::string> prompt() const;
};
