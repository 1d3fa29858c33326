#pragma once
/*
 * ConfirmPrompt
 *
 * Purpose: yes/no question parsed from typed text (y, yes, n, no; any case).
 * Note: empty input returns the default when one is set; anything else keeps
 *       the input and shows the error message.
 */
#include <optional>
#include <string>
#include "iterminal.hpp"
#include "prompt_config.hpp"
#include "prompt_result.hpp"

struct ConfirmPrompt {
  std::string message;
  std::optional<std::string> help_message;
  std::optional<bool> default_value;
  std::optional<std::string> placeholder;   // replaces the (Y/n) hint
  std::string error_message = "Invalid answer, try typing 'y' for yes or 'n' for no";
  Formatter<bool> formatter;
  PromptConfig config = PromptConfig::defaults();

  explicit ConfirmPrompt(std::string msg) : message(std::move(msg)) {}

  PromptResult<bool> prompt(ITerminal& term) const;
  PromptResult<bool> prompt() const;
};

std::optional<bool> parse_confirmation(const std::string& input);
