#pragma once
/*
 * TextPrompt
 *
 * Purpose: free-text question; optional default, initial value, validators
 *          and a suggestion list navigated with the arrow keys.
 * Answer: the typed text, or the default when the input is left empty.
 */
#include <functional>
#include <optional>
#include <string>
#include <vector>
#include "iterminal.hpp"
#include "prompt_config.hpp"
#include "prompt_result.hpp"

using Suggester = std::function<std::vector<std::string>(const std::string& input)>;

struct TextPrompt {
  std::string message;
  std::optional<std::string> help_message;
  std::optional<std::string> default_value;
  std::optional<std::string> initial_value;
  std::vector<Validator<std::string>> validators;
  Formatter<std::string> formatter;
  Suggester suggester;
  PromptConfig config = PromptConfig::defaults();

  explicit TextPrompt(std::string msg) : message(std::move(msg)) {}

  PromptResult<std::string> prompt(ITerminal& term) const;
  PromptResult<std::string> prompt() const;
};
