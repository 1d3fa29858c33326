#pragma once
/*
 * SelectPrompt / MultiSelectPrompt
 *
 * Purpose: choose one (or several) entries of a non-empty option list.
 * Behavior: typing filters the list; arrows (and j/k in vim mode) move with
 *           wrap-around; the visible window comes from paginate().
 * Config errors: empty list, out-of-range starting cursor or default selection.
 */
#include <functional>
#include <optional>
#include <string>
#include <vector>
#include "iterminal.hpp"
#include "prompt_config.hpp"
#include "prompt_result.hpp"

using OptionFilter = std::function<bool(const std::string& filter, const std::string& option, size_t index)>;

/* case-insensitive (ASCII) substring match */
bool default_option_filter(const std::string& filter, const std::string& option, size_t index);

struct SelectPrompt {
  std::string message;
  std::vector<std::string> options;
  std::optional<std::string> help_message = std::string("↑↓ to move, enter to select, type to filter");
  size_t starting_cursor = 0;
  OptionFilter filter = default_option_filter;
  Formatter<ListOption> formatter;
  PromptConfig config = PromptConfig::defaults();

  SelectPrompt(std::string msg, std::vector<std::string> opts)
      : message(std::move(msg)), options(std::move(opts)) {}

  PromptResult<ListOption> prompt(ITerminal& term) const;
  PromptResult<ListOption> prompt() const;
};

struct MultiSelectPrompt {
  std::string message;
  std::vector<std::string> options;
  std::vector<size_t> default_selections;
  std::optional<std::string> help_message =
      std::string("↑↓ to move, space to select one, → to all, ← to none, type to filter");
  size_t starting_cursor = 0;
  bool keep_filter = true;   // false: clear the filter after each toggle
  OptionFilter filter = default_option_filter;
  std::vector<Validator<std::vector<ListOption>>> validators;
  Formatter<std::vector<ListOption>> formatter;
  PromptConfig config = PromptConfig::defaults();

  MultiSelectPrompt(std::string msg, std::vector<std::string> opts)
      : message(std::move(msg)), options(std::move(opts)) {}

  PromptResult<std::vector<ListOption>> prompt(ITerminal& term) const;
  PromptResult<std::vector<ListOption>> prompt() const;
};
