#pragma once
/*
 * Renderer
 *
 * Purpose: draw prompt frames inline below the current terminal line.
 * Dependency: draws via ITerminal to allow backend replacement.
 * Invariant: cur_line == number of rows the last frame moved down, counting rows
 *            wrapped at ITerminal::width(); reset_prompt() clears that many and zeroes it.
 * Note: columns are counted per scalar; double-width glyphs count as one.
 * Lifetime: hides the terminal cursor on construction, shows it on destruction.
 */
#include <optional>
#include <string>
#include <vector>
#include "iterminal.hpp"
#include "input_buffer.hpp"
#include "pager.hpp"
#include "prompt_config.hpp"

struct Token {
  std::string content;
  StyleSheet style;

  Token() = default;
  explicit Token(std::string c, StyleSheet s = {}) : content(std::move(c)), style(s) {}
};

class Renderer {
public:
  Renderer(ITerminal& term, const RenderConfig& cfg);
  ~Renderer();
  Renderer(const Renderer&) = delete;
  Renderer& operator=(const Renderer&) = delete;

  void reset_prompt();
  void print_tokens(const std::vector<Token>& tokens);
  void print_prompt(const std::string& prompt,
                    const std::optional<std::string>& default_value,
                    const std::optional<std::string>& content);
  void print_prompt_input(const std::string& prompt,
                          const std::optional<std::string>& default_value,
                          const InputBuffer& input);
  void print_prompt_answer(const std::string& prompt, const std::string& answer);
  void print_error_message(const std::string& message);
  void print_help(const std::string& message);
  void print_option(bool cursor, const std::string& content);
  void print_options(const Page<std::string>& page);
  void print_multi_option(bool cursor, bool checked, const std::string& content);
  void cleanup(const std::string& prompt, const std::string& answer);
  void cleanup_canceled(const std::string& prompt);
  void cleanup_failed(const std::string& prompt, const std::string& error);
  void flush();

  size_t cur_line() const { return cur_line_; }

private:
  void print_token(const Token& t);
  void print_prefix(const std::string& text);
  void new_line();
  void end_row();

  ITerminal& term_;
  RenderConfig cfg_;
  size_t cur_line_ = 0;
  size_t cur_col_ = 0;
};
