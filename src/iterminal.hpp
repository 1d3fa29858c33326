#pragma once
/*
 * ITerminal
 *
 * Purpose: abstract terminal backend (key input, styled output, line control, cursor).
 * Goal: decouple prompts from concrete impls (terminfo/headless), enable testing.
 * Errors: faults throw TerminalError; end of input is read_key() == nullopt.
 */
#include <optional>
#include <stdexcept>
#include <string>
#include "types.hpp"

class TerminalError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

class ITerminal {
public:
  virtual ~ITerminal() = default;
  virtual std::optional<Key> read_key() = 0;
  virtual void write(const std::string& text) = 0;
  virtual void set_fg(Color c) = 0;
  virtual void set_bg(Color c) = 0;
  virtual void set_attr(Attr a) = 0;
  virtual void reset_attrs() = 0;
  virtual void cursor_up() = 0;
  virtual void cursor_horizontal_reset() = 0;
  virtual void clear_current_line() = 0;
  virtual void cursor_hide() = 0;
  /* must not throw: called from destructors */
  virtual void cursor_show() noexcept = 0;
  virtual void flush() = 0;
  virtual int width() const = 0;
};
