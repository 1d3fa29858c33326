#pragma once
/*
 * TerminfoTerminal
 *
 * Purpose: ITerminal on the controlling tty, drawing with terminfo capabilities.
 * Lifetime: constructor enters raw mode + keypad transmit; destructor restores both.
 * Note: draws inline below the shell prompt; never switches to the alternate screen.
 * Input: decodes UTF-8, control bytes, CSI/SS3 sequences; a lone ESC is resolved
 *        after MP_ESC_DELAY_MS without further bytes.
 */
#include <memory>
#include <optional>
#include <string>
#include "iterminal.hpp"
#include "posix_fd.hpp"
#include "raw_mode.hpp"
#include "terminfo.hpp"

class TerminfoTerminal : public ITerminal {
public:
  /* throws TerminalError when no terminal can be put in raw mode */
  TerminfoTerminal();
  ~TerminfoTerminal() override;
  TerminfoTerminal(const TerminfoTerminal&) = delete;
  TerminfoTerminal& operator=(const TerminfoTerminal&) = delete;

  std::optional<Key> read_key() override;
  void write(const std::string& text) override;
  void set_fg(Color c) override;
  void set_bg(Color c) override;
  void set_attr(Attr a) override;
  void reset_attrs() override;
  void cursor_up() override;
  void cursor_horizontal_reset() override;
  void clear_current_line() override;
  void cursor_hide() override;
  void cursor_show() noexcept override;
  void flush() override;
  int width() const override;

private:
  static constexpr int kEof = -1;
  static constexpr int kTimeout = -2;
  /* next byte; timeout_ms < 0 blocks */
  int read_byte(int timeout_ms);
  std::optional<Key> decode_escape();
  std::optional<Key> decode_sequence(const std::string& seq) const;
  Key decode_utf8(unsigned char lead, std::uint8_t mods);
  std::string color_sequence(Color c, bool foreground) const;
  void write_all(const std::string& bytes);

  UniqueFd tty_;
  int in_fd_ = -1;
  int out_fd_ = -1;
  std::unique_ptr<RawMode> raw_;
  TerminfoCaps caps_;
  bool terminfo_loaded_ = false;
  std::string out_;
};
