#pragma once
/*
 * HeadlessTerminal
 *
 * Purpose: scripted ITerminal for automated tests and render verification.
 * Input: queued keys; read_key() returns nullopt once the queue is drained.
 * Output: a minimal line model (cursor row + per-line text) so tests can assert
 *         what remains visible after a prompt finishes.
 */
#include <deque>
#include <string>
#include <vector>
#include "iterminal.hpp"

class HeadlessTerminal : public ITerminal {
public:
  HeadlessTerminal() = default;
  explicit HeadlessTerminal(int width) : width_(width) {}

  void push_key(const Key& k) { keys_.push_back(k); }
  void push_keys(const std::vector<Key>& ks) { keys_.insert(keys_.end(), ks.begin(), ks.end()); }
  /* one Char key per code point */
  void push_text(const std::string& utf8);
  void push_enter() { keys_.push_back(Key::of(KeyCode::Enter)); }
  void push_escape() { keys_.push_back(Key::of(KeyCode::Escape)); }
  void push_backspaces(size_t n);
  /* every write after this throws TerminalError */
  void fail_writes(bool on) { fail_writes_ = on; }

  std::optional<Key> read_key() override;
  void write(const std::string& text) override;
  void set_fg(Color) override { ++style_changes_; }
  void set_bg(Color) override { ++style_changes_; }
  void set_attr(Attr) override { ++style_changes_; }
  void reset_attrs() override { ++style_changes_; }
  void cursor_up() override;
  void cursor_horizontal_reset() override { col_ = 0; }
  void clear_current_line() override;
  void cursor_hide() override { cursor_visible_ = false; }
  void cursor_show() noexcept override { cursor_visible_ = true; }
  void flush() override { ++flushes_; }
  int width() const override { return width_; }

  /* visible lines, trailing empty line dropped */
  std::vector<std::string> screen() const;
  const std::string& transcript() const { return transcript_; }
  size_t row() const { return row_; }
  size_t pending_keys() const { return keys_.size(); }
  bool cursor_visible() const { return cursor_visible_; }
  size_t flushes() const { return flushes_; }
  size_t style_changes() const { return style_changes_; }

private:
  std::deque<Key> keys_;
  std::vector<std::string> lines_{std::string()};
  std::string transcript_;
  size_t row_ = 0;
  size_t col_ = 0;
  int width_ = 80;
  bool cursor_visible_ = true;
  bool fail_writes_ = false;
  size_t flushes_ = 0;
  size_t style_changes_ = 0;
};
