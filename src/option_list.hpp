#pragma once
/*
 * OptionList
 *
 * Purpose: filtered, cursor-tracked view over a prompt's option list.
 * Invariant: cursor < visible().size() whenever visible() is non-empty.
 * Note: wrap-around on up/down happens here, before paginate() sees the cursor.
 */
#include <optional>
#include <string>
#include <vector>
#include "input_buffer.hpp"
#include "pager.hpp"
#include "select_prompt.hpp"

class OptionList {
public:
  OptionList(const std::vector<std::string>& options, const OptionFilter& filter, size_t start);

  /* returns true when the filter text changed */
  bool apply_filter_input(const InputAction& a);
  void clear_filter();

  void move_up();
  void move_down();
  void page_up(size_t page_size);
  void page_down(size_t page_size);
  void move_to_start() { cursor_ = 0; }
  void move_to_end() { if (!visible_.empty()) cursor_ = visible_.size() - 1; }

  /* index into the full option list of the highlighted entry */
  std::optional<size_t> current() const;
  const std::vector<size_t>& visible() const { return visible_; }
  const InputBuffer& filter_input() const { return input_; }
  size_t cursor() const { return cursor_; }
  PageWindow window(size_t page_size) const { return paginate(visible_.size(), page_size, cursor_); }

private:
  void refilter();

  const std::vector<std::string>& options_;
  const OptionFilter& filter_;
  InputBuffer input_;
  std::vector<size_t> visible_;
  size_t cursor_ = 0;
};
