#include "option_list.hpp"
#include <algorithm>

OptionList::OptionList(const std::vector<std::string>& options, const OptionFilter& filter, size_t start)
    : options_(options), filter_(filter) {
  refilter();
  cursor_ = std::min(start, visible_.empty() ? 0 : visible_.size() - 1);
}

void OptionList::refilter() {
  std::optional<size_t> keep = current();
  std::string text = input_.content();
  visible_.clear();
  for (size_t i = 0; i < options_.size(); ++i) {
    if (text.empty() || !filter_ || filter_(text, options_[i], i)) visible_.push_back(i);
  }
  cursor_ = 0;
  if (keep) {
    auto it = std::find(visible_.begin(), visible_.end(), *keep);
    if (it != visible_.end()) cursor_ = static_cast<size_t>(it - visible_.begin());
  }
}

bool OptionList::apply_filter_input(const InputAction& a) {
  if (!input_.apply(a)) return false;
  refilter();
  return true;
}

void OptionList::clear_filter() {
  if (input_.is_empty()) return;
  input_.clear();
  refilter();
}

void OptionList::move_up() {
  if (visible_.empty()) return;
  cursor_ = cursor_ == 0 ? visible_.size() - 1 : cursor_ - 1;
}

void OptionList::move_down() {
  if (visible_.empty()) return;
  cursor_ = cursor_ + 1 >= visible_.size() ? 0 : cursor_ + 1;
}

void OptionList::page_up(size_t page_size) {
  if (visible_.empty()) return;
  cursor_ = cursor_ >= page_size ? cursor_ - page_size : 0;
}

void OptionList::page_down(size_t page_size) {
  if (visible_.empty()) return;
  cursor_ = std::min(visible_.size() - 1, cursor_ + page_size);
}

std::optional<size_t> OptionList::current() const {
  if (cursor_ >= visible_.size()) return std::nullopt;
  return visible_[cursor_];
}
