#pragma once
/*
 * Pager
 *
 * Purpose: compute the visible window of a list (size, page size, cursor).
 * Constraint: stateless; wrap-around is the caller's job (adjust cursor first).
 * Invariant: window length == min(page_size, total); cursor inside the window.
 */
#include <cstddef>
#include <vector>

struct PageWindow {
  size_t start = 0;      // index of the first visible item in the full list
  size_t length = 0;
  size_t selection = 0;  // cursor relative to start
  bool first = true;     // window touches index 0
  bool last = true;      // window touches total - 1
};

PageWindow paginate(size_t total_len, size_t page_size, size_t cursor);

template <typename T>
struct Page {
  std::vector<T> content;
  size_t offset = 0;
  size_t selection = 0;
  bool first = true;
  bool last = true;
};

template <typename T>
Page<T> make_page(const std::vector<T>& items, size_t page_size, size_t cursor) {
  PageWindow w = paginate(items.size(), page_size, cursor);
  Page<T> p;
  p.content.assign(items.begin() + static_cast<std::ptrdiff_t>(w.start),
                   items.begin() + static_cast<std::ptrdiff_t>(w.start + w.length));
  p.offset = w.start;
  p.selection = w.selection;
  p.first = w.first;
  p.last = w.last;
  return p;
}
