#include "pager.hpp"
#include <algorithm>

PageWindow paginate(size_t total_len, size_t page_size, size_t cursor) {
  PageWindow w;
  if (total_len == 0 || page_size == 0) return w;
  if (cursor >= total_len) cursor = total_len - 1;
  size_t len = std::min(page_size, total_len);
  size_t start = 0;
  if (total_len > page_size) {
    size_t half = page_size / 2;
    start = cursor > half ? cursor - half : 0;
    start = std::min(start, total_len - len);
  }
  w.start = start;
  w.length = len;
  w.selection = cursor - start;
  w.first = (start == 0);
  w.last = (start + len == total_len);
  return w;
}
