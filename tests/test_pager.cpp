#include "pager.hpp"
#include <algorithm>
#include <cassert>
#include <string>
#include <vector>

int main() {
  // list shorter than a page
  PageWindow w = paginate(3, 7, 2);
  assert(w.start == 0 && w.length == 3 && w.selection == 2);
  assert(w.first && w.last);

  w = paginate(12, 5, 0);
  assert(w.start == 0 && w.length == 5 && w.selection == 0);
  assert(w.first && !w.last);

  w = paginate(12, 5, 11);
  assert(w.start == 7 && w.length == 5 && w.selection == 4);
  assert(!w.first && w.last);

  // cursor stays centered mid-list
  w = paginate(12, 5, 6);
  assert(w.start == 4 && w.selection == 2);
  assert(!w.first && !w.last);

  w = paginate(0, 5, 0);
  assert(w.length == 0);

  // every cursor lands inside its window
  for (size_t total = 1; total < 20; ++total) {
    for (size_t page = 1; page < 9; ++page) {
      for (size_t c = 0; c < total; ++c) {
        PageWindow p = paginate(total, page, c);
        assert(p.length == std::min(page, total));
        assert(p.selection < p.length);
        assert(p.start + p.selection == c);
        assert(p.first == (p.start == 0));
        assert(p.last == (p.start + p.length == total));
      }
    }
  }

  std::vector<std::string> items = {"a", "b", "c", "d", "e", "f"};
  Page<std::string> pg = make_page(items, 3, 5);
  assert(pg.content.size() == 3);
  assert(pg.content[0] == "d" && pg.content[2] == "f");
  assert(pg.offset == 3 && pg.selection == 2);
  assert(!pg.first && pg.last);
  return 0;
}
