#include "prompt_config.hpp"
#include "cmd_registry.hpp"
#include "file_reader.hpp"
#include <cassert>
#include <cstdio>
#include <cstdlib>
#include <unistd.h>
#include <string>
#include <vector>

int main() {
  Color c;
  assert(parse_color("Red", c) && c == Color::Red);
  assert(parse_color("darkgray", c) && c == Color::DarkGrey);
  assert(!parse_color("octarine", c));

  CommandRegistry reg;
  int calls = 0;
  reg.register_command("set x", [&calls](const std::vector<std::string>& args) {
    calls++;
    return args.empty() ? std::string("empty") : std::string();
  });
  assert(reg.contains("set x") && !reg.contains("set y"));
  assert(reg.execute("set x", {"1"}).empty());
  assert(reg.execute("set x", {}) == "empty");
  assert(reg.execute("set y", {}) == "unknown command: set y");
  assert(calls == 2);

  {
    PromptConfig cfg;
    std::vector<std::string> msgs;
    apply_rc_lines(cfg, {
      "# comment",
      "\" vim style comment",
      "",
      "set page_size=3",
      "  set vim_mode on  ",
      "set error_color blue",
      "set prompt_prefix >",
    }, msgs);
    assert(msgs.empty());
    assert(cfg.page_size == 3);
    assert(cfg.vim_mode);
    assert(cfg.render.error.fg == Color::Blue);
    assert(cfg.render.prompt_prefix_text == ">");
    assert(cfg.render.answered_prefix_text == ">");
  }
  {
    // bad lines are reported and skipped; later lines still apply
    PromptConfig cfg;
    std::vector<std::string> msgs;
    apply_rc_lines(cfg, {
      "set page_size=0",
      "set page_size=abc",
      "frobnicate",
      "set nope on",
      "set vim_mode maybe",
      "set help_color octarine",
      "set page_size=9",
    }, msgs);
    assert(msgs.size() == 6);
    assert(msgs[0] == "line 1: set page_size: size must be >= 1");
    assert(msgs[1] == "line 2: set page_size: size must be a number");
    assert(msgs[2] == "line 3: unknown command: frobnicate");
    assert(msgs[3] == "line 4: unknown command: set nope");
    assert(msgs[4] == "line 5: set vim_mode: use set vim_mode on|off");
    assert(msgs[5] == "line 6: set help_color: unknown color octarine");
    assert(cfg.page_size == 9);
    assert(!cfg.vim_mode);
  }
  {
    PromptConfig cfg;
    std::vector<std::string> msgs;
    apply_rc_lines(cfg, {"set color off"}, msgs);
    assert(!cfg.render.prompt_prefix.fg);
    assert(cfg.render.highlighted_cursor.attr == Attr::Reverse);
    apply_rc_lines(cfg, {"set color on", "set answer_color default"}, msgs);
    assert(cfg.render.prompt_prefix.fg == Color::Green);
    assert(!cfg.render.answer.fg);
    assert(msgs.empty());
  }
  {
    setenv("NO_COLOR", "1", 1);
    PromptConfig cfg = PromptConfig::defaults();
    assert(!cfg.render.error.fg);
    assert(cfg.page_size == MP_DEFAULT_PAGE_SIZE);
    unsetenv("NO_COLOR");
    cfg = PromptConfig::defaults();
    assert(cfg.render.error.fg == Color::Red);
  }
  {
    // rc file via MPROMPT_RC, CRLF endings tolerated
    char path[] = "/tmp/mprompt_rc_XXXXXX";
    int fd = mkstemp(path);
    assert(fd >= 0);
    const char body[] = "set page_size=4\r\nset vim_mode on\r\nbogus\r\n";
    assert(write(fd, body, sizeof(body) - 1) == static_cast<ssize_t>(sizeof(body) - 1));
    close(fd);

    std::vector<std::string> lines;
    std::string msg;
    assert(mmap_readlines(path, lines, msg));
    assert(lines.size() == 3 && lines[0] == "set page_size=4");

    setenv(MP_RC_ENV, path, 1);
    std::vector<std::string> msgs;
    PromptConfig cfg = load_prompt_config(msgs);
    assert(cfg.page_size == 4 && cfg.vim_mode);
    assert(msgs.size() == 1 && msgs[0] == "line 3: unknown command: bogus");
    std::remove(path);

    // a missing rc file is not an error
    msgs.clear();
    cfg = load_prompt_config(msgs);
    assert(msgs.empty() && cfg.page_size == MP_DEFAULT_PAGE_SIZE);
    unsetenv(MP_RC_ENV);
  }
  return 0;
}
