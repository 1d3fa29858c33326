#include "confirm_prompt.hpp"
#include "headless_terminal.hpp"
#include <cassert>
#include <string>
#include <vector>

static PromptResult<bool> run(const ConfirmPrompt& p, const std::string& typed, HeadlessTerminal& term) {
  term.push_text(typed);
  term.push_enter();
  return p.prompt(term);
}

int main() {
  assert(parse_confirmation("y") == true);
  assert(parse_confirmation("YES") == true);
  assert(parse_confirmation("n") == false);
  assert(parse_confirmation("No") == false);
  assert(!parse_confirmation(""));
  assert(!parse_confirmation("yep"));

  ConfirmPrompt p("Continue?");
  {
    HeadlessTerminal term;
    auto r = run(p, "y", term);
    assert(r.ok() && *r.value);
    assert(term.screen() == std::vector<std::string>{"? Continue? Yes"});
    assert(term.transcript().find("? Continue? (y/n)") != std::string::npos);
  }
  {
    HeadlessTerminal term;
    auto r = run(p, "No", term);
    assert(r.ok() && !*r.value);
    assert(term.screen() == std::vector<std::string>{"? Continue? No"});
  }
  {
    // garbage is rejected; the buffer survives and can be fixed
    HeadlessTerminal term;
    term.push_text("maybe");
    term.push_enter();
    term.push_backspaces(5);
    term.push_text("yes");
    term.push_enter();
    auto r = p.prompt(term);
    assert(r.ok() && *r.value);
    assert(term.transcript().find("# Invalid answer, try typing 'y' for yes or 'n' for no") != std::string::npos);
  }
  {
    // no default: empty input is an invalid answer
    HeadlessTerminal term;
    term.push_enter();
    auto r = p.prompt(term);
    assert(r.status == PromptStatus::StreamEnded);
    assert(term.transcript().find("# Invalid answer") != std::string::npos);
  }
  {
    // blank error message falls back to a generic one
    ConfirmPrompt q("Go?");
    q.error_message = "";
    HeadlessTerminal term;
    term.push_text("x");
    term.push_enter();
    auto r = q.prompt(term);
    assert(r.status == PromptStatus::StreamEnded);
    assert(term.transcript().find("# Invalid input") != std::string::npos);
  }
  {
    ConfirmPrompt d("Overwrite?");
    d.default_value = false;
    HeadlessTerminal term;
    auto r = run(d, "", term);
    assert(r.ok() && !*r.value);
    assert(term.transcript().find("(y/N)") != std::string::npos);
  }
  {
    ConfirmPrompt d("Proceed?");
    d.default_value = true;
    d.placeholder = "yes please";
    d.formatter = [](const bool& b) { return std::string(b ? "sure" : "nah"); };
    HeadlessTerminal term;
    auto r = run(d, "", term);
    assert(r.ok() && *r.value);
    assert(term.transcript().find("(yes please)") != std::string::npos);
    assert(term.screen() == std::vector<std::string>{"? Proceed? sure"});
  }
  {
    HeadlessTerminal term;
    term.push_text("y");
    term.push_key(Key::character(U'c', MOD_CONTROL));
    auto r = p.prompt(term);
    assert(r.status == PromptStatus::Interrupted && !r.value);
  }
  return 0;
}
