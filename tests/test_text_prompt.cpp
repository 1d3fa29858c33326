#include "text_prompt.hpp"
#include "headless_terminal.hpp"
#include <cassert>
#include <string>
#include <vector>

static std::vector<std::string> suggest_names(const std::string& input) {
  static const std::vector<std::string> names = {"Ada", "Alan", "Barbara", "Bjarne", "Grace"};
  std::vector<std::string> out;
  if (input.empty()) return out;
  for (const auto& n : names) {
    if (n.compare(0, input.size(), input) == 0) out.push_back(n);
  }
  return out;
}

int main() {
  {
    HeadlessTerminal term;
    term.push_text("Ada");
    term.push_enter();
    TextPrompt p("Name?");
    auto r = p.prompt(term);
    assert(r.ok() && *r.value == "Ada");
    assert(term.screen() == std::vector<std::string>{"? Name? Ada"});
    assert(term.cursor_visible());
    assert(term.flushes() > 0);
  }
  {
    // empty input takes the default, shown in parentheses while editing
    HeadlessTerminal term;
    term.push_enter();
    TextPrompt p("City?");
    p.default_value = "Lisbon";
    auto r = p.prompt(term);
    assert(r.ok() && *r.value == "Lisbon");
    assert(term.transcript().find("? City? (Lisbon)") != std::string::npos);
  }
  {
    // initial value seeds the buffer with the cursor at its end
    HeadlessTerminal term;
    term.push_backspaces(1);
    term.push_text("x");
    term.push_enter();
    TextPrompt p("Word?");
    p.initial_value = "fob";
    auto r = p.prompt(term);
    assert(r.ok() && *r.value == "fox");
  }
  {
    // rejected submit keeps the input and shows the message
    HeadlessTerminal term;
    std::vector<std::string> seen;
    term.push_text("ab");
    term.push_enter();
    term.push_text("cd");
    term.push_enter();
    TextPrompt p("Code?");
    p.validators.push_back([&seen](const std::string& s) {
      seen.push_back(s);
      return s.size() < 4 ? Validation::Invalid("at least 4 characters") : Validation::Valid();
    });
    auto r = p.prompt(term);
    assert(r.ok() && *r.value == "abcd");
    assert((seen == std::vector<std::string>{"ab", "abcd"}));
    assert(term.transcript().find("# at least 4 characters") != std::string::npos);
    assert(term.screen() == std::vector<std::string>{"? Code? abcd"});
  }
  {
    // validators run in order, first failure wins
    HeadlessTerminal term;
    term.push_enter();
    TextPrompt p("X?");
    p.validators.push_back([](const std::string&) { return Validation::Invalid("first"); });
    p.validators.push_back([](const std::string&) { return Validation::Invalid("second"); });
    auto r = p.prompt(term);
    assert(r.status == PromptStatus::StreamEnded);
    assert(term.transcript().find("# first") != std::string::npos);
    assert(term.transcript().find("# second") == std::string::npos);
  }
  {
    // a rejection without a message still shows an error line
    HeadlessTerminal term;
    term.push_text("ab");
    term.push_enter();
    TextPrompt p("X?");
    p.validators.push_back([](const std::string&) { return Validation::Invalid(""); });
    auto r = p.prompt(term);
    assert(r.status == PromptStatus::StreamEnded);
    assert(term.transcript().find("# Invalid input") != std::string::npos);
  }
  {
    // Down highlights the first suggestion; Enter submits it
    HeadlessTerminal term;
    term.push_text("B");
    term.push_key(Key::of(KeyCode::Down));
    term.push_enter();
    TextPrompt p("Who?");
    p.suggester = suggest_names;
    auto r = p.prompt(term);
    assert(r.ok() && *r.value == "Barbara");
    assert(term.transcript().find("> Barbara") != std::string::npos);
    assert(term.transcript().find("[↑↓ to move, tab to autocomplete, enter to submit]") != std::string::npos);
  }
  {
    // Up wraps to the last suggestion
    HeadlessTerminal term;
    term.push_text("B");
    term.push_key(Key::of(KeyCode::Up));
    term.push_enter();
    TextPrompt p("Who?");
    p.suggester = suggest_names;
    auto r = p.prompt(term);
    assert(r.ok() && *r.value == "Bjarne");
  }
  {
    // Tab copies the suggestion into the input for further editing
    HeadlessTerminal term;
    term.push_text("Al");
    term.push_key(Key::of(KeyCode::Tab));
    term.push_text("!");
    term.push_enter();
    TextPrompt p("Who?");
    p.suggester = suggest_names;
    auto r = p.prompt(term);
    assert(r.ok() && *r.value == "Alan!");
  }
  {
    // formatter changes the echoed answer only
    HeadlessTerminal term;
    term.push_text("quiet");
    term.push_enter();
    TextPrompt p("Say?");
    p.formatter = [](const std::string& s) { return "<" + s + ">"; };
    auto r = p.prompt(term);
    assert(r.ok() && *r.value == "quiet");
    assert(term.screen() == std::vector<std::string>{"? Say? <quiet>"});
  }
  {
    // word editing through the action mapper
    HeadlessTerminal term;
    term.push_text("hello big world");
    term.push_key(Key::character(U'w', MOD_CONTROL));
    term.push_key(Key::character(U'b', MOD_ALT));
    term.push_key(Key::of(KeyCode::Delete, MOD_CONTROL));
    term.push_enter();
    TextPrompt p("Edit?");
    auto r = p.prompt(term);
    assert(r.ok() && *r.value == "hello ");
  }
  {
    HeadlessTerminal term;
    term.push_text("abc");
    term.push_escape();
    TextPrompt p("Name?");
    auto r = p.prompt(term);
    assert(r.canceled() && !r.value);
    assert(term.screen() == std::vector<std::string>{"? Name? <canceled>"});
    assert(term.pending_keys() == 0);
  }
  return 0;
}
