#include "select_prompt.hpp"
#include "headless_terminal.hpp"
#include <cassert>
#include <string>
#include <vector>

static const std::vector<std::string> TOOLS = {"gdb", "perf", "strace", "valgrind"};

static Key down() { return Key::of(KeyCode::Down); }
static Key up() { return Key::of(KeyCode::Up); }
static Key space() { return Key::character(U' '); }

static std::vector<size_t> indexes(const std::vector<ListOption>& sel) {
  std::vector<size_t> out;
  for (const auto& o : sel) out.push_back(o.index);
  return out;
}

static PromptResult<std::vector<ListOption>> run(const MultiSelectPrompt& p, const std::vector<Key>& keys) {
  HeadlessTerminal term;
  term.push_keys(keys);
  term.push_enter();
  return p.prompt(term);
}

int main() {
  MultiSelectPrompt p("Tools?", TOOLS);
  {
    auto r = run(p, {});
    assert(r.ok() && r.value->empty());
  }
  {
    // answers come back in option order
    auto r = run(p, {down(), down(), space(), up(), up(), space()});
    assert(r.ok());
    assert((indexes(*r.value) == std::vector<size_t>{0, 2}));
    assert(r.value->at(1).value == "strace");
  }
  {
    // toggle twice clears
    auto r = run(p, {space(), space()});
    assert(r.ok() && r.value->empty());
  }
  {
    auto r = run(p, {Key::of(KeyCode::Right)});
    assert(r.ok() && r.value->size() == 4);
    r = run(p, {Key::of(KeyCode::Right), Key::of(KeyCode::Left)});
    assert(r.ok() && r.value->empty());
  }
  {
    HeadlessTerminal term;
    term.push_keys({down(), space()});
    term.push_enter();
    auto r = p.prompt(term);
    assert(r.ok());
    assert(term.transcript().find("> [x] perf") != std::string::npos);
    assert(term.transcript().find("  [ ] gdb") != std::string::npos);
    assert(term.screen() == std::vector<std::string>{"? Tools? perf"});
  }
  {
    MultiSelectPrompt d("Tools?", TOOLS);
    d.default_selections = {1, 3};
    auto r = run(d, {});
    assert(r.ok() && (indexes(*r.value) == std::vector<size_t>{1, 3}));
    HeadlessTerminal term;
    term.push_enter();
    r = d.prompt(term);
    assert(term.screen() == std::vector<std::string>{"? Tools? perf, valgrind"});
  }
  {
    MultiSelectPrompt d("Tools?", TOOLS);
    d.default_selections = {7};
    HeadlessTerminal term;
    auto r = d.prompt(term);
    assert(r.status == PromptStatus::InvalidConfiguration);
    assert(r.message == "index 7 is out-of-bounds for length 4 of options");
  }
  {
    // select-all applies to the filtered options only
    HeadlessTerminal term;
    term.push_text("a");
    term.push_key(Key::of(KeyCode::Right));
    term.push_backspaces(1);
    term.push_enter();
    auto r = p.prompt(term);
    assert(r.ok() && (indexes(*r.value) == std::vector<size_t>{2, 3}));
  }
  {
    // keep_filter off: a toggle clears the filter and keeps the highlighted option
    MultiSelectPrompt k("Tools?", TOOLS);
    k.keep_filter = false;
    HeadlessTerminal term;
    term.push_text("perf");
    term.push_key(space());
    term.push_key(down());
    term.push_key(space());
    term.push_enter();
    auto r = k.prompt(term);
    assert(r.ok() && (indexes(*r.value) == std::vector<size_t>{1, 2}));
  }
  {
    // validator over the selection
    MultiSelectPrompt v("Tools?", TOOLS);
    v.validators.push_back([](const std::vector<ListOption>& sel) {
      return sel.empty() ? Validation::Invalid("pick at least one") : Validation::Valid();
    });
    HeadlessTerminal term;
    term.push_enter();
    term.push_key(space());
    term.push_enter();
    auto r = v.prompt(term);
    assert(r.ok() && (indexes(*r.value) == std::vector<size_t>{0}));
    assert(term.transcript().find("# pick at least one") != std::string::npos);
  }
  {
    MultiSelectPrompt vim("Tools?", TOOLS);
    vim.config.vim_mode = true;
    auto r = run(vim, {Key::character(U'l'), Key::character(U'j'), space()});
    assert(r.ok() && (indexes(*r.value) == std::vector<size_t>{0, 2, 3}));
    r = run(vim, {Key::character(U'l'), Key::character(U'h')});
    assert(r.ok() && r.value->empty());
  }
  {
    MultiSelectPrompt f("Tools?", TOOLS);
    f.formatter = [](const std::vector<ListOption>& sel) { return std::to_string(sel.size()) + " tools"; };
    HeadlessTerminal term;
    term.push_key(Key::of(KeyCode::Right));
    term.push_enter();
    auto r = f.prompt(term);
    assert(r.ok());
    assert(term.screen() == std::vector<std::string>{"? Tools? 4 tools"});
  }
  {
    HeadlessTerminal term;
    term.push_key(space());
    term.push_escape();
    auto r = p.prompt(term);
    assert(r.canceled() && !r.value);
  }
  return 0;
}
