#include "select_prompt.hpp"
#include "headless_terminal.hpp"
#include <cassert>
#include <string>
#include <vector>

static const std::vector<std::string> FRUITS = {"apple", "banana", "cherry", "bar"};

static PromptResult<ListOption> run(const SelectPrompt& p, const std::vector<Key>& keys) {
  HeadlessTerminal term;
  term.push_keys(keys);
  term.push_enter();
  return p.prompt(term);
}

static Key down() { return Key::of(KeyCode::Down); }
static Key up() { return Key::of(KeyCode::Up); }
static Key ch(char32_t c) { return Key::character(c); }

int main() {
  SelectPrompt p("Fruit?", FRUITS);
  {
    auto r = run(p, {});
    assert(r.ok() && r.value->index == 0 && r.value->value == "apple");
  }
  {
    auto r = run(p, {down()});
    assert(r.ok() && (*r.value == ListOption{1, "banana"}));
  }
  {
    // wrap both ways
    auto r = run(p, {up()});
    assert(r.ok() && r.value->index == 3);
    r = run(p, {up(), down()});
    assert(r.ok() && r.value->index == 0);
  }
  {
    // filter is a case-insensitive substring match
    auto r = run(p, {ch('B'), ch('A')});
    assert(r.ok() && (*r.value == ListOption{1, "banana"}));
    r = run(p, {ch('b'), ch('a'), down()});
    assert(r.ok() && (*r.value == ListOption{3, "bar"}));
    r = run(p, {ch('b'), ch('a'), down(), down()});
    assert(r.ok() && r.value->index == 1);
  }
  {
    // the highlighted option survives refiltering when still visible
    auto r = run(p, {down(), down(), ch('e')});
    assert(r.ok() && (*r.value == ListOption{2, "cherry"}));
    // ...otherwise the cursor returns to the top
    r = run(p, {down(), ch('r')});
    assert(r.ok() && r.value->index == 2);
  }
  {
    // submit with nothing visible is ignored
    HeadlessTerminal term;
    term.push_text("zzz");
    term.push_enter();
    term.push_backspaces(3);
    term.push_enter();
    auto r = p.prompt(term);
    assert(r.ok() && r.value->index == 0);
  }
  {
    HeadlessTerminal term;
    term.push_key(down());
    term.push_enter();
    auto r = p.prompt(term);
    assert(r.ok());
    assert(term.screen() == std::vector<std::string>{"? Fruit? banana"});
    assert(term.transcript().find("> banana") != std::string::npos);
    assert(term.transcript().find("[↑↓ to move, enter to select, type to filter]") != std::string::npos);
  }
  {
    SelectPrompt s("Pick", FRUITS);
    s.starting_cursor = 2;
    s.formatter = [](const ListOption& o) { return std::to_string(o.index) + ":" + o.value; };
    HeadlessTerminal term;
    term.push_enter();
    auto r = s.prompt(term);
    assert(r.ok() && r.value->value == "cherry");
    assert(term.screen() == std::vector<std::string>{"? Pick 2:cherry"});
  }
  {
    // vim mode: j/k move instead of filtering
    SelectPrompt s("Pick", FRUITS);
    s.config.vim_mode = true;
    auto r = run(s, {ch('j'), ch('j'), ch('k')});
    assert(r.ok() && r.value->index == 1);
    SelectPrompt t("Pick", {"jam", "kiwi"});
    r = run(t, {ch('k')});
    assert(r.ok() && r.value->value == "kiwi");
  }
  {
    // paging over a long list
    std::vector<std::string> opts;
    for (int i = 0; i < 10; ++i) opts.push_back("opt" + std::to_string(i));
    SelectPrompt s("Pick", opts);
    s.config.page_size = 3;
    auto r = run(s, {Key::of(KeyCode::PageDown)});
    assert(r.ok() && r.value->index == 3);
    r = run(s, {Key::of(KeyCode::PageDown), Key::of(KeyCode::PageDown), Key::of(KeyCode::PageDown),
                Key::of(KeyCode::PageDown)});
    assert(r.ok() && r.value->index == 9);
    r = run(s, {Key::of(KeyCode::End), Key::of(KeyCode::PageUp)});
    assert(r.ok() && r.value->index == 6);
    r = run(s, {Key::of(KeyCode::End), Key::of(KeyCode::Home)});
    assert(r.ok() && r.value->index == 0);

    HeadlessTerminal term;
    term.push_key(Key::of(KeyCode::End));
    term.push_enter();
    r = s.prompt(term);
    assert(r.ok() && r.value->index == 9);
    const std::string& t = term.transcript();
    // first frame: top of the list with a "more below" marker
    assert(t.find("> opt0") != std::string::npos);
    assert(t.find("v opt2") != std::string::npos);
    // after End: last window with a "more above" marker
    assert(t.find("^ opt7") != std::string::npos);
    assert(t.find("> opt9") != std::string::npos);
  }
  {
    SelectPrompt empty("Pick", {});
    HeadlessTerminal term;
    term.push_enter();
    auto r = empty.prompt(term);
    assert(r.status == PromptStatus::InvalidConfiguration);
    assert(r.message == "available options can not be empty");
    assert(term.transcript().empty());
    assert(term.pending_keys() == 1);

    SelectPrompt bad("Pick", FRUITS);
    bad.starting_cursor = 5;
    r = bad.prompt(term);
    assert(r.status == PromptStatus::InvalidConfiguration);
    assert(r.message == "starting cursor index 5 is out-of-bounds for length 4 of options");
  }
  {
    // custom filter
    SelectPrompt s("Pick", FRUITS);
    s.filter = [](const std::string& f, const std::string& o, size_t) { return o.size() == f.size(); };
    auto r = run(s, {ch('x'), ch('x'), ch('x')});
    assert(r.ok() && r.value->value == "bar");
  }
  return 0;
}
