#include "renderer.hpp"
#include "utf8.hpp"
#include <string_view>

Renderer::Renderer(ITerminal& term, const RenderConfig& cfg) : term_(term), cfg_(cfg) {
  term_.cursor_hide();
}

Renderer::~Renderer() {
  term_.cursor_show();
}

void Renderer::reset_prompt() {
  for (size_t i = 0; i < cur_line_; ++i) {
    term_.cursor_up();
    term_.cursor_horizontal_reset();
    term_.clear_current_line();
  }
  cur_line_ = 0;
  cur_col_ = 0;
}

void Renderer::print_token(const Token& t) {
  if (t.content.empty()) return;
  const StyleSheet& s = t.style;
  if (s.fg) term_.set_fg(*s.fg);
  if (s.bg) term_.set_bg(*s.bg);
  if (s.attr) term_.set_attr(*s.attr);
  term_.write(t.content);
  if (!s.is_empty()) term_.reset_attrs();
  std::string_view rest(t.content);
  while (true) {
    size_t nl = rest.find('\n');
    cur_col_ += utf8_length(rest.substr(0, nl));
    if (nl == std::string_view::npos) break;
    end_row();
    rest.remove_prefix(nl + 1);
  }
}

void Renderer::end_row() {
  int w = term_.width();
  if (w > 0 && cur_col_ > 0) cur_line_ += (cur_col_ - 1) / static_cast<size_t>(w);
  cur_line_++;
  cur_col_ = 0;
}

void Renderer::print_tokens(const std::vector<Token>& tokens) {
  for (const auto& t : tokens) print_token(t);
}

void Renderer::new_line() {
  term_.cursor_horizontal_reset();
  term_.write("\n");
  end_row();
}

void Renderer::print_prefix(const std::string& text) {
  print_token(Token(text, cfg_.prompt_prefix));
  print_token(Token(" "));
}

void Renderer::print_prompt(const std::string& prompt,
                            const std::optional<std::string>& default_value,
                            const std::optional<std::string>& content) {
  print_prefix(cfg_.prompt_prefix_text);
  print_token(Token(prompt));
  if (default_value) print_token(Token(" (" + *default_value + ")", cfg_.default_value));
  if (content && !content->empty()) print_token(Token(" " + *content, cfg_.text_input));
  new_line();
}

void Renderer::print_prompt_input(const std::string& prompt,
                                  const std::optional<std::string>& default_value,
                                  const InputBuffer& input) {
  print_prefix(cfg_.prompt_prefix_text);
  print_token(Token(prompt));
  if (default_value) print_token(Token(" (" + *default_value + ")", cfg_.default_value));
  InputSplit parts = input.split();
  print_tokens({
    Token(" "),
    Token(parts.before),
    Token(parts.at, cfg_.highlighted_cursor),
    Token(parts.after),
  });
  new_line();
}

void Renderer::print_prompt_answer(const std::string& prompt, const std::string& answer) {
  print_prefix(cfg_.answered_prefix_text);
  print_token(Token(prompt));
  print_token(Token(" " + answer, cfg_.answer));
  new_line();
}

void Renderer::print_error_message(const std::string& message) {
  print_token(Token("# " + message, cfg_.error));
  new_line();
}

void Renderer::print_help(const std::string& message) {
  print_token(Token("[" + message + "]", cfg_.help));
  new_line();
}

void Renderer::print_option(bool cursor, const std::string& content) {
  if (cursor) print_token(Token("> " + content, cfg_.selected_option));
  else print_token(Token("  " + content));
  new_line();
}

void Renderer::print_options(const Page<std::string>& page) {
  size_t n = page.content.size();
  for (size_t idx = 0; idx < n; ++idx) {
    const std::string& option = page.content[idx];
    // a continuation marker hides the selection marker on an edge row
    if (idx == 0 && !page.first) {
      print_tokens({Token("^ ", cfg_.continuation), Token(option)});
      new_line();
    } else if (idx + 1 == n && !page.last) {
      print_tokens({Token("v ", cfg_.continuation), Token(option)});
      new_line();
    } else {
      print_option(idx == page.selection, option);
    }
  }
}

void Renderer::print_multi_option(bool cursor, bool checked, const std::string& content) {
  print_tokens({
    cursor ? Token("> ", cfg_.selected_option) : Token("  "),
    checked ? Token("[x] ", cfg_.checked) : Token("[ ] "),
    Token(content),
  });
  new_line();
}

void Renderer::cleanup(const std::string& prompt, const std::string& answer) {
  reset_prompt();
  print_prompt_answer(prompt, answer);
  // the answer line is permanent output now
  cur_line_ = 0;
}

void Renderer::cleanup_canceled(const std::string& prompt) {
  reset_prompt();
  print_prefix(cfg_.answered_prefix_text);
  print_token(Token(prompt));
  print_token(Token(" <canceled>", cfg_.canceled));
  new_line();
  cur_line_ = 0;
}

void Renderer::cleanup_failed(const std::string& prompt, const std::string& error) {
  reset_prompt();
  print_prefix(cfg_.answered_prefix_text);
  print_token(Token(prompt));
  new_line();
  print_error_message(error);
  cur_line_ = 0;
}

void Renderer::flush() { term_.flush(); }
