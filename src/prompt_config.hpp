#pragma once
/*
 * PromptConfig / RenderConfig
 *
 * Purpose: explicit per-prompt configuration (page size, vim mode, styles).
 * Source order: built-in defaults → NO_COLOR → rc file ($MPROMPT_RC or ~/.mpromptrc).
 * Note: no process-wide state; every prompt receives its own copy.
 */
#include <optional>
#include <string>
#include <vector>
#include "types.hpp"
#include "config.hpp"

struct StyleSheet {
  std::optional<Color> fg;
  std::optional<Color> bg;
  std::optional<Attr> attr;

  static StyleSheet with_fg(Color c) { StyleSheet s; s.fg = c; return s; }
  bool is_empty() const { return !fg && !bg && !attr; }
};

struct RenderConfig {
  std::string prompt_prefix_text = "?";
  std::string answered_prefix_text = "?";
  StyleSheet prompt_prefix;
  StyleSheet answer;
  StyleSheet default_value;
  StyleSheet text_input;        // echoed input on non-editable lines
  StyleSheet highlighted_cursor;
  StyleSheet error;
  StyleSheet help;
  StyleSheet selected_option;
  StyleSheet continuation;      // ^ / v page markers
  StyleSheet checked;
  StyleSheet canceled;

  static RenderConfig default_colored();
  /* no colors; input cursor still drawn in reverse video */
  static RenderConfig empty();
};

struct PromptConfig {
  size_t page_size = MP_DEFAULT_PAGE_SIZE;
  bool vim_mode = MP_DEFAULT_VIM_MODE != 0;
  RenderConfig render = RenderConfig::default_colored();

  /* defaults + NO_COLOR; does not touch the filesystem */
  static PromptConfig defaults();
};

bool parse_color(const std::string& name, Color& out);

/* apply rc lines; bad lines append a message and are skipped */
void apply_rc_lines(PromptConfig& cfg,
                    const std::vector<std::string>& lines,
                    std::vector<std::string>& messages);

/* defaults, NO_COLOR, then rc file; a missing rc file is not an error */
PromptConfig load_prompt_config(std::vector<std::string>& messages);
