#include "input.hpp"

static std::optional<InputAction> make(InputActionKind k, char32_t ch = 0) {
  return InputAction{k, ch};
}

static bool is_printable(char32_t c) {
  return c >= 0x20 && c != 0x7F && !(c >= 0x80 && c < 0xA0);
}

std::optional<InputAction> InputAction::from_key(const Key& key) {
  const std::uint8_t m = key.mods;
  switch (key.code) {
    case KeyCode::Backspace:
      if (m & (MOD_CONTROL | MOD_ALT)) return make(InputActionKind::DeleteWordLeft);
      return make(InputActionKind::DeleteLeft);
    case KeyCode::Delete:
      if (m & (MOD_CONTROL | MOD_ALT)) return make(InputActionKind::DeleteWordRight);
      return make(InputActionKind::DeleteRight);
    case KeyCode::Left:
      if (m & (MOD_CONTROL | MOD_ALT)) return make(InputActionKind::MoveWordLeft);
      return make(InputActionKind::MoveLeft);
    case KeyCode::Right:
      if (m & (MOD_CONTROL | MOD_ALT)) return make(InputActionKind::MoveWordRight);
      return make(InputActionKind::MoveRight);
    case KeyCode::Home: return make(InputActionKind::MoveToStart);
    case KeyCode::End: return make(InputActionKind::MoveToEnd);
    case KeyCode::Char: break;
    default: return std::nullopt;
  }
  if (m == MOD_CONTROL) {
    switch (key.ch) {
      case U'a': return make(InputActionKind::MoveToStart);
      case U'e': return make(InputActionKind::MoveToEnd);
      case U'b': return make(InputActionKind::MoveLeft);
      case U'f': return make(InputActionKind::MoveRight);
      case U'w': return make(InputActionKind::DeleteWordLeft);
      case U'd': return make(InputActionKind::DeleteRight);
      default: return std::nullopt;
    }
  }
  if (m == MOD_ALT) {
    switch (key.ch) {
      case U'b': return make(InputActionKind::MoveWordLeft);
      case U'f': return make(InputActionKind::MoveWordRight);
      case U'd': return make(InputActionKind::DeleteWordRight);
      default: return std::nullopt;
    }
  }
  if ((m == MOD_NONE || m == MOD_SHIFT) && is_printable(key.ch)) return make(InputActionKind::Insert, key.ch);
  return std::nullopt;
}

std::optional<TextPromptAction> TextPromptAction::from_key(const Key& key, const KeyConfig&) {
  using K = TextPromptAction::Kind;
  if (key.is(KeyCode::Up)) return TextPromptAction{K::MoveToSuggestionAbove, {}};
  if (key.is(KeyCode::Down)) return TextPromptAction{K::MoveToSuggestionBelow, {}};
  if (key.is(KeyCode::PageUp)) return TextPromptAction{K::MoveToSuggestionPageUp, {}};
  if (key.is(KeyCode::PageDown)) return TextPromptAction{K::MoveToSuggestionPageDown, {}};
  if (key.is(KeyCode::Tab)) return TextPromptAction{K::UseCurrentSuggestion, {}};
  auto in = InputAction::from_key(key);
  if (!in) return std::nullopt;
  return TextPromptAction{K::ValueInput, *in};
}

std::optional<PasswordPromptAction> PasswordPromptAction::from_key(const Key& key, const KeyConfig& cfg) {
  using K = PasswordPromptAction::Kind;
  if (cfg.display_toggle && key.is_char(U'r', MOD_CONTROL)) return PasswordPromptAction{K::ToggleDisplayMode, {}};
  auto in = InputAction::from_key(key);
  if (!in) return std::nullopt;
  return PasswordPromptAction{K::ValueInput, *in};
}

std::optional<SelectPromptAction> SelectPromptAction::from_key(const Key& key, const KeyConfig& cfg) {
  using K = SelectPromptAction::Kind;
  if (key.is(KeyCode::Up) || key.is_char(U'p', MOD_CONTROL)) return SelectPromptAction{K::MoveUp, {}};
  if (key.is(KeyCode::Down) || key.is_char(U'n', MOD_CONTROL)) return SelectPromptAction{K::MoveDown, {}};
  if (key.is(KeyCode::PageUp)) return SelectPromptAction{K::PageUp, {}};
  if (key.is(KeyCode::PageDown)) return SelectPromptAction{K::PageDown, {}};
  if (key.is(KeyCode::Home)) return SelectPromptAction{K::MoveToStart, {}};
  if (key.is(KeyCode::End)) return SelectPromptAction{K::MoveToEnd, {}};
  if (cfg.vim_mode) {
    if (key.is_char(U'k')) return SelectPromptAction{K::MoveUp, {}};
    if (key.is_char(U'j')) return SelectPromptAction{K::MoveDown, {}};
  }
  auto in = InputAction::from_key(key);
  if (!in) return std::nullopt;
  return SelectPromptAction{K::FilterInput, *in};
}

std::optional<MultiSelectPromptAction> MultiSelectPromptAction::from_key(const Key& key, const KeyConfig& cfg) {
  using K = MultiSelectPromptAction::Kind;
  if (key.is(KeyCode::Up) || key.is_char(U'p', MOD_CONTROL)) return MultiSelectPromptAction{K::MoveUp, {}};
  if (key.is(KeyCode::Down) || key.is_char(U'n', MOD_CONTROL)) return MultiSelectPromptAction{K::MoveDown, {}};
  if (key.is(KeyCode::PageUp)) return MultiSelectPromptAction{K::PageUp, {}};
  if (key.is(KeyCode::PageDown)) return MultiSelectPromptAction{K::PageDown, {}};
  if (key.is(KeyCode::Home)) return MultiSelectPromptAction{K::MoveToStart, {}};
  if (key.is(KeyCode::End)) return MultiSelectPromptAction{K::MoveToEnd, {}};
  if (key.is_char(U' ')) return MultiSelectPromptAction{K::ToggleCurrentOption, {}};
  if (key.is(KeyCode::Right)) return MultiSelectPromptAction{K::SelectAll, {}};
  if (key.is(KeyCode::Left)) return MultiSelectPromptAction{K::ClearSelections, {}};
  if (cfg.vim_mode) {
    if (key.is_char(U'k')) return MultiSelectPromptAction{K::MoveUp, {}};
    if (key.is_char(U'j')) return MultiSelectPromptAction{K::MoveDown, {}};
    if (key.is_char(U'l')) return MultiSelectPromptAction{K::SelectAll, {}};
    if (key.is_char(U'h')) return MultiSelectPromptAction{K::ClearSelections, {}};
  }
  auto in = InputAction::from_key(key);
  if (!in) return std::nullopt;
  return MultiSelectPromptAction{K::FilterInput, *in};
}
