#pragma once
/*
 * Input
 *
 * Purpose: map raw keys to semantic actions, one closed action type per prompt.
 * Design: every prompt action embeds the shared InputAction set; Action<Inner>
 *         adds Submit/Cancel/Interrupt. Mapping is pure, unmapped keys -> nullopt.
 * Rule: navigation keys are matched before falling through to InputAction.
 */
#include <optional>
#include "types.hpp"

struct KeyConfig {
  bool vim_mode = false;
  bool display_toggle = false;
};

enum class InputActionKind {
  MoveLeft, MoveRight, MoveToStart, MoveToEnd,
  MoveWordLeft, MoveWordRight,
  DeleteLeft, DeleteRight, DeleteWordLeft, DeleteWordRight,
  Insert
};

struct InputAction {
  InputActionKind kind = InputActionKind::MoveToEnd;
  char32_t ch = 0;  // Insert only

  static std::optional<InputAction> from_key(const Key& key);
  static std::optional<InputAction> from_key(const Key& key, const KeyConfig&) { return from_key(key); }
  bool operator==(const InputAction& o) const { return kind == o.kind && ch == o.ch; }
};

struct TextPromptAction {
  enum class Kind {
    ValueInput,
    MoveToSuggestionAbove, MoveToSuggestionBelow,
    MoveToSuggestionPageUp, MoveToSuggestionPageDown,
    UseCurrentSuggestion
  };
  Kind kind = Kind::ValueInput;
  InputAction input{};

  static std::optional<TextPromptAction> from_key(const Key& key, const KeyConfig& cfg);
};

struct PasswordPromptAction {
  enum class Kind { ValueInput, ToggleDisplayMode };
  Kind kind = Kind::ValueInput;
  InputAction input{};

  static std::optional<PasswordPromptAction> from_key(const Key& key, const KeyConfig& cfg);
};

struct SelectPromptAction {
  enum class Kind { FilterInput, MoveUp, MoveDown, PageUp, PageDown, MoveToStart, MoveToEnd };
  Kind kind = Kind::FilterInput;
  InputAction input{};

  static std::optional<SelectPromptAction> from_key(const Key& key, const KeyConfig& cfg);
};

struct MultiSelectPromptAction {
  enum class Kind {
    FilterInput, MoveUp, MoveDown, PageUp, PageDown, MoveToStart, MoveToEnd,
    ToggleCurrentOption, SelectAll, ClearSelections
  };
  Kind kind = Kind::FilterInput;
  InputAction input{};

  static std::optional<MultiSelectPromptAction> from_key(const Key& key, const KeyConfig& cfg);
};

template <typename Inner>
struct Action {
  enum class Kind { Submit, Cancel, Interrupt, Forward };
  Kind kind = Kind::Forward;
  Inner inner{};

  static std::optional<Action> from_key(const Key& key, const KeyConfig& cfg) {
    if (key.is(KeyCode::Enter)) return Action{Kind::Submit, Inner{}};
    if (key.is(KeyCode::Escape)) return Action{Kind::Cancel, Inner{}};
    if (key.is_char(U'c', MOD_CONTROL)) return Action{Kind::Interrupt, Inner{}};
    std::optional<Inner> in = Inner::from_key(key, cfg);
    if (!in) return std::nullopt;
    return Action{Kind::Forward, *in};
  }
};
