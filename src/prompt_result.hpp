#pragma once
/*
 * PromptResult / Validation
 *
 * Purpose: outcome of one prompt run and of one validator call.
 * Note: Canceled is an expected outcome, not a failure; callers may treat it as "no answer".
 */
#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

enum class PromptStatus {
  Ok,
  Canceled,              // ESC
  Interrupted,           // Ctrl-C
  ConfirmationMismatch,
  InvalidConfiguration,
  StreamEnded,           // backend reported end of input
  IoError,               // backend read/write fault
};

const char* prompt_status_name(PromptStatus s);

template <typename T>
struct PromptResult {
  PromptStatus status = PromptStatus::Ok;
  std::optional<T> value;
  std::string message;

  static PromptResult success(T v) { PromptResult r; r.value = std::move(v); return r; }
  static PromptResult failure(PromptStatus s, std::string msg = {}) {
    PromptResult r; r.status = s; r.message = std::move(msg); return r;
  }
  bool ok() const { return status == PromptStatus::Ok; }
  bool canceled() const { return status == PromptStatus::Canceled; }
};

struct Validation {
  bool valid = true;
  std::string message;

  static Validation Valid() { return {}; }
  static Validation Invalid(std::string msg = "Invalid input") { return {false, std::move(msg)}; }
};

template <typename T>
using Validator = std::function<Validation(const T&)>;

/* first Invalid wins; validators run in registration order.
 * An Invalid without a message reports "Invalid input" so the error line is never blank. */
template <typename T>
Validation run_validators(const std::vector<Validator<T>>& validators, const T& value) {
  for (const auto& v : validators) {
    Validation r = v(value);
    if (r.valid) continue;
    if (r.message.empty()) r.message = Validation::Invalid().message;
    return r;
  }
  return Validation::Valid();
}

template <typename T>
using Formatter = std::function<std::string(const T&)>;

struct ListOption {
  size_t index = 0;
  std::string value;
  bool operator==(const ListOption& o) const { return index == o.index && value == o.value; }
};
