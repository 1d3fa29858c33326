#pragma once
/*
 * Prompt driver
 *
 * Purpose: the read → act → render loop shared by every prompt type.
 * States: Editing → Submitting → Accepted | Rejected(message); confirmable prompts
 *         go Accepted → ConfirmEditing → ConfirmSubmitting → Done | Mismatch.
 * Guarantees: input survives a rejected submit; Cancel at any stage yields no answer;
 *             the cursor is shown again and raw mode released on every exit path
 *             (Renderer / terminal RAII), including TerminalError unwinding.
 */
#include <concepts>
#include <optional>
#include <string>
#include <utility>
#include "debug_log.hpp"
#include "input.hpp"
#include "iterminal.hpp"
#include "prompt_result.hpp"
#include "renderer.hpp"
#include "terminfo_terminal.hpp"

enum class SubmitOutcome {
  Accepted,   // answer() is ready
  Rejected,   // validation failed; error is pending, input untouched
  NextStage,  // first entry accepted, confirmation stage begins
  Mismatch,   // confirmation differs from first entry
  Ignored,    // nothing to submit (e.g. empty filtered list)
};

template <typename P>
concept PromptState = requires(P& p, const P& cp, Renderer& r, const typename P::InnerAction& a,
                               const typename P::Answer& ans) {
  { cp.message() } -> std::convertible_to<std::string>;
  { cp.key_config() } -> std::same_as<KeyConfig>;
  { cp.check_config() } -> std::same_as<std::optional<std::string>>;
  cp.render(r);
  p.handle(a);
  { p.submit() } -> std::same_as<SubmitOutcome>;
  { p.answer() } -> std::same_as<typename P::Answer>;
  { cp.format_answer(ans) } -> std::convertible_to<std::string>;
  { cp.error() } -> std::convertible_to<std::string>;
};

template <PromptState P>
PromptResult<typename P::Answer> run_prompt(P& state, ITerminal& term, const RenderConfig& render) {
  using Result = PromptResult<typename P::Answer>;
  if (std::optional<std::string> bad = state.check_config()) {
    debug_log("prompt '" + std::string(state.message()) + "': invalid configuration: " + *bad);
    return Result::failure(PromptStatus::InvalidConfiguration, *bad);
  }
  try {
    Renderer renderer(term, render);
    while (true) {
      renderer.reset_prompt();
      state.render(renderer);
      renderer.flush();

      std::optional<Key> key = term.read_key();
      if (!key) {
        renderer.reset_prompt();
        renderer.flush();
        debug_log("prompt '" + std::string(state.message()) + "': input stream ended");
        return Result::failure(PromptStatus::StreamEnded, "input stream has ended");
      }
      auto action = Action<typename P::InnerAction>::from_key(*key, state.key_config());
      if (!action) continue;

      using Kind = typename Action<typename P::InnerAction>::Kind;
      switch (action->kind) {
        case Kind::Cancel:
          renderer.cleanup_canceled(state.message());
          renderer.flush();
          debug_log("prompt '" + std::string(state.message()) + "': canceled");
          return Result::failure(PromptStatus::Canceled, "operation canceled");
        case Kind::Interrupt:
          renderer.cleanup_canceled(state.message());
          renderer.flush();
          debug_log("prompt '" + std::string(state.message()) + "': interrupted");
          return Result::failure(PromptStatus::Interrupted, "operation interrupted");
        case Kind::Forward:
          state.handle(action->inner);
          break;
        case Kind::Submit:
          switch (state.submit()) {
            case SubmitOutcome::Accepted: {
              typename P::Answer answer = state.answer();
              renderer.cleanup(state.message(), state.format_answer(answer));
              renderer.flush();
              return Result::success(std::move(answer));
            }
            case SubmitOutcome::Mismatch:
              renderer.cleanup_failed(state.message(), state.error());
              renderer.flush();
              debug_log("prompt '" + std::string(state.message()) + "': confirmation mismatch");
              return Result::failure(PromptStatus::ConfirmationMismatch, state.error());
            case SubmitOutcome::Rejected:
              debug_log("prompt '" + std::string(state.message()) + "': rejected: " + state.error());
              break;
            case SubmitOutcome::NextStage:
              debug_log("prompt '" + std::string(state.message()) + "': confirmation stage");
              break;
            case SubmitOutcome::Ignored:
              break;
          }
          break;
      }
    }
  } catch (const TerminalError& e) {
    debug_log("prompt '" + std::string(state.message()) + "': terminal error: " + e.what());
    return Result::failure(PromptStatus::IoError, e.what());
  }
}

/* open the controlling terminal for one prompt run; raw mode ends with the call */
template <typename F>
auto with_default_terminal(F&& fn) -> decltype(fn(std::declval<ITerminal&>())) {
  using Result = decltype(fn(std::declval<ITerminal&>()));
  try {
    TerminfoTerminal term;
    return fn(term);
  } catch (const TerminalError& e) {
    debug_log(std::string("terminal: ") + e.what());
    return Result::failure(PromptStatus::IoError, e.what());
  }
}
