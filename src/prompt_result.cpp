#include "prompt_result.hpp"

const char* prompt_status_name(PromptStatus s) {
  switch (s) {
    case PromptStatus::Ok: return "ok";
    case PromptStatus::Canceled: return "canceled";
    case PromptStatus::Interrupted: return "interrupted";
    case PromptStatus::ConfirmationMismatch: return "confirmation mismatch";
    case PromptStatus::InvalidConfiguration: return "invalid configuration";
    case PromptStatus::StreamEnded: return "stream ended";
    case PromptStatus::IoError: return "io error";
  }
  return "unknown";
}
