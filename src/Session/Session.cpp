#include "Session.hpp"

const char* toString(SessionState state) {
  switch (state) {
    case SessionState::Idle:
      return "idle";
    case SessionState::Active:
      return "active";
    case SessionState::Completed:
      return "completed";
    case SessionState::Cancelled:
      return "cancelled";
    case SessionState::Failed:
      return "failed";
    default:
      return "unknown";
  }
}

bool isTerminal(SessionState state) {
  return state == SessionState::Completed ||
         state == SessionState::Cancelled || state == SessionState::Failed;
}

bool canTransition(SessionState from, SessionState to) {
  if (from == SessionState::Idle) return to == SessionState::Active;
  if (from == SessionState::Active) return isTerminal(to);
  return false;
}
