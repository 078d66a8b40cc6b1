#ifndef SESSION_HPP_
#define SESSION_HPP_

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

using SessionId = std::string;

enum class SessionState { Idle, Active, Completed, Cancelled, Failed };

const char* toString(SessionState state);

bool isTerminal(SessionState state);

// Idle -> Active -> {Completed | Cancelled | Failed}
bool canTransition(SessionState from, SessionState to);

// Point-in-time copy of a session, safe to hand out of the registry lock.
struct SessionSnapshot {
  SessionId id;
  SessionState state = SessionState::Idle;
  uint64_t downloadedBytes = 0;
  uint64_t totalBytes = 0;
  uint32_t percentage = 0;
  std::optional<std::filesystem::path> filePath;
  std::string error;
};

struct CompletedArtifact {
  SessionId id;
  std::filesystem::path filePath;
};

#endif  // SESSION_HPP_
