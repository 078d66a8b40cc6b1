#ifndef SESSION_REGISTRY_HPP_
#define SESSION_REGISTRY_HPP_

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "CancellationSignal.hpp"
#include "CompletedArtifactIndex.hpp"
#include "ProgressAccumulator.hpp"
#include "Session.hpp"

/**
 * @brief Authoritative table of transfer sessions.
 *
 * Session state, progress counters and cancellation handles form one
 * aggregate behind a single mutex. Workers address their session through a
 * Handle; every entry carries a generation number, and a handle whose
 * generation no longer matches (the id was restarted) is stale: its updates
 * are ignored and it is treated as cancelled.
 *
 * Once a session reaches a terminal state its live entry is dropped and a
 * snapshot of the outcome is retained (bounded, oldest first out) so pollers
 * can still see how it ended.
 */
class SessionRegistry {
 public:
  struct Handle {
    SessionId id;
    uint64_t generation = 0;
    std::shared_ptr<CancellationSignal> cancel;
  };

  enum class CancelResult { Accepted, NotFound };
  enum class UpdateResult { Ok, Stale, ExceedsTotal };
  enum class CommitResult { Committed, Cancelled, Stale };

  explicit SessionRegistry(CompletedArtifactIndex& artifacts,
                           size_t retainedOutcomes = 256);

  SessionRegistry(const SessionRegistry&) = delete;
  SessionRegistry& operator=(const SessionRegistry&) = delete;

  // New Idle session. An existing entry for the id is discarded first and
  // its cancellation signal raised so the orphaned worker winds down.
  Handle create(const SessionId& id);

  std::optional<SessionSnapshot> get(const SessionId& id) const;

  // Drops both the live entry and any retained outcome.
  void remove(const SessionId& id);

  // Idle -> Active. False for a stale handle.
  bool activate(const Handle& handle);

  UpdateResult setTotal(const Handle& handle, uint64_t total);
  UpdateResult advance(const Handle& handle, uint64_t n);
  bool setFilePath(const Handle& handle, const std::filesystem::path& path);

  // True once the session should stop: cancelled or superseded.
  bool cancellationRequested(const Handle& handle) const;

  // Active -> Completed and records the artifact, atomically with respect
  // to signal(). Cancelled: this generation was signalled first and still
  // owns the id, so its output must go. Stale: the id was restarted and the
  // target path may already belong to the successor.
  // The index file is rewritten after the registry lock is released.
  CommitResult complete(const Handle& handle,
                        const std::filesystem::path& artifact);

  // Active -> Cancelled / Failed. False for a stale handle.
  bool finish(const Handle& handle, SessionState terminal,
              const std::string& error = std::string());

  // Raises the session's cancellation signal. NotFound when there is no
  // live session or it was already signalled. Never blocks on the worker.
  CancelResult signal(const SessionId& id);

  // Signals every live session; returns how many were signalled.
  size_t cancelAll();

  // Blocks until the id has no live entry. True if an outcome is recorded.
  bool waitForTerminal(const SessionId& id,
                       std::chrono::milliseconds timeout) const;

  std::vector<SessionSnapshot> list() const;
  size_t activeCount() const;
  // Terminal outcomes currently held, never more than retainedOutcomes.
  size_t retainedCount() const;

 private:
  struct Entry {
    uint64_t generation = 0;
    SessionState state = SessionState::Idle;
    ProgressAccumulator progress;
    std::optional<std::filesystem::path> filePath;
    std::shared_ptr<CancellationSignal> cancel;
  };

  Entry* findLocked(const Handle& handle);
  const Entry* findLocked(const Handle& handle) const;
  static SessionSnapshot snapshotOf(const SessionId& id, const Entry& entry);
  void retainLocked(SessionSnapshot snapshot, uint64_t generation);
  void dropOutcomeLocked(const SessionId& id);

  CompletedArtifactIndex& artifacts_;
  const size_t retainedOutcomes_;

  std::unordered_map<SessionId, Entry> active_;
  std::unordered_map<SessionId, std::pair<uint64_t, SessionSnapshot>> outcomes_;
  std::deque<std::pair<SessionId, uint64_t>> outcomeOrder_;
  uint64_t nextGeneration_ = 1;

  mutable std::mutex mutex_;
  mutable std::condition_variable terminalCv_;
};

#endif  // SESSION_REGISTRY_HPP_
