#ifndef TRANSFER_SERVICE_HPP_
#define TRANSFER_SERVICE_HPP_

#include <atomic>
#include <chrono>
#include <cstddef>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "Engine/TransferEngine.hpp"
#include "Session/CompletedArtifactIndex.hpp"
#include "Session/Session.hpp"
#include "Session/SessionRegistry.hpp"
#include "Session/WorkerPool.hpp"

struct ServiceOptions {
  std::filesystem::path downloadRoot = ".";
  size_t chunkSize = 64 * 1024;
  size_t retainedOutcomes = 256;
  // Extensions (with dot, lower case) listed by listFiles(); empty = all.
  std::vector<std::string> listedExtensions;
  // Empty keeps the completed index in memory only.
  std::filesystem::path completedIndexFile;
};

struct StartResult {
  bool accepted = false;
  SessionId sessionId;
  std::string reason;  // set when rejected
};

/**
 * @brief Process-wide entry point used by the HTTP layer.
 *
 * Owns the completed-artifact index, the session registry and the worker
 * pool; every started session runs a SessionWorker on its own thread.
 */
class TransferService {
 public:
  TransferService(ServiceOptions options,
                  std::shared_ptr<TransferEngine> engine);
  ~TransferService();

  TransferService(const TransferService&) = delete;
  TransferService& operator=(const TransferService&) = delete;

  // An empty id gets a random UUID. Restarting an id supersedes the
  // previous session under that id.
  StartResult startSession(const SessionId& sessionId,
                           const std::string& locator);

  std::optional<SessionSnapshot> getProgress(const SessionId& sessionId) const;

  SessionRegistry::CancelResult cancelSession(const SessionId& sessionId);

  std::vector<CompletedArtifact> listCompleted() const;

  // Accepts a session id from the completed index or a path relative to the
  // download root. Anything that leaves the root or is not a regular file
  // is NotFound.
  std::optional<std::filesystem::path> fetchArtifact(
      const std::string& key) const;

  // Relative paths of finished files under the download root.
  std::vector<std::string> listFiles() const;

  std::vector<SessionSnapshot> listSessions() const;

  bool waitForSession(const SessionId& sessionId,
                      std::chrono::milliseconds timeout) const;

  // Cancels every live session and joins all workers. Idempotent.
  void shutdown();

  const std::filesystem::path& downloadRoot() const {
    return options_.downloadRoot;
  }

 private:
  static SessionId generateSessionId();
  bool listed(const std::filesystem::path& path) const;

  ServiceOptions options_;
  std::shared_ptr<TransferEngine> engine_;
  CompletedArtifactIndex artifacts_;
  SessionRegistry registry_;
  WorkerPool workers_;
  std::atomic<bool> stopping_{false};
};

#endif  // TRANSFER_SERVICE_HPP_
