#ifndef SESSION_WORKER_HPP_
#define SESSION_WORKER_HPP_

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

#include "Engine/TransferEngine.hpp"
#include "SessionRegistry.hpp"

struct WorkerOptions {
  std::filesystem::path downloadRoot = ".";
  size_t chunkSize = 64 * 1024;
  // Pause after a read that produced nothing, so an engine without its own
  // wait does not spin the core.
  std::chrono::milliseconds pendingBackoff{1};
};

/**
 * @brief Drives one session from Idle to a terminal state.
 *
 * Resolve the locator, set the session total, then copy every file through
 * a ".part" sink next to its final path, renaming it into place at
 * end-of-stream. Cancellation is checked before every read. Cancelled and
 * failed sessions leave no partial file behind; files already finished by
 * the session stay where they are.
 */
class SessionWorker {
 public:
  SessionWorker(SessionRegistry& registry, TransferEngine& engine,
                SessionRegistry::Handle handle, std::string locator,
                WorkerOptions options);

  // Never throws; returns the state the session ended in.
  SessionState run();

 private:
  enum class FileOutcome { Done, Cancelled };

  FileOutcome transferFile(const RemoteFile& file,
                           const std::filesystem::path& target,
                           std::vector<char>& buffer);
  std::filesystem::path partialPathFor(
      const std::filesystem::path& target) const;
  void discard(const std::filesystem::path& path) const;

  SessionState cancelled();
  SessionState failed(const std::string& reason);

  SessionRegistry& registry_;
  TransferEngine& engine_;
  SessionRegistry::Handle handle_;
  std::string locator_;
  WorkerOptions options_;
};

#endif  // SESSION_WORKER_HPP_
