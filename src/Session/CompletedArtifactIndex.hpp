#ifndef COMPLETED_ARTIFACT_INDEX_HPP_
#define COMPLETED_ARTIFACT_INDEX_HPP_

#include <cstddef>
#include <filesystem>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <vector>

#include "Session.hpp"

/**
 * @brief Final file paths of sessions that completed successfully.
 *
 * Entries are kept in recording order and are never dropped here; cleaning
 * up old artifacts is left to whoever manages the download directory.
 * Recording an id a second time (a restarted session that completed again)
 * replaces its path in place.
 *
 * With a persist file the index is loaded at construction and rewritten as
 * JSON by record() or persist() so completed artifacts survive a restart.
 */
class CompletedArtifactIndex {
 public:
  CompletedArtifactIndex() = default;
  explicit CompletedArtifactIndex(std::filesystem::path persistFile);

  // insert() followed by persist().
  void record(const SessionId& id, const std::filesystem::path& path);
  // Updates the in-memory index only.
  void insert(const SessionId& id, const std::filesystem::path& path);
  // Rewrites the persist file from a snapshot; readers are not blocked while
  // the file is written. No-op without a persist file.
  void persist() const;
  std::vector<CompletedArtifact> list() const;
  std::optional<std::filesystem::path> get(const SessionId& id) const;
  size_t size() const;

 private:
  void load();

  std::vector<CompletedArtifact> entries_;
  std::unordered_map<SessionId, size_t> byId_;
  std::filesystem::path persistFile_;
  mutable std::mutex mutex_;
  // 串行化落盘，保证最后写入的是最新快照
  mutable std::mutex persistMutex_;
};

#endif  // COMPLETED_ARTIFACT_INDEX_HPP_
