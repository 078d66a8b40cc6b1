#include "SessionRegistry.hpp"

#include "logger.hpp"

SessionRegistry::SessionRegistry(CompletedArtifactIndex& artifacts,
                                 size_t retainedOutcomes)
    : artifacts_(artifacts), retainedOutcomes_(retainedOutcomes) {}

SessionRegistry::Handle SessionRegistry::create(const SessionId& id) {
  std::lock_guard<std::mutex> lock(mutex_);

  auto it = active_.find(id);
  if (it != active_.end()) {
    // 旧会话被覆盖：通知其 worker 退出，旧 worker 之后的更新都会被忽略
    it->second.cancel->signal();
    LOG(INFO) << "Session " << id << " restarted, superseding generation "
              << it->second.generation << " ("
              << it->second.progress.downloadedBytes() << " bytes discarded)";
    active_.erase(it);
    terminalCv_.notify_all();
  }
  dropOutcomeLocked(id);

  Entry entry;
  entry.generation = nextGeneration_++;
  entry.cancel = std::make_shared<CancellationSignal>();
  Handle handle{id, entry.generation, entry.cancel};
  active_.emplace(id, std::move(entry));

  LOG(DEBUG) << "Session " << id << " created, generation "
             << handle.generation;
  return handle;
}

std::optional<SessionSnapshot> SessionRegistry::get(const SessionId& id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = active_.find(id);
  if (it != active_.end()) return snapshotOf(id, it->second);
  auto done = outcomes_.find(id);
  if (done != outcomes_.end()) return done->second.second;
  return std::nullopt;
}

void SessionRegistry::remove(const SessionId& id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = active_.find(id);
  if (it != active_.end()) {
    it->second.cancel->signal();
    active_.erase(it);
    terminalCv_.notify_all();
  }
  dropOutcomeLocked(id);
}

bool SessionRegistry::activate(const Handle& handle) {
  std::lock_guard<std::mutex> lock(mutex_);
  Entry* entry = findLocked(handle);
  if (entry == nullptr) return false;
  if (!canTransition(entry->state, SessionState::Active)) {
    LOG(WARN) << "Session " << handle.id << " cannot become active from "
              << toString(entry->state);
    return false;
  }
  entry->state = SessionState::Active;
  LOG(INFO) << "Session " << handle.id << " active";
  return true;
}

SessionRegistry::UpdateResult SessionRegistry::setTotal(const Handle& handle,
                                                        uint64_t total) {
  std::lock_guard<std::mutex> lock(mutex_);
  Entry* entry = findLocked(handle);
  if (entry == nullptr || entry->state != SessionState::Active) {
    return UpdateResult::Stale;
  }
  if (!entry->progress.setTotal(total)) {
    LOG(WARN) << "Session " << handle.id << " rejected total " << total
              << " (counted " << entry->progress.downloadedBytes() << ")";
    return UpdateResult::ExceedsTotal;
  }
  return UpdateResult::Ok;
}

SessionRegistry::UpdateResult SessionRegistry::advance(const Handle& handle,
                                                       uint64_t n) {
  std::lock_guard<std::mutex> lock(mutex_);
  Entry* entry = findLocked(handle);
  if (entry == nullptr || entry->state != SessionState::Active) {
    return UpdateResult::Stale;
  }
  if (entry->progress.advance(n) ==
      ProgressAccumulator::AdvanceResult::ExceedsTotal) {
    return UpdateResult::ExceedsTotal;
  }
  return UpdateResult::Ok;
}

bool SessionRegistry::setFilePath(const Handle& handle,
                                  const std::filesystem::path& path) {
  std::lock_guard<std::mutex> lock(mutex_);
  Entry* entry = findLocked(handle);
  if (entry == nullptr) return false;
  entry->filePath = path;
  return true;
}

bool SessionRegistry::cancellationRequested(const Handle& handle) const {
  if (handle.cancel && handle.cancel->isSignalled()) return true;
  std::lock_guard<std::mutex> lock(mutex_);
  return findLocked(handle) == nullptr;
}

SessionRegistry::CommitResult SessionRegistry::complete(
    const Handle& handle, const std::filesystem::path& artifact) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    Entry* entry = findLocked(handle);
    if (entry == nullptr) return CommitResult::Stale;
    if (entry->cancel->isSignalled()) return CommitResult::Cancelled;
    if (!canTransition(entry->state, SessionState::Completed)) {
      LOG(WARN) << "Session " << handle.id << " cannot complete from "
                << toString(entry->state);
      return CommitResult::Cancelled;
    }

    entry->state = SessionState::Completed;
    entry->filePath = artifact;
    artifacts_.insert(handle.id, artifact);

    SessionSnapshot snapshot = snapshotOf(handle.id, *entry);
    LOG(INFO) << "Session " << handle.id << " completed: "
              << snapshot.downloadedBytes << " bytes, artifact "
              << artifact.string();
    active_.erase(handle.id);
    retainLocked(std::move(snapshot), handle.generation);
    terminalCv_.notify_all();
  }
  // 落盘不占用注册表锁
  artifacts_.persist();
  return CommitResult::Committed;
}

bool SessionRegistry::finish(const Handle& handle, SessionState terminal,
                             const std::string& error) {
  std::lock_guard<std::mutex> lock(mutex_);
  Entry* entry = findLocked(handle);
  if (entry == nullptr) return false;
  if (terminal == SessionState::Completed ||
      !canTransition(entry->state, terminal)) {
    LOG(WARN) << "Session " << handle.id << " refused transition "
              << toString(entry->state) << " -> " << toString(terminal);
    return false;
  }

  entry->state = terminal;
  SessionSnapshot snapshot = snapshotOf(handle.id, *entry);
  snapshot.error = error;
  if (terminal == SessionState::Failed) {
    LOG(ERROR) << "Session " << handle.id << " failed: " << error;
  } else {
    LOG(INFO) << "Session " << handle.id << " " << toString(terminal) << " at "
              << snapshot.downloadedBytes << "/" << snapshot.totalBytes
              << " bytes";
  }
  active_.erase(handle.id);
  retainLocked(std::move(snapshot), handle.generation);
  terminalCv_.notify_all();
  return true;
}

SessionRegistry::CancelResult SessionRegistry::signal(const SessionId& id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = active_.find(id);
  if (it == active_.end()) return CancelResult::NotFound;
  if (!it->second.cancel->signal()) {
    LOG(DEBUG) << "Session " << id << " already cancelling";
    return CancelResult::NotFound;
  }
  LOG(INFO) << "Session " << id << " cancellation requested";
  return CancelResult::Accepted;
}

size_t SessionRegistry::cancelAll() {
  std::lock_guard<std::mutex> lock(mutex_);
  size_t signalled = 0;
  for (auto& kv : active_) {
    if (kv.second.cancel->signal()) ++signalled;
  }
  return signalled;
}

bool SessionRegistry::waitForTerminal(const SessionId& id,
                                      std::chrono::milliseconds timeout) const {
  std::unique_lock<std::mutex> lock(mutex_);
  bool drained = terminalCv_.wait_for(
      lock, timeout, [&]() { return active_.find(id) == active_.end(); });
  return drained && outcomes_.find(id) != outcomes_.end();
}

std::vector<SessionSnapshot> SessionRegistry::list() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<SessionSnapshot> result;
  result.reserve(active_.size() + outcomes_.size());
  for (const auto& kv : active_) result.push_back(snapshotOf(kv.first, kv.second));
  for (const auto& kv : outcomes_) result.push_back(kv.second.second);
  return result;
}

size_t SessionRegistry::activeCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return active_.size();
}

size_t SessionRegistry::retainedCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return outcomeOrder_.size();
}

SessionRegistry::Entry* SessionRegistry::findLocked(const Handle& handle) {
  auto it = active_.find(handle.id);
  if (it == active_.end() || it->second.generation != handle.generation) {
    return nullptr;
  }
  return &it->second;
}

const SessionRegistry::Entry* SessionRegistry::findLocked(
    const Handle& handle) const {
  auto it = active_.find(handle.id);
  if (it == active_.end() || it->second.generation != handle.generation) {
    return nullptr;
  }
  return &it->second;
}

SessionSnapshot SessionRegistry::snapshotOf(const SessionId& id,
                                            const Entry& entry) {
  SessionSnapshot snapshot;
  snapshot.id = id;
  snapshot.state = entry.state;
  snapshot.downloadedBytes = entry.progress.downloadedBytes();
  snapshot.totalBytes = entry.progress.totalBytes();
  // 完成态固定为 100%，总大小为 0 时也不做除法
  snapshot.percentage = entry.state == SessionState::Completed
                            ? 100
                            : entry.progress.percentage();
  snapshot.filePath = entry.filePath;
  return snapshot;
}

void SessionRegistry::retainLocked(SessionSnapshot snapshot,
                                   uint64_t generation) {
  if (retainedOutcomes_ == 0) return;
  SessionId id = snapshot.id;
  dropOutcomeLocked(id);
  outcomes_.emplace(id, std::make_pair(generation, std::move(snapshot)));
  outcomeOrder_.emplace_back(id, generation);

  while (outcomeOrder_.size() > retainedOutcomes_) {
    outcomes_.erase(outcomeOrder_.front().first);
    outcomeOrder_.pop_front();
  }
}

// outcomes_ 与 outcomeOrder_ 始终一一对应
void SessionRegistry::dropOutcomeLocked(const SessionId& id) {
  if (outcomes_.erase(id) == 0) return;
  for (auto it = outcomeOrder_.begin(); it != outcomeOrder_.end(); ++it) {
    if (it->first == id) {
      outcomeOrder_.erase(it);
      break;
    }
  }
}
