#include "TransferService.hpp"

#include <algorithm>
#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <cctype>
#include <mutex>
#include <system_error>
#include <utility>

#include "Session/SessionWorker.hpp"
#include "logger.hpp"
#include "string_utils.hpp"

namespace {

constexpr size_t kMaxSessionIdLength = 128;

bool isPartialFile(const std::filesystem::path& path) {
  return path.extension() == ".part";
}

// 判断 candidate 是否位于 root 之内（两者均已规范化）
bool isWithin(const std::filesystem::path& root,
              const std::filesystem::path& candidate) {
  auto rootIt = root.begin();
  auto candIt = candidate.begin();
  for (; rootIt != root.end(); ++rootIt, ++candIt) {
    if (rootIt->empty()) continue;  // trailing separator
    if (candIt == candidate.end() || *rootIt != *candIt) return false;
  }
  return candIt != candidate.end();
}

}  // namespace

TransferService::TransferService(ServiceOptions options,
                                 std::shared_ptr<TransferEngine> engine)
    : options_(std::move(options)),
      engine_(std::move(engine)),
      artifacts_(options_.completedIndexFile),
      registry_(artifacts_, options_.retainedOutcomes) {
  for (auto& ext : options_.listedExtensions) {
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    if (!ext.empty() && ext.front() != '.') ext.insert(ext.begin(), '.');
  }
  LOG(INFO) << "Transfer service ready, download root "
            << options_.downloadRoot.string();
}

TransferService::~TransferService() { shutdown(); }

StartResult TransferService::startSession(const SessionId& sessionId,
                                          const std::string& locator) {
  StartResult result;
  if (stopping_.load()) {
    result.reason = "service is shutting down";
    return result;
  }
  if (utils::trim(locator).empty()) {
    result.reason = "locator is required";
    return result;
  }
  if (sessionId.size() > kMaxSessionIdLength) {
    result.reason = "sessionID is too long";
    return result;
  }

  SessionId id = sessionId.empty() ? generateSessionId() : sessionId;
  SessionRegistry::Handle handle = registry_.create(id);

  WorkerOptions workerOptions;
  workerOptions.downloadRoot = options_.downloadRoot;
  workerOptions.chunkSize = options_.chunkSize;

  bool spawned = workers_.spawn(
      "session-" + id, [this, handle, locator, workerOptions]() {
        SessionWorker worker(registry_, *engine_, handle, locator,
                             workerOptions);
        worker.run();
      });
  if (!spawned) {
    registry_.remove(id);
    result.reason = "service is shutting down";
    return result;
  }

  LOG(INFO) << "Session " << id << " started for " << locator;
  result.accepted = true;
  result.sessionId = id;
  return result;
}

std::optional<SessionSnapshot> TransferService::getProgress(
    const SessionId& sessionId) const {
  return registry_.get(sessionId);
}

SessionRegistry::CancelResult TransferService::cancelSession(
    const SessionId& sessionId) {
  return registry_.signal(sessionId);
}

std::vector<CompletedArtifact> TransferService::listCompleted() const {
  return artifacts_.list();
}

std::optional<std::filesystem::path> TransferService::fetchArtifact(
    const std::string& key) const {
  if (key.empty()) return std::nullopt;
  std::error_code ec;

  if (auto recorded = artifacts_.get(key)) {
    if (std::filesystem::is_regular_file(*recorded, ec)) return recorded;
    LOG(WARN) << "Completed artifact of " << key << " is gone: "
              << recorded->string();
    return std::nullopt;
  }

  std::filesystem::path relative(key);
  if (relative.is_absolute() || isPartialFile(relative)) return std::nullopt;

  auto root = std::filesystem::weakly_canonical(options_.downloadRoot, ec);
  if (ec) return std::nullopt;
  auto candidate = std::filesystem::weakly_canonical(root / relative, ec);
  if (ec || !isWithin(root, candidate)) return std::nullopt;
  if (!std::filesystem::is_regular_file(candidate, ec)) return std::nullopt;
  return candidate;
}

std::vector<std::string> TransferService::listFiles() const {
  std::vector<std::string> files;
  std::error_code ec;
  std::filesystem::recursive_directory_iterator it(
      options_.downloadRoot,
      std::filesystem::directory_options::skip_permission_denied, ec);
  if (ec) {
    LOG(ERROR) << "Cannot list " << options_.downloadRoot.string() << ": "
               << ec.message();
    return files;
  }
  for (; it != std::filesystem::recursive_directory_iterator();
       it.increment(ec)) {
    if (ec) {
      LOG(ERROR) << "Listing " << options_.downloadRoot.string()
                 << " stopped: " << ec.message();
      break;
    }
    std::error_code typeEc;
    if (!it->is_regular_file(typeEc) || !listed(it->path())) continue;
    files.push_back(
        it->path().lexically_relative(options_.downloadRoot).generic_string());
  }
  std::sort(files.begin(), files.end());
  return files;
}

std::vector<SessionSnapshot> TransferService::listSessions() const {
  auto sessions = registry_.list();
  std::sort(sessions.begin(), sessions.end(),
            [](const SessionSnapshot& a, const SessionSnapshot& b) {
              return a.id < b.id;
            });
  return sessions;
}

bool TransferService::waitForSession(const SessionId& sessionId,
                                     std::chrono::milliseconds timeout) const {
  return registry_.waitForTerminal(sessionId, timeout);
}

void TransferService::shutdown() {
  if (stopping_.exchange(true)) return;
  size_t signalled = registry_.cancelAll();
  LOG(INFO) << "Transfer service stopping, cancelled " << signalled
            << " live session(s)";
  workers_.shutdown();
}

SessionId TransferService::generateSessionId() {
  // random_generator 不是线程安全的
  static std::mutex generatorMutex;
  static boost::uuids::random_generator generator;
  std::lock_guard<std::mutex> lock(generatorMutex);
  return boost::uuids::to_string(generator());
}

bool TransferService::listed(const std::filesystem::path& path) const {
  if (isPartialFile(path)) return false;
  if (options_.listedExtensions.empty()) return true;
  std::string ext = path.extension().string();
  std::transform(ext.begin(), ext.end(), ext.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return std::find(options_.listedExtensions.begin(),
                   options_.listedExtensions.end(),
                   ext) != options_.listedExtensions.end();
}
