#include "CompletedArtifactIndex.hpp"

#include <fstream>
#include <nlohmann/json.hpp>
#include <system_error>

#include "logger.hpp"

using json = nlohmann::json;

CompletedArtifactIndex::CompletedArtifactIndex(std::filesystem::path persistFile)
    : persistFile_(std::move(persistFile)) {
  load();
}

void CompletedArtifactIndex::record(const SessionId& id,
                                    const std::filesystem::path& path) {
  insert(id, path);
  persist();
}

void CompletedArtifactIndex::insert(const SessionId& id,
                                    const std::filesystem::path& path) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = byId_.find(id);
  if (it != byId_.end()) {
    entries_[it->second].filePath = path;
  } else {
    byId_.emplace(id, entries_.size());
    entries_.push_back(CompletedArtifact{id, path});
  }
  LOG(INFO) << "Completed artifact recorded: " << id << " -> " << path.string();
}

std::vector<CompletedArtifact> CompletedArtifactIndex::list() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_;
}

std::optional<std::filesystem::path> CompletedArtifactIndex::get(
    const SessionId& id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = byId_.find(id);
  if (it == byId_.end()) return std::nullopt;
  return entries_[it->second].filePath;
}

size_t CompletedArtifactIndex::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_.size();
}

void CompletedArtifactIndex::load() {
  std::error_code ec;
  if (persistFile_.empty() || !std::filesystem::exists(persistFile_, ec)) {
    return;
  }
  std::ifstream ifs(persistFile_);
  if (!ifs) {
    LOG(ERROR) << "Cannot open completed index " << persistFile_.string();
    return;
  }
  try {
    json doc = json::parse(ifs);
    for (const auto& item : doc.at("completed")) {
      SessionId id = item.at("session_id").get<std::string>();
      std::filesystem::path path = item.at("path").get<std::string>();
      auto it = byId_.find(id);
      if (it != byId_.end()) {
        entries_[it->second].filePath = std::move(path);
        continue;
      }
      byId_.emplace(id, entries_.size());
      entries_.push_back(CompletedArtifact{std::move(id), std::move(path)});
    }
    LOG(INFO) << "Loaded " << entries_.size() << " completed artifacts from "
              << persistFile_.string();
  } catch (const json::exception& e) {
    LOG(ERROR) << "Ignoring malformed completed index "
               << persistFile_.string() << ": " << e.what();
    entries_.clear();
    byId_.clear();
  }
}

void CompletedArtifactIndex::persist() const {
  if (persistFile_.empty()) return;
  std::lock_guard<std::mutex> persistLock(persistMutex_);

  json doc;
  doc["completed"] = json::array();
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& entry : entries_) {
      doc["completed"].push_back(
          {{"session_id", entry.id}, {"path", entry.filePath.string()}});
    }
  }

  // 先写临时文件再改名，避免写一半的索引
  std::filesystem::path tmp = persistFile_;
  tmp += ".tmp";
  {
    std::ofstream ofs(tmp, std::ios::trunc);
    if (!ofs) {
      LOG(ERROR) << "Cannot write completed index " << tmp.string();
      return;
    }
    ofs << doc.dump(2);
    if (!ofs) {
      LOG(ERROR) << "Short write on completed index " << tmp.string();
      return;
    }
  }
  std::error_code ec;
  std::filesystem::rename(tmp, persistFile_, ec);
  if (ec) {
    LOG(ERROR) << "Cannot replace completed index " << persistFile_.string()
               << ": " << ec.message();
  }
}
