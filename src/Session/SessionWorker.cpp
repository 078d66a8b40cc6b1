#include "SessionWorker.hpp"

#include <fstream>
#include <limits>
#include <memory>
#include <system_error>
#include <thread>
#include <utility>

#include "logger.hpp"

SessionWorker::SessionWorker(SessionRegistry& registry, TransferEngine& engine,
                             SessionRegistry::Handle handle,
                             std::string locator, WorkerOptions options)
    : registry_(registry),
      engine_(engine),
      handle_(std::move(handle)),
      locator_(std::move(locator)),
      options_(std::move(options)) {
  if (options_.chunkSize == 0) options_.chunkSize = 64 * 1024;
}

SessionState SessionWorker::run() {
  if (!registry_.activate(handle_)) {
    LOG(INFO) << "Session " << handle_.id << " superseded before it started";
    return SessionState::Cancelled;
  }

  try {
    if (registry_.cancellationRequested(handle_)) return cancelled();

    // 解析：获取文件列表和总大小
    std::vector<RemoteFile> files = engine_.resolve(locator_);
    if (files.empty()) {
      throw TransferError(TransferError::Kind::ResolutionFailure,
                          "locator resolved to no files");
    }
    uint64_t total = 0;
    for (const auto& file : files) {
      if (file.size > std::numeric_limits<uint64_t>::max() - total) {
        throw TransferError(TransferError::Kind::ResolutionFailure,
                            "resource size overflows 64 bits");
      }
      total += file.size;
    }
    switch (registry_.setTotal(handle_, total)) {
      case SessionRegistry::UpdateResult::Ok:
        break;
      case SessionRegistry::UpdateResult::Stale:
        return cancelled();
      case SessionRegistry::UpdateResult::ExceedsTotal:
        throw TransferError(TransferError::Kind::ResolutionFailure,
                            "total size rejected");
    }
    LOG(INFO) << "Session " << handle_.id << ": " << files.size()
              << " file(s), " << total << " bytes";

    // 逐个文件传输，按解析顺序
    std::vector<char> buffer(options_.chunkSize);
    std::filesystem::path lastTarget;
    for (size_t i = 0; i < files.size(); ++i) {
      std::filesystem::path target = options_.downloadRoot / files[i].relativePath;
      LOG(INFO) << "Session " << handle_.id << ": file " << (i + 1) << "/"
                << files.size() << " " << files[i].url << " -> "
                << target.string();
      if (transferFile(files[i], target, buffer) == FileOutcome::Cancelled) {
        return cancelled();
      }
      lastTarget = target;
    }

    switch (registry_.complete(handle_, lastTarget)) {
      case SessionRegistry::CommitResult::Committed:
        return SessionState::Completed;
      case SessionRegistry::CommitResult::Cancelled:
        // 最后一块写完后才收到取消，产物同样不能保留
        discard(lastTarget);
        return cancelled();
      case SessionRegistry::CommitResult::Stale:
        // 会话已被重启，目标路径可能已属于新的一代
        LOG(INFO) << "Session " << handle_.id << " generation "
                  << handle_.generation << " superseded at commit, leaving "
                  << lastTarget.string() << " to its successor";
        return SessionState::Cancelled;
    }
    return cancelled();
  } catch (const TransferError& e) {
    return failed(std::string(toString(e.kind())) + ": " + e.what());
  } catch (const std::exception& e) {
    return failed(std::string("I/O failure: ") + e.what());
  }
}

SessionWorker::FileOutcome SessionWorker::transferFile(
    const RemoteFile& file, const std::filesystem::path& target,
    std::vector<char>& buffer) {
  std::error_code ec;
  if (target.has_parent_path()) {
    std::filesystem::create_directories(target.parent_path(), ec);
    if (ec) {
      throw TransferError(TransferError::Kind::IOFailure,
                          "cannot create directory " +
                              target.parent_path().string() + ": " +
                              ec.message());
    }
  }
  registry_.setFilePath(handle_, target);

  std::unique_ptr<ByteStream> stream = engine_.openStream(file);
  const std::filesystem::path partial = partialPathFor(target);
  std::ofstream sink(partial, std::ios::binary | std::ios::trunc);
  if (!sink) {
    stream->close();
    throw TransferError(TransferError::Kind::IOFailure,
                        "cannot create " + partial.string());
  }

  uint64_t received = 0;
  try {
    while (true) {
      if (registry_.cancellationRequested(handle_)) {
        stream->close();
        sink.close();
        discard(partial);
        return FileOutcome::Cancelled;
      }

      ReadResult result = stream->read(buffer.data(), buffer.size());
      if (result.status == ReadStatus::EndOfStream) break;
      if (result.status == ReadStatus::Pending || result.bytes == 0) {
        std::this_thread::sleep_for(options_.pendingBackoff);
        continue;
      }

      if (result.bytes > file.size - received) {
        throw TransferError(TransferError::Kind::IOFailure,
                            file.url + " delivered more than its declared " +
                                std::to_string(file.size) + " bytes");
      }
      sink.write(buffer.data(), static_cast<std::streamsize>(result.bytes));
      if (!sink) {
        throw TransferError(TransferError::Kind::IOFailure,
                            "write failed on " + partial.string());
      }
      received += result.bytes;

      if (registry_.advance(handle_, result.bytes) ==
          SessionRegistry::UpdateResult::ExceedsTotal) {
        throw TransferError(TransferError::Kind::IOFailure,
                            "stream exceeded declared size");
      }
      // Stale 的情况由下一轮的取消检查处理
    }

    stream->close();
    sink.close();
    if (sink.fail()) {
      throw TransferError(TransferError::Kind::IOFailure,
                          "cannot flush " + partial.string());
    }
    if (received != file.size) {
      throw TransferError(TransferError::Kind::IOFailure,
                          file.url + " ended after " + std::to_string(received) +
                              " of " + std::to_string(file.size) + " bytes");
    }
    std::filesystem::rename(partial, target, ec);
    if (ec) {
      throw TransferError(TransferError::Kind::IOFailure,
                          "cannot move " + partial.string() + " to " +
                              target.string() + ": " + ec.message());
    }
  } catch (...) {
    stream->close();
    if (sink.is_open()) sink.close();
    discard(partial);
    throw;
  }
  return FileOutcome::Done;
}

std::filesystem::path SessionWorker::partialPathFor(
    const std::filesystem::path& target) const {
  std::filesystem::path partial = target;
  partial += "." + std::to_string(handle_.generation) + ".part";
  return partial;
}

void SessionWorker::discard(const std::filesystem::path& path) const {
  std::error_code ec;
  if (!std::filesystem::remove(path, ec) && ec) {
    LOG(ERROR) << "Session " << handle_.id << ": cannot delete "
               << path.string() << ": " << ec.message();
  }
}

SessionState SessionWorker::cancelled() {
  if (!registry_.finish(handle_, SessionState::Cancelled)) {
    LOG(INFO) << "Session " << handle_.id << " generation "
              << handle_.generation << " stopped after being superseded";
  }
  return SessionState::Cancelled;
}

SessionState SessionWorker::failed(const std::string& reason) {
  if (!registry_.finish(handle_, SessionState::Failed, reason)) {
    LOG(WARN) << "Session " << handle_.id << " generation "
              << handle_.generation << " failed after being superseded: "
              << reason;
  }
  return SessionState::Failed;
}
