#ifndef TRANSFER_ENGINE_HPP_
#define TRANSFER_ENGINE_HPP_

#include <cstddef>
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

class TransferError : public std::runtime_error {
 public:
  enum class Kind { ResolutionFailure, IOFailure };

  TransferError(Kind kind, const std::string& what)
      : std::runtime_error(what), kind_(kind) {}

  Kind kind() const { return kind_; }

 private:
  Kind kind_;
};

const char* toString(TransferError::Kind kind);

// One constituent file of a resolved locator.
struct RemoteFile {
  std::string url;
  std::string relativePath;  // relative to the download root
  uint64_t size = 0;
};

enum class ReadStatus {
  Data,         // bytes > 0 were copied out
  Pending,      // nothing available yet, stream still open
  EndOfStream,  // no more data will ever arrive
};

struct ReadResult {
  ReadStatus status;
  size_t bytes;
};

class ByteStream {
 public:
  virtual ~ByteStream() = default;

  // Never returns Data with zero bytes. Throws TransferError(IOFailure).
  virtual ReadResult read(char* buffer, size_t capacity) = 0;

  // Aborts the transfer and releases its resources. Idempotent.
  virtual void close() = 0;
};

class TransferEngine {
 public:
  virtual ~TransferEngine() = default;

  // Throws TransferError(ResolutionFailure).
  virtual std::vector<RemoteFile> resolve(const std::string& locator) = 0;

  // Throws TransferError(IOFailure).
  virtual std::unique_ptr<ByteStream> openStream(const RemoteFile& file) = 0;
};

#endif  // TRANSFER_ENGINE_HPP_
