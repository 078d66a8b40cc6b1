#ifndef CURL_TRANSFER_ENGINE_HPP_
#define CURL_TRANSFER_ENGINE_HPP_

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "TransferEngine.hpp"

struct CurlEngineOptions {
  long connectTimeoutSec = 30;
  // Upper bound for one read() on a stalled transfer before it reports
  // Pending, so the caller gets to check for cancellation.
  int pollTimeoutMs = 200;
  std::string userAgent = "transfer-session-server/1.0";
};

/**
 * @brief libcurl backed engine.
 *
 * A locator is one or more URLs separated by whitespace. Every URL is probed
 * for its size (HEAD, in parallel on the "resolve" TBB arena) and becomes one
 * file named after the last segment of its path. Streams are driven through
 * the curl multi interface so a read never blocks longer than pollTimeoutMs.
 */
class CurlTransferEngine : public TransferEngine {
 public:
  explicit CurlTransferEngine(CurlEngineOptions options = CurlEngineOptions());

  std::vector<RemoteFile> resolve(const std::string& locator) override;
  std::unique_ptr<ByteStream> openStream(const RemoteFile& file) override;

  static std::vector<std::string> splitLocator(const std::string& locator);
  static std::string fileNameFromUrl(const std::string& url);

 private:
  // Returns -1 and fills *error when the size cannot be determined.
  int64_t probeSize(const std::string& url, std::string* error) const;

  CurlEngineOptions options_;
};

#endif  // CURL_TRANSFER_ENGINE_HPP_
