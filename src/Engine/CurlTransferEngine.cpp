#include "CurlTransferEngine.hpp"

#include <curl/curl.h>

#include <algorithm>
#include <cstring>
#include <mutex>
#include <set>
#include <utility>

#include "logger.hpp"
#include "string_utils.hpp"
#include "tbb_manager.hpp"

namespace {

std::once_flag curl_init_flag;

// HEAD 响应头里的 Content-Length，跟随重定向时以最后一个响应为准
struct HeaderProbe {
  int64_t contentLength = -1;
};

size_t onProbeHeader(char* buffer, size_t size, size_t nitems, void* userdata) {
  auto* probe = static_cast<HeaderProbe*>(userdata);
  std::string line(buffer, size * nitems);
  if (utils::startsWithNoCase(line, "HTTP/")) {
    probe->contentLength = -1;
  } else if (utils::startsWithNoCase(line, "Content-Length:")) {
    std::string value = utils::trim(line.substr(std::strlen("Content-Length:")));
    try {
      probe->contentLength = static_cast<int64_t>(std::stoll(value));
    } catch (const std::exception&) {
      probe->contentLength = -1;
    }
  }
  return size * nitems;
}

class CurlByteStream : public ByteStream {
 public:
  CurlByteStream(const RemoteFile& file, const CurlEngineOptions& options)
      : url_(file.url), pollTimeoutMs_(options.pollTimeoutMs) {
    easy_ = curl_easy_init();
    multi_ = curl_multi_init();
    if (easy_ == nullptr || multi_ == nullptr) {
      close();
      throw TransferError(TransferError::Kind::IOFailure,
                          "curl initialisation failed for " + url_);
    }
    curl_easy_setopt(easy_, CURLOPT_URL, url_.c_str());
    curl_easy_setopt(easy_, CURLOPT_WRITEFUNCTION, &CurlByteStream::onWrite);
    curl_easy_setopt(easy_, CURLOPT_WRITEDATA, this);
    curl_easy_setopt(easy_, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(easy_, CURLOPT_FAILONERROR, 1L);
    curl_easy_setopt(easy_, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(easy_, CURLOPT_CONNECTTIMEOUT, options.connectTimeoutSec);
    curl_easy_setopt(easy_, CURLOPT_USERAGENT, options.userAgent.c_str());

    CURLMcode mc = curl_multi_add_handle(multi_, easy_);
    if (mc != CURLM_OK) {
      std::string reason = curl_multi_strerror(mc);
      curl_easy_cleanup(easy_);
      easy_ = nullptr;
      close();
      throw TransferError(TransferError::Kind::IOFailure,
                          "cannot start transfer of " + url_ + ": " + reason);
    }
    attached_ = true;
  }

  ~CurlByteStream() override { close(); }

  ReadResult read(char* buffer, size_t capacity) override {
    if (closed_) {
      throw TransferError(TransferError::Kind::IOFailure,
                          "read on closed stream " + url_);
    }
    if (offset_ == pending_.size()) {
      pending_.clear();
      offset_ = 0;
      if (!finished_) pump();
    }

    if (offset_ < pending_.size() && capacity > 0) {
      size_t n = std::min(capacity, pending_.size() - offset_);
      std::memcpy(buffer, pending_.data() + offset_, n);
      offset_ += n;
      return ReadResult{ReadStatus::Data, n};
    }
    if (finished_) {
      if (result_ != CURLE_OK) {
        throw TransferError(TransferError::Kind::IOFailure,
                            url_ + ": " + curl_easy_strerror(result_));
      }
      return ReadResult{ReadStatus::EndOfStream, 0};
    }
    return ReadResult{ReadStatus::Pending, 0};
  }

  void close() override {
    if (multi_ != nullptr && easy_ != nullptr && attached_) {
      curl_multi_remove_handle(multi_, easy_);
    }
    attached_ = false;
    if (easy_ != nullptr) {
      curl_easy_cleanup(easy_);
      easy_ = nullptr;
    }
    if (multi_ != nullptr) {
      curl_multi_cleanup(multi_);
      multi_ = nullptr;
    }
    closed_ = true;
  }

 private:
  static size_t onWrite(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* self = static_cast<CurlByteStream*>(userdata);
    self->pending_.append(ptr, size * nmemb);
    return size * nmemb;
  }

  void pump() {
    perform();
    if (pending_.empty() && !finished_) {
      // 没有数据时最多等待 pollTimeoutMs_，超时返回 Pending
      int numfds = 0;
      CURLMcode mc =
          curl_multi_poll(multi_, nullptr, 0, pollTimeoutMs_, &numfds);
      if (mc != CURLM_OK) {
        throw TransferError(TransferError::Kind::IOFailure,
                            url_ + ": " + curl_multi_strerror(mc));
      }
      perform();
    }
  }

  void perform() {
    int running = 0;
    CURLMcode mc = curl_multi_perform(multi_, &running);
    if (mc != CURLM_OK) {
      throw TransferError(TransferError::Kind::IOFailure,
                          url_ + ": " + curl_multi_strerror(mc));
    }
    int queued = 0;
    while (CURLMsg* msg = curl_multi_info_read(multi_, &queued)) {
      if (msg->msg == CURLMSG_DONE) {
        finished_ = true;
        result_ = msg->data.result;
      }
    }
  }

  std::string url_;
  int pollTimeoutMs_;
  CURL* easy_ = nullptr;
  CURLM* multi_ = nullptr;
  bool attached_ = false;
  bool closed_ = false;
  bool finished_ = false;
  CURLcode result_ = CURLE_OK;
  std::string pending_;
  size_t offset_ = 0;
};

}  // namespace

CurlTransferEngine::CurlTransferEngine(CurlEngineOptions options)
    : options_(std::move(options)) {
  std::call_once(curl_init_flag, []() {
    CURLcode res = curl_global_init(CURL_GLOBAL_DEFAULT);
    if (res != CURLE_OK) {
      LOG(ERROR) << "curl_global_init failed: " << curl_easy_strerror(res);
    }
  });
}

std::vector<std::string> CurlTransferEngine::splitLocator(
    const std::string& locator) {
  return utils::splitAny(locator, " \t\r\n");
}

std::string CurlTransferEngine::fileNameFromUrl(const std::string& url) {
  std::string path = url;
  auto scheme = path.find("://");
  if (scheme != std::string::npos) {
    auto slash = path.find('/', scheme + 3);
    path = slash == std::string::npos ? std::string() : path.substr(slash);
  }
  auto cut = path.find_first_of("?#");
  if (cut != std::string::npos) path.resize(cut);

  auto last = path.find_last_of('/');
  std::string name = utils::percentDecode(
      last == std::string::npos ? path : path.substr(last + 1));
  std::replace(name.begin(), name.end(), '\\', '_');
  std::replace(name.begin(), name.end(), '/', '_');
  if (name.empty() || name == "." || name == "..") name = "download";
  return name;
}

int64_t CurlTransferEngine::probeSize(const std::string& url,
                                      std::string* error) const {
  CURL* curl = curl_easy_init();
  if (!curl) {
    *error = "curl_easy_init failed";
    return -1;
  }
  HeaderProbe probe;
  curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl, CURLOPT_NOBODY, 1L);
  curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
  curl_easy_setopt(curl, CURLOPT_FAILONERROR, 1L);
  curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, options_.connectTimeoutSec);
  curl_easy_setopt(curl, CURLOPT_USERAGENT, options_.userAgent.c_str());
  curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, onProbeHeader);
  curl_easy_setopt(curl, CURLOPT_HEADERDATA, &probe);

  CURLcode res = curl_easy_perform(curl);
  curl_off_t length = -1;
  if (res == CURLE_OK) {
    curl_easy_getinfo(curl, CURLINFO_CONTENT_LENGTH_DOWNLOAD_T, &length);
  }
  curl_easy_cleanup(curl);

  if (res != CURLE_OK) {
    *error = url + ": " + curl_easy_strerror(res);
    return -1;
  }
  if (length < 0) length = probe.contentLength;
  if (length < 0) {
    *error = url + ": size unknown";
    return -1;
  }
  return static_cast<int64_t>(length);
}

std::vector<RemoteFile> CurlTransferEngine::resolve(const std::string& locator) {
  std::vector<std::string> urls = splitLocator(locator);
  if (urls.empty()) {
    throw TransferError(TransferError::Kind::ResolutionFailure,
                        "empty locator");
  }

  std::vector<int64_t> sizes(urls.size(), -1);
  std::vector<std::string> errors(urls.size());

  // 并行探测每个文件的大小
  size_t crashed = utils::TBBManager::GetInstance().ParallelFor(
      "resolve", size_t(0), urls.size(),
      [&](size_t idx) { sizes[idx] = probeSize(urls[idx], &errors[idx]); });
  if (crashed > 0) {
    throw TransferError(TransferError::Kind::ResolutionFailure,
                        "size probe aborted for " + std::to_string(crashed) +
                            " file(s)");
  }

  std::vector<RemoteFile> files;
  std::set<std::string> usedNames;
  for (size_t i = 0; i < urls.size(); ++i) {
    if (sizes[i] < 0) {
      throw TransferError(TransferError::Kind::ResolutionFailure, errors[i]);
    }
    std::string name = fileNameFromUrl(urls[i]);
    if (!usedNames.insert(name).second) {
      name = std::to_string(i) + "-" + name;
      usedNames.insert(name);
    }
    LOG(INFO) << "Resolved " << urls[i] << " -> " << name << " (" << sizes[i]
              << " bytes)";
    files.push_back(RemoteFile{urls[i], name, static_cast<uint64_t>(sizes[i])});
  }
  return files;
}

std::unique_ptr<ByteStream> CurlTransferEngine::openStream(
    const RemoteFile& file) {
  return std::make_unique<CurlByteStream>(file, options_);
}
