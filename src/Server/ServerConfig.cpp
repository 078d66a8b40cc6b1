#include "ServerConfig.hpp"

#include <algorithm>
#include <boost/asio/ip/address.hpp>
#include <boost/system/error_code.hpp>
#include <cctype>
#include <filesystem>
#include <stdexcept>
#include <system_error>

#include "string_utils.hpp"
#include "tbb_manager.hpp"

void ServerConfig::validate() const {
  if (port <= 0 || port > 65535) {
    throw std::invalid_argument("port must be in 1..65535, got " +
                                std::to_string(port));
  }
  if (httpThreads <= 0) {
    throw std::invalid_argument("http_threads must be positive");
  }
  boost::system::error_code addrEc;
  boost::asio::ip::make_address(listenAddress, addrEc);
  if (addrEc) {
    throw std::invalid_argument("listen_address '" + listenAddress +
                                "' is not an IP address");
  }
  if (service.chunkSize == 0) {
    throw std::invalid_argument("chunk_size must be positive");
  }
  if (statusInterval.count() < 0) {
    throw std::invalid_argument("status_interval_ms must not be negative");
  }

  std::error_code ec;
  if (service.downloadRoot.empty()) {
    throw std::invalid_argument("dir must not be empty");
  }
  std::filesystem::create_directories(service.downloadRoot, ec);
  if (ec || !std::filesystem::is_directory(service.downloadRoot, ec)) {
    throw std::invalid_argument("download directory " +
                                service.downloadRoot.string() +
                                " is not usable");
  }

  // 格式错误时抛出异常
  Credentials::parse(credentials);
  utils::TBBManager::ParseParallelCountDefines(
      FLAGS_custom_tbb_parallel_control);
}

Credentials ServerConfig::parsedCredentials() const {
  return Credentials::parse(credentials);
}

std::vector<std::string> ServerConfig::parseExtensions(const std::string& list) {
  std::vector<std::string> extensions;
  for (auto ext : utils::splitAny(list, ", ")) {
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    if (ext.front() != '.') ext.insert(ext.begin(), '.');
    extensions.push_back(ext);
  }
  return extensions;
}
