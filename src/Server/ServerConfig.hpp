#ifndef SERVER_CONFIG_HPP_
#define SERVER_CONFIG_HPP_

#include <chrono>
#include <string>
#include <vector>

#include "Credentials.hpp"
#include "Service/TransferService.hpp"
#include "logger.hpp"

struct ServerConfig {
  std::string listenAddress = "0.0.0.0";
  int port = 8080;
  int httpThreads = 2;
  std::string credentials;
  std::chrono::milliseconds statusInterval{0};
  ServiceOptions service;
  utils::LogConfig log;

  // Throws std::invalid_argument naming the offending setting. Creates the
  // download root if it does not exist yet.
  void validate() const;

  Credentials parsedCredentials() const;

  // ".mkv,MP4" -> {".mkv", ".mp4"}
  static std::vector<std::string> parseExtensions(const std::string& list);
};

#endif  // SERVER_CONFIG_HPP_
