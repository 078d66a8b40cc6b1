#include <gflags/gflags.h>

#include <chrono>
#include <exception>
#include <iostream>
#include <memory>
#include <stdexcept>

#include "Engine/CurlTransferEngine.hpp"
#include "Server/HttpRouter.hpp"
#include "Server/HttpServer.hpp"
#include "Server/ServerConfig.hpp"
#include "Service/TransferService.hpp"
#include "logger.hpp"
#include "tbb_manager.hpp"
#include "timer.hpp"

DEFINE_string(dir, ".", "Download directory");
DEFINE_string(listen_address, "0.0.0.0", "Address to listen on");
DEFINE_int32(port, 8080, "Server port");
DEFINE_int32(http_threads, 2, "Threads serving HTTP requests");
DEFINE_string(credentials, "",
              "Basic auth users as user:pass,user2:pass2 (empty disables)");
DEFINE_uint64(chunk_size, 64 * 1024, "Bytes read per transfer step");
DEFINE_uint64(retained_sessions, 256,
              "Finished sessions whose final state stays queryable");
DEFINE_string(listed_extensions, ".mkv,.mp4",
              "Extensions listed by /files (empty lists every file)");
DEFINE_string(completed_index_file, "",
              "JSON file persisting completed downloads (empty: memory only)");
DEFINE_int64(status_interval_ms, 0,
             "Period of the active session status log (0 disables)");
DEFINE_string(log_dir, "logs", "Log directory (empty: console only)");
DEFINE_string(log_level, "info", "debug, info, warn, error or fatal");

namespace {

ServerConfig configFromFlags() {
  ServerConfig config;
  config.listenAddress = FLAGS_listen_address;
  config.port = FLAGS_port;
  config.httpThreads = FLAGS_http_threads;
  config.credentials = FLAGS_credentials;
  config.statusInterval = std::chrono::milliseconds(FLAGS_status_interval_ms);
  config.service.downloadRoot = FLAGS_dir;
  config.service.chunkSize = FLAGS_chunk_size;
  config.service.retainedOutcomes = FLAGS_retained_sessions;
  config.service.listedExtensions =
      ServerConfig::parseExtensions(FLAGS_listed_extensions);
  config.service.completedIndexFile = FLAGS_completed_index_file;

  config.log.logDir = FLAGS_log_dir;
  if (!utils::Logger::parseLevel(FLAGS_log_level, &config.log.minLevel)) {
    throw std::invalid_argument("unknown log_level '" + FLAGS_log_level + "'");
  }
  return config;
}

void reportStatus(const TransferService& service) {
  size_t active = 0;
  for (const auto& session : service.listSessions()) {
    if (isTerminal(session.state)) continue;
    ++active;
    LOG(INFO) << "[status] " << session.id << " " << toString(session.state)
              << " " << session.percentage << "% (" << session.downloadedBytes
              << "/" << session.totalBytes << ")";
  }
  LOG(DEBUG) << "[status] " << active << " live session(s)";
}

}  // namespace

int main(int argc, char* argv[]) {
  gflags::SetUsageMessage("HTTP service for cancellable background downloads");
  gflags::ParseCommandLineFlags(&argc, &argv, true);

  ServerConfig config;
  try {
    config = configFromFlags();
    config.validate();
  } catch (const std::exception& e) {
    std::cerr << "Invalid configuration: " << e.what() << std::endl;
    return 1;
  }

  // 日志初始化
  utils::Logger::initialize(config.log);

  try {
    auto engine = std::make_shared<CurlTransferEngine>();
    TransferService service(config.service, engine);
    HttpRouter router(service, config.parsedCredentials());
    if (config.parsedCredentials().enabled()) {
      LOG(INFO) << "Basic authentication enabled for "
                << config.parsedCredentials().size() << " user(s)";
    }

    utils::Timer statusTimer;
    if (statusTimer.addPeriodicTask(config.statusInterval, config.statusInterval,
                                    [&service]() { reportStatus(service); })) {
      statusTimer.start();
    }

    HttpServer server(router, config.listenAddress,
                      static_cast<unsigned short>(config.port),
                      config.httpThreads);
    server.run();

    statusTimer.stop();
    service.shutdown();
  } catch (const std::exception& e) {
    LOG(FATAL) << "Server stopped: " << e.what();
    utils::TBBManager::GetInstance().Release();
    return 1;
  }

  utils::TBBManager::GetInstance().Release();
  LOG(INFO) << "Server exited.";
  gflags::ShutDownCommandLineFlags();
  return 0;
}
