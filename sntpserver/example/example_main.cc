// Copyright (c) 2025 The SNTP Server Authors
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <memory>
#include <mutex>
#include <string>

#include "cli_options.hpp"
#include "sntpserver/ntp_server.hpp"
#include "sntpserver/system_clock.hpp"

namespace {
/**
 * @brief Thread-safe stderr logger; debug messages only with --debug.
 */
class Logger {
 public:
  explicit Logger(bool debug) : debug_(debug) {}

  void Log(sntpserver::LogLevel level, const std::string& msg) {
    if (level == sntpserver::LogLevel::kDebug && !debug_) return;
    std::lock_guard<std::mutex> lock(mutex_);
    std::fprintf(stderr, "[%s] %s\n", sntpserver::ToString(level),
                 msg.c_str());
  }

 private:
  bool debug_;
  std::mutex mutex_;
};

void PrintUsage() {
  std::fprintf(
      stderr,
      "Usage: sntpserver_example [--host H] [--port N] [--min-interval SEC]\n"
      "                          [--max-clients N] [--client-ttl SEC] "
      "[--debug]\n"
      "       --port 0-65535 (default 123), durations 0-1e9 seconds\n"
      "       Commands on stdin: help | stats | quit\n");
}

void PrintStats(const sntpserver::ServerStats& s) {
  std::printf(
      "received=%llu sent=%llu short=%llu rate_limited=%llu invalid=%llu "
      "recv_errors=%llu send_errors=%llu handler_errors=%llu clients=%llu\n",
      static_cast<unsigned long long>(s.packets_received),
      static_cast<unsigned long long>(s.packets_sent),
      static_cast<unsigned long long>(s.drop_short_packets),
      static_cast<unsigned long long>(s.drop_rate_limited),
      static_cast<unsigned long long>(s.drop_invalid_requests),
      static_cast<unsigned long long>(s.recv_errors),
      static_cast<unsigned long long>(s.send_errors),
      static_cast<unsigned long long>(s.handler_errors),
      static_cast<unsigned long long>(s.active_clients));
  if (!s.last_error.empty()) {
    std::printf("last_error=%s\n", s.last_error.c_str());
  }
}
}  // namespace

int main(int argc, char** argv) {
  sntpserver_example::CliOptions cli;
  std::string error;
  if (!sntpserver_example::ParseCommandLine(argc, argv, &cli, &error)) {
    std::fprintf(stderr, "%s\n", error.c_str());
    PrintUsage();
    return 2;
  }
  if (cli.show_help) {
    PrintUsage();
    return 0;
  }

  // Handlers outliving Stop() may still log; the sink owns the logger.
  auto logger = std::make_shared<Logger>(cli.debug);
  auto log_callback = [logger](sntpserver::LogLevel level,
                               const std::string& msg) {
    logger->Log(level, msg);
  };

  auto opts = sntpserver::Options::Builder()
                  .MinRequestInterval(cli.min_interval)
                  .ClientRetention(cli.client_ttl)
                  .MaxTrackedClients(cli.max_clients)
                  .LogSink(log_callback)
                  .Build();

  sntpserver::NtpServer server;
  if (!server.Start(cli.host, cli.port,
                    std::make_shared<sntpserver::SystemClock>(), opts)) {
    std::fprintf(stderr, "failed to start sntp server: %s\n",
                 server.GetStats().last_error.c_str());
    return 1;
  }
  std::printf("sntp server running on UDP %u\n", server.LocalPort());
  std::printf("stdin commands: help | stats | quit\n");

  char line[256];
  while (std::fgets(line, sizeof(line), stdin)) {
    size_t len = std::strlen(line);
    while (len && (line[len - 1] == '\n' || line[len - 1] == '\r'))
      line[--len] = 0;
    if (len == 0) continue;
    if (std::strcmp(line, "help") == 0) {
      PrintUsage();
      continue;
    }
    if (std::strcmp(line, "quit") == 0 || std::strcmp(line, "exit") == 0) {
      break;
    }
    if (std::strcmp(line, "stats") == 0) {
      PrintStats(server.GetStats());
      if (!server.IsRunning()) std::printf("server loop has stopped\n");
      continue;
    }
    std::fprintf(stderr, "unknown command: %s\n", line);
  }

  server.Stop();
  return 0;
}
