#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <unordered_set>
#include <vector>

#include "model/control_status.hpp"

struct redisContext;
struct redisReply;

namespace heat_agent::sinks {

struct RedisTsOptions {
  std::string host{"127.0.0.1"};
  std::uint16_t port{6379};
  std::string unix_socket{};
  std::string password{};
  int db{0};
  std::string key_prefix{"heat:agent"};
  // 0 keeps samples forever.
  std::uint64_t retention_ms{0};
  std::uint32_t connect_timeout_ms{1000};
  bool publish_health{true};
};

// Publishes cycle diagnostics to RedisTimeSeries with one TS.MADD per cycle.
class RedisTsSink {
 public:
  explicit RedisTsSink(RedisTsOptions options = {});
  ~RedisTsSink();

  RedisTsSink(const RedisTsSink&) = delete;
  RedisTsSink& operator=(const RedisTsSink&) = delete;
  RedisTsSink(RedisTsSink&&) noexcept;
  RedisTsSink& operator=(RedisTsSink&&) noexcept;

  bool check_connectivity();
  bool publish(const model::CycleReport& report);

  [[nodiscard]] float last_latency_ms() const noexcept { return last_latency_ms_; }

 private:
  struct ContextDeleter {
    void operator()(redisContext* context) const;
  };

  bool ensure_connected();
  bool reconnect();
  bool run_setup_command(const char* what, redisReply* reply);
  bool prepare_session();
  bool ensure_schema();
  bool publish_impl(const model::CycleReport& report);
  void reserve_command_buffers();

  RedisTsOptions options_;
  std::vector<std::string> metric_suffixes_;
  std::unordered_set<std::string> metric_set_;
  std::unique_ptr<redisContext, ContextDeleter> context_;
  std::vector<std::string> command_args_;
  std::vector<const char*> command_argv_;
  std::vector<std::size_t> command_argv_len_;
  float last_latency_ms_{0.0F};
  bool timeseries_available_{true};
  bool schema_ready_{false};
};

}  // namespace heat_agent::sinks
