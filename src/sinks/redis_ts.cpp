#include "sinks/redis_ts.hpp"

#include "core/timestamp.hpp"

#include <chrono>
#include <cmath>
#include <cstddef>
#include <iostream>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <hiredis/hiredis.h>

namespace heat_agent::sinks {
namespace {

constexpr std::size_t kMaxMetricCount = 24;
constexpr std::size_t kMaxCommandArgCount = 1 + (kMaxMetricCount * 3);

double sanitize_value(const double value) {
  return std::isfinite(value) ? value : 0.0;
}

void add_metric_args(std::vector<std::string>& args, const std::string& key_prefix,
                     const std::uint64_t timestamp_ms, const char* suffix, const double value) {
  args.emplace_back(key_prefix + ":" + suffix);
  args.emplace_back(std::to_string(timestamp_ms));
  args.emplace_back(std::to_string(value));
}

std::vector<std::string> metric_suffixes(const bool publish_health) {
  std::vector<std::string> suffixes = {
      "status",
      "confidence",
      "outlet:final",
      "outlet:suggested",
      "indoor:predicted",
      "indoor:actual",
      "blocking:active",
      "solver:degraded",
      "learner:stability_warning",
      "corrector:open_window",
  };
  if (publish_health) {
    suffixes.emplace_back("health:parameter_stability");
    suffixes.emplace_back("health:prediction_consistency");
    suffixes.emplace_back("health:physics_alignment");
    suffixes.emplace_back("health:model");
    suffixes.emplace_back("health:learning_progress");
    suffixes.emplace_back("health:mae");
    suffixes.emplace_back("agent:redis_latency");
  }
  return suffixes;
}

}  // namespace

RedisTsSink::RedisTsSink(RedisTsOptions options) : options_(std::move(options)) {
  metric_suffixes_ = metric_suffixes(options_.publish_health);
  metric_set_ = std::unordered_set<std::string>(metric_suffixes_.begin(), metric_suffixes_.end());
  reserve_command_buffers();
}

RedisTsSink::~RedisTsSink() = default;

RedisTsSink::RedisTsSink(RedisTsSink&&) noexcept = default;
RedisTsSink& RedisTsSink::operator=(RedisTsSink&&) noexcept = default;

bool RedisTsSink::check_connectivity() {
  return ensure_connected();
}

void RedisTsSink::ContextDeleter::operator()(redisContext* context) const {
  if (context != nullptr) {
    redisFree(context);
  }
}

bool RedisTsSink::ensure_connected() {
  if (!timeseries_available_) {
    return false;
  }

  if (context_ != nullptr && context_->err == REDIS_OK) {
    return true;
  }
  return reconnect();
}

bool RedisTsSink::reconnect() {
  context_.reset();

  timeval timeout{};
  timeout.tv_sec = static_cast<time_t>(options_.connect_timeout_ms / 1000);
  timeout.tv_usec = static_cast<suseconds_t>((options_.connect_timeout_ms % 1000) * 1000);

  redisContext* raw = nullptr;
  if (!options_.unix_socket.empty()) {
    raw = redisConnectUnixWithTimeout(options_.unix_socket.c_str(), timeout);
  } else {
    raw = redisConnectWithTimeout(options_.host.c_str(), static_cast<int>(options_.port), timeout);
  }
  if (raw == nullptr || raw->err != REDIS_OK) {
    if (raw != nullptr) {
      std::cerr << "[redis] connect failed: " << raw->errstr << '\n';
      redisFree(raw);
    } else {
      std::cerr << "[redis] connect failed: out of memory\n";
    }
    return false;
  }

  context_.reset(raw);
  if (!prepare_session() || !ensure_schema()) {
    context_.reset();
    return false;
  }

  return true;
}

bool RedisTsSink::run_setup_command(const char* what, redisReply* reply) {
  if (reply == nullptr) {
    std::cerr << "[redis] " << what << " failed: " << (context_->errstr[0] != '\0' ? context_->errstr : "no reply")
              << '\n';
    return false;
  }
  const bool ok = reply->type != REDIS_REPLY_ERROR;
  if (!ok) {
    std::cerr << "[redis] " << what << " rejected: " << (reply->str != nullptr ? reply->str : "unknown") << '\n';
  }
  freeReplyObject(reply);
  return ok;
}

bool RedisTsSink::prepare_session() {
  if (!options_.password.empty() &&
      !run_setup_command("AUTH", static_cast<redisReply*>(
                                     redisCommand(context_.get(), "AUTH %s", options_.password.c_str())))) {
    return false;
  }
  if (options_.db != 0 &&
      !run_setup_command("SELECT", static_cast<redisReply*>(redisCommand(context_.get(), "SELECT %d", options_.db)))) {
    return false;
  }
  return true;
}

// Every series is labelled with the key prefix so one house can be queried with TS.MRANGE.
bool RedisTsSink::ensure_schema() {
  if (schema_ready_) {
    return true;
  }

  const std::string retention = std::to_string(options_.retention_ms);
  for (const auto& suffix : metric_suffixes_) {
    const std::string key = options_.key_prefix + ":" + suffix;
    redisReply* reply = static_cast<redisReply*>(
        redisCommand(context_.get(), "TS.CREATE %s RETENTION %s DUPLICATE_POLICY LAST LABELS site %s metric %s",
                     key.c_str(), retention.c_str(), options_.key_prefix.c_str(), suffix.c_str()));
    if (reply == nullptr) {
      return false;
    }

    const std::string message = reply->type == REDIS_REPLY_ERROR && reply->str != nullptr ? reply->str : "";
    freeReplyObject(reply);
    if (message.empty() || message.find("already exists") != std::string::npos) {
      continue;
    }
    if (message.find("unknown command") != std::string::npos) {
      std::cerr << "[redis] RedisTimeSeries module not loaded; diagnostics publishing disabled\n";
      timeseries_available_ = false;
      return false;
    }
    std::cerr << "[redis] TS.CREATE " << key << " rejected: " << message << '\n';
    return false;
  }

  schema_ready_ = true;
  return true;
}

bool RedisTsSink::publish(const model::CycleReport& report) {
  if (!ensure_connected()) {
    return false;
  }

  if (publish_impl(report)) {
    return true;
  }

  if (!reconnect()) {
    return false;
  }
  return publish_impl(report);
}

bool RedisTsSink::publish_impl(const model::CycleReport& report) {
  const std::uint64_t timestamp_ms = core::unix_timestamp_now_ns() / 1'000'000ULL;

  command_args_.clear();
  command_argv_.clear();
  command_argv_len_.clear();
  command_args_.emplace_back("TS.MADD");

  const auto append_metric = [&](const char* suffix, const double value) {
    if (metric_set_.find(suffix) == metric_set_.end()) {
      return;
    }
    add_metric_args(command_args_, options_.key_prefix, timestamp_ms, suffix, sanitize_value(value));
  };
  // Absent readings are skipped rather than written as zero.
  const auto append_optional = [&](const char* suffix, const std::optional<double>& value) {
    if (value.has_value()) {
      append_metric(suffix, *value);
    }
  };

  append_metric("status", static_cast<double>(static_cast<std::uint8_t>(report.status)));
  append_metric("confidence", report.confidence);
  append_optional("outlet:final", report.final_outlet_c);
  append_optional("outlet:suggested", report.suggested_outlet_c);
  append_optional("indoor:predicted", report.predicted_indoor_c);
  append_optional("indoor:actual", report.actual_indoor_c);
  append_metric("blocking:active", report.blocking_reasons.empty() ? 0.0 : 1.0);
  append_metric("solver:degraded", report.search_degraded ? 1.0 : 0.0);
  append_metric("learner:stability_warning", report.stability_warning ? 1.0 : 0.0);
  append_metric("corrector:open_window", report.open_window ? 1.0 : 0.0);

  if (options_.publish_health) {
    append_metric("health:parameter_stability", report.health.parameter_stability);
    append_metric("health:prediction_consistency", report.health.prediction_consistency);
    append_metric("health:physics_alignment", report.health.physics_alignment);
    append_metric("health:model", report.health.model_health);
    append_metric("health:learning_progress", report.health.learning_progress);
    append_metric("health:mae", report.health.mae_c);
    append_metric("agent:redis_latency", static_cast<double>(last_latency_ms_));
  }

  for (const auto& arg : command_args_) {
    command_argv_.push_back(arg.c_str());
    command_argv_len_.push_back(arg.size());
  }

  const auto publish_start = std::chrono::steady_clock::now();
  redisReply* reply = static_cast<redisReply*>(
      redisCommandArgv(context_.get(), static_cast<int>(command_argv_.size()), command_argv_.data(),
                       command_argv_len_.data()));
  const auto publish_end = std::chrono::steady_clock::now();
  last_latency_ms_ =
      std::chrono::duration_cast<std::chrono::duration<float, std::milli>>(publish_end - publish_start).count();
  if (reply == nullptr) {
    return false;
  }

  const bool ok = reply->type != REDIS_REPLY_ERROR;
  freeReplyObject(reply);
  return ok;
}

void RedisTsSink::reserve_command_buffers() {
  command_args_.reserve(kMaxCommandArgCount);
  command_argv_.reserve(kMaxCommandArgCount);
  command_argv_len_.reserve(kMaxCommandArgCount);
}

}  // namespace heat_agent::sinks
