#include "xarb/alerts.hpp"
#include <spdlog/spdlog.h>
#include <sstream>

namespace xarb {

const char *toString(Severity s) {
  switch (s) {
  case Severity::INFO:
    return "INFO";
  case Severity::WARNING:
    return "WARNING";
  case Severity::CRITICAL:
    return "CRITICAL";
  }
  return "UNKNOWN";
}

// ── Log sink ─────────────────────────────────────────────────────────
void LogAlertSink::notify(Severity severity, const std::string &message,
                          const AlertContext &context) {
  std::ostringstream ctx;
  for (const auto &[k, v] : context)
    ctx << " " << k << "=" << v;

  switch (severity) {
  case Severity::CRITICAL:
    spdlog::critical("🚨 [Alert] {}{}", message, ctx.str());
    break;
  case Severity::WARNING:
    spdlog::warn("⚠️  [Alert] {}{}", message, ctx.str());
    break;
  case Severity::INFO:
    spdlog::info("[Alert] {}{}", message, ctx.str());
    break;
  }
}

// ── Async dispatcher ─────────────────────────────────────────────────
AsyncAlertDispatcher::AsyncAlertDispatcher(std::shared_ptr<AlertSink> downstream)
    : downstream_(std::move(downstream)) {
  worker_ = std::thread([this] { workerLoop(); });
}

AsyncAlertDispatcher::~AsyncAlertDispatcher() { stop(); }

void AsyncAlertDispatcher::notify(Severity severity, const std::string &message,
                                  const AlertContext &context) {
  {
    std::lock_guard<std::mutex> lock(mtx_);
    if (stopping_) {
      spdlog::warn("[Alert] Dispatcher stopped, dropping: {}", message);
      return;
    }
    queue_.push_back({severity, message, context, Clock::now()});
  }
  cv_.notify_one();
}

void AsyncAlertDispatcher::stop() {
  {
    std::lock_guard<std::mutex> lock(mtx_);
    if (stopping_ && !worker_.joinable())
      return;
    stopping_ = true;
  }
  cv_.notify_all();
  if (worker_.joinable())
    worker_.join();
}

size_t AsyncAlertDispatcher::delivered() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return delivered_;
}

void AsyncAlertDispatcher::workerLoop() {
  while (true) {
    Alert alert;
    {
      std::unique_lock<std::mutex> lock(mtx_);
      cv_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
      if (queue_.empty())
        return; // stopping and drained
      alert = std::move(queue_.front());
      queue_.pop_front();
    }
    try {
      downstream_->notify(alert.severity, alert.message, alert.context);
    } catch (const std::exception &e) {
      spdlog::error("[Alert] Sink failed for '{}': {}", alert.message, e.what());
    }
    std::lock_guard<std::mutex> lock(mtx_);
    delivered_++;
  }
}

} // namespace xarb
