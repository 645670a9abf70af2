#pragma once
#include "xarb/common.hpp"
#include <condition_variable>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace xarb {

enum class Severity { INFO, WARNING, CRITICAL };

const char *toString(Severity s);

using AlertContext = std::map<std::string, std::string>;

struct Alert {
  Severity severity = Severity::INFO;
  std::string message;
  AlertContext context;
  Timestamp at;
};

// Fire-and-forget notification channel.
class AlertSink {
public:
  virtual ~AlertSink() = default;
  virtual void notify(Severity severity, const std::string &message,
                      const AlertContext &context = {}) = 0;
};

// Writes alerts to the log at a level matching their severity.
class LogAlertSink : public AlertSink {
public:
  void notify(Severity severity, const std::string &message,
              const AlertContext &context = {}) override;
};

// Queues alerts and delivers them on its own thread, so callers on the
// execution path never block on a slow sink.
class AsyncAlertDispatcher : public AlertSink {
public:
  explicit AsyncAlertDispatcher(std::shared_ptr<AlertSink> downstream);
  ~AsyncAlertDispatcher() override;

  void notify(Severity severity, const std::string &message,
              const AlertContext &context = {}) override;

  // Drain the queue and join the worker.
  void stop();
  size_t delivered() const;

private:
  void workerLoop();

  std::shared_ptr<AlertSink> downstream_;
  std::deque<Alert> queue_;
  mutable std::mutex mtx_;
  std::condition_variable cv_;
  bool stopping_ = false;
  size_t delivered_ = 0;
  std::thread worker_;
};

} // namespace xarb
