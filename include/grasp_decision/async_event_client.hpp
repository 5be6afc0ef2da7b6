#pragma once

#include <atomic>
#include <cstddef>
#include <deque>
#include <mutex>
#include <string>
#include <thread>

#include "grasp_decision/event_publisher.hpp"

namespace httplib
{
class Client;
}

class AsyncEventClient : public EventPublisher
{
public:
  explicit AsyncEventClient(const std::string & endpoint, std::size_t max_pending = 64);
  ~AsyncEventClient() override;

  // Queues the event for the worker; false when the queue is full.
  bool publish(EventKind kind, const PersonWarningEvent & event) override;

  bool isHealthy() const;
  std::size_t pending() const;

  static std::string toJson(EventKind kind, const PersonWarningEvent & event);

private:
  struct Pending
  {
    EventKind kind;
    PersonWarningEvent event;
  };

  void workerLoop();
  bool sendEvent(httplib::Client & cli, const Pending & item);

private:
  std::string endpoint_;
  std::size_t max_pending_;

  std::thread worker_;
  std::atomic<bool> running_{true};

  mutable std::mutex mutex_;
  std::deque<Pending> pending_;

  std::atomic<bool> last_ok_{true};
};
