#include "grasp_decision/async_event_client.hpp"

#include <httplib.h>
#include <nlohmann/json.hpp>

#include <rclcpp/logging.hpp>

#include <chrono>

AsyncEventClient::AsyncEventClient(const std::string & endpoint, std::size_t max_pending)
: endpoint_(endpoint),
  max_pending_(max_pending)
{
  worker_ = std::thread(&AsyncEventClient::workerLoop, this);
}

AsyncEventClient::~AsyncEventClient()
{
  running_ = false;
  if (worker_.joinable()) {
    worker_.join();
  }
}

bool AsyncEventClient::publish(EventKind kind, const PersonWarningEvent & event)
{
  std::lock_guard<std::mutex> lock(mutex_);
  if (pending_.size() >= max_pending_) {
    return false;
  }
  pending_.push_back(Pending{kind, event});
  return true;
}

bool AsyncEventClient::isHealthy() const
{
  return last_ok_;
}

std::size_t AsyncEventClient::pending() const
{
  std::lock_guard<std::mutex> lock(mutex_);
  return pending_.size();
}

std::string AsyncEventClient::toJson(EventKind kind, const PersonWarningEvent & event)
{
  nlohmann::json payload = {
    {"event",     toString(kind)},
    {"status",    toString(event.status)},
    {"timestamp", event.timestamp},
    {"device_id", event.device_id}
  };
  return payload.dump();
}

void AsyncEventClient::workerLoop()
{
  using namespace std::chrono_literals;

  httplib::Client cli(endpoint_);
  cli.set_connection_timeout(0, 200000); // 200 ms
  cli.set_read_timeout(0, 500000);       // 500 ms

  while (running_) {
    std::deque<Pending> batch;

    {
      std::lock_guard<std::mutex> lock(mutex_);
      batch.swap(pending_);
    }

    for (const auto & item : batch) {
      const bool ok = sendEvent(cli, item);
      if (!ok) {
        RCLCPP_ERROR(
          rclcpp::get_logger("grasp_decision.event_client"),
          "Dropping %s event for %s: POST %s/events failed",
          toString(item.event.status), item.event.device_id.c_str(), endpoint_.c_str());
      }
      last_ok_ = ok;
    }

    std::this_thread::sleep_for(50ms);
  }
}

bool AsyncEventClient::sendEvent(httplib::Client & cli, const Pending & item)
{
  auto res = cli.Post("/events", toJson(item.kind, item.event), "application/json");

  return res && res->status == 200;
}
