#include <gtest/gtest.h>

#include <httplib.h>
#include <nlohmann/json.hpp>

#include <chrono>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "grasp_decision/async_event_client.hpp"

namespace
{

PersonWarningEvent makeEvent(WarningStatus status, double stamp)
{
  PersonWarningEvent event;
  event.status = status;
  event.timestamp = stamp;
  event.device_id = "camL";
  return event;
}

class EventSink
{
public:
  EventSink()
  {
    server_.Post("/events", [this](const httplib::Request & req, httplib::Response & res) {
      {
        std::lock_guard<std::mutex> lock(mutex_);
        bodies_.push_back(req.body);
      }
      res.status = 200;
      res.set_content("{}", "application/json");
    });
    port_ = server_.bind_to_any_port("127.0.0.1");
    thread_ = std::thread([this]() { server_.listen_after_bind(); });
    while (port_ > 0 && !server_.is_running()) {
      std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
  }

  ~EventSink()
  {
    server_.stop();
    if (thread_.joinable()) {
      thread_.join();
    }
  }

  int port() const { return port_; }

  std::string endpoint() const
  {
    return "http://127.0.0.1:" + std::to_string(port_);
  }

  std::vector<std::string> waitFor(std::size_t count, std::chrono::milliseconds timeout)
  {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
      {
        std::lock_guard<std::mutex> lock(mutex_);
        if (bodies_.size() >= count) {
          return bodies_;
        }
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    std::lock_guard<std::mutex> lock(mutex_);
    return bodies_;
  }

private:
  httplib::Server server_;
  int port_{0};
  std::thread thread_;
  std::mutex mutex_;
  std::vector<std::string> bodies_;
};

}  // namespace

TEST(AsyncEventClient, JsonPayload)
{
  const auto body = AsyncEventClient::toJson(
    EventKind::PERSON_WARNING, makeEvent(WarningStatus::CLEARED, 12.5));
  const auto json = nlohmann::json::parse(body);

  EXPECT_EQ(json.at("event").get<std::string>(), "person_warning");
  EXPECT_EQ(json.at("status").get<std::string>(), "cleared");
  EXPECT_DOUBLE_EQ(json.at("timestamp").get<double>(), 12.5);
  EXPECT_EQ(json.at("device_id").get<std::string>(), "camL");
}

TEST(AsyncEventClient, DeliversEventsInOrder)
{
  EventSink sink;
  ASSERT_GT(sink.port(), 0);

  AsyncEventClient client(sink.endpoint());
  EXPECT_TRUE(client.publish(EventKind::PERSON_WARNING, makeEvent(WarningStatus::TRIGGERED, 1.0)));
  EXPECT_TRUE(client.publish(EventKind::PERSON_WARNING, makeEvent(WarningStatus::CLEARED, 2.0)));

  const auto bodies = sink.waitFor(2, std::chrono::seconds(3));
  ASSERT_EQ(bodies.size(), 2u);
  EXPECT_EQ(nlohmann::json::parse(bodies[0]).at("status").get<std::string>(), "triggered");
  EXPECT_EQ(nlohmann::json::parse(bodies[1]).at("status").get<std::string>(), "cleared");
  EXPECT_TRUE(client.isHealthy());
}

TEST(AsyncEventClient, FullQueueRejectsWithoutBlocking)
{
  AsyncEventClient client("http://127.0.0.1:9", 0);
  EXPECT_FALSE(client.publish(EventKind::PERSON_WARNING, makeEvent(WarningStatus::TRIGGERED, 1.0)));
  EXPECT_EQ(client.pending(), 0u);
}
