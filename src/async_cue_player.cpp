#include "delivery_controller/async_cue_player.hpp"

#include <httplib.h>
#include <nlohmann/json.hpp>

#include <chrono>
#include <optional>

#include <rclcpp/logging.hpp>

AsyncCuePlayer::AsyncCuePlayer(const std::string & endpoint)
: endpoint_(endpoint)
{
  worker_ = std::thread(&AsyncCuePlayer::workerLoop, this);
}

AsyncCuePlayer::~AsyncCuePlayer()
{
  running_ = false;
  if (worker_.joinable()) {
    worker_.join();
  }
}

void AsyncCuePlayer::submit(const std::string & sound_path)
{
  std::lock_guard<std::mutex> lock(mutex_);
  if (pending_.size() >= kMaxQueued) {
    pending_.pop_front();
  }
  pending_.push_back(sound_path);
}

bool AsyncCuePlayer::isHealthy() const
{
  return last_ok_;
}

void AsyncCuePlayer::workerLoop()
{
  using namespace std::chrono_literals;

  httplib::Client cli(endpoint_);
  cli.set_connection_timeout(0, 200000); // 200 ms
  cli.set_read_timeout(1, 0);

  while (running_) {
    std::optional<std::string> sound;

    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (!pending_.empty()) {
        sound = pending_.front();
        pending_.pop_front();
      }
    }

    if (sound) {
      const bool ok = sendCue(cli, *sound);
      if (!ok && last_ok_) {
        RCLCPP_WARN(rclcpp::get_logger("async_cue_player"),
                    "Audio service at %s did not play '%s'",
                    endpoint_.c_str(), sound->c_str());
      }
      last_ok_ = ok;
      continue;
    }

    std::this_thread::sleep_for(50ms);
  }
}

bool AsyncCuePlayer::sendCue(httplib::Client & cli, const std::string & sound_path)
{
  nlohmann::json payload = {
    {"sound", sound_path}
  };

  auto res = cli.Post("/play", payload.dump(), "application/json");

  return res && res->status == 200;
}
