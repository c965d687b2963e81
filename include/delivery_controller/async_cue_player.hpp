#pragma once

#include <atomic>
#include <cstddef>
#include <deque>
#include <mutex>
#include <string>
#include <thread>

namespace httplib
{
class Client;
}  // namespace httplib

/**
 * @brief Non-blocking sound playback through the audio service.
 *
 * submit() only queues the file; a worker thread posts it to
 * `<endpoint>/play`. The queue is bounded, oldest cues are dropped first.
 */
class AsyncCuePlayer
{
public:
  explicit AsyncCuePlayer(const std::string & endpoint);
  ~AsyncCuePlayer();

  AsyncCuePlayer(const AsyncCuePlayer &) = delete;
  AsyncCuePlayer & operator=(const AsyncCuePlayer &) = delete;

  void submit(const std::string & sound_path);
  bool isHealthy() const;

private:
  void workerLoop();
  bool sendCue(httplib::Client & cli, const std::string & sound_path);

private:
  static constexpr std::size_t kMaxQueued = 8;

  std::string endpoint_;

  std::thread worker_;
  std::atomic<bool> running_{true};

  mutable std::mutex mutex_;
  std::deque<std::string> pending_;

  std::atomic<bool> last_ok_{true};
};
