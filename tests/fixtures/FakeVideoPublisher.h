// Scriptable publisher for RtmpTransportSession tests. Open() can be held
// until the test releases it or the session interrupts it.

#ifndef LENSCAST_TESTS_FIXTURES_FAKE_VIDEO_PUBLISHER_H_
#define LENSCAST_TESTS_FIXTURES_FAKE_VIDEO_PUBLISHER_H_

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "lenscast/transport/IVideoPublisher.hpp"

namespace lenscast::tests::fixtures {

struct PublisherRecorder {
  std::atomic<bool> open_result{true};
  std::atomic<int> created{0};
  std::atomic<int> opens{0};
  std::atomic<int> closes{0};
  std::atomic<int> interrupts{0};
  // PushFrame() fails once this many frames went through; -1 never fails.
  std::atomic<int> fail_after{-1};
  int64_t bytes_per_frame = 1000;

  std::mutex mutex;
  std::condition_variable cv;
  bool hold_open = false;
  bool interrupted = false;
  std::vector<lenscast::transport::VideoPublisherSettings> settings;
  std::vector<int64_t> pts;

  void ReleaseOpen() {
    {
      std::lock_guard<std::mutex> lock(mutex);
      hold_open = false;
    }
    cv.notify_all();
  }

  std::vector<int64_t> Pts() {
    std::lock_guard<std::mutex> lock(mutex);
    return pts;
  }

  // Waits until `count` frames were pushed or `timeout` passes.
  bool WaitForPushes(size_t count, std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex);
    return cv.wait_for(lock, timeout, [&] { return pts.size() >= count; });
  }
};

class FakeVideoPublisher : public lenscast::transport::IVideoPublisher {
 public:
  explicit FakeVideoPublisher(std::shared_ptr<PublisherRecorder> recorder) : recorder_(std::move(recorder)) {
    recorder_->created.fetch_add(1);
  }

  bool Open(const lenscast::transport::VideoPublisherSettings& settings,
            std::string* error) override {
    recorder_->opens.fetch_add(1);
    std::unique_lock<std::mutex> lock(recorder_->mutex);
    recorder_->settings.push_back(settings);
    recorder_->cv.wait(lock, [this] { return !recorder_->hold_open || recorder_->interrupted; });
    if (recorder_->interrupted) {
      if (error) *error = "interrupted";
      return false;
    }
    if (!recorder_->open_result.load()) {
      if (error) *error = "handshake rejected";
      return false;
    }
    return true;
  }

  int64_t PushFrame(const uint8_t*, size_t, int64_t pts_us, std::string* error) override {
    int64_t result = recorder_->bytes_per_frame;
    {
      std::lock_guard<std::mutex> lock(recorder_->mutex);
      const int limit = recorder_->fail_after.load();
      if (limit >= 0 && static_cast<int>(recorder_->pts.size()) >= limit) {
        if (error) *error = "connection reset";
        result = -1;
      } else {
        recorder_->pts.push_back(pts_us);
      }
    }
    recorder_->cv.notify_all();
    return result;
  }

  void Close() override { recorder_->closes.fetch_add(1); }

  void Interrupt() override {
    recorder_->interrupts.fetch_add(1);
    {
      std::lock_guard<std::mutex> lock(recorder_->mutex);
      recorder_->interrupted = true;
    }
    recorder_->cv.notify_all();
  }

 private:
  std::shared_ptr<PublisherRecorder> recorder_;
};

}  // namespace lenscast::tests::fixtures

#endif  // LENSCAST_TESTS_FIXTURES_FAKE_VIDEO_PUBLISHER_H_
