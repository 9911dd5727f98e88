// Deterministic stand-in for the AAC encoder: one packet of `payload_size`
// bytes per `packets_per_chunk` for every chunk it is fed.

#ifndef LENSCAST_TESTS_FIXTURES_FAKE_AUDIO_ENCODER_H_
#define LENSCAST_TESTS_FIXTURES_FAKE_AUDIO_ENCODER_H_

#include <atomic>
#include <cstdint>
#include <memory>
#include <vector>

#include "lenscast/audio/IAudioEncoder.hpp"

namespace lenscast::tests::fixtures {

struct AudioEncoderRecorder {
  std::atomic<bool> open_result{true};
  std::atomic<int> opens{0};
  std::atomic<int> closes{0};
  std::atomic<int> chunks{0};
  std::atomic<int> flushes{0};
  int packets_per_chunk = 1;
  // Packets still buffered in the codec, returned by Flush().
  int flush_packets = 0;
  size_t payload_size = 100;
};

class FakeAudioEncoder : public lenscast::audio::IAudioEncoder {
 public:
  explicit FakeAudioEncoder(std::shared_ptr<AudioEncoderRecorder> recorder) : recorder_(std::move(recorder)) {}

  bool Open() override {
    recorder_->opens.fetch_add(1);
    return recorder_->open_result.load();
  }

  std::vector<lenscast::media::EncodedAacPacket> Encode(
      const lenscast::media::AudioChunk&) override {
    recorder_->chunks.fetch_add(1);
    return Packets(recorder_->packets_per_chunk);
  }

  std::vector<lenscast::media::EncodedAacPacket> Flush() override {
    recorder_->flushes.fetch_add(1);
    return Packets(recorder_->flush_packets);
  }

  void Close() override { recorder_->closes.fetch_add(1); }

  int output_sample_rate() const override { return 24000; }
  int output_channels() const override { return 1; }

  void SetWarningCallback(lenscast::audio::EncodeWarningCallback) override {}

 private:
  std::vector<lenscast::media::EncodedAacPacket> Packets(int count) {
    std::vector<lenscast::media::EncodedAacPacket> out;
    for (int i = 0; i < count; ++i) {
      lenscast::media::EncodedAacPacket packet;
      packet.payload.assign(recorder_->payload_size, static_cast<uint8_t>(0x21));
      packet.sample_rate = 24000;
      packet.channel_count = 1;
      packet.sequence_index = sequence_++;
      out.push_back(std::move(packet));
    }
    return out;
  }

  std::shared_ptr<AudioEncoderRecorder> recorder_;
  int64_t sequence_ = 0;
};

}  // namespace lenscast::tests::fixtures

#endif  // LENSCAST_TESTS_FIXTURES_FAKE_AUDIO_ENCODER_H_
