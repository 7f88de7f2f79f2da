#ifndef LIVEDICT_AUDIO_BUFFER_HPP
#define LIVEDICT_AUDIO_BUFFER_HPP

#include <vector>
#include <mutex>
#include <cstdint>
#include <cstddef>

// Fixed-capacity circular store of mono float32 audio.
// Holds the most recent min(written, capacity) samples; the oldest samples
// are overwritten on overflow. Writers never block beyond a memory copy.
class AudioBuffer {
public:
    // max_seconds: audio to retain (12s covers one long utterance)
    explicit AudioBuffer(float max_seconds = 12.0f, int sample_rate = 16000);

    // Push float32 samples. Thread-safe.
    void pushFloat(const float* samples, size_t count);

    // Copy of the most recent min(n_samples, size()) samples, oldest first.
    // Thread-safe.
    std::vector<float> snapshot(size_t n_samples) const;

    // Samples written after cursor `position` that are still retained,
    // limited to the trailing max_samples. *end_position receives the cursor
    // at the end of the copy. Thread-safe.
    std::vector<float> getSince(uint64_t position, size_t max_samples,
                                uint64_t* end_position = nullptr) const;

    // Drop all retained audio. The write cursor keeps counting. Thread-safe.
    void clear();

    // Retained samples. Thread-safe.
    size_t size() const;

    size_t capacity() const { return capacity_; }
    int sampleRate() const { return sample_rate_; }

    // Total samples ever written (monotonic). Thread-safe.
    uint64_t writePosition() const;

    // Convert int16 to float32 (normalized to [-1, 1])
    static float int16ToFloat(int16_t sample) {
        return static_cast<float>(sample) / 32768.0f;
    }

    // Convert a block of int16 PCM (capture path)
    static std::vector<float> int16ToFloat(const int16_t* samples, size_t count);

    size_t msToSamples(int ms) const {
        if (ms <= 0) return 0;
        return static_cast<size_t>((static_cast<int64_t>(ms) * sample_rate_) / 1000);
    }

private:
    std::vector<float> ring_;
    mutable std::mutex mutex_;
    size_t capacity_;
    int sample_rate_;
    uint64_t write_pos_ = 0;   // monotonic; ring index is write_pos_ % capacity_
    size_t size_ = 0;

    // Copy the trailing `count` retained samples. Caller holds mutex_.
    std::vector<float> copyTail(size_t count) const;

    void writeSample(float sample) {
        ring_[write_pos_ % capacity_] = sample;
        ++write_pos_;
        if (size_ < capacity_) ++size_;
    }
};

#endif // LIVEDICT_AUDIO_BUFFER_HPP
