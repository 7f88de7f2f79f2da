#include "audio_buffer.hpp"

#include <algorithm>

AudioBuffer::AudioBuffer(float max_seconds, int sample_rate)
    : capacity_(std::max<size_t>(1, static_cast<size_t>(max_seconds * sample_rate)))
    , sample_rate_(sample_rate) {
    ring_.resize(capacity_, 0.0f);
}

std::vector<float> AudioBuffer::int16ToFloat(const int16_t* samples, size_t count) {
    std::vector<float> converted(count);
    std::transform(samples, samples + count, converted.begin(),
                   [](int16_t sample) { return int16ToFloat(sample); });
    return converted;
}

void AudioBuffer::pushFloat(const float* samples, size_t count) {
    std::lock_guard<std::mutex> lock(mutex_);

    size_t skip = count > capacity_ ? count - capacity_ : 0;
    write_pos_ += skip;
    for (size_t i = skip; i < count; ++i) {
        writeSample(samples[i]);
    }
}

std::vector<float> AudioBuffer::copyTail(size_t count) const {
    count = std::min(count, size_);
    std::vector<float> result(count);

    uint64_t start = write_pos_ - count;
    for (size_t i = 0; i < count; ++i) {
        result[i] = ring_[(start + i) % capacity_];
    }
    return result;
}

std::vector<float> AudioBuffer::snapshot(size_t n_samples) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return copyTail(n_samples);
}

std::vector<float> AudioBuffer::getSince(uint64_t position, size_t max_samples,
                                         uint64_t* end_position) const {
    std::lock_guard<std::mutex> lock(mutex_);

    if (end_position) *end_position = write_pos_;
    if (position >= write_pos_) return {};

    uint64_t pending = write_pos_ - position;
    size_t count = static_cast<size_t>(std::min<uint64_t>(pending, max_samples));
    return copyTail(count);
}

void AudioBuffer::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    size_ = 0;
}

size_t AudioBuffer::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return size_;
}

uint64_t AudioBuffer::writePosition() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return write_pos_;
}
