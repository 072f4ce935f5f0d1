#include "audio/pcm.hpp"

std::vector<float> downmixToMono(const AudioBuffer& buffer) {
    if (buffer.channels <= 1) return buffer.samples;

    const int frames = buffer.frames();
    std::vector<float> mono(frames);
    for (int f = 0; f < frames; ++f) {
        float acc = 0.0f;
        for (int c = 0; c < buffer.channels; ++c) acc += buffer.samples[(std::size_t)f * buffer.channels + c];
        mono[f] = acc / (float)buffer.channels;
    }
    return mono;
}

// Constructor
LinearResampler::LinearResampler(double fromRate, double toRate)
    : fromRate_(fromRate), toRate_(toRate), step_(toRate > 0.0 ? fromRate / toRate : 1.0) {}

std::vector<float> LinearResampler::process(const float* samples, std::size_t count) {
    if (count == 0) return {};
    if (fromRate_ <= 0.0 || toRate_ <= 0.0 || fromRate_ == toRate_) {
        return std::vector<float>(samples, samples + count);
    }

    const std::size_t offset = primed_ ? 1 : 0;
    const std::size_t total = count + offset;
    auto at = [&](std::size_t i) { return i < offset ? last_ : samples[i - offset]; };

    std::vector<float> out;
    out.reserve((std::size_t)((double)total / step_) + 1);
    while (position_ < (double)(total - 1)) {
        const std::size_t i0 = (std::size_t)position_;
        const float t = (float)(position_ - (double)i0);
        const float a = at(i0);
        const float b = at(i0 + 1);
        out.push_back(a + (b - a) * t);
        position_ += step_;
    }

    last_ = samples[count - 1];
    position_ -= (double)(total - 1);
    primed_ = true;
    return out;
}
