#ifndef PCM_HPP
#define PCM_HPP

#include "audio/audio_input.hpp"

#include <cstddef>
#include <vector>

// Averages interleaved channels into one.
std::vector<float> downmixToMono(const AudioBuffer& buffer);

// Linear interpolation between sample rates over a stream of blocks. The read
// position and the last sample carry over, so block boundaries are seamless.
class LinearResampler {
public:
    LinearResampler(double fromRate, double toRate);

    std::vector<float> process(const float* samples, std::size_t count);

    double inputRate() const { return fromRate_; }

private:
    double fromRate_;
    double toRate_;
    double step_;

    // Position of the next output sample; index 0 is last_ once primed.
    double position_ = 0.0;
    float last_ = 0.0f;
    bool primed_ = false;
};

#endif
