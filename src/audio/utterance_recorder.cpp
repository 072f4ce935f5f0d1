#include "audio/utterance_recorder.hpp"

#include <algorithm>
#include <cmath>

// Constructor
UtteranceRecorder::UtteranceRecorder(Config config) : config_(config) {
    preRoll_.reserve(toSamples(config_.preRollMs));
    utterance_.reserve(toSamples(config_.maxUtteranceMs));
}

// Resets recording variables
void UtteranceRecorder::reset() {
    listening_ = false;
    finished_ = false;
    speechSamples_ = 0;
    silenceSamples_ = 0;
    preRoll_.clear();
    utterance_.clear();
}

int UtteranceRecorder::toSamples(int ms) const {
    return (int)(((long long)ms * config_.sampleRate) / 1000);
}

float UtteranceRecorder::rms(const float* x, int n) const {
    double acc = 0.0;
    for (int i = 0; i < n; ++i) acc += (double)x[i] * (double)x[i];
    acc /= std::max(1, n);
    return (float)std::sqrt(acc);
}

void UtteranceRecorder::pushPreRoll(const float* x, int n) {
    const int maxPre = toSamples(config_.preRollMs);
    preRoll_.insert(preRoll_.end(), x, x + n);
    if ((int)preRoll_.size() > maxPre) {
        const int extra = (int)preRoll_.size() - maxPre;
        preRoll_.erase(preRoll_.begin(), preRoll_.begin() + extra);
    }
}

bool UtteranceRecorder::feed(const float* samples, int count) {
    if (finished_) return true;
    if (count <= 0) return false;

    const float r = rms(samples, count);

    if (!listening_) {
        pushPreRoll(samples, count);
        if (r >= config_.vadStartRms) {
            speechSamples_ += count;
            if (speechSamples_ >= toSamples(config_.startHangMs)) {
                listening_ = true;
                // The pre-roll already holds this block.
                utterance_.insert(utterance_.end(), preRoll_.begin(), preRoll_.end());
                preRoll_.clear();
                silenceSamples_ = 0;
            }
        } else {
            speechSamples_ = 0;
        }
        return false;
    }

    utterance_.insert(utterance_.end(), samples, samples + count);

    if (r <= config_.vadStopRms) {
        silenceSamples_ += count;
        if (silenceSamples_ >= toSamples(config_.stopHangMs)) {
            finished_ = true;
            listening_ = false;
            return true;
        }
    } else {
        silenceSamples_ = 0;
    }

    if ((int)utterance_.size() >= toSamples(config_.maxUtteranceMs)) {
        finished_ = true;
        listening_ = false;
        return true;
    }

    return false;
}
