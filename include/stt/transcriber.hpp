#ifndef TRANSCRIBER_HPP
#define TRANSCRIBER_HPP

#include <atomic>
#include <string>
#include <vector>

// Batch speech-to-text over one stretch of audio.
class Transcriber {
public:
    virtual ~Transcriber() = default;

    // Converts 16 kHz mono PCM into text. Returns early, with whatever it has,
    // once cancelled is set. Throws std::runtime_error on failure.
    virtual std::string transcribe(const std::vector<float>& pcm16kMono, const std::atomic<bool>& cancelled) = 0;
};

#endif
