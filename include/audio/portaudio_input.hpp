#ifndef PORTAUDIO_INPUT_HPP
#define PORTAUDIO_INPUT_HPP

#include "audio/audio_input.hpp"

#include <memory>
#include <mutex>

// Default-device microphone capture through PortAudio. The library is
// initialised for the lifetime of this object. Ducking is decided here, once,
// from config.duckOthers, before PortAudio is initialised.
class PortAudioInput : public AudioInput {
public:
    explicit PortAudioInput(const AudioSessionConfig& config = AudioSessionConfig());
    ~PortAudioInput() override;

    PortAudioInput(const PortAudioInput&) = delete;
    PortAudioInput& operator=(const PortAudioInput&) = delete;

    std::unique_ptr<CaptureHandle> start(const AudioSessionConfig& config, BufferCallback onBuffer) override;

    // True when a default input device exists and accepts its native format.
    bool hasUsableInputDevice();

private:
    std::mutex mutex_;
};

#endif
