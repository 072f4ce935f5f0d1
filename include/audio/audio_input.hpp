#ifndef AUDIO_INPUT_HPP
#define AUDIO_INPUT_HPP

#include <functional>
#include <memory>
#include <vector>

// Interleaved float PCM at the capture device's native format.
struct AudioBuffer {
    std::vector<float> samples;
    int channels = 1;
    double sampleRate = 0.0;

    int frames() const { return channels > 0 ? (int)samples.size() / channels : 0; }
};

// Capture stays shared with playback; there is no exclusive mode.
struct AudioSessionConfig {
    // Measurement delivers the signal without dithering or clipping.
    enum class Mode { Default, Measurement };

    Mode mode = Mode::Measurement;
    bool duckOthers = true;
    int framesPerBuffer = 1024;
};

// A running capture stream. stop() halts the stream and removes the tap;
// no buffer callback runs once it returns. Calling it twice is harmless.
class CaptureHandle {
public:
    virtual ~CaptureHandle() = default;
    virtual void stop() = 0;
};

class AudioInput {
public:
    using BufferCallback = std::function<void(const AudioBuffer& buffer)>;

    virtual ~AudioInput() = default;

    // Throws std::runtime_error when the stream cannot be opened or started.
    // onBuffer runs on the audio thread.
    virtual std::unique_ptr<CaptureHandle> start(const AudioSessionConfig& config, BufferCallback onBuffer) = 0;
};

#endif
