#include "audio/portaudio_input.hpp"
#include "audio/sound_server.hpp"

#include <portaudio.h>

#include <algorithm>
#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>

static void pa_check(PaError e, const char* msg) {
    if (e != paNoError) {
        throw std::runtime_error(std::string(msg) + " (" + std::to_string((int)e) + "): " + Pa_GetErrorText(e));
    }
}

namespace {

struct NativeFormat {
    PaStreamParameters params{};
    double sampleRate = 0.0;
};

// Default input device at its own rate, capped at stereo
NativeFormat nativeInputFormat() {
    NativeFormat format;
    format.params.device = Pa_GetDefaultInputDevice();
    if (format.params.device == paNoDevice) {
        throw std::runtime_error("No default input device");
    }

    const PaDeviceInfo* info = Pa_GetDeviceInfo(format.params.device);
    if (!info) throw std::runtime_error("No info for default input device");

    format.params.channelCount = std::max(1, std::min(info->maxInputChannels, 2));
    format.params.sampleFormat = paFloat32;
    format.params.suggestedLatency = info->defaultLowInputLatency;
    format.params.hostApiSpecificStreamInfo = nullptr;
    format.sampleRate = info->defaultSampleRate;
    return format;
}

class PortAudioCapture : public CaptureHandle {
public:
    PortAudioCapture(std::mutex& paMutex, AudioInput::BufferCallback onBuffer)
        : paMutex_(paMutex), onBuffer_(std::move(onBuffer)) {}

    ~PortAudioCapture() override { stop(); }

    void open(const NativeFormat& format, const AudioSessionConfig& config) {
        const PaStreamFlags flags = config.mode == AudioSessionConfig::Mode::Measurement
            ? (paClipOff | paDitherOff) : paNoFlag;

        channels_ = format.params.channelCount;
        sampleRate_ = format.sampleRate;
        pa_check(
            Pa_OpenStream(&stream_, &format.params, nullptr,
                          format.sampleRate, config.framesPerBuffer,
                          flags, &PortAudioCapture::callback, this),
            "Pa_OpenStream"
        );
        pa_check(Pa_StartStream(stream_), "Pa_StartStream");
    }

    void stop() override {
        std::lock_guard<std::mutex> lock(paMutex_);
        if (!stream_) return;

        // Stopping waits for the callback in flight, which removes the tap.
        PaError e = Pa_StopStream(stream_);
        if (e != paNoError && e != paStreamIsStopped) {
            std::cerr << "[Audio Input] [WARN] Pa_StopStream: " << Pa_GetErrorText(e) << std::endl;
        }
        e = Pa_CloseStream(stream_);
        if (e != paNoError) {
            std::cerr << "[Audio Input] [WARN] Pa_CloseStream: " << Pa_GetErrorText(e) << std::endl;
        }
        stream_ = nullptr;
        std::cout << "[Audio Input] stopped" << std::endl;
    }

private:
    static int callback(const void* input, void*, unsigned long frames,
                        const PaStreamCallbackTimeInfo*, PaStreamCallbackFlags, void* userData) {
        auto* self = static_cast<PortAudioCapture*>(userData);
        if (!input) return paContinue;

        const float* samples = static_cast<const float*>(input);
        AudioBuffer buffer;
        buffer.channels = self->channels_;
        buffer.sampleRate = self->sampleRate_;
        buffer.samples.assign(samples, samples + frames * self->channels_);
        if (self->onBuffer_) self->onBuffer_(buffer);
        return paContinue;
    }

    std::mutex& paMutex_;
    AudioInput::BufferCallback onBuffer_;
    PaStream* stream_ = nullptr;
    int channels_ = 1;
    double sampleRate_ = 0.0;
};

} // namespace

// Constructor
PortAudioInput::PortAudioInput(const AudioSessionConfig& config) {
    if (config.duckOthers) requestDucking();
    pa_check(Pa_Initialize(), "Pa_Initialize");
}

// Destructor
PortAudioInput::~PortAudioInput() {
    Pa_Terminate();
}

std::unique_ptr<CaptureHandle> PortAudioInput::start(const AudioSessionConfig& config, BufferCallback onBuffer) {
    std::unique_ptr<PortAudioCapture> capture(new PortAudioCapture(mutex_, std::move(onBuffer)));

    std::lock_guard<std::mutex> lock(mutex_);
    const NativeFormat format = nativeInputFormat();

    const PaDeviceInfo* info = Pa_GetDeviceInfo(format.params.device);
    std::cout << "[Audio Input] device: " << (info ? info->name : "(unknown)")
              << ", " << format.sampleRate << " Hz, " << format.params.channelCount << " ch, "
              << config.framesPerBuffer << " frames per buffer" << std::endl;

    capture->open(format, config);
    return std::unique_ptr<CaptureHandle>(capture.release());
}

bool PortAudioInput::hasUsableInputDevice() {
    std::lock_guard<std::mutex> lock(mutex_);
    try {
        const NativeFormat format = nativeInputFormat();
        return Pa_IsFormatSupported(&format.params, nullptr, format.sampleRate) == paFormatIsSupported;
    } catch (const std::runtime_error& e) {
        std::cerr << "[Audio Input] [WARN] " << e.what() << std::endl;
        return false;
    }
}
