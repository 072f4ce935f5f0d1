#ifndef WHISPER_RECOGNIZER_HPP
#define WHISPER_RECOGNIZER_HPP

#include "stt/speech_recognizer.hpp"
#include "stt/transcriber.hpp"
#include "stt/utterance_recognition_task.hpp"

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

struct whisper_context;

// Streaming recognition on top of a whisper.cpp model. One task at a time
// owns the model.
class WhisperRecognizer : public SpeechRecognizer, public Transcriber {
public:
    struct Config {
        std::string modelPath = "models/whisper/ggml-base.en-q5_1.bin";
        std::string language = "en";
        int threads = 4;
        bool useGpu = false;

        float noSpeechThreshold = 0.6f;

        // Partial interval and segmentation.
        UtteranceRecognitionTask::Config task;
    };

    // Returns nullptr when the model cannot be loaded.
    static std::unique_ptr<WhisperRecognizer> create(Config config);

    ~WhisperRecognizer() override;

    WhisperRecognizer(const WhisperRecognizer&) = delete;
    WhisperRecognizer& operator=(const WhisperRecognizer&) = delete;

    bool isAvailable() const override;

    std::unique_ptr<RecognitionTask> startRecognition(const RecognitionRequest& request,
                                                      OutcomeCallback onOutcome) override;

    // Runs whisper_full, aborting as soon as cancelled is set.
    std::string transcribe(const std::vector<float>& pcm16kMono, const std::atomic<bool>& cancelled) override;

    const Config& config() const { return config_; }

private:
    friend class ExclusiveRecognitionTask;

    WhisperRecognizer(Config config, whisper_context* context);

    Config config_;
    whisper_context* context_ = nullptr;
    std::mutex inferenceMutex_;
    std::atomic<bool> busy_{false};
};

#endif
