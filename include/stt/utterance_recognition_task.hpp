#ifndef UTTERANCE_RECOGNITION_TASK_HPP
#define UTTERANCE_RECOGNITION_TASK_HPP

#include "audio/pcm.hpp"
#include "audio/utterance_recorder.hpp"
#include "stt/speech_recognizer.hpp"
#include "stt/transcriber.hpp"

#include <atomic>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

// Recognition of a single utterance on a worker thread. Appended audio is
// downmixed, resampled to 16 kHz and segmented; the transcriber is run for
// partial results while speech goes on and once more when it ends.
class UtteranceRecognitionTask : public RecognitionTask {
public:
    struct Config {
        // Minimum audio gathered between two partial results.
        int partialIntervalMs = 1000;

        UtteranceRecorder::Config vad;
    };

    static constexpr int kSampleRate = 16000;

    UtteranceRecognitionTask(Transcriber& transcriber, Config config, RecognitionRequest request,
                             SpeechRecognizer::OutcomeCallback onOutcome);
    ~UtteranceRecognitionTask() override;

    UtteranceRecognitionTask(const UtteranceRecognitionTask&) = delete;
    UtteranceRecognitionTask& operator=(const UtteranceRecognitionTask&) = delete;

    void append(const AudioBuffer& buffer) override;
    void cancel() override;

private:
    void run();
    void process(const AudioBuffer& buffer, std::string& lastPartial, std::size_t& lastPartialSize);
    void emit(const RecognitionOutcome& outcome);

    Transcriber& transcriber_;
    Config config_;
    RecognitionRequest request_;
    SpeechRecognizer::OutcomeCallback onOutcome_;

    UtteranceRecorder recorder_;
    std::unique_ptr<LinearResampler> resampler_;
    bool finished_ = false;

    std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<AudioBuffer> pending_;
    std::atomic<bool> stopping_{false};

    std::thread thread_;
};

#endif
