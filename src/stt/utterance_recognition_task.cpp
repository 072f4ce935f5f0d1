#include "stt/utterance_recognition_task.hpp"

#include <exception>
#include <iostream>
#include <utility>
#include <vector>

namespace {

UtteranceRecorder::Config vadAt16k(UtteranceRecorder::Config vad) {
    vad.sampleRate = UtteranceRecognitionTask::kSampleRate;
    return vad;
}

} // namespace

// Constructor
UtteranceRecognitionTask::UtteranceRecognitionTask(Transcriber& transcriber, Config config,
                                                   RecognitionRequest request,
                                                   SpeechRecognizer::OutcomeCallback onOutcome)
    : transcriber_(transcriber), config_(config), request_(request), onOutcome_(std::move(onOutcome)),
      recorder_(vadAt16k(config.vad)) {
    thread_ = std::thread(&UtteranceRecognitionTask::run, this);
}

// Destructor
UtteranceRecognitionTask::~UtteranceRecognitionTask() {
    cancel();
}

void UtteranceRecognitionTask::append(const AudioBuffer& buffer) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_.load()) return;
        pending_.push_back(buffer);
    }
    cv_.notify_one();
}

void UtteranceRecognitionTask::cancel() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        // Also aborts a transcription in progress.
        stopping_.store(true);
        pending_.clear();
    }
    cv_.notify_one();
    if (thread_.joinable() && thread_.get_id() != std::this_thread::get_id()) thread_.join();
}

void UtteranceRecognitionTask::emit(const RecognitionOutcome& outcome) {
    if (stopping_.load() || !onOutcome_) return;
    try {
        onOutcome_(outcome);
    } catch (const std::exception& e) {
        std::cerr << "[Recognition] [ERROR] outcome handler threw: " << e.what() << std::endl;
    }
}

void UtteranceRecognitionTask::run() {
    std::string lastPartial;
    std::size_t lastPartialSize = 0;

    try {
        while (!finished_) {
            AudioBuffer buffer;
            {
                std::unique_lock<std::mutex> lock(mutex_);
                cv_.wait(lock, [this] { return stopping_.load() || !pending_.empty(); });
                if (stopping_.load()) return;
                buffer = std::move(pending_.front());
                pending_.pop_front();
            }
            process(buffer, lastPartial, lastPartialSize);
        }
    } catch (const std::exception& e) {
        if (stopping_.load()) return;
        std::cerr << "[Recognition] [ERROR] " << e.what() << std::endl;
        emit(RecognitionOutcome::failure(e.what()));
    }
}

void UtteranceRecognitionTask::process(const AudioBuffer& buffer, std::string& lastPartial,
                                       std::size_t& lastPartialSize) {
    const double rate = buffer.sampleRate > 0.0 ? buffer.sampleRate : (double)kSampleRate;
    if (!resampler_ || resampler_->inputRate() != rate) {
        resampler_.reset(new LinearResampler(rate, kSampleRate));
    }

    const std::vector<float> mono = downmixToMono(buffer);
    const std::vector<float> pcm = resampler_->process(mono.data(), mono.size());
    const bool done = recorder_.feed(pcm.data(), (int)pcm.size());

    if (done && recorder_.hasUtterance()) {
        std::string text = transcriber_.transcribe(recorder_.utterance(), stopping_);
        if (stopping_.load()) return;

        // A trailing pass that hears nothing keeps what was already shown.
        if (text.empty()) text = lastPartial;
        finished_ = true;
        emit(RecognitionOutcome::finalText(std::move(text)));
        return;
    }

    const std::size_t partialSamples = (std::size_t)kSampleRate * config_.partialIntervalMs / 1000;
    const std::vector<float>& utterance = recorder_.utterance();
    if (request_.reportPartialResults && recorder_.isListening() &&
        utterance.size() >= lastPartialSize + partialSamples) {
        lastPartialSize = utterance.size();
        std::string text = transcriber_.transcribe(utterance, stopping_);
        if (stopping_.load()) return;
        if (!text.empty() && text != lastPartial) {
            lastPartial = text;
            emit(RecognitionOutcome::partialText(std::move(text)));
        }
    }
}
