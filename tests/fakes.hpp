#ifndef TEST_FAKES_HPP
#define TEST_FAKES_HPP

#include "audio/audio_input.hpp"
#include "speech/permission_broker.hpp"
#include "stt/speech_recognizer.hpp"
#include "stt/transcriber.hpp"

#include <algorithm>
#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

// =============================================================================
// Audio input
// =============================================================================

class FakeAudioInput : public AudioInput {
public:
    std::atomic<int> starts{0};
    std::atomic<int> stops{0};
    std::atomic<int> open{0};
    std::atomic<int> maxOpen{0};
    bool failStart = false;
    AudioSessionConfig lastConfig;

    class Handle : public CaptureHandle {
    public:
        explicit Handle(FakeAudioInput& owner) : owner_(owner) {}
        ~Handle() override { stop(); }

        void stop() override {
            if (stopped_.exchange(true)) return;
            {
                std::lock_guard<std::mutex> lock(owner_.mutex_);
                owner_.callback_ = nullptr;
            }
            owner_.stops++;
            owner_.open--;
        }

    private:
        FakeAudioInput& owner_;
        std::atomic<bool> stopped_{false};
    };

    std::unique_ptr<CaptureHandle> start(const AudioSessionConfig& config, BufferCallback onBuffer) override {
        if (failStart) throw std::runtime_error("audio device busy");
        lastConfig = config;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            callback_ = std::move(onBuffer);
        }
        starts++;
        const int now = ++open;
        int seen = maxOpen.load();
        while (now > seen && !maxOpen.compare_exchange_weak(seen, now)) {}
        return std::unique_ptr<CaptureHandle>(new Handle(*this));
    }

    // Delivers a buffer the way the audio thread would. False when nothing is tapped.
    bool push(const AudioBuffer& buffer) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!callback_) return false;
        callback_(buffer);
        return true;
    }

private:
    std::mutex mutex_;
    BufferCallback callback_;
};

// =============================================================================
// Recognizer
// =============================================================================

class FakeRecognitionTask;

// Shared between the test and the recognizer the controller owns.
struct FakeEngine {
    std::atomic<bool> available{true};
    bool failStart = false;
    bool failImmediately = false;

    std::atomic<int> started{0};
    std::atomic<int> cancels{0};
    RecognitionRequest lastRequest;

    std::mutex mutex;
    std::vector<FakeRecognitionTask*> live;

    FakeRecognitionTask* current() {
        std::lock_guard<std::mutex> lock(mutex);
        return live.empty() ? nullptr : live.back();
    }
};

class FakeRecognitionTask : public RecognitionTask {
public:
    FakeRecognitionTask(std::shared_ptr<FakeEngine> engine, SpeechRecognizer::OutcomeCallback onOutcome)
        : engine_(std::move(engine)), onOutcome_(std::move(onOutcome)) {
        std::lock_guard<std::mutex> lock(engine_->mutex);
        engine_->live.push_back(this);
    }

    ~FakeRecognitionTask() override {
        cancel();
        std::lock_guard<std::mutex> lock(engine_->mutex);
        engine_->live.erase(std::remove(engine_->live.begin(), engine_->live.end(), this), engine_->live.end());
    }

    void append(const AudioBuffer& buffer) override {
        appendedFrames += buffer.frames();
        appended++;
    }

    void cancel() override {
        if (!cancelled_.exchange(true)) engine_->cancels++;
        if (emitter_.joinable() && emitter_.get_id() != std::this_thread::get_id()) emitter_.join();
    }

    // Delivers an outcome on the calling thread.
    void emit(const RecognitionOutcome& outcome) {
        if (cancelled_.load()) return;
        onOutcome_(outcome);
    }

    // Delivers outcomes in order on a thread of the task's own.
    void emitAsync(std::vector<RecognitionOutcome> outcomes) {
        emitter_ = std::thread([this, outcomes = std::move(outcomes)] {
            for (const RecognitionOutcome& outcome : outcomes) emit(outcome);
        });
    }

    std::atomic<int> appended{0};
    std::atomic<int> appendedFrames{0};

private:
    std::shared_ptr<FakeEngine> engine_;
    SpeechRecognizer::OutcomeCallback onOutcome_;
    std::atomic<bool> cancelled_{false};
    std::thread emitter_;
};

class FakeRecognizer : public SpeechRecognizer {
public:
    explicit FakeRecognizer(std::shared_ptr<FakeEngine> engine) : engine_(std::move(engine)) {}

    bool isAvailable() const override { return engine_->available.load(); }

    std::unique_ptr<RecognitionTask> startRecognition(const RecognitionRequest& request,
                                                      OutcomeCallback onOutcome) override {
        if (engine_->failStart) throw std::runtime_error("recognition request rejected");
        engine_->lastRequest = request;
        engine_->started++;
        std::unique_ptr<FakeRecognitionTask> task(new FakeRecognitionTask(engine_, std::move(onOutcome)));
        if (engine_->failImmediately) task->emit(RecognitionOutcome::failure("no speech detected"));
        return std::unique_ptr<RecognitionTask>(task.release());
    }

private:
    std::shared_ptr<FakeEngine> engine_;
};

// =============================================================================
// Transcriber
// =============================================================================

// Scripted transcriber. The script sees the audio, the 1-based call number and
// the cancellation flag.
class FakeTranscriber : public Transcriber {
public:
    using Script = std::function<std::string(const std::vector<float>&, int, const std::atomic<bool>&)>;

    explicit FakeTranscriber(Script script) : script_(std::move(script)) {}

    std::string transcribe(const std::vector<float>& pcm16kMono, const std::atomic<bool>& cancelled) override {
        const int call = ++calls;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            sizes_.push_back(pcm16kMono.size());
        }
        return script_(pcm16kMono, call, cancelled);
    }

    std::vector<std::size_t> sizes() {
        std::lock_guard<std::mutex> lock(mutex_);
        return sizes_;
    }

    std::atomic<int> calls{0};

private:
    Script script_;
    std::mutex mutex_;
    std::vector<std::size_t> sizes_;
};

// =============================================================================
// Permissions
// =============================================================================

class FakePermissionBroker : public PermissionBroker {
public:
    bool speechGranted = true;
    bool microphoneGranted = true;
    bool replyOnThread = false;

    std::atomic<int> speechRequests{0};
    std::atomic<int> microphoneRequests{0};

    ~FakePermissionBroker() override {
        for (std::thread& t : threads_) {
            if (t.joinable()) t.join();
        }
    }

    void requestSpeechAuthorization(Reply reply) override {
        speechRequests++;
        answer(std::move(reply), speechGranted);
    }

    void requestMicrophonePermission(Reply reply) override {
        microphoneRequests++;
        answer(std::move(reply), microphoneGranted);
    }

private:
    void answer(Reply reply, bool granted) {
        if (replyOnThread) {
            threads_.emplace_back([reply = std::move(reply), granted] { reply(granted); });
        } else {
            reply(granted);
        }
    }

    std::vector<std::thread> threads_;
};

#endif
