#ifndef TRANSCRIPTION_CONTROLLER_HPP
#define TRANSCRIPTION_CONTROLLER_HPP

#include "audio/audio_input.hpp"
#include "speech/capture_session.hpp"
#include "speech/main_queue.hpp"
#include "speech/permission_broker.hpp"
#include "speech/recognizer_error.hpp"
#include "stt/speech_recognizer.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

struct TranscriptState {
    std::string transcript;
    bool isActive = false;
};

// Owns the recording lifecycle and publishes the transcript on the
// dispatcher's context. Commands may be called from any thread; everything
// that reads or observes TranscriptState belongs to the dispatcher's thread.
//
// Starting while already recording is a no-op. stopTranscribing() keeps the
// last transcript, resetTranscript() clears it.
class TranscriptionController : public std::enable_shared_from_this<TranscriptionController> {
public:
    using RecognizerFactory = std::function<std::unique_ptr<SpeechRecognizer>()>;
    using Observer = std::function<void(const TranscriptState& state)>;

    struct Collaborators {
        RecognizerFactory recognizerFactory;
        std::shared_ptr<AudioInput> audioInput;
        std::shared_ptr<PermissionBroker> permissions;
        std::shared_ptr<Dispatcher> dispatcher;
    };

    struct Config {
        AudioSessionConfig audio;
        RecognitionRequest request;
    };

    // Acquires the recognizer and starts the permission checks.
    static std::shared_ptr<TranscriptionController> create(Collaborators collaborators, Config config = Config());

    ~TranscriptionController();

    TranscriptionController(const TranscriptionController&) = delete;
    TranscriptionController& operator=(const TranscriptionController&) = delete;

    void startTranscribing();
    void stopTranscribing();
    void resetTranscript();

    bool isRecording() const;

    // Dispatcher thread only.
    const TranscriptState& state() const { return state_; }
    const std::string& transcript() const { return state_.transcript; }
    bool isActive() const { return state_.isActive; }
    void setObserver(Observer observer) { observer_ = std::move(observer); }

private:
    TranscriptionController(Collaborators collaborators, Config config);

    void initialize();
    void checkPermissions();
    void rememberDenial(RecognizerError::Kind kind);

    void transcribe();
    void reset(bool clearTranscript);
    std::unique_ptr<CaptureSession> takeSession();
    void releaseFinishedSession(std::uint64_t id);

    static void handleOutcome(const std::weak_ptr<TranscriptionController>& weak,
                              Dispatcher& dispatcher,
                              CaptureSession& session,
                              const RecognitionOutcome& outcome);

    // Publish path. Each call posts one mutation onto the dispatcher.
    void publish(const std::exception& error);
    static void post(const std::weak_ptr<TranscriptionController>& weak,
                     Dispatcher& dispatcher,
                     std::function<void(TranscriptionController&)> mutation);

    // Mutations, dispatcher thread only.
    void applyText(std::uint64_t sessionId, const std::string& text);
    void applyError(std::uint64_t sessionId, const std::string& message);
    void applyActive(std::uint64_t sessionId, bool active, bool clearTranscript);
    void notify();

    Collaborators collaborators_;
    Config config_;

    // Guards recognizer_, session_, nextSessionId_ and the remembered denial.
    mutable std::mutex mutex_;
    std::unique_ptr<SpeechRecognizer> recognizer_;
    std::unique_ptr<CaptureSession> session_;
    std::uint64_t nextSessionId_ = 1;
    bool denied_ = false;
    RecognizerError::Kind denial_ = RecognizerError::Kind::Other;

    // Dispatcher thread only.
    TranscriptState state_;
    std::uint64_t publishedSessionId_ = 0;
    Observer observer_;
};

#endif
