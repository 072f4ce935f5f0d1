#include "speech/transcription_controller.hpp"

#include <iostream>
#include <stdexcept>
#include <utility>

std::shared_ptr<TranscriptionController> TranscriptionController::create(Collaborators collaborators, Config config) {
    if (!collaborators.dispatcher) throw std::invalid_argument("TranscriptionController needs a dispatcher");
    if (!collaborators.audioInput) throw std::invalid_argument("TranscriptionController needs an audio input");

    std::shared_ptr<TranscriptionController> controller(
        new TranscriptionController(std::move(collaborators), std::move(config)));
    controller->initialize();
    return controller;
}

// Constructor
TranscriptionController::TranscriptionController(Collaborators collaborators, Config config)
    : collaborators_(std::move(collaborators)), config_(std::move(config)) {}

// Destructor
TranscriptionController::~TranscriptionController() {
    std::unique_ptr<CaptureSession> session = takeSession();
    if (session) std::cout << "[Transcription] closing session " << session->id() << " on shutdown" << std::endl;
}

// Acquires the recognizer, then asks for permissions without waiting
void TranscriptionController::initialize() {
    std::unique_ptr<SpeechRecognizer> recognizer;
    try {
        if (collaborators_.recognizerFactory) recognizer = collaborators_.recognizerFactory();
    } catch (const std::exception& e) {
        std::cerr << "[Transcription] [ERROR] recognizer construction failed: " << e.what() << std::endl;
    }

    if (!recognizer) {
        publish(RecognizerError(RecognizerError::Kind::NilRecognizer));
        return;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        recognizer_ = std::move(recognizer);
    }
    checkPermissions();
}

// Both queries run independently; replies are handled on the dispatcher
void TranscriptionController::checkPermissions() {
    if (!collaborators_.permissions) {
        std::cout << "[Transcription] [WARN] no permission broker, assuming access" << std::endl;
        return;
    }

    std::weak_ptr<TranscriptionController> weak = shared_from_this();
    std::shared_ptr<Dispatcher> dispatcher = collaborators_.dispatcher;

    auto onReply = [weak, dispatcher](RecognizerError::Kind denial) {
        return [weak, dispatcher, denial](bool granted) {
            if (granted) return;
            post(weak, *dispatcher, [denial](TranscriptionController& self) { self.rememberDenial(denial); });
        };
    };

    collaborators_.permissions->requestSpeechAuthorization(onReply(RecognizerError::Kind::NotAuthorizedToRecognize));
    collaborators_.permissions->requestMicrophonePermission(onReply(RecognizerError::Kind::NotPermittedToRecord));
}

void TranscriptionController::rememberDenial(RecognizerError::Kind kind) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!denied_) {
            denied_ = true;
            denial_ = kind;
        }
    }
    std::cerr << "[Transcription] [WARN] " << RecognizerError::message(kind) << std::endl;
    publish(RecognizerError(kind));
}

void TranscriptionController::startTranscribing() { transcribe(); }

void TranscriptionController::stopTranscribing() { reset(false); }

void TranscriptionController::resetTranscript() { reset(true); }

bool TranscriptionController::isRecording() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return session_ && session_->isOpen();
}

void TranscriptionController::transcribe() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!recognizer_) {
        publish(RecognizerError(RecognizerError::Kind::NilRecognizer));
        return;
    }
    if (session_ && session_->isOpen()) {
        std::cout << "[Transcription] [WARN] already recording, start ignored" << std::endl;
        return;
    }
    // A session ended by its own final result may still be waiting for release.
    session_.reset();

    if (denied_) {
        publish(RecognizerError(denial_));
        return;
    }
    if (!recognizer_->isAvailable()) {
        publish(RecognizerError(RecognizerError::Kind::RecognizerUnavailable));
        return;
    }

    const std::uint64_t id = nextSessionId_++;
    std::weak_ptr<TranscriptionController> weak = shared_from_this();
    std::shared_ptr<Dispatcher> dispatcher = collaborators_.dispatcher;

    post(weak, *dispatcher, [id](TranscriptionController& self) { self.applyActive(id, true, false); });

    try {
        session_ = CaptureSession::open(id, *recognizer_, *collaborators_.audioInput, config_.audio, config_.request,
            [weak, dispatcher](CaptureSession& session, const RecognitionOutcome& outcome) {
                handleOutcome(weak, *dispatcher, session, outcome);
            });
    } catch (const std::exception& e) {
        std::cerr << "[Transcription] [ERROR] could not start session " << id << ": " << e.what() << std::endl;
        post(weak, *dispatcher, [id](TranscriptionController& self) { self.applyActive(id, false, false); });
        publish(e);
        return;
    }

    std::cout << "[Transcription] session " << id << " recording" << std::endl;
}

void TranscriptionController::reset(bool clearTranscript) {
    std::uint64_t id = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (session_) {
            id = session_->id();
            session_.reset();
            std::cout << "[Transcription] session " << id << " closed" << std::endl;
        }
    }

    post(weak_from_this(), *collaborators_.dispatcher, [id, clearTranscript](TranscriptionController& self) {
        self.applyActive(id, false, clearTranscript);
    });
}

std::unique_ptr<CaptureSession> TranscriptionController::takeSession() {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::move(session_);
}

// Runs on the dispatcher once a session has ended itself
void TranscriptionController::releaseFinishedSession(std::uint64_t id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (session_ && session_->id() == id && !session_->isOpen()) session_.reset();
}

// Runs on the recognizer's thread. Never touches controller state directly.
void TranscriptionController::handleOutcome(const std::weak_ptr<TranscriptionController>& weak,
                                            Dispatcher& dispatcher,
                                            CaptureSession& session,
                                            const RecognitionOutcome& outcome) {
    if (!session.isOpen()) return;

    const std::uint64_t id = session.id();

    // Stop the microphone before anything else; a second terminal event loses here.
    if (outcome.isTerminal() && !session.finishCapture()) return;

    if (outcome.kind == RecognitionOutcome::Kind::Failure) {
        std::cerr << "[Transcription] [ERROR] session " << id << " failed: " << outcome.text << std::endl;
        const std::string message = bracketed(outcome.text);
        post(weak, dispatcher, [id, message](TranscriptionController& self) { self.applyError(id, message); });
    } else {
        const std::string text = outcome.text;
        post(weak, dispatcher, [id, text](TranscriptionController& self) { self.applyText(id, text); });
    }

    if (outcome.isTerminal()) {
        post(weak, dispatcher, [id](TranscriptionController& self) {
            self.applyActive(id, false, false);
            self.releaseFinishedSession(id);
        });
    }
}

void TranscriptionController::publish(const std::exception& error) {
    const std::string message = bracketed(describeError(error));
    post(weak_from_this(), *collaborators_.dispatcher, [message](TranscriptionController& self) {
        self.applyError(0, message);
    });
}

void TranscriptionController::post(const std::weak_ptr<TranscriptionController>& weak,
                                   Dispatcher& dispatcher,
                                   std::function<void(TranscriptionController&)> mutation) {
    dispatcher.post([weak, mutation = std::move(mutation)]() {
        if (auto self = weak.lock()) mutation(*self);
    });
}

// Text from a session that has since been stopped is stale
void TranscriptionController::applyText(std::uint64_t sessionId, const std::string& text) {
    if (sessionId != publishedSessionId_) return;
    state_.transcript = text;
    notify();
}

void TranscriptionController::applyError(std::uint64_t sessionId, const std::string& message) {
    if (sessionId != 0 && sessionId != publishedSessionId_) return;
    state_.transcript = message;
    notify();
}

void TranscriptionController::applyActive(std::uint64_t sessionId, bool active, bool clearTranscript) {
    if (active) {
        publishedSessionId_ = sessionId;
        state_.isActive = true;
    } else if (sessionId == 0 || sessionId == publishedSessionId_) {
        publishedSessionId_ = 0;
        state_.isActive = false;
    }
    if (clearTranscript) state_.transcript.clear();
    notify();
}

void TranscriptionController::notify() {
    if (observer_) observer_(state_);
}
