#include "speech/capture_session.hpp"

#include <utility>

CaptureSession::CaptureSession(std::uint64_t id) : id_(id) {}

CaptureSession::~CaptureSession() { close(); }

std::unique_ptr<CaptureSession> CaptureSession::open(std::uint64_t id,
                                                     SpeechRecognizer& recognizer,
                                                     AudioInput& input,
                                                     const AudioSessionConfig& audioConfig,
                                                     const RecognitionRequest& request,
                                                     OutcomeHandler handler) {
    std::unique_ptr<CaptureSession> session(new CaptureSession(id));
    CaptureSession* raw = session.get();

    // The task is joined in close(), so raw outlives every callback.
    session->task_ = recognizer.startRecognition(request,
        [raw, handler = std::move(handler)](const RecognitionOutcome& outcome) {
            handler(*raw, outcome);
        });

    RecognitionTask* task = session->task_.get();

    std::lock_guard<std::mutex> lock(session->captureMutex_);
    // Recognition may already have failed before the microphone opened.
    if (session->finished_.load()) return session;

    // On failure the lock is released before session unwinds and closes.
    session->capture_ = input.start(audioConfig, [task](const AudioBuffer& buffer) {
        task->append(buffer);
    });
    return session;
}

bool CaptureSession::finishCapture() {
    if (finished_.exchange(true)) return false;

    std::lock_guard<std::mutex> lock(captureMutex_);
    if (capture_) capture_->stop();
    return true;
}

void CaptureSession::close() {
    finishCapture();
    if (task_) task_->cancel();
}
