#ifndef CAPTURE_SESSION_HPP
#define CAPTURE_SESSION_HPP

#include "audio/audio_input.hpp"
#include "stt/speech_recognizer.hpp"

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>

// The audio capture and recognition task of one recording attempt.
class CaptureSession {
public:
    using OutcomeHandler = std::function<void(CaptureSession& session, const RecognitionOutcome& outcome)>;

    // Starts recognition, then audio capture feeding it. Throws whatever the
    // collaborators throw, after tearing down the part already started.
    static std::unique_ptr<CaptureSession> open(std::uint64_t id,
                                                SpeechRecognizer& recognizer,
                                                AudioInput& input,
                                                const AudioSessionConfig& audioConfig,
                                                const RecognitionRequest& request,
                                                OutcomeHandler handler);

    ~CaptureSession();

    CaptureSession(const CaptureSession&) = delete;
    CaptureSession& operator=(const CaptureSession&) = delete;

    std::uint64_t id() const { return id_; }
    bool isOpen() const { return !finished_.load(); }

    // Stops audio and removes the tap. True only for the first caller.
    bool finishCapture();

    // finishCapture() plus cancelling recognition. Not for the recognition thread.
    void close();

private:
    explicit CaptureSession(std::uint64_t id);

    std::uint64_t id_;
    std::atomic<bool> finished_{false};

    std::mutex captureMutex_;
    std::unique_ptr<CaptureHandle> capture_;
    std::unique_ptr<RecognitionTask> task_;
};

#endif
