#ifndef SPEECH_RECOGNIZER_HPP
#define SPEECH_RECOGNIZER_HPP

#include "audio/audio_input.hpp"

#include <functional>
#include <memory>
#include <string>
#include <utility>

struct RecognitionOutcome {
    enum class Kind { Partial, Final, Failure };

    Kind kind = Kind::Partial;
    std::string text;   // transcription, or the failure reason

    static RecognitionOutcome partialText(std::string text) { return {Kind::Partial, std::move(text)}; }
    static RecognitionOutcome finalText(std::string text) { return {Kind::Final, std::move(text)}; }
    static RecognitionOutcome failure(std::string reason) { return {Kind::Failure, std::move(reason)}; }

    bool isTerminal() const { return kind != Kind::Partial; }
};

struct RecognitionRequest {
    bool reportPartialResults = true;
};

// One streaming recognition. Outcomes are delivered on a thread owned by the
// recognizer. Destroying the task cancels it.
class RecognitionTask {
public:
    virtual ~RecognitionTask() = default;

    // Called from the audio thread.
    virtual void append(const AudioBuffer& buffer) = 0;

    // Stops delivering outcomes and waits for the recognition thread.
    // Calling it twice is harmless.
    // Must not be called from inside an outcome callback.
    virtual void cancel() = 0;
};

class SpeechRecognizer {
public:
    using OutcomeCallback = std::function<void(const RecognitionOutcome& outcome)>;

    virtual ~SpeechRecognizer() = default;

    virtual bool isAvailable() const = 0;

    // Throws std::runtime_error when the task cannot be started.
    virtual std::unique_ptr<RecognitionTask> startRecognition(const RecognitionRequest& request,
                                                              OutcomeCallback onOutcome) = 0;
};

#endif
