#ifndef RECOGNIZER_ERROR_HPP
#define RECOGNIZER_ERROR_HPP

#include <exception>
#include <stdexcept>
#include <string>

class RecognizerError : public std::runtime_error {
public:
    enum class Kind {
        NilRecognizer,
        NotAuthorizedToRecognize,
        NotPermittedToRecord,
        RecognizerUnavailable,
        Other
    };

    explicit RecognizerError(Kind kind);
    RecognizerError(Kind kind, const std::string& description);

    Kind kind() const { return kind_; }

    // Fixed user-facing text for a kind. Other has no fixed text.
    static const char* message(Kind kind);

private:
    Kind kind_;
};

// User-facing description of any error: the fixed message for a
// RecognizerError, what() for everything else.
std::string describeError(const std::exception& e);

// Wraps a message in the markers that distinguish errors in the transcript.
std::string bracketed(const std::string& message);

#endif
