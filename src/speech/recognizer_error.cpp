#include "speech/recognizer_error.hpp"

RecognizerError::RecognizerError(Kind kind)
    : std::runtime_error(message(kind)), kind_(kind) {}

RecognizerError::RecognizerError(Kind kind, const std::string& description)
    : std::runtime_error(kind == Kind::Other ? description : std::string(message(kind))), kind_(kind) {}

const char* RecognizerError::message(Kind kind) {
    switch (kind) {
        case Kind::NilRecognizer: return "can't initialize speech recognizer";
        case Kind::NotAuthorizedToRecognize: return "Not authorized to recognize speech";
        case Kind::NotPermittedToRecord: return "Not permitted to record audio";
        case Kind::RecognizerUnavailable: return "Recognizer is unavailable";
        case Kind::Other: break;
    }
    return "";
}

std::string describeError(const std::exception& e) {
    return e.what();
}

std::string bracketed(const std::string& message) {
    return "<< " + message + " >>";
}
