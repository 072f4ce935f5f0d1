#include "stt/whisper_recognizer.hpp"

#include <whisper.h>

#include <iostream>
#include <stdexcept>
#include <utility>

// Holds the model for one task and hands it back when the task goes away.
class ExclusiveRecognitionTask : public RecognitionTask {
public:
    ExclusiveRecognitionTask(WhisperRecognizer& owner, std::unique_ptr<RecognitionTask> task)
        : owner_(owner), task_(std::move(task)) {}

    ~ExclusiveRecognitionTask() override {
        task_.reset();
        owner_.busy_.store(false);
    }

    void append(const AudioBuffer& buffer) override { task_->append(buffer); }
    void cancel() override { task_->cancel(); }

private:
    WhisperRecognizer& owner_;
    std::unique_ptr<RecognitionTask> task_;
};

namespace {

bool abortRequested(void* cancelled) {
    return static_cast<const std::atomic<bool>*>(cancelled)->load();
}

} // namespace

std::unique_ptr<WhisperRecognizer> WhisperRecognizer::create(Config config) {
    whisper_context_params cparams = whisper_context_default_params();
    cparams.use_gpu = config.useGpu;
    cparams.flash_attn = false;

    whisper_context* context = whisper_init_from_file_with_params(config.modelPath.c_str(), cparams);
    if (!context) {
        std::cerr << "[Whisper STT] [ERROR] whisper_init_from_file_with_params failed: " << config.modelPath << std::endl;
        return nullptr;
    }

    std::cout << "[Whisper STT] loaded " << config.modelPath << std::endl;
    return std::unique_ptr<WhisperRecognizer>(new WhisperRecognizer(std::move(config), context));
}

// Constructor
WhisperRecognizer::WhisperRecognizer(Config config, whisper_context* context)
    : config_(std::move(config)), context_(context) {}

// Destructor
WhisperRecognizer::~WhisperRecognizer() {
    if (context_) whisper_free(context_);
}

bool WhisperRecognizer::isAvailable() const {
    return context_ != nullptr && !busy_.load();
}

std::unique_ptr<RecognitionTask> WhisperRecognizer::startRecognition(const RecognitionRequest& request,
                                                                     OutcomeCallback onOutcome) {
    if (busy_.exchange(true)) throw std::runtime_error("whisper model is already in use");
    std::unique_ptr<RecognitionTask> task;
    try {
        task.reset(new UtteranceRecognitionTask(*this, config_.task, request, std::move(onOutcome)));
    } catch (...) {
        busy_.store(false);
        throw;
    }
    return std::unique_ptr<RecognitionTask>(new ExclusiveRecognitionTask(*this, std::move(task)));
}

// Converts pcm16kMono into text (std::string)
std::string WhisperRecognizer::transcribe(const std::vector<float>& pcm16kMono, const std::atomic<bool>& cancelled) {
    if (pcm16kMono.empty() || cancelled.load()) return {};

    whisper_full_params params = whisper_full_default_params(WHISPER_SAMPLING_GREEDY);

    params.n_threads = config_.threads;
    params.language = config_.language.c_str();
    params.translate = false;

    params.print_progress = false;
    params.print_realtime = false;
    params.print_timestamps = false;
    params.single_segment = false;

    params.no_speech_thold = config_.noSpeechThreshold;

    // Checked by whisper between decoding steps.
    params.abort_callback = abortRequested;
    params.abort_callback_user_data = const_cast<std::atomic<bool>*>(&cancelled);

    std::lock_guard<std::mutex> lock(inferenceMutex_);
    const int rc = whisper_full(context_, params, pcm16kMono.data(), (int)pcm16kMono.size());
    if (cancelled.load()) return {};
    if (rc != 0) throw std::runtime_error("whisper_full failed (" + std::to_string(rc) + ")");

    std::string out;
    const int n_segments = whisper_full_n_segments(context_);
    for (int i = 0; i < n_segments; ++i) out += whisper_full_get_segment_text(context_, i);

    // Segments start with a space.
    const std::size_t first = out.find_first_not_of(' ');
    return first == std::string::npos ? std::string() : out.substr(first);
}
