#include "audio/portaudio_input.hpp"
#include "speech/local_permission_broker.hpp"
#include "speech/main_queue.hpp"
#include "speech/transcription_controller.hpp"
#include "stt/whisper_recognizer.hpp"

#include <exception>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

int main(int argc, char** argv) {
    WhisperRecognizer::Config whisperConfig;
    if (argc > 1) whisperConfig.modelPath = argv[1];
    TranscriptionController::Config controllerConfig;

    try {
        auto queue = std::make_shared<MainQueue>();
        auto input = std::make_shared<PortAudioInput>(controllerConfig.audio);
        auto permissions = std::make_shared<LocalPermissionBroker>(*input, whisperConfig.modelPath);

        TranscriptionController::Collaborators collaborators;
        collaborators.recognizerFactory = [whisperConfig]() -> std::unique_ptr<SpeechRecognizer> {
            return WhisperRecognizer::create(whisperConfig);
        };
        collaborators.audioInput = input;
        collaborators.permissions = permissions;
        collaborators.dispatcher = queue;

        auto controller = TranscriptionController::create(collaborators, controllerConfig);

        std::string lastTranscript;
        bool lastActive = false;
        controller->setObserver([&](const TranscriptState& state) {
            if (state.isActive != lastActive) {
                lastActive = state.isActive;
                std::cout << (state.isActive ? "[recording]" : "[idle]") << std::endl;
            }
            if (state.transcript != lastTranscript) {
                lastTranscript = state.transcript;
                std::cout << "> " << state.transcript << std::endl;
            }
        });

        std::cout << "\nCommands: s = start, x = stop, r = reset, q = quit" << std::endl;

        // Commands are handed to the main queue, the only thread touching the controller's state.
        std::thread reader([&] {
            std::string line;
            while (std::getline(std::cin, line)) {
                if (line == "s") {
                    queue->post([&] { controller->startTranscribing(); });
                } else if (line == "x") {
                    queue->post([&] { controller->stopTranscribing(); });
                } else if (line == "r") {
                    queue->post([&] { controller->resetTranscript(); });
                } else if (line == "q") {
                    break;
                } else if (!line.empty()) {
                    std::cout << "[Main] [WARN] unknown command: " << line << std::endl;
                }
            }
            queue->quit();
        });

        queue->run();
        reader.join();

        controller->stopTranscribing();
        queue->runPending();
    } catch (const std::exception& e) {
        std::cerr << "[Main] [ERROR] " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
