#include "speech/local_permission_broker.hpp"
#include "audio/portaudio_input.hpp"

#include <exception>
#include <fstream>
#include <iostream>
#include <utility>

// Constructor
LocalPermissionBroker::LocalPermissionBroker(PortAudioInput& input, std::string modelPath)
    : input_(input), modelPath_(std::move(modelPath)) {}

// Destructor waits for outstanding replies
LocalPermissionBroker::~LocalPermissionBroker() {
    std::vector<std::thread> threads;
    {
        std::lock_guard<std::mutex> lock(threads_mutex_);
        threads.swap(threads_);
    }
    for (std::thread& t : threads) {
        if (t.joinable()) t.join();
    }
}

void LocalPermissionBroker::spawn(std::thread thread) {
    std::lock_guard<std::mutex> lock(threads_mutex_);
    threads_.push_back(std::move(thread));
}

void LocalPermissionBroker::requestSpeechAuthorization(Reply reply) {
    const std::string path = modelPath_;
    spawn(std::thread([path, reply = std::move(reply)] {
        const bool granted = std::ifstream(path, std::ios::binary).good();
        if (!granted) std::cerr << "[Permissions] [WARN] speech model not readable: " << path << std::endl;
        try {
            reply(granted);
        } catch (const std::exception& e) {
            std::cerr << "[Permissions] [ERROR] speech authorization reply threw: " << e.what() << std::endl;
        }
    }));
}

void LocalPermissionBroker::requestMicrophonePermission(Reply reply) {
    spawn(std::thread([this, reply = std::move(reply)] {
        const bool granted = input_.hasUsableInputDevice();
        if (!granted) std::cerr << "[Permissions] [WARN] no usable capture device" << std::endl;
        try {
            reply(granted);
        } catch (const std::exception& e) {
            std::cerr << "[Permissions] [ERROR] microphone permission reply threw: " << e.what() << std::endl;
        }
    }));
}
