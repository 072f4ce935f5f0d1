#ifndef LOCAL_PERMISSION_BROKER_HPP
#define LOCAL_PERMISSION_BROKER_HPP

#include "speech/permission_broker.hpp"

#include <mutex>
#include <string>
#include <thread>
#include <vector>

class PortAudioInput;

// Desktop Linux has no permission prompts. Recording is allowed when a
// usable capture device exists, recognition when the model file is readable.
class LocalPermissionBroker : public PermissionBroker {
public:
    LocalPermissionBroker(PortAudioInput& input, std::string modelPath);
    ~LocalPermissionBroker() override;

    LocalPermissionBroker(const LocalPermissionBroker&) = delete;
    LocalPermissionBroker& operator=(const LocalPermissionBroker&) = delete;

    void requestSpeechAuthorization(Reply reply) override;
    void requestMicrophonePermission(Reply reply) override;

private:
    void spawn(std::thread thread);

    PortAudioInput& input_;
    std::string modelPath_;

    std::mutex threads_mutex_;
    std::vector<std::thread> threads_;
};

#endif
