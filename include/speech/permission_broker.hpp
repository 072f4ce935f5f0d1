#ifndef PERMISSION_BROKER_HPP
#define PERMISSION_BROKER_HPP

#include <functional>

// Asynchronous permission queries. Replies may arrive on any thread.
class PermissionBroker {
public:
    using Reply = std::function<void(bool granted)>;

    virtual ~PermissionBroker() = default;

    virtual void requestSpeechAuthorization(Reply reply) = 0;
    virtual void requestMicrophonePermission(Reply reply) = 0;
};

#endif
