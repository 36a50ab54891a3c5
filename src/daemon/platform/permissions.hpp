#pragma once

class PermissionProvider {
public:
    virtual ~PermissionProvider() = default;
    virtual bool microphone_granted() const = 0;
    virtual bool speech_granted() const = 0;
};
