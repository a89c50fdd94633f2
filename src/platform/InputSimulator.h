#pragma once
#include "InputBackend.h"

/**
 * InputSimulator
 * -----------------------
 * Input actuator used by the control loop. Runs ActuationCommands on
 * the platform backend, synchronously and in the order given.
 * Does not own the backend.
 */
class InputSimulator
{
public:
    explicit InputSimulator(InputBackend *backend = nullptr)
        : backend_(backend) {}

    void setBackend(InputBackend *backend) { backend_ = backend; }
    bool isReady() const { return backend_ != nullptr; }

    bool execute(const ActuationCommand &cmd);

private:
    InputBackend *backend_;
};
