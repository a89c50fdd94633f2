#pragma once
#include <memory>

#include "InputBackend.h"

namespace PlatformFactory
{
    // nullptr when the platform has no backend
    std::unique_ptr<InputBackend> createBackend();
}
