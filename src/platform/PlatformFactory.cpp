#include "PlatformFactory.h"

#ifdef _WIN32
#include "windows/WindowsInputBackend.h"
#elif __linux__
#include "linux/LinuxInputBackend.h"
#endif

std::unique_ptr<InputBackend> PlatformFactory::createBackend()
{
#ifdef _WIN32
    return std::make_unique<WindowsInputBackend>();
#elif __linux__
    return std::make_unique<LinuxInputBackend>();
#else
    return nullptr;
#endif
}
