#include "Application.h"

auto main() -> int
{
    auto application = std::make_unique<Application>(sRelaySettings::fromEnvironment());

    application->start();
    application->join();

    return 0;
}
