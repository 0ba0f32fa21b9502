#include "DriverFallback.h"

namespace TriangleLab::Renderer
{
    const char* DriverTypeName(DriverType type)
    {
        switch (type)
        {
        case DriverType::Hardware: return "hardware";
        case DriverType::Software: return "software";
        }
        return "unknown";
    }

    std::vector<DriverAttempt> BuildAttemptOrder(DriverType preferred, bool debugLayer)
    {
        std::vector<DriverAttempt> attempts;

        if (preferred == DriverType::Hardware)
        {
            DriverAttempt hardware;
            hardware.driver = DriverType::Hardware;
            hardware.debugLayer = debugLayer;
            attempts.push_back(hardware);
        }

        // Software fallback never carries validation flags
        DriverAttempt software;
        software.driver = DriverType::Software;
        software.debugLayer = false;
        attempts.push_back(software);

        return attempts;
    }
}
