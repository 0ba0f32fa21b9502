#pragma once

#include <cstdint>
#include <string>
#include <type_traits>
#include <vector>
#include "RenderErrors.h"

namespace TriangleLab::Renderer
{
    enum class DriverType : uint32_t
    {
        Hardware,   // best hardware adapter
        Software    // WARP rasterizer
    };

    const char* DriverTypeName(DriverType type);

    struct DriverAttempt
    {
        DriverType driver = DriverType::Hardware;
        bool debugLayer = false;
    };

    // Hardware is tried first (with the debug layer if requested), then
    // software without any debug/validation flags. A software preference
    // yields a single attempt.
    std::vector<DriverAttempt> BuildAttemptOrder(DriverType preferred, bool debugLayer);

    // Runs tryCreate(attempt) for each attempt until one returns.
    // A RenderError from a non-final attempt is reported to onFailure and the
    // next attempt runs; when every attempt fails a DeviceCreationError
    // listing all failures is thrown.
    template <typename TryCreate, typename OnFailure>
    auto CreateWithFallback(const std::vector<DriverAttempt>& attempts, TryCreate&& tryCreate, OnFailure&& onFailure)
        -> std::invoke_result_t<TryCreate&, const DriverAttempt&>
    {
        if (attempts.empty())
            throw DeviceCreationError("no driver attempts configured");

        std::string failures;
        int32_t lastResult = 0;

        for (const DriverAttempt& attempt : attempts)
        {
            try
            {
                return tryCreate(attempt);
            }
            catch (const RenderError& e)
            {
                onFailure(attempt, e);

                if (!failures.empty())
                    failures += "; ";
                failures += DriverTypeName(attempt.driver);
                failures += ": ";
                failures += e.what();
                lastResult = e.GetResult();
            }
        }

        throw DeviceCreationError("all driver attempts failed [" + failures + "]", lastResult);
    }
}
