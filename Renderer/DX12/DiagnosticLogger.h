#pragma once

#include <Windows.h>
#include <cstdio>
#include <cstdarg>

namespace TriangleLab::Renderer
{
    // DiagnosticLogger: Centralized diagnostic logging
    // Output goes to the debugger (OutputDebugStringA) and is mirrored to stderr
    // so console runs and test logs see the same lines.
    class DiagnosticLogger
    {
    public:
        // Throttle interval in milliseconds (1 second default)
        static constexpr DWORD DefaultThrottleMs = 1000;

        // Returns true once per interval for this tag
        static bool ShouldLog(const char* tag, DWORD throttleMs = DefaultThrottleMs)
        {
            DWORD now = GetTickCount();
            DWORD* lastTime = GetThrottleSlot(tag);

            if (*lastTime == 0 || now - *lastTime > throttleMs)
            {
                *lastTime = now ? now : 1;
                return true;
            }
            return false;
        }

        // Log a message with throttling (printf-style)
        template<typename... Args>
        static void LogThrottled(const char* tag, const char* format, Args... args)
        {
            if (ShouldLog(tag))
                Emit("", format, args...);
        }

        // Log unconditionally (no throttling)
        template<typename... Args>
        static void Log(const char* format, Args... args)
        {
            Emit("", format, args...);
        }

        template<typename... Args>
        static void LogError(const char* format, Args... args)
        {
            Emit("ERROR: ", format, args...);
        }

    private:
        static constexpr size_t NumSlots = 16;
        static constexpr size_t BufferSize = 1024;

        template<typename... Args>
        static void Emit(const char* prefix, const char* format, Args... args)
        {
            char body[BufferSize];
            if constexpr (sizeof...(Args) == 0)
                std::snprintf(body, sizeof(body), "%s", format);
            else
                std::snprintf(body, sizeof(body), format, args...);

            char line[BufferSize + 16];
            std::snprintf(line, sizeof(line), "%s%s", prefix, body);
            OutputDebugStringA(line);
            std::fputs(line, stderr);
            std::fflush(stderr);
        }

        static DWORD* GetThrottleSlot(const char* tag)
        {
            static DWORD slots[NumSlots] = {};

            size_t hash = 0;
            for (const char* p = tag; *p; ++p)
                hash = hash * 31 + static_cast<unsigned char>(*p);

            return &slots[hash % NumSlots];
        }
    };

} // namespace TriangleLab::Renderer
