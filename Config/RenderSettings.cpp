// Config/RenderSettings.cpp
// Render settings file loader implementation

#include "RenderSettings.h"
#include <fstream>
#include <sstream>
#include <set>

#ifdef _WIN32
#include <Windows.h>
#endif

namespace TriangleLab::Config {

//------------------------------------------------------------------------------
// Helper: trim whitespace from string
//------------------------------------------------------------------------------
static std::string Trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

//------------------------------------------------------------------------------
// Helper: true if nothing but whitespace remains on the line
//------------------------------------------------------------------------------
static bool AtEnd(std::istringstream& iss) {
    std::string extra;
    return !(iss >> extra);
}

static LoadResult Fail(const std::string& message, int line) {
    LoadResult result;
    result.status = LoadStatus::PARSE_ERROR;
    result.errorMessage = message;
    result.errorLine = line;
    return result;
}

const char* FeatureLevelName(FeatureLevel level) {
    switch (level) {
    case FeatureLevel::Level11_0: return "11_0";
    case FeatureLevel::Level11_1: return "11_1";
    case FeatureLevel::Level12_0: return "12_0";
    case FeatureLevel::Level12_1: return "12_1";
    }
    return "unknown";
}

//------------------------------------------------------------------------------
// ParseRenderSettings
//------------------------------------------------------------------------------
LoadResult ParseRenderSettings(std::istream& in, RenderSettings& outSettings) {
    outSettings = RenderSettings{};
    RenderSettings parsed;
    std::set<std::string> seen;

    std::string line;
    int lineNum = 0;

    while (std::getline(in, line)) {
        lineNum++;
        line = Trim(line);

        // Skip empty lines and comments
        if (line.empty() || line[0] == '#') continue;

        std::istringstream iss(line);
        std::string keyword;
        iss >> keyword;

        if (!seen.insert(keyword).second) {
            return Fail("Duplicate " + keyword, lineNum);
        }

        if (keyword == "WINDOW") {
            long long w = 0, h = 0;
            if (!(iss >> w >> h) || !AtEnd(iss)) {
                return Fail("WINDOW requires: width height", lineNum);
            }
            if (w <= 0 || h <= 0 || w > 16384 || h > 16384) {
                return Fail("WINDOW dimensions must be in 1..16384", lineNum);
            }
            parsed.width = static_cast<uint32_t>(w);
            parsed.height = static_cast<uint32_t>(h);
        }
        else if (keyword == "CLEAR_COLOR") {
            float c[4] = {};
            if (!(iss >> c[0] >> c[1] >> c[2] >> c[3]) || !AtEnd(iss)) {
                return Fail("CLEAR_COLOR requires: r g b a", lineNum);
            }
            for (int i = 0; i < 4; ++i) {
                if (!(c[i] >= 0.0f && c[i] <= 1.0f)) {
                    return Fail("CLEAR_COLOR components must be in [0, 1]", lineNum);
                }
                parsed.clearColor[i] = c[i];
            }
        }
        else if (keyword == "SHADER") {
            // Rest of the line is the path (may contain spaces)
            std::string rest;
            std::getline(iss, rest);
            rest = Trim(rest);
            if (rest.empty()) {
                return Fail("SHADER requires: path", lineNum);
            }
            parsed.shaderPath = rest;
        }
        else if (keyword == "VSYNC") {
            long long interval = -1;
            if (!(iss >> interval) || !AtEnd(iss)) {
                return Fail("VSYNC requires: interval", lineNum);
            }
            if (interval < 0 || interval > 4) {
                return Fail("VSYNC interval must be in 0..4", lineNum);
            }
            parsed.syncInterval = static_cast<uint32_t>(interval);
        }
        else if (keyword == "DRIVER") {
            std::string name;
            if (!(iss >> name) || !AtEnd(iss)) {
                return Fail("DRIVER requires: hardware|software", lineNum);
            }
            if (name == "hardware") parsed.driver = Renderer::DriverType::Hardware;
            else if (name == "software") parsed.driver = Renderer::DriverType::Software;
            else return Fail("Unknown DRIVER: " + name, lineNum);
        }
        else if (keyword == "DEBUG_LAYER") {
            int flag = -1;
            if (!(iss >> flag) || !AtEnd(iss) || (flag != 0 && flag != 1)) {
                return Fail("DEBUG_LAYER requires: 0|1", lineNum);
            }
            parsed.debugLayer = (flag == 1);
        }
        else if (keyword == "FEATURE_LEVEL") {
            std::string name;
            if (!(iss >> name) || !AtEnd(iss)) {
                return Fail("FEATURE_LEVEL requires: 11_0|11_1|12_0|12_1", lineNum);
            }
            if (name == "11_0") parsed.featureLevel = FeatureLevel::Level11_0;
            else if (name == "11_1") parsed.featureLevel = FeatureLevel::Level11_1;
            else if (name == "12_0") parsed.featureLevel = FeatureLevel::Level12_0;
            else if (name == "12_1") parsed.featureLevel = FeatureLevel::Level12_1;
            else return Fail("Unsupported FEATURE_LEVEL: " + name, lineNum);
        }
        else {
            return Fail("Unknown keyword: " + keyword, lineNum);
        }
    }

    outSettings = parsed;
    return LoadResult{};
}

//------------------------------------------------------------------------------
// ResolvePath
//------------------------------------------------------------------------------
std::string ResolvePath(const char* path) {
    {
        std::ifstream test(path);
        if (test.good()) return path;
    }

#ifdef _WIN32
    char exePath[MAX_PATH];
    if (GetModuleFileNameA(nullptr, exePath, MAX_PATH) > 0) {
        std::string exeDir(exePath);
        auto lastSlash = exeDir.find_last_of("\\/");
        if (lastSlash != std::string::npos) {
            std::string fallback = exeDir.substr(0, lastSlash + 1) + path;
            std::ifstream test(fallback);
            if (test.good()) return fallback;
        }
    }
#endif

    return path;
}

//------------------------------------------------------------------------------
// LoadRenderSettingsFromFile
//------------------------------------------------------------------------------
LoadResult LoadRenderSettingsFromFile(const char* path, RenderSettings& outSettings) {
    outSettings = RenderSettings{};

    std::string resolvedPath = ResolvePath(path);
    std::ifstream file(resolvedPath);
    if (!file.is_open()) {
        LoadResult result;
        result.status = LoadStatus::FILE_NOT_FOUND;
        result.errorMessage = "Cannot open file: " + std::string(path);
        return result;
    }

    return ParseRenderSettings(file, outSettings);
}

} // namespace TriangleLab::Config
