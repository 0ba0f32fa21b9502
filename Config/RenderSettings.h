#pragma once
// Config/RenderSettings.h
// Render settings file loader

#include "../Renderer/Core/DriverFallback.h"
#include <cstdint>
#include <istream>
#include <string>

namespace TriangleLab::Config {

//------------------------------------------------------------------------------
// Minimum Direct3D feature level requested at device creation
//------------------------------------------------------------------------------
enum class FeatureLevel : uint32_t {
    Level11_0,
    Level11_1,
    Level12_0,
    Level12_1
};

const char* FeatureLevelName(FeatureLevel level);

//------------------------------------------------------------------------------
// Settings consumed by Dx12Context / App
//------------------------------------------------------------------------------
struct RenderSettings {
    uint32_t width = 800;
    uint32_t height = 600;
    float clearColor[4] = { 0.0f, 0.2f, 0.4f, 1.0f };
    std::string shaderPath = "shaders.hlsl";
    uint32_t syncInterval = 1;
    Renderer::DriverType driver = Renderer::DriverType::Hardware;
#if defined(_DEBUG)
    bool debugLayer = true;
#else
    bool debugLayer = false;
#endif
    FeatureLevel featureLevel = FeatureLevel::Level11_0;
};

//------------------------------------------------------------------------------
// Load status codes
//------------------------------------------------------------------------------
enum class LoadStatus {
    OK,
    FILE_NOT_FOUND,
    PARSE_ERROR
};

struct LoadResult {
    LoadStatus status = LoadStatus::OK;
    std::string errorMessage;
    int errorLine = 0;
};

//------------------------------------------------------------------------------
// ParseRenderSettings
// Line format: KEYWORD values...   ('#' starts a comment line)
//   WINDOW w h            w, h > 0
//   CLEAR_COLOR r g b a   each in [0, 1]
//   SHADER path
//   VSYNC n               0..4
//   DRIVER hardware|software
//   DEBUG_LAYER 0|1
//   FEATURE_LEVEL 11_0|11_1|12_0|12_1
// Each keyword may appear at most once; omitted keywords keep their defaults.
// On error, outSettings is left at defaults.
//------------------------------------------------------------------------------
LoadResult ParseRenderSettings(std::istream& in, RenderSettings& outSettings);

//------------------------------------------------------------------------------
// LoadRenderSettingsFromFile
// Path resolution: tries as-is, then next to the executable
//------------------------------------------------------------------------------
LoadResult LoadRenderSettingsFromFile(const char* path, RenderSettings& outSettings);

//------------------------------------------------------------------------------
// ResolvePath
// Returns path if it opens, else the exe-relative candidate if that opens,
// else path unchanged
//------------------------------------------------------------------------------
std::string ResolvePath(const char* path);

} // namespace TriangleLab::Config
