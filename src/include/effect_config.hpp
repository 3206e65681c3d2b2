#pragma once
#include "crtmix.hpp"
#include <cstdint>
#include <string>

namespace crtmix {

// Upper bound on sort worker threads
constexpr uint32_t kMaxWorkers = 256;

enum class SortKey : uint8_t { Brightness, Red, Green, Blue, Hue, Saturation };
enum class SortDirection : uint8_t { Horizontal, Vertical };
// Output channel order, named after the source channel feeding R,G,B
enum class ChannelSwapMode : uint8_t { RGB, RBG, GRB, GBR, BRG, BGR };
enum class NoiseType : uint8_t { Gaussian, SaltPepper, FilmGrain };
enum class ArtifactType : uint8_t { Jpeg, Vhs, DigitalGlitch, ColorBleed };

const char* to_string(SortKey v);
const char* to_string(SortDirection v);
const char* to_string(ChannelSwapMode v);
const char* to_string(NoiseType v);
const char* to_string(ArtifactType v);

// Name parsers; unknown names throw Error(UnsupportedParameter)
SortKey parse_sort_key(const std::string& name);
SortDirection parse_sort_direction(const std::string& name);
ChannelSwapMode parse_swap_mode(const std::string& name);
NoiseType parse_noise_type(const std::string& name);
ArtifactType parse_artifact_type(const std::string& name);

struct SortConfig {
    SortKey key = SortKey::Brightness;
    SortDirection direction = SortDirection::Horizontal;
    int threshold = 100;       // 0..255, brightness >= threshold joins an interval
    bool reverse = false;
    bool sort_all = false;     // one whole-image sort; direction and threshold ignored
    bool no_sort = false;      // skip the sort stage entirely
    bool preview = false;      // downscale before interval sorting
    int preview_max_dimension = 800;
    uint32_t workers = 0;      // 0 = hardware concurrency minus one, at most kMaxWorkers
};

struct ChannelOffset {
    int dx = 0;
    int dy = 0;
    bool zero() const { return dx == 0 && dy == 0; }
};

struct ChannelConfig {
    ChannelSwapMode swap = ChannelSwapMode::RGB;
    ChannelOffset red;
    ChannelOffset green;
    ChannelOffset blue;
    int aberration = 0;        // chromatic aberration strength in pixels
};

struct CrtConfig {
    bool enabled = false;
    float scanline_intensity = 0.15f;
    int scanline_thickness = 1;
    int scanline_count = 600;
    float warp = 0.02f;        // curvature, applied to both axes
    float brightness = 1.2f;
    float glow = 0.0f;
    float mask_dark = 0.9f;
    float mask_light = 1.05f;
};

struct NoiseConfig {
    bool enabled = false;
    NoiseType type = NoiseType::Gaussian;
    float intensity = 0.1f;
};

struct ArtifactConfig {
    bool enabled = false;
    ArtifactType type = ArtifactType::Jpeg;
    float intensity = 0.5f;
};

// EffectConfig: immutable snapshot consumed by one EffectPipeline run
struct EffectConfig {
    SortConfig sort;
    ChannelConfig channel;
    CrtConfig crt;
    NoiseConfig noise;
    ArtifactConfig artifact;
    bool has_seed = false;
    uint64_t seed = 0;

    // throws Error(UnsupportedParameter) naming the first bad field
    void validate() const;
};

} // namespace crtmix
