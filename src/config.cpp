#include "include/effect_config.hpp"
#include <sstream>

namespace crtmix {

namespace {

[[noreturn]] void reject(const std::string& field, const std::string& detail) {
    throw Error(ErrorKind::UnsupportedParameter, field + ": " + detail);
}

template <typename T>
void require_range(const char* field, T v, T lo, T hi) {
    if (v < lo || v > hi) {
        std::ostringstream os;
        os << "value " << v << " outside [" << lo << ", " << hi << "]";
        reject(field, os.str());
    }
}

template <typename T>
void require_min(const char* field, T v, T lo) {
    if (v < lo) {
        std::ostringstream os;
        os << "value " << v << " below " << lo;
        reject(field, os.str());
    }
}

} // namespace

const char* to_string(SortKey v) {
    switch (v) {
    case SortKey::Brightness: return "brightness";
    case SortKey::Red: return "red";
    case SortKey::Green: return "green";
    case SortKey::Blue: return "blue";
    case SortKey::Hue: return "hue";
    case SortKey::Saturation: return "saturation";
    }
    return "unknown";
}

const char* to_string(SortDirection v) {
    return v == SortDirection::Vertical ? "vertical" : "horizontal";
}

const char* to_string(ChannelSwapMode v) {
    switch (v) {
    case ChannelSwapMode::RGB: return "rgb";
    case ChannelSwapMode::RBG: return "rbg";
    case ChannelSwapMode::GRB: return "grb";
    case ChannelSwapMode::GBR: return "gbr";
    case ChannelSwapMode::BRG: return "brg";
    case ChannelSwapMode::BGR: return "bgr";
    }
    return "unknown";
}

const char* to_string(NoiseType v) {
    switch (v) {
    case NoiseType::Gaussian: return "gaussian";
    case NoiseType::SaltPepper: return "salt_pepper";
    case NoiseType::FilmGrain: return "film_grain";
    }
    return "unknown";
}

const char* to_string(ArtifactType v) {
    switch (v) {
    case ArtifactType::Jpeg: return "jpeg";
    case ArtifactType::Vhs: return "vhs";
    case ArtifactType::DigitalGlitch: return "digital_glitch";
    case ArtifactType::ColorBleed: return "color_bleed";
    }
    return "unknown";
}

SortKey parse_sort_key(const std::string& name) {
    for (SortKey k : {SortKey::Brightness, SortKey::Red, SortKey::Green,
                      SortKey::Blue, SortKey::Hue, SortKey::Saturation}) {
        if (name == to_string(k)) return k;
    }
    reject("sort_mode", "unknown mode '" + name + "'");
}

SortDirection parse_sort_direction(const std::string& name) {
    if (name == "horizontal") return SortDirection::Horizontal;
    if (name == "vertical") return SortDirection::Vertical;
    reject("sort_direction", "unknown direction '" + name + "'");
}

ChannelSwapMode parse_swap_mode(const std::string& name) {
    for (ChannelSwapMode m : {ChannelSwapMode::RGB, ChannelSwapMode::RBG, ChannelSwapMode::GRB,
                              ChannelSwapMode::GBR, ChannelSwapMode::BRG, ChannelSwapMode::BGR}) {
        if (name == to_string(m)) return m;
    }
    reject("channel_swap_mode", "unknown permutation '" + name + "'");
}

NoiseType parse_noise_type(const std::string& name) {
    for (NoiseType t : {NoiseType::Gaussian, NoiseType::SaltPepper, NoiseType::FilmGrain}) {
        if (name == to_string(t)) return t;
    }
    reject("noise.type", "unknown noise type '" + name + "'");
}

ArtifactType parse_artifact_type(const std::string& name) {
    for (ArtifactType t : {ArtifactType::Jpeg, ArtifactType::Vhs,
                           ArtifactType::DigitalGlitch, ArtifactType::ColorBleed}) {
        if (name == to_string(t)) return t;
    }
    reject("artifact.type", "unknown artifact type '" + name + "'");
}

void EffectConfig::validate() const {
    require_range("sort.threshold", sort.threshold, 0, 255);
    require_min("sort.preview_max_dimension", sort.preview_max_dimension, 1);
    require_range("sort.workers", sort.workers, 0u, kMaxWorkers);

    require_min("channel.aberration", channel.aberration, 0);

    require_range("crt.scanline_intensity", crt.scanline_intensity, 0.0f, 1.0f);
    require_min("crt.scanline_thickness", crt.scanline_thickness, 1);
    require_min("crt.scanline_count", crt.scanline_count, 0);
    require_min("crt.warp", crt.warp, 0.0f);
    require_min("crt.brightness", crt.brightness, 0.0f);
    require_range("crt.glow", crt.glow, 0.0f, 1.0f);
    require_min("crt.mask_dark", crt.mask_dark, 0.0f);
    require_min("crt.mask_light", crt.mask_light, 0.0f);

    require_range("noise.intensity", noise.intensity, 0.0f, 1.0f);
    require_range("artifact.intensity", artifact.intensity, 0.0f, 1.0f);
}

} // namespace crtmix
