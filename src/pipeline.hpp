#pragma once
#include "include/crtmix.hpp"
#include "include/effect_config.hpp"
#include "core/sort_engine/parallel_sort_engine.h"
#include <memory>
#include <vector>

namespace crtmix {

// Pipeline states in their fixed execution order
enum class PipelineStage : uint8_t {
    Noise = 0,
    Artifact,
    ChannelSwap,
    ChannelShift,
    ChromaticAberration,
    PixelSort,
    Crt,
    Done,
};

const char* to_string(PipelineStage stage);

// EffectPipeline walks the stages in order, handing each stage's fresh
// output buffer to the next. A disabled stage passes its input through.
// Stages never overlap: stage N+1 starts after stage N's buffer is complete.
class EffectPipeline {
public:
    // Validates cfg; throws Error(UnsupportedParameter)
    explicit EffectPipeline(const EffectConfig& cfg);
    ~EffectPipeline();

    // Random source seeded from cfg.seed when set, else nondeterministic
    PixelBuffer run(const PixelBuffer& input);
    PixelBuffer run(const PixelBuffer& input, Rng& rng);

    const EffectConfig& config() const { return cfg_; }

    static bool stage_enabled(PipelineStage stage, const EffectConfig& cfg);
    // Stages that will execute for cfg, in order
    static std::vector<PipelineStage> plan(const EffectConfig& cfg);

private:
    PixelBuffer apply_stage(PipelineStage stage, const PixelBuffer& in, Rng& rng);

    EffectConfig cfg_;
    std::unique_ptr<ParallelSortEngine> sort_engine_;
};

// One-shot entry point: build a pipeline for cfg and run it on input
PixelBuffer apply_effects(const PixelBuffer& input, const EffectConfig& cfg);
PixelBuffer apply_effects(const PixelBuffer& input, const EffectConfig& cfg, Rng& rng);

} // namespace crtmix
