#include "pipeline.hpp"
#include "core/microblocks/artifact_synth.h"
#include "core/microblocks/channel_distortion.h"
#include "core/microblocks/crt_simulator.h"
#include "core/microblocks/noise_synth.h"
#include <chrono>
#include <iostream>

namespace crtmix {

const char* to_string(PipelineStage stage) {
    switch (stage) {
    case PipelineStage::Noise: return "noise";
    case PipelineStage::Artifact: return "artifact";
    case PipelineStage::ChannelSwap: return "channel_swap";
    case PipelineStage::ChannelShift: return "channel_shift";
    case PipelineStage::ChromaticAberration: return "chromatic_aberration";
    case PipelineStage::PixelSort: return "pixel_sort";
    case PipelineStage::Crt: return "crt";
    case PipelineStage::Done: return "done";
    }
    return "unknown";
}

EffectPipeline::EffectPipeline(const EffectConfig& cfg) : cfg_(cfg) {
    cfg_.validate();
    if (stage_enabled(PipelineStage::PixelSort, cfg_)) {
        sort_engine_.reset(new ParallelSortEngine(cfg_.sort.workers));
    }
}

EffectPipeline::~EffectPipeline() = default;

bool EffectPipeline::stage_enabled(PipelineStage stage, const EffectConfig& cfg) {
    switch (stage) {
    case PipelineStage::Noise: return cfg.noise.enabled;
    case PipelineStage::Artifact: return cfg.artifact.enabled;
    case PipelineStage::ChannelSwap: return cfg.channel.swap != ChannelSwapMode::RGB;
    case PipelineStage::ChannelShift:
        return !(cfg.channel.red.zero() && cfg.channel.green.zero() && cfg.channel.blue.zero());
    case PipelineStage::ChromaticAberration: return cfg.channel.aberration > 0;
    case PipelineStage::PixelSort: return !cfg.sort.no_sort;
    case PipelineStage::Crt: return cfg.crt.enabled;
    case PipelineStage::Done: return false;
    }
    return false;
}

std::vector<PipelineStage> EffectPipeline::plan(const EffectConfig& cfg) {
    std::vector<PipelineStage> out;
    for (int s = 0; s < static_cast<int>(PipelineStage::Done); ++s) {
        const PipelineStage stage = static_cast<PipelineStage>(s);
        if (stage_enabled(stage, cfg)) out.push_back(stage);
    }
    return out;
}

PixelBuffer EffectPipeline::run(const PixelBuffer& input) {
    Rng rng = make_rng(cfg_.has_seed, cfg_.seed);
    return run(input, rng);
}

PixelBuffer EffectPipeline::run(const PixelBuffer& input, Rng& rng) {
    using clock = std::chrono::steady_clock;
    if (verbose()) {
        std::cout << "[Pipeline] RUN size=" << input.width() << "x" << input.height()
                  << " stages=" << plan(cfg_).size() << "\n";
    }

    PixelBuffer current = input;
    PipelineStage stage = PipelineStage::Noise;
    while (stage != PipelineStage::Done) {
        if (stage_enabled(stage, cfg_)) {
            auto t0 = clock::now();
            current = apply_stage(stage, current, rng);
            if (verbose()) {
                auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(clock::now() - t0).count();
                std::cout << "[Pipeline] STAGE_APPLIED stage=" << to_string(stage) << " size=" << current.width()
                          << "x" << current.height() << " ms=" << ms << "\n";
            }
        } else if (verbose()) {
            std::cout << "[Pipeline] STAGE_SKIPPED stage=" << to_string(stage) << "\n";
        }
        stage = static_cast<PipelineStage>(static_cast<int>(stage) + 1);
    }
    return current;
}

PixelBuffer EffectPipeline::apply_stage(PipelineStage stage, const PixelBuffer& in, Rng& rng) {
    switch (stage) {
    case PipelineStage::Noise:
        return NoiseSynthesizer(cfg_.noise.type, cfg_.noise.intensity).process(in, rng);
    case PipelineStage::Artifact:
        return ArtifactSynthesizer(cfg_.artifact.type, cfg_.artifact.intensity).process(in, rng);
    case PipelineStage::ChannelSwap:
        return ChannelSwap(cfg_.channel.swap).process(in);
    case PipelineStage::ChannelShift:
        return ChannelShift(cfg_.channel.red, cfg_.channel.green, cfg_.channel.blue).process(in);
    case PipelineStage::ChromaticAberration:
        return ChromaticAberration(cfg_.channel.aberration).process(in);
    case PipelineStage::PixelSort:
        return sort_engine_->process(in, cfg_.sort);
    case PipelineStage::Crt:
        return CrtSimulator(CrtParams::from_config(cfg_.crt)).process(in);
    case PipelineStage::Done:
        break;
    }
    return in;
}

PixelBuffer apply_effects(const PixelBuffer& input, const EffectConfig& cfg) {
    EffectPipeline pipeline(cfg);
    return pipeline.run(input);
}

PixelBuffer apply_effects(const PixelBuffer& input, const EffectConfig& cfg, Rng& rng) {
    EffectPipeline pipeline(cfg);
    return pipeline.run(input, rng);
}

} // namespace crtmix
