#include "pipeline.hpp"
#include <cassert>
#include <iostream>
#include <random>
#include <string>
#include <vector>

using namespace crtmix;

static PixelBuffer random_buffer(int w, int h, uint64_t seed) {
    std::mt19937_64 rng(seed);
    std::uniform_int_distribution<int> byte(0, 255);
    PixelBuffer b(w, h);
    for (size_t i = 0; i < b.size(); ++i)
        b.data()[i] = Rgb{static_cast<uint8_t>(byte(rng)), static_cast<uint8_t>(byte(rng)),
                          static_cast<uint8_t>(byte(rng))};
    return b;
}

static void test_passthrough() {
    EffectConfig cfg;
    cfg.sort.no_sort = true;
    assert(EffectPipeline::plan(cfg).empty());
    PixelBuffer in = random_buffer(33, 21, 1);
    assert(apply_effects(in, cfg) == in);
}

static void test_plan_order() {
    EffectConfig cfg;
    cfg.noise.enabled = true;
    cfg.artifact.enabled = true;
    cfg.channel.swap = ChannelSwapMode::GRB;
    cfg.channel.green.dx = 2;
    cfg.channel.aberration = 4;
    cfg.crt.enabled = true;
    std::vector<PipelineStage> plan = EffectPipeline::plan(cfg);
    std::vector<PipelineStage> expect{PipelineStage::Noise, PipelineStage::Artifact, PipelineStage::ChannelSwap,
                                      PipelineStage::ChannelShift, PipelineStage::ChromaticAberration,
                                      PipelineStage::PixelSort, PipelineStage::Crt};
    assert(plan == expect);

    cfg.channel.green.dx = 0;
    cfg.channel.aberration = 0;
    assert(!EffectPipeline::stage_enabled(PipelineStage::ChannelShift, cfg));
    assert(!EffectPipeline::stage_enabled(PipelineStage::ChromaticAberration, cfg));
    assert(std::string(to_string(PipelineStage::PixelSort)) == "pixel_sort");
}

static void test_swap_runs_before_sort() {
    EffectConfig cfg;
    cfg.channel.swap = ChannelSwapMode::BGR;
    cfg.sort.key = SortKey::Red;
    cfg.sort.threshold = 0;
    cfg.sort.workers = 2;
    PixelBuffer in(2, 1, {Rgb{0, 0, 200}, Rgb{200, 0, 0}});
    PixelBuffer out = apply_effects(in, cfg);
    // swapped to [(200,0,0),(0,0,200)], then sorted by red
    assert(out.at(0, 0) == (Rgb{0, 0, 200}));
    assert(out.at(1, 0) == (Rgb{200, 0, 0}));
}

static void test_seeded_runs_repeat() {
    EffectConfig cfg;
    cfg.noise.enabled = true;
    cfg.noise.type = NoiseType::Gaussian;
    cfg.artifact.enabled = true;
    cfg.artifact.type = ArtifactType::DigitalGlitch;
    cfg.artifact.intensity = 0.7f;
    cfg.crt.enabled = true;
    cfg.has_seed = true;
    cfg.seed = 2024;
    cfg.sort.workers = 3;

    PixelBuffer in = random_buffer(80, 60, 9);
    EffectPipeline pipeline(cfg);
    assert(pipeline.config().seed == 2024 && pipeline.config().sort.workers == 3);
    PixelBuffer a = pipeline.run(in);
    PixelBuffer b = pipeline.run(in);
    assert(a == b);
    assert(a.width() == 80 && a.height() == 60);

    Rng r1(5), r2(5);
    assert(apply_effects(in, cfg, r1) == apply_effects(in, cfg, r2));
}

static void test_deterministic_stages() {
    EffectConfig cfg;
    cfg.channel.red.dx = 3;
    cfg.channel.blue.dy = -2;
    cfg.channel.aberration = 2;
    cfg.crt.enabled = true;
    cfg.sort.direction = SortDirection::Vertical;
    PixelBuffer in = random_buffer(50, 40, 4);
    assert(apply_effects(in, cfg) == apply_effects(in, cfg));
}

static void test_invalid_config() {
    EffectConfig cfg;
    cfg.crt.scanline_intensity = 1.5f;
    bool caught = false;
    try {
        EffectPipeline pipeline(cfg);
    } catch (const Error& e) {
        caught = e.kind() == ErrorKind::UnsupportedParameter;
    }
    assert(caught);
}

int main() {
    set_verbose(false);
    test_passthrough();
    test_plan_order();
    test_swap_runs_before_sort();
    test_seeded_runs_repeat();
    test_deterministic_stages();
    test_invalid_config();
    std::cout << "EffectPipeline test PASSED\n";
    return 0;
}
