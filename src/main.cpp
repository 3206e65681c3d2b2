#include "include/crtmix.hpp"
#include "include/effect_config.hpp"
#include "core/microblocks/channel_distortion.h"
#include "core/microblocks/signal_distortion.h"
#include "image_io.hpp"
#include "pipeline.hpp"
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace crtmix;

namespace {

void usage() {
    std::cerr <<
        "usage:\n"
        "  crtmix apply <in> <out> [options]\n"
        "    --mode brightness|red|green|blue|hue|saturation   --direction horizontal|vertical\n"
        "    --threshold T  --reverse  --sort-all  --no-sort  --preview  --workers N\n"
        "    --swap rgb|rbg|grb|gbr|brg|bgr  --shift R G B  --shift-y R G B  --aberration N\n"
        "    --crt  --scanline-intensity F  --scanline-thickness N  --scanline-count N\n"
        "    --curvature F  --crt-brightness F  --glow F  --mask-dark F  --mask-light F\n"
        "    --noise gaussian|salt_pepper|film_grain  --noise-intensity F\n"
        "    --artifact jpeg|vhs|digital_glitch|color_bleed  --artifact-intensity F\n"
        "    --seed N  --quiet\n"
        "  crtmix scale <in> <out> <r> <g> <b>\n"
        "  crtmix signal <effect> <in> <out> [params] [--seed N] [--quiet]\n"
        "    scanline_shift <max_shift> <probability> | signal_noise <amount>\n"
        "    interlacing <strength> | vertical_hold <rows> | chroma_smear <amount>\n"
        "    dropout <count> <size>\n";
}

int to_int(const std::string& flag, const std::string& v) {
    try {
        size_t used = 0;
        int out = std::stoi(v, &used);
        if (used == v.size()) return out;
    } catch (const std::logic_error&) {
    }
    throw Error(ErrorKind::UnsupportedParameter, flag + ": expected an integer, got '" + v + "'");
}

float to_float(const std::string& flag, const std::string& v) {
    try {
        size_t used = 0;
        float out = std::stof(v, &used);
        if (used == v.size()) return out;
    } catch (const std::logic_error&) {
    }
    throw Error(ErrorKind::UnsupportedParameter, flag + ": expected a number, got '" + v + "'");
}

uint64_t to_u64(const std::string& flag, const std::string& v) {
    try {
        size_t used = 0;
        unsigned long long out = std::stoull(v, &used);
        if (used == v.size()) return static_cast<uint64_t>(out);
    } catch (const std::logic_error&) {
    }
    throw Error(ErrorKind::UnsupportedParameter, flag + ": expected an unsigned integer, got '" + v + "'");
}

// Walks argv; next() consumes the value following a flag
struct ArgCursor {
    const std::vector<std::string>& args;
    size_t i;

    std::string next(const std::string& flag) {
        if (i + 1 >= args.size()) {
            throw Error(ErrorKind::UnsupportedParameter, flag + ": missing value");
        }
        return args[++i];
    }
};

EffectConfig parse_apply(const std::vector<std::string>& args, std::vector<std::string>& positional) {
    EffectConfig cfg;
    ArgCursor cur{args, 0};
    for (; cur.i < args.size(); ++cur.i) {
        const std::string& a = args[cur.i];
        if (a == "--mode") cfg.sort.key = parse_sort_key(cur.next(a));
        else if (a == "--direction") cfg.sort.direction = parse_sort_direction(cur.next(a));
        else if (a == "--threshold") cfg.sort.threshold = to_int(a, cur.next(a));
        else if (a == "--reverse") cfg.sort.reverse = true;
        else if (a == "--sort-all") cfg.sort.sort_all = true;
        else if (a == "--no-sort") cfg.sort.no_sort = true;
        else if (a == "--preview") cfg.sort.preview = true;
        else if (a == "--workers") {
            const uint64_t n = to_u64(a, cur.next(a));
            if (n > kMaxWorkers) {
                throw Error(ErrorKind::UnsupportedParameter,
                            a + ": at most " + std::to_string(kMaxWorkers) + " workers");
            }
            cfg.sort.workers = static_cast<uint32_t>(n);
        }
        else if (a == "--swap") cfg.channel.swap = parse_swap_mode(cur.next(a));
        else if (a == "--shift") {
            cfg.channel.red.dx = to_int(a, cur.next(a));
            cfg.channel.green.dx = to_int(a, cur.next(a));
            cfg.channel.blue.dx = to_int(a, cur.next(a));
        } else if (a == "--shift-y") {
            cfg.channel.red.dy = to_int(a, cur.next(a));
            cfg.channel.green.dy = to_int(a, cur.next(a));
            cfg.channel.blue.dy = to_int(a, cur.next(a));
        }
        else if (a == "--aberration") cfg.channel.aberration = to_int(a, cur.next(a));
        else if (a == "--crt") cfg.crt.enabled = true;
        else if (a == "--scanline-intensity") cfg.crt.scanline_intensity = to_float(a, cur.next(a));
        else if (a == "--scanline-thickness") cfg.crt.scanline_thickness = to_int(a, cur.next(a));
        else if (a == "--scanline-count") cfg.crt.scanline_count = to_int(a, cur.next(a));
        else if (a == "--curvature") cfg.crt.warp = to_float(a, cur.next(a));
        else if (a == "--crt-brightness") cfg.crt.brightness = to_float(a, cur.next(a));
        else if (a == "--glow") cfg.crt.glow = to_float(a, cur.next(a));
        else if (a == "--mask-dark") cfg.crt.mask_dark = to_float(a, cur.next(a));
        else if (a == "--mask-light") cfg.crt.mask_light = to_float(a, cur.next(a));
        else if (a == "--noise") {
            cfg.noise.enabled = true;
            cfg.noise.type = parse_noise_type(cur.next(a));
        }
        else if (a == "--noise-intensity") cfg.noise.intensity = to_float(a, cur.next(a));
        else if (a == "--artifact") {
            cfg.artifact.enabled = true;
            cfg.artifact.type = parse_artifact_type(cur.next(a));
        }
        else if (a == "--artifact-intensity") cfg.artifact.intensity = to_float(a, cur.next(a));
        else if (a == "--seed") {
            cfg.has_seed = true;
            cfg.seed = to_u64(a, cur.next(a));
        }
        else if (a == "--quiet") set_verbose(false);
        else if (a.size() > 2 && a.compare(0, 2, "--") == 0) {
            throw Error(ErrorKind::UnsupportedParameter, "unknown option " + a);
        }
        else positional.push_back(a);
    }
    return cfg;
}

int cmd_apply(const std::vector<std::string>& args) {
    std::vector<std::string> pos;
    EffectConfig cfg = parse_apply(args, pos);
    if (pos.size() != 2) {
        usage();
        return 1;
    }
    cfg.validate();

    std::cout << "[crtmix] Processing " << pos[0] << "...\n";
    PixelBuffer img = load_image(pos[0]);
    PixelBuffer out = apply_effects(img, cfg);
    std::string written = save_image(pos[1], out);
    std::cout << "[crtmix] Done: " << written << "\n";
    return 0;
}

int cmd_scale(const std::vector<std::string>& args) {
    if (args.size() != 5) {
        usage();
        return 1;
    }
    ChannelScale scale(to_float("r", args[2]), to_float("g", args[3]), to_float("b", args[4]));
    PixelBuffer out = scale.process(load_image(args[0]));
    std::cout << "[crtmix] Done: " << save_image(args[1], out) << "\n";
    return 0;
}

int cmd_signal(const std::vector<std::string>& args) {
    std::vector<std::string> pos;
    bool has_seed = false;
    uint64_t seed = 0;
    for (size_t i = 0; i < args.size(); ++i) {
        if (args[i] == "--seed" && i + 1 < args.size()) {
            has_seed = true;
            seed = to_u64("--seed", args[++i]);
        } else if (args[i] == "--quiet") {
            set_verbose(false);
        } else {
            pos.push_back(args[i]);
        }
    }
    if (pos.size() < 3) {
        usage();
        return 1;
    }

    const std::string& effect = pos[0];
    const size_t nparams = pos.size() - 3;
    auto param = [&](size_t k) { return pos[3 + k]; };
    auto need = [&](size_t n) {
        if (nparams != n) {
            throw Error(ErrorKind::UnsupportedParameter,
                        effect + ": expected " + std::to_string(n) + " parameter(s)");
        }
    };

    Rng rng = make_rng(has_seed, seed);
    PixelBuffer img = load_image(pos[1]);
    PixelBuffer out;
    if (effect == "scanline_shift") {
        need(2);
        out = SignalDistortion::scanline_shift(img, to_int("max_shift", param(0)), to_float("probability", param(1)), rng);
    } else if (effect == "signal_noise") {
        need(1);
        out = SignalDistortion::signal_noise(img, to_float("amount", param(0)), rng);
    } else if (effect == "interlacing") {
        need(1);
        out = SignalDistortion::interlacing(img, to_float("strength", param(0)));
    } else if (effect == "vertical_hold") {
        need(1);
        out = SignalDistortion::vertical_hold(img, to_int("rows", param(0)));
    } else if (effect == "chroma_smear") {
        need(1);
        out = SignalDistortion::chroma_smear(img, to_int("amount", param(0)));
    } else if (effect == "dropout") {
        need(2);
        out = SignalDistortion::signal_dropout(img, to_int("count", param(0)), to_int("size", param(1)), rng);
    } else {
        throw Error(ErrorKind::UnsupportedParameter, "unknown signal effect '" + effect + "'");
    }
    std::cout << "[crtmix] Done: " << save_image(pos[2], out) << "\n";
    return 0;
}

int exit_code(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::InvalidImage: return 2;
    case ErrorKind::UnsupportedParameter: return 3;
    case ErrorKind::EncodeFailure: return 4;
    }
    return 1;
}

} // namespace

int main(int argc, char** argv) {
    if (argc < 2) {
        usage();
        return 1;
    }
    const std::string cmd = argv[1];
    const std::vector<std::string> args(argv + 2, argv + argc);

    try {
        if (cmd == "apply") return cmd_apply(args);
        if (cmd == "scale") return cmd_scale(args);
        if (cmd == "signal") return cmd_signal(args);
        usage();
        return 1;
    } catch (const Error& e) {
        switch (e.kind()) {
        case ErrorKind::InvalidImage:
            std::cerr << "[crtmix] Invalid image: " << e.what() << "\n";
            break;
        case ErrorKind::UnsupportedParameter:
            std::cerr << "[crtmix] Unsupported parameter: " << e.what() << "\n";
            break;
        case ErrorKind::EncodeFailure:
            std::cerr << "[crtmix] Could not write output: " << e.what() << "\n";
            break;
        }
        return exit_code(e.kind());
    } catch (const std::exception& e) {
        std::cerr << "[crtmix] Error: " << e.what() << "\n";
        return 1;
    }
}
