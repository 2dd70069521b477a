// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file main.cpp
 * @brief lampcast command-line entry point
 *
 * Reads a decoded frame set and a signal list, prints the blueprint string
 * on stdout. Diagnostics go to stderr.
 */

#define LC_LOG_TAG "Main"

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>

#include "codec/ConfigCodec.h"
#include "config/DebugConfig.h"
#include "config/SynthConfig.h"
#include "config/version.h"
#include "frames/FrameSetCodec.h"
#include "palette/SignalPalette.h"
#include "synth/Pipeline.h"
#include "utils/Log.h"

using namespace lampcast;

namespace {

struct CliArgs {
    const char* framesPath = nullptr;
    const char* signalsPath = nullptr;
    const char* configPath = nullptr;
    const char* logLevel = nullptr;

    // Overrides; applied after the config file
    bool hasFps = false;
    uint32_t fps = 0;
    bool hasMaxSize = false;
    uint32_t maxSize = 0;
    bool hasCoverage = false;
    uint32_t coverage = 0;
    const char* powerQuality = nullptr;
    const char* qualityTiers = nullptr;
    bool showVersion = false;
    bool showHelp = false;
};

void printUsage(FILE* out) {
    fprintf(out,
            "Usage: lampcast --frames <frames.json> --signals <signals.json> [options]\n"
            "\n"
            "Options:\n"
            "  --config <file>           JSON config file\n"
            "  --fps <n>                 Target playback rate (1-%u, default %u)\n"
            "  --max-size <n>            Longest frame side after downscaling (default %u)\n"
            "  --coverage <n>            Power lattice spacing (0 = from quality)\n"
            "  --power-quality <q>       normal|uncommon|rare|epic|legendary\n"
            "  --quality-tiers <mode>    none|base|extended\n"
            "  --log-level <n|dom=n>     0=off .. 5=trace; domains synth, codec, frames, system\n"
            "  --version                 Print version and exit\n",
            config::MAX_TARGET_FPS, config::DEFAULT_TARGET_FPS, config::DEFAULT_MAX_SIZE);
}

bool parseUint(const char* text, uint32_t& out) {
    if (text == nullptr || *text == '\0') {
        return false;
    }
    char* end = nullptr;
    errno = 0;
    unsigned long v = strtoul(text, &end, 10);
    if (errno != 0 || *end != '\0' || text[0] == '-' || v > 0xFFFFFFFFUL) {
        return false;
    }
    out = static_cast<uint32_t>(v);
    return true;
}

bool parseArgs(int argc, char** argv, CliArgs& args) {
    for (int i = 1; i < argc; ++i) {
        const char* flag = argv[i];
        if (strcmp(flag, "--version") == 0) {
            args.showVersion = true;
            continue;
        }
        if (strcmp(flag, "--help") == 0 || strcmp(flag, "-h") == 0) {
            args.showHelp = true;
            continue;
        }
        if (i + 1 >= argc) {
            fprintf(stderr, "Missing value for %s\n", flag);
            return false;
        }
        const char* value = argv[++i];

        if (strcmp(flag, "--frames") == 0) {
            args.framesPath = value;
        } else if (strcmp(flag, "--signals") == 0) {
            args.signalsPath = value;
        } else if (strcmp(flag, "--config") == 0) {
            args.configPath = value;
        } else if (strcmp(flag, "--log-level") == 0) {
            args.logLevel = value;
        } else if (strcmp(flag, "--fps") == 0) {
            args.hasFps = parseUint(value, args.fps);
            if (!args.hasFps) {
                fprintf(stderr, "Invalid --fps: %s\n", value);
                return false;
            }
        } else if (strcmp(flag, "--max-size") == 0) {
            args.hasMaxSize = parseUint(value, args.maxSize);
            if (!args.hasMaxSize) {
                fprintf(stderr, "Invalid --max-size: %s\n", value);
                return false;
            }
        } else if (strcmp(flag, "--coverage") == 0) {
            args.hasCoverage = parseUint(value, args.coverage);
            if (!args.hasCoverage) {
                fprintf(stderr, "Invalid --coverage: %s\n", value);
                return false;
            }
        } else if (strcmp(flag, "--power-quality") == 0) {
            args.powerQuality = value;
        } else if (strcmp(flag, "--quality-tiers") == 0) {
            args.qualityTiers = value;
        } else {
            fprintf(stderr, "Unknown option: %s\n", flag);
            return false;
        }
    }
    return true;
}

bool readFile(const char* path, std::string& out) {
    FILE* file = fopen(path, "rb");
    if (file == nullptr) {
        LC_LOGE("Cannot open %s: %s", path, strerror(errno));
        return false;
    }
    char buffer[8192];
    size_t n = 0;
    while ((n = fread(buffer, 1, sizeof(buffer), file)) > 0) {
        out.append(buffer, n);
    }
    bool ok = ferror(file) == 0;
    fclose(file);
    if (!ok) {
        LC_LOGE("Read error on %s", path);
    }
    return ok;
}

} // namespace

int main(int argc, char** argv) {
    CliArgs args;
    if (!parseArgs(argc, argv, args)) {
        printUsage(stderr);
        return 2;
    }
    if (args.showHelp) {
        printUsage(stdout);
        return 0;
    }
    if (args.showVersion) {
        printf("lampcast %s\n", LAMPCAST_VERSION_STRING);
        return 0;
    }
    if (args.framesPath == nullptr || args.signalsPath == nullptr) {
        fprintf(stderr, "--frames and --signals are required\n");
        printUsage(stderr);
        return 2;
    }

    // ------------------------------------------------------------------
    // Configuration: defaults -> file -> flags
    // ------------------------------------------------------------------
    config::SynthConfig cfg;
    if (args.configPath != nullptr) {
        std::string text;
        if (!readFile(args.configPath, text)) {
            return 1;
        }
        codec::ConfigDecodeResult decoded = codec::ConfigCodec::decodeText(text.data(), text.size(), cfg);
        if (!decoded.success) {
            LC_LOGE("%s: %s", args.configPath, decoded.errorMsg);
            return 1;
        }
        cfg = decoded.config;
        if (decoded.logLevel >= 0) {
            config::getDebugConfig().globalLevel = static_cast<uint8_t>(decoded.logLevel);
        }
    }

    if (args.logLevel != nullptr && !config::applyLogLevelArg(args.logLevel)) {
        fprintf(stderr, "Invalid --log-level: %s\n", args.logLevel);
        return 2;
    }
    if (args.hasFps) cfg.targetFps = args.fps;
    if (args.hasMaxSize) cfg.maxSize = args.maxSize;
    if (args.hasCoverage) cfg.coverage = args.coverage;
    if (args.powerQuality != nullptr) cfg.powerQuality = args.powerQuality;
    if (args.qualityTiers != nullptr &&
        !palette::parseQualityTiers(args.qualityTiers, cfg.qualityTiers)) {
        fprintf(stderr, "Invalid --quality-tiers: %s\n", args.qualityTiers);
        return 2;
    }

    char errorMsg[MAX_ERROR_MSG] = {0};
    if (!codec::ConfigCodec::validate(cfg, errorMsg)) {
        LC_LOGE("%s", errorMsg);
        return 2;
    }

    LC_SYS_LOGI("lampcast %s: fps=%u maxSize=%u coverage=%u power=%s tiers=%s",
                LAMPCAST_VERSION_STRING, cfg.targetFps, cfg.maxSize, cfg.coverage,
                cfg.powerQuality.c_str(), palette::qualityTiersName(cfg.qualityTiers));

    // ------------------------------------------------------------------
    // Inputs
    // ------------------------------------------------------------------
    std::string signalsText;
    if (!readFile(args.signalsPath, signalsText)) {
        return 1;
    }
    palette::SignalPaletteDecodeResult palette =
        palette::SignalPalette::decodeText(signalsText.data(), signalsText.size(), cfg.qualityTiers);
    if (!palette.success) {
        LC_LOGE("%s: %s", args.signalsPath, palette.errorMsg);
        return 1;
    }

    std::string framesText;
    if (!readFile(args.framesPath, framesText)) {
        return 1;
    }
    frames::FrameSetDecodeResult frameSet =
        frames::FrameSetCodec::decodeText(framesText.data(), framesText.size());
    if (!frameSet.success) {
        LC_LOGE("%s: %s", args.framesPath, frameSet.errorMsg);
        return 1;
    }

    // ------------------------------------------------------------------
    // Run
    // ------------------------------------------------------------------
    synth::PipelineResult result = synth::Pipeline::run(
        frameSet.frames, palette.signals, cfg,
        [](uint8_t percent, const char* status) {
            LC_SYS_LOGD("[%3u%%] %s", percent, status);
        });
    if (!result.success) {
        LC_LOGE("Synthesis failed (%s): %s", synthErrorName(result.error), result.errorMsg);
        return 1;
    }

    fwrite(result.blueprint.data(), 1, result.blueprint.size(), stdout);
    fputc('\n', stdout);
    return fflush(stdout) == 0 ? 0 : 1;
}
