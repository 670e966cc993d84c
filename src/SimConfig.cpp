/**
 * @file SimConfig.cpp
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#include "SimConfig.h"
#include "Logger.h"

#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <cstring>
#include <string>

namespace {
bool parseDouble(const char* s, double& out) {
    if (!s || !*s) return false;
    char* end = nullptr;
    errno = 0;
    double v = std::strtod(s, &end);
    if (end == s || *end != '\0' || errno != 0) return false;
    out = v;
    return true;
}

bool parseInt(const char* s, int& out) {
    if (!s || !*s) return false;
    char* end = nullptr;
    errno = 0;
    long v = std::strtol(s, &end, 10);
    if (end == s || *end != '\0' || errno != 0) return false;
    if (v < -1000000L || v > 1000000L) return false;
    out = (int)v;
    return true;
}

struct Option {
    const char* shortName; // may be nullptr
    const char* longName;
    const char* env;       // may be nullptr
    bool integer;
    double SimConfig::* dval;
    int SimConfig::* ival;
};

const Option kOptions[] = {
    {"-w", "--workers", "ORRERY_WORKERS", true, nullptr, &SimConfig::workers},
    {nullptr, "--step", "ORRERY_STEP", false, &SimConfig::stepSize, nullptr},
    {nullptr, "--max-steps", "ORRERY_MAX_STEPS", true, nullptr, &SimConfig::maxStepsPerFrame},
    {"-t", "--time-scale", "ORRERY_TIME_SCALE", false, &SimConfig::timeScale, nullptr},
    {nullptr, "--softening", "ORRERY_SOFTENING", false, &SimConfig::softening, nullptr},
    {nullptr, "--substep", "ORRERY_SUBSTEP", false, &SimConfig::maxSubstep, nullptr},
    {nullptr, "--headless", nullptr, true, nullptr, &SimConfig::headlessFrames},
};

bool assign(SimConfig& cfg, const Option& opt, const char* value) {
    if (opt.integer) {
        int v;
        if (!parseInt(value, v)) return false;
        cfg.*(opt.ival) = v;
    } else {
        double v;
        if (!parseDouble(value, v)) return false;
        cfg.*(opt.dval) = v;
    }
    return true;
}
}

void applyEnv(SimConfig& cfg) {
    for (const auto& opt : kOptions) {
        if (!opt.env) continue;
        const char* v = std::getenv(opt.env);
        if (!v) continue;
        if (!assign(cfg, opt, v)) Logger::warn(std::string("ignoring unparsable ") + opt.env + "=" + v);
    }
}

void applyArgs(SimConfig& cfg, int argc, const char* const* argv) {
    for (int i = 1; i < argc; ++i) {
        std::string a(argv[i] ? argv[i] : "");
        bool matched = false;
        for (const auto& opt : kOptions) {
            const char* value = nullptr;
            std::string eq = std::string(opt.longName) + "=";
            if (a == opt.longName || (opt.shortName && a == opt.shortName)) {
                if (i + 1 < argc) value = argv[++i];
            } else if (a.rfind(eq, 0) == 0) {
                value = argv[i] + eq.size();
            } else {
                continue;
            }
            matched = true;
            if (!assign(cfg, opt, value)) {
                Logger::warn("ignoring bad value for " + std::string(opt.longName) + ": " + (value ? value : "(missing)"));
            }
            break;
        }
        if (!matched) Logger::warn("unknown argument: " + a);
    }
}

void validate(SimConfig& cfg) {
    const SimConfig defaults;
    if (cfg.workers < 0) {
        Logger::warn("workers must be >= 0; using logical core count");
        cfg.workers = 0;
    }
    if (!(cfg.stepSize > 0.0) || !std::isfinite(cfg.stepSize)) {
        Logger::warn("step size must be positive; using " + std::to_string(defaults.stepSize));
        cfg.stepSize = defaults.stepSize;
    }
    if (cfg.maxStepsPerFrame < 1) {
        Logger::warn("max steps per frame must be >= 1; using " + std::to_string(defaults.maxStepsPerFrame));
        cfg.maxStepsPerFrame = defaults.maxStepsPerFrame;
    }
    if (!(cfg.timeScale >= 0.0) || !std::isfinite(cfg.timeScale)) {
        Logger::warn("time scale must be >= 0; using " + std::to_string(defaults.timeScale));
        cfg.timeScale = defaults.timeScale;
    }
    if (!(cfg.softening >= 0.0) || !std::isfinite(cfg.softening)) {
        Logger::warn("softening must be >= 0; using " + std::to_string(defaults.softening));
        cfg.softening = defaults.softening;
    }
    if (!(cfg.maxSubstep > 0.0) || !std::isfinite(cfg.maxSubstep)) {
        Logger::warn("substep ceiling must be positive; using " + std::to_string(defaults.maxSubstep));
        cfg.maxSubstep = defaults.maxSubstep;
    }
    if (cfg.stepSize > cfg.maxSubstep) {
        Logger::warn("step size " + std::to_string(cfg.stepSize) + " exceeds substep ceiling; clamped to " +
                     std::to_string(cfg.maxSubstep));
        cfg.stepSize = cfg.maxSubstep;
    }
    if (cfg.headlessFrames < 0) cfg.headlessFrames = 0;
}

SimConfig loadConfig(int argc, const char* const* argv) {
    SimConfig cfg;
    applyEnv(cfg);
    applyArgs(cfg, argc, argv);
    validate(cfg);
    return cfg;
}
