#include "eye_config.hpp"
#include "logger.h"

#include <algorithm>
#include <cmath>
#include <random>
#include <sstream>

extern "C" {
#include "eye_limits.h"
}

// Seed transform bounds, fractions of the screen
static constexpr double SEED_WIDTH_MIN     = 0.22;
static constexpr double SEED_WIDTH_SPAN    = 0.12;
static constexpr double SEED_ASPECT_MIN    = 0.80;
static constexpr double SEED_ASPECT_SPAN   = 0.40;
static constexpr double SEED_HEIGHT_MIN    = 0.30;
static constexpr double SEED_HEIGHT_MAX    = 0.75;
static constexpr double SEED_SPACING_MIN   = 0.04;
static constexpr double SEED_SPACING_SPAN  = 0.10;
static constexpr double SEED_RADIUS_MIN    = 0.15;
static constexpr double SEED_RADIUS_SPAN   = 0.15;

bool operator==(const EyeParams &a, const EyeParams &b) {
    return a.width == b.width && a.height == b.height && a.corner_radius == b.corner_radius;
}

const char *toString(ConfigSource source) {
    switch (source) {
        case ConfigSource::OVERRIDE: return "override";
        case ConfigSource::SEED:     return "seed";
        case ConfigSource::DEFAULTS: return "defaults";
    }
    return "?";
}

// [0,1) from the top 53 bits; std distributions are not portable
static double unitDraw(std::mt19937_64 &rng) {
    return static_cast<double>(rng() >> 11) * (1.0 / 9007199254740992.0);
}

static std::string describe(const char *what, double from, double to) {
    std::ostringstream ss;
    ss << what << " " << from << " clamped to " << to;
    return ss.str();
}

static float clampValue(float value, float lo, float hi, float fallback,
                        const char *what, std::vector<std::string> &warnings) {
    if (!std::isfinite(value)) {
        std::ostringstream ss;
        ss << what << " not finite, using " << fallback;
        warnings.push_back(ss.str());
        value = fallback;
    }
    float clamped = std::clamp(value, lo, hi);
    if (clamped != value) {
        warnings.push_back(describe(what, value, clamped));
    }
    return clamped;
}

static void clampScreen(ScreenConfig &screen, std::vector<std::string> &warnings) {
    int w = roboeyes_clamp_int(screen.width, ROBOEYES_SCREEN_MIN_W, ROBOEYES_SCREEN_MAX_DIM);
    int h = roboeyes_clamp_int(screen.height, ROBOEYES_SCREEN_MIN_H, ROBOEYES_SCREEN_MAX_DIM);
    if (w != screen.width) warnings.push_back(describe("screen.width", screen.width, w));
    if (h != screen.height) warnings.push_back(describe("screen.height", screen.height, h));
    screen.width = w;
    screen.height = h;

    int rotate = ((screen.rotate % 360) + 360) % 360;
    if (rotate % 90 != 0) {
        warnings.push_back(describe("screen.rotate", screen.rotate, 0));
        rotate = 0;
    }
    screen.rotate = rotate;
}

static void clampEye(EyeParams &eye, const EyeParams &fallback, const ScreenConfig &screen,
                     const char *name, std::vector<std::string> &warnings) {
    std::string prefix(name);
    eye.width = clampValue(eye.width, ROBOEYES_EYE_MIN_PX, static_cast<float>(screen.width),
                           fallback.width, (prefix + ".width").c_str(), warnings);
    eye.height = clampValue(eye.height, ROBOEYES_EYE_MIN_PX, static_cast<float>(screen.height),
                            fallback.height, (prefix + ".height").c_str(), warnings);
}

static void clampRadius(EyeParams &eye, const char *name, std::vector<std::string> &warnings) {
    std::string what = std::string(name) + ".corner_radius";
    float limit = std::min(eye.width, eye.height) * 0.5f;
    eye.corner_radius = clampValue(eye.corner_radius, 0.0f, limit, 0.0f, what.c_str(), warnings);
}

// Both eyes plus the gap must fit side by side
static void fitWidth(ResolvedConfig &cfg, std::vector<std::string> &warnings) {
    float screen_w = static_cast<float>(cfg.screen.width);
    float eyes_w = cfg.left.width + cfg.right.width;

    if (eyes_w + cfg.spacing > screen_w) {
        float spacing = std::max(0.0f, screen_w - eyes_w);
        warnings.push_back(describe("eye.spacing", cfg.spacing, spacing));
        cfg.spacing = spacing;
    }

    if (eyes_w > screen_w) {
        float scale = screen_w / eyes_w;
        float lw = std::max<float>(ROBOEYES_EYE_MIN_PX, std::floor(cfg.left.width * scale));
        float rw = std::max<float>(ROBOEYES_EYE_MIN_PX, std::floor(cfg.right.width * scale));
        warnings.push_back(describe("left.width", cfg.left.width, lw));
        warnings.push_back(describe("right.width", cfg.right.width, rw));
        cfg.left.width = lw;
        cfg.right.width = rw;
    }
}

void ConfigResolver::deriveFromSeed(uint64_t seed, const ScreenConfig &screen,
                                    EyeParams &eye, float &spacing) {
    std::mt19937_64 rng(seed);

    double w = screen.width * (SEED_WIDTH_MIN + SEED_WIDTH_SPAN * unitDraw(rng));
    double h = w * (SEED_ASPECT_MIN + SEED_ASPECT_SPAN * unitDraw(rng));
    h = std::clamp(h, screen.height * SEED_HEIGHT_MIN, screen.height * SEED_HEIGHT_MAX);
    double gap = screen.width * (SEED_SPACING_MIN + SEED_SPACING_SPAN * unitDraw(rng));
    double r = std::min(w, h) * (SEED_RADIUS_MIN + SEED_RADIUS_SPAN * unitDraw(rng));

    eye.width = static_cast<float>(std::round(w));
    eye.height = static_cast<float>(std::round(h));
    eye.corner_radius = static_cast<float>(std::round(r));
    spacing = static_cast<float>(std::round(gap));
}

UnitOverride ConfigResolver::toOverride(const ResolvedConfig &config) {
    UnitOverride out;
    out.left.width = config.left.width;
    out.left.height = config.left.height;
    out.left.corner_radius = config.left.corner_radius;
    out.right.width = config.right.width;
    out.right.height = config.right.height;
    out.right.corner_radius = config.right.corner_radius;
    out.spacing = config.spacing;
    return out;
}

ResolveResult ConfigResolver::resolve(const ScreenConfig &screen,
                                      const EyeDefaults &defaults,
                                      const UnitConfig &unit) {
    ResolveResult result;
    ResolvedConfig &cfg = result.config;

    cfg.screen = screen;
    clampScreen(cfg.screen, result.warnings);

    cfg.color = defaults.color;
    cfg.background = defaults.background;
    cfg.easing = isValid(defaults.easing) ? defaults.easing : Easing::LINEAR;
    cfg.seed = unit.seed;

    EyeParams fallback;
    fallback.width = defaults.width;
    fallback.height = defaults.height;
    fallback.corner_radius = defaults.corner_radius;

    if (unit.override_params) {
        const UnitOverride &ov = *unit.override_params;
        result.source = ConfigSource::OVERRIDE;

        cfg.left.width = ov.left.width.value_or(defaults.width);
        cfg.left.height = ov.left.height.value_or(defaults.height);
        cfg.left.corner_radius = ov.left.corner_radius.value_or(defaults.corner_radius);
        cfg.right.width = ov.right.width.value_or(defaults.width);
        cfg.right.height = ov.right.height.value_or(defaults.height);
        cfg.right.corner_radius = ov.right.corner_radius.value_or(defaults.corner_radius);
        cfg.spacing = ov.spacing.value_or(defaults.spacing);
    } else if (unit.randomize) {
        result.source = ConfigSource::SEED;

        EyeParams eye;
        deriveFromSeed(unit.seed, cfg.screen, eye, cfg.spacing);
        cfg.left = eye;
        cfg.right = eye;
    } else {
        result.source = ConfigSource::DEFAULTS;

        cfg.left = fallback;
        cfg.right = fallback;
        cfg.spacing = defaults.spacing;
    }

    // Seed-derived values stay in range by construction; the clamps below
    // only bite on tiny screens, overrides and defaults.
    clampEye(cfg.left, fallback, cfg.screen, "left", result.warnings);
    clampEye(cfg.right, fallback, cfg.screen, "right", result.warnings);
    cfg.spacing = clampValue(cfg.spacing, 0.0f, static_cast<float>(cfg.screen.width),
                             defaults.spacing, "eye.spacing", result.warnings);
    fitWidth(cfg, result.warnings);
    clampRadius(cfg.left, "left", result.warnings);
    clampRadius(cfg.right, "right", result.warnings);

    cfg.look_travel = clampValue(defaults.look_travel, 0.0f, 1.0f, 1.0f,
                                 "eye.look_travel", result.warnings);
    cfg.idle_travel = clampValue(defaults.idle_travel, 0.0f, 1.0f, 0.5f,
                                 "eye.idle_travel", result.warnings);

    for (const auto &warning : result.warnings) {
        LOG_WARN(LOG_TAG_CONFIG, "%s", warning.c_str());
    }

    LOG_INFO(LOG_TAG_CONFIG, "Eyes from %s: L %.0fx%.0f r%.0f, R %.0fx%.0f r%.0f, spacing %.0f on %dx%d",
             toString(result.source),
             cfg.left.width, cfg.left.height, cfg.left.corner_radius,
             cfg.right.width, cfg.right.height, cfg.right.corner_radius,
             cfg.spacing, cfg.screen.width, cfg.screen.height);

    return result;
}
