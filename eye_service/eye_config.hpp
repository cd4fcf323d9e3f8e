#ifndef EYE_CONFIG_HPP
#define EYE_CONFIG_HPP

#include "bitmap.hpp"
#include "eye_types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

/**
 * Screen geometry as handed over by the display settings.
 * rotate and the offsets belong to the display transport and are only
 * carried through.
 */
struct ScreenConfig {
    int width = 128;
    int height = 64;
    ColorMode mode = ColorMode::MONO;
    int rotate = 0;       // degrees: 0, 90, 180, 270
    int h_offset = 0;
    int v_offset = 0;
};

/**
 * Eye defaults shared by every unit.
 */
struct EyeDefaults {
    float width = 36.0f;
    float height = 36.0f;
    float spacing = 10.0f;
    float corner_radius = 8.0f;
    Rgb color{255, 255, 255};
    Rgb background{0, 0, 0};
    float look_travel = 1.0f;   // fraction of the free room a look uses
    float idle_travel = 0.5f;   // same, for idle wander
    Easing easing = Easing::LINEAR;
};

struct EyeOverride {
    std::optional<float> width;
    std::optional<float> height;
    std::optional<float> corner_radius;
};

/**
 * Persisted per-unit appearance. Every field is optional.
 */
struct UnitOverride {
    EyeOverride left;
    EyeOverride right;
    std::optional<float> spacing;
};

struct UnitConfig {
    std::optional<UnitOverride> override_params;
    uint64_t seed = 0;
    bool randomize = true;
};

struct EyeParams {
    float width = 0.0f;
    float height = 0.0f;
    float corner_radius = 0.0f;
};

bool operator==(const EyeParams &a, const EyeParams &b);

/**
 * Fully resolved, bounds-checked parameters the engine starts from.
 */
struct ResolvedConfig {
    ScreenConfig screen;
    EyeParams left;
    EyeParams right;
    float spacing = 0.0f;
    Rgb color{255, 255, 255};
    Rgb background{0, 0, 0};
    float look_travel = 1.0f;
    float idle_travel = 0.5f;
    Easing easing = Easing::LINEAR;
    uint64_t seed = 0;
};

enum class ConfigSource : uint8_t {
    OVERRIDE,
    SEED,
    DEFAULTS
};

const char *toString(ConfigSource source);

struct ResolveResult {
    ResolvedConfig config;
    ConfigSource source = ConfigSource::DEFAULTS;
    std::vector<std::string> warnings;   // one per clamped value

    bool clamped() const { return !warnings.empty(); }
    EyeError error() const {
        return warnings.empty() ? EyeError::NONE : EyeError::CONFIG_OUT_OF_BOUNDS;
    }
};

/**
 * ConfigResolver - Startup parameters for both eyes
 *
 * Priority: persisted override (verbatim, gaps filled from defaults),
 * then seed-derived appearance when randomize is set, then defaults.
 * Whatever the source, values are clamped to the screen rather than
 * rejected; each clamp is reported as a warning.
 */
class ConfigResolver {
public:
    static ResolveResult resolve(const ScreenConfig &screen,
                                 const EyeDefaults &defaults,
                                 const UnitConfig &unit);

    /**
     * Deterministic appearance for a seed. Same seed and screen give
     * the same result on every platform.
     */
    static void deriveFromSeed(uint64_t seed, const ScreenConfig &screen,
                               EyeParams &eye, float &spacing);

    /**
     * Express resolved parameters as an override, for persisting.
     */
    static UnitOverride toOverride(const ResolvedConfig &config);
};

#endif // EYE_CONFIG_HPP
