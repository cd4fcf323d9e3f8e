/**
 * ConfigStore Implementation
 *
 * Uses nlohmann/json for parsing and writing.
 */

#include "config_store.hpp"
#include "logger.h"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <sstream>
#include <nlohmann/json.hpp>

extern "C" {
#include "eye_limits.h"
}

using json = nlohmann::json;

namespace {

// Thrown for values that have the right JSON type but no meaning
struct BadValue {
    std::string message;
};

void readOptional(const json &obj, const char *key, std::optional<float> &out) {
    auto it = obj.find(key);
    if (it != obj.end() && !it->is_null()) {
        out = it->get<float>();
    }
}

EyeOverride readEyeOverride(const json &obj) {
    EyeOverride o;
    readOptional(obj, "width", o.width);
    readOptional(obj, "height", o.height);
    readOptional(obj, "roundness", o.corner_radius);
    return o;
}

json writeEyeOverride(const EyeOverride &o) {
    json out = json::object();
    if (o.width) out["width"] = *o.width;
    if (o.height) out["height"] = *o.height;
    if (o.corner_radius) out["roundness"] = *o.corner_radius;
    return out;
}

Rgb readColor(const json &obj, const char *key, const Rgb &def) {
    auto it = obj.find(key);
    if (it == obj.end()) return def;
    Rgb out;
    if (!parseRgb(it->get<std::string>(), out)) {
        throw BadValue{std::string("bad colour for \"") + key + "\""};
    }
    return out;
}

}  // namespace

ConfigStore::ConfigStore()
    : fps(ROBOEYES_RENDER_FPS_DEFAULT) {
}

bool ConfigStore::load(const std::string &path) {
    m_config_path = path;
    m_rejected = false;

    std::ifstream file(path);
    if (!file.is_open()) {
        LOG_WARN(LOG_TAG_CONFIG, "Config %s not found, using defaults", path.c_str());
        return false;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    if (!loadFromString(buffer.str())) {
        m_rejected = true;
        LOG_ERROR(LOG_TAG_CONFIG, "Config %s rejected, using defaults", path.c_str());
        return false;
    }

    LOG_INFO(LOG_TAG_CONFIG, "Loaded %s", path.c_str());
    return true;
}

bool ConfigStore::loadFromString(const std::string &content) {
    // Parse into copies so a bad file changes nothing
    ScreenConfig new_screen = screen;
    EyeDefaults new_eye = eye;
    int new_fps = fps;
    std::optional<UnitOverride> new_override = unit_override;
    std::optional<uint64_t> new_seed = seed;
    bool new_randomize = randomize;

    try {
        json root = json::parse(content);
        if (!root.is_object()) {
            LOG_ERROR(LOG_TAG_CONFIG, "Config root must be an object");
            return false;
        }

        if (root.contains("screen")) {
            const json &s = root["screen"];
            new_screen.width = s.value("width", new_screen.width);
            new_screen.height = s.value("height", new_screen.height);
            if (s.contains("mode")) {
                std::string mode = s["mode"].get<std::string>();
                if (!parseColorMode(mode, new_screen.mode)) {
                    throw BadValue{"unknown screen mode: " + mode};
                }
            }
            new_screen.rotate = s.value("rotate", new_screen.rotate);
            new_screen.h_offset = s.value("h_offset", new_screen.h_offset);
            new_screen.v_offset = s.value("v_offset", new_screen.v_offset);

            if (new_screen.rotate % 90 != 0) {
                LOG_WARN(LOG_TAG_CONFIG, "rotate %d is not a multiple of 90, using 0",
                         new_screen.rotate);
                new_screen.rotate = 0;
            }
        }

        if (root.contains("render")) {
            const json &r = root["render"];
            new_fps = r.value("fps", new_fps);
            if (r.contains("easing")) {
                std::string name = r["easing"].get<std::string>();
                if (!parseEasing(name, new_eye.easing)) {
                    throw BadValue{"unknown easing: " + name};
                }
            }
        }

        if (root.contains("eye")) {
            const json &e = root["eye"];
            new_eye.width = e.value("width", new_eye.width);
            new_eye.height = e.value("height", new_eye.height);
            new_eye.spacing = e.value("distance", new_eye.spacing);
            new_eye.corner_radius = e.value("roundness", new_eye.corner_radius);
            new_eye.color = readColor(e, "color", new_eye.color);
            new_eye.background = readColor(e, "background", new_eye.background);
            new_eye.look_travel = e.value("look_travel", new_eye.look_travel);
            new_eye.idle_travel = e.value("idle_travel", new_eye.idle_travel);
        }

        if (root.contains("unit")) {
            const json &u = root["unit"];
            if (u.contains("seed") && !u["seed"].is_null()) {
                new_seed = u["seed"].get<uint64_t>();
            }
            new_randomize = u.value("randomize", new_randomize);

            if (u.contains("left") || u.contains("right") || u.contains("distance")) {
                UnitOverride o;
                if (u.contains("left")) o.left = readEyeOverride(u["left"]);
                if (u.contains("right")) o.right = readEyeOverride(u["right"]);
                readOptional(u, "distance", o.spacing);
                new_override = o;
            }
        }
    } catch (const json::exception &e) {
        LOG_ERROR(LOG_TAG_CONFIG, "Config parse error: %s", e.what());
        return false;
    } catch (const BadValue &e) {
        LOG_ERROR(LOG_TAG_CONFIG, "Config error: %s", e.message.c_str());
        return false;
    }

    int clamped_fps = roboeyes_clamp_int(new_fps, ROBOEYES_RENDER_FPS_MIN, ROBOEYES_RENDER_FPS_MAX);
    if (clamped_fps != new_fps) {
        LOG_WARN(LOG_TAG_CONFIG, "fps %d out of range, using %d", new_fps, clamped_fps);
    }

    screen = new_screen;
    eye = new_eye;
    fps = clamped_fps;
    unit_override = new_override;
    seed = new_seed;
    randomize = new_randomize;
    return true;
}

std::string ConfigStore::toJson() const {
    json root;

    root["screen"] = {
        {"width", screen.width},
        {"height", screen.height},
        {"mode", toString(screen.mode)},
        {"rotate", screen.rotate},
        {"h_offset", screen.h_offset},
        {"v_offset", screen.v_offset},
    };

    root["render"] = {
        {"fps", fps},
        {"easing", toString(eye.easing)},
    };

    root["eye"] = {
        {"width", eye.width},
        {"height", eye.height},
        {"distance", eye.spacing},
        {"roundness", eye.corner_radius},
        {"color", formatRgb(eye.color)},
        {"background", formatRgb(eye.background)},
        {"look_travel", eye.look_travel},
        {"idle_travel", eye.idle_travel},
    };

    json unit = json::object();
    if (seed) unit["seed"] = *seed;
    unit["randomize"] = randomize;
    if (unit_override) {
        unit["left"] = writeEyeOverride(unit_override->left);
        unit["right"] = writeEyeOverride(unit_override->right);
        if (unit_override->spacing) unit["distance"] = *unit_override->spacing;
    }
    root["unit"] = unit;

    return root.dump(2);
}

bool ConfigStore::save(const std::string &path) const {
    if (m_rejected && path == m_config_path) {
        LOG_ERROR(LOG_TAG_CONFIG, "Not overwriting %s, it failed to load", path.c_str());
        return false;
    }

    std::string tmp = path + ".tmp";
    {
        std::ofstream file(tmp, std::ios::trunc);
        if (!file.is_open()) {
            LOG_ERROR(LOG_TAG_CONFIG, "Cannot write %s", tmp.c_str());
            return false;
        }

        file << toJson() << "\n";
        if (!file.good()) {
            LOG_ERROR(LOG_TAG_CONFIG, "Write to %s failed", tmp.c_str());
            std::remove(tmp.c_str());
            return false;
        }
    }

    if (std::rename(tmp.c_str(), path.c_str()) != 0) {
        LOG_ERROR(LOG_TAG_CONFIG, "rename %s: %s", path.c_str(), strerror(errno));
        std::remove(tmp.c_str());
        return false;
    }

    LOG_INFO(LOG_TAG_CONFIG, "Saved %s", path.c_str());
    return true;
}

void ConfigStore::setUnitOverride(const UnitOverride &override_params) {
    unit_override = override_params;
}

UnitConfig ConfigStore::unitConfig(uint64_t fallback_seed) const {
    UnitConfig unit;
    unit.override_params = unit_override;
    unit.seed = seed ? *seed : fallback_seed;
    unit.randomize = randomize;
    return unit;
}
