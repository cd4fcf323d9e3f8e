#ifndef CONFIG_STORE_HPP
#define CONFIG_STORE_HPP

#include "eye_config.hpp"

#include <cstdint>
#include <optional>
#include <string>

/**
 * ConfigStore - Persistent configuration storage
 *
 * Stores and loads configuration from a JSON file with four sections:
 * "screen", "render", "eye" and "unit". Anything missing keeps its default.
 * A file that fails to parse leaves every value at its previous state.
 */
class ConfigStore {
public:
    ConfigStore();

    /**
     * Load configuration from file. A missing file is not an error
     * (defaults are used, a warning is logged).
     */
    bool load(const std::string &path);

    /**
     * Load configuration from a JSON document.
     */
    bool loadFromString(const std::string &content);

    /**
     * Save configuration to file (written to "<path>.tmp", then renamed).
     * Refuses to replace the file this store last failed to parse.
     */
    bool save(const std::string &path) const;

    std::string toJson() const;

    /**
     * Replace the persisted per-unit appearance.
     */
    void setUnitOverride(const UnitOverride &override_params);

    /**
     * Unit section with the seed filled in: the configured one, or the
     * fallback when the file has none.
     */
    UnitConfig unitConfig(uint64_t fallback_seed) const;

    const std::string &path() const { return m_config_path; }

    /**
     * True when the last load() found the file but could not use it.
     */
    bool rejected() const { return m_rejected; }

    // Configuration values
    ScreenConfig screen;
    EyeDefaults eye;
    int fps;

    std::optional<UnitOverride> unit_override;
    std::optional<uint64_t> seed;
    bool randomize = true;

private:
    std::string m_config_path;
    bool m_rejected = false;
};

#endif // CONFIG_STORE_HPP
