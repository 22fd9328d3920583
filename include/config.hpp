#ifndef CONFIG_HPP
#define CONFIG_HPP

#include <string>

namespace Bulkpack {

/**
 * @brief Geometry hints passed to the dialog program.
 */
struct DialogGeometry
{
    int height = 20;
    int width = 70;
    int listHeight = 12;
};

/**
 * @class Config
 * @brief Process-wide settings. Built once at startup and handed to every
 *        component by const reference; nothing else reads the environment.
 */
class Config
{
public:
    /**
     * @brief Raw backend selector ("apt-get", "pacman", ...). May be empty.
     */
    std::string packageManager;

    /**
     * @brief Catalog file path or http(s) URL. Empty means the built-in catalog.
     */
    std::string catalog;

    /**
     * @brief dialog-compatible program used by the interactive selector.
     */
    std::string dialogProgram = "dialog";

    /**
     * @brief Prefix used to elevate privileged backend commands.
     */
    std::string privilegeCommand = "sudo";

    /**
     * @brief Pass the backend's non-interactive flag (-y / --noconfirm).
     */
    bool assumeYes = false;

    DialogGeometry dialog;

    /**
     * @brief Loads configuration from a YAML file on disk.
     *
     * A missing file yields the defaults.
     *
     * @param path Path to the configuration file.
     * @return A fully populated Config instance.
     * @throws ConfigError if the file exists but cannot be parsed.
     */
    static Config loadFromFile(const std::string& path);

    /**
     * @brief Parses configuration from YAML text.
     * @throws ConfigError on malformed input.
     */
    static Config fromYaml(const std::string& text);

    /**
     * @brief Default config location: $XDG_CONFIG_HOME/bulkpack/config.yaml,
     *        falling back to ~/.config/bulkpack/config.yaml.
     */
    static std::string defaultPath();

    /**
     * @brief Applies environment overrides (PKG_MANAGER).
     */
    void applyEnvironment();

    /**
     * @brief Prints the effective configuration to standard output.
     */
    void print() const;
};

} // namespace Bulkpack

#endif // CONFIG_HPP
