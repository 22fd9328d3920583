#include "config.hpp"
#include "errors.hpp"
#include "utils.hpp"

#include <iostream>
#include <fstream>
#include <sstream>
#include <filesystem>
#include <cstdlib>
#include <yaml-cpp/yaml.h>

namespace fs = std::filesystem;

namespace Bulkpack {

    namespace {

        int readPositive(const YAML::Node& node, const char* key, int fallback)
        {
            if (!node[key]) {
                return fallback;
            }
            int value = node[key].as<int>();
            if (value <= 0) {
                throw ConfigError(std::string("dialog.") + key + " must be positive");
            }
            return value;
        }

    } // namespace

    Config Config::fromYaml(const std::string& text) {
        Config config;

        try {
            YAML::Node root = YAML::Load(text);
            if (!root || root.IsNull()) {
                return config;
            }
            if (!root.IsMap()) {
                throw ConfigError("Configuration root must be a mapping");
            }

            if (root["package_manager"]) {
                config.packageManager = trim(root["package_manager"].as<std::string>());
            }
            if (root["catalog"]) {
                config.catalog = root["catalog"].as<std::string>();
            }
            if (root["dialog_program"]) {
                config.dialogProgram = root["dialog_program"].as<std::string>();
            }
            if (root["privilege_command"]) {
                config.privilegeCommand = root["privilege_command"].as<std::string>();
            }
            if (root["assume_yes"]) {
                config.assumeYes = root["assume_yes"].as<bool>();
            }

            const YAML::Node dialog = root["dialog"];
            if (dialog) {
                if (!dialog.IsMap()) {
                    throw ConfigError("'dialog' must be a mapping");
                }
                config.dialog.height     = readPositive(dialog, "height", config.dialog.height);
                config.dialog.width      = readPositive(dialog, "width", config.dialog.width);
                config.dialog.listHeight = readPositive(dialog, "list_height", config.dialog.listHeight);
            }
        } catch (const YAML::Exception& e) {
            throw ConfigError(std::string("Invalid configuration: ") + e.what());
        }

        return config;
    }

    Config Config::loadFromFile(const std::string& path) {
        if (!fs::exists(path)) {
            log_message("No configuration file at " + path + ", using defaults");
            return Config{};
        }

        std::ifstream file(path);
        if (!file.is_open()) {
            throw ConfigError("Unable to open configuration file: " + path);
        }

        std::stringstream buffer;
        buffer << file.rdbuf();
        return fromYaml(buffer.str());
    }

    std::string Config::defaultPath() {
        const char* xdg = std::getenv("XDG_CONFIG_HOME");
        if (xdg && *xdg) {
            return (fs::path(xdg) / "bulkpack" / "config.yaml").string();
        }
        const char* home = std::getenv("HOME");
        fs::path base = (home && *home) ? fs::path(home) : fs::current_path();
        return (base / ".config" / "bulkpack" / "config.yaml").string();
    }

    void Config::applyEnvironment() {
        const char* env = std::getenv("PKG_MANAGER");
        if (env && !trim(env).empty()) {
            packageManager = trim(env);
        }
    }

    void Config::print() const {
        std::cout << "Configuration:" << std::endl;
        std::cout << "  package_manager:   " << (packageManager.empty() ? "(unset)" : packageManager) << std::endl;
        std::cout << "  catalog:           " << (catalog.empty() ? "(built-in)" : catalog) << std::endl;
        std::cout << "  dialog_program:    " << dialogProgram << std::endl;
        std::cout << "  privilege_command: " << privilegeCommand << std::endl;
        std::cout << "  assume_yes:        " << (assumeYes ? "true" : "false") << std::endl;
        std::cout << "  dialog:            " << dialog.height << "x" << dialog.width
                  << " (list " << dialog.listHeight << ")" << std::endl;
    }
}
