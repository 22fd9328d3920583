#include "catalog.hpp"
#include "errors.hpp"
#include "utils.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <unordered_set>
#include <utility>
#include <yaml-cpp/yaml.h>

namespace fs = std::filesystem;

namespace Bulkpack {

const char* const CategoryCatalog::kInstallTag = "INSTALL";

namespace {

    // Ids travel through the dialog program as whitespace-separated tags
    // with quotes stripped, so they may contain neither.
    bool isValidTag(const std::string& id)
    {
        return std::none_of(id.begin(), id.end(), [](unsigned char c) {
            return std::isspace(c) || c == '"' || c == '\'';
        });
    }

} // namespace

bool Category::contains(const std::string& package) const
{
    return std::find(packages.begin(), packages.end(), package) != packages.end();
}

CategoryCatalog::CategoryCatalog(std::vector<Category> categories)
    : categories_(std::move(categories))
{
    std::unordered_set<std::string> ids;
    for (const auto& category : categories_) {
        if (category.id.empty()) {
            throw CatalogError("Category with empty id");
        }
        if (!isValidTag(category.id)) {
            throw CatalogError("Invalid category id: '" + category.id + "'");
        }
        if (category.id == kInstallTag) {
            throw CatalogError(std::string("Category id '") + kInstallTag + "' is reserved");
        }
        if (!ids.insert(category.id).second) {
            throw CatalogError("Duplicate category id: " + category.id);
        }

        std::unordered_set<std::string> packages;
        for (const auto& package : category.packages) {
            if (package.empty()) {
                throw CatalogError("Empty package name in category " + category.id);
            }
            if (!isValidTag(package)) {
                throw CatalogError("Invalid package name '" + package + "' in category " +
                                   category.id);
            }
            if (!packages.insert(package).second) {
                throw CatalogError("Duplicate package '" + package + "' in category " +
                                   category.id);
            }
        }
    }
}

CategoryCatalog CategoryCatalog::builtIn()
{
    return CategoryCatalog(std::vector<Category>{
        {"core", "Shell and development essentials",
         {"git", "vim", "curl", "wget", "tmux", "htop", "zsh", "build-essential"}},
        {"pip", "Python tooling",
         {"python3-pip", "python3-venv", "ipython3", "black"}},
        {"optional", "Nice-to-have command line tools",
         {"ripgrep", "fzf", "bat", "jq", "tree", "ncdu"}},
        {"apps", "Desktop applications",
         {"firefox", "vlc", "gimp", "keepassxc", "thunderbird"}}
    });
}

CategoryCatalog CategoryCatalog::fromYaml(const std::string& text)
{
    std::vector<Category> categories;

    try {
        YAML::Node root = YAML::Load(text);
        if (!root.IsMap() || !root["categories"]) {
            throw CatalogError("Catalog must contain a 'categories' list");
        }

        const YAML::Node list = root["categories"];
        if (!list.IsSequence()) {
            throw CatalogError("'categories' must be a sequence");
        }

        for (const auto& node : list) {
            if (!node["id"]) {
                throw CatalogError("Category entry without 'id'");
            }

            Category category;
            category.id = trim(node["id"].as<std::string>());
            if (node["description"]) {
                category.description = node["description"].as<std::string>();
            }

            const YAML::Node packages = node["packages"];
            if (packages && packages.IsSequence()) {
                for (const auto& package : packages) {
                    category.packages.push_back(trim(package.as<std::string>()));
                }
            } else if (packages && packages.IsScalar()) {
                category.packages = splitWords(packages.as<std::string>());
            } else if (packages && !packages.IsNull()) {
                throw CatalogError("Invalid 'packages' for category " + category.id);
            }

            categories.push_back(std::move(category));
        }
    } catch (const YAML::Exception& e) {
        throw CatalogError(std::string("Invalid catalog: ") + e.what());
    }

    return CategoryCatalog(std::move(categories));
}

CategoryCatalog CategoryCatalog::load(const std::string& source)
{
    if (isRemoteSource(source)) {
        log_message("Fetching catalog from " + source);
        std::string text;
        try {
            text = fetchRemoteText(source);
        } catch (const std::runtime_error& e) {
            throw CatalogError(e.what());
        }
        return fromYaml(text);
    }

    if (!fs::exists(source)) {
        throw CatalogError("Catalog file not found: " + source);
    }
    std::ifstream file(source);
    if (!file.is_open()) {
        throw CatalogError("Unable to open catalog file: " + source);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return fromYaml(buffer.str());
}

const Category* CategoryCatalog::find(const std::string& id) const
{
    for (const auto& category : categories_) {
        if (category.id == id) {
            return &category;
        }
    }
    return nullptr;
}

void CategoryCatalog::print() const
{
    for (const auto& category : categories_) {
        std::cout << category.id;
        if (!category.description.empty()) {
            std::cout << " - " << category.description;
        }
        std::cout << "\n  " << join(category.packages) << "\n";
    }
}

} // namespace Bulkpack
