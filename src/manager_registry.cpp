#include "manager_registry.hpp"
#include "errors.hpp"
#include "utils.hpp"

#include <functional>
#include <map>
#include <utility>

namespace Bulkpack {

namespace {

    using Factory = std::function<std::unique_ptr<PackageManager>(
        CommandRunner&, const Highlighter&, bool)>;

    // Accepted configuration spellings
    const std::vector<std::pair<std::string, ManagerKind>> knownManagers = {
        {"apt",     ManagerKind::AptGet},
        {"apt-get", ManagerKind::AptGet},
        {"pacman",  ManagerKind::Pacman}
    };

    const std::map<ManagerKind, Factory>& factories()
    {
        static const std::map<ManagerKind, Factory> table = {
            {ManagerKind::AptGet,
             [](CommandRunner& runner, const Highlighter& highlighter, bool assumeYes) {
                 return std::make_unique<AptGetManager>(runner, highlighter, assumeYes);
             }},
            {ManagerKind::Pacman,
             [](CommandRunner& runner, const Highlighter& highlighter, bool assumeYes) {
                 return std::make_unique<PacmanManager>(runner, highlighter, assumeYes);
             }}
        };
        return table;
    }

    ManagerSelection resolveAndWarn(const std::string& value)
    {
        if (value.empty()) {
            log_warning("No package manager configured; set 'package_manager' in the "
                        "config file or the PKG_MANAGER environment variable");
        }
        return ManagerRegistry::resolve(value);
    }

} // namespace

std::string toString(ManagerKind kind)
{
    switch (kind) {
    case ManagerKind::AptGet:
        return "apt-get";
    case ManagerKind::Pacman:
        return "pacman";
    case ManagerKind::Unsupported:
        break;
    }
    return "unsupported";
}

ManagerRegistry::ManagerRegistry(const Config& config)
    : selection_(resolveAndWarn(config.packageManager)),
      assumeYes_(config.assumeYes)
{
}

ManagerSelection ManagerRegistry::resolve(const std::string& configValue)
{
    for (const auto& [name, kind] : knownManagers) {
        if (configValue == name) {
            return ManagerSelection{kind, configValue};
        }
    }
    return ManagerSelection{ManagerKind::Unsupported, configValue};
}

bool ManagerRegistry::checkSupported() const
{
    if (selection_.supported()) {
        return true;
    }
    log_warning(UnsupportedManagerError(selection_.raw).what());
    return false;
}

std::vector<std::string> ManagerRegistry::knownValues()
{
    std::vector<std::string> values;
    for (const auto& entry : knownManagers) {
        values.push_back(entry.first);
    }
    return values;
}

std::unique_ptr<PackageManager> ManagerRegistry::createManager(CommandRunner& runner,
                                                               const Highlighter& highlighter) const
{
    auto it = factories().find(selection_.kind);
    if (it == factories().end()) {
        return std::make_unique<UnsupportedManager>(selection_.raw);
    }
    return it->second(runner, highlighter, assumeYes_);
}

} // namespace Bulkpack
