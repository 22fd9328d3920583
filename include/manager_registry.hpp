#ifndef MANAGER_REGISTRY_HPP
#define MANAGER_REGISTRY_HPP

#include "config.hpp"
#include "package_manager.hpp"
#include "process.hpp"

#include <memory>
#include <string>
#include <vector>

namespace Bulkpack {

enum class ManagerKind
{
    AptGet,
    Pacman,
    Unsupported
};

/**
 * @brief A resolved backend. For Unsupported, raw holds the offending value.
 */
struct ManagerSelection
{
    ManagerKind kind;
    std::string raw;

    bool supported() const { return kind != ManagerKind::Unsupported; }
};

/**
 * @brief Returns a printable name for a kind ("apt-get", "pacman", "unsupported").
 */
std::string toString(ManagerKind kind);

/**
 * @class ManagerRegistry
 * @brief Resolves the configured backend once and builds its adapter.
 */
class ManagerRegistry
{
public:
    /**
     * @brief Resolves config.packageManager. Logs a warning if it is empty.
     */
    explicit ManagerRegistry(const Config& config);

    /**
     * @brief Maps a configuration value to a backend. Pure and total:
     *        unknown values (including "") resolve to Unsupported.
     */
    static ManagerSelection resolve(const std::string& configValue);

    /**
     * @brief The configuration values recognized by resolve().
     */
    static std::vector<std::string> knownValues();

    const ManagerSelection& selection() const { return selection_; }

    /**
     * @brief Returns true for a supported backend. Otherwise logs the
     *        unsupported-manager warning and returns false.
     */
    bool checkSupported() const;

    /**
     * @brief Builds the adapter for the resolved backend.
     *
     * @param runner      Executes backend commands; must outlive the adapter.
     * @param highlighter Used by search; must outlive the adapter.
     */
    std::unique_ptr<PackageManager> createManager(CommandRunner& runner,
                                                  const Highlighter& highlighter) const;

private:
    const ManagerSelection selection_;
    const bool assumeYes_;
};

} // namespace Bulkpack

#endif // MANAGER_REGISTRY_HPP
