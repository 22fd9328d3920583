#ifndef ORCHESTRATOR_HPP
#define ORCHESTRATOR_HPP

#include "catalog.hpp"
#include "errors.hpp"
#include "package_manager.hpp"
#include "session.hpp"

#include <string>
#include <vector>

namespace Bulkpack {

enum class InstallOutcome
{
    SkippedEmpty,
    Succeeded,
    Failed
};

std::string toString(InstallOutcome outcome);

struct CategoryReport
{
    std::string categoryId;
    InstallOutcome outcome = InstallOutcome::SkippedEmpty;
    std::string reason;                // Failed only
    std::vector<std::string> packages; // what was passed to install
};

/**
 * @brief Per-category results, in catalog order.
 */
struct InstallReport
{
    std::vector<CategoryReport> entries;

    size_t succeededCount() const;
    size_t failedCount() const;
    std::vector<PartialInstallFailure> failures() const;

    /**
     * @brief Prints a one-line summary per category.
     */
    void print() const;
};

/**
 * @class InstallOrchestrator
 * @brief Installs a SelectionSet one batched call per category.
 *
 * A failing category is recorded and the remaining categories are still
 * attempted.
 */
class InstallOrchestrator
{
public:
    explicit InstallOrchestrator(const CategoryCatalog& catalog);

    InstallReport run(const SelectionSet& selection, PackageManager& manager) const;

private:
    const CategoryCatalog& catalog_;
};

} // namespace Bulkpack

#endif // ORCHESTRATOR_HPP
