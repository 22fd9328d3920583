#include "orchestrator.hpp"
#include "utils.hpp"

#include <iostream>

namespace Bulkpack {

std::string toString(InstallOutcome outcome)
{
    switch (outcome) {
    case InstallOutcome::SkippedEmpty:
        return "skipped";
    case InstallOutcome::Succeeded:
        return "installed";
    case InstallOutcome::Failed:
        return "failed";
    }
    return "unknown";
}

size_t InstallReport::succeededCount() const
{
    size_t count = 0;
    for (const auto& entry : entries) {
        if (entry.outcome == InstallOutcome::Succeeded) {
            ++count;
        }
    }
    return count;
}

size_t InstallReport::failedCount() const
{
    return failures().size();
}

std::vector<PartialInstallFailure> InstallReport::failures() const
{
    std::vector<PartialInstallFailure> result;
    for (const auto& entry : entries) {
        if (entry.outcome == InstallOutcome::Failed) {
            result.emplace_back(entry.categoryId, entry.reason);
        }
    }
    return result;
}

void InstallReport::print() const
{
    std::cout << "Installation summary:" << std::endl;
    for (const auto& entry : entries) {
        std::cout << "  " << entry.categoryId << ": " << toString(entry.outcome);
        if (!entry.packages.empty()) {
            std::cout << " (" << join(entry.packages) << ")";
        }
        if (entry.outcome == InstallOutcome::Failed) {
            std::cout << " - " << entry.reason;
        }
        std::cout << std::endl;
    }
}

InstallOrchestrator::InstallOrchestrator(const CategoryCatalog& catalog)
    : catalog_(catalog)
{
}

InstallReport InstallOrchestrator::run(const SelectionSet& selection, PackageManager& manager) const
{
    InstallReport report;

    for (const auto& category : catalog_.categories()) {
        CategoryReport entry;
        entry.categoryId = category.id;
        entry.packages   = selection.chosen(category.id);

        if (entry.packages.empty()) {
            entry.outcome = InstallOutcome::SkippedEmpty;
            report.entries.push_back(entry);
            continue;
        }

        log_message("Installing " + category.id + ": " + join(entry.packages));
        try {
            manager.install(entry.packages);
            entry.outcome = InstallOutcome::Succeeded;
        } catch (const UnsupportedManagerError&) {
            // Misconfiguration is fatal for the whole run, not one category
            throw;
        } catch (const std::exception& e) {
            PartialInstallFailure failure(category.id, e.what());
            log_error(failure.what());
            entry.outcome = InstallOutcome::Failed;
            entry.reason  = failure.reason();
        }
        report.entries.push_back(entry);
    }

    return report;
}

} // namespace Bulkpack
