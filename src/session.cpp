#include "session.hpp"
#include "errors.hpp"
#include "utils.hpp"

#include <algorithm>
#include <stdexcept>
#include <unordered_set>

namespace Bulkpack {

// ============================================================================
// SelectionSet
// ============================================================================

SelectionSet::SelectionSet(const CategoryCatalog& catalog)
    : catalog_(catalog)
{
}

void SelectionSet::assign(const std::string& categoryId, const std::vector<std::string>& packages)
{
    const Category* category = catalog_.find(categoryId);
    if (!category) {
        throw std::invalid_argument("Unknown category: " + categoryId);
    }

    std::unordered_set<std::string> requested(packages.begin(), packages.end());
    for (const auto& package : requested) {
        if (!category->contains(package)) {
            throw std::invalid_argument("Package '" + package + "' is not in category " +
                                        categoryId);
        }
    }

    // Stored in catalog order regardless of the order the dialog returned
    std::vector<std::string> ordered;
    for (const auto& package : category->packages) {
        if (requested.count(package)) {
            ordered.push_back(package);
        }
    }
    chosen_[categoryId] = ordered;
}

std::vector<std::string> SelectionSet::chosen(const std::string& categoryId) const
{
    auto it = chosen_.find(categoryId);
    if (it == chosen_.end()) {
        return {};
    }
    return it->second;
}

bool SelectionSet::contains(const std::string& categoryId) const
{
    return chosen_.count(categoryId) != 0;
}

size_t SelectionSet::totalCount() const
{
    size_t total = 0;
    for (const auto& entry : chosen_) {
        total += entry.second.size();
    }
    return total;
}

// ============================================================================
// MenuState
// ============================================================================

std::string toString(const MenuState& state)
{
    switch (state.kind) {
    case MenuStateKind::CategoryMenu:
        return "CategoryMenu";
    case MenuStateKind::PackageChecklist:
        return "PackageChecklist(" + state.categoryId + ")";
    case MenuStateKind::Confirm:
        return "Confirm";
    case MenuStateKind::Done:
        return "Done";
    case MenuStateKind::Aborted:
        return "Aborted";
    }
    return "Unknown";
}

// ============================================================================
// SelectionSession
// ============================================================================

SelectionSession::SelectionSession(const CategoryCatalog& catalog, DialogProvider& dialog,
                                   const DialogGeometry& geometry)
    : catalog_(catalog),
      dialog_(dialog),
      geometry_(geometry),
      selection_(catalog)
{
}

void SelectionSession::enter(const MenuState& state)
{
    history_.push_back(state);
}

MenuStateKind SelectionSession::run()
{
    if (!dialog_.isAvailable()) {
        throw DialogUnavailableError(dialog_.name());
    }

    MenuState state{MenuStateKind::CategoryMenu, ""};
    enter(state);

    while (!state.terminal()) {
        switch (state.kind) {
        case MenuStateKind::CategoryMenu:
            state = categoryMenu();
            break;
        case MenuStateKind::PackageChecklist:
            state = packageChecklist(state.categoryId);
            break;
        case MenuStateKind::Confirm:
            state = confirm();
            break;
        case MenuStateKind::Done:
        case MenuStateKind::Aborted:
            break;
        }
        enter(state);
    }
    return state.kind;
}

MenuState SelectionSession::categoryMenu()
{
    DialogRequest request;
    request.title    = "Package selection";
    request.text     = "Choose a category to pick packages from";
    request.geometry = geometry_;
    request.mode     = DialogMode::Menu;

    for (const auto& category : catalog_.categories()) {
        std::string label = category.description.empty() ? category.id : category.description;
        label += " [" + std::to_string(selection_.chosen(category.id).size()) + "/" +
                 std::to_string(category.packages.size()) + "]";
        request.items.push_back({category.id, label, false});
    }
    request.items.push_back({CategoryCatalog::kInstallTag,
                             "Proceed to install (" +
                                 std::to_string(selection_.totalCount()) + " selected)",
                             false});

    DialogResult result = dialog_.show(request);
    if (!result.ok()) {
        return {MenuStateKind::Aborted, ""};
    }
    if (result.tags.empty()) {
        log_warning("No menu entry chosen");
        return {MenuStateKind::CategoryMenu, ""};
    }

    std::string tag = sanitizeTag(result.tags.front());
    if (tag == CategoryCatalog::kInstallTag) {
        return {MenuStateKind::Confirm, ""};
    }
    if (catalog_.find(tag)) {
        return {MenuStateKind::PackageChecklist, tag};
    }

    log_warning("Ignoring unknown menu entry: " + tag);
    return {MenuStateKind::CategoryMenu, ""};
}

MenuState SelectionSession::packageChecklist(const std::string& categoryId)
{
    const Category* category = catalog_.find(categoryId);

    std::vector<std::string> previous = selection_.chosen(categoryId);
    std::unordered_set<std::string> marked(previous.begin(), previous.end());

    DialogRequest request;
    request.title    = categoryId;
    request.text     = "Select packages to install";
    request.geometry = geometry_;
    request.mode     = DialogMode::Checklist;
    for (const auto& package : category->packages) {
        request.items.push_back({package, "", marked.count(package) != 0});
    }

    DialogResult result = dialog_.show(request);
    if (result.ok()) {
        std::vector<std::string> chosen;
        for (const auto& raw : result.tags) {
            std::string tag = sanitizeTag(raw);
            if (tag.empty()) {
                continue;
            }
            if (!category->contains(tag)) {
                log_warning("Ignoring unknown package '" + tag + "' in category " + categoryId);
                continue;
            }
            chosen.push_back(tag);
        }
        selection_.assign(categoryId, chosen);
    }

    return {MenuStateKind::CategoryMenu, ""};
}

MenuState SelectionSession::confirm()
{
    std::string text;
    if (selection_.empty()) {
        text = "No packages selected.\n\nFinish without installing anything?";
    } else {
        text = std::to_string(selection_.totalCount()) + " package(s) selected:\n\n";
        for (const auto& category : catalog_.categories()) {
            std::vector<std::string> chosen = selection_.chosen(category.id);
            if (!chosen.empty()) {
                text += category.id + ": " + join(chosen) + "\n";
            }
        }
        text += "\nInstall now?";
    }

    DialogRequest request;
    request.title    = "Confirm installation";
    request.text     = text;
    request.geometry = geometry_;
    request.mode     = DialogMode::YesNo;

    DialogResult result = dialog_.show(request);
    if (result.ok()) {
        return {MenuStateKind::Done, ""};
    }
    return {MenuStateKind::CategoryMenu, ""};
}

} // namespace Bulkpack
