#ifndef SESSION_HPP
#define SESSION_HPP

#include "catalog.hpp"
#include "config.hpp"
#include "dialog.hpp"

#include <map>
#include <string>
#include <vector>

namespace Bulkpack {

/**
 * @class SelectionSet
 * @brief Chosen packages per category. Only ids present in the catalog
 *        are accepted.
 */
class SelectionSet
{
public:
    explicit SelectionSet(const CategoryCatalog& catalog);

    /**
     * @brief Replaces the selection for a category.
     * @throws std::invalid_argument for an unknown category or package.
     */
    void assign(const std::string& categoryId, const std::vector<std::string>& packages);

    /**
     * @brief Chosen packages for a category, in catalog order. Empty if none.
     */
    std::vector<std::string> chosen(const std::string& categoryId) const;

    bool contains(const std::string& categoryId) const;

    size_t totalCount() const;
    bool empty() const { return totalCount() == 0; }

private:
    const CategoryCatalog& catalog_;
    std::map<std::string, std::vector<std::string>> chosen_;
};

enum class MenuStateKind
{
    CategoryMenu,
    PackageChecklist,
    Confirm,
    Done,
    Aborted
};

struct MenuState
{
    MenuStateKind kind = MenuStateKind::CategoryMenu;
    std::string categoryId; // PackageChecklist only

    bool terminal() const
    {
        return kind == MenuStateKind::Done || kind == MenuStateKind::Aborted;
    }

    bool operator==(const MenuState& other) const
    {
        return kind == other.kind && categoryId == other.categoryId;
    }
};

std::string toString(const MenuState& state);

/**
 * @class SelectionSession
 * @brief Walks the user through category menu, package checklists and a
 *        confirmation screen, building a SelectionSet.
 *
 * Selections are sticky: revisiting a checklist pre-marks what was chosen
 * before. Cancelling a checklist keeps the previous choice.
 */
class SelectionSession
{
public:
    SelectionSession(const CategoryCatalog& catalog, DialogProvider& dialog,
                     const DialogGeometry& geometry);

    /**
     * @brief Runs the session until Done or Aborted.
     *
     * @return The terminal state reached.
     * @throws DialogUnavailableError if the dialog provider is missing; no
     *         state is entered in that case.
     */
    MenuStateKind run();

    const SelectionSet& selection() const { return selection_; }

    /**
     * @brief Every state entered, in order.
     */
    const std::vector<MenuState>& history() const { return history_; }

private:
    MenuState categoryMenu();
    MenuState packageChecklist(const std::string& categoryId);
    MenuState confirm();

    void enter(const MenuState& state);

    const CategoryCatalog& catalog_;
    DialogProvider& dialog_;
    DialogGeometry geometry_;
    SelectionSet selection_;
    std::vector<MenuState> history_;
};

} // namespace Bulkpack

#endif // SESSION_HPP
