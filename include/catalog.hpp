#ifndef CATALOG_HPP
#define CATALOG_HPP

#include <string>
#include <vector>

namespace Bulkpack {

/**
 * @brief A named, ordered group of packages shown together in the selector.
 */
struct Category
{
    std::string id;
    std::string description;
    std::vector<std::string> packages;

    bool contains(const std::string& package) const;
};

/**
 * @class CategoryCatalog
 * @brief Read-only, manually ordered list of categories.
 *
 * The declared order is an install-priority hint (core before nice-to-have)
 * and is preserved exactly; it is never sorted.
 */
class CategoryCatalog
{
public:
    /**
     * @brief Tag reserved for the "proceed to install" menu entry.
     */
    static const char* const kInstallTag;

    /**
     * @brief Builds a catalog, validating ids and package lists.
     * @throws CatalogError on empty or duplicate category ids, the reserved
     *         install tag, or duplicate packages within one category.
     */
    explicit CategoryCatalog(std::vector<Category> categories);

    /**
     * @brief The default catalog: core, pip, optional, apps.
     */
    static CategoryCatalog builtIn();

    /**
     * @brief Parses a catalog from YAML text.
     *
     * Expected layout:
     * @code
     * categories:
     *   - id: core
     *     description: Base tools
     *     packages: [git, vim]
     * @endcode
     * A scalar packages value ("git vim") is split on whitespace here, once.
     *
     * @throws CatalogError on malformed input.
     */
    static CategoryCatalog fromYaml(const std::string& text);

    /**
     * @brief Loads a catalog from a file path or an http(s) URL.
     */
    static CategoryCatalog load(const std::string& source);

    const std::vector<Category>& categories() const { return categories_; }

    /**
     * @brief Looks up a category by id.
     * @return The category, or nullptr if it is not in the catalog.
     */
    const Category* find(const std::string& id) const;

    /**
     * @brief Prints every category and its packages to standard output.
     */
    void print() const;

private:
    std::vector<Category> categories_;
};

} // namespace Bulkpack

#endif // CATALOG_HPP
