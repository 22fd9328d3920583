#include <algorithm>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "catalog.hpp"
#include "config.hpp"
#include "dialog.hpp"
#include "errors.hpp"
#include "manager_registry.hpp"
#include "orchestrator.hpp"
#include "package_manager.hpp"
#include "process.hpp"
#include "session.hpp"
#include "utils.hpp"

namespace {

void printHelp()
{
    std::cout << "Bulkpack\n"
              << "Usage: bulkpack [--config <path>] command [args]\n\n"
              << "Bulkpack drives the system package manager and offers an\n"
              << "interactive menu for installing packages in bulk.\n\n"
              << "Commands:\n"
              << "  install <pkg...>  - Install packages in one batch\n"
              << "  remove <pkg...>   - Remove packages in one batch\n"
              << "  search <query>    - Search the package index\n"
              << "  sync              - Refresh the package index\n"
              << "  upgrade           - Upgrade all installed packages\n"
              << "  autoremove        - Remove orphaned dependencies\n"
              << "  select            - Pick packages by category and install them\n"
              << "  categories        - List the package catalog\n"
              << "  config            - Show the effective configuration\n\n"
              << "Supported package managers: " << Bulkpack::join(Bulkpack::ManagerRegistry::knownValues(), ", ")
              << "\n(set 'package_manager' in " << Bulkpack::Config::defaultPath()
              << " or PKG_MANAGER)\n";
}

bool isBackendCommand(const std::string& command)
{
    static const std::vector<std::string> commands = {
        "install", "remove", "search", "sync", "upgrade", "autoremove", "select"
    };
    return std::find(commands.begin(), commands.end(), command) != commands.end();
}

Bulkpack::CategoryCatalog loadCatalog(const Bulkpack::Config& config)
{
    if (config.catalog.empty()) {
        return Bulkpack::CategoryCatalog::builtIn();
    }
    return Bulkpack::CategoryCatalog::load(config.catalog);
}

int runSelection(const Bulkpack::Config& config, Bulkpack::PackageManager& manager)
{
    Bulkpack::CategoryCatalog catalog = loadCatalog(config);
    Bulkpack::ExternalDialog dialog(config.dialogProgram);
    Bulkpack::SelectionSession session(catalog, dialog, config.dialog);

    Bulkpack::MenuStateKind end;
    try {
        end = session.run();
    } catch (const Bulkpack::DialogUnavailableError& e) {
        Bulkpack::log_warning(std::string(e.what()) + "; install it or set 'dialog_program'");
        return 1;
    }

    if (end == Bulkpack::MenuStateKind::Aborted) {
        Bulkpack::log_message("Selection cancelled, nothing installed");
        return 0;
    }

    Bulkpack::InstallOrchestrator orchestrator(catalog);
    Bulkpack::InstallReport report = orchestrator.run(session.selection(), manager);
    report.print();
    return report.failedCount() == 0 ? 0 : 1;
}

} // namespace

int main(int argc, char* argv[])
{
    std::string configPath = Bulkpack::Config::defaultPath();
    std::vector<std::string> args;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--config") {
            if (i + 1 < argc) {
                configPath = argv[++i];
            }
            else {
                std::cerr << "Error: --config requires a file argument.\n";
                return 1;
            }
        }
        else {
            args.push_back(arg);
        }
    }

    // If no command is supplied, show the help message
    if (args.empty() || args[0] == "help" || args[0] == "--help" || args[0] == "-h") {
        printHelp();
        return 0;
    }

    const std::string command = args[0];
    const std::vector<std::string> operands(args.begin() + 1, args.end());

    try {
        Bulkpack::Config config = Bulkpack::Config::loadFromFile(configPath);
        config.applyEnvironment();

        // -------------------------------------------------------------
        // Commands that need no backend
        // -------------------------------------------------------------
        if (command == "config") {
            config.print();
            return 0;
        }
        if (command == "categories") {
            loadCatalog(config).print();
            return 0;
        }

        if (!isBackendCommand(command)) {
            std::cerr << "Unknown command: " << command << "\n";
            return 1;
        }

        const Bulkpack::ManagerRegistry registry(config);
        if (!registry.checkSupported()) {
            return 1;
        }

        Bulkpack::SystemCommandRunner runner(config.privilegeCommand);
        const Bulkpack::Highlighter highlighter = Bulkpack::Highlighter::detect();
        std::unique_ptr<Bulkpack::PackageManager> manager = registry.createManager(runner, highlighter);

        // -------------------------------------------------------------
        // Install / Remove Commands
        // -------------------------------------------------------------
        if (command == "install" || command == "remove") {
            if (operands.empty()) {
                std::cerr << "Usage: bulkpack " << command << " <package_name> [package_name ...]\n";
                return 1;
            }
            if (command == "install") {
                manager->install(operands);
            }
            else {
                manager->remove(operands);
            }
        }
        // -------------------------------------------------------------
        // Search Command
        // -------------------------------------------------------------
        else if (command == "search") {
            if (operands.size() != 1) {
                std::cerr << "Usage: bulkpack search <query>\n";
                return 1;
            }
            size_t matches = 0;
            manager->search(operands[0]).forEach([&matches](const std::string& line) {
                std::cout << line << "\n";
                ++matches;
            });
            if (matches == 0) {
                std::cout << "No packages found matching: " << operands[0] << std::endl;
            }
        }
        // -------------------------------------------------------------
        // Index / Upgrade / Orphan Commands
        // -------------------------------------------------------------
        else if (command == "sync") {
            manager->syncIndex();
        }
        else if (command == "upgrade") {
            manager->upgradeAll();
        }
        else if (command == "autoremove") {
            manager->removeOrphans();
        }
        // -------------------------------------------------------------
        // Interactive Selection
        // -------------------------------------------------------------
        else if (command == "select") {
            return runSelection(config, *manager);
        }
    } catch (const std::exception& e) {
        Bulkpack::log_error(e.what());
        return 1;
    }

    return 0;
}
