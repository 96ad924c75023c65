#include "licenseheaders/application/license_app.hpp"
#include "licenseheaders/config/variables.hpp"
#include "licenseheaders/core/comment_style.hpp"
#include "licenseheaders/io/file_system.hpp"
#include "licenseheaders/logging.hpp"
#include "licenseheaders/templates/template_catalog.hpp"

#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace {

constexpr const char* VERSION = "0.4.0";

auto join(const std::vector<std::string>& items, const std::string& separator) -> std::string {
    std::string joined;
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) {
            joined += separator;
        }
        joined += items[i];
    }
    return joined;
}

auto print_usage(std::ostream& out) -> void {
    out << "Usage: licenseheaders [options]\n";
    out << "  -d, --dir <dir>          Directory to process recursively (default: .)\n";
    out << "  -t, --tmpl <name|file>   Built-in template name or template file\n";
    out << "  -y, --years <years>      Year or year range, e.g. 2019-2024\n";
    out << "  -o, --owner <owner>      Copyright owner\n";
    out << "  -n, --projname <name>    Project name\n";
    out << "  -u, --projurl <url>      Project URL\n";
    out << "  -x, --var <name=value>   Any other template variable\n";
    out << "  -e, --exclude <pattern>  Skip paths containing pattern (repeatable)\n";
    out << "      --add-only           Never replace an existing header\n";
    out << "      --refresh-years      Extend detected year ranges to the current year\n";
    out << "      --no-file-name       Use \"This file\" for ${file_name}\n";
    out << "  -b, --backup             Copy each changed file to <file>.bak first\n";
    out << "      --dry-run            Report changes without writing files\n";
    out << "  -v, --verbose            Increase log verbosity (repeatable)\n";
    out << "  -V, --version            Show version\n";
    out << "  -h, --help               Show this help\n";
    out << "\nVariables missing on the command line are read from LICENSEHEADERS_<NAME>,\n";
    out << "e.g. LICENSEHEADERS_OWNER. Years default to the current year.\n";
    out << "\nBuilt-in templates: "
        << join(licenseheaders::TemplateCatalog::builtin().names(), ", ") << "\n";
    out << "Supported extensions: "
        << join(licenseheaders::CommentStyleRegistry::builtin().extensions(), " ") << "\n";
    out << "\nExamples:\n";
    out << "  licenseheaders -t lgpl-v3 -o \"Eager Hacker\" -n demo -u https://example.org\n";
    out << "  licenseheaders -t mit -o Acme --add-only -e third_party\n";
    out << "  licenseheaders -y 2019-2024                 # Only rewrite years\n";
}

[[noreturn]] auto usage_error(const std::string& message) -> void {
    std::cerr << "Error: " << message << "\n\n";
    print_usage(std::cerr);
    std::exit(2);
}

auto parse_args(int argc, char* argv[]) -> licenseheaders::Config {
    licenseheaders::Config config;

    auto value_of = [&](int& i, const std::string& option) -> std::string {
        if (i + 1 >= argc) {
            usage_error("option " + option + " requires a value");
        }
        return argv[++i];
    };

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-d" || arg == "--dir") {
            config.directory = value_of(i, arg);
        } else if (arg == "-t" || arg == "--tmpl") {
            config.template_query = value_of(i, arg);
        } else if (arg == "-y" || arg == "--years") {
            config.variables["years"] = value_of(i, arg);
        } else if (arg == "-o" || arg == "--owner") {
            config.variables["owner"] = value_of(i, arg);
        } else if (arg == "-n" || arg == "--projname") {
            config.variables["projectname"] = value_of(i, arg);
        } else if (arg == "-u" || arg == "--projurl") {
            config.variables["projecturl"] = value_of(i, arg);
        } else if (arg == "-x" || arg == "--var") {
            auto assignment = value_of(i, arg);
            auto equals = assignment.find('=');
            if (equals == std::string::npos || equals == 0) {
                usage_error("expected name=value after " + arg + ", got '" + assignment + "'");
            }
            config.variables[assignment.substr(0, equals)] = assignment.substr(equals + 1);
        } else if (arg == "-e" || arg == "--exclude") {
            config.excludes.push_back(value_of(i, arg));
        } else if (arg == "--add-only") {
            config.mode = licenseheaders::UpdateMode::ADD_ONLY;
        } else if (arg == "--refresh-years") {
            config.refresh_years = true;
        } else if (arg == "--no-file-name") {
            config.include_file_name = false;
        } else if (arg == "-b" || arg == "--backup") {
            config.backup = true;
        } else if (arg == "--dry-run") {
            config.dry_run = true;
        } else if (arg == "-v" || arg == "--verbose") {
            config.verbosity++;
        } else if (arg.size() > 2 && arg.starts_with("-v") && arg.find_first_not_of('v', 1) == std::string::npos) {
            config.verbosity += static_cast<int>(arg.size() - 1);
        } else if (arg == "-V" || arg == "--version") {
            std::cout << "licenseheaders " << VERSION << "\n";
            std::exit(0);
        } else if (arg == "-h" || arg == "--help") {
            print_usage(std::cout);
            std::exit(0);
        } else {
            usage_error("unknown option '" + arg + "'");
        }
    }

    return config;
}

} // namespace

auto main(int argc, char* argv[]) -> int {
    auto config = parse_args(argc, argv);
    licenseheaders::configure_logging(config.verbosity);

    const auto& registry = licenseheaders::CommentStyleRegistry::builtin();
    const auto catalog = licenseheaders::TemplateCatalog::builtin();

    licenseheaders::LicenseApp app(std::make_unique<licenseheaders::FileSystem>(), registry, catalog,
                                   licenseheaders::system_environment(),
                                   licenseheaders::current_calendar_year());
    return app.run(config);
}
