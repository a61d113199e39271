// tba3_report.cpp – Command-line front end: loads booklet metadata and the
// configuration directory, answers one request and prints the records.
//
// Usage:
//   tba3_report --scope group|school|state --id <id>
//               --kind competence-levels|items|aggregations
//               [--metadata <dir>] [--config <dir>] [--type <group,students>]
//               [--log-level debug|info|warn|error]
//
// Directories fall back to $TBA3_METADATA_DIR / $TBA3_CONFIG_DIR, then to
// "metadata" / "config" in the working directory.
//
// Exit codes: 0 success, 1 usage or load error, 2 unknown id.

#include "TBA3Generator/BookletCatalog.hpp"
#include "TBA3Generator/Config.hpp"
#include "TBA3Generator/DataService.hpp"
#include "TBA3Generator/Errors.hpp"
#include "TBA3Generator/Log.hpp"

#include <cstdlib>
#include <cstring>
#include <iomanip>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

using namespace tba3;

namespace {

struct Args {
    std::string metadata_dir;
    std::string config_dir;
    std::string scope;
    std::string id;
    std::string kind;
    std::string type;
    std::optional<LogLevel> log_level;
};

void printUsage(std::ostream& os) {
    os << "tba3_report --scope group|school|state --id <id>\n"
          "            --kind competence-levels|items|aggregations\n"
          "            [--metadata <dir>] [--config <dir>] [--type <group,students>]\n"
          "            [--log-level debug|info|warn|error]\n";
}

std::string envOr(const char* name, const char* fallback) {
    const char* v = std::getenv(name);
    return (v != nullptr && *v != '\0') ? std::string(v) : std::string(fallback);
}

bool getNext(int& i, int argc, char** argv, std::string& out) {
    if (i + 1 >= argc) return false;
    out = argv[++i];
    return true;
}

bool parseArgs(int argc, char** argv, Args& a, std::string& err) {
    for (int i = 1; i < argc; ++i) {
        const char* flag = argv[i];
        std::string value;
        if (!getNext(i, argc, argv, value)) {
            err = std::string("missing value for ") + flag;
            return false;
        }
        if      (std::strcmp(flag, "--metadata") == 0) a.metadata_dir = value;
        else if (std::strcmp(flag, "--config") == 0)   a.config_dir   = value;
        else if (std::strcmp(flag, "--scope") == 0)    a.scope        = value;
        else if (std::strcmp(flag, "--id") == 0)       a.id           = value;
        else if (std::strcmp(flag, "--kind") == 0)     a.kind         = value;
        else if (std::strcmp(flag, "--type") == 0)     a.type         = value;
        else if (std::strcmp(flag, "--log-level") == 0) {
            LogLevel lvl = LogLevel::Info;
            if (!parseLogLevel(value, lvl)) {
                err = "unknown log level '" + value + "'";
                return false;
            }
            a.log_level = lvl;
        } else {
            err = std::string("unknown option ") + flag;
            return false;
        }
    }

    if (a.metadata_dir.empty()) a.metadata_dir = envOr("TBA3_METADATA_DIR", "metadata");
    if (a.config_dir.empty())   a.config_dir   = envOr("TBA3_CONFIG_DIR", "config");

    if (a.scope != "group" && a.scope != "school" && a.scope != "state") {
        err = "--scope must be group, school or state";
        return false;
    }
    if (a.kind != "competence-levels" && a.kind != "items" && a.kind != "aggregations") {
        err = "--kind must be competence-levels, items or aggregations";
        return false;
    }
    if (a.id.empty()) {
        err = "--id is required";
        return false;
    }
    if (!a.type.empty() && a.scope != "group") {
        err = "--type only applies to --scope group";
        return false;
    }
    return true;
}

// ─── Printing ─────────────────────────────────────────────────────────────────

template <typename Record>
void printHeader(const Record& r) {
    std::cout << r.id << "  " << r.name;
    if (r.domain)
        std::cout << "  [" << r.domain->subject_name << " / " << r.domain->name << "]";
    std::cout << '\n';
    if (r.covariates) {
        for (const auto& c : *r.covariates)
            std::cout << "    " << c.type << " = " << c.value << '\n';
    }
}

void printStats(const DescriptiveStatistics& s) {
    std::cout << "n=" << s.total << " correct=" << s.frequency
              << " mean=" << std::fixed << std::setprecision(4) << s.mean
              << " sd=" << s.standard_deviation << std::defaultfloat;
}

void print(const std::vector<CompetenceLevelRecord>& records) {
    for (const auto& r : records) {
        printHeader(r);
        for (const auto& lvl : r.competence_levels) {
            std::cout << "    " << std::left << std::setw(8) << lvl.name_short << std::right
                      << lvl.frequency;
            if (lvl.name) std::cout << "  " << *lvl.name;
            std::cout << '\n';
        }
    }
}

void print(const std::vector<ItemRecord>& records) {
    for (const auto& r : records) {
        printHeader(r);
        for (const auto& it : r.items) {
            std::cout << "    " << std::left << std::setw(6) << it.name << std::setw(10) << it.iqb_id
                      << std::right << "logit=" << std::fixed << std::setprecision(3)
                      << it.parameters.logit << std::defaultfloat << "  ";
            printStats(it.descriptive_statistics);
            std::cout << '\n';
        }
    }
}

void print(const std::vector<AggregationRecord>& records) {
    for (const auto& r : records) {
        printHeader(r);
        for (const auto& a : r.aggregations) {
            std::cout << "    " << a.type << ":" << a.value << "  ";
            printStats(a.descriptive_statistics);
            std::cout << "  items=" << a.included_iqb_ids.size() << '\n';
        }
    }
}

void run(const DataService& svc, const Args& a) {
    if (a.scope == "group") {
        const ReportTypes types = parseReportTypes(a.type);
        if      (a.kind == "competence-levels") print(svc.groupCompetenceLevels(a.id, types));
        else if (a.kind == "items")             print(svc.groupItems(a.id, types));
        else                                    print(svc.groupAggregations(a.id, types));
    } else if (a.scope == "school") {
        if      (a.kind == "competence-levels") print(svc.schoolCompetenceLevels(a.id));
        else if (a.kind == "items")             print(svc.schoolItems(a.id));
        else                                    print(svc.schoolAggregations(a.id));
    } else {
        if      (a.kind == "competence-levels") print(svc.stateCompetenceLevels(a.id));
        else if (a.kind == "items")             print(svc.stateItems(a.id));
        else                                    print(svc.stateAggregations(a.id));
    }
}

} // namespace

int main(int argc, char* argv[]) {
    Args args;
    std::string err;
    if (argc < 2 || !parseArgs(argc, argv, args, err)) {
        if (!err.empty()) std::cerr << "error: " << err << '\n';
        printUsage(std::cerr);
        return 1;
    }
    if (args.log_level) setLogLevel(*args.log_level);

    try {
        BookletCatalog catalog;
        catalog.loadDirectory(args.metadata_dir);
        const ConfigStore config = ConfigStore::loadDirectory(args.config_dir, catalog);

        DataService svc(catalog, config);
        run(svc, args);
    } catch (const NotFoundError& e) {
        std::cerr << "not found: " << e.what() << '\n';
        return 2;
    } catch (const Error& e) {
        std::cerr << "error: " << e.what() << '\n';
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "unexpected error: " << e.what() << '\n';
        return 1;
    }
    return 0;
}
