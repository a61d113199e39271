// test_service.cpp – End-to-end requests through DataService over the
// fixture metadata and configuration in tests/data.
//
// Compile with CMake:
//   cmake -B build && cmake --build build
//   ./build/test_service [tests/data]

#include "TBA3Generator/BookletCatalog.hpp"
#include "TBA3Generator/Config.hpp"
#include "TBA3Generator/DataService.hpp"
#include "TBA3Generator/Errors.hpp"
#include "TBA3Generator/Generator.hpp"
#include "TBA3Generator/Log.hpp"

#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using namespace tba3;

static int failures = 0;

#define CHECK(cond, msg)                                                  \
    do {                                                                   \
        if (!(cond)) {                                                     \
            std::cerr << "FAIL [" << __LINE__ << "] " << (msg) << '\n';  \
            ++failures;                                                    \
        } else {                                                           \
            std::cout << "OK   " << (msg) << '\n';                        \
        }                                                                  \
    } while(0)

template <typename E, typename Fn>
static bool throwsAs(Fn&& fn) {
    try {
        fn();
    } catch (const E&) {
        return true;
    } catch (const std::exception& e) {
        std::cerr << "     unexpected exception: " << e.what() << '\n';
    }
    return false;
}

template <typename Record>
static int64_t levelTotal(const Record& rec) {
    int64_t n = 0;
    for (const auto& l : rec.competence_levels) n += l.frequency;
    return n;
}

// ─────────────────────────────────────────────────────────────────────────────
//  Test 1: Type selector
// ─────────────────────────────────────────────────────────────────────────────
static void testReportTypes() {
    std::cout << "\n=== Test: Type selector ===\n";

    ReportTypes t = parseReportTypes("");
    CHECK(t.group && !t.students, "empty → group only");
    t = parseReportTypes("group");
    CHECK(t.group && !t.students, "group → group only");
    t = parseReportTypes("students");
    CHECK(!t.group && t.students, "students → students only");
    t = parseReportTypes("group,students");
    CHECK(t.group && t.students,  "group,students → both");
    t = parseReportTypes(" Students , GROUP ");
    CHECK(t.group && t.students,  "case and whitespace ignored");
    t = parseReportTypes("nonsense");
    CHECK(t.group && !t.students, "unknown token → group only");
}

// ─────────────────────────────────────────────────────────────────────────────
//  Test 2: Group requests
// ─────────────────────────────────────────────────────────────────────────────
static void testGroups(const DataService& svc) {
    std::cout << "\n=== Test: Group requests ===\n";

    const auto items = svc.groupItems("3a", parseReportTypes(""));
    CHECK(items.size() == 2,                                   "le + ho records");
    CHECK(!items.empty() && items[0].id == "3a" && items[0].name == "Klasse 3a", "group id / name");
    CHECK(!items.empty() && items[0].items.size() == 2 && items[0].items[0].iqb_id == "D002",
          "items in numeric order");
    CHECK(!items.empty() && items[0].items[0].descriptive_statistics.total == 12, "n = group size");

    CHECK(svc.groupItems("3a", parseReportTypes("students")).size() == 2 * 12, "students only");
    CHECK(svc.groupItems("3a", parseReportTypes("group,students")).size() == 2 + 2 * 12, "both");

    const auto student_aggs = svc.groupAggregations("3a", parseReportTypes("students"));
    CHECK(!student_aggs.empty() && student_aggs[0].covariates && student_aggs[0].covariates->size() == 2,
          "student records carry merged covariates");

    const auto again = svc.groupAggregations("3b", parseReportTypes(""));
    const auto first = svc.groupAggregations("3b", parseReportTypes(""));
    bool same = again.size() == first.size();
    for (size_t i = 0; same && i < again.size(); ++i) {
        const auto& a = again[i].aggregations[0].descriptive_statistics;
        const auto& b = first[i].aggregations[0].descriptive_statistics;
        same = a.frequency == b.frequency && a.mean == b.mean && a.standard_deviation == b.standard_deviation;
    }
    CHECK(same, "identical requests give identical results");
    CHECK(!first.empty() && first[0].name == "Lerngruppe 3b", "name fallback in records");

    const auto levels = svc.groupCompetenceLevels("3a", parseReportTypes(""));
    CHECK(levels.size() == 2,                                  "one record per equivalence table");
    CHECK(levels.size() == 2 && levelTotal(levels[0]) == 12 && levelTotal(levels[1]) == 12,
          "every student classified once per table");
    CHECK(levels.size() == 2 && levels[0].domain->name == "Deutsch" && levels[1].domain->name == "le",
          "whole-booklet table, then le");

    CHECK(svc.groupCompetenceLevels("3a", parseReportTypes("students")).size() == 2 * 12,
          "per-student levels");

    CHECK(throwsAs<NotFoundError>([&] { (void)svc.groupCompetenceLevels("4a", {}); }),
          "no tables for the booklet → NotFoundError");
    CHECK(throwsAs<NotFoundError>([&] { (void)svc.groupItems("nope", {}); }),
          "unknown group → NotFoundError");
    CHECK(throwsAs<NotFoundError>([&] { (void)svc.groupItems("ghost", {}); }),
          "unknown booklet → NotFoundError");
}

// ─────────────────────────────────────────────────────────────────────────────
//  Test 3: School requests
// ─────────────────────────────────────────────────────────────────────────────
static void testSchools(const DataService& svc) {
    std::cout << "\n=== Test: School requests ===\n";

    const auto items = svc.schoolItems("S1");
    CHECK(items.size() == 2 + 2 + 2, "school records, then each group's");
    if (items.size() == 6) {
        CHECK(items[0].id == "S1" && items[0].name == "Grundschule am Park", "school record first");
        CHECK(items[0].items[0].descriptive_statistics.total == 20,         "pooled n = 12 + 8");
        CHECK(items[2].id == "3a" && items[4].id == "3b",                   "member order");

        int64_t pooled = items[0].items[0].descriptive_statistics.frequency;
        int64_t parts  = items[2].items[0].descriptive_statistics.frequency +
                         items[4].items[0].descriptive_statistics.frequency;
        CHECK(pooled == parts, "pooled frequency = sum over groups");
    }

    const auto levels = svc.schoolCompetenceLevels("S2");
    CHECK(levels.size() == 2 + 2, "DE tables for the school, then for 3a; 4a has none");
    CHECK(!levels.empty() && levels[0].name == "Schule S2" && levelTotal(levels[0]) == 12,
          "only groups with tables are counted");

    const auto aggs = svc.schoolAggregations("S2");
    CHECK(aggs.size() == 4 + 2 + 2, "DE le/ho + MA zahl/MA, then per group");
    if (aggs.size() == 8) {
        CHECK(aggs[2].domain->name == "zahl" && aggs[2].domain->subject_name == "Mathematik",
              "MA domain after DE domains");
        CHECK(aggs[3].aggregations[0].value == "ma", "domain-less MA aggregation");
    }

    CHECK(throwsAs<NotFoundError>([&] { (void)svc.schoolCompetenceLevels("S3"); }),
          "school without any table → NotFoundError");
    CHECK(throwsAs<NotFoundError>([&] { (void)svc.schoolItems("S9"); }), "unknown school → NotFoundError");
}

// ─────────────────────────────────────────────────────────────────────────────
//  Test 4: State requests
// ─────────────────────────────────────────────────────────────────────────────
static void testStates(const DataService& svc, const ConfigStore& config) {
    std::cout << "\n=== Test: State requests ===\n";

    const auto groups = svc.resolveState("BY");
    CHECK(groups.size() == 2, "one synthetic group per booklet");
    if (groups.size() == 2) {
        CHECK(groups[0].data.group_id == "BY:V3-2024-DE-TH01", "group id = state:booklet");
        CHECK(groups[0].data.students.size() == 30,            "state size per booklet");
        CHECK(groups[0].data.profile.name == "Bayern",         "state profile");

        const StateConfig& by = config.state("BY");
        const StudentTable expected =
            generateStudents(30, {"Bayern", by.ability_mean, by.ability_std}, "by-V3-2024-DE-TH01",
                             config.stateCovariates(by));
        CHECK(groups[0].data.students.ids == expected.ids, "seed = state seed + booklet");
        CHECK(groups[0].data.students.ids != groups[1].data.students.ids, "booklets draw separate students");
    }

    const auto items = svc.stateItems("BY");
    CHECK(items.size() == 2 + 2, "DE le/ho + MA zahl/MA");
    CHECK(items.size() == 4 && items[0].id == "V3-2024-DE-TH01" && items[0].name == items[0].id,
          "DE records keyed by booklet");
    CHECK(items.size() == 4 && items[3].id == "V3-2024-MA-TH01", "MA records keyed by booklet");

    const auto levels = svc.stateCompetenceLevels("BY");
    CHECK(levels.size() == 2 && levels[0].id == "V3-2024-DE-TH01" && levelTotal(levels[0]) == 30,
          "levels for the DE booklet only");

    CHECK(svc.stateAggregations("BY").size() == 4, "aggregations per booklet");

    CHECK(throwsAs<NotFoundError>([&] { (void)svc.stateCompetenceLevels("HB"); }),
          "state without tables → NotFoundError");
    CHECK(throwsAs<NotFoundError>([&] { (void)svc.stateItems("XX"); }), "unknown state → NotFoundError");
}

// ─────────────────────────────────────────────────────────────────────────────
//  main
// ─────────────────────────────────────────────────────────────────────────────
int main(int argc, char* argv[]) {
    fs::path data_dir = (argc > 1)
        ? fs::path(argv[1])
        : fs::path(__FILE__).parent_path() / "data";

    std::cout << "Using data: " << data_dir << '\n';
    setLogLevel(LogLevel::Warn);

    testReportTypes();

    try {
        BookletCatalog catalog;
        catalog.loadDirectory(data_dir / "metadata");
        const ConfigStore config = ConfigStore::loadDirectory(data_dir / "config", catalog);
        const DataService svc(catalog, config);

        testGroups(svc);
        testSchools(svc);
        testStates(svc, config);
    } catch (const std::exception& e) {
        std::cerr << "FAIL setup: " << e.what() << '\n';
        ++failures;
    }

    std::cout << "\n──────────────────────────────────\n";
    if (failures == 0) {
        std::cout << "ALL TESTS PASSED\n";
    } else {
        std::cout << failures << " TEST(S) FAILED\n";
    }
    return failures == 0 ? 0 : 1;
}
