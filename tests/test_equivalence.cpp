// test_equivalence.cpp – Raw-score classification and table validation.
//
// Compile with CMake:
//   cmake -B build && cmake --build build
//   ./build/test_equivalence

#include "TBA3Generator/BookletCatalog.hpp"
#include "TBA3Generator/Equivalence.hpp"
#include "TBA3Generator/Errors.hpp"
#include "TBA3Generator/Generator.hpp"

#include <iostream>
#include <string>
#include <vector>

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

// ─── Utility ─────────────────────────────────────────────────────────────────

static EquivalenceTableEntry makeTable(std::vector<CompetenceLevelRange> levels,
                                       std::optional<std::string> domain = std::nullopt) {
    EquivalenceTableEntry e;
    e.booklet           = "V3-2024-DE-TH01";
    e.booklet_key       = BookletKey::parse(e.booklet);
    e.domain            = std::move(domain);
    e.competence_levels = std::move(levels);
    return e;
}

static CompetenceLevelRange level(const std::string& name, int lo, int hi) {
    return CompetenceLevelRange{name, std::nullopt, std::nullopt, lo, hi};
}

static Booklet fourItemBooklet() {
    Booklet b;
    b.key = BookletKey::parse("V3-2024-DE-TH01");
    const char* domains[] = {"le", "le", "ho", "ho"};
    for (int i = 0; i < 4; ++i) {
        Item it;
        it.iqb_item_id        = "D" + std::to_string(i + 1);
        it.item_order_booklet = i + 1;
        it.logit              = -0.5 + 0.4 * i;
        it.domain             = std::string(domains[i]);
        b.items.push_back(it);
    }
    return b;
}

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

// ─────────────────────────────────────────────────────────────────────────────
//  Test 1: 4-item table, [0–1] → I, [2–4] → II
// ─────────────────────────────────────────────────────────────────────────────
static void testMatch() {
    std::cout << "\n=== Test: Level matching ===\n";

    const auto table = makeTable({level("I", 0, 1), level("II", 2, 4)});
    CHECK(matchLevel(0, table) == std::optional<std::string>("I"),  "0 → I");
    CHECK(matchLevel(1, table) == std::optional<std::string>("I"),  "1 → I");
    CHECK(matchLevel(2, table) == std::optional<std::string>("II"), "2 → II");
    CHECK(matchLevel(3, table) == std::optional<std::string>("II"), "3 → II");
    CHECK(matchLevel(4, table) == std::optional<std::string>("II"), "4 → II");
    CHECK(!matchLevel(5, table).has_value(),                         "5 → no level");
    CHECK(!matchLevel(-1, table).has_value(),                        "-1 → no level");

    CHECK(classify(3, table).name_short == "II",                     "classify returns the range");
    CHECK(throwsAs<IntegrityError>([&] { (void)classify(5, table); }), "classify miss → IntegrityError");
}

// ─────────────────────────────────────────────────────────────────────────────
//  Test 2: Every generated raw score matches exactly one level
// ─────────────────────────────────────────────────────────────────────────────
static void testCoverage() {
    std::cout << "\n=== Test: Coverage ===\n";

    BookletCatalog catalog;
    catalog.add(fourItemBooklet());
    const Booklet& booklet = catalog.get(BookletKey::parse("V3-2024-DE-TH01"));

    const auto whole = makeTable({level("I", 0, 1), level("II", 2, 3), level("III", 4, 4)});
    const auto le    = makeTable({level("I", 0, 0), level("II", 1, 2)}, std::string("le"));

    bool valid = true;
    try {
        validateRanges(whole);
        validateAgainstCatalog(whole, catalog);
        validateRanges(le);
        validateAgainstCatalog(le, catalog);
    } catch (const std::exception& e) {
        std::cerr << "     " << e.what() << '\n';
        valid = false;
    }
    CHECK(valid, "whole-booklet and domain tables validate");

    const GroupData g = generateGroup("cov", booklet, {"cov", 0.0, 1.5}, 200, {}, "coverage");
    const std::vector<size_t> all_cols = {0, 1, 2, 3};
    std::vector<size_t> le_cols;
    for (size_t idx : booklet.itemIndicesForDomain(std::string("le")))
        le_cols.push_back(g.responses.columnOfItem(idx));

    int unmatched = 0, multi = 0;
    for (size_t r = 0; r < g.responses.rows(); ++r) {
        for (const auto* t : {&whole, &le}) {
            const int raw = g.responses.rowSum(r, t == &whole ? all_cols : le_cols);
            int hits = 0;
            for (const auto& cl : t->competence_levels)
                if (cl.min_score <= raw && raw <= cl.max_score) ++hits;
            if (hits == 0) ++unmatched;
            if (hits > 1) ++multi;
        }
    }
    CHECK(unmatched == 0, "no raw score without a level");
    CHECK(multi == 0,     "no raw score with two levels");
}

// ─────────────────────────────────────────────────────────────────────────────
//  Test 3: Range validation
// ─────────────────────────────────────────────────────────────────────────────
static void testValidation() {
    std::cout << "\n=== Test: Range validation ===\n";

    CHECK(throwsAs<ConfigValidationError>([] { validateRanges(makeTable({})); }),
          "empty table");
    CHECK(throwsAs<ConfigValidationError>([] { validateRanges(makeTable({level("I", -1, 1)})); }),
          "negative min_score");
    CHECK(throwsAs<ConfigValidationError>([] { validateRanges(makeTable({level("I", 2, 1)})); }),
          "min > max");
    CHECK(throwsAs<ConfigValidationError>([] { validateRanges(makeTable({level("I", 0, 1), level("II", 3, 4)})); }),
          "gap between levels");
    CHECK(throwsAs<ConfigValidationError>([] { validateRanges(makeTable({level("I", 0, 2), level("II", 2, 4)})); }),
          "overlapping levels");

    BookletCatalog catalog;
    catalog.add(fourItemBooklet());
    CHECK(throwsAs<ConfigValidationError>([&] {
              validateAgainstCatalog(makeTable({level("I", 0, 1), level("II", 2, 3)}), catalog);
          }),
          "last max below item count");
    CHECK(throwsAs<ConfigValidationError>([&] {
              validateAgainstCatalog(makeTable({level("I", 0, 4)}, std::string("ho")), catalog);
          }),
          "domain table checked against domain item count");

    EquivalenceTableEntry other = makeTable({level("I", 0, 4)});
    other.booklet_key = BookletKey::parse("V3-2024-DE-TH77");
    CHECK(throwsAs<ConfigValidationError>([&] { validateAgainstCatalog(other, catalog); }),
          "unknown booklet");
}

// ─────────────────────────────────────────────────────────────────────────────
//  main
// ─────────────────────────────────────────────────────────────────────────────
int main() {
    testMatch();
    testCoverage();
    testValidation();

    std::cout << "\n──────────────────────────────────\n";
    if (failures == 0) {
        std::cout << "ALL TESTS PASSED\n";
    } else {
        std::cout << failures << " TEST(S) FAILED\n";
    }
    return failures == 0 ? 0 : 1;
}
