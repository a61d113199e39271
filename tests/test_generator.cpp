// test_generator.cpp – Seeded student and response generation.
//
// Compile with CMake:
//   cmake -B build && cmake --build build
//   ./build/test_generator

#include "TBA3Generator/Errors.hpp"
#include "TBA3Generator/Generator.hpp"
#include "TBA3Generator/Types.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <iostream>
#include <set>
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

static Booklet makeBooklet(const std::vector<double>& logits) {
    Booklet b;
    b.key = BookletKey::parse("V3-2024-DE-TH01");
    for (size_t i = 0; i < logits.size(); ++i) {
        Item it;
        it.iqb_item_id        = "D" + std::to_string(i + 1);
        it.item_nr_booklet    = std::to_string(i + 1);
        it.item_order_booklet = static_cast<double>(i + 1);
        it.logit              = logits[i];
        b.items.push_back(it);
    }
    return b;
}

static bool isUuid(const std::string& s) {
    if (s.size() != 36) return false;
    for (size_t i = 0; i < s.size(); ++i) {
        if (i == 8 || i == 13 || i == 18 || i == 23) {
            if (s[i] != '-') return false;
        } else if (!std::isxdigit(static_cast<unsigned char>(s[i])) ||
                   std::isupper(static_cast<unsigned char>(s[i]))) {
            return false;
        }
    }
    return true;
}

static bool isStudentName(const std::string& s) {
    const size_t d1 = s.find('.');
    const size_t d2 = s.rfind('.');
    if (d1 == std::string::npos || d1 == d2 || d1 == 0 || d2 == d1 + 1) return false;
    const std::string num = s.substr(d2 + 1);
    if (num.size() != 2 || !std::isdigit(static_cast<unsigned char>(num[0])) ||
        !std::isdigit(static_cast<unsigned char>(num[1])))
        return false;
    const int n = std::stoi(num);
    return n >= 10 && n <= 99;
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
//  Test 1: Adler-32 seed checksum and the 1PL model
// ─────────────────────────────────────────────────────────────────────────────
static void testPrimitives() {
    std::cout << "\n=== Test: Checksum and 1PL ===\n";
    CHECK(seedChecksum("") == 1u,                   "adler32('') = 1");
    CHECK(seedChecksum("abc") == 0x024d0127u,       "adler32('abc')");
    CHECK(seedChecksum("Wikipedia") == 0x11e60398u, "adler32('Wikipedia')");

    CHECK(failureProbability(0.0, 0.0) == 0.5,               "θ = β → 0.5");
    CHECK(failureProbability(2.0, 0.0) < 0.5,                "able student fails less");
    CHECK(failureProbability(-2.0, 0.0) > 0.5,               "weak student fails more");
    CHECK(std::fabs(failureProbability(1.0, 0.0) + failureProbability(-1.0, 0.0) - 1.0) < 1e-12,
          "symmetric around θ = β");
}

// ─────────────────────────────────────────────────────────────────────────────
//  Test 2: seed "A", 3 students × 2 items, regenerated
// ─────────────────────────────────────────────────────────────────────────────
static void testReproducible() {
    std::cout << "\n=== Test: Reproducible group ===\n";

    const Booklet booklet = makeBooklet({0.0, 0.0});
    const AbilityProfile profile{"Klasse A", 0.0, 1.0};

    const GroupData g1 = generateGroup("A", booklet, profile, 3, {}, "A");
    const GroupData g2 = generateGroup("A", booklet, profile, 3, {}, "A");

    CHECK(g1.students.size() == 3,                          "3 students");
    CHECK(g1.responses.rows() == 3 && g1.responses.cols() == 2, "3 × 2 matrix");
    CHECK(g1.students.ids == g2.students.ids,               "same ids");
    CHECK(g1.students.names == g2.students.names,           "same names");
    CHECK(g1.students.abilities == g2.students.abilities,   "same abilities");
    CHECK(g1.responses.cells() == g2.responses.cells(),     "same responses");

    CHECK(std::all_of(g1.students.ids.begin(), g1.students.ids.end(), isUuid), "UUID text layout");
    CHECK(std::all_of(g1.students.names.begin(), g1.students.names.end(), isStudentName),
          "names adjective.noun.NN");
    CHECK(std::all_of(g1.responses.cells().begin(), g1.responses.cells().end(),
                      [](uint8_t v) { return v == 0 || v == 1; }),
          "binary responses");

    const GroupData other = generateGroup("A", booklet, profile, 3, {}, "B");
    CHECK(other.students.ids != g1.students.ids, "different seed → different ids");

    const GroupData implicit = generateGroup("A", booklet, profile, 3, {}, "");
    CHECK(implicit.students.ids == g1.students.ids, "empty seed falls back to the group id");
}

// ─────────────────────────────────────────────────────────────────────────────
//  Test 3: Covariates only extend the student stream
// ─────────────────────────────────────────────────────────────────────────────
static void testStreamSeparation() {
    std::cout << "\n=== Test: Stream separation ===\n";

    const Booklet booklet = makeBooklet({-1.0, 0.0, 1.0, 0.5});
    const AbilityProfile profile{"p", 0.3, 1.2};
    const std::vector<CovariateDistribution> covs = {
        makeCovariate("geschlecht", {"m", "w"}, {0.5, 0.5}),
        makeCovariate("ses", {"niedrig", "mittel", "hoch"}, {0.3, 0.4, 0.3}),
    };

    const GroupData plain = generateGroup("g", booklet, profile, 40, {}, "stream");
    const GroupData rich  = generateGroup("g", booklet, profile, 40, covs, "stream");

    CHECK(plain.students.ids == rich.students.ids,             "ids unchanged by covariates");
    CHECK(plain.students.abilities == rich.students.abilities, "abilities unchanged by covariates");
    CHECK(plain.responses.cells() == rich.responses.cells(),   "responses unchanged by covariates");

    CHECK(rich.students.covariates.size() == 2,                   "one column per covariate");
    CHECK(rich.students.covariates[0].type_name == "geschlecht",  "configured order");
    CHECK(rich.students.covariates[1].values.size() == 40,        "one value per student");

    const std::set<std::string> allowed = {"niedrig", "mittel", "hoch"};
    const auto& ses = rich.students.covariates[1].values;
    CHECK(std::all_of(ses.begin(), ses.end(), [&](const std::string& v) { return allowed.count(v) != 0; }),
          "values drawn from categories");

    const auto certain = makeCovariate("fix", {"x", "y"}, {1.0, 0.0});
    const StudentTable t = generateStudents(25, profile, "fix", {certain});
    const auto& fixed = t.covariates[0].values;
    CHECK(std::all_of(fixed.begin(), fixed.end(), [](const std::string& v) { return v == "x"; }),
          "zero-probability category never drawn");
}

// ─────────────────────────────────────────────────────────────────────────────
//  Test 4: Response columns and extreme abilities
// ─────────────────────────────────────────────────────────────────────────────
static void testResponses() {
    std::cout << "\n=== Test: Responses ===\n";

    Booklet shuffled = makeBooklet({0.0, 0.0, 0.0});
    shuffled.items[0].item_order_booklet = 3.0;
    shuffled.items[2].item_order_booklet = 1.0;

    const StudentTable strong = generateStudents(20, {"s", 40.0, 0.01}, "strong", {});
    const ResponseMatrix m = generateResponses(strong, shuffled, "strong");
    CHECK((m.itemOfColumn() == std::vector<size_t>{2, 1, 0}), "columns follow numeric item order");
    CHECK(m.columnOfItem(0) == 2,                              "inverse mapping");
    CHECK(std::all_of(m.cells().begin(), m.cells().end(), [](uint8_t v) { return v == 1; }),
          "θ ≫ β → all correct");

    const StudentTable weak = generateStudents(20, {"w", -40.0, 0.01}, "weak", {});
    const ResponseMatrix w = generateResponses(weak, shuffled, "weak");
    CHECK(std::all_of(w.cells().begin(), w.cells().end(), [](uint8_t v) { return v == 0; }),
          "θ ≪ β → all wrong");

    const StudentTable crowd = generateStudents(400, {"c", 0.0, 1.0}, "crowd", {});
    const double mean = [&] {
        double s = 0.0;
        for (double a : crowd.abilities) s += a;
        return s / static_cast<double>(crowd.abilities.size());
    }();
    CHECK(std::fabs(mean) < 0.25, "ability sample mean near the profile mean");
}

// ─────────────────────────────────────────────────────────────────────────────
//  Test 5: Preconditions
// ─────────────────────────────────────────────────────────────────────────────
static void testPreconditions() {
    std::cout << "\n=== Test: Preconditions ===\n";

    const AbilityProfile profile{"p", 0.0, 1.0};
    CHECK(throwsAs<ComputationPrecondition>([&] { (void)generateStudents(0, profile, "s", {}); }),
          "count 0 rejected");
    CHECK(throwsAs<ComputationPrecondition>([&] { (void)generateStudents(-3, profile, "s", {}); }),
          "negative count rejected");
    CHECK(throwsAs<ComputationPrecondition>([&] { (void)generateStudents(5, {"p", 0.0, 0.0}, "s", {}); }),
          "zero ability_std rejected");

    const StudentTable students = generateStudents(5, profile, "s", {});
    Booklet empty;
    empty.key = BookletKey::parse("V3-2024-DE-TH99");
    CHECK(throwsAs<ComputationPrecondition>([&] { (void)generateResponses(students, empty, "s"); }),
          "empty booklet rejected");

    StudentTable broken = students;
    broken.abilities.pop_back();
    CHECK(throwsAs<ComputationPrecondition>([&] { (void)generateResponses(broken, makeBooklet({0.0}), "s"); }),
          "id/ability length mismatch rejected");

    CHECK(throwsAs<ComputationPrecondition>([&] { (void)generateResponses(StudentTable{}, makeBooklet({0.0}), "s"); }),
          "empty student table rejected");
}

// ─────────────────────────────────────────────────────────────────────────────
//  main
// ─────────────────────────────────────────────────────────────────────────────
int main() {
    testPrimitives();
    testReproducible();
    testStreamSeparation();
    testResponses();
    testPreconditions();

    std::cout << "\n──────────────────────────────────\n";
    if (failures == 0) {
        std::cout << "ALL TESTS PASSED\n";
    } else {
        std::cout << failures << " TEST(S) FAILED\n";
    }
    return failures == 0 ? 0 : 1;
}
