// StudentGenerator.cpp – Synthetic student populations (identity, name,
// ability, covariates) drawn from a single seeded stream.

#include "TBA3Generator/Generator.hpp"
#include "TBA3Generator/Errors.hpp"

#include <array>
#include <cstdio>
#include <random>

namespace tba3 {

static constexpr std::array<const char*, 20> kAdjectives = {
    "schnell", "langsam", "gross", "klein", "hell",  "dunkel", "leise", "laut",  "warm",   "kalt",
    "neu",     "alt",     "jung",  "weit",  "nah",   "hoch",   "tief",  "breit", "schmal", "rund",
};

static constexpr std::array<const char*, 20> kNouns = {
    "apfel", "birne", "kirsche", "banane", "orange", "traube", "pflaume", "himbeere", "erdbeere", "zitrone",
    "baum",  "blume", "wolke",   "stern",  "mond",   "sonne",  "berg",    "fluss",    "wald",     "wiese",
};

// 16 bytes rendered in the 8-4-4-4-12 textual UUID layout, bytes verbatim.
static std::string formatUuid(const std::array<uint8_t, 16>& b) {
    char buf[37];
    std::snprintf(buf, sizeof(buf),
                  "%02x%02x%02x%02x-%02x%02x-%02x%02x-%02x%02x-%02x%02x%02x%02x%02x%02x",
                  b[0], b[1], b[2], b[3], b[4], b[5], b[6], b[7],
                  b[8], b[9], b[10], b[11], b[12], b[13], b[14], b[15]);
    return std::string(buf, 36);
}

StudentTable generateStudents(int count,
                              const AbilityProfile& profile,
                              const std::string& seed,
                              const std::vector<CovariateDistribution>& covariates) {
    if (count < 1)
        throw ComputationPrecondition("count must be at least 1, got " + std::to_string(count));
    if (!(profile.ability_std > 0.0))
        throw ComputationPrecondition("ability_std must be positive for profile '" + profile.name + "'");

    const auto n = static_cast<size_t>(count);
    std::mt19937 rng(seedChecksum(seed));

    StudentTable t;
    t.ids.reserve(n);
    t.names.reserve(n);
    t.abilities.reserve(n);

    // (a) identities
    std::uniform_int_distribution<int> byte_dist(0, 255);
    for (size_t i = 0; i < n; ++i) {
        std::array<uint8_t, 16> bytes{};
        for (auto& b : bytes) b = static_cast<uint8_t>(byte_dist(rng));
        t.ids.push_back(formatUuid(bytes));
    }

    // (b) names: all adjectives, then all nouns, then all numbers
    std::uniform_int_distribution<size_t> adj_dist(0, kAdjectives.size() - 1);
    std::uniform_int_distribution<size_t> noun_dist(0, kNouns.size() - 1);
    std::uniform_int_distribution<int>    num_dist(10, 99);
    std::vector<size_t> adj(n), noun(n);
    std::vector<int>    num(n);
    for (auto& a : adj)  a = adj_dist(rng);
    for (auto& o : noun) o = noun_dist(rng);
    for (auto& k : num)  k = num_dist(rng);
    for (size_t i = 0; i < n; ++i)
        t.names.push_back(std::string(kAdjectives[adj[i]]) + "." + kNouns[noun[i]] + "." + std::to_string(num[i]));

    // (c) abilities
    std::normal_distribution<double> ability(profile.ability_mean, profile.ability_std);
    for (size_t i = 0; i < n; ++i) t.abilities.push_back(ability(rng));

    // (d) covariates, in configured order
    for (const auto& cov : covariates) {
        if (cov.categories.empty() || cov.categories.size() != cov.probabilities.size())
            throw ComputationPrecondition("Covariate '" + cov.type_name + "' is malformed");

        std::discrete_distribution<size_t> pick(cov.probabilities.begin(), cov.probabilities.end());
        CovariateColumn col;
        col.type_name = cov.type_name;
        col.values.reserve(n);
        for (size_t i = 0; i < n; ++i) col.values.push_back(cov.categories[pick(rng)]);
        t.covariates.push_back(std::move(col));
    }

    return t;
}

} // namespace tba3
