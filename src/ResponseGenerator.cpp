// ResponseGenerator.cpp – Binary item responses under the 1PL IRT model.
//
// For ability θ and difficulty β:
//   P_fail(θ, β) = 1 / (1 + exp(θ − β))
// A response is correct iff U(0,1) > P_fail, i.e. correct with probability
// exp(θ−β) / (1 + exp(θ−β)).

#include "TBA3Generator/Generator.hpp"
#include "TBA3Generator/Errors.hpp"

#include <cmath>
#include <random>

namespace tba3 {

double failureProbability(double ability, double difficulty) noexcept {
    return 1.0 / (1.0 + std::exp(ability - difficulty));
}

ResponseMatrix generateResponses(const StudentTable& students,
                                 const Booklet& booklet,
                                 const std::string& seed) {
    if (students.ids.empty() || students.abilities.empty())
        throw ComputationPrecondition("student table must have 'id' and 'ability' columns");
    if (students.ids.size() != students.abilities.size())
        throw ComputationPrecondition("student table 'id' and 'ability' columns differ in length");
    if (booklet.itemCount() == 0)
        throw ComputationPrecondition("booklet " + booklet.key.toString() + " must contain at least one item");

    const size_t n_students = students.abilities.size();
    const size_t n_items    = booklet.itemCount();

    // Column order = numeric booklet order
    std::vector<size_t> order = booklet.sortedItemIndices();
    std::vector<double> difficulties;
    difficulties.reserve(n_items);
    for (size_t idx : order) difficulties.push_back(booklet.items[idx].logit);

    // Outer combination abilities × difficulties
    std::vector<double> p_fail(n_students * n_items);
    for (size_t r = 0; r < n_students; ++r)
        for (size_t c = 0; c < n_items; ++c)
            p_fail[r * n_items + c] = failureProbability(students.abilities[r], difficulties[c]);

    // Independent stream for this stage
    const std::string stream_seed =
        seed + "-" + std::to_string(n_students) + "-" + std::to_string(n_items);
    std::mt19937 rng(seedChecksum(stream_seed));
    std::uniform_real_distribution<double> uniform(0.0, 1.0);

    std::vector<double> draws(n_students * n_items);
    for (auto& u : draws) u = uniform(rng);

    ResponseMatrix m(n_students, std::move(order));
    for (size_t r = 0; r < n_students; ++r)
        for (size_t c = 0; c < n_items; ++c)
            m.at(r, c) = draws[r * n_items + c] > p_fail[r * n_items + c] ? 1 : 0;

    return m;
}

} // namespace tba3
