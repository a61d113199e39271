#pragma once
// Generator.hpp – Deterministic synthesis of students and item responses.
//
// Determinism contract:
//   • Student stream:  mt19937 seeded with adler32(seed).
//     Draw order: N UUIDs (16 bytes each), N adjectives, N nouns, N numbers,
//     N abilities, then N draws per covariate in configured order.
//   • Response stream: mt19937 seeded with adler32("{seed}-{N}-{M}"),
//     N×M uniform draws in row-major order.
//   Re-ordering or adding covariates changes every later draw of the student
//   stream; it never changes the response stream.
//
// Usage example:
//   GroupData g = generateGroup("3a", booklet, {"Klasse 3a", 0.2, 1.1}, 25, {}, "seed-3a");
//   uint8_t first = g.responses.at(0, 0);

#include "Types.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace tba3 {

// 32-bit Adler-32 checksum of the UTF-8 bytes of text.
[[nodiscard]] uint32_t seedChecksum(std::string_view text);

// Probability of an incorrect answer under the 1PL model.
[[nodiscard]] double failureProbability(double ability, double difficulty) noexcept;

// Throws ComputationPrecondition when count < 1.
[[nodiscard]] StudentTable generateStudents(int count,
                                            const AbilityProfile& profile,
                                            const std::string& seed,
                                            const std::vector<CovariateDistribution>& covariates);

// Throws ComputationPrecondition for an empty booklet or a student table
// without ids / abilities.
[[nodiscard]] ResponseMatrix generateResponses(const StudentTable& students,
                                               const Booklet& booklet,
                                               const std::string& seed);

// Students then responses, both from the same seed (group_id when seed is
// empty). The booklet must outlive the returned GroupData.
[[nodiscard]] GroupData generateGroup(const std::string& group_id,
                                      const Booklet& booklet,
                                      const AbilityProfile& profile,
                                      int student_count,
                                      const std::vector<CovariateDistribution>& covariates,
                                      const std::string& seed);

} // namespace tba3
