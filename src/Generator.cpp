// Generator.cpp – Seed checksum and whole-group generation.

#include "TBA3Generator/Generator.hpp"

#include <zlib.h>

namespace tba3 {

uint32_t seedChecksum(std::string_view text) {
    uLong sum = adler32(0L, Z_NULL, 0);
    sum = adler32_z(sum, reinterpret_cast<const Bytef*>(text.data()), text.size());
    return static_cast<uint32_t>(sum);
}

GroupData generateGroup(const std::string& group_id,
                        const Booklet& booklet,
                        const AbilityProfile& profile,
                        int student_count,
                        const std::vector<CovariateDistribution>& covariates,
                        const std::string& seed) {
    const std::string& seed_str = seed.empty() ? group_id : seed;

    GroupData g;
    g.group_id  = group_id;
    g.booklet   = &booklet;
    g.profile   = profile;
    g.students  = generateStudents(student_count, profile, seed_str, covariates);
    g.responses = generateResponses(g.students, booklet, seed_str);
    return g;
}

} // namespace tba3
