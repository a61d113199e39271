#pragma once
// Equivalence.hpp – Raw score → competence level lookup and the load-time
// validation of equivalence tables.

#include "Config.hpp"

#include <optional>
#include <string>

namespace tba3 {

class BookletCatalog;

// Checks that the ranges are non-empty, ascending and contiguous
// (range[i].min == range[i-1].max + 1). Throws ConfigValidationError.
void validateRanges(const EquivalenceTableEntry& entry);

// Checks that the table's booklet exists and that the last range ends at the
// number of items in scope (whole booklet or the named domain).
// Throws ConfigValidationError.
void validateAgainstCatalog(const EquivalenceTableEntry& entry, const BookletCatalog& catalog);

// Linear range scan; nullopt when no range contains raw_score.
[[nodiscard]] std::optional<std::string> matchLevel(int raw_score, const EquivalenceTableEntry& entry);

// Like matchLevel() but a miss is a data-integrity fault: throws IntegrityError.
[[nodiscard]] const CompetenceLevelRange& classify(int raw_score, const EquivalenceTableEntry& entry);

} // namespace tba3
