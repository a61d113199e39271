// Equivalence.cpp – Competence-level tables: validation and matching.

#include "TBA3Generator/Equivalence.hpp"
#include "TBA3Generator/BookletCatalog.hpp"
#include "TBA3Generator/Errors.hpp"

namespace tba3 {

static std::string tableLabel(const EquivalenceTableEntry& entry) {
    std::string label = "Equivalence table " + entry.booklet;
    if (entry.domain) label += " domain=" + *entry.domain;
    return label;
}

void validateRanges(const EquivalenceTableEntry& entry) {
    const auto& levels = entry.competence_levels;
    if (levels.empty())
        throw ConfigValidationError(tableLabel(entry) + ": competence_levels must not be empty");

    for (size_t i = 0; i < levels.size(); ++i) {
        const CompetenceLevelRange& lvl = levels[i];
        if (lvl.min_score < 0)
            throw ConfigValidationError(tableLabel(entry) + ": level '" + lvl.name_short +
                                        "' has negative min_score " + std::to_string(lvl.min_score));
        if (lvl.min_score > lvl.max_score)
            throw ConfigValidationError(tableLabel(entry) + ": level '" + lvl.name_short +
                                        "': min_score (" + std::to_string(lvl.min_score) +
                                        ") > max_score (" + std::to_string(lvl.max_score) + ")");
        if (i > 0) {
            const CompetenceLevelRange& prev = levels[i - 1];
            if (lvl.min_score != prev.max_score + 1)
                throw ConfigValidationError(tableLabel(entry) + ": gap or overlap between '" +
                                            prev.name_short + "' (max=" + std::to_string(prev.max_score) +
                                            ") and '" + lvl.name_short + "' (min=" +
                                            std::to_string(lvl.min_score) + ")");
        }
    }
}

void validateAgainstCatalog(const EquivalenceTableEntry& entry, const BookletCatalog& catalog) {
    const Booklet* booklet = catalog.find(entry.booklet_key);
    if (booklet == nullptr)
        throw ConfigValidationError(tableLabel(entry) + ": unknown booklet");

    const size_t num_items = booklet->itemCountForDomain(entry.domain);
    const CompetenceLevelRange& last = entry.competence_levels.back();
    if (last.max_score < 0 || static_cast<size_t>(last.max_score) != num_items)
        throw ConfigValidationError(tableLabel(entry) + ": last level '" + last.name_short +
                                    "' has max_score=" + std::to_string(last.max_score) +
                                    ", but booklet has " + std::to_string(num_items) + " items");
}

std::optional<std::string> matchLevel(int raw_score, const EquivalenceTableEntry& entry) {
    for (const auto& cl : entry.competence_levels) {
        if (cl.min_score <= raw_score && raw_score <= cl.max_score)
            return cl.name_short;
    }
    return std::nullopt;
}

const CompetenceLevelRange& classify(int raw_score, const EquivalenceTableEntry& entry) {
    for (const auto& cl : entry.competence_levels) {
        if (cl.min_score <= raw_score && raw_score <= cl.max_score)
            return cl;
    }
    throw IntegrityError(tableLabel(entry) + ": raw score " + std::to_string(raw_score) +
                         " matches no competence level");
}

} // namespace tba3
