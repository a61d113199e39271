// Config.cpp – ConfigStore construction, cross-entity validation and lookups.

#include "TBA3Generator/Config.hpp"
#include "TBA3Generator/BookletCatalog.hpp"
#include "TBA3Generator/ConfigLoader.hpp"
#include "TBA3Generator/Equivalence.hpp"
#include "TBA3Generator/Errors.hpp"
#include "TBA3Generator/Log.hpp"

#include <algorithm>
#include <set>

namespace tba3 {

namespace fs = std::filesystem;

std::vector<CovariateDistribution>
mergeCovariates(const std::vector<CovariateDistribution>& defaults,
                const std::vector<CovariateDistribution>& entity) {
    std::vector<CovariateDistribution> merged = defaults;
    for (const auto& cov : entity) {
        auto it = std::find_if(merged.begin(), merged.end(),
                               [&](const CovariateDistribution& d) { return d.type_name == cov.type_name; });
        if (it != merged.end())
            *it = cov;
        else
            merged.push_back(cov);
    }
    return merged;
}

// ─── Validation helpers ───────────────────────────────────────────────────────

template <typename T>
static std::unordered_map<std::string, size_t> indexById(const std::vector<T>& entities, const char* kind) {
    std::unordered_map<std::string, size_t> index;
    std::set<std::string> duplicates;
    for (size_t i = 0; i < entities.size(); ++i) {
        if (!index.emplace(entities[i].id, i).second)
            duplicates.insert(entities[i].id);
    }
    if (!duplicates.empty()) {
        std::string list;
        for (const auto& d : duplicates) list += (list.empty() ? "" : ", ") + d;
        throw ConfigValidationError(std::string("Duplicate ") + kind + " IDs: " + list);
    }
    return index;
}

// ─── ConfigStore ──────────────────────────────────────────────────────────────

ConfigStore::ConfigStore(GroupsFile groups,
                         SchoolsFile schools,
                         StatesFile states,
                         EquivalenceTablesFile tables,
                         const BookletCatalog* catalog)
    : groups_(std::move(groups)),
      schools_(std::move(schools)),
      states_(std::move(states)),
      tables_(std::move(tables)) {
    group_index_  = indexById(groups_.groups, "group");
    school_index_ = indexById(schools_.schools, "school");
    state_index_  = indexById(states_.states, "state");

    std::set<std::pair<BookletKey, std::optional<std::string>>> seen;
    for (const auto& entry : tables_.tables) {
        validateRanges(entry);
        if (catalog != nullptr)
            validateAgainstCatalog(entry, *catalog);
        if (!seen.emplace(entry.booklet_key, entry.domain).second)
            throw ConfigValidationError("Equivalence table " + entry.booklet +
                                        (entry.domain ? " domain=" + *entry.domain : std::string()) +
                                        " is defined more than once");
    }
}

ConfigStore ConfigStore::loadDirectory(const fs::path& dir, const BookletCatalog& catalog) {
    GroupsFile            groups;
    SchoolsFile           schools;
    StatesFile            states;
    EquivalenceTablesFile tables;

    const fs::path groups_path  = dir / "groups.xml";
    const fs::path schools_path = dir / "schools.xml";
    const fs::path states_path  = dir / "states.xml";
    const fs::path equiv_path   = dir / "equivalence_tables.xml";

    if (fs::exists(groups_path)) {
        groups = loadGroupsConfig(groups_path);
        logInfo("Loaded " + std::to_string(groups.groups.size()) + " groups from " + groups_path.string());
    } else {
        logWarn("Groups config not found: " + groups_path.string());
    }

    if (fs::exists(equiv_path)) {
        tables = loadEquivalenceTables(equiv_path);
        logInfo("Loaded " + std::to_string(tables.tables.size()) + " equivalence tables from " +
                equiv_path.string());
    } else {
        logWarn("Equivalence tables not found: " + equiv_path.string());
    }

    if (fs::exists(schools_path)) {
        schools = loadSchoolsConfig(schools_path);
        logInfo("Loaded " + std::to_string(schools.schools.size()) + " schools from " + schools_path.string());
    } else {
        logWarn("Schools config not found: " + schools_path.string());
    }

    if (fs::exists(states_path)) {
        states = loadStatesConfig(states_path);
        logInfo("Loaded " + std::to_string(states.states.size()) + " states from " + states_path.string());
    } else {
        logWarn("States config not found: " + states_path.string());
    }

    return ConfigStore(std::move(groups), std::move(schools), std::move(states), std::move(tables), &catalog);
}

const GroupConfig* ConfigStore::findGroup(const std::string& id) const {
    auto it = group_index_.find(id);
    return it == group_index_.end() ? nullptr : &groups_.groups[it->second];
}

const SchoolConfig* ConfigStore::findSchool(const std::string& id) const {
    auto it = school_index_.find(id);
    return it == school_index_.end() ? nullptr : &schools_.schools[it->second];
}

const StateConfig* ConfigStore::findState(const std::string& id) const {
    auto it = state_index_.find(id);
    return it == state_index_.end() ? nullptr : &states_.states[it->second];
}

const GroupConfig& ConfigStore::group(const std::string& id) const {
    const GroupConfig* g = findGroup(id);
    if (g == nullptr) throw NotFoundError("Group not found: " + id);
    return *g;
}

const SchoolConfig& ConfigStore::school(const std::string& id) const {
    const SchoolConfig* s = findSchool(id);
    if (s == nullptr) throw NotFoundError("School not found: " + id);
    return *s;
}

const StateConfig& ConfigStore::state(const std::string& id) const {
    const StateConfig* s = findState(id);
    if (s == nullptr) throw NotFoundError("State not found: " + id);
    return *s;
}

std::vector<const EquivalenceTableEntry*> ConfigStore::equivalenceTablesFor(const BookletKey& key) const {
    std::vector<const EquivalenceTableEntry*> out;
    for (const auto& entry : tables_.tables) {
        if (entry.booklet_key == key) out.push_back(&entry);
    }
    return out;
}

std::vector<CovariateDistribution> ConfigStore::groupCovariates(const GroupConfig& g) const {
    return mergeCovariates(groups_.default_covariates, g.covariates);
}

std::vector<CovariateDistribution> ConfigStore::stateCovariates(const StateConfig& s) const {
    return mergeCovariates(states_.default_covariates, s.covariates);
}

} // namespace tba3
