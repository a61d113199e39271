// DataService.cpp – Resolution of configured entities and record assembly.

#include "TBA3Generator/DataService.hpp"
#include "TBA3Generator/Errors.hpp"
#include "TBA3Generator/Generator.hpp"
#include "TBA3Generator/Log.hpp"

#include <algorithm>
#include <cctype>
#include <set>

namespace tba3 {

ReportTypes parseReportTypes(const std::string& type_param) {
    std::set<std::string> requested;
    size_t start = 0;
    while (start <= type_param.size()) {
        size_t comma = type_param.find(',', start);
        if (comma == std::string::npos) comma = type_param.size();
        std::string tok = type_param.substr(start, comma - start);

        tok.erase(0, tok.find_first_not_of(" \t"));
        tok.erase(tok.find_last_not_of(" \t") + 1);
        std::transform(tok.begin(), tok.end(), tok.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (!tok.empty()) requested.insert(tok);

        start = comma + 1;
    }

    ReportTypes t;
    t.students = requested.count("students") != 0;
    t.group    = !t.students || requested.count("group") != 0;
    return t;
}

template <typename Record>
static void append(std::vector<Record>& out, std::vector<Record> more) {
    out.insert(out.end(), std::make_move_iterator(more.begin()), std::make_move_iterator(more.end()));
}

static bool anyTables(const std::vector<ResolvedGroup>& groups) {
    return std::any_of(groups.begin(), groups.end(), [](const ResolvedGroup& rg) { return !rg.tables.empty(); });
}

// ─────────────────────────────────────────────────────────────────────────────
//  Resolution
// ─────────────────────────────────────────────────────────────────────────────

ResolvedGroup DataService::resolveGroup(const std::string& group_id) const {
    const GroupConfig& cfg     = config_.group(group_id);
    const Booklet&     booklet = catalog_.get(cfg.booklet_key);

    const AbilityProfile profile{cfg.displayName(), cfg.ability_mean, cfg.ability_std};
    logDebug("Generating group " + group_id + " (" + std::to_string(cfg.size) + " students, booklet " +
             booklet.key.toString() + ")");

    ResolvedGroup rg;
    rg.data   = generateGroup(group_id, booklet, profile, cfg.size, config_.groupCovariates(cfg), cfg.seed);
    rg.tables = config_.equivalenceTablesFor(booklet.key);
    return rg;
}

std::vector<ResolvedGroup> DataService::resolveSchool(const std::string& school_id) const {
    const SchoolConfig& cfg = config_.school(school_id);
    std::vector<ResolvedGroup> out;
    out.reserve(cfg.groups.size());
    for (const auto& gid : cfg.groups)
        out.push_back(resolveGroup(gid));
    return out;
}

std::vector<ResolvedGroup> DataService::resolveState(const std::string& state_id) const {
    const StateConfig& cfg = config_.state(state_id);
    const AbilityProfile profile{cfg.displayName(), cfg.ability_mean, cfg.ability_std};
    const std::vector<CovariateDistribution> covariates = config_.stateCovariates(cfg);

    std::vector<ResolvedGroup> out;
    out.reserve(cfg.booklets.size());
    for (size_t i = 0; i < cfg.booklets.size(); ++i) {
        const std::string& booklet_str = cfg.booklets[i];
        const Booklet&     booklet     = catalog_.get(cfg.booklet_keys[i]);

        ResolvedGroup rg;
        rg.data   = generateGroup(state_id + ":" + booklet_str, booklet, profile, cfg.size, covariates,
                                  cfg.seed + "-" + booklet_str);
        rg.tables = config_.equivalenceTablesFor(booklet.key);
        out.push_back(std::move(rg));
    }
    return out;
}

// ─────────────────────────────────────────────────────────────────────────────
//  Groups
// ─────────────────────────────────────────────────────────────────────────────

std::vector<CompetenceLevelRecord> DataService::groupCompetenceLevels(const std::string& id, ReportTypes types) const {
    ResolvedGroup rg = resolveGroup(id);
    if (rg.tables.empty())
        throw NotFoundError("No equivalence tables found for group: " + id);

    std::vector<CompetenceLevelRecord> out;
    if (types.group)    append(out, tba3::groupCompetenceLevels(rg.data, rg.tables));
    if (types.students) append(out, tba3::studentCompetenceLevels(rg.data, rg.tables));
    return out;
}

std::vector<ItemRecord> DataService::groupItems(const std::string& id, ReportTypes types) const {
    ResolvedGroup rg = resolveGroup(id);
    std::vector<ItemRecord> out;
    if (types.group)    append(out, tba3::groupItems(rg.data));
    if (types.students) append(out, tba3::studentItems(rg.data));
    return out;
}

std::vector<AggregationRecord> DataService::groupAggregations(const std::string& id, ReportTypes types) const {
    ResolvedGroup rg = resolveGroup(id);
    std::vector<AggregationRecord> out;
    if (types.group)    append(out, tba3::groupAggregations(rg.data));
    if (types.students) append(out, tba3::studentAggregations(rg.data));
    return out;
}

// ─────────────────────────────────────────────────────────────────────────────
//  Schools
// ─────────────────────────────────────────────────────────────────────────────

std::vector<CompetenceLevelRecord> DataService::schoolCompetenceLevels(const std::string& id) const {
    const std::vector<ResolvedGroup> groups = resolveSchool(id);
    if (!anyTables(groups))
        throw NotFoundError("No equivalence tables found for school: " + id);

    const std::string name = config_.school(id).displayName();
    std::vector<CompetenceLevelRecord> out = tba3::schoolCompetenceLevels(id, name, groups);
    for (const auto& rg : groups)
        append(out, tba3::groupCompetenceLevels(rg.data, rg.tables));
    return out;
}

std::vector<ItemRecord> DataService::schoolItems(const std::string& id) const {
    const std::vector<ResolvedGroup> groups = resolveSchool(id);
    const std::string name = config_.school(id).displayName();

    std::vector<ItemRecord> out = tba3::schoolItems(id, name, groups);
    for (const auto& rg : groups)
        append(out, tba3::groupItems(rg.data));
    return out;
}

std::vector<AggregationRecord> DataService::schoolAggregations(const std::string& id) const {
    const std::vector<ResolvedGroup> groups = resolveSchool(id);
    const std::string name = config_.school(id).displayName();

    std::vector<AggregationRecord> out = tba3::schoolAggregations(id, name, groups);
    for (const auto& rg : groups)
        append(out, tba3::groupAggregations(rg.data));
    return out;
}

// ─────────────────────────────────────────────────────────────────────────────
//  States
// ─────────────────────────────────────────────────────────────────────────────

std::vector<CompetenceLevelRecord> DataService::stateCompetenceLevels(const std::string& id) const {
    const std::vector<ResolvedGroup> groups = resolveState(id);
    if (!anyTables(groups))
        throw NotFoundError("No equivalence tables found for state: " + id);
    return tba3::stateCompetenceLevels(groups);
}

std::vector<ItemRecord> DataService::stateItems(const std::string& id) const {
    return tba3::stateItems(resolveState(id));
}

std::vector<AggregationRecord> DataService::stateAggregations(const std::string& id) const {
    return tba3::stateAggregations(resolveState(id));
}

} // namespace tba3
