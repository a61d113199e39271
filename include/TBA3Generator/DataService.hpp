#pragma once
// DataService.hpp – Request facade: resolves group / school / state ids,
// generates their data and assembles the record lists.
//
// Every call recomputes from configuration plus seed; nothing is cached and
// the service holds no mutable state, so one instance may serve concurrent
// requests.
//
// Usage example:
//   DataService svc(catalog, config);
//   auto records = svc.groupItems("3a", parseReportTypes("group,students"));

#include "Aggregation.hpp"
#include "BookletCatalog.hpp"
#include "Config.hpp"
#include "Records.hpp"

#include <string>
#include <vector>

namespace tba3 {

// Which value groups a group request emits.
struct ReportTypes {
    bool group{true};
    bool students{false};
};

// Comma-separated, case-insensitive. Empty → group only; "students" →
// students only; "group,students" → both.
[[nodiscard]] ReportTypes parseReportTypes(const std::string& type_param);

class DataService {
public:
    DataService(const BookletCatalog& catalog, const ConfigStore& config) noexcept
        : catalog_(catalog), config_(config) {}

    // ── Resolution (NotFoundError for unknown ids or booklets) ───────────────
    [[nodiscard]] ResolvedGroup              resolveGroup(const std::string& group_id) const;
    [[nodiscard]] std::vector<ResolvedGroup> resolveSchool(const std::string& school_id) const;
    [[nodiscard]] std::vector<ResolvedGroup> resolveState(const std::string& state_id) const;

    // ── Groups ───────────────────────────────────────────────────────────────
    [[nodiscard]] std::vector<CompetenceLevelRecord> groupCompetenceLevels(const std::string& id, ReportTypes types) const;
    [[nodiscard]] std::vector<ItemRecord>            groupItems(const std::string& id, ReportTypes types) const;
    [[nodiscard]] std::vector<AggregationRecord>     groupAggregations(const std::string& id, ReportTypes types) const;

    // ── Schools: school-level records, then every member group's records ────
    [[nodiscard]] std::vector<CompetenceLevelRecord> schoolCompetenceLevels(const std::string& id) const;
    [[nodiscard]] std::vector<ItemRecord>            schoolItems(const std::string& id) const;
    [[nodiscard]] std::vector<AggregationRecord>     schoolAggregations(const std::string& id) const;

    // ── States: one set of records per booklet ───────────────────────────────
    [[nodiscard]] std::vector<CompetenceLevelRecord> stateCompetenceLevels(const std::string& id) const;
    [[nodiscard]] std::vector<ItemRecord>            stateItems(const std::string& id) const;
    [[nodiscard]] std::vector<AggregationRecord>     stateAggregations(const std::string& id) const;

private:
    const BookletCatalog& catalog_;
    const ConfigStore&    config_;
};

} // namespace tba3
