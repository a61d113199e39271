#pragma once
// Aggregation.hpp – Item, domain and competence-level statistics at group,
// school and state scope, plus per-student breakdowns.
//
// Scopes:
//   group  – one GroupData, one record per domain (or per equivalence table).
//   school – several groups pooled so that every statistic equals the flat
//            computation over the union of their students.
//   state  – one generated group per booklet; records are emitted per
//            booklet (id/name = booklet key) and never pooled across booklets.
//
// Means and standard deviations are rounded to 4 decimals. Standard
// deviations are sample deviations (n − 1) and 0 for fewer than two values.

#include "Config.hpp"
#include "Records.hpp"
#include "Types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace tba3 {

// A generated group together with the equivalence tables of its booklet.
struct ResolvedGroup {
    GroupData                                 data;
    std::vector<const EquivalenceTableEntry*> tables;
};

// "de" → "Deutsch", …; unknown codes are returned verbatim.
[[nodiscard]] std::string subjectDisplayName(const std::string& subject_code);

// Domain label of a record: the domain code, or the subject display name for
// the domain-less group.
[[nodiscard]] DomainInfo makeDomain(const std::optional<std::string>& domain, const std::string& subject_code);

// ─── Group scope ──────────────────────────────────────────────────────────────

// One record per table. Throws IntegrityError for an unmatched raw score.
[[nodiscard]] std::vector<CompetenceLevelRecord>
groupCompetenceLevels(const GroupData& group, const std::vector<const EquivalenceTableEntry*>& tables);

[[nodiscard]] std::vector<ItemRecord>        groupItems(const GroupData& group);
[[nodiscard]] std::vector<AggregationRecord> groupAggregations(const GroupData& group);

// ─── Per-student breakdowns ───────────────────────────────────────────────────
// Same taxonomy as the group records, one record per student and domain,
// carrying the student's covariates.

[[nodiscard]] std::vector<CompetenceLevelRecord>
studentCompetenceLevels(const GroupData& group, const std::vector<const EquivalenceTableEntry*>& tables);

[[nodiscard]] std::vector<ItemRecord>        studentItems(const GroupData& group);
[[nodiscard]] std::vector<AggregationRecord> studentAggregations(const GroupData& group);

// ─── School scope ─────────────────────────────────────────────────────────────

// Frequencies summed per (subject, domain); level list from first occurrence.
[[nodiscard]] std::vector<CompetenceLevelRecord>
schoolCompetenceLevels(const std::string& school_id, const std::string& school_name,
                       const std::vector<ResolvedGroup>& groups);

// Same-booklet response matrices are concatenated before recomputation.
[[nodiscard]] std::vector<ItemRecord>
schoolItems(const std::string& school_id, const std::string& school_name,
            const std::vector<ResolvedGroup>& groups);

// Per-student domain means are pooled across groups per (subject, domain).
[[nodiscard]] std::vector<AggregationRecord>
schoolAggregations(const std::string& school_id, const std::string& school_name,
                   const std::vector<ResolvedGroup>& groups);

// ─── State scope ──────────────────────────────────────────────────────────────

[[nodiscard]] std::vector<CompetenceLevelRecord> stateCompetenceLevels(const std::vector<ResolvedGroup>& groups);
[[nodiscard]] std::vector<ItemRecord>            stateItems(const std::vector<ResolvedGroup>& groups);
[[nodiscard]] std::vector<AggregationRecord>     stateAggregations(const std::vector<ResolvedGroup>& groups);

} // namespace tba3
