#pragma once
// Records.hpp – Result records produced by the aggregation engine.
// One record = one value group (a group, school, booklet or student) for one
// domain. The API layer serialises these; this library only builds them.

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace tba3 {

struct DomainInfo {
    std::string name;         // domain code, or the subject display name
    std::string subject_name; // "Deutsch", "Mathematik", …
};

struct DescriptiveStatistics {
    int64_t total{0};
    int64_t frequency{0};
    double  mean{0.0};
    double  standard_deviation{0.0};
};

// Categorical attribute of a single student (per-student records only).
struct Covariate {
    std::string type;
    std::string value;
};

// ─── Competence-level distribution ────────────────────────────────────────────
struct CompetenceLevelFrequency {
    std::string                name_short;
    std::optional<std::string> name;
    std::optional<std::string> description;
    int64_t                    frequency{0};
};

struct CompetenceLevelRecord {
    std::string                           id;
    std::string                           name;
    std::optional<DomainInfo>             domain;
    std::vector<CompetenceLevelFrequency> competence_levels;
    std::optional<std::vector<Covariate>> covariates;
};

// ─── Item statistics ──────────────────────────────────────────────────────────
struct ItemParameters {
    double                     logit{0.0};
    double                     bista_points{0.0};
    std::optional<double>      solution_frequency_primary_school;
    std::optional<double>      solution_frequency_gymnasium;
    std::optional<double>      solution_frequency_non_gymnasium;
    std::optional<std::string> domain;
    std::string                competence_level;
    std::vector<std::string>   competence_standard;
    std::optional<std::string> listening_or_reading_style;
    std::vector<std::string>   general_mathematical_competence;
    std::vector<std::string>   core_idea;
    std::optional<std::string> cognitive_demand_level;
};

struct ItemStatistics {
    std::string           name;   // in-booklet display number
    std::string           iqb_id;
    ItemParameters        parameters;
    DescriptiveStatistics descriptive_statistics;
};

struct ItemRecord {
    std::string                           id;
    std::string                           name;
    std::optional<DomainInfo>             domain;
    std::vector<ItemStatistics>           items;
    std::optional<std::vector<Covariate>> covariates;
};

// ─── Domain aggregation ───────────────────────────────────────────────────────
struct Aggregation {
    std::string              type{"custom"};
    std::string              value;            // domain code or subject code
    DescriptiveStatistics    descriptive_statistics;
    std::vector<std::string> included_iqb_ids;
};

struct AggregationRecord {
    std::string                           id;
    std::string                           name;
    std::optional<DomainInfo>             domain;
    std::vector<Aggregation>              aggregations;
    std::optional<std::vector<Covariate>> covariates;
};

} // namespace tba3
