#pragma once
// Config.hpp – Validated group / school / state / equivalence-table definitions
// and the immutable ConfigStore that indexes them.
//
// Usage example:
//   BookletCatalog catalog;
//   catalog.loadDirectory("metadata");
//   ConfigStore config = ConfigStore::loadDirectory("config", catalog);
//
//   const GroupConfig& g = config.group("3a");
//   auto covariates      = config.groupCovariates(g);

#include "Types.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace tba3 {

class BookletCatalog;

struct GroupConfig {
    std::string                        id;
    std::optional<std::string>         name;
    std::string                        booklet; // as written in the config
    BookletKey                         booklet_key;
    double                             ability_mean{0.0};
    double                             ability_std{1.0};
    int                                size{1};
    std::string                        seed;
    std::vector<CovariateDistribution> covariates; // entity-specific only

    [[nodiscard]] std::string displayName() const { return name ? *name : "Lerngruppe " + id; }
};

struct SchoolConfig {
    std::string                id;
    std::optional<std::string> name;
    std::vector<std::string>   groups; // member group ids, in order

    [[nodiscard]] std::string displayName() const { return name ? *name : "Schule " + id; }
};

struct StateConfig {
    std::string                        id;
    std::optional<std::string>         name;
    std::vector<std::string>           booklets; // as written; used in the seed
    std::vector<BookletKey>            booklet_keys;
    double                             ability_mean{0.0};
    double                             ability_std{1.0};
    int                                size{1};
    std::string                        seed;
    std::vector<CovariateDistribution> covariates;

    [[nodiscard]] std::string displayName() const { return name ? *name : "Bundesland " + id; }
};

// Inclusive raw-score band of one competence level.
struct CompetenceLevelRange {
    std::string                name_short;
    std::optional<std::string> name;
    std::optional<std::string> description;
    int                        min_score{0};
    int                        max_score{0};
};

struct EquivalenceTableEntry {
    std::string                       booklet; // as written in the config
    BookletKey                        booklet_key;
    std::optional<std::string>        domain;  // nullopt = whole booklet
    std::vector<CompetenceLevelRange> competence_levels;
};

// ─── Parsed configuration files ───────────────────────────────────────────────
struct GroupsFile {
    std::vector<CovariateDistribution> default_covariates;
    std::vector<GroupConfig>           groups;
};

struct SchoolsFile {
    std::vector<SchoolConfig> schools;
};

struct StatesFile {
    std::vector<CovariateDistribution> default_covariates;
    std::vector<StateConfig>           states;
};

struct EquivalenceTablesFile {
    std::vector<EquivalenceTableEntry> tables;
};

// Defaults first; an entity covariate replaces the default of the same type
// in place, new types are appended in entity order.
[[nodiscard]] std::vector<CovariateDistribution>
mergeCovariates(const std::vector<CovariateDistribution>& defaults,
                const std::vector<CovariateDistribution>& entity);

// ─── ConfigStore ──────────────────────────────────────────────────────────────
// Immutable after construction; safe for concurrent readers.
class ConfigStore {
public:
    ConfigStore() = default;

    // Validates duplicate ids and every equivalence table. When a catalog is
    // given, each table's booklet must exist and its last range must end at
    // the item count in scope. Throws ConfigValidationError.
    ConfigStore(GroupsFile groups,
                SchoolsFile schools,
                StatesFile states,
                EquivalenceTablesFile tables,
                const BookletCatalog* catalog);

    // Loads groups.xml, schools.xml, states.xml and equivalence_tables.xml
    // from dir. Missing files are logged and yield empty collections.
    [[nodiscard]] static ConfigStore loadDirectory(const std::filesystem::path& dir,
                                                   const BookletCatalog& catalog);

    [[nodiscard]] const GroupConfig*  findGroup(const std::string& id) const;
    [[nodiscard]] const SchoolConfig* findSchool(const std::string& id) const;
    [[nodiscard]] const StateConfig*  findState(const std::string& id) const;

    // Same lookups, throwing NotFoundError.
    [[nodiscard]] const GroupConfig&  group(const std::string& id) const;
    [[nodiscard]] const SchoolConfig& school(const std::string& id) const;
    [[nodiscard]] const StateConfig&  state(const std::string& id) const;

    // Tables of one booklet, in configuration order.
    [[nodiscard]] std::vector<const EquivalenceTableEntry*>
    equivalenceTablesFor(const BookletKey& key) const;

    [[nodiscard]] std::vector<CovariateDistribution> groupCovariates(const GroupConfig& g) const;
    [[nodiscard]] std::vector<CovariateDistribution> stateCovariates(const StateConfig& s) const;

    [[nodiscard]] const std::vector<GroupConfig>&           groups()  const noexcept { return groups_.groups; }
    [[nodiscard]] const std::vector<SchoolConfig>&          schools() const noexcept { return schools_.schools; }
    [[nodiscard]] const std::vector<StateConfig>&           states()  const noexcept { return states_.states; }
    [[nodiscard]] const std::vector<EquivalenceTableEntry>& equivalenceTables() const noexcept {
        return tables_.tables;
    }

private:
    GroupsFile            groups_;
    SchoolsFile           schools_;
    StatesFile            states_;
    EquivalenceTablesFile tables_;

    std::unordered_map<std::string, size_t> group_index_;
    std::unordered_map<std::string, size_t> school_index_;
    std::unordered_map<std::string, size_t> state_index_;
};

} // namespace tba3
