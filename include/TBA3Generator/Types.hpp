#pragma once
// Types.hpp – Booklet metadata and generated-data types.
// Everything the generators and the aggregation engine exchange lives here.

#include <compare>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tba3 {

// ─── Booklet identity ─────────────────────────────────────────────────────────
// Canonical text form: V{level}-{year}-{SUBJECT}-{booklet_id}
// e.g. "V3-2024-DE-TH01". The booklet id may itself contain dashes.
struct BookletKey {
    int         level{0};
    int         year{0};
    std::string subject;    // lower-case subject code, e.g. "de"
    std::string booklet_id; // "TH01", "TH-02-A", …

    // Throws std::invalid_argument when the text is not a valid key.
    [[nodiscard]] static BookletKey parse(std::string_view text);

    [[nodiscard]] std::string toString() const;

    auto operator<=>(const BookletKey&) const = default;
};

// ─── Aggregation key: keeps equal domain codes of different subjects apart ────
struct DomainKey {
    std::string                subject;
    std::optional<std::string> domain; // nullopt = whole booklet / no domain

    [[nodiscard]] std::string toString() const; // "DE-le" or "DE"

    auto operator<=>(const DomainKey&) const = default;
};

// ─── A single test item ───────────────────────────────────────────────────────
struct Item {
    std::string iqb_item_id;       // "D38701", "M1674501"
    std::string name;              // item / stimulus name
    double      logit{0.0};        // IRT difficulty
    double      bista{0.0};        // scaled score (BISTA points)
    std::string competence_level;  // "I", "Ia", "A2.1", …
    std::optional<std::string> domain; // "le", "ho", "gm", …
    std::string item_nr_booklet;   // display number, e.g. "1.1"
    double      item_order_booklet{0.0}; // sort key inside the booklet

    // Reference solution frequencies per school type (informational)
    std::optional<double> solution_freq_primary_school;
    std::optional<double> solution_freq_gymnasium;
    std::optional<double> solution_freq_non_gymnasium;

    // Didactic classification (all optional, copied verbatim to item stats)
    std::vector<std::string>   competence_standard;            // kompstd1..3
    std::optional<std::string> listening_or_reading_style;     // selektiv, global, …
    std::vector<std::string>   general_mathematical_competence; // K1..K6, A1..A5
    std::vector<std::string>   core_idea;                       // L1..L5
    std::optional<std::string> cognitive_demand_level;          // AFB
};

// Items of one domain, as indices into Booklet::items (load order).
struct DomainItems {
    std::optional<std::string> domain;
    std::vector<size_t>        item_indices;
};

// ─── A test booklet ───────────────────────────────────────────────────────────
struct Booklet {
    BookletKey        key;
    std::vector<Item> items; // load order; see sortedItemIndices()

    [[nodiscard]] size_t itemCount() const noexcept { return items.size(); }
    [[nodiscard]] const std::string& subject() const noexcept { return key.subject; }

    // Indices of items ordered by item_order_booklet (stable for ties).
    [[nodiscard]] std::vector<size_t> sortedItemIndices() const;

    // Items grouped by domain; groups appear in first-seen order and the
    // domain-less items form their own group.
    [[nodiscard]] std::vector<DomainItems> itemsByDomain() const;

    // Number of items in scope: the whole booklet when domain is nullopt.
    [[nodiscard]] size_t itemCountForDomain(const std::optional<std::string>& domain) const;

    // Item indices in scope, load order.
    [[nodiscard]] std::vector<size_t> itemIndicesForDomain(const std::optional<std::string>& domain) const;
};

// ─── Generation inputs ────────────────────────────────────────────────────────
struct AbilityProfile {
    std::string name;        // display name of the group / state
    double      ability_mean{0.0};
    double      ability_std{1.0};
};

// Discrete distribution for one categorical student attribute.
// Construct through makeCovariate() so the probabilities are validated.
struct CovariateDistribution {
    std::string              type_name;     // "geschlecht", "SES", …
    std::vector<std::string> categories;
    std::vector<double>      probabilities; // parallel to categories, sums to 1
};

// Validates and builds a covariate distribution.
// Throws ConfigValidationError on length mismatch, negative values or a sum ≠ 1.
[[nodiscard]] CovariateDistribution makeCovariate(std::string type_name,
                                                  std::vector<std::string> categories,
                                                  std::vector<double> probabilities);

// ─── Generated data ───────────────────────────────────────────────────────────
struct CovariateColumn {
    std::string              type_name;
    std::vector<std::string> values; // one per student
};

struct StudentTable {
    std::vector<std::string>     ids;       // UUID strings
    std::vector<std::string>     names;     // "schnell.apfel.42"
    std::vector<double>          abilities; // logit scale
    std::vector<CovariateColumn> covariates;

    [[nodiscard]] size_t size() const noexcept { return ids.size(); }
};

// Binary students × items matrix, row-major.
// Column c holds the responses to booklet item item_of_column[c]; columns
// follow the booklet's numeric item order.
class ResponseMatrix {
public:
    ResponseMatrix() = default;
    ResponseMatrix(size_t rows, std::vector<size_t> item_of_column);

    [[nodiscard]] size_t rows() const noexcept { return rows_; }
    [[nodiscard]] size_t cols() const noexcept { return item_of_column_.size(); }

    [[nodiscard]] uint8_t  at(size_t row, size_t col) const { return cells_[row * cols() + col]; }
    [[nodiscard]] uint8_t& at(size_t row, size_t col)       { return cells_[row * cols() + col]; }

    [[nodiscard]] const std::vector<size_t>& itemOfColumn() const noexcept { return item_of_column_; }

    // Column holding the given booklet item index. Throws std::out_of_range.
    [[nodiscard]] size_t columnOfItem(size_t item_index) const;

    // Appends the rows of another matrix with the same column layout.
    // Throws ComputationPrecondition when the layouts differ.
    void appendRows(const ResponseMatrix& other);

    // Sum of the given columns for one row (the raw score in that scope).
    [[nodiscard]] int rowSum(size_t row, const std::vector<size_t>& columns) const;

    [[nodiscard]] const std::vector<uint8_t>& cells() const noexcept { return cells_; }

private:
    size_t               rows_{0};
    std::vector<size_t>  item_of_column_;
    std::vector<size_t>  column_of_item_;
    std::vector<uint8_t> cells_;
};

// Complete generated artifact for one group instance. Created per request,
// never mutated afterwards.
struct GroupData {
    std::string    group_id;
    const Booklet* booklet{nullptr}; // owned by the BookletCatalog
    StudentTable   students;
    ResponseMatrix responses;
    AbilityProfile profile;
};

} // namespace tba3

template <>
struct std::hash<tba3::BookletKey> {
    size_t operator()(const tba3::BookletKey& k) const noexcept {
        size_t h = std::hash<std::string>{}(k.subject);
        h ^= std::hash<std::string>{}(k.booklet_id) + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2);
        h ^= std::hash<int>{}(k.level) + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2);
        h ^= std::hash<int>{}(k.year) + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2);
        return h;
    }
};
