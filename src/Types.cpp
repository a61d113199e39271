// Types.cpp – Booklet key parsing, booklet views and the response matrix.

#include "TBA3Generator/Types.hpp"
#include "TBA3Generator/Errors.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <numeric>
#include <stdexcept>

namespace tba3 {

// ─── BookletKey ───────────────────────────────────────────────────────────────

static int parseKeyInt(std::string_view s, std::string_view what, std::string_view whole) {
    int v = 0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
    if (s.empty() || ec != std::errc{} || ptr != s.data() + s.size())
        throw std::invalid_argument("Cannot parse " + std::string(what) + " from '" +
                                    std::string(s) + "' in booklet key '" + std::string(whole) + "'");
    return v;
}

static std::string toLower(std::string_view s) {
    std::string out(s);
    for (char& c : out) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return out;
}

static std::string toUpper(std::string_view s) {
    std::string out(s);
    for (char& c : out) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    return out;
}

BookletKey BookletKey::parse(std::string_view text) {
    std::vector<std::string_view> parts;
    size_t start = 0;
    while (true) {
        size_t dash = text.find('-', start);
        if (dash == std::string_view::npos) {
            parts.push_back(text.substr(start));
            break;
        }
        parts.push_back(text.substr(start, dash - start));
        start = dash + 1;
    }

    if (parts.size() < 4)
        throw std::invalid_argument("BookletKey must have at least 4 dash-separated segments, got " +
                                    std::to_string(parts.size()) + ": '" + std::string(text) + "'");
    if (parts[0].empty() || parts[0].front() != 'V')
        throw std::invalid_argument("BookletKey must start with 'V', got: '" + std::string(parts[0]) + "'");

    BookletKey key;
    key.level   = parseKeyInt(parts[0].substr(1), "level", text);
    key.year    = parseKeyInt(parts[1], "year", text);
    key.subject = toLower(parts[2]);

    // Everything after the subject belongs to the booklet id
    const size_t id_start = static_cast<size_t>(parts[3].data() - text.data());
    key.booklet_id = std::string(text.substr(id_start));
    if (key.booklet_id.empty())
        throw std::invalid_argument("Booklet ID is empty in '" + std::string(text) + "'");

    return key;
}

std::string BookletKey::toString() const {
    return "V" + std::to_string(level) + "-" + std::to_string(year) + "-" +
           toUpper(subject) + "-" + booklet_id;
}

std::string DomainKey::toString() const {
    if (domain && !domain->empty())
        return toUpper(subject) + "-" + *domain;
    return toUpper(subject);
}

// ─── Booklet ──────────────────────────────────────────────────────────────────

std::vector<size_t> Booklet::sortedItemIndices() const {
    std::vector<size_t> idx(items.size());
    std::iota(idx.begin(), idx.end(), size_t{0});
    std::stable_sort(idx.begin(), idx.end(), [this](size_t a, size_t b) {
        return items[a].item_order_booklet < items[b].item_order_booklet;
    });
    return idx;
}

std::vector<DomainItems> Booklet::itemsByDomain() const {
    std::vector<DomainItems> groups;
    for (size_t i = 0; i < items.size(); ++i) {
        auto it = std::find_if(groups.begin(), groups.end(), [&](const DomainItems& g) {
            return g.domain == items[i].domain;
        });
        if (it == groups.end()) {
            groups.push_back(DomainItems{items[i].domain, {}});
            it = std::prev(groups.end());
        }
        it->item_indices.push_back(i);
    }
    return groups;
}

size_t Booklet::itemCountForDomain(const std::optional<std::string>& domain) const {
    if (!domain) return items.size();
    return static_cast<size_t>(std::count_if(items.begin(), items.end(),
                                             [&](const Item& it) { return it.domain == domain; }));
}

std::vector<size_t> Booklet::itemIndicesForDomain(const std::optional<std::string>& domain) const {
    std::vector<size_t> out;
    for (size_t i = 0; i < items.size(); ++i) {
        if (!domain || items[i].domain == domain) out.push_back(i);
    }
    return out;
}

// ─── Covariates ───────────────────────────────────────────────────────────────

CovariateDistribution makeCovariate(std::string type_name,
                                    std::vector<std::string> categories,
                                    std::vector<double> probabilities) {
    if (categories.size() != probabilities.size())
        throw ConfigValidationError("Covariate '" + type_name +
                                    "': categories and probabilities must have same length");
    if (categories.empty())
        throw ConfigValidationError("Covariate '" + type_name + "' has no categories");
    if (std::any_of(probabilities.begin(), probabilities.end(), [](double p) { return p < 0.0; }))
        throw ConfigValidationError("Covariate '" + type_name + "': probabilities must be non-negative");

    // Kahan-compensated sum, compared with a relative tolerance
    double sum = 0.0, comp = 0.0;
    for (double p : probabilities) {
        const double y = p - comp;
        const double t = sum + y;
        comp = (t - sum) - y;
        sum  = t;
    }
    if (std::fabs(sum - 1.0) > 1e-9)
        throw ConfigValidationError("Covariate '" + type_name + "': probabilities must sum to 1.0, got " +
                                    std::to_string(sum));

    return CovariateDistribution{std::move(type_name), std::move(categories), std::move(probabilities)};
}

// ─── ResponseMatrix ───────────────────────────────────────────────────────────

ResponseMatrix::ResponseMatrix(size_t rows, std::vector<size_t> item_of_column)
    : rows_(rows), item_of_column_(std::move(item_of_column)) {
    column_of_item_.assign(item_of_column_.size(), 0);
    for (size_t c = 0; c < item_of_column_.size(); ++c) {
        if (item_of_column_[c] >= column_of_item_.size())
            throw ComputationPrecondition("Response column layout is not a permutation of the booklet items");
        column_of_item_[item_of_column_[c]] = c;
    }
    cells_.assign(rows_ * item_of_column_.size(), 0);
}

size_t ResponseMatrix::columnOfItem(size_t item_index) const {
    if (item_index >= column_of_item_.size())
        throw std::out_of_range("Item index " + std::to_string(item_index) + " has no response column");
    return column_of_item_[item_index];
}

void ResponseMatrix::appendRows(const ResponseMatrix& other) {
    if (other.item_of_column_ != item_of_column_)
        throw ComputationPrecondition("Cannot concatenate response matrices with different item columns");
    cells_.insert(cells_.end(), other.cells_.begin(), other.cells_.end());
    rows_ += other.rows_;
}

int ResponseMatrix::rowSum(size_t row, const std::vector<size_t>& columns) const {
    int sum = 0;
    for (size_t c : columns) sum += at(row, c);
    return sum;
}

} // namespace tba3
