// Aggregation.cpp – Statistics over generated response matrices.

#include "TBA3Generator/Aggregation.hpp"
#include "TBA3Generator/Equivalence.hpp"
#include "TBA3Generator/Errors.hpp"

#include <algorithm>
#include <cmath>
#include <map>
#include <set>
#include <unordered_map>

namespace tba3 {

// ─────────────────────────────────────────────────────────────────────────────
//  Descriptive statistics
// ─────────────────────────────────────────────────────────────────────────────

static double round4(double v) {
    if (!std::isfinite(v)) return 0.0;
    return std::round(v * 10000.0) / 10000.0;
}

struct Summary {
    double mean{0.0};
    double sd{0.0};
};

// Two-pass mean and sample standard deviation.
static Summary summarize(const std::vector<double>& values) {
    Summary s;
    if (values.empty()) return s;
    double sum = 0.0;
    for (double v : values) sum += v;
    s.mean = sum / static_cast<double>(values.size());
    if (values.size() < 2) return s;
    double ss = 0.0;
    for (double v : values) ss += (v - s.mean) * (v - s.mean);
    s.sd = std::sqrt(ss / static_cast<double>(values.size() - 1));
    return s;
}

static DescriptiveStatistics describeColumn(const ResponseMatrix& m, size_t col) {
    std::vector<double> values(m.rows());
    int64_t frequency = 0;
    for (size_t r = 0; r < m.rows(); ++r) {
        values[r] = m.at(r, col);
        frequency += m.at(r, col);
    }
    const Summary s = summarize(values);
    return DescriptiveStatistics{static_cast<int64_t>(m.rows()), frequency, round4(s.mean), round4(s.sd)};
}

// ─────────────────────────────────────────────────────────────────────────────
//  Shared helpers
// ─────────────────────────────────────────────────────────────────────────────

std::string subjectDisplayName(const std::string& subject_code) {
    static const std::map<std::string, std::string> kNames = {
        {"de", "Deutsch"},
        {"ma", "Mathematik"},
        {"en", "Englisch"},
        {"fr", "Französisch"},
    };
    auto it = kNames.find(subject_code);
    return it == kNames.end() ? subject_code : it->second;
}

DomainInfo makeDomain(const std::optional<std::string>& domain, const std::string& subject_code) {
    std::string subject = subjectDisplayName(subject_code);
    return DomainInfo{domain ? *domain : subject, subject};
}

static const Booklet& bookletOf(const GroupData& group) {
    if (group.booklet == nullptr)
        throw ComputationPrecondition("Group '" + group.group_id + "' has no booklet");
    if (group.responses.rows() != group.students.size())
        throw ComputationPrecondition("Group '" + group.group_id + "' response rows do not match students");
    return *group.booklet;
}

static ItemParameters itemParameters(const Item& item) {
    ItemParameters p;
    p.logit                             = item.logit;
    p.bista_points                      = item.bista;
    p.solution_frequency_primary_school = item.solution_freq_primary_school;
    p.solution_frequency_gymnasium      = item.solution_freq_gymnasium;
    p.solution_frequency_non_gymnasium  = item.solution_freq_non_gymnasium;
    p.domain                            = item.domain;
    p.competence_level                  = item.competence_level;
    p.competence_standard               = item.competence_standard;
    p.listening_or_reading_style        = item.listening_or_reading_style;
    p.general_mathematical_competence   = item.general_mathematical_competence;
    p.core_idea                         = item.core_idea;
    p.cognitive_demand_level            = item.cognitive_demand_level;
    return p;
}

// Item indices of one domain group, ordered by item_order_booklet.
static std::vector<size_t> sortedByOrder(const Booklet& booklet, std::vector<size_t> indices) {
    std::stable_sort(indices.begin(), indices.end(), [&](size_t a, size_t b) {
        return booklet.items[a].item_order_booklet < booklet.items[b].item_order_booklet;
    });
    return indices;
}

static std::vector<size_t> columnsOf(const ResponseMatrix& m, const std::vector<size_t>& item_indices) {
    std::vector<size_t> cols;
    cols.reserve(item_indices.size());
    for (size_t idx : item_indices) cols.push_back(m.columnOfItem(idx));
    return cols;
}

static std::vector<std::string> iqbIds(const Booklet& booklet, const std::vector<size_t>& item_indices) {
    std::vector<std::string> ids;
    ids.reserve(item_indices.size());
    for (size_t idx : item_indices) ids.push_back(booklet.items[idx].iqb_item_id);
    return ids;
}

// Mean score of each student over the given columns.
static std::vector<double> studentMeans(const ResponseMatrix& m, const std::vector<size_t>& cols) {
    std::vector<double> means(m.rows(), 0.0);
    if (cols.empty()) return means;
    for (size_t r = 0; r < m.rows(); ++r)
        means[r] = static_cast<double>(m.rowSum(r, cols)) / static_cast<double>(cols.size());
    return means;
}

static std::vector<Covariate> covariatesOf(const StudentTable& students, size_t row) {
    std::vector<Covariate> out;
    out.reserve(students.covariates.size());
    for (const auto& col : students.covariates)
        out.push_back(Covariate{col.type_name, col.values.at(row)});
    return out;
}

static std::vector<ItemStatistics> itemStatisticsFor(const Booklet& booklet,
                                                     const ResponseMatrix& responses,
                                                     const std::vector<size_t>& sorted_items) {
    std::vector<ItemStatistics> stats;
    stats.reserve(sorted_items.size());
    for (size_t idx : sorted_items) {
        const Item& item = booklet.items[idx];
        stats.push_back(ItemStatistics{item.item_nr_booklet, item.iqb_item_id, itemParameters(item),
                                       describeColumn(responses, responses.columnOfItem(idx))});
    }
    return stats;
}

// Per-level frequencies of one group for one table, all levels zero-filled.
static std::vector<CompetenceLevelFrequency> levelFrequencies(const GroupData& group,
                                                              const EquivalenceTableEntry& entry) {
    const Booklet& booklet = bookletOf(group);
    const std::vector<size_t> cols = columnsOf(group.responses, booklet.itemIndicesForDomain(entry.domain));

    std::vector<CompetenceLevelFrequency> levels;
    levels.reserve(entry.competence_levels.size());
    for (const auto& cl : entry.competence_levels)
        levels.push_back(CompetenceLevelFrequency{cl.name_short, cl.name, cl.description, 0});

    for (size_t r = 0; r < group.responses.rows(); ++r) {
        const CompetenceLevelRange& matched = classify(group.responses.rowSum(r, cols), entry);
        for (auto& lvl : levels) {
            if (lvl.name_short == matched.name_short) {
                ++lvl.frequency;
                break;
            }
        }
    }
    return levels;
}

// ─────────────────────────────────────────────────────────────────────────────
//  Group scope
// ─────────────────────────────────────────────────────────────────────────────

std::vector<CompetenceLevelRecord>
groupCompetenceLevels(const GroupData& group, const std::vector<const EquivalenceTableEntry*>& tables) {
    const Booklet& booklet = bookletOf(group);
    std::vector<CompetenceLevelRecord> out;
    for (const EquivalenceTableEntry* entry : tables) {
        CompetenceLevelRecord rec;
        rec.id                = group.group_id;
        rec.name              = group.profile.name;
        rec.domain            = makeDomain(entry->domain, booklet.subject());
        rec.competence_levels = levelFrequencies(group, *entry);
        out.push_back(std::move(rec));
    }
    return out;
}

std::vector<ItemRecord> groupItems(const GroupData& group) {
    const Booklet& booklet = bookletOf(group);
    std::vector<ItemRecord> out;
    for (const DomainItems& d : booklet.itemsByDomain()) {
        ItemRecord rec;
        rec.id     = group.group_id;
        rec.name   = group.profile.name;
        rec.domain = makeDomain(d.domain, booklet.subject());
        rec.items  = itemStatisticsFor(booklet, group.responses, sortedByOrder(booklet, d.item_indices));
        out.push_back(std::move(rec));
    }
    return out;
}

std::vector<AggregationRecord> groupAggregations(const GroupData& group) {
    const Booklet& booklet = bookletOf(group);
    std::vector<AggregationRecord> out;
    for (const DomainItems& d : booklet.itemsByDomain()) {
        const std::vector<size_t> cols = columnsOf(group.responses, d.item_indices);
        const Summary s = summarize(studentMeans(group.responses, cols));

        int64_t frequency = 0;
        for (size_t r = 0; r < group.responses.rows(); ++r)
            frequency += group.responses.rowSum(r, cols);

        Aggregation agg;
        agg.value                  = d.domain ? *d.domain : booklet.subject();
        agg.descriptive_statistics = DescriptiveStatistics{static_cast<int64_t>(cols.size()), frequency,
                                                           round4(s.mean), round4(s.sd)};
        agg.included_iqb_ids       = iqbIds(booklet, d.item_indices);

        AggregationRecord rec;
        rec.id     = group.group_id;
        rec.name   = group.profile.name;
        rec.domain = makeDomain(d.domain, booklet.subject());
        rec.aggregations.push_back(std::move(agg));
        out.push_back(std::move(rec));
    }
    return out;
}

// ─────────────────────────────────────────────────────────────────────────────
//  Per-student breakdowns
// ─────────────────────────────────────────────────────────────────────────────

std::vector<CompetenceLevelRecord>
studentCompetenceLevels(const GroupData& group, const std::vector<const EquivalenceTableEntry*>& tables) {
    const Booklet& booklet = bookletOf(group);
    std::vector<CompetenceLevelRecord> out;
    for (const EquivalenceTableEntry* entry : tables) {
        const std::vector<size_t> cols = columnsOf(group.responses, booklet.itemIndicesForDomain(entry->domain));
        const DomainInfo domain = makeDomain(entry->domain, booklet.subject());

        for (size_t r = 0; r < group.students.size(); ++r) {
            const CompetenceLevelRange& matched = classify(group.responses.rowSum(r, cols), *entry);

            CompetenceLevelRecord rec;
            rec.id     = group.students.ids[r];
            rec.name   = group.students.names[r];
            rec.domain = domain;
            for (const auto& cl : entry->competence_levels) {
                rec.competence_levels.push_back(CompetenceLevelFrequency{
                    cl.name_short, cl.name, cl.description, cl.name_short == matched.name_short ? 1 : 0});
            }
            rec.covariates = covariatesOf(group.students, r);
            out.push_back(std::move(rec));
        }
    }
    return out;
}

std::vector<ItemRecord> studentItems(const GroupData& group) {
    const Booklet& booklet = bookletOf(group);
    std::vector<ItemRecord> out;
    for (const DomainItems& d : booklet.itemsByDomain()) {
        const std::vector<size_t> sorted = sortedByOrder(booklet, d.item_indices);
        const DomainInfo domain = makeDomain(d.domain, booklet.subject());

        std::vector<ItemParameters> params;
        params.reserve(sorted.size());
        for (size_t idx : sorted) params.push_back(itemParameters(booklet.items[idx]));

        for (size_t r = 0; r < group.students.size(); ++r) {
            ItemRecord rec;
            rec.id     = group.students.ids[r];
            rec.name   = group.students.names[r];
            rec.domain = domain;
            for (size_t k = 0; k < sorted.size(); ++k) {
                const Item&   item  = booklet.items[sorted[k]];
                const uint8_t score = group.responses.at(r, group.responses.columnOfItem(sorted[k]));
                rec.items.push_back(ItemStatistics{item.item_nr_booklet, item.iqb_item_id, params[k],
                                                   DescriptiveStatistics{1, score, static_cast<double>(score), 0.0}});
            }
            rec.covariates = covariatesOf(group.students, r);
            out.push_back(std::move(rec));
        }
    }
    return out;
}

std::vector<AggregationRecord> studentAggregations(const GroupData& group) {
    const Booklet& booklet = bookletOf(group);
    std::vector<AggregationRecord> out;
    for (const DomainItems& d : booklet.itemsByDomain()) {
        const std::vector<size_t>      cols  = columnsOf(group.responses, d.item_indices);
        const std::vector<std::string> ids   = iqbIds(booklet, d.item_indices);
        const auto                     total = static_cast<int64_t>(cols.size());
        const DomainInfo               domain = makeDomain(d.domain, booklet.subject());

        for (size_t r = 0; r < group.students.size(); ++r) {
            const int64_t frequency = group.responses.rowSum(r, cols);

            Aggregation agg;
            agg.value = d.domain ? *d.domain : booklet.subject();
            agg.descriptive_statistics = DescriptiveStatistics{
                total, frequency,
                total > 0 ? round4(static_cast<double>(frequency) / static_cast<double>(total)) : 0.0, 0.0};
            agg.included_iqb_ids = ids;

            AggregationRecord rec;
            rec.id     = group.students.ids[r];
            rec.name   = group.students.names[r];
            rec.domain = domain;
            rec.aggregations.push_back(std::move(agg));
            rec.covariates = covariatesOf(group.students, r);
            out.push_back(std::move(rec));
        }
    }
    return out;
}

// ─────────────────────────────────────────────────────────────────────────────
//  School scope
// ─────────────────────────────────────────────────────────────────────────────

// Insertion-ordered DomainKey → value map (results keep first-seen order).
template <typename V>
class OrderedDomainMap {
public:
    V& operator[](const DomainKey& key) {
        auto it = index_.find(key);
        if (it != index_.end()) return entries_[it->second].second;
        index_.emplace(key, entries_.size());
        entries_.emplace_back(key, V{});
        return entries_.back().second;
    }
    [[nodiscard]] bool contains(const DomainKey& key) const { return index_.count(key) != 0; }
    [[nodiscard]] const std::vector<std::pair<DomainKey, V>>& entries() const noexcept { return entries_; }

private:
    std::map<DomainKey, size_t>           index_;
    std::vector<std::pair<DomainKey, V>> entries_;
};

std::vector<CompetenceLevelRecord>
schoolCompetenceLevels(const std::string& school_id, const std::string& school_name,
                       const std::vector<ResolvedGroup>& groups) {
    struct Merged {
        DomainInfo                                 domain;
        std::vector<CompetenceLevelFrequency>      levels; // first occurrence defines order and metadata
        std::unordered_map<std::string, int64_t>   frequency;
    };

    OrderedDomainMap<Merged> merged;
    for (const ResolvedGroup& rg : groups) {
        const Booklet& booklet = bookletOf(rg.data);
        for (const EquivalenceTableEntry* entry : rg.tables) {
            const DomainKey key{booklet.subject(), entry->domain};
            const bool first = !merged.contains(key);
            Merged& m = merged[key];

            const std::vector<CompetenceLevelFrequency> levels = levelFrequencies(rg.data, *entry);
            if (first) {
                m.domain = makeDomain(entry->domain, booklet.subject());
                m.levels = levels;
            }
            for (const auto& lvl : levels)
                m.frequency[lvl.name_short] += lvl.frequency;
        }
    }

    std::vector<CompetenceLevelRecord> out;
    for (const auto& [key, m] : merged.entries()) {
        CompetenceLevelRecord rec;
        rec.id     = school_id;
        rec.name   = school_name;
        rec.domain = m.domain;
        for (const auto& lvl : m.levels) {
            auto it = m.frequency.find(lvl.name_short);
            rec.competence_levels.push_back(CompetenceLevelFrequency{
                lvl.name_short, lvl.name, lvl.description, it == m.frequency.end() ? 0 : it->second});
        }
        out.push_back(std::move(rec));
    }
    return out;
}

std::vector<ItemRecord>
schoolItems(const std::string& school_id, const std::string& school_name,
            const std::vector<ResolvedGroup>& groups) {
    // Bucket by booklet, first-seen order
    std::vector<std::pair<const Booklet*, ResponseMatrix>> buckets;
    for (const ResolvedGroup& rg : groups) {
        const Booklet& booklet = bookletOf(rg.data);
        auto it = std::find_if(buckets.begin(), buckets.end(),
                               [&](const auto& b) { return b.first->key == booklet.key; });
        if (it == buckets.end())
            buckets.emplace_back(&booklet, rg.data.responses);
        else
            it->second.appendRows(rg.data.responses);
    }

    std::vector<ItemRecord> out;
    for (const auto& [booklet, pooled] : buckets) {
        for (const DomainItems& d : booklet->itemsByDomain()) {
            ItemRecord rec;
            rec.id     = school_id;
            rec.name   = school_name;
            rec.domain = makeDomain(d.domain, booklet->subject());
            rec.items  = itemStatisticsFor(*booklet, pooled, sortedByOrder(*booklet, d.item_indices));
            out.push_back(std::move(rec));
        }
    }
    return out;
}

std::vector<AggregationRecord>
schoolAggregations(const std::string& school_id, const std::string& school_name,
                   const std::vector<ResolvedGroup>& groups) {
    struct Pooled {
        std::vector<double>   student_means;
        int64_t               frequency{0};
        std::set<std::string> iqb_ids;
    };

    OrderedDomainMap<Pooled> pooled;
    for (const ResolvedGroup& rg : groups) {
        const Booklet&        booklet   = bookletOf(rg.data);
        const ResponseMatrix& responses = rg.data.responses;
        for (const DomainItems& d : booklet.itemsByDomain()) {
            Pooled& p = pooled[DomainKey{booklet.subject(), d.domain}];
            const std::vector<size_t> cols = columnsOf(responses, d.item_indices);

            const std::vector<double> means = studentMeans(responses, cols);
            p.student_means.insert(p.student_means.end(), means.begin(), means.end());
            for (size_t r = 0; r < responses.rows(); ++r)
                p.frequency += responses.rowSum(r, cols);
            for (size_t idx : d.item_indices)
                p.iqb_ids.insert(booklet.items[idx].iqb_item_id);
        }
    }

    std::vector<AggregationRecord> out;
    for (const auto& [key, p] : pooled.entries()) {
        const Summary s = summarize(p.student_means);

        Aggregation agg;
        agg.value                  = key.domain ? *key.domain : key.subject;
        agg.descriptive_statistics = DescriptiveStatistics{static_cast<int64_t>(p.iqb_ids.size()), p.frequency,
                                                           round4(s.mean), round4(s.sd)};
        agg.included_iqb_ids.assign(p.iqb_ids.begin(), p.iqb_ids.end());

        AggregationRecord rec;
        rec.id     = school_id;
        rec.name   = school_name;
        rec.domain = makeDomain(key.domain, key.subject);
        rec.aggregations.push_back(std::move(agg));
        out.push_back(std::move(rec));
    }
    return out;
}

// ─────────────────────────────────────────────────────────────────────────────
//  State scope
// ─────────────────────────────────────────────────────────────────────────────

template <typename Record, typename Fn>
static std::vector<Record> perBooklet(const std::vector<ResolvedGroup>& groups, Fn&& build) {
    std::vector<Record> out;
    for (const ResolvedGroup& rg : groups) {
        const std::string booklet_id = bookletOf(rg.data).key.toString();
        for (Record& rec : build(rg)) {
            rec.id   = booklet_id;
            rec.name = booklet_id;
            out.push_back(std::move(rec));
        }
    }
    return out;
}

std::vector<CompetenceLevelRecord> stateCompetenceLevels(const std::vector<ResolvedGroup>& groups) {
    return perBooklet<CompetenceLevelRecord>(groups, [](const ResolvedGroup& rg) {
        return groupCompetenceLevels(rg.data, rg.tables);
    });
}

std::vector<ItemRecord> stateItems(const std::vector<ResolvedGroup>& groups) {
    return perBooklet<ItemRecord>(groups, [](const ResolvedGroup& rg) { return groupItems(rg.data); });
}

std::vector<AggregationRecord> stateAggregations(const std::vector<ResolvedGroup>& groups) {
    return perBooklet<AggregationRecord>(groups, [](const ResolvedGroup& rg) { return groupAggregations(rg.data); });
}

} // namespace tba3
