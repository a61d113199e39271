// BookletCatalog.cpp – Item metadata CSV loader and the booklet index.
// CSV parsing is delegated to rapidcsv; this file maps columns to Items.
//
// Expected layout (one row per item, ';' separated, header row):
//   vera;tjahr;fach;iqbtestheft_id;iqbitem_id;name;kstufe;itemnr_th;itemord_th;
//   logit;bista;domain;lh_gs;lh_gy;lh_ng;kompstd1..3;K1..K6;A1..A5;L1..L5;AFB;…
// Decimal numbers may use ',' as separator. Empty cells are missing values.
// Files are ISO-8859-1 (latin1); cell text is converted to UTF-8 on read.

#include "TBA3Generator/BookletCatalog.hpp"
#include "TBA3Generator/Errors.hpp"
#include "TBA3Generator/Log.hpp"

#include <rapidcsv.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <optional>

namespace tba3 {

namespace fs = std::filesystem;

// ─── Cell helpers ─────────────────────────────────────────────────────────────

namespace {

constexpr std::array<const char*, 8> kRequiredColumns = {
    "vera", "tjahr", "fach", "iqbtestheft_id", "iqbitem_id", "name", "kstufe", "itemnr_th",
};

std::string trim(const std::string& s) {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return {};
    const auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string latin1ToUtf8(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (unsigned char c : s) {
        if (c < 0x80) {
            out += static_cast<char>(c);
        } else {
            out += static_cast<char>(0xC0 | (c >> 6));
            out += static_cast<char>(0x80 | (c & 0x3F));
        }
    }
    return out;
}

// One parsed row with name-based access; short rows read as empty cells.
class CsvRow {
public:
    CsvRow(const std::vector<std::string>& columns, std::vector<std::string> cells,
           const std::string& ctx)
        : columns_(columns), cells_(std::move(cells)), ctx_(ctx) {}

    [[nodiscard]] bool has(const std::string& col) const {
        return std::find(columns_.begin(), columns_.end(), col) != columns_.end();
    }

    [[nodiscard]] std::optional<std::string> str(const std::string& col) const {
        auto it = std::find(columns_.begin(), columns_.end(), col);
        if (it == columns_.end()) return std::nullopt;
        const size_t idx = static_cast<size_t>(it - columns_.begin());
        if (idx >= cells_.size()) return std::nullopt;
        std::string v = trim(latin1ToUtf8(cells_[idx]));
        if (v.empty()) return std::nullopt;
        return v;
    }

    [[nodiscard]] std::string required(const std::string& col) const {
        auto v = str(col);
        if (!v)
            throw ConfigValidationError(ctx_ + ": empty value in required column '" + col + "'");
        return *v;
    }

    [[nodiscard]] std::optional<double> number(const std::string& col) const {
        auto v = str(col);
        if (!v) return std::nullopt;
        std::string s = *v;
        std::replace(s.begin(), s.end(), ',', '.');
        char* end = nullptr;
        const double d = std::strtod(s.c_str(), &end);
        if (end == s.c_str() || *end != '\0')
            throw ConfigValidationError(ctx_ + ": cannot parse number '" + *v + "' in column '" + col + "'");
        return d;
    }

    [[nodiscard]] int integer(const std::string& col) const {
        auto d = number(col);
        if (!d || std::floor(*d) != *d)
            throw ConfigValidationError(ctx_ + ": column '" + col + "' must hold an integer");
        return static_cast<int>(*d);
    }

    // "1" (or numeric 1) is set; empty / anything else is unset.
    [[nodiscard]] bool flag(const std::string& col) const {
        auto v = str(col);
        if (!v) return false;
        if (*v == "1") return true;
        std::string s = *v;
        std::replace(s.begin(), s.end(), ',', '.');
        char* end = nullptr;
        const double d = std::strtod(s.c_str(), &end);
        return end != s.c_str() && *end == '\0' && d == 1.0;
    }

private:
    const std::vector<std::string>& columns_;
    std::vector<std::string>        cells_;
    const std::string&              ctx_;
};

std::vector<std::string> collectFlags(const CsvRow& row, std::initializer_list<const char*> cols) {
    std::vector<std::string> out;
    for (const char* c : cols) {
        if (row.has(c) && row.flag(c)) out.emplace_back(c);
    }
    return out;
}

// Reading/listening style flags; the source data spells "detailliert" both ways.
std::optional<std::string> readingStyle(const CsvRow& row) {
    static const std::array<std::pair<const char*, const char*>, 5> kStyles = {{
        {"selektiv", "selektiv"},
        {"detailliert", "detailliert"},
        {"detailiert", "detailliert"},
        {"inferierend", "inferierend"},
        {"global", "global"},
    }};
    for (const auto& [col, canonical] : kStyles) {
        if (row.has(col) && row.flag(col)) return std::string(canonical);
    }
    return std::nullopt;
}

Item parseItem(const CsvRow& row) {
    Item item;
    item.iqb_item_id        = row.required("iqbitem_id");
    item.name               = row.str("name").value_or("");
    item.logit              = row.number("logit").value_or(0.0);
    item.bista              = row.number("bista").value_or(0.0);
    item.competence_level   = row.str("kstufe").value_or("");
    item.domain             = row.str("domain");
    item.item_nr_booklet    = row.str("itemnr_th").value_or("");
    item.item_order_booklet = row.number("itemord_th").value_or(0.0);

    item.solution_freq_primary_school = row.number("lh_gs");
    item.solution_freq_gymnasium      = row.number("lh_gy");
    item.solution_freq_non_gymnasium  = row.number("lh_ng");

    for (const char* col : {"kompstd1", "kompstd2", "kompstd3"}) {
        if (auto v = row.str(col)) item.competence_standard.push_back(*v);
    }
    item.listening_or_reading_style = readingStyle(row);
    item.general_mathematical_competence =
        collectFlags(row, {"K1", "K2", "K3", "K4", "K5", "K6", "A1", "A2", "A3", "A4", "A5"});
    item.core_idea = collectFlags(row, {"L1", "L2", "L3", "L4", "L5"});
    if (auto afb = row.number("AFB"))
        item.cognitive_demand_level = std::to_string(static_cast<int>(*afb));

    return item;
}

} // namespace

// ─── Public loader ────────────────────────────────────────────────────────────

std::vector<Booklet> loadBookletsFromCsv(const fs::path& csv_path) {
    const std::string ctx = csv_path.string();

    rapidcsv::Document doc;
    try {
        doc.Load(csv_path.string(), rapidcsv::LabelParams(0, -1), rapidcsv::SeparatorParams(';', true));
    } catch (const std::exception& e) {
        throw ConfigValidationError("Failed to read CSV '" + ctx + "': " + e.what());
    }

    std::vector<std::string> columns = doc.GetColumnNames();
    for (auto& c : columns) c = trim(c);

    std::vector<std::string> missing;
    for (const char* req : kRequiredColumns) {
        if (std::find(columns.begin(), columns.end(), req) == columns.end())
            missing.emplace_back(req);
    }
    if (!missing.empty()) {
        std::string list;
        for (const auto& m : missing) list += (list.empty() ? "" : ", ") + m;
        throw ConfigValidationError("CSV '" + ctx + "' missing required column(s): " + list);
    }

    const bool has_model = std::find(columns.begin(), columns.end(), "model") != columns.end();

    std::vector<Booklet> booklets;
    const size_t rows = doc.GetRowCount();
    for (size_t r = 0; r < rows; ++r) {
        const std::string row_ctx = ctx + " row " + std::to_string(r + 2);
        CsvRow row(columns, doc.GetRow<std::string>(r), row_ctx);

        // Rows of non-global models duplicate the global ones
        if (has_model) {
            auto model = row.str("model");
            if (model && *model != "global") continue;
        }

        BookletKey key;
        key.level      = row.integer("vera");
        key.year       = row.integer("tjahr");
        key.subject    = lower(row.required("fach"));
        key.booklet_id = row.required("iqbtestheft_id");

        auto it = std::find_if(booklets.begin(), booklets.end(),
                               [&](const Booklet& b) { return b.key == key; });
        if (it == booklets.end()) {
            booklets.push_back(Booklet{key, {}});
            it = std::prev(booklets.end());
        }
        it->items.push_back(parseItem(row));
    }

    return booklets;
}

// ─── BookletCatalog ───────────────────────────────────────────────────────────

void BookletCatalog::add(Booklet booklet) {
    auto it = booklets_.find(booklet.key);
    if (it == booklets_.end()) {
        BookletKey key = booklet.key;
        booklets_.emplace(std::move(key), std::move(booklet));
        return;
    }
    auto& items = it->second.items;
    items.insert(items.end(),
                 std::make_move_iterator(booklet.items.begin()),
                 std::make_move_iterator(booklet.items.end()));
}

size_t BookletCatalog::loadDirectory(const fs::path& dir, const std::string& extension) {
    if (!fs::is_directory(dir)) {
        logWarn("Metadata directory not found: " + dir.string());
        return 0;
    }

    std::vector<fs::path> files;
    for (const auto& entry : fs::directory_iterator(dir)) {
        if (entry.is_regular_file() && entry.path().extension() == extension)
            files.push_back(entry.path());
    }
    std::sort(files.begin(), files.end());

    for (const auto& f : files) {
        std::vector<Booklet> loaded = loadBookletsFromCsv(f);
        logDebug("Read " + std::to_string(loaded.size()) + " booklet(s) from " + f.string());
        for (auto& b : loaded) add(std::move(b));
    }

    logInfo("Loaded " + std::to_string(booklets_.size()) + " booklets from " + dir.string());
    return files.size();
}

const Booklet* BookletCatalog::find(const BookletKey& key) const {
    auto it = booklets_.find(key);
    return it == booklets_.end() ? nullptr : &it->second;
}

const Booklet& BookletCatalog::get(const BookletKey& key) const {
    const Booklet* b = find(key);
    if (b == nullptr)
        throw NotFoundError("Booklet not found: " + key.toString());
    return *b;
}

} // namespace tba3
