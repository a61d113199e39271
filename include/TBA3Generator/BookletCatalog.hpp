#pragma once
// BookletCatalog.hpp – Read-only index of test booklets keyed by BookletKey,
// filled from semicolon-separated item metadata files.
//
// Usage example:
//   BookletCatalog catalog;
//   catalog.loadDirectory("metadata");
//   const Booklet& b = catalog.get(BookletKey::parse("V3-2024-DE-TH01"));

#include "Types.hpp"

#include <filesystem>
#include <string>
#include <unordered_map>
#include <vector>

namespace tba3 {

// Parses one item metadata CSV file into booklets, in first-seen key order.
// Throws ConfigValidationError when required columns are missing or a row
// cannot be parsed.
[[nodiscard]] std::vector<Booklet> loadBookletsFromCsv(const std::filesystem::path& csv_path);

class BookletCatalog {
public:
    // Registers a booklet. Items of an already known key are appended, not
    // deduplicated.
    void add(Booklet booklet);

    // Loads every file with the given extension in dir (sorted by file name).
    // Returns the number of files read; a missing directory logs a warning and reads none.
    size_t loadDirectory(const std::filesystem::path& dir, const std::string& extension = ".csv");

    [[nodiscard]] const Booklet* find(const BookletKey& key) const;

    // Throws NotFoundError.
    [[nodiscard]] const Booklet& get(const BookletKey& key) const;

    [[nodiscard]] size_t size() const noexcept { return booklets_.size(); }

private:
    std::unordered_map<BookletKey, Booklet> booklets_;
};

} // namespace tba3
