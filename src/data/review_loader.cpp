#include "data/review_loader.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cmath>
#include <format>
#include <fstream>
#include <optional>
#include <set>
#include <sstream>
#include <stdexcept>
#include <unordered_map>

namespace reviewgate {

namespace {

constexpr std::array<std::string_view, 3> kCategoryBlocklist = {
    "buy a kindle",
    "amazon.co.uk",
    "mazon.co.uk",
};

// Accepts ISO-8601 dates ("2017-01-13" or "2017-01-13T00:00:00.000Z").
bool is_valid_date(std::string_view value) {
    const auto s = utils::trim(value);
    if (s.size() < 10) return false;
    for (size_t i = 0; i < 10; ++i) {
        const bool dash = (i == 4 || i == 7);
        if (dash ? s[i] != '-' : !std::isdigit(static_cast<unsigned char>(s[i]))) return false;
    }
    const auto month = utils::try_parse_int<int>(std::string_view(s).substr(5, 2));
    const auto day = utils::try_parse_int<int>(std::string_view(s).substr(8, 2));
    return month && day && *month >= 1 && *month <= 12 && *day >= 1 && *day <= 31;
}

std::optional<int> parse_rating(std::string_view value) {
    const auto s = utils::trim(value);
    if (s.empty()) return std::nullopt;
    const auto d = utils::try_parse_double(s);
    if (!d || !std::isfinite(*d) || *d < 1.0 || *d > 5.0) return std::nullopt;
    // Star ratings only; "4.0" is fine, "4.7" is not a rating this corpus uses
    if (*d != std::floor(*d)) return std::nullopt;
    return static_cast<int>(*d);
}

} // anonymous namespace

const std::vector<std::string>& ReviewLoader::expected_columns() {
    static const std::vector<std::string> kColumns = {
        "id", "asins", "brand", "categories", "colors", "dateAdded", "dateUpdated",
        "dimension", "ean", "keys", "manufacturer", "manufacturerNumber", "name",
        "prices", "reviews.date", "reviews.doRecommend", "reviews.numHelpful",
        "reviews.rating", "reviews.sourceURLs", "reviews.text", "reviews.title",
        "reviews.userCity", "reviews.userProvince", "reviews.username", "sizes",
        "upc", "weight",
    };
    return kColumns;
}

// ============================================================================
// CSV
// ============================================================================

std::vector<std::vector<std::string>> ReviewLoader::parse_csv(std::string_view content) {
    std::vector<std::vector<std::string>> records;
    std::vector<std::string> record;
    std::string field;
    bool in_quotes = false;
    bool field_started = false;

    const auto end_record = [&] {
        record.push_back(std::move(field));
        field.clear();
        const bool blank = record.size() == 1 && record.front().empty();
        if (!blank) records.push_back(std::move(record));
        record.clear();
        field_started = false;
    };

    for (size_t i = 0; i < content.size(); ++i) {
        const char c = content[i];
        if (in_quotes) {
            if (c == '"') {
                if (i + 1 < content.size() && content[i + 1] == '"') {
                    field += '"';
                    ++i;
                } else {
                    in_quotes = false;
                }
            } else {
                field += c;
            }
            continue;
        }

        switch (c) {
            case '"':
                if (!field_started) {
                    in_quotes = true;
                    field_started = true;
                } else {
                    field += c;   // Stray quote inside an unquoted field
                }
                break;
            case ',':
                record.push_back(std::move(field));
                field.clear();
                field_started = false;
                break;
            case '\r':
                if (i + 1 < content.size() && content[i + 1] == '\n') ++i;
                end_record();
                break;
            case '\n':
                end_record();
                break;
            default:
                field += c;
                field_started = true;
        }
    }

    if (in_quotes) {
        throw std::runtime_error("CSV: unterminated quoted field");
    }
    if (field_started || !field.empty() || !record.empty()) {
        end_record();
    }
    return records;
}

// ============================================================================
// Cleaning
// ============================================================================

bool ReviewLoader::is_valid_category(std::string_view category) {
    const auto c = utils::to_lower(utils::trim(category));
    if (c.empty()) return false;

    if (std::find(kCategoryBlocklist.begin(), kCategoryBlocklist.end(), c) !=
        kCategoryBlocklist.end()) {
        return false;
    }
    if (c.size() < 3) return false;

    const bool has_letter = std::any_of(c.begin(), c.end(),
        [](char ch) { return ch >= 'a' && ch <= 'z'; });
    if (!has_letter) return false;

    // URLs / domains
    if (c.find('.') != std::string::npos && c.find(' ') == std::string::npos) return false;

    return true;
}

std::vector<std::string> ReviewLoader::extract_categories(std::string_view cell) {
    std::vector<std::string> out;
    std::set<std::string> seen;
    for (const auto& part : utils::split(std::string(cell), ',')) {
        if (!is_valid_category(part)) continue;
        auto trimmed = utils::trim(part);
        if (seen.insert(trimmed).second) out.push_back(std::move(trimmed));
    }
    return out;
}

// ============================================================================
// Loading
// ============================================================================

ReviewLoader::LoadResult ReviewLoader::load_csv(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return LoadResult::error(std::format("CSV not found at: {}", path));
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return load_from_string(buffer.str());
}

ReviewLoader::LoadResult ReviewLoader::load_from_string(std::string_view content) {
    std::vector<std::vector<std::string>> records;
    try {
        records = parse_csv(content);
    } catch (const std::exception& e) {
        return LoadResult::error(e.what());
    }
    if (records.empty()) {
        return LoadResult::error("CSV is empty");
    }

    LoadResult result;
    const auto& header = records.front();
    std::unordered_map<std::string, size_t> column_index;
    for (size_t i = 0; i < header.size(); ++i) {
        column_index.emplace(utils::trim(header[i]), i);
    }

    const auto& expected = expected_columns();
    for (const auto& col : expected) {
        if (!column_index.contains(col)) result.missing_columns.push_back(col);
    }
    for (const auto& col : header) {
        const auto name = utils::trim(col);
        if (std::find(expected.begin(), expected.end(), name) == expected.end()) {
            result.extra_columns.push_back(name);
        }
    }

    for (const char* required : {"categories", "reviews.rating", "reviews.date"}) {
        if (!column_index.contains(required)) {
            return LoadResult::error(std::format("CSV missing required column '{}'", required));
        }
    }

    const auto col = [&](const std::vector<std::string>& rec, const char* name) -> std::string {
        const auto it = column_index.find(name);
        if (it == column_index.end() || it->second >= rec.size()) return {};
        return rec[it->second];
    };

    std::set<std::string> categories;
    for (size_t r = 1; r < records.size(); ++r) {
        const auto& rec = records[r];
        ++result.stats.records;

        const auto rating = parse_rating(col(rec, "reviews.rating"));
        if (!rating) {
            ++result.stats.dropped_rating;
            continue;
        }
        const auto date = col(rec, "reviews.date");
        if (!is_valid_date(date)) {
            ++result.stats.dropped_date;
            continue;
        }
        const auto cats = extract_categories(col(rec, "categories"));
        if (cats.empty()) {
            ++result.stats.dropped_no_category;
            continue;
        }

        for (const auto& category : cats) {
            ReviewRow row;
            row.review_index = r - 1;
            row.product_id = col(rec, "id");
            row.product_name = col(rec, "name");
            row.category = category;
            row.rating = *rating;
            row.title = col(rec, "reviews.title");
            row.text = col(rec, "reviews.text");
            row.date = utils::trim(date);
            result.rows.push_back(std::move(row));
            categories.insert(category);
        }
    }

    result.stats.rows = result.rows.size();
    result.stats.categories = categories.size();
    result.success = true;
    return result;
}

} // namespace reviewgate
