#pragma once

#include "data/review_source.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace reviewgate {

/**
 * @brief Loads and cleans the product-review CSV (Datafiniti layout)
 *
 * Cleaning rules:
 * - rating must parse as a whole number in [1, 5] ("4.0" is accepted,
 *   "4.7" is dropped)
 * - rows without a rating or without a parseable review date are dropped
 * - the categories cell is split on ',' and each entry trimmed; entries
 *   that are blocklisted, shorter than 3 chars, letterless or domain-like
 *   are discarded
 * - one ReviewRow per (review, surviving category)
 */
class ReviewLoader {
public:
    struct LoadStats {
        size_t records = 0;
        size_t dropped_rating = 0;
        size_t dropped_date = 0;
        size_t dropped_no_category = 0;
        size_t rows = 0;
        size_t categories = 0;
    };

    struct LoadResult {
        bool success = false;
        std::string error_message;
        std::vector<ReviewRow> rows;
        std::vector<std::string> missing_columns;
        std::vector<std::string> extra_columns;
        LoadStats stats;

        static LoadResult error(std::string message) {
            LoadResult result;
            result.success = false;
            result.error_message = std::move(message);
            return result;
        }
    };

    /// Columns of the Datafiniti product-review export, in file order.
    [[nodiscard]] static const std::vector<std::string>& expected_columns();

    [[nodiscard]] static LoadResult load_csv(const std::string& path);
    [[nodiscard]] static LoadResult load_from_string(std::string_view content);

    [[nodiscard]] static bool is_valid_category(std::string_view category);
    [[nodiscard]] static std::vector<std::string> extract_categories(std::string_view cell);

    /**
     * @brief RFC-4180 CSV tokenizer
     *
     * Quoted fields may contain commas, CR/LF and doubled quotes. Blank
     * lines are skipped.
     * @throws std::runtime_error on an unterminated quoted field
     */
    [[nodiscard]] static std::vector<std::vector<std::string>> parse_csv(std::string_view content);
};

} // namespace reviewgate
