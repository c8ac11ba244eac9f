#pragma once

/**
 * @file AsciiTable.hpp
 * @brief Box-drawn text tables for console reports
 */

#include <bioslurry/io/Console.hpp>

#include <algorithm>
#include <sstream>
#include <string>
#include <vector>

namespace bioslurry {

/**
 * @brief Text table with box-drawing borders
 *
 * Example output:
 * ┌──────────┬──────────────┬──────────┐
 * │ Day      │ C_G_aq (mg/L)│ Removal  │
 * ├──────────┼──────────────┼──────────┤
 * │      0.0 │       100.00 │      0.0 │
 * │      2.0 │        31.84 │     49.3 │
 * └──────────┴──────────────┴──────────┘
 */
class AsciiTable {
  public:
    enum class Align { Left, Right, Center };

    struct Column {
        std::string header;
        std::size_t width = 0; ///< 0 = fit header and data
        Align align = Align::Left;
    };

    void AddColumn(const std::string &header, std::size_t width = 0, Align align = Align::Left) {
        columns_.push_back(Column{header, width, align});
    }

    /// Missing trailing cells render blank; extra cells are ignored
    void AddRow(std::vector<std::string> cells) { rows_.push_back(std::move(cells)); }

    [[nodiscard]] std::size_t ColumnCount() const { return columns_.size(); }
    [[nodiscard]] std::size_t RowCount() const { return rows_.size(); }

    [[nodiscard]] std::string Render() const {
        if (columns_.empty()) {
            return "";
        }

        const std::vector<std::size_t> widths = Widths();

        std::vector<std::string> headers;
        headers.reserve(columns_.size());
        for (const auto &col : columns_) {
            headers.push_back(col.header);
        }

        std::ostringstream oss;
        oss << Rule(widths, BoxChars::TopLeft, BoxChars::TeeDown, BoxChars::TopRight) << "\n";
        oss << Row(headers, widths, true) << "\n";
        oss << Rule(widths, BoxChars::TeeRight, BoxChars::Cross, BoxChars::TeeLeft) << "\n";
        for (const auto &row : rows_) {
            oss << Row(row, widths, false) << "\n";
        }
        oss << Rule(widths, BoxChars::BottomLeft, BoxChars::TeeUp, BoxChars::BottomRight) << "\n";
        return oss.str();
    }

    void ClearRows() { rows_.clear(); }

  private:
    std::vector<Column> columns_;
    std::vector<std::vector<std::string>> rows_;

    [[nodiscard]] std::vector<std::size_t> Widths() const {
        std::vector<std::size_t> widths;
        widths.reserve(columns_.size());
        for (std::size_t i = 0; i < columns_.size(); ++i) {
            std::size_t width = columns_[i].width;
            if (width == 0) {
                width = DisplayWidth(columns_[i].header);
                for (const auto &row : rows_) {
                    if (i < row.size()) {
                        width = std::max(width, DisplayWidth(row[i]));
                    }
                }
            }
            widths.push_back(width);
        }
        return widths;
    }

    [[nodiscard]] static std::string Rule(const std::vector<std::size_t> &widths, const char *left,
                                          const char *junction, const char *right) {
        std::string line = left;
        for (std::size_t i = 0; i < widths.size(); ++i) {
            for (std::size_t j = 0; j < widths[i] + 2; ++j) {
                line += BoxChars::Horizontal;
            }
            line += (i + 1 < widths.size()) ? junction : right;
        }
        return line;
    }

    /// Headers are always left-aligned
    [[nodiscard]] std::string Row(const std::vector<std::string> &cells,
                                  const std::vector<std::size_t> &widths, bool header) const {
        std::string line = BoxChars::Vertical;
        for (std::size_t i = 0; i < widths.size(); ++i) {
            const std::string cell = (i < cells.size()) ? cells[i] : "";
            const Align align = header ? Align::Left : columns_[i].align;
            line += " " + AlignCell(cell, widths[i], align) + " " + BoxChars::Vertical;
        }
        return line;
    }

    /// Width in UTF-8 codepoints
    [[nodiscard]] static std::size_t DisplayWidth(const std::string &text) {
        return static_cast<std::size_t>(std::count_if(text.begin(), text.end(), [](char ch) {
            return (static_cast<unsigned char>(ch) & 0xC0) != 0x80;
        }));
    }

    [[nodiscard]] static std::string AlignCell(const std::string &text, std::size_t width,
                                               Align align) {
        const std::size_t display_width = DisplayWidth(text);
        if (display_width >= width) {
            return text;
        }
        const std::size_t padding = width - display_width;
        switch (align) {
        case Align::Left:
            return text + std::string(padding, ' ');
        case Align::Right:
            return std::string(padding, ' ') + text;
        case Align::Center:
            return std::string(padding / 2, ' ') + text + std::string(padding - padding / 2, ' ');
        }
        return text;
    }
};

} // namespace bioslurry
