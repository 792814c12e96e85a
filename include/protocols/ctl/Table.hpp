#pragma once

#include <algorithm>
#include <cstddef>
#include <iterator>
#include <string>
#include <vector>
#include <fmt/format.h>

namespace usd::ctl {

enum class Align { Left, Right };

struct Column {
    std::string header;
    Align align = Align::Left;
    std::size_t max = 48;  // longer cells are clipped with "..."
};

class Table {
public:
    explicit Table(std::vector<Column> cols) : cols_(std::move(cols)) {}

    void add_row(std::vector<std::string> cells) {
        cells.resize(cols_.size());
        rows_.push_back(std::move(cells));
    }

    [[nodiscard]] bool empty() const noexcept { return rows_.empty(); }

    [[nodiscard]] std::string render() const {
        std::vector<std::size_t> width(cols_.size());
        for (std::size_t i = 0; i < cols_.size(); ++i) {
            width[i] = cols_[i].header.size();
            for (const auto& r : rows_) width[i] = std::max(width[i], std::min(cols_[i].max, r[i].size()));
        }

        std::string out;
        emit(out, width, [this](const std::size_t i) { return cols_[i].header; });
        emit(out, width, [&width](const std::size_t i) { return std::string(width[i], '-'); });
        for (const auto& r : rows_) emit(out, width, [&](const std::size_t i) { return clip(r[i], width[i]); });
        return out;
    }

private:
    std::vector<Column> cols_;
    std::vector<std::vector<std::string>> rows_;

    static std::string clip(const std::string& s, const std::size_t w) {
        if (s.size() <= w) return s;
        if (w <= 3) return s.substr(0, w);
        return s.substr(0, w - 3) + "...";
    }

    template<typename CellFn>
    void emit(std::string& out, const std::vector<std::size_t>& width, CellFn&& cell) const {
        for (std::size_t i = 0; i < cols_.size(); ++i) {
            if (i) out += "  ";
            const auto text = cell(i);
            if (cols_[i].align == Align::Left && i + 1 == cols_.size()) out += text;  // no trailing pad
            else if (cols_[i].align == Align::Left) fmt::format_to(std::back_inserter(out), "{:<{}}", text, width[i]);
            else fmt::format_to(std::back_inserter(out), "{:>{}}", text, width[i]);
        }
        out += '\n';
    }
};

}
