#ifndef FLOWBENCH_TERMINAL_HPP
#define FLOWBENCH_TERMINAL_HPP

#include <algorithm>
#include <cstddef>
#include <iomanip>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace Flowbench::Utils::Terminal {
    // ---------- Colors ----------
    namespace Colors {
        inline constexpr std::string_view kReset        = "\033[0m";
        inline constexpr std::string_view kBrightBlue   = "\033[94m";
    }

    // ---------- Symbols ----------
    namespace Symbols {
        // Heavy box drawing
        inline constexpr std::string_view kBoxTopLeft         = "┏";
        inline constexpr std::string_view kBoxTopSeparator    = "┳";
        inline constexpr std::string_view kBoxTopRight        = "┓";
        inline constexpr std::string_view kBoxMiddleLeft      = "┣";
        inline constexpr std::string_view kBoxMiddleSeparator = "╋";
        inline constexpr std::string_view kBoxMiddleRight     = "┫";
        inline constexpr std::string_view kBoxBottomLeft      = "┗";
        inline constexpr std::string_view kBoxBottomSeparator = "┻";
        inline constexpr std::string_view kBoxBottomRight     = "┛";
        inline constexpr std::string_view kBoxHorizontal      = "━";
        inline constexpr std::string_view kBoxVertical        = "┃";

        inline constexpr std::string_view kRoundedTopLeft     = "╭";
        inline constexpr std::string_view kRoundedTopRight    = "╮";
        inline constexpr std::string_view kRoundedBottomLeft  = "╰";
        inline constexpr std::string_view kRoundedBottomRight = "╯";
    }

    inline std::string Repeat(std::string_view glyph, std::size_t count) {
        std::string s; s.reserve(glyph.size() * count);
        for (std::size_t i = 0; i < count; ++i) s.append(glyph);
        return s;
    }
    inline std::string ApplyColor(std::string_view s, std::string_view color) {
        if (color.empty()) return std::string(s);
        std::string out; out.reserve(color.size() + s.size() + Colors::kReset.size());
        out.append(color).append(s).append(Colors::kReset);
        return out;
    }

    enum class FrameStyle { Rounded, Box };
    enum class HSepKind { Top, Middle, Bottom };

    // spacings = widths of each segment between vertical junctions.
    inline std::string HSeparator(const std::vector<std::size_t>& spacings,
                                  std::string_view color,
                                  FrameStyle style,
                                  HSepKind kind) {
        using namespace Symbols;

        std::string_view left;
        std::string_view midJunction;
        std::string_view right;
        switch (kind) {
            case HSepKind::Top:
                left  = (style == FrameStyle::Rounded) ? kRoundedTopLeft : kBoxTopLeft;
                midJunction = kBoxTopSeparator;
                right = (style == FrameStyle::Rounded) ? kRoundedTopRight : kBoxTopRight;
                break;
            case HSepKind::Middle:
                left  = kBoxMiddleLeft;
                midJunction = kBoxMiddleSeparator;
                right = kBoxMiddleRight;
                break;
            case HSepKind::Bottom:
                left  = (style == FrameStyle::Rounded) ? kRoundedBottomLeft : kBoxBottomLeft;
                midJunction = kBoxBottomSeparator;
                right = (style == FrameStyle::Rounded) ? kRoundedBottomRight : kBoxBottomRight;
                break;
        }

        std::string out;
        out.append(left);
        for (std::size_t i = 0; i < spacings.size(); ++i) {
            out.append(Repeat(kBoxHorizontal, spacings[i]));
            if (i + 1 < spacings.size()) out.append(midJunction);
        }
        out.append(right);
        return ApplyColor(out, color);
    }

    inline std::string HTop(const std::vector<std::size_t>& spacings, std::string_view color, FrameStyle style) {
        return HSeparator(spacings, color, style, HSepKind::Top);
    }
    inline std::string HMid(const std::vector<std::size_t>& spacings, std::string_view color) {
        return HSeparator(spacings, color, FrameStyle::Box, HSepKind::Middle);
    }
    inline std::string HBottom(const std::vector<std::size_t>& spacings, std::string_view color,
                               FrameStyle style = FrameStyle::Box) {
        return HSeparator(spacings, color, style, HSepKind::Bottom);
    }

    // One framed row; the first cell is left aligned, the others right aligned.
    inline std::string Row(const std::vector<std::string>& cells, const std::vector<std::size_t>& widths) {
        std::ostringstream row;
        row << std::setfill(' ') << Symbols::kBoxVertical;
        for (std::size_t i = 0; i < cells.size() && i < widths.size(); ++i) {
            row << ' ';
            if (i == 0) row << std::left; else row << std::right;
            row << std::setw(static_cast<int>(widths[i])) << cells[i];
            row << ' ' << Symbols::kBoxVertical;
        }
        return row.str();
    }

    // Column widths wide enough for every row.
    inline std::vector<std::size_t> ColumnWidths(const std::vector<std::vector<std::string>>& rows) {
        std::vector<std::size_t> widths;
        for (const auto& row : rows) {
            if (widths.size() < row.size()) widths.resize(row.size(), 0);
            for (std::size_t i = 0; i < row.size(); ++i) widths[i] = std::max(widths[i], row[i].size());
        }
        return widths;
    }
}

#endif // FLOWBENCH_TERMINAL_HPP
