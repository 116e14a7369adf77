//
// Render.hpp
//

#ifndef BINGO_RENDER_HPP
#define BINGO_RENDER_HPP

#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>
#include "Types.hpp"
#include "State.hpp"

namespace bingo::core::render
{
    inline constexpr std::string_view MarkGlyph = "✅";
    inline constexpr std::string_view FreeGlyph = "🆓";
    inline constexpr std::string_view ColumnHeader = "🇧 🇮 🇳 🇬 🇴";

    // "B".."O" for 1..75, "?" otherwise
    auto GetBingoLetter(int number) -> std::string_view;

    // "I-16"
    auto FormatCall(Number number) -> std::string;

    // "B-3, I-16, ..."
    auto FormatCallList(std::span<Number const> numbers) -> std::string;

    auto CellText(Cell const& cell) -> std::string;

    // Header with the last call (when any), the column line and 5 rows.
    auto RenderCard(Card const& card, std::optional<Number> last_called) -> std::string;

    // 5x5 inline buttons, callback "mark_<row>_<col>"
    auto CardKeyboard(Card const& card) -> Keyboard;

    auto MainMenu(bool is_admin) -> Keyboard;

    auto CallAnnouncement(Number number, std::span<Winner const> winners) -> std::string;

    auto MarkAnnouncement(std::optional<Number> last_called, std::span<Winner const> winners) -> std::string;

    auto PrivateWinNotice(size_t lines) -> std::string;
}

#endif //BINGO_RENDER_HPP
