//
// Render.cpp
//
#include "Render.hpp"

#include <format>

namespace bingo::core::render
{
    namespace
    {
        auto WinnerLines(std::span<Winner const> winners) -> std::string
        {
            std::string body;
            for (size_t i{}; i < winners.size(); ++i)
            {
                body += (i ? "\n" : "");
                body += std::format("- {}", winners[i].name);
            }
            return body;
        }
    }

    auto GetBingoLetter(int const number) -> std::string_view
    {
        if (number >= 1 && number <= 15) return "B";
        if (number >= 16 && number <= 30) return "I";
        if (number >= 31 && number <= 45) return "N";
        if (number >= 46 && number <= 60) return "G";
        if (number >= 61 && number <= 75) return "O";
        return "?";
    }

    auto FormatCall(Number const number) -> std::string
    {
        return std::format("{}-{}", GetBingoLetter(number), number);
    }

    auto FormatCallList(std::span<Number const> numbers) -> std::string
    {
        std::string out;
        for (size_t i{}; i < numbers.size(); ++i)
        {
            out += (i ? ", " : "");
            out += FormatCall(numbers[i]);
        }
        return out;
    }

    auto CellText(Cell const& cell) -> std::string
    {
        switch (cell.kind)
        {
        case CellKind::Marked: return std::string{MarkGlyph};
        case CellKind::Free: return std::string{FreeGlyph};
        case CellKind::Number: return std::format("{:>2}", cell.number);
        }
        return "??";
    }

    auto RenderCard(Card const& card, std::optional<Number> const last_called) -> std::string
    {
        std::string out;
        if (last_called)
        {
            out += std::format("🎯 Last number: <b>{}</b>\n", FormatCall(*last_called));
        }
        out += ColumnHeader;
        for (Row const& row : card)
        {
            out += "\n";
            for (size_t c{}; c < row.size(); ++c)
            {
                out += (c ? "  " : "");
                out += CellText(row[c]);
            }
        }
        return out;
    }

    auto CardKeyboard(Card const& card) -> Keyboard
    {
        Keyboard kb;
        kb.reserve(constants::GridSize);
        for (size_t r{}; r < constants::GridSize; ++r)
        {
            std::vector<Button> row;
            row.reserve(constants::GridSize);
            for (size_t c{}; c < constants::GridSize; ++c)
            {
                Cell const& cell = card[r][c];
                std::string label = cell.Covered() ? CellText(cell) : std::format("{}", cell.number);
                row.push_back(Button{std::move(label), std::format("mark_{}_{}", r, c)});
            }
            kb.push_back(std::move(row));
        }
        return kb;
    }

    auto MainMenu(bool const is_admin) -> Keyboard
    {
        Keyboard kb{
            {Button{"🎮 Join Game", "join"}},
            {Button{"🎲 View Called Numbers", "called_numbers"}, Button{"🕔 Last 5 Numbers", "last_five"}},
            {Button{"🃏 Show My Card", "show_card"}},
        };
        if (is_admin)
        {
            kb.push_back({Button{"📢 Call Number", "call"}, Button{"🔁 Reset Game", "admin_reset"}});
        }
        return kb;
    }

    auto CallAnnouncement(Number const number, std::span<Winner const> winners) -> std::string
    {
        return std::format("🎉 BINGO!\nLast number: <b>{}</b>\n\nWinners:\n{}",
                           FormatCall(number), WinnerLines(winners));
    }

    auto MarkAnnouncement(std::optional<Number> const last_called, std::span<Winner const> winners) -> std::string
    {
        std::string const number_text = last_called ? FormatCall(*last_called) : std::string{"N/A"};
        return std::format("🎉 BINGO!\nWinners for number <b>{}</b>:\n{}", number_text, WinnerLines(winners));
    }

    auto PrivateWinNotice(size_t const lines) -> std::string
    {
        return std::format("🏆 You got BINGO! ({} lines)", lines);
    }
}
