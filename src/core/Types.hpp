//
// Types.hpp
//

#ifndef BINGO_TYPES_HPP
#define BINGO_TYPES_HPP

#define BINGO_ENABLE_TEST_HOOKS true

#include <cstdint>
#include <compare>
#include <optional>
#include <string>
#include <vector>
#include <array>
#include <random>

namespace bingo::core::constants
{
    inline constexpr size_t GridSize = 5;
    inline constexpr size_t Center = 2;
    inline constexpr size_t LineCount = 12;
    // house rule: two complete lines, not one
    inline constexpr size_t WinLineThreshold = 2;

    inline constexpr uint8_t BandWidth = 15;
    inline constexpr uint8_t MaxNumber = 75;
    inline constexpr size_t RecentCallsShown = 5;
}

namespace bingo::core
{
    using Number = uint8_t;
    using ChatId = int64_t;
    using MessageId = int64_t;

    enum class CellKind : uint8_t
    {
        Number = 0,
        Free,
        Marked
    };

    struct Cell
    {
        CellKind kind{CellKind::Number};
        // kept after marking so a snapshot loses nothing; 0 for the FREE cell
        Number number{};

        [[nodiscard]]
        auto Covered() const noexcept -> bool { return kind != CellKind::Number; }

        auto operator==(Cell const&) const -> bool = default;
    };

    // row-major, [row][col]
    using Row = std::array<Cell, constants::GridSize>;
    using Card = std::array<Row, constants::GridSize>;

    struct PlayerId
    {
        int64_t value{};

        auto operator<=>(PlayerId const&) const = default;
    };
    // the caller of an action is identified the same way as a joined player
    using UserId = PlayerId;

    struct Destination
    {
        ChatId chat{};
        MessageId message{};

        auto operator==(Destination const&) const -> bool = default;
    };

    struct Button
    {
        std::string label;
        std::string data;
    };
    using Keyboard = std::vector<std::vector<Button>>;

    struct Config
    {
        std::vector<UserId> admins;
        uint64_t seed{std::random_device{}()};
    };

    inline auto IsAdmin(std::vector<UserId> const& admins, UserId const user) -> bool
    {
        for (UserId const& a : admins)
        {
            if (a == user) return true;
        }
        return false;
    }
}

#endif //BINGO_TYPES_HPP
