//
// State.hpp
//

#ifndef BINGO_STATE_HPP
#define BINGO_STATE_HPP

#include <map>
#include <optional>
#include <string>
#include <vector>
#include "Types.hpp"

namespace bingo::core
{
    struct Player
    {
        PlayerId id{};
        Card card{};
        // where this player's card message lives, edited on refresh
        Destination dest{};
        std::string name;

        auto operator==(Player const&) const -> bool = default;
    };

    // Authoritative game state. Owned by GameStore, mutated only under its lock.
    struct GameState
    {
        std::map<PlayerId, Player> players;
        std::vector<Number> called;    // call order, never duplicates
        bool active{false};
        std::optional<Number> last_called;

        auto Clear() -> void
        {
            players.clear();
            called.clear();
            active = false;
            last_called.reset();
        }

        auto Find(PlayerId const id) -> Player*
        {
            auto const it = players.find(id);
            return it != players.end() ? &it->second : nullptr;
        }

        auto operator==(GameState const&) const -> bool = default;
    };

    struct Winner
    {
        PlayerId id{};
        std::string name;

        auto operator==(Winner const&) const -> bool = default;
    };

    // Serializable snapshot. Ids are text only here.
    struct PlayerRecord
    {
        std::string id;
        Card card{};
        ChatId chat{};
        MessageId message{};
        std::string name;

        auto operator==(PlayerRecord const&) const -> bool = default;
    };

    struct StateRecord
    {
        std::vector<PlayerRecord> players;
        std::vector<Number> called;
        bool active{false};
        std::optional<Number> last_called;

        auto operator==(StateRecord const&) const -> bool = default;
    };
} // namespace bingo::core

#endif //BINGO_STATE_HPP
