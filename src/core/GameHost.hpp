//
// GameHost.hpp
//

#ifndef BINGO_GAMEHOST_HPP
#define BINGO_GAMEHOST_HPP

#include <memory>
#include <random>
#include <string>
#include <vector>
#include "Announcer.hpp"
#include "CallEngine.hpp"
#include "Exception.hpp"
#include "GameStore.hpp"
#include "Messenger.hpp"
#include "Types.hpp"

namespace bingo::core
{
    // What goes back to the user who triggered an action. Empty text means nothing to send.
    struct Reply
    {
        std::string text;
        Keyboard keyboard;
        // short transient notice rather than a chat message
        bool notice{false};

        [[nodiscard]]
        auto Empty() const noexcept -> bool { return text.empty(); }
    };

    auto RejectionReply(error::Rejection const& r) -> Reply;

    // Coordinates one game: each action takes the store lock for its whole
    // read-evaluate-write sequence, persists at the mutation boundaries
    // (join, call, start, reset, winning mark) and only delivers after unlocking.
    class GameHost
    {
    public:
        GameHost(Config const& cfg,
                 std::shared_ptr<GameStore> store,
                 std::shared_ptr<Messenger> messenger);

        auto Menu(UserId user) const -> Reply;

        // admin
        auto StartNewGame(UserId caller) -> Reply;
        auto Reset(UserId caller) -> Reply;
        auto CallNext(UserId caller) -> Reply;

        // players
        auto Join(UserId user, ChatId chat, std::string name) -> Reply;
        auto Mark(UserId user, size_t row, size_t col) -> Reply;
        auto ViewCalled(UserId user) -> Reply;
        auto ViewLastCalled(UserId user, size_t n = constants::RecentCallsShown) -> Reply;
        auto ShowCard(UserId user, ChatId chat) -> Reply;

        auto IsAdmin(UserId user) const -> bool { return core::IsAdmin(admins_, user); }

    private:
        std::vector<UserId> admins_;
        std::shared_ptr<GameStore> store_;
        std::shared_ptr<Messenger> messenger_;
        Announcer announcer_;
        CallEngine calls_;
        std::mt19937_64 card_rng_;
    };
}

#endif //BINGO_GAMEHOST_HPP
