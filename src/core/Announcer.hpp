//
// Announcer.hpp
//

#ifndef BINGO_ANNOUNCER_HPP
#define BINGO_ANNOUNCER_HPP

#include <cstddef>
#include <memory>
#include <string>
#include <vector>
#include "Messenger.hpp"
#include "State.hpp"
#include "Types.hpp"

namespace bingo::core
{
    struct DispatchReport
    {
        size_t attempted{};
        size_t delivered{};
        size_t failed{};
    };

    // One card view to push into a player's existing card message.
    struct CardPush
    {
        Destination dest{};
        std::string text;
        Keyboard keyboard;
    };

    // Best-effort fan-out. Each delivery is an independent task; a failed one is
    // logged and counted, the rest still go out. No retries.
    class Announcer
    {
    public:
        explicit Announcer(std::shared_ptr<Messenger> messenger);

        auto Broadcast(std::vector<ChatId> const& recipients, std::string const& message) -> DispatchReport;

        auto PushCards(std::vector<CardPush> const& pushes) -> DispatchReport;

        auto Notify(ChatId chat, std::string const& message) -> bool;

        // Every joined player's chat plus every admin, each chat once.
        static auto Recipients(GameState const& state, std::vector<UserId> const& admins) -> std::vector<ChatId>;

    private:
        std::shared_ptr<Messenger> messenger_;
    };
}

#endif //BINGO_ANNOUNCER_HPP
