//
// GameHost.cpp
//
#include "GameHost.hpp"

#include <algorithm>
#include <cstdio>
#include <format>
#include <optional>
#include <print>
#include <span>
#include <utility>

#include "CardGenerator.hpp"
#include "MarkHandler.hpp"
#include "Render.hpp"

namespace bingo::core
{
    auto RejectionReply(error::Rejection const& r) -> Reply
    {
        return Reply{std::string{error::user_text(r.code)}, {}, true};
    }

    GameHost::GameHost(Config const& cfg,
                       std::shared_ptr<GameStore> store,
                       std::shared_ptr<Messenger> messenger) :
        admins_(cfg.admins),
        store_(std::move(store)),
        messenger_(std::move(messenger)),
        announcer_(messenger_),
        calls_(cfg.admins, cfg.seed),
        // distinct stream from the caller's draws
        card_rng_{cfg.seed ^ 0x9E3779B97F4A7C15ULL}
    {
        BINGO_ASSERT(store_ != nullptr, "GameHost needs a store");
    }

    auto GameHost::Menu(UserId const user) const -> Reply
    {
        return Reply{"🎉 Welcome to Bingo! Click to join or manage the game.", render::MainMenu(IsAdmin(user))};
    }

    auto GameHost::StartNewGame(UserId const caller) -> Reply
    {
        if (!IsAdmin(caller))
            return RejectionReply(error::Rejection{.code = error::RejectionCode::NotAdmin}.with_user(caller));

        auto lock = store_->Lock();
        GameState& state = store_->State();
        state.Clear();
        state.active = true;
        store_->Persist();
        std::print("[Host] New game started by {}\n", caller.value);
        return Reply{"🎮 New Bingo game started! Join using the menu."};
    }

    auto GameHost::Reset(UserId const caller) -> Reply
    {
        if (!IsAdmin(caller))
            return RejectionReply(error::Rejection{.code = error::RejectionCode::NotAdmin}.with_user(caller));

        auto lock = store_->Lock();
        store_->State().Clear();
        store_->Persist();
        std::print("[Host] Game state reset by {}\n", caller.value);
        return Reply{"🔁 Game reset."};
    }

    auto GameHost::CallNext(UserId const caller) -> Reply
    {
        CallResult result{};
        std::vector<ChatId> recipients;
        std::string announcement;
        std::vector<CardPush> pushes;
        {
            auto lock = store_->Lock();
            GameState& state = store_->State();

            auto called = calls_.CallNext(state, caller);
            if (!called.has_value())
            {
                return RejectionReply(called.error());
            }
            result = std::move(*called);
            store_->Persist();

            if (result.RoundEnded())
            {
                recipients = Announcer::Recipients(state, admins_);
                announcement = render::CallAnnouncement(result.number, result.winners);
            }
            else
            {
                pushes.reserve(state.players.size());
                for (auto const& [id, player] : state.players)
                {
                    pushes.push_back(CardPush{
                        player.dest,
                        render::RenderCard(player.card, state.last_called),
                        render::CardKeyboard(player.card)
                    });
                }
            }
        }

        if (result.RoundEnded())
        {
            announcer_.Broadcast(recipients, announcement);
            std::print("[Host] Called {}. Round won by {} player(s).\n",
                       render::FormatCall(result.number), result.winners.size());
        }
        else
        {
            DispatchReport const rep = announcer_.PushCards(pushes);
            std::print("[Host] Called {}. Updated {} card(s), {} auto-marked.\n",
                       render::FormatCall(result.number), rep.delivered, result.auto_marked.size());
        }
        return Reply{std::format("📢 Called <b>{}</b>", render::FormatCall(result.number))};
    }

    auto GameHost::Join(UserId const user, ChatId const chat, std::string name) -> Reply
    {
        auto lock = store_->Lock();
        GameState& state = store_->State();

        if (!state.active)
            return RejectionReply(error::Rejection{.code = error::RejectionCode::GameInactive}.with_user(user));
        if (state.Find(user))
            return RejectionReply(error::Rejection{.code = error::RejectionCode::AlreadyJoined}.with_user(user));

        Card const card = GenerateCard(card_rng_);

        // the card message handle belongs to the record, so it is sent before committing
        std::optional<MessageId> sent;
        try
        {
            sent = messenger_->SendText(chat, render::RenderCard(card, state.last_called), render::CardKeyboard(card));
        }
        catch (std::exception const& e)
        {
            std::print(stderr, "[Host] Card delivery to chat {} failed: {}\n", chat, e.what());
        }
        if (!sent)
        {
            return Reply{"⚠️ Could not deliver your card, please try again.", {}, true};
        }

        if (name.empty()) name = std::to_string(user.value);
        state.players.emplace(user, Player{user, card, Destination{chat, *sent}, std::move(name)});
        store_->Persist();
        std::print("[Host] Player {} joined ({} total)\n", user.value, state.players.size());
        return Reply{"🎟️ You’ve joined the game!"};
    }

    auto GameHost::Mark(UserId const user, size_t const row, size_t const col) -> Reply
    {
        MarkResult result{};
        CardPush own{};
        std::vector<ChatId> recipients;
        std::string announcement;
        {
            auto lock = store_->Lock();
            GameState& state = store_->State();

            auto marked = ApplyMark(state, user, row, col);
            if (!marked.has_value())
            {
                return RejectionReply(marked.error());
            }
            result = std::move(*marked);

            Player const& p = state.players.at(user);
            own.dest = p.dest;
            own.text = render::RenderCard(p.card, state.last_called);
            if (!result.won)
            {
                // hot path: no persistence, no broadcast
                own.keyboard = render::CardKeyboard(p.card);
            }
            else
            {
                store_->Persist();
                recipients = Announcer::Recipients(state, admins_);
                announcement = render::MarkAnnouncement(result.tag, result.winners);
            }
        }

        announcer_.PushCards({own});
        if (result.won)
        {
            announcer_.Notify(own.dest.chat, render::PrivateWinNotice(result.lines));
            announcer_.Broadcast(recipients, announcement);
            std::print("[Host] Player {} completed {} lines; {} winner(s) announced.\n",
                       user.value, result.lines, result.winners.size());
        }
        return Reply{};
    }

    auto GameHost::ViewCalled(UserId const user) -> Reply
    {
        auto lock = store_->Lock();
        GameState const& state = store_->State();
        if (state.called.empty())
        {
            return Reply{"⏳ No numbers have been called yet."};
        }
        return Reply{std::format("📜 All Called Numbers:\n<code>{}</code>", render::FormatCallList(state.called)),
                     render::MainMenu(IsAdmin(user))};
    }

    auto GameHost::ViewLastCalled(UserId const user, size_t const n) -> Reply
    {
        auto lock = store_->Lock();
        GameState const& state = store_->State();
        if (state.called.empty())
        {
            return Reply{"⏳ Not enough numbers have been called yet."};
        }
        size_t const shown = std::min(n, state.called.size());
        std::span<Number const> const tail{state.called.end() - static_cast<std::ptrdiff_t>(shown), state.called.end()};
        return Reply{std::format("🕔 Last {} Called Numbers:\n<code>{}</code>", n, render::FormatCallList(tail)),
                     render::MainMenu(IsAdmin(user))};
    }

    auto GameHost::ShowCard(UserId const user, ChatId const chat) -> Reply
    {
        auto lock = store_->Lock();
        GameState& state = store_->State();
        Player* p = state.Find(user);
        if (!p)
            return RejectionReply(error::Rejection{.code = error::RejectionCode::NotJoined}.with_user(user));

        std::optional<MessageId> sent;
        try
        {
            sent = messenger_->SendText(chat, render::RenderCard(p->card, state.last_called),
                                        state.active ? render::CardKeyboard(p->card) : Keyboard{});
        }
        catch (std::exception const& e)
        {
            std::print(stderr, "[Host] Card delivery to chat {} failed: {}\n", chat, e.what());
        }
        if (!sent)
        {
            return Reply{"⚠️ Could not deliver your card, please try again.", {}, true};
        }
        // later refreshes go to the newest copy; persisted with the next boundary write
        p->dest = Destination{chat, *sent};
        return Reply{"🃏 Your current card is below."};
    }
}
