//
// Announcer.cpp
//
#include "Announcer.hpp"

#include <algorithm>
#include <cstdio>
#include <format>
#include <functional>
#include <future>
#include <print>
#include <utility>

#include "Exception.hpp"

namespace bingo::core
{
    namespace
    {
        // Runs every delivery as its own task and waits for all of them.
        // labels[i] names job i in the failure log.
        auto FanOut(std::vector<std::function<bool()>> jobs,
                    std::vector<std::string> labels) -> DispatchReport
        {
            std::vector<std::future<bool>> pending;
            pending.reserve(jobs.size());
            for (auto& job : jobs)
            {
                pending.push_back(std::async(std::launch::async, std::move(job)));
            }

            DispatchReport report{};
            report.attempted = pending.size();
            for (size_t i{}; i < pending.size(); ++i)
            {
                try
                {
                    if (pending[i].get())
                    {
                        ++report.delivered;
                        continue;
                    }
                    std::print(stderr, "[Dispatch] Failed to deliver to {}\n", labels[i]);
                }
                catch (std::exception const& e)
                {
                    std::print(stderr, "[Dispatch] Failed to deliver to {}: {}\n", labels[i], e.what());
                }
                ++report.failed;
            }
            return report;
        }
    }

    Announcer::Announcer(std::shared_ptr<Messenger> messenger) :
        messenger_(std::move(messenger))
    {
        BINGO_ASSERT(messenger_ != nullptr, "Announcer needs a messenger");
    }

    auto Announcer::Broadcast(std::vector<ChatId> const& recipients, std::string const& message) -> DispatchReport
    {
        std::vector<std::function<bool()>> jobs;
        std::vector<std::string> labels;
        jobs.reserve(recipients.size());
        labels.reserve(recipients.size());

        for (ChatId const chat : recipients)
        {
            jobs.emplace_back([m = messenger_, chat, &message]
            {
                return m->SendText(chat, message, Keyboard{}).has_value();
            });
            labels.push_back(std::format("chat {}", chat));
        }

        DispatchReport const report = FanOut(std::move(jobs), std::move(labels));
        std::print("[Dispatch] Announcement sent to {}/{} recipient(s)\n", report.delivered, report.attempted);
        return report;
    }

    auto Announcer::PushCards(std::vector<CardPush> const& pushes) -> DispatchReport
    {
        std::vector<std::function<bool()>> jobs;
        std::vector<std::string> labels;
        jobs.reserve(pushes.size());
        labels.reserve(pushes.size());

        for (CardPush const& push : pushes)
        {
            jobs.emplace_back([m = messenger_, &push]
            {
                return m->EditText(push.dest, push.text, push.keyboard);
            });
            labels.push_back(std::format("card message {} in chat {}", push.dest.message, push.dest.chat));
        }
        return FanOut(std::move(jobs), std::move(labels));
    }

    auto Announcer::Notify(ChatId const chat, std::string const& message) -> bool
    {
        try
        {
            if (messenger_->SendText(chat, message, Keyboard{}).has_value()) return true;
            std::print(stderr, "[Dispatch] Failed to deliver private message to chat {}\n", chat);
        }
        catch (std::exception const& e)
        {
            std::print(stderr, "[Dispatch] Failed to deliver private message to chat {}: {}\n", chat, e.what());
        }
        return false;
    }

    auto Announcer::Recipients(GameState const& state, std::vector<UserId> const& admins) -> std::vector<ChatId>
    {
        std::vector<ChatId> out;
        out.reserve(state.players.size() + admins.size());
        for (auto const& [id, player] : state.players)
        {
            out.push_back(player.dest.chat);
        }
        // an admin's private chat shares the admin's user id
        for (UserId const admin : admins)
        {
            out.push_back(admin.value);
        }
        std::ranges::sort(out);
        auto const dup = std::ranges::unique(out);
        out.erase(dup.begin(), dup.end());
        return out;
    }
}
