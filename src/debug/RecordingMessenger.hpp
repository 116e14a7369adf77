//
// RecordingMessenger.hpp
//

#ifndef BINGO_RECORDINGMESSENGER_HPP
#define BINGO_RECORDINGMESSENGER_HPP

#include <algorithm>
#include <iterator>
#include <mutex>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

#include "../core/Messenger.hpp"

namespace bingo::core::debug
{
    // In-memory Messenger that keeps every delivery. Chats can be made to fail
    // (false return) or to throw, to exercise best-effort fan-out.
    class RecordingMessenger final : public Messenger
    {
    public:
        struct Sent
        {
            ChatId chat{};
            MessageId message{};
            std::string text;
            Keyboard keyboard;
        };

        struct Edited
        {
            Destination dest{};
            std::string text;
            Keyboard keyboard;
        };

        auto SendText(ChatId chat, std::string const& text, Keyboard const& keyboard)
            -> std::optional<MessageId> override
        {
            std::lock_guard<std::mutex> lock(mtx_);
            if (throwing_.contains(chat)) throw std::runtime_error("transport exploded");
            if (failing_.contains(chat)) return std::nullopt;
            MessageId const id = next_id_++;
            sent_.push_back(Sent{chat, id, text, keyboard});
            return id;
        }

        auto EditText(Destination const& dest, std::string const& text, Keyboard const& keyboard)
            -> bool override
        {
            std::lock_guard<std::mutex> lock(mtx_);
            if (throwing_.contains(dest.chat)) throw std::runtime_error("transport exploded");
            if (failing_.contains(dest.chat)) return false;
            edited_.push_back(Edited{dest, text, keyboard});
            return true;
        }

        auto FailChat(ChatId chat) -> void
        {
            std::lock_guard<std::mutex> lock(mtx_);
            failing_.insert(chat);
        }

        auto ThrowOnChat(ChatId chat) -> void
        {
            std::lock_guard<std::mutex> lock(mtx_);
            throwing_.insert(chat);
        }

        auto Heal() -> void
        {
            std::lock_guard<std::mutex> lock(mtx_);
            failing_.clear();
            throwing_.clear();
        }

        auto SentMessages() const -> std::vector<Sent>
        {
            std::lock_guard<std::mutex> lock(mtx_);
            return sent_;
        }

        auto Edits() const -> std::vector<Edited>
        {
            std::lock_guard<std::mutex> lock(mtx_);
            return edited_;
        }

        // Sent messages whose text contains needle.
        auto SentContaining(std::string const& needle) const -> std::vector<Sent>
        {
            std::lock_guard<std::mutex> lock(mtx_);
            std::vector<Sent> out;
            std::ranges::copy_if(sent_, std::back_inserter(out),
                                 [&](Sent const& s) { return s.text.find(needle) != std::string::npos; });
            return out;
        }

        auto Clear() -> void
        {
            std::lock_guard<std::mutex> lock(mtx_);
            sent_.clear();
            edited_.clear();
        }

    private:
        mutable std::mutex mtx_;
        std::vector<Sent> sent_;
        std::vector<Edited> edited_;
        std::set<ChatId> failing_;
        std::set<ChatId> throwing_;
        MessageId next_id_{100};
    };
} // namespace bingo::core::debug

#endif //BINGO_RECORDINGMESSENGER_HPP
