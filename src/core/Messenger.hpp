//
// Messenger.hpp
//

#ifndef BINGO_MESSENGER_HPP
#define BINGO_MESSENGER_HPP

#include <optional>
#include <string>
#include "Types.hpp"

namespace bingo::core
{
    // Outbound chat transport. Implementations must tolerate calls from several
    // threads at once: fan-out deliveries run concurrently.
    class Messenger
    {
    public:
        virtual ~Messenger() = default;

        // Posts a new message; returns its handle, nullopt when it could not be delivered.
        virtual auto SendText(ChatId chat, std::string const& text, Keyboard const& keyboard)
            -> std::optional<MessageId> = 0;

        // Replaces an existing message in place. false when it could not be delivered.
        virtual auto EditText(Destination const& dest, std::string const& text, Keyboard const& keyboard)
            -> bool = 0;
    };
}

#endif //BINGO_MESSENGER_HPP
