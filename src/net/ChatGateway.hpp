//
// ChatGateway.hpp: chat transport over WebSocket++ carrying codec envelopes
//

#ifndef BINGO_CHATGATEWAY_HPP
#define BINGO_CHATGATEWAY_HPP

#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include <websocketpp/config/asio_no_tls.hpp>
#include <websocketpp/server.hpp>

#include "core/GameHost.hpp"
#include "core/Messenger.hpp"
#include "core/Types.hpp"
#include "net/codec.hpp"

namespace bingo::net
{
    using WsServer = websocketpp::server<websocketpp::config::asio>;
    using Hdl      = websocketpp::connection_hdl;

    // Each connection speaks for the chats it has sent requests from. Replies and
    // pushes for a chat go to the connection that last used it.
    class ChatGateway final : public core::Messenger
    {
    public:
        using RequestHandler = std::function<core::Reply(Request const&)>;

        ChatGateway();

        auto SetRequestHandler(RequestHandler handler) -> void;

        auto Listen(std::uint16_t port) -> void;
        // Blocks running the network loop; requests are handled one at a time on it.
        auto Run() -> void;
        auto Stop() -> void;

        auto SendText(core::ChatId chat, std::string const& text, core::Keyboard const& keyboard)
            -> std::optional<core::MessageId> override;

        auto EditText(core::Destination const& dest, std::string const& text, core::Keyboard const& keyboard)
            -> bool override;

    private:
        auto OnOpen(Hdl hdl) -> void;
        auto OnClose(Hdl hdl) -> void;
        auto OnMessage(Hdl hdl, WsServer::message_ptr msg) -> void;

        auto Deliver(Delivery const& d) -> bool;

    private:
        std::shared_ptr<WsServer> ep_;
        RequestHandler handler_;

        std::mutex mtx_;
        std::map<core::ChatId, Hdl> chat_to_hdl_;

        std::atomic<core::MessageId> next_message_id_{1};
        std::atomic<std::uint64_t> next_msg_id_{1};
    };
}

#endif //BINGO_CHATGATEWAY_HPP
