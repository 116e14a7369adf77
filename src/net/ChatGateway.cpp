//
// ChatGateway.cpp
//

#include "net/ChatGateway.hpp"

#include <cstdio>
#include <print>
#include <span>
#include <utility>
#include <vector>

namespace bingo::net
{
    ChatGateway::ChatGateway() :
        ep_(std::make_shared<WsServer>())
    {
        ep_->clear_access_channels(websocketpp::log::alevel::all);
        ep_->set_access_channels(websocketpp::log::alevel::connect |
            websocketpp::log::alevel::disconnect);
        ep_->clear_error_channels(websocketpp::log::elevel::all);

        ep_->init_asio();
        ep_->set_reuse_addr(true);

        ep_->set_open_handler([this](Hdl hdl) { OnOpen(std::move(hdl)); });
        ep_->set_close_handler([this](Hdl hdl) { OnClose(std::move(hdl)); });
        ep_->set_message_handler([this](Hdl hdl, WsServer::message_ptr msg)
        {
            OnMessage(std::move(hdl), std::move(msg));
        });
    }

    auto ChatGateway::SetRequestHandler(RequestHandler handler) -> void
    {
        handler_ = std::move(handler);
    }

    auto ChatGateway::Listen(std::uint16_t const port) -> void
    {
        ep_->listen(port);
        ep_->start_accept();
        std::print("[Gateway] listening on port {}\n", port);
    }

    auto ChatGateway::Run() -> void
    {
        ep_->run();
    }

    auto ChatGateway::Stop() -> void
    {
        ep_->stop_listening();
        ep_->stop();
    }

    auto ChatGateway::OnOpen(Hdl hdl) -> void
    {
        (void)hdl;
        std::print("[Gateway] client connected\n");
    }

    auto ChatGateway::OnClose(Hdl hdl) -> void
    {
        std::lock_guard<std::mutex> lock(mtx_);
        std::owner_less<Hdl> less;
        for (auto it = chat_to_hdl_.begin(); it != chat_to_hdl_.end();)
        {
            bool const same = !less(it->second, hdl) && !less(hdl, it->second);
            if (same)
            {
                std::print("[Gateway] chat {} disconnected\n", it->first);
                it = chat_to_hdl_.erase(it);
            }
            else
            {
                ++it;
            }
        }
    }

    auto ChatGateway::OnMessage(Hdl hdl, WsServer::message_ptr msg) -> void
    {
        // Only binary frames are valid
        if (msg->get_opcode() != websocketpp::frame::opcode::binary)
        {
            std::print(stderr, "[Gateway] Ignoring non-binary frame from client\n");
            return;
        }

        std::string const& payload = msg->get_payload();
        std::span<std::byte const> bytes{reinterpret_cast<std::byte const*>(payload.data()), payload.size()};

        std::expected<Request, ParseError> parsed = DecodeRequest(bytes);
        if (!parsed.has_value())
        {
            std::print(stderr, "[Gateway] Parse error: {}\n", parsed.error().message);
            return;
        }

        {
            std::lock_guard<std::mutex> lock(mtx_);
            chat_to_hdl_[parsed->chat] = hdl;
        }

        if (!handler_)
        {
            return;
        }

        core::Reply const reply = handler_(*parsed);
        if (reply.Empty())
        {
            return;
        }

        Delivery d{};
        d.chat = parsed->chat;
        d.op = reply.notice ? DeliveryOp::Notice : DeliveryOp::Send;
        d.message = reply.notice ? 0 : next_message_id_++;
        d.text = reply.text;
        d.keyboard = reply.keyboard;
        if (!Deliver(d))
        {
            std::print(stderr, "[Gateway] Reply to chat {} not delivered\n", d.chat);
        }
    }

    auto ChatGateway::Deliver(Delivery const& d) -> bool
    {
        Hdl hdl;
        {
            std::lock_guard<std::mutex> lock(mtx_);
            auto const it = chat_to_hdl_.find(d.chat);
            if (it == chat_to_hdl_.end())
            {
                return false;
            }
            hdl = it->second;
        }

        flatbuffers::DetachedBuffer const buf = BuildDelivery(d, next_msg_id_++);

        websocketpp::lib::error_code ec;
        ep_->send(hdl, buf.data(), buf.size(), websocketpp::frame::opcode::binary, ec);
        if (ec)
        {
            std::print(stderr, "[Gateway] send() error chat {}: {}\n", d.chat, ec.message());
            return false;
        }
        return true;
    }

    auto ChatGateway::SendText(core::ChatId const chat, std::string const& text, core::Keyboard const& keyboard)
        -> std::optional<core::MessageId>
    {
        Delivery d{};
        d.chat = chat;
        d.message = next_message_id_++;
        d.op = DeliveryOp::Send;
        d.text = text;
        d.keyboard = keyboard;
        if (!Deliver(d))
        {
            return std::nullopt;
        }
        return d.message;
    }

    auto ChatGateway::EditText(core::Destination const& dest, std::string const& text, core::Keyboard const& keyboard)
        -> bool
    {
        Delivery d{};
        d.chat = dest.chat;
        d.message = dest.message;
        d.op = DeliveryOp::Edit;
        d.text = text;
        d.keyboard = keyboard;
        return Deliver(d);
    }
}
