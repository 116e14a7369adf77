//
// codec.cpp
//
#include "net/codec.hpp"

#include <utility>
#include <vector>

namespace fbn = bingo::gen::net;

namespace
{
    static_assert((int)bingo::net::RequestKind::Command == (int)fbn::RequestKind::Command);
    static_assert((int)bingo::net::DeliveryOp::Send == (int)fbn::DeliveryOp::Send);

    inline auto Str(flatbuffers::String const* s) -> std::string
    {
        return s ? s->str() : std::string{};
    }

    // Verifies and returns the envelope, or the reason it was rejected.
    auto OpenEnvelope(std::span<std::byte const> bytes) -> std::expected<fbn::Envelope const*, bingo::net::ParseError>
    {
        if (bytes.size() < sizeof(flatbuffers::uoffset_t))
            return std::unexpected(bingo::net::ParseError{"buffer too small"});

        auto const* data = reinterpret_cast<uint8_t const*>(bytes.data());
        flatbuffers::Verifier verifier(data, bytes.size());
        if (!fbn::VerifyEnvelopeBuffer(verifier))
            return std::unexpected(bingo::net::ParseError{"envelope failed verification"});

        auto const* env = fbn::GetEnvelope(data);
        if (!env)
            return std::unexpected(bingo::net::ParseError{"bad root"});
        return env;
    }
}

namespace bingo::net
{
    auto ToFbKind(RequestKind k) noexcept -> fbn::RequestKind
    {
        switch (k)
        {
        case RequestKind::Command: return fbn::RequestKind::Command;
        case RequestKind::Callback: return fbn::RequestKind::Callback;
        }
        return fbn::RequestKind::Command;
    }

    auto FromFbKind(fbn::RequestKind k) noexcept -> RequestKind
    {
        switch (k)
        {
        case fbn::RequestKind::Command: return RequestKind::Command;
        case fbn::RequestKind::Callback: return RequestKind::Callback;
        }
        return RequestKind::Command;
    }

    auto ToFbOp(DeliveryOp op) noexcept -> fbn::DeliveryOp
    {
        switch (op)
        {
        case DeliveryOp::Send: return fbn::DeliveryOp::Send;
        case DeliveryOp::Edit: return fbn::DeliveryOp::Edit;
        case DeliveryOp::Notice: return fbn::DeliveryOp::Notice;
        }
        return fbn::DeliveryOp::Send;
    }

    auto FromFbOp(fbn::DeliveryOp op) noexcept -> DeliveryOp
    {
        switch (op)
        {
        case fbn::DeliveryOp::Send: return DeliveryOp::Send;
        case fbn::DeliveryOp::Edit: return DeliveryOp::Edit;
        case fbn::DeliveryOp::Notice: return DeliveryOp::Notice;
        }
        return DeliveryOp::Send;
    }

    // ---------- Request (client → server) ----------

    auto BuildRequest(Request const& req, std::uint64_t msg_id) -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;
        auto const name = fbb.CreateString(req.display_name);
        auto const data = fbb.CreateString(req.data);
        auto const r = fbn::CreateClientRequest(fbb, req.user.value, req.chat, name, ToFbKind(req.kind), data);
        auto const e = fbn::CreateEnvelope(fbb, msg_id, fbn::Body::ClientRequest, r.Union());
        fbn::FinishEnvelopeBuffer(fbb, e);
        return fbb.Release();
    }

    // ---------- Delivery (server → client) ----------

    auto BuildDelivery(Delivery const& d, std::uint64_t msg_id) -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;

        std::vector<flatbuffers::Offset<fbn::ButtonRow>> rows;
        rows.reserve(d.keyboard.size());
        for (auto const& row : d.keyboard)
        {
            std::vector<flatbuffers::Offset<fbn::Button>> buttons;
            buttons.reserve(row.size());
            for (core::Button const& b : row)
            {
                auto const label = fbb.CreateString(b.label);
                auto const data = fbb.CreateString(b.data);
                buttons.push_back(fbn::CreateButton(fbb, label, data));
            }
            rows.push_back(fbn::CreateButtonRow(fbb, fbb.CreateVector(buttons)));
        }
        auto const kb = fbb.CreateVector(rows);
        auto const text = fbb.CreateString(d.text);

        auto const del = fbn::CreateDelivery(fbb, d.chat, d.message, ToFbOp(d.op), text, kb);
        auto const e = fbn::CreateEnvelope(fbb, msg_id, fbn::Body::Delivery, del.Union());
        fbn::FinishEnvelopeBuffer(fbb, e);
        return fbb.Release();
    }

    // ---------- Decode ----------

    auto DecodeRequest(std::span<std::byte const> bytes) -> std::expected<Request, ParseError>
    {
        auto env = OpenEnvelope(bytes);
        if (!env.has_value())
            return std::unexpected(env.error());

        if ((*env)->body_type() != fbn::Body::ClientRequest)
            return std::unexpected(ParseError{"not a ClientRequest"});

        fbn::ClientRequest const* r = (*env)->body_as_ClientRequest();
        Request out{};
        out.user = core::UserId{r->user_id()};
        out.chat = r->chat_id();
        out.display_name = Str(r->display_name());
        out.kind = FromFbKind(r->kind());
        out.data = Str(r->data());
        if (out.data.empty())
            return std::unexpected(ParseError{"empty request data"});
        return out;
    }

    auto DecodeDelivery(std::span<std::byte const> bytes) -> std::expected<Delivery, ParseError>
    {
        auto env = OpenEnvelope(bytes);
        if (!env.has_value())
            return std::unexpected(env.error());

        if ((*env)->body_type() != fbn::Body::Delivery)
            return std::unexpected(ParseError{"not a Delivery"});

        fbn::Delivery const* d = (*env)->body_as_Delivery();
        Delivery out{};
        out.chat = d->chat_id();
        out.message = d->message_id();
        out.op = FromFbOp(d->op());
        out.text = Str(d->text());
        if (auto const* rows = d->keyboard())
        {
            out.keyboard.reserve(rows->size());
            for (fbn::ButtonRow const* row : *rows)
            {
                std::vector<core::Button> buttons;
                if (auto const* bs = row->buttons())
                {
                    buttons.reserve(bs->size());
                    for (fbn::Button const* b : *bs)
                    {
                        buttons.push_back(core::Button{Str(b->label()), Str(b->data())});
                    }
                }
                out.keyboard.push_back(std::move(buttons));
            }
        }
        return out;
    }
} // namespace bingo::net
