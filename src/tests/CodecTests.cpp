#include <gtest/gtest.h>
#include <cstddef>
#include <span>
#include <vector>

#include "../net/codec.hpp"

using namespace bingo;

namespace
{
    auto Bytes(flatbuffers::DetachedBuffer const& buf) -> std::span<std::byte const>
    {
        return {reinterpret_cast<std::byte const*>(buf.data()), buf.size()};
    }
}

TEST(Codec, RequestSurvivesTheWire)
{
    net::Request req{};
    req.user = core::UserId{987654321};
    req.chat = -100200300;
    req.display_name = "Ann";
    req.kind = net::RequestKind::Callback;
    req.data = "mark_3_4";

    auto const buf = net::BuildRequest(req, 7);
    auto const got = net::DecodeRequest(Bytes(buf));
    ASSERT_TRUE(got.has_value()) << got.error().message;
    EXPECT_EQ(got->user, req.user);
    EXPECT_EQ(got->chat, req.chat);
    EXPECT_EQ(got->display_name, "Ann");
    EXPECT_EQ(got->kind, net::RequestKind::Callback);
    EXPECT_EQ(got->data, "mark_3_4");
}

TEST(Codec, DeliveryKeepsKeyboardShape)
{
    net::Delivery d{};
    d.chat = 10;
    d.message = 55;
    d.op = net::DeliveryOp::Edit;
    d.text = "🇧 🇮 🇳 🇬 🇴";
    d.keyboard = {
        {core::Button{"1", "mark_0_0"}, core::Button{"16", "mark_0_1"}},
        {},
        {core::Button{"🆓", "mark_2_2"}},
    };

    auto const buf = net::BuildDelivery(d, 1);
    auto const got = net::DecodeDelivery(Bytes(buf));
    ASSERT_TRUE(got.has_value()) << got.error().message;
    EXPECT_EQ(got->chat, 10);
    EXPECT_EQ(got->message, 55);
    EXPECT_EQ(got->op, net::DeliveryOp::Edit);
    EXPECT_EQ(got->text, d.text);
    ASSERT_EQ(got->keyboard.size(), 3u);
    ASSERT_EQ(got->keyboard[0].size(), 2u);
    EXPECT_EQ(got->keyboard[0][1].label, "16");
    EXPECT_EQ(got->keyboard[0][1].data, "mark_0_1");
    EXPECT_TRUE(got->keyboard[1].empty());
    EXPECT_EQ(got->keyboard[2][0].label, "🆓");
}

TEST(Codec, WrongBodyTypeRejected)
{
    net::Request req{};
    req.data = "call";
    auto const buf = net::BuildRequest(req, 1);
    EXPECT_FALSE(net::DecodeDelivery(Bytes(buf)).has_value());

    net::Delivery d{};
    d.text = "hi";
    auto const dbuf = net::BuildDelivery(d, 2);
    EXPECT_FALSE(net::DecodeRequest(Bytes(dbuf)).has_value());
}

TEST(Codec, EmptyRequestDataRejected)
{
    net::Request req{};
    req.user = core::UserId{1};
    auto const buf = net::BuildRequest(req, 1);
    auto const got = net::DecodeRequest(Bytes(buf));
    ASSERT_FALSE(got.has_value());
    EXPECT_EQ(got.error().message, "empty request data");
}

TEST(Codec, GarbageRejected)
{
    std::vector<std::byte> tiny{std::byte{1}, std::byte{2}};
    EXPECT_FALSE(net::DecodeRequest(tiny).has_value());

    std::vector<std::byte> junk(64, std::byte{0xAB});
    EXPECT_FALSE(net::DecodeRequest(junk).has_value());
    EXPECT_FALSE(net::DecodeDelivery(junk).has_value());
}

TEST(Codec, TruncatedEnvelopeRejected)
{
    net::Request req{};
    req.data = "join";
    req.display_name = "a fairly long display name to pad the buffer";
    auto const buf = net::BuildRequest(req, 3);
    auto const whole = Bytes(buf);
    EXPECT_FALSE(net::DecodeRequest(whole.first(whole.size() / 2)).has_value());
}
