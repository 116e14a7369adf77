//
// Exception.hpp
//

#ifndef BINGO_EXCEPTION_HPP
#define BINGO_EXCEPTION_HPP

#include "OmegaException.hpp"

#include <expected>
#include <format>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include "Types.hpp"

namespace bingo::core::error
{
    enum class Code : unsigned
    {
        Persistence, // snapshot could not be read or written
        Serialization, // FlatBuffers verification/build errors, bad snapshot content
        Assertion // internal assertion failed
    };

    struct PersistenceError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct SerializationError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct AssertionError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    [[noreturn]]
    inline auto fail(Code c, std::string msg) -> void
    {
        switch (c)
        {
        case Code::Persistence: throw PersistenceError(std::move(msg), c);
        case Code::Serialization: throw SerializationError(std::move(msg), c);
        case Code::Assertion: throw AssertionError(std::move(msg), c);
        }
        throw std::runtime_error(msg);
    }

#define BINGO_THROW(code_enum, msg) ::bingo::core::error::fail((code_enum), (msg))
#define BINGO_ASSERT(cond, msg) do { if(!(cond)) ::bingo::core::error::fail(::bingo::core::error::Code::Assertion, (msg)); } while(0)

    // Ordinary user rejections. Returned, never thrown, never mutate state.
    enum class RejectionCode : std::uint16_t
    {
        // Identity / flow
        NotAdmin,
        GameInactive,
        NotJoined,
        AlreadyJoined,

        // Call
        Call_NoNumbersRemain,

        // Mark
        Mark_InvalidPosition,
        Mark_NotCalled,
        Mark_AlreadyMarked,

        // Routing
        UnknownAction,

        // Safety net
        Internal_Unreachable
    };

    struct Rejection
    {
        RejectionCode code{};
        std::optional<UserId> user{};
        std::optional<std::uint8_t> row{};
        std::optional<std::uint8_t> col{};
        std::optional<Number> number{};

        auto with_user(UserId u) -> Rejection&
        {
            user = u;
            return *this;
        }

        auto with_cell(std::uint8_t r, std::uint8_t c) -> Rejection&
        {
            row = r;
            col = c;
            return *this;
        }

        auto with_number(Number n) -> Rejection&
        {
            number = n;
            return *this;
        }
    };

    // Text shown to the user that triggered the rejection.
    inline auto user_text(RejectionCode c) -> std::string_view
    {
        using E = RejectionCode;
        switch (c)
        {
        case E::NotAdmin: return "⛔ Only the admin can do that.";
        case E::GameInactive: return "❌ No game in progress.";
        case E::NotJoined: return "❌ You haven't joined the game yet.";
        case E::AlreadyJoined: return "✅ You already joined.";
        case E::Call_NoNumbersRemain: return "All numbers have been called.";
        case E::Mark_InvalidPosition: return "❌ Invalid position.";
        case E::Mark_NotCalled: return "❌ This number hasn't been called yet.";
        case E::Mark_AlreadyMarked: return "✅ Already marked.";
        case E::UnknownAction: return "Unknown action.";
        case E::Internal_Unreachable: return "Something went wrong.";
        }
        return "Unknown action.";
    }

    template <typename T>
    using Outcome = std::expected<T, Rejection>;

    inline auto reject(RejectionCode c) -> std::unexpected<Rejection>
    {
        return std::unexpected(Rejection{.code = c});
    }

    inline auto reject(Rejection r) -> std::unexpected<Rejection>
    {
        return std::unexpected(std::move(r));
    }
}

#endif //BINGO_EXCEPTION_HPP
