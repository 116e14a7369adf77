//
// Util.hpp
//

#ifndef BINGO_UTIL_HPP
#define BINGO_UTIL_HPP

#include <algorithm>
#include <bitset>
#include <span>
#include "Types.hpp"

namespace bingo::core::util
{
    inline auto InRange(Number const n) -> bool
    {
        return n >= 1 && n <= constants::MaxNumber;
    }

    // Band index 0..4 of a callable number (B..O).
    inline auto BandOf(Number const n) -> size_t
    {
        return static_cast<size_t>((n - 1) / constants::BandWidth);
    }

    inline auto BandLow(size_t const band) -> Number
    {
        return static_cast<Number>(band * constants::BandWidth + 1);
    }

    inline auto BandHigh(size_t const band) -> Number
    {
        return static_cast<Number>((band + 1) * constants::BandWidth);
    }

    class NumberSet
    {
    public:
        NumberSet() = default;

        explicit NumberSet(std::span<Number const> numbers)
        {
            for (Number const n : numbers) Add(n);
        }

        // numbers above MaxNumber are not callable and are ignored
        auto Add(Number const n) -> void
        {
            if (n > constants::MaxNumber) return;
            contains_dup_ |= bits_.test(n);
            bits_.set(n);
        }

        [[nodiscard]]
        auto Contains(Number const n) const -> bool
        {
            return n <= constants::MaxNumber && bits_.test(n);
        }

        [[nodiscard]]
        auto ContainsDup() const -> bool
        {
            return contains_dup_;
        }

        [[nodiscard]]
        auto Count() const -> size_t
        {
            return bits_.count();
        }

        // Every callable number not yet in the set, ascending.
        [[nodiscard]]
        auto Remaining() const -> std::vector<Number>
        {
            std::vector<Number> out;
            out.reserve(constants::MaxNumber);
            for (Number n{1}; n <= constants::MaxNumber; ++n)
            {
                if (!bits_.test(n)) out.push_back(n);
            }
            return out;
        }

    private:
        // index 0 unused, also absorbs FREE cells' zero
        std::bitset<constants::MaxNumber + 1> bits_{};
        bool contains_dup_{false};
    };
}

#endif //BINGO_UTIL_HPP
