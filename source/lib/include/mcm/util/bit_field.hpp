#pragma once

#include <type_traits>

// NOLINTBEGIN

namespace detail
{
template<typename BitFieldTy>
struct BitFieldOperatorsEnabled
{
    static constexpr bool value = false;
};
} // namespace detail

// Enables the bitwise operators below for an enum class
#define ENABLE_BITFIELD_OPERATORS(bitfield)           \
    template<>                                        \
    struct detail::BitFieldOperatorsEnabled<bitfield> \
    {                                                 \
        static constexpr bool value = true;           \
    }

template<typename BitFieldTy>
concept BitField = detail::BitFieldOperatorsEnabled<BitFieldTy>::value;

#define MAKE_BINARY_BITFIELD_OPERATOR(op)                                           \
    template<BitField BitFieldTy>                                                   \
    inline constexpr BitFieldTy operator op(BitFieldTy lhs, BitFieldTy rhs)         \
    {                                                                               \
        using BaseTy = std::underlying_type_t<BitFieldTy>;                          \
        return static_cast<BitFieldTy>(static_cast<BaseTy>(lhs) op                  \
                                           static_cast<BaseTy>(rhs));               \
    }                                                                               \
    template<BitField BitFieldTy>                                                   \
    inline constexpr BitFieldTy& operator op##=(BitFieldTy & lhs, BitFieldTy rhs)   \
    {                                                                               \
        lhs = lhs op rhs;                                                           \
        return lhs;                                                                 \
    }

MAKE_BINARY_BITFIELD_OPERATOR(&)
MAKE_BINARY_BITFIELD_OPERATOR(|)
MAKE_BINARY_BITFIELD_OPERATOR(^)

#undef MAKE_BINARY_BITFIELD_OPERATOR

template<BitField BitFieldTy>
inline constexpr BitFieldTy operator~(BitFieldTy value)
{
    using BaseTy = std::underlying_type_t<BitFieldTy>;
    return static_cast<BitFieldTy>(~static_cast<BaseTy>(value));
}

template<BitField BitFieldTy>
inline constexpr bool IsSet(BitFieldTy lhs, BitFieldTy rhs)
{
    return (lhs & rhs) == rhs;
}

template<class T>
consteval T Bit(T ith)
{
    return static_cast<T>(1u << ith);
}

// NOLINTEND
