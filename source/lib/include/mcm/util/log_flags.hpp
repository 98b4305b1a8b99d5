#pragma once

#include <cstdint>

#include <mcm/util/bit_field.hpp>

enum class LogFlags : uint32_t
{
    None = 0,
    Console = Bit(0u),
    File = Bit(1u),
    FatalQuit = Bit(2u),
    // Debug messages are dropped unless set
    Verbose = Bit(3u),
    DetailTime = Bit(4u),
    DetailFile = Bit(5u),
    DetailLine = Bit(6u),
    // Prefix messages with the card that is being exported
    DetailCard = Bit(7u),
};
ENABLE_BITFIELD_OPERATORS(LogFlags);
