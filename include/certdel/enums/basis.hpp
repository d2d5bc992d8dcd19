#pragma once

#include <cstdint>

namespace certdel::protocol::enums {

/**
 * @brief Basis in which a qubit is prepared and measured
 *
 * The key's theta holds one tag per prepared position:
 * - COMPUTATIONAL positions carry the pad seed r
 * - HADAMARD positions carry r_bar, the deletion check bits
 */
enum class Basis : uint8_t {
    Computational = 0,
    Hadamard = 1
};

constexpr const char* ToString(Basis basis) noexcept {
    switch (basis) {
        case Basis::Computational:
            return "COMPUTATIONAL";
        case Basis::Hadamard:
            return "HADAMARD";
        default:
            return "UNKNOWN";
    }
}

} // namespace certdel::protocol::enums
