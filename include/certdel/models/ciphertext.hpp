#pragma once
#include "certdel/gf2/bit_string.hpp"
#include "certdel/interfaces/i_quantum_backend.hpp"
#include <optional>

namespace certdel::protocol::models {

/**
 * @brief Classical part of a ciphertext plus the handle of its qubits
 *
 * - c: message under both the privacy-amplified pad and u (n bits)
 * - p: padded error-correction hash (tau bits)
 * - q: padded syndrome of r (mu bits)
 */
class Ciphertext {
public:
    Ciphertext(
        gf2::BitString c,
        gf2::BitString p,
        gf2::BitString q,
        std::optional<interfaces::BackendHandle> handle = std::nullopt);

    [[nodiscard]] const gf2::BitString& C() const noexcept { return c_; }
    [[nodiscard]] const gf2::BitString& P() const noexcept { return p_; }
    [[nodiscard]] const gf2::BitString& Q() const noexcept { return q_; }
    [[nodiscard]] const std::optional<interfaces::BackendHandle>& Handle() const noexcept { return handle_; }

    bool operator==(const Ciphertext& other) const noexcept {
        return c_ == other.c_ && p_ == other.p_ && q_ == other.q_ && handle_ == other.handle_;
    }

private:
    gf2::BitString c_;
    gf2::BitString p_;
    gf2::BitString q_;
    std::optional<interfaces::BackendHandle> handle_;
};

}
