#include "certdel/models/ciphertext.hpp"

namespace certdel::protocol::models {

Ciphertext::Ciphertext(
    gf2::BitString c,
    gf2::BitString p,
    gf2::BitString q,
    std::optional<interfaces::BackendHandle> handle)
    : c_(std::move(c))
    , p_(std::move(p))
    , q_(std::move(q))
    , handle_(handle) {
}

}
