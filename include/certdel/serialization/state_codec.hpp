#pragma once
#include "certdel/configuration/scheme_parameters.hpp"
#include "certdel/models/ciphertext.hpp"
#include "certdel/models/key.hpp"
#include "certdel/models/measurement_counts.hpp"
#include "certdel/core/result.hpp"
#include "certdel/core/failures.hpp"
#include <cstdint>
#include <span>
#include <vector>

namespace certdel::protocol::serialization {

/**
 * @brief Protobuf encoding of scheme state (certdel/protocol_state.proto)
 *
 * Encoding is deterministic, so equal values give equal bytes. Decoding
 * checks every length against the scheme parameters and fails with Decode
 * on malformed input.
 *
 * Scheme parameters are stored by code name, so only built-in codes can be
 * restored.
 */
class StateCodec {
public:
    [[nodiscard]] static Result<std::vector<uint8_t>, ProtocolFailure> EncodeSchemeParameters(
        const configuration::SchemeParameters& params);
    [[nodiscard]] static Result<configuration::SchemeParameters, ProtocolFailure> DecodeSchemeParameters(
        std::span<const uint8_t> bytes);

    [[nodiscard]] static Result<std::vector<uint8_t>, ProtocolFailure> EncodeKey(const models::Key& key);
    [[nodiscard]] static Result<models::Key, ProtocolFailure> DecodeKey(
        std::span<const uint8_t> bytes,
        const configuration::SchemeParameters& params);

    [[nodiscard]] static Result<std::vector<uint8_t>, ProtocolFailure> EncodeCiphertext(
        const models::Ciphertext& ciphertext);
    [[nodiscard]] static Result<models::Ciphertext, ProtocolFailure> DecodeCiphertext(
        std::span<const uint8_t> bytes,
        const configuration::SchemeParameters& params);

    [[nodiscard]] static Result<std::vector<uint8_t>, ProtocolFailure> EncodeCounts(
        const models::MeasurementCounts& counts);
    [[nodiscard]] static Result<models::MeasurementCounts, ProtocolFailure> DecodeCounts(
        std::span<const uint8_t> bytes);

    StateCodec() = delete;
};

}
