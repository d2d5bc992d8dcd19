#include "certdel/serialization/state_codec.hpp"
#include "certdel/core/constants.hpp"
#include "certdel/core/format.hpp"
#include "certdel/protocol_state.pb.h"
#include <google/protobuf/io/coded_stream.h>
#include <google/protobuf/io/zero_copy_stream_impl_lite.h>
#include <google/protobuf/message.h>
#include <limits>
#include <string>

namespace certdel::protocol::serialization {

using enums::Basis;

namespace {

Result<std::vector<uint8_t>, ProtocolFailure> SerializeDeterministic(const google::protobuf::Message& message) {
    std::string output;
    {
        google::protobuf::io::StringOutputStream stream(&output);
        google::protobuf::io::CodedOutputStream coded_out(&stream);
        coded_out.SetSerializationDeterministic(true);
        if (!message.SerializeToCodedStream(&coded_out) || coded_out.HadError()) {
            return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
                ProtocolFailure::Encode(
                    compat::format("Failed to serialize {} deterministically", message.GetTypeName())));
        }
    }
    return Result<std::vector<uint8_t>, ProtocolFailure>::Ok(
        std::vector<uint8_t>(output.begin(), output.end()));
}

Result<Unit, ProtocolFailure> ParseInto(std::span<const uint8_t> bytes, google::protobuf::Message& message) {
    if (bytes.size() > static_cast<size_t>(std::numeric_limits<int>::max()) ||
        !message.ParseFromArray(bytes.data(), static_cast<int>(bytes.size()))) {
        return Result<Unit, ProtocolFailure>::Err(
            ProtocolFailure::Decode(compat::format("Malformed {} payload", message.GetTypeName())));
    }
    return Result<Unit, ProtocolFailure>::Ok(unit);
}

void PackBits(const gf2::BitString& bits, proto::PackedBits* out) {
    const auto bytes = bits.ToBytes();
    out->set_bit_length(bits.Size());
    out->set_data(std::string(bytes.begin(), bytes.end()));
}

Result<gf2::BitString, ProtocolFailure> UnpackBits(
    const proto::PackedBits& packed,
    const std::string_view field,
    const size_t expected_length) {
    if (packed.bit_length() != expected_length) {
        return Result<gf2::BitString, ProtocolFailure>::Err(
            ProtocolFailure::Decode(
                compat::format("Field {} has {} bits, expected {}", field, packed.bit_length(), expected_length)));
    }
    const auto& data = packed.data();
    auto bits = gf2::BitString::FromBytes(
        std::span<const uint8_t>(reinterpret_cast<const uint8_t*>(data.data()), data.size()),
        expected_length);
    if (bits.IsErr()) {
        return Result<gf2::BitString, ProtocolFailure>::Err(
            ProtocolFailure::Decode(compat::format("Field {}: {}", field, bits.UnwrapErr().message)));
    }
    return bits;
}

void PackMatrix(const gf2::BitMatrix& matrix, proto::PackedMatrix* out) {
    out->set_rows(matrix.Rows());
    out->set_cols(matrix.Cols());
    for (size_t r = 0; r < matrix.Rows(); ++r) {
        const auto bytes = matrix.Row(r).ToBytes();
        out->add_row_data(std::string(bytes.begin(), bytes.end()));
    }
}

Result<gf2::BitMatrix, ProtocolFailure> UnpackMatrix(
    const proto::PackedMatrix& packed,
    const std::string_view field,
    const size_t rows,
    const size_t cols) {
    if (packed.rows() != rows || packed.cols() != cols ||
        static_cast<size_t>(packed.row_data_size()) != rows) {
        return Result<gf2::BitMatrix, ProtocolFailure>::Err(
            ProtocolFailure::Decode(
                compat::format("Matrix {} is {}x{} with {} rows of data, expected {}x{}",
                               field, packed.rows(), packed.cols(), packed.row_data_size(), rows, cols)));
    }
    std::vector<gf2::BitString> parsed;
    parsed.reserve(rows);
    for (const auto& row : packed.row_data()) {
        auto bits = gf2::BitString::FromBytes(
            std::span<const uint8_t>(reinterpret_cast<const uint8_t*>(row.data()), row.size()), cols);
        if (bits.IsErr()) {
            return Result<gf2::BitMatrix, ProtocolFailure>::Err(
                ProtocolFailure::Decode(compat::format("Matrix {}: {}", field, bits.UnwrapErr().message)));
        }
        parsed.push_back(std::move(bits).Unwrap());
    }
    return gf2::BitMatrix::FromRows(std::move(parsed), cols);
}

bool IsOutcomeCharacter(const char ch) {
    return ch == Constants::BIT_ZERO || ch == Constants::BIT_ONE || ch == Constants::STAGE_SEPARATOR;
}

} // namespace

Result<std::vector<uint8_t>, ProtocolFailure> StateCodec::EncodeSchemeParameters(
    const configuration::SchemeParameters& params) {
    proto::SchemeParametersState state;
    state.set_lambda(params.Lambda());
    state.set_n(params.N());
    state.set_m(params.M());
    state.set_k(params.K());
    state.set_s(params.S());
    state.set_tau(params.Tau());
    state.set_mu(params.Mu());
    state.set_delta(params.Delta());
    state.set_code_name(params.CodeName());
    return SerializeDeterministic(state);
}

Result<configuration::SchemeParameters, ProtocolFailure> StateCodec::DecodeSchemeParameters(
    std::span<const uint8_t> bytes) {
    proto::SchemeParametersState state;
    if (auto parsed = ParseInto(bytes, state); parsed.IsErr()) {
        return Result<configuration::SchemeParameters, ProtocolFailure>::Err(std::move(parsed).UnwrapErr());
    }
    return configuration::SchemeParameters::CreateWithTotal(
        state.lambda(), state.n(), state.m(), state.k(), state.s(),
        state.tau(), state.mu(), state.delta(), state.code_name());
}

Result<std::vector<uint8_t>, ProtocolFailure> StateCodec::EncodeKey(const models::Key& key) {
    proto::KeyState state;
    for (const Basis basis : key.Theta()) {
        state.add_theta(basis == Basis::Hadamard ? proto::BASIS_HADAMARD : proto::BASIS_COMPUTATIONAL);
    }
    PackBits(key.RBar(), state.mutable_r_bar());
    PackBits(key.U(), state.mutable_u());
    PackBits(key.D(), state.mutable_d());
    PackBits(key.E(), state.mutable_e());
    PackMatrix(key.PrivacyAmplificationMatrix(), state.mutable_privacy_amplification());
    PackMatrix(key.ErrorCorrectionMatrix(), state.mutable_error_correction());
    return SerializeDeterministic(state);
}

Result<models::Key, ProtocolFailure> StateCodec::DecodeKey(
    std::span<const uint8_t> bytes,
    const configuration::SchemeParameters& params) {
    using ResultType = Result<models::Key, ProtocolFailure>;
    proto::KeyState state;
    if (auto parsed = ParseInto(bytes, state); parsed.IsErr()) {
        return ResultType::Err(std::move(parsed).UnwrapErr());
    }

    std::vector<Basis> theta;
    theta.reserve(static_cast<size_t>(state.theta_size()));
    for (const int tag : state.theta()) {
        if (tag == proto::BASIS_HADAMARD) {
            theta.push_back(Basis::Hadamard);
        } else if (tag == proto::BASIS_COMPUTATIONAL) {
            theta.push_back(Basis::Computational);
        } else {
            return ResultType::Err(ProtocolFailure::Decode(compat::format("Unknown basis tag {}", tag)));
        }
    }

    auto r_bar = UnpackBits(state.r_bar(), "r_bar", params.K());
    if (r_bar.IsErr()) {
        return ResultType::Err(std::move(r_bar).UnwrapErr());
    }
    auto u = UnpackBits(state.u(), "u", params.N());
    if (u.IsErr()) {
        return ResultType::Err(std::move(u).UnwrapErr());
    }
    auto d = UnpackBits(state.d(), "d", params.Tau());
    if (d.IsErr()) {
        return ResultType::Err(std::move(d).UnwrapErr());
    }
    auto e = UnpackBits(state.e(), "e", params.Mu());
    if (e.IsErr()) {
        return ResultType::Err(std::move(e).UnwrapErr());
    }
    auto privacy_amplification = UnpackMatrix(state.privacy_amplification(), "privacy_amplification",
                                              params.S(), params.N());
    if (privacy_amplification.IsErr()) {
        return ResultType::Err(std::move(privacy_amplification).UnwrapErr());
    }
    auto error_correction = UnpackMatrix(state.error_correction(), "error_correction", params.S(), params.Tau());
    if (error_correction.IsErr()) {
        return ResultType::Err(std::move(error_correction).UnwrapErr());
    }

    auto key = models::Key::FromParts(
        params,
        std::move(theta),
        std::move(r_bar).Unwrap(),
        std::move(u).Unwrap(),
        std::move(d).Unwrap(),
        std::move(e).Unwrap(),
        std::move(privacy_amplification).Unwrap(),
        std::move(error_correction).Unwrap());
    if (key.IsErr()) {
        return ResultType::Err(ProtocolFailure::Decode(key.UnwrapErr().message));
    }
    return key;
}

Result<std::vector<uint8_t>, ProtocolFailure> StateCodec::EncodeCiphertext(const models::Ciphertext& ciphertext) {
    proto::CiphertextState state;
    PackBits(ciphertext.C(), state.mutable_c());
    PackBits(ciphertext.P(), state.mutable_p());
    PackBits(ciphertext.Q(), state.mutable_q());
    if (ciphertext.Handle().has_value()) {
        state.set_backend_handle(ciphertext.Handle()->id);
    }
    return SerializeDeterministic(state);
}

Result<models::Ciphertext, ProtocolFailure> StateCodec::DecodeCiphertext(
    std::span<const uint8_t> bytes,
    const configuration::SchemeParameters& params) {
    using ResultType = Result<models::Ciphertext, ProtocolFailure>;
    proto::CiphertextState state;
    if (auto parsed = ParseInto(bytes, state); parsed.IsErr()) {
        return ResultType::Err(std::move(parsed).UnwrapErr());
    }
    auto c = UnpackBits(state.c(), "c", params.N());
    if (c.IsErr()) {
        return ResultType::Err(std::move(c).UnwrapErr());
    }
    auto p = UnpackBits(state.p(), "p", params.Tau());
    if (p.IsErr()) {
        return ResultType::Err(std::move(p).UnwrapErr());
    }
    auto q = UnpackBits(state.q(), "q", params.Mu());
    if (q.IsErr()) {
        return ResultType::Err(std::move(q).UnwrapErr());
    }
    std::optional<interfaces::BackendHandle> handle;
    if (state.has_backend_handle()) {
        handle = interfaces::BackendHandle{state.backend_handle()};
    }
    return ResultType::Ok(models::Ciphertext(
        std::move(c).Unwrap(), std::move(p).Unwrap(), std::move(q).Unwrap(), handle));
}

Result<std::vector<uint8_t>, ProtocolFailure> StateCodec::EncodeCounts(const models::MeasurementCounts& counts) {
    proto::MeasurementCountsState state;
    for (const auto& [outcome, count] : counts) {
        auto* entry = state.add_entries();
        entry->set_outcome(outcome);
        entry->set_count(count);
    }
    return SerializeDeterministic(state);
}

Result<models::MeasurementCounts, ProtocolFailure> StateCodec::DecodeCounts(std::span<const uint8_t> bytes) {
    using ResultType = Result<models::MeasurementCounts, ProtocolFailure>;
    proto::MeasurementCountsState state;
    if (auto parsed = ParseInto(bytes, state); parsed.IsErr()) {
        return ResultType::Err(std::move(parsed).UnwrapErr());
    }
    models::MeasurementCounts counts;
    for (const auto& entry : state.entries()) {
        const auto& outcome = entry.outcome();
        for (const char ch : outcome) {
            if (!IsOutcomeCharacter(ch)) {
                return ResultType::Err(
                    ProtocolFailure::Decode(compat::format("Outcome '{}' contains an invalid character", outcome)));
            }
        }
        if (!counts.emplace(outcome, entry.count()).second) {
            return ResultType::Err(
                ProtocolFailure::Decode(compat::format("Outcome '{}' appears more than once", outcome)));
        }
    }
    return ResultType::Ok(std::move(counts));
}

}
