#include "certdel/protocol/encryption.hpp"
#include "certdel/gf2/linear_algebra.hpp"
#include "certdel/debug/key_logger.hpp"
#include "certdel/core/format.hpp"

namespace certdel::protocol {

using enums::Basis;

namespace {

Result<Unit, ProtocolFailure> CheckDimensions(
    const gf2::BitString& message,
    const models::Key& key,
    const configuration::SchemeParameters& params,
    const gf2::BitString& r) {
    if (message.Size() != params.N()) {
        return Result<Unit, ProtocolFailure>::Err(
            ProtocolFailure::LengthMismatch(
                compat::format("Message has {} bits, scheme encrypts {}", message.Size(), params.N())));
    }
    if (r.Size() != params.S()) {
        return Result<Unit, ProtocolFailure>::Err(
            ProtocolFailure::LengthMismatch(
                compat::format("Pad seed r has {} bits, expected {}", r.Size(), params.S())));
    }
    if (key.TotalPositions() != params.M() || key.HadamardCount() != params.K()) {
        return Result<Unit, ProtocolFailure>::Err(
            ProtocolFailure::LengthMismatch(
                compat::format("Key covers {} positions ({} Hadamard), scheme needs {} ({})",
                               key.TotalPositions(), key.HadamardCount(), params.M(), params.K())));
    }
    return Result<Unit, ProtocolFailure>::Ok(unit);
}

} // namespace

Result<EncryptionOutput, ProtocolFailure> Encryption::Encrypt(
    const gf2::BitString& message,
    const models::Key& key,
    const configuration::SchemeParameters& params,
    crypto::RandomSource& random,
    interfaces::IQuantumBackend* backend) {
    if (message.Size() != params.N()) {
        return Result<EncryptionOutput, ProtocolFailure>::Err(
            ProtocolFailure::LengthMismatch(
                compat::format("Message has {} bits, scheme encrypts {}", message.Size(), params.N())));
    }
    auto r = gf2::BitString::Random(params.S(), random);
    if (r.IsErr()) {
        return Result<EncryptionOutput, ProtocolFailure>::Err(std::move(r).UnwrapErr());
    }
    return EncryptWithSample(message, key, params, std::move(r).Unwrap(), backend);
}

Result<EncryptionOutput, ProtocolFailure> Encryption::EncryptWithSample(
    const gf2::BitString& message,
    const models::Key& key,
    const configuration::SchemeParameters& params,
    gf2::BitString r,
    interfaces::IQuantumBackend* backend) {
    if (auto check = CheckDimensions(message, key, params, r); check.IsErr()) {
        return Result<EncryptionOutput, ProtocolFailure>::Err(std::move(check).UnwrapErr());
    }

    auto x = gf2::MatVecMod2(r, key.PrivacyAmplificationMatrix());
    if (x.IsErr()) {
        return Result<EncryptionOutput, ProtocolFailure>::Err(std::move(x).UnwrapErr());
    }
    auto ec_hash = gf2::MatVecMod2(r, key.ErrorCorrectionMatrix());
    if (ec_hash.IsErr()) {
        return Result<EncryptionOutput, ProtocolFailure>::Err(std::move(ec_hash).UnwrapErr());
    }
    auto p = gf2::Xor(ec_hash.Unwrap(), key.D());
    if (p.IsErr()) {
        return Result<EncryptionOutput, ProtocolFailure>::Err(std::move(p).UnwrapErr());
    }
    auto q = gf2::Xor(params.Synd(r), key.E());
    if (q.IsErr()) {
        return Result<EncryptionOutput, ProtocolFailure>::Err(std::move(q).UnwrapErr());
    }
    auto c = gf2::Xor(message, x.Unwrap(), key.U());
    if (c.IsErr()) {
        return Result<EncryptionOutput, ProtocolFailure>::Err(std::move(c).UnwrapErr());
    }

    std::optional<interfaces::BackendHandle> handle;
    if (backend != nullptr) {
        auto plan = BuildPreparationPlan(key, r);
        if (plan.IsErr()) {
            return Result<EncryptionOutput, ProtocolFailure>::Err(std::move(plan).UnwrapErr());
        }
        auto prepared = backend->Prepare(plan.Unwrap());
        if (prepared.IsErr()) {
            return Result<EncryptionOutput, ProtocolFailure>::Err(
                ProtocolFailure::BackendFailure(
                    compat::format("Backend rejected preparation: {}", prepared.UnwrapErr().message)));
        }
        handle = prepared.Unwrap();
    }

    debug::LogEncryption(debug::Side::Sender, r, x.Unwrap(), c.Unwrap(), p.Unwrap(), q.Unwrap(),
                         handle.has_value());

    return Result<EncryptionOutput, ProtocolFailure>::Ok(EncryptionOutput{
        .ciphertext = models::Ciphertext(
            std::move(c).Unwrap(), std::move(p).Unwrap(), std::move(q).Unwrap(), handle),
        .r = std::move(r)
    });
}

Result<std::vector<interfaces::QubitPreparation>, ProtocolFailure> Encryption::BuildPreparationPlan(
    const models::Key& key,
    const gf2::BitString& r) {
    if (r.Size() != key.ComputationalCount()) {
        return Result<std::vector<interfaces::QubitPreparation>, ProtocolFailure>::Err(
            ProtocolFailure::LengthMismatch(
                compat::format("Pad seed r has {} bits, key has {} computational positions",
                               r.Size(), key.ComputationalCount())));
    }
    std::vector<interfaces::QubitPreparation> plan;
    plan.reserve(key.TotalPositions());
    size_t next_computational = 0;
    size_t next_hadamard = 0;
    for (const Basis basis : key.Theta()) {
        if (basis == Basis::Computational) {
            plan.push_back({basis, r.Get(next_computational++)});
        } else {
            plan.push_back({basis, key.RBar().Get(next_hadamard++)});
        }
    }
    return Result<std::vector<interfaces::QubitPreparation>, ProtocolFailure>::Ok(std::move(plan));
}

}
