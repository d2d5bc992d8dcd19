#pragma once
#include "certdel/core/result.hpp"
#include "certdel/core/failures.hpp"
#include "certdel/enums/basis.hpp"
#include "certdel/models/measurement_counts.hpp"
#include <cstdint>
#include <vector>

namespace certdel::protocol::interfaces {

using protocol::Result;
using protocol::ProtocolFailure;
using enums::Basis;

/// Opaque identifier for a batch of prepared qubits held by a backend.
struct BackendHandle {
    uint64_t id = 0;

    bool operator==(const BackendHandle& other) const noexcept { return id == other.id; }
    bool operator!=(const BackendHandle& other) const noexcept { return id != other.id; }
};

/// One prepared position: the basis and the classical bit encoded in it.
struct QubitPreparation {
    Basis basis;
    bool value;
};

/**
 * @brief Quantum device or simulator that holds the ciphertext qubits
 *
 * Prepare takes one entry per position, in theta order. Measure returns a
 * histogram of outcome strings; an outcome lists one bit per position in the
 * same order, and a two-stage measurement joins the stages with a single
 * space, first-measured stage first.
 */
class IQuantumBackend {
public:
    virtual ~IQuantumBackend() = default;

    [[nodiscard]] virtual Result<BackendHandle, ProtocolFailure> Prepare(
        const std::vector<QubitPreparation>& plan) = 0;

    [[nodiscard]] virtual Result<models::MeasurementCounts, ProtocolFailure> Measure(
        BackendHandle handle,
        const std::vector<Basis>& bases) = 0;
};

}
