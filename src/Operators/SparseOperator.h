#pragma once

#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <fmt/format.h>

#include "Pauli/Pauli.hpp"
#include "Pauli/PauliError.hpp"

namespace qpauli {

// A Pauli operator which only stores its non-identity sites, e.g. XIYIZ is
// stored as X_0 Y_2 Z_4 with length 5. The global phase is not tracked.
//
// Invariants: positions are strictly increasing and smaller than the length,
// and no stored value is I.
class SparseOperator {
  public:
    SparseOperator();

    // Throws LengthMismatch if sites and values have different sizes, or
    // OutOfBound for the first position which is not smaller than length.
    // Entries are sorted; repeated positions are multiplied together and
    // identities are discarded.
    SparseOperator(size_t length, const std::vector<size_t>& sites, const std::vector<Pauli>& values);

    static SparseOperator identity(size_t length);

    // Returns I for sites without an entry, and nothing if position >= length().
    std::optional<Pauli> get(size_t position) const;

    size_t length() const {
      return num_qubits;
    }

    size_t weight() const {
      return positions.size();
    }

    const std::vector<size_t>& non_trivial_positions() const {
      return positions;
    }

    const std::vector<Pauli>& non_trivial_paulis() const {
      return paulis;
    }

    std::vector<std::pair<size_t, Pauli>> entries() const;

    // Operators of different length are allowed; only sites stored in both
    // operators can contribute.
    bool commutes_with(const SparseOperator& other) const;
    bool anticommutes_with(const SparseOperator& other) const;

    // Site-wise product, ignoring phase. Throws LengthMismatch if the lengths differ.
    SparseOperator multiply(const SparseOperator& other) const;

    SparseOperator operator*(const SparseOperator& other) const {
      return multiply(other);
    }

    // X and Z factors of the operator: Y contributes to both, so that
    // x_part() * z_part() equals the operator up to phase.
    SparseOperator x_part() const;
    SparseOperator z_part() const;
    std::pair<SparseOperator, SparseOperator> partition_x_and_z() const;

    std::vector<size_t> into_raw_positions() &&;
    std::vector<Pauli> into_raw_paulis() &&;
    std::pair<std::vector<size_t>, std::vector<Pauli>> into_raw() &&;

    std::string to_string() const;

    std::vector<char> serialize() const;
    static SparseOperator deserialize(const std::vector<char>& bytes);

    bool operator==(const SparseOperator& other) const = default;

  private:
    size_t num_qubits;
    std::vector<size_t> positions;
    std::vector<Pauli> paulis;

    // Skips validation; callers guarantee the invariants.
    static SparseOperator from_canonical(size_t length, std::vector<size_t>&& sites, std::vector<Pauli>&& values);
};

}

template <>
struct fmt::formatter<qpauli::SparseOperator> {
  constexpr auto parse(format_parse_context& ctx) const -> decltype(ctx.begin()) {
    return ctx.begin();
  }

  template <typename FormatContext>
  auto format(const qpauli::SparseOperator& op, FormatContext& ctx) const -> decltype(ctx.out()) {
    return fmt::format_to(ctx.out(), "{}", op.to_string());
  }
};

template <>
struct std::hash<qpauli::SparseOperator> {
  size_t operator()(const qpauli::SparseOperator& op) const noexcept {
    size_t seed = std::hash<size_t>{}(op.length());
    const auto& positions = op.non_trivial_positions();
    const auto& paulis = op.non_trivial_paulis();
    for (size_t i = 0; i < positions.size(); i++) {
      seed = qpauli::hash_combine(seed, positions[i]);
      seed = qpauli::hash_combine(seed, static_cast<size_t>(paulis[i]));
    }

    return seed;
  }
};
