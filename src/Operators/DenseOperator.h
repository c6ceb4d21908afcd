#pragma once

#include <functional>
#include <ranges>
#include <string>
#include <utility>
#include <vector>

#include <Eigen/Dense>
#include <fmt/format.h>

#include "Pauli/Pauli.hpp"
#include "Pauli/Phase.hpp"
#include "SparseOperator.h"

namespace qpauli {

// A global phase together with one Pauli per qubit, identities included.
// The length is fixed at construction. Binary operations require operands of
// equal length and throw LengthMismatch otherwise; there is no implicit
// padding with identities.
class DenseOperator {
  public:
    DenseOperator();
    explicit DenseOperator(const std::vector<Pauli>& paulis);
    DenseOperator(Phase phase, const std::vector<Pauli>& paulis);

    // Parses strings such as "XIZ", "-YY" or "+iXYZ".
    static DenseOperator from_string(const std::string& s);

    static DenseOperator from_sparse(const SparseOperator& op, Phase phase=Phase::one());
    SparseOperator to_sparse() const;

    size_t length() const {
      return ops.size();
    }

    bool empty() const {
      return ops.empty();
    }

    Phase phase() const {
      return global_phase;
    }

    const std::vector<Pauli>& paulis() const {
      return ops;
    }

    Pauli get(size_t i) const {
      return ops.at(i);
    }

    size_t weight() const;

    bool hermitian() const {
      return global_phase.is_real();
    }

    // The views refer to this operator and must not outlive it, so they are
    // not available on temporaries.
    auto non_trivial_positions() const& {
      return std::views::iota(size_t{0}, ops.size())
        | std::views::filter([this](size_t i) { return is_non_trivial(ops[i]); });
    }

    auto non_trivial_paulis() const& {
      return non_trivial_positions()
        | std::views::transform([this](size_t i) { return std::make_pair(i, ops[i]); });
    }

    void non_trivial_positions() const&& = delete;
    void non_trivial_paulis() const&& = delete;

    bool commutes_with(const DenseOperator& other) const;
    bool anticommutes_with(const DenseOperator& other) const;

    // Phases picked up at every site are accumulated into the phase of the product.
    DenseOperator multiply(const DenseOperator& other) const;
    DenseOperator multiply(Phase phase) const;

    // Multiplies every site by pauli from the right.
    DenseOperator multiply(Pauli pauli) const;

    DenseOperator operator*(const DenseOperator& other) const {
      return multiply(other);
    }

    DenseOperator operator*(Phase phase) const {
      return multiply(phase);
    }

    DenseOperator operator*(Pauli pauli) const {
      return multiply(pauli);
    }

    // Qubit 0 is the least significant tensor factor.
    Eigen::MatrixXcd to_matrix() const;

    std::string to_string() const;

    std::vector<char> serialize() const;
    static DenseOperator deserialize(const std::vector<char>& bytes);

    bool operator==(const DenseOperator& other) const = default;

  private:
    std::vector<Pauli> ops;
    Phase global_phase;

    void check_same_length(const DenseOperator& other) const;
};

inline DenseOperator operator*(Phase phase, const DenseOperator& op) {
  return op.multiply(phase);
}

inline DenseOperator operator*(Pauli pauli, const DenseOperator& op) {
  return op.multiply(pauli);
}

}

template <>
struct fmt::formatter<qpauli::DenseOperator> {
  constexpr auto parse(format_parse_context& ctx) const -> decltype(ctx.begin()) {
    return ctx.begin();
  }

  template <typename FormatContext>
  auto format(const qpauli::DenseOperator& op, FormatContext& ctx) const -> decltype(ctx.out()) {
    return fmt::format_to(ctx.out(), "{}", op.to_string());
  }
};

template <>
struct std::hash<qpauli::DenseOperator> {
  size_t operator()(const qpauli::DenseOperator& op) const noexcept {
    size_t seed = std::hash<qpauli::Phase>{}(op.phase());
    for (const auto p : op.paulis()) {
      seed = qpauli::hash_combine(seed, static_cast<size_t>(p));
    }

    return seed;
  }
};
