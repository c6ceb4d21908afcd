#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <utility>

#include <Eigen/Dense>
#include <fmt/format.h>

#include "Phase.hpp"

namespace qpauli {

// Single-qubit Pauli without a phase. Values are the symplectic bits
// x | (z << 1), so that the phase-free product of two Paulis is the XOR of
// their codes.
enum Pauli {
  I, X, Z, Y
};

constexpr bool commutes_with(Pauli p1, Pauli p2) {
  return p1 == Pauli::I || p2 == Pauli::I || p1 == p2;
}

constexpr bool anticommutes_with(Pauli p1, Pauli p2) {
  return !commutes_with(p1, p2);
}

constexpr bool is_trivial(Pauli p) {
  return p == Pauli::I;
}

constexpr bool is_non_trivial(Pauli p) {
  return p != Pauli::I;
}

// Product up to a phase. Commutative.
constexpr Pauli multiply(Pauli p1, Pauli p2) {
  return static_cast<Pauli>(static_cast<uint8_t>(p1) ^ static_cast<uint8_t>(p2));
}

constexpr Pauli operator*(Pauli p1, Pauli p2) {
  return multiply(p1, p2);
}

constexpr Pauli& operator*=(Pauli& p1, Pauli p2) {
  p1 = multiply(p1, p2);
  return p1;
}

// Power of i picked up by p1*p2; one of -1, 0, 1.
constexpr int compute_phase(uint8_t xz1, uint8_t xz2) {
  bool x1 = (xz1 >> 0u) & 1u;
  bool z1 = (xz1 >> 1u) & 1u;
  bool x2 = (xz2 >> 0u) & 1u;
  bool z2 = (xz2 >> 1u) & 1u;
  if (!x1 && !z1) {
    return 0;
  } else if (x1 && z1) {
    if (z2) {
      return x2 ? 0 : 1;
    } else {
      return x2 ? -1 : 0;
    }
  } else if (x1 && !z1) {
    if (z2) {
      return x2 ? 1 : -1;
    } else {
      return 0;
    }
  } else {
    if (x2) {
      return z2 ? -1 : 1;
    } else {
      return 0;
    }
  }
}

constexpr std::array<std::pair<Phase, Pauli>, 16> generate_multiplication_table() {
  std::array<std::pair<Phase, Pauli>, 16> table{};
  for (uint8_t xz1 = 0; xz1 < 4; xz1++) {
    for (uint8_t xz2 = 0; xz2 < 4; xz2++) {
      int k = compute_phase(xz1, xz2);
      Phase phase = (k == 0) ? Phase::one() : ((k == 1) ? Phase::i() : Phase::minus_i());
      table[xz2 + (xz1 << 2u)] = std::make_pair(phase, static_cast<Pauli>(xz1 ^ xz2));
    }
  }

  return table;
}

// p1*p2 as an exact (phase, Pauli) pair, e.g. X*Y = (i, Z) and Y*X = (-i, Z).
constexpr std::pair<Phase, Pauli> multiply_with_phase(Pauli p1, Pauli p2) {
  constexpr auto table = generate_multiplication_table();
  return table[static_cast<uint8_t>(p2) + (static_cast<uint8_t>(p1) << 2u)];
}

inline char pauli_to_char(Pauli p) {
  switch (p) {
    case Pauli::I: return 'I';
    case Pauli::X: return 'X';
    case Pauli::Y: return 'Y';
    case Pauli::Z: return 'Z';
  }

  throw std::runtime_error("Unreachable.");
}

inline Pauli pauli_from_char(char c) {
  switch (c) {
    case 'I': return Pauli::I;
    case 'X': return Pauli::X;
    case 'Y': return Pauli::Y;
    case 'Z': return Pauli::Z;
  }

  throw std::invalid_argument(fmt::format("Character '{}' is not one of I, X, Y, Z.", c));
}

// Boost-style mixing, used by the std::hash specializations of the operators
inline size_t hash_combine(size_t seed, size_t value) {
  return seed ^ (value + 0x9e3779b97f4a7c15ull + (seed << 6) + (seed >> 2));
}

inline Eigen::Matrix2cd pauli_to_matrix(Pauli p) {
  Eigen::Matrix2cd g;
  if (p == Pauli::I) {
    g << 1, 0, 0, 1;
  } else if (p == Pauli::X) {
    g << 0, 1, 1, 0;
  } else if (p == Pauli::Y) {
    g << 0, std::complex<double>(0.0, -1.0), std::complex<double>(0.0, 1.0), 0;
  } else {
    g << 1, 0, 0, -1;
  }

  return g;
}

}

template <>
struct fmt::formatter<qpauli::Pauli> {
  constexpr auto parse(format_parse_context& ctx) const -> decltype(ctx.begin()) {
    return ctx.begin();
  }

  template <typename FormatContext>
  auto format(qpauli::Pauli p, FormatContext& ctx) const -> decltype(ctx.out()) {
    return fmt::format_to(ctx.out(), "{}", qpauli::pauli_to_char(p));
  }
};
