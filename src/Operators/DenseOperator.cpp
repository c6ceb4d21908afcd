#include "DenseOperator.h"

#include <algorithm>
#include <stdexcept>

#include <unsupported/Eigen/KroneckerProduct>
#include <glaze/glaze.hpp>

#include "Logger.hpp"
#include "Pauli/PauliError.hpp"

namespace qpauli {

struct DenseOperatorData {
  uint8_t phase = 0;
  std::vector<uint8_t> paulis;
};

}

template<>
struct glz::meta<qpauli::DenseOperatorData> {
  using T = qpauli::DenseOperatorData;
  static constexpr auto value = glz::object(
    "phase", &T::phase,
    "paulis", &T::paulis
  );
};

namespace qpauli {

// Dense operators are expanded into 2^n x 2^n matrices
static constexpr size_t max_matrix_qubits = 12;

static Phase parse_phase(std::string& s) {
  if (s.rfind("+", 0) == 0) {
    if (s.rfind("+i", 0) == 0) {
      s = s.substr(2);
      return Phase::i();
    } else {
      s = s.substr(1);
      return Phase::one();
    }
  } else if (s.rfind("-", 0) == 0) {
    if (s.rfind("-i", 0) == 0) {
      s = s.substr(2);
      return Phase::minus_i();
    } else {
      s = s.substr(1);
      return Phase::minus_one();
    }
  }

  return Phase::one();
}

static std::string phase_prefix(Phase phase) {
  switch (phase.exponent()) {
    case 0: return "+";
    case 1: return "+i";
    case 2: return "-";
    default: return "-i";
  }
}

DenseOperator::DenseOperator() : global_phase(Phase::one()) {}

DenseOperator::DenseOperator(const std::vector<Pauli>& paulis) : ops(paulis), global_phase(Phase::one()) {}

DenseOperator::DenseOperator(Phase phase, const std::vector<Pauli>& paulis) : ops(paulis), global_phase(phase) {}

DenseOperator DenseOperator::from_string(const std::string& paulis) {
  std::string s = paulis;
  Phase phase = parse_phase(s);

  std::vector<Pauli> ops;
  ops.reserve(s.size());
  for (const char c : s) {
    try {
      ops.push_back(pauli_from_char(c));
    } catch (const std::invalid_argument& e) {
      log_and_throw(std::invalid_argument(fmt::format("Invalid string {} used to create DenseOperator: {}", paulis, e.what())));
    }
  }

  return DenseOperator(phase, ops);
}

DenseOperator DenseOperator::from_sparse(const SparseOperator& op, Phase phase) {
  std::vector<Pauli> paulis(op.length(), Pauli::I);
  const auto& positions = op.non_trivial_positions();
  const auto& values = op.non_trivial_paulis();
  for (size_t i = 0; i < positions.size(); i++) {
    paulis[positions[i]] = values[i];
  }

  return DenseOperator(phase, paulis);
}

SparseOperator DenseOperator::to_sparse() const {
  std::vector<size_t> positions;
  std::vector<Pauli> values;
  for (const auto& [i, p] : non_trivial_paulis()) {
    positions.push_back(i);
    values.push_back(p);
  }

  return SparseOperator(length(), positions, values);
}

size_t DenseOperator::weight() const {
  return std::ranges::count_if(ops, [](Pauli p) { return is_non_trivial(p); });
}

void DenseOperator::check_same_length(const DenseOperator& other) const {
  if (length() != other.length()) {
    log_and_throw(LengthMismatch(length(), other.length()));
  }
}

bool DenseOperator::commutes_with(const DenseOperator& other) const {
  check_same_length(other);

  size_t anticommuting_indices = 0;
  for (size_t i = 0; i < ops.size(); i++) {
    if (qpauli::anticommutes_with(ops[i], other.ops[i])) {
      anticommuting_indices++;
    }
  }

  return anticommuting_indices % 2 == 0;
}

bool DenseOperator::anticommutes_with(const DenseOperator& other) const {
  return !commutes_with(other);
}

DenseOperator DenseOperator::multiply(const DenseOperator& other) const {
  check_same_length(other);

  Phase phase = Phase::one();
  std::vector<Pauli> paulis(ops.size());
  for (size_t i = 0; i < ops.size(); i++) {
    auto [site_phase, p] = multiply_with_phase(ops[i], other.ops[i]);
    phase *= site_phase;
    paulis[i] = p;
  }

  return DenseOperator(phase * global_phase * other.global_phase, paulis);
}

DenseOperator DenseOperator::multiply(Phase phase) const {
  return DenseOperator(global_phase * phase, ops);
}

DenseOperator DenseOperator::multiply(Pauli pauli) const {
  Phase phase = Phase::one();
  std::vector<Pauli> paulis(ops.size());
  for (size_t i = 0; i < ops.size(); i++) {
    auto [site_phase, p] = multiply_with_phase(ops[i], pauli);
    phase *= site_phase;
    paulis[i] = p;
  }

  return DenseOperator(global_phase * phase, paulis);
}

Eigen::MatrixXcd DenseOperator::to_matrix() const {
  if (ops.size() > max_matrix_qubits) {
    log_and_throw(std::invalid_argument(fmt::format("Cannot build the matrix of a {}-qubit DenseOperator; at most {} qubits are supported.", ops.size(), max_matrix_qubits)));
  }

  Eigen::MatrixXcd g = Eigen::MatrixXcd::Identity(1, 1);
  for (const auto p : ops) {
    Eigen::MatrixXcd gi = pauli_to_matrix(p);
    Eigen::MatrixXcd g0 = g;
    g = Eigen::kroneckerProduct(gi, g0);
  }

  return global_phase.to_complex() * g;
}

std::string DenseOperator::to_string() const {
  std::string s = phase_prefix(global_phase);
  for (const auto p : ops) {
    s += pauli_to_char(p);
  }

  return s;
}

std::vector<char> DenseOperator::serialize() const {
  DenseOperatorData data{global_phase.exponent(), std::vector<uint8_t>(ops.size())};
  std::transform(ops.begin(), ops.end(), data.paulis.begin(), [](Pauli p) { return static_cast<uint8_t>(p); });

  std::vector<char> bytes;
  auto write_error = glz::write_beve(data, bytes);
  if (write_error) {
    log_and_throw(std::runtime_error(fmt::format("Error writing DenseOperator to binary: \n{}", glz::format_error(write_error, bytes))));
  }

  return bytes;
}

DenseOperator DenseOperator::deserialize(const std::vector<char>& bytes) {
  DenseOperatorData data;
  auto parse_error = glz::read_beve(data, bytes);
  if (parse_error) {
    log_and_throw(std::runtime_error(fmt::format("Error reading DenseOperator from binary: \n{}", glz::format_error(parse_error, bytes))));
  }

  if (data.phase > 3) {
    log_and_throw(std::runtime_error(fmt::format("Invalid phase exponent {} found while reading DenseOperator.", data.phase)));
  }

  std::vector<Pauli> paulis(data.paulis.size());
  for (size_t i = 0; i < data.paulis.size(); i++) {
    if (data.paulis[i] > 3) {
      log_and_throw(std::runtime_error(fmt::format("Invalid Pauli code {} found while reading DenseOperator.", data.paulis[i])));
    }
    paulis[i] = static_cast<Pauli>(data.paulis[i]);
  }

  Logger::log_info(fmt::format("Read DenseOperator of length {} from {} bytes.", paulis.size(), bytes.size()));
  return DenseOperator(Phase::from_exponent(data.phase), paulis);
}

}
