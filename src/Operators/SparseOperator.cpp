#include "SparseOperator.h"

#include <algorithm>
#include <numeric>
#include <stdexcept>

#include <glaze/glaze.hpp>

#include "Logger.hpp"

namespace qpauli {

struct SparseOperatorData {
  size_t num_qubits = 0;
  std::vector<size_t> positions;
  std::vector<uint8_t> paulis;
};

}

template<>
struct glz::meta<qpauli::SparseOperatorData> {
  using T = qpauli::SparseOperatorData;
  static constexpr auto value = glz::object(
    "num_qubits", &T::num_qubits,
    "positions", &T::positions,
    "paulis", &T::paulis
  );
};

namespace qpauli {

SparseOperator::SparseOperator() : num_qubits(0) {}

SparseOperator::SparseOperator(size_t length, const std::vector<size_t>& sites, const std::vector<Pauli>& values) : num_qubits(length) {
  if (sites.size() != values.size()) {
    log_and_throw(LengthMismatch(sites.size(), values.size()));
  }

  auto bad_site = std::ranges::find_if(sites, [length](size_t q) { return q >= length; });
  if (bad_site != sites.end()) {
    log_and_throw(OutOfBound(*bad_site, length));
  }

  std::vector<size_t> order(sites.size());
  std::iota(order.begin(), order.end(), 0);
  std::stable_sort(order.begin(), order.end(), [&sites](size_t a, size_t b) { return sites[a] < sites[b]; });

  positions.reserve(sites.size());
  paulis.reserve(sites.size());

  size_t num_merged = 0;
  for (const auto k : order) {
    if (!positions.empty() && positions.back() == sites[k]) {
      paulis.back() = qpauli::multiply(paulis.back(), values[k]);
      num_merged++;
    } else {
      positions.push_back(sites[k]);
      paulis.push_back(values[k]);
    }
  }

  // Compact away identities, which may have been given explicitly or produced by merging
  size_t num_kept = 0;
  for (size_t i = 0; i < positions.size(); i++) {
    if (is_non_trivial(paulis[i])) {
      positions[num_kept] = positions[i];
      paulis[num_kept] = paulis[i];
      num_kept++;
    }
  }
  size_t num_dropped = positions.size() - num_kept;
  positions.resize(num_kept);
  paulis.resize(num_kept);

  if (num_merged != 0 || num_dropped != 0) {
    Logger::log_warning(fmt::format("SparseOperator of length {}: merged {} duplicate positions and dropped {} identities.", length, num_merged, num_dropped));
  }
}

SparseOperator SparseOperator::from_canonical(size_t length, std::vector<size_t>&& sites, std::vector<Pauli>&& values) {
  SparseOperator op;
  op.num_qubits = length;
  op.positions = std::move(sites);
  op.paulis = std::move(values);
  return op;
}

SparseOperator SparseOperator::identity(size_t length) {
  return from_canonical(length, {}, {});
}

std::optional<Pauli> SparseOperator::get(size_t position) const {
  if (position >= num_qubits) {
    return std::nullopt;
  }

  auto it = std::lower_bound(positions.begin(), positions.end(), position);
  if (it != positions.end() && *it == position) {
    return paulis[std::distance(positions.begin(), it)];
  }

  return Pauli::I;
}

std::vector<std::pair<size_t, Pauli>> SparseOperator::entries() const {
  std::vector<std::pair<size_t, Pauli>> result(positions.size());
  for (size_t i = 0; i < positions.size(); i++) {
    result[i] = {positions[i], paulis[i]};
  }

  return result;
}

bool SparseOperator::commutes_with(const SparseOperator& other) const {
  size_t anticommuting_indices = 0;

  size_t i = 0;
  size_t j = 0;
  while (i < positions.size() && j < other.positions.size()) {
    if (positions[i] < other.positions[j]) {
      i++;
    } else if (other.positions[j] < positions[i]) {
      j++;
    } else {
      if (qpauli::anticommutes_with(paulis[i], other.paulis[j])) {
        anticommuting_indices++;
      }
      i++;
      j++;
    }
  }

  return anticommuting_indices % 2 == 0;
}

bool SparseOperator::anticommutes_with(const SparseOperator& other) const {
  return !commutes_with(other);
}

SparseOperator SparseOperator::multiply(const SparseOperator& other) const {
  if (num_qubits != other.num_qubits) {
    log_and_throw(LengthMismatch(num_qubits, other.num_qubits));
  }

  size_t n1 = positions.size();
  size_t n2 = other.positions.size();

  std::vector<size_t> sites;
  std::vector<Pauli> values;
  sites.reserve(n1 + n2);
  values.reserve(n1 + n2);

  size_t i = 0;
  size_t j = 0;
  while (i < n1 || j < n2) {
    if (j == n2 || (i < n1 && positions[i] < other.positions[j])) {
      sites.push_back(positions[i]);
      values.push_back(paulis[i]);
      i++;
    } else if (i == n1 || other.positions[j] < positions[i]) {
      sites.push_back(other.positions[j]);
      values.push_back(other.paulis[j]);
      j++;
    } else {
      Pauli p = qpauli::multiply(paulis[i], other.paulis[j]);
      if (is_non_trivial(p)) {
        sites.push_back(positions[i]);
        values.push_back(p);
      }
      i++;
      j++;
    }
  }

  return from_canonical(num_qubits, std::move(sites), std::move(values));
}

SparseOperator SparseOperator::x_part() const {
  std::vector<size_t> sites;
  std::vector<Pauli> values;
  for (size_t i = 0; i < positions.size(); i++) {
    if (paulis[i] != Pauli::Z) {
      sites.push_back(positions[i]);
      values.push_back(Pauli::X);
    }
  }

  return from_canonical(num_qubits, std::move(sites), std::move(values));
}

SparseOperator SparseOperator::z_part() const {
  std::vector<size_t> sites;
  std::vector<Pauli> values;
  for (size_t i = 0; i < positions.size(); i++) {
    if (paulis[i] != Pauli::X) {
      sites.push_back(positions[i]);
      values.push_back(Pauli::Z);
    }
  }

  return from_canonical(num_qubits, std::move(sites), std::move(values));
}

std::pair<SparseOperator, SparseOperator> SparseOperator::partition_x_and_z() const {
  return {x_part(), z_part()};
}

std::vector<size_t> SparseOperator::into_raw_positions() && {
  return std::move(positions);
}

std::vector<Pauli> SparseOperator::into_raw_paulis() && {
  return std::move(paulis);
}

std::pair<std::vector<size_t>, std::vector<Pauli>> SparseOperator::into_raw() && {
  return {std::move(positions), std::move(paulis)};
}

std::string SparseOperator::to_string() const {
  std::string s = "[";
  for (size_t i = 0; i < positions.size(); i++) {
    if (i != 0) {
      s += ", ";
    }
    s += fmt::format("({}, {})", positions[i], paulis[i]);
  }
  s += "]";

  return s;
}

std::vector<char> SparseOperator::serialize() const {
  SparseOperatorData data{num_qubits, positions, std::vector<uint8_t>(paulis.size())};
  std::transform(paulis.begin(), paulis.end(), data.paulis.begin(), [](Pauli p) { return static_cast<uint8_t>(p); });

  std::vector<char> bytes;
  auto write_error = glz::write_beve(data, bytes);
  if (write_error) {
    log_and_throw(std::runtime_error(fmt::format("Error writing SparseOperator to binary: \n{}", glz::format_error(write_error, bytes))));
  }

  return bytes;
}

SparseOperator SparseOperator::deserialize(const std::vector<char>& bytes) {
  SparseOperatorData data;
  auto parse_error = glz::read_beve(data, bytes);
  if (parse_error) {
    log_and_throw(std::runtime_error(fmt::format("Error reading SparseOperator from binary: \n{}", glz::format_error(parse_error, bytes))));
  }

  std::vector<Pauli> values(data.paulis.size());
  for (size_t i = 0; i < data.paulis.size(); i++) {
    if (data.paulis[i] > 3) {
      log_and_throw(std::runtime_error(fmt::format("Invalid Pauli code {} found while reading SparseOperator.", data.paulis[i])));
    }
    values[i] = static_cast<Pauli>(data.paulis[i]);
  }

  // Goes through validation so that corrupted data cannot break the invariants
  SparseOperator op(data.num_qubits, data.positions, values);
  Logger::log_info(fmt::format("Read SparseOperator of length {} with {} entries from {} bytes.", op.length(), op.weight(), bytes.size()));
  return op;
}

}
