#include "tests.hpp"

#include <cstdlib>
#include <filesystem>
#include <unordered_map>
#include <unordered_set>

template <typename T>
concept has_non_trivial_views = requires(T&& op) {
  std::forward<T>(op).non_trivial_positions().begin();
  std::forward<T>(op).non_trivial_paulis().begin();
};

// The views refer to the operator they were taken from, so taking them from a
// temporary must not compile.
static_assert(has_non_trivial_views<DenseOperator&>);
static_assert(has_non_trivial_views<const DenseOperator&>);
static_assert(!has_non_trivial_views<DenseOperator>);
static_assert(!has_non_trivial_views<const DenseOperator>);

template <typename View>
std::vector<std::ranges::range_value_t<View>> collect(View&& view) {
  std::vector<std::ranges::range_value_t<View>> values;
  for (auto v : view) {
    values.push_back(v);
  }
  return values;
}

bool test_dense_construction() {
  DenseOperator op({X, I, Y, I, Z, I});

  ASSERT(op.length() == 6);
  ASSERT(!op.empty());
  ASSERT(op.phase() == Phase::one());
  ASSERT(op.paulis() == std::vector<Pauli>({X, I, Y, I, Z, I}));
  ASSERT(op.get(2) == Y);
  ASSERT(op.weight() == 3);
  ASSERT(throws<std::out_of_range>([&op]() { op.get(6); }));

  DenseOperator with_phase(Phase::minus_i(), {X, Y, Z});
  ASSERT(with_phase.phase() == Phase::minus_i());
  ASSERT(with_phase.length() == 3);

  DenseOperator empty;
  ASSERT(empty.empty() && empty.length() == 0);
  ASSERT(empty.phase() == Phase::one());

  return true;
}

bool test_dense_non_trivial_views() {
  DenseOperator op({X, I, Y, I, Z, I});

  ASSERT(collect(op.non_trivial_positions()) == std::vector<size_t>({0, 2, 4}));

  std::vector<std::pair<size_t, Pauli>> expected = {{0, X}, {2, Y}, {4, Z}};
  ASSERT(collect(op.non_trivial_paulis()) == expected);

  // Views can be traversed more than once
  auto positions = op.non_trivial_positions();
  ASSERT(collect(positions) == collect(positions));

  DenseOperator identity({I, I});
  ASSERT(collect(identity.non_trivial_positions()).empty());
  ASSERT(collect(identity.non_trivial_paulis()).empty());

  // Taken from a named operator, the views stay valid across a loop
  DenseOperator wide(std::vector<Pauli>(64, X));
  size_t count = 0;
  for (auto i : wide.non_trivial_positions()) {
    ASSERT(i == count);
    count++;
  }
  ASSERT(count == 64);

  return true;
}

bool test_dense_commutation() {
  DenseOperator first({X, Y, Z});
  DenseOperator second({Y, Y, Y});
  DenseOperator third({I, X, I});

  ASSERT(first.commutes_with(second));
  ASSERT(!first.commutes_with(third));
  ASSERT(!second.commutes_with(third));

  ASSERT(!first.anticommutes_with(second));
  ASSERT(first.anticommutes_with(third));
  ASSERT(second.anticommutes_with(third));

  // The phase plays no role
  ASSERT(first.multiply(Phase::i()).commutes_with(second));

  return true;
}

bool test_dense_commutation_matches_matrices() {
  std::minstd_rand rng(31);

  for (size_t i = 0; i < 100; i++) {
    size_t nqb = 1 + rng() % 4;
    DenseOperator p = random_dense_operator(rng, nqb);
    DenseOperator q = random_dense_operator(rng, nqb);

    Eigen::MatrixXcd pq = p.to_matrix() * q.to_matrix();
    Eigen::MatrixXcd qp = q.to_matrix() * p.to_matrix();

    ASSERT(p.commutes_with(q) == q.commutes_with(p));
    if (p.commutes_with(q)) {
      ASSERT(matrices_close(pq, qp), fmt::format("{} and {} should commute", p, q));
    } else {
      ASSERT(matrices_close(pq, -qp), fmt::format("{} and {} should anticommute", p, q));
    }
  }

  return true;
}

bool test_dense_length_mismatch() {
  DenseOperator first({X, Y, Z});
  DenseOperator second({X, Y});

  ASSERT(throws<LengthMismatch>([&]() { first.commutes_with(second); }));
  ASSERT(throws<LengthMismatch>([&]() { first.anticommutes_with(second); }));
  ASSERT(throws<LengthMismatch>([&]() { first * second; }));
  ASSERT(throws<PauliError>([&]() { second.multiply(first); }));

  try {
    first.multiply(second);
    return false;
  } catch (const LengthMismatch& e) {
    ASSERT(e.first == 3 && e.second == 2, fmt::format("Wrong lengths reported: {}", e.what()));
    ASSERT(std::string(e.what()) == "incompatible length 3 and 2", e.what());
  }

  // Multiplying by a single Pauli has no length requirement
  ASSERT(first * X == DenseOperator({I, Z, Y}), fmt::format("{}", first * X));

  return true;
}

bool test_dense_multiplication() {
  DenseOperator first(Phase::i(), {I, X, Y, Z});
  DenseOperator second(Phase::one(), {X, Z, X, Z});
  DenseOperator product(Phase::minus_i(), {X, Y, Z, I});

  ASSERT(first * second == product, fmt::format("{} * {} = {}", first, second, first * second));
  ASSERT(second * first == product, fmt::format("{} * {} = {}", second, first, second * first));

  DenseOperator op(Phase::i(), {X, Y, Z});
  DenseOperator other({X, X, X});
  ASSERT(op * other == DenseOperator(Phase::i(), {I, Z, Y}));
  ASSERT(other * op == DenseOperator(Phase::i(), {I, Z, Y}));

  DenseOperator anticommuting({Y, I, I});
  ASSERT(op * anticommuting == DenseOperator(Phase::minus_one(), {Z, Y, Z}));
  ASSERT(anticommuting * op == DenseOperator(Phase::one(), {Z, Y, Z}));

  return true;
}

bool test_dense_multiplication_matches_matrices() {
  std::minstd_rand rng(17);

  for (size_t i = 0; i < 100; i++) {
    size_t nqb = 1 + rng() % 4;
    DenseOperator p = random_dense_operator(rng, nqb);
    DenseOperator q = random_dense_operator(rng, nqb);

    DenseOperator pq = p * q;
    ASSERT(is_unit_phase(pq.phase()));
    ASSERT(pq.length() == nqb);
    ASSERT(matrices_close(pq.to_matrix(), p.to_matrix() * q.to_matrix()), fmt::format("{} * {} = {} disagrees with the matrix product", p, q, pq));

    Pauli pauli = random_pauli(rng);
    DenseOperator all_pauli(std::vector<Pauli>(nqb, pauli));
    ASSERT(matrices_close((p * pauli).to_matrix(), p.to_matrix() * all_pauli.to_matrix()));
  }

  return true;
}

bool test_dense_phase_multiplication() {
  DenseOperator op(Phase::minus_one(), {X, Z, I, Y});
  Phase phase = Phase::i();
  DenseOperator product(Phase::minus_i(), {X, Z, I, Y});

  ASSERT(op * phase == product);
  ASSERT(phase * op == product);
  ASSERT(op.multiply(phase) == product);

  DenseOperator other({X, X, X});
  ASSERT(Phase::minus_i() * other == DenseOperator(Phase::minus_i(), {X, X, X}));

  return true;
}

bool test_dense_pauli_multiplication() {
  DenseOperator op(Phase::minus_one(), {Y, X, Z, I});
  DenseOperator product(Phase::minus_one(), {X, Y, I, Z});

  ASSERT(op * Z == product, fmt::format("{} * Z = {}", op, op * Z));
  ASSERT(Z * op == product);
  ASSERT(op.multiply(Z) == product);

  DenseOperator other({X, X, X});
  ASSERT(Y * other == DenseOperator(Phase::minus_i(), {Z, Z, Z}));
  ASSERT(other * I == other);

  return true;
}

bool test_dense_square_is_identity() {
  std::minstd_rand rng(3);

  for (size_t i = 0; i < 50; i++) {
    size_t nqb = 1 + rng() % 20;
    DenseOperator p = random_dense_operator(rng, nqb);
    DenseOperator square = p * p;

    ASSERT(square.weight() == 0);
    Phase expected = p.phase() * p.phase();
    ASSERT(square.phase() == expected, fmt::format("{} squared to {}", p, square));
  }

  return true;
}

bool test_dense_to_matrix() {
  DenseOperator x(Phase::i(), {X});
  Eigen::MatrixXcd expected(2, 2);
  expected << 0, std::complex<double>(0.0, 1.0), std::complex<double>(0.0, 1.0), 0;
  ASSERT(matrices_close(x.to_matrix(), expected));

  // Qubit 0 is the least significant factor: ZX on qubits (0, 1) is X (x) Z
  Eigen::MatrixXcd zx = DenseOperator({Z, X}).to_matrix();
  ASSERT(zx.rows() == 4 && zx.cols() == 4);
  ASSERT(zx(2, 0) == std::complex<double>(1.0, 0.0));
  ASSERT(zx(1, 3) == std::complex<double>(-1.0, 0.0));
  ASSERT(zx(0, 0) == std::complex<double>(0.0, 0.0));

  ASSERT(matrices_close(DenseOperator().to_matrix(), Eigen::MatrixXcd::Identity(1, 1)));
  ASSERT(throws<std::invalid_argument>([]() { DenseOperator(std::vector<Pauli>(13, X)).to_matrix(); }));

  return true;
}

bool test_dense_string() {
  ASSERT(DenseOperator::from_string("+iXYZ") == DenseOperator(Phase::i(), {X, Y, Z}));
  ASSERT(DenseOperator::from_string("-IXZ") == DenseOperator(Phase::minus_one(), {I, X, Z}));
  ASSERT(DenseOperator::from_string("-iY") == DenseOperator(Phase::minus_i(), {Y}));
  ASSERT(DenseOperator::from_string("ZZ") == DenseOperator({Z, Z}));
  ASSERT(DenseOperator::from_string("").empty());

  ASSERT(DenseOperator(Phase::minus_i(), {X, I, Z}).to_string() == "-iXIZ");
  ASSERT(fmt::format("{}", DenseOperator({Y, Y})) == "+YY");

  std::minstd_rand rng(11);
  for (size_t i = 0; i < 20; i++) {
    DenseOperator p = random_dense_operator(rng, 1 + rng() % 10);
    ASSERT(DenseOperator::from_string(p.to_string()) == p);
  }

  ASSERT(throws<std::invalid_argument>([]() { DenseOperator::from_string("XQZ"); }));
  ASSERT(throws<std::invalid_argument>([]() { DenseOperator::from_string("+ixz"); }));

  return true;
}

bool test_dense_hermitian() {
  ASSERT(DenseOperator({X, Y}).hermitian());
  ASSERT(DenseOperator(Phase::minus_one(), {X, Y}).hermitian());
  ASSERT(!DenseOperator(Phase::i(), {X, Y}).hermitian());
  ASSERT(!DenseOperator(Phase::minus_i(), {Z}).hermitian());

  return true;
}

bool test_dense_hash() {
  std::unordered_set<DenseOperator> operators;
  operators.insert(DenseOperator::from_string("+XYZ"));
  operators.insert(DenseOperator::from_string("-XYZ"));
  operators.insert(DenseOperator::from_string("XYZ"));
  operators.insert(DenseOperator::from_string("+iXYZ"));
  operators.insert(DenseOperator::from_string("XYZI"));
  ASSERT(operators.size() == 4);
  ASSERT(operators.contains(DenseOperator(Phase::i(), {X, Y, Z})));
  ASSERT(!operators.contains(DenseOperator(Phase::minus_i(), {X, Y, Z})));

  std::minstd_rand rng(99);
  for (size_t i = 0; i < 20; i++) {
    DenseOperator p = random_dense_operator(rng, 1 + rng() % 10);
    DenseOperator q = DenseOperator::deserialize(p.serialize());
    ASSERT(std::hash<DenseOperator>{}(p) == std::hash<DenseOperator>{}(q));
  }

  std::unordered_map<Phase, size_t> counts;
  for (const auto& phase : all_phases()) {
    counts[phase * Phase::i()]++;
  }
  ASSERT(counts.size() == 4);

  return true;
}

bool test_dense_deserialize_logged() {
  ASSERT(Logger::enabled(), "Logging should have been configured by main.");

  DenseOperator op = DenseOperator::from_string("-iXYZZ");
  auto bytes = op.serialize();
  DenseOperator::deserialize(bytes);

  std::string log = Logger::read_log();
  ASSERT(log.find("[INFO]") != std::string::npos, log);
  ASSERT(log.find(fmt::format("Read DenseOperator of length 4 from {} bytes.", bytes.size())) != std::string::npos, log);

  throws<LengthMismatch>([&op]() { op.commutes_with(DenseOperator({X})); });
  log = Logger::read_log();
  ASSERT(log.find("incompatible length 4 and 1") != std::string::npos, log);

  throws<std::invalid_argument>([]() { DenseOperator::from_string("XAZ"); });
  log = Logger::read_log();
  ASSERT(log.find("Invalid string XAZ used to create DenseOperator") != std::string::npos, log);

  return true;
}

bool test_dense_serialize() {
  std::minstd_rand rng(2718);

  for (size_t i = 0; i < 20; i++) {
    DenseOperator p = random_dense_operator(rng, rng() % 50);

    auto bytes = p.serialize();
    DenseOperator p_ = DenseOperator::deserialize(bytes);
    ASSERT(p == p_, "DenseOperators were not equal after (de)serialization.");
  }

  return true;
}

int main(int argc, char *argv[]) {
  std::map<std::string, TestResult> tests;
  std::set<std::string> test_names;

  auto log_path = std::filesystem::temp_directory_path() / "qpauli_test_dense_operator.log";
  std::filesystem::remove(log_path);
  setenv("QPAULI_LOG_FILE", log_path.c_str(), 1);
  setenv("QPAULI_LOG_LEVEL", "INFO", 1);

  bool run_all = (argc == 1);

  if (!run_all) {
    for (int i = 1; i < argc; i++) {
      test_names.insert(argv[i]);
    }
  }

  ADD_TEST(test_dense_construction);
  ADD_TEST(test_dense_non_trivial_views);
  ADD_TEST(test_dense_commutation);
  ADD_TEST(test_dense_commutation_matches_matrices);
  ADD_TEST(test_dense_length_mismatch);
  ADD_TEST(test_dense_multiplication);
  ADD_TEST(test_dense_multiplication_matches_matrices);
  ADD_TEST(test_dense_phase_multiplication);
  ADD_TEST(test_dense_pauli_multiplication);
  ADD_TEST(test_dense_square_is_identity);
  ADD_TEST(test_dense_to_matrix);
  ADD_TEST(test_dense_string);
  ADD_TEST(test_dense_hermitian);
  ADD_TEST(test_dense_hash);
  ADD_TEST(test_dense_serialize);
  ADD_TEST(test_dense_deserialize_logged);

  return report_results(tests);
}
