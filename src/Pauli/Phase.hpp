#pragma once

#include <complex>
#include <cstdint>
#include <functional>
#include <string>

#include <fmt/format.h>

namespace qpauli {

// A global phase restricted to the four units 1, i, -1, -i.
// Stored as a Gaussian integer (re, im); the only way to obtain a Phase is
// through the named constructors, from_exponent, or products of existing
// phases, so (re, im) is always one of (1,0), (0,1), (-1,0), (0,-1).
class Phase {
  public:
    constexpr Phase() : re(1), im(0) {}

    static constexpr Phase one() {
      return Phase(1, 0);
    }

    static constexpr Phase minus_one() {
      return Phase(-1, 0);
    }

    static constexpr Phase i() {
      return Phase(0, 1);
    }

    static constexpr Phase minus_i() {
      return Phase(0, -1);
    }

    // i^k
    static constexpr Phase from_exponent(uint8_t k) {
      switch (k % 4) {
        case 0: return one();
        case 1: return i();
        case 2: return minus_one();
        default: return minus_i();
      }
    }

    // k such that the phase is i^k
    constexpr uint8_t exponent() const {
      if (re == 1) {
        return 0;
      } else if (im == 1) {
        return 1;
      } else if (re == -1) {
        return 2;
      } else {
        return 3;
      }
    }

    constexpr Phase multiply(Phase other) const {
      return Phase(re*other.re - im*other.im, re*other.im + im*other.re);
    }

    constexpr Phase operator*(Phase other) const {
      return multiply(other);
    }

    constexpr Phase& operator*=(Phase other) {
      *this = multiply(other);
      return *this;
    }

    constexpr Phase operator-() const {
      return Phase(-re, -im);
    }

    // Inverse in the group
    constexpr Phase conjugate() const {
      return Phase(re, -im);
    }

    constexpr bool is_real() const {
      return im == 0;
    }

    constexpr int real() const {
      return re;
    }

    constexpr int imag() const {
      return im;
    }

    constexpr bool operator==(const Phase& other) const = default;

    std::complex<double> to_complex() const {
      return std::complex<double>(re, im);
    }

    std::string to_string() const {
      if (re == 1) {
        return "1";
      } else if (re == -1) {
        return "-1";
      } else if (im == 1) {
        return "i";
      } else {
        return "-i";
      }
    }

  private:
    constexpr Phase(int re, int im) : re(static_cast<int8_t>(re)), im(static_cast<int8_t>(im)) {}

    int8_t re;
    int8_t im;
};

}

template <>
struct fmt::formatter<qpauli::Phase> {
  constexpr auto parse(format_parse_context& ctx) const -> decltype(ctx.begin()) {
    return ctx.begin();
  }

  template <typename FormatContext>
  auto format(const qpauli::Phase& phase, FormatContext& ctx) const -> decltype(ctx.out()) {
    return fmt::format_to(ctx.out(), "{}", phase.to_string());
  }
};

template <>
struct std::hash<qpauli::Phase> {
  size_t operator()(const qpauli::Phase& phase) const noexcept {
    return phase.exponent();
  }
};
