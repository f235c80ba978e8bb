#pragma once

// Copyright © 2020-2022 Conor Williams <conorwilliams@outlook.com>

// SPDX-License-Identifier: GPL-3.0-or-later

// This file is part of openMOL.

// OpenMOL is free software: you can redistribute it and/or modify it under the terms of the GNU General Public License
// as published by the Free Software Foundation, either version 3 of the License, or (at your option) any later version.

// OpenMOL is distributed in the hope that it will be useful, but WITHOUT ANY WARRANTY; without even the implied
// warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the GNU General Public License for more details.

// You should have received a copy of the GNU General Public License along with openMOL. If not, see <https://www.gnu.org/licenses/>.

#include <fmt/chrono.h>
#include <fmt/core.h>
#include <fmt/format.h>

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstddef>
#include <functional>
#include <limits>
#include <numeric>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

/**
 * \file core.hpp
 *
 * @brief Miscellaneous utilities.
 */

namespace mol {

  // ------------------- Error Handling ---------------- //

  /**
   * @brief libMOL's catchable error type.
   */
  struct RuntimeError : std::runtime_error {
    using std::runtime_error::runtime_error;
  };

  /**
   * @brief Utility to make a RuntimeError object using the `{fmt}` library to
   * format the error message.
   *
   * @param fmt Format string.
   * @param args Format arguments (forwarded to ``fmt::format``).
   * @return A mol::RuntimeError containing the formatted error message as by ``fmt::format(fmt, args...)``.
   */
  template <typename... Args>
  auto error(fmt::format_string<Args...> fmt, Args &&...args) -> RuntimeError {
    try {
      return RuntimeError{fmt::format(fmt, std::forward<Args>(args)...)};
    } catch (fmt::format_error const &err) {
      return RuntimeError{fmt::format("Failed to format '{}' with err: {}", fmt::string_view(fmt), err.what())};
    }
  }

  /**
   * @brief Utility to check ``cond`` and throw RuntimeError if condition is ``false``.
   *
   * \rst
   *
   * Shorthand for:
   *
   * .. code::
   *
   *     if (!cond) {
   *         throw mol::error(fmt, args...);
   *     }
   *
   * \endrst
   *
   * @param cond Condition to check.
   * @param fmt Format string.
   * @param args Format arguments (forwarded to ``fmt::format``).
   *
   * @return void.
   */
  template <typename... Args>
  constexpr auto verify(bool cond, fmt::format_string<Args...> fmt, Args &&...args) -> void {
    if (!cond) {
      throw error(std::move(fmt), std::forward<Args>(args)...);
    }
  }

#ifndef NDEBUG

  namespace detail {
    constexpr std::string_view file_name(std::string_view path) {
      if (auto k = path.find_last_of("/\\"); k != std::string_view::npos) {
        path.remove_prefix(k);
      }
      return path;
    }
  }  // namespace detail

/**
 * @brief Use like mol::verify() but disabled if ``NDEBUG`` defined.
 */
#  define ASSERT(expr, string_literal, ...)                                                                          \
    do {                                                                                                             \
      if (constexpr std::string_view fname = mol::detail::file_name(__FILE__); !(expr)) {                            \
        throw mol::error("ASSERT \"{}\" failed in ...{}:{} | " string_literal, #expr, fname, __LINE__, __VA_ARGS__); \
      }                                                                                                              \
    } while (false)

#else

/**
 * @brief Use like mol::verify() but disabled if ``NDEBUG`` defined.
 */
#  define ASSERT(...) \
    do {              \
    } while (false)

#endif  // !NDEBUG

  // ------------------- Small functions ---------------- //

  /**
   * @brief Conditional printing utility.
   *
   * If ``cond`` is true forwards ``fmt`` and ``args...`` to ``fmt::print``. Useful for printing debug messages.
   */
  template <typename... Args>
  auto dprint(bool cond, fmt::format_string<Args...> fmt, Args &&...args) -> void {
    if (cond) {
      fmt::print(fmt, std::forward<Args>(args)...);
    }
  }

  namespace detail {
    // C++20 functions see: https://en.cppreference.com/w/cpp/utility/intcmp
    template <class T, class U>
    constexpr bool cmp_less(T t, U u) noexcept {
      using UT = std::make_unsigned_t<T>;
      using UU = std::make_unsigned_t<U>;
      if constexpr (std::is_signed_v<T> == std::is_signed_v<U>)
        return t < u;
      else if constexpr (std::is_signed_v<T>)
        return t < 0 ? true : UT(t) < u;
      else
        return u < 0 ? false : t < UU(u);
    }

    template <class T, class U>
    constexpr bool cmp_greater(T t, U u) noexcept {
      return cmp_less(u, t);
    }

    template <class T, class U>
    constexpr bool cmp_less_equal(T t, U u) noexcept {
      return !cmp_greater(t, u);
    }

    template <class T, class U>
    constexpr bool cmp_greater_equal(T t, U u) noexcept {
      return !cmp_less(t, u);
    }

  }  // namespace detail

  /**
   * @brief Cast integral types asserting that conversion is lossless.
   *
   * Perform a `static_cast` from type `T` to `R` with bounds checking in debug builds.
   *
   * @tparam T Type of input ``x``, must be integral.
   * @tparam R Target type to cast to, must be integral.
   *
   * @param x The value to cast to a new type.
   *
   * @return Exactly ``static_cast<R>(x)``.
   */
  template <typename R, typename T>
  constexpr auto safe_cast(T x) -> std::enable_if_t<std::is_integral_v<R> && std::is_integral_v<T>, R> {
    //
    auto constexpr R_max = std::numeric_limits<R>::max();
    auto constexpr R_min = std::numeric_limits<R>::min();

    auto constexpr T_max = std::numeric_limits<T>::max();
    auto constexpr T_min = std::numeric_limits<T>::min();

    if constexpr (detail::cmp_less(R_max, T_max)) {
      ASSERT(detail::cmp_less_equal(x, R_max), "Could not cast '{}' to type R with R_max={}", x, R_max);
    }

    if constexpr (detail::cmp_greater(R_min, T_min)) {
      ASSERT(detail::cmp_greater_equal(x, R_min), "Could not cast '{}' to type R with R_min={}", x, R_min);
    }

    return static_cast<R>(x);
  }

  /**
   * @brief Get the signed size of a container.
   *
   * See https://en.cppreference.com/w/cpp/iterator/size
   *
   * @param c Container to find the size of.
   * @return The result of ``c.size()`` cast to an appropriate signed type.
   */
  template <typename C>
  constexpr auto ssize(C const &c) -> std::common_type_t<std::ptrdiff_t, std::make_signed_t<decltype(c.size())>> {
    using R = std::common_type_t<std::ptrdiff_t, std::make_signed_t<decltype(c.size())>>;
    return static_cast<R>(c.size());
  }

  // ------------------- Math functions ---------------- //

  /**
   * @brief Test if two floating point numbers are close.
   *
   * @tparam T Type of inputs, must be a floating point type.
   *
   * @param a First input.
   * @param b Second input.
   *
   * @param atol Tolerance of absolute difference between ``a`` and  ``b`` for them to be close.
   * @param ftol Tolerance of fractional difference between ``a`` and  ``b`` for them to be close.
   *
   * @return ``true`` if ``a`` and  ``b`` are within ``atol`` or fractionally within ``ftol`` of each other.
   */
  template <typename T>
  constexpr auto near(T a, T b, T atol = 1e-10, T ftol = 0.0001) -> std::enable_if_t<std::is_floating_point_v<T>, bool> {
    return std::abs(a - b) < atol || std::abs(a - b) <= ftol * std::max(std::abs(a), std::abs(b));
  }

  /**
   * @brief Number of digits after the decimal point needed to print ``f`` in ``width`` characters.
   *
   * \rst
   *
   * Computes:
   *
   * .. math::
   *
   *    \text{width} - \lfloor \log_{10} |f| \rfloor - 2
   *
   * with the logarithm clamped to zero for :math:`|f| < 1` and one more digit reserved for the sign of
   * negative numbers. The result is at least one.
   *
   * \endrst
   */
  inline auto precision_digits(double f, int width) -> int {
    //
    double lg = f == 0 ? 0.0 : std::log10(std::abs(f));

    int digits = width - static_cast<int>(std::floor(std::max(lg, 0.0))) - (f < 0 ? 3 : 2);

    return std::max(digits, 1);
  }

  /**
   * @brief Greatest common divisor of a list of integers.
   *
   * @return The GCD of ``numbers`` or one if ``numbers`` is empty.
   */
  template <typename T>
  auto gcd(std::vector<T> const &numbers) -> std::enable_if_t<std::is_integral_v<T>, T> {
    //
    if (numbers.empty()) {
      return 1;
    }

    T result = 0;

    for (T n : numbers) {
      result = std::gcd(result, n);
    }

    return result;
  }

  // ------------------- Classes ---------------- //

  /**
   * @brief Basic implementation of a Golang like defer.
   *
   *
   * \tparam F The nullary invocable's type, this **MUST** be deducted through CTAD by the deduction guide and it must be ``noexcept``
   * callable.
   */
  template <class F, typename = std::enable_if_t<std::is_nothrow_invocable_v<F &&>>>
  class [[nodiscard]] Defer {
  public:
    /**
     * @brief Construct a new Defer object.
     *
     * @param f Nullary invocable forwarded into object and invoked by destructor.
     */
    constexpr Defer(F &&f) : m_f(std::forward<F>(f)) {}

    Defer(const Defer &) = delete;
    Defer(Defer &&other) = delete;
    Defer &operator=(const Defer &) = delete;
    Defer &operator=(Defer &&) = delete;

    /**
     * @brief Call the invocable.
     */
    ~Defer() noexcept { std::invoke(std::forward<F>(m_f)); }

  private:
    F m_f;
  };

  /**
   * @brief Forwarding deduction guide.
   */
  template <typename F>
  Defer(F &&) -> Defer<F>;

  // ------------------- Timing ---------------- //

  /**
   * @brief Transparent function wrapper that measures the execution time of a
   * function.
   *
   * The execution time is printed to stdout. Garantees RVO.
   *
   * @param name Name of function being called, also printed to stdout.
   * @param f Invocable to call.
   * @param args Arguments to invoke \c f with.
   * @return The result of invoking \c f with \c args... .
   */
  template <typename F, typename... Args>
  auto timeit(std::string_view name, F &&f, Args &&...args) -> std::invoke_result_t<F &&, Args &&...> {
    //
    auto start = std::chrono::steady_clock::now();

    Defer _ = [&]() noexcept {
      //
      using namespace std::chrono;

      auto elapsed = steady_clock::now() - start;

      auto mil = duration_cast<milliseconds>(elapsed);

      elapsed -= mil;

      auto mic = duration_cast<microseconds>(elapsed);

      fmt::print("Timing \"{}\" {:>5} {:>5}\n", name, mil, mic);
    };

    if constexpr (std::is_void_v<std::invoke_result_t<F &&, Args &&...>>) {
      std::invoke(std::forward<F>(f), std::forward<Args>(args)...);
    } else {
      return std::invoke(std::forward<F>(f), std::forward<Args>(args)...);
    }
  }

}  // namespace mol
