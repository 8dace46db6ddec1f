/**
* @file expected.hpp
 * @brief Compatibility shim for std::expected (C++23) and tl::expected (C++20).
 *
 * Every fallible tap API returns through these aliases, so call sites never
 * name a specific implementation.
 *
 * - When the library ships <expected> (libstdc++ 12+ in C++23 mode): uses it.
 *   Only the 202202 surface is relied on (no monadic and_then/transform).
 * - Otherwise: falls back to <tl/expected.hpp> (TartanLlama's header-only backport).
 */
#pragma once

#include <version>  // __cpp_lib_expected

#if defined(__cpp_lib_expected) && __cpp_lib_expected >= 202202L
  #include <expected>
  namespace tap_detail {
      template<class T, class E> using expected   = std::expected<T,E>;
      template<class E>          using unexpected = std::unexpected<E>;
  }
#else
#include <tl/expected.hpp>
namespace tap_detail {
      template<class T, class E> using expected   = tl::expected<T,E>;
      template<class E>          using unexpected = tl::unexpected<E>;
  }
#endif
