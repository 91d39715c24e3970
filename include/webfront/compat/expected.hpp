/**
* @file expected.hpp
 * @brief Compatibility shim for std::expected (C++23) and tl::expected (C++20).
 *
 * Fallible factories (rule loading, router creation, CLI parsing, host
 * authorization) return webfront_detail::expected so call sites do not
 * depend on which implementation the toolchain provides.
 *
 * - With a C++23 standard library: uses <expected>.
 * - Otherwise: <tl/expected.hpp>, the header-only backport by TartanLlama
 *   (https://github.com/TartanLlama/expected).
 */
#pragma once

#if __has_include(<version>)
  #include <version>
#endif

#if defined(__cpp_lib_expected) && __cpp_lib_expected >= 202211L
  #include <expected>
  namespace webfront_detail {
      template<class T, class E> using expected   = std::expected<T,E>;
      template<class E>          using unexpected = std::unexpected<E>;
  }
#else
#include <tl/expected.hpp>
namespace webfront_detail {
      template<class T, class E> using expected   = tl::expected<T,E>;
      template<class E>          using unexpected = tl::unexpected<E>;
  }
#endif
