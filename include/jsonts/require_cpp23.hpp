#pragma once

/**
 * @file require_cpp23.hpp
 * @brief C++23 feature-test checks for jsonts
 *
 * Include early in a translation unit (main.cpp does) to get a clear error
 * when the toolchain is too old. Requires GCC 14+ or Clang 19+.
 */

#include <expected>
#include <version>

#if !defined(__cplusplus) || __cplusplus < 202'302L
    #error "jsonts requires C++23 or later (__cplusplus >= 202302L)."
#endif

// std::println for CLI diagnostics
#if !defined(__cpp_lib_print) || __cpp_lib_print < 202'207L
    #error "jsonts requires std::print/std::println (__cpp_lib_print >= 202207L)."
#endif

// std::expected for Result/VoidResult
#if !defined(__cpp_lib_expected) || __cpp_lib_expected < 202'202L
    #error "jsonts requires std::expected (__cpp_lib_expected >= 202202L)."
#endif

// std::views::enumerate for indexed traversal
#if !defined(__cpp_lib_ranges_enumerate) || __cpp_lib_ranges_enumerate < 202'302L
    #error "jsonts requires std::views::enumerate (__cpp_lib_ranges_enumerate >= 202302L)."
#endif

// std::views::zip in the SHA-256 state update
#if !defined(__cpp_lib_ranges_zip) || __cpp_lib_ranges_zip < 202'110L
    #error "jsonts requires std::views::zip (__cpp_lib_ranges_zip >= 202110L)."
#endif

// std::byteswap for big-endian message words
#if !defined(__cpp_lib_byteswap) || __cpp_lib_byteswap < 202'110L
    #error "jsonts requires std::byteswap (__cpp_lib_byteswap >= 202110L)."
#endif

#define JSONTS_CPP23_FEATURES_VERIFIED 1
