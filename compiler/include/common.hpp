//! # Common Definitions
//!
//! This module provides common types, utilities, and constants used throughout
//! sift. Every other component depends on it.
//!
//! ## Overview
//!
//! The common module includes:
//!
//! - **Compiler Options**: Global defaults for the optimizer
//! - **Source Locations**: Debug metadata attached to IR instructions
//! - **Result Type**: Error handling without exceptions
//!
//! ## Design Philosophy
//!
//! - **No Exceptions**: All errors are returned via `Result<T, E>`
//! - **Explicit Ownership**: Blocks and instructions are owned by value,
//!   cross references are plain ids

#ifndef SIFT_COMMON_HPP
#define SIFT_COMMON_HPP

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace sift {

// ============================================================================
// Optimizer Configuration
// ============================================================================

/// Default cap on fixed-point rounds of the dead code eliminator.
constexpr size_t DEFAULT_MAX_DCE_ITERATIONS = 10;

/// Default cap on liveness dataflow iterations. Kept below the driver cap.
constexpr size_t DEFAULT_MAX_LIVENESS_ITERATIONS = 8;

/// Global optimizer configuration options.
///
/// These are process-wide defaults. Passes copy them into their own
/// configuration at construction, so changing a value affects passes created
/// afterwards only.
///
/// # Example
///
/// ```cpp
/// CompilerOptions::max_dce_iterations = 4;
/// CompilerOptions::print_statistics = true;
/// ```
struct CompilerOptions {
    /// Upper bound on DCE fixed-point rounds per function.
    static inline size_t max_dce_iterations = DEFAULT_MAX_DCE_ITERATIONS;

    /// Upper bound on liveness iterations per analysis run.
    static inline size_t max_liveness_iterations = DEFAULT_MAX_LIVENESS_ITERATIONS;

    /// Treat direct calls to bodies marked `pure` as side-effect free.
    static inline bool trust_pure_attribute = false;

    /// Run the structural verifier after each optimized function.
    static inline bool verify_after_passes = true;

    /// Log a statistics report after each module run.
    static inline bool print_statistics = false;
};

// ============================================================================
// Source Location Types
// ============================================================================

/// A precise location in source code.
///
/// # Fields
///
/// - `file`: Path to the source file
/// - `line`: 1-based line number
/// - `column`: 1-based column number
/// - `offset`: 0-based byte offset from file start
/// - `length`: Length of the source element in bytes
struct SourceLocation {
    std::string_view file;
    uint32_t line = 0;
    uint32_t column = 0;
    uint32_t offset = 0;
    uint32_t length = 0;

    [[nodiscard]] auto operator==(const SourceLocation& other) const -> bool = default;
};

/// A span of source code from start to end location.
///
/// IR instructions carry the span of the construct they were lowered from.
/// Optimizations must keep it unchanged on every instruction they keep.
struct SourceSpan {
    SourceLocation start;
    SourceLocation end;

    [[nodiscard]] auto operator==(const SourceSpan& other) const -> bool = default;
};

// ============================================================================
// Result Type
// ============================================================================

/// A type that represents either a success value or an error.
///
/// # Example
///
/// ```cpp
/// auto result = pass.optimize(func);
/// if (is_ok(result)) {
///     const auto& stats = unwrap(result);
/// }
/// ```
template <typename T, typename E = std::string> using Result = std::variant<T, E>;

/// Checks if a Result contains a success value.
template <typename T, typename E>
[[nodiscard]] constexpr auto is_ok(const Result<T, E>& result) -> bool {
    return std::holds_alternative<T>(result);
}

/// Checks if a Result contains an error.
template <typename T, typename E>
[[nodiscard]] constexpr auto is_err(const Result<T, E>& result) -> bool {
    return std::holds_alternative<E>(result);
}

/// Extracts the success value from a Result.
///
/// # Panics
///
/// Throws `std::bad_variant_access` if the Result contains an error.
template <typename T, typename E> [[nodiscard]] constexpr auto unwrap(Result<T, E>& result) -> T& {
    return std::get<T>(result);
}

/// Extracts the success value from a const Result.
template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap(const Result<T, E>& result) -> const T& {
    return std::get<T>(result);
}

/// Extracts the error value from a Result.
template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap_err(Result<T, E>& result) -> E& {
    return std::get<E>(result);
}

/// Extracts the error value from a const Result.
template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap_err(const Result<T, E>& result) -> const E& {
    return std::get<E>(result);
}

} // namespace sift

#endif // SIFT_COMMON_HPP
