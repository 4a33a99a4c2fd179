#pragma once

#include <expected>
#include <functional>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <utility>

namespace h1stream {

// Errors of the configuration layer. Protocol failures have their own
// category, see http/parse_error.hpp.
enum class Error : int {
  Success = 0,
  FileNotFound,
  FileOpenFailed,
  ParseError,
  InvalidArgument,
};

class ErrorCategory : public std::error_category {
public:
  [[nodiscard]] auto name() const noexcept -> const char* override {
    return "h1stream";
  }

  [[nodiscard]] auto message(int ev) const -> std::string override {
    switch (static_cast<Error>(ev)) {
      case Error::Success: return "success";
      case Error::FileNotFound: return "config file not found";
      case Error::FileOpenFailed: return "config file cannot be opened";
      case Error::ParseError: return "malformed configuration";
      case Error::InvalidArgument: return "invalid configuration value";
    }
    return "unknown error";
  }
};

inline auto error_category() -> const ErrorCategory& {
  static const ErrorCategory instance;
  return instance;
}

inline auto make_error_code(Error e) -> std::error_code {
  return {std::to_underlying(e), error_category()};
}

template <typename T>
using Result = std::expected<T, std::error_code>;

template <typename T>
[[nodiscard]] constexpr auto ok(T&& value) -> Result<std::decay_t<T>> {
  return std::forward<T>(value);
}

[[nodiscard]] constexpr auto ok() -> Result<void> {
  return {};
}

[[nodiscard]] inline auto fail(Error e) -> std::unexpected<std::error_code> {
  return std::unexpected{make_error_code(e)};
}

/// Heterogeneous lookup for string-keyed maps
struct StringHash {
  using is_transparent = void;

  [[nodiscard]] auto operator()(std::string_view sv) const noexcept
      -> std::size_t {
    return std::hash<std::string_view>{}(sv);
  }
};

using StringEqual = std::equal_to<>;

}  // namespace h1stream

template <>
struct std::is_error_code_enum<h1stream::Error> : std::true_type {};
