#include "h1stream/http/parse_error.hpp"

namespace h1stream::http {

auto default_status(ParseErrc e) noexcept -> HttpStatus {
  switch (e) {
    case ParseErrc::Success:
    case ParseErrc::NeedMoreData:
      return HttpStatus::Ok;
    case ParseErrc::UnsupportedMethod:
      return HttpStatus::NotImplemented;
    case ParseErrc::TargetTooLong:
      return HttpStatus::UriTooLong;
    case ParseErrc::UnsupportedProtocolVersion:
      return HttpStatus::HttpVersionNotSupported;
    case ParseErrc::EntityNotAllowed:
      return HttpStatus::UnprocessableEntity;
    case ParseErrc::HeaderFieldsTooLarge:
      return HttpStatus::RequestHeaderFieldsTooLarge;
    case ParseErrc::ExpectationFailed:
      return HttpStatus::ExpectationFailed;
    case ParseErrc::EntityTooLarge:
      return HttpStatus::PayloadTooLarge;
    default:
      return HttpStatus::BadRequest;
  }
}

auto ParseError::formatted() const -> std::string {
  if (detail.empty()) {
    return summary;
  }
  return summary + ": " + detail;
}

auto parse_failure(ParseErrc e, std::string summary, std::string detail)
    -> std::unexpected<ParseError> {
  return parse_failure(e, default_status(e), std::move(summary),
                       std::move(detail));
}

auto parse_failure(ParseErrc e, HttpStatus status, std::string summary,
                   std::string detail) -> std::unexpected<ParseError> {
  return std::unexpected{ParseError{make_error_code(e), status,
                                    std::move(summary), std::move(detail)}};
}

}  // namespace h1stream::http
