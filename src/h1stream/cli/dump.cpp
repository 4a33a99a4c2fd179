#include "h1stream/cli/commands.hpp"
#include "h1stream/config/config.hpp"
#include "h1stream/http/request_parser.hpp"
#include "h1stream/util/log.hpp"

#include <algorithm>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <print>
#include <sstream>
#include <string_view>
#include <type_traits>
#include <variant>

namespace h1stream::cli {

namespace {

using json = nlohmann::json;

auto headers_to_json(const http::HttpHeaders& headers) -> json {
  auto arr = json::array();
  for (const auto& h : headers) {
    arr.push_back({h.name, h.value});
  }
  return arr;
}

auto entity_to_json(const http::RequestEntity& entity) -> json {
  json j = {{"framing", std::string(http::framing_name(entity.framing))}};
  if (const auto* strict = std::get_if<http::StrictEntity>(&entity.framing)) {
    j["length"] = strict->data.size();
    j["data"] = strict->data.to_string();
  } else if (const auto* fixed =
                 std::get_if<http::DeferredFixedLength>(&entity.framing)) {
    j["length"] = fixed->length;
  }
  if (entity.content_type) {
    j["content_type"] = *entity.content_type;
  }
  return j;
}

auto read_input(const std::string& path) -> std::optional<std::string> {
  std::stringstream buffer;
  if (path.empty() || path == "-") {
    buffer << std::cin.rdbuf();
    return buffer.str();
  }
  std::ifstream file(path, std::ios::binary);
  if (!file.is_open()) {
    return std::nullopt;
  }
  buffer << file.rdbuf();
  return buffer.str();
}

class EventPrinter {
public:
  // Prints events until the parser needs input or the stream has ended.
  // Returns false once the stream has ended.
  auto drain(http::RequestParser& parser, http::RequestOutput out) -> bool {
    while (true) {
      if (std::holds_alternative<http::NeedMoreData>(out)) {
        return true;
      }
      if (std::holds_alternative<http::MessageFailure>(out)) {
        failed_ = true;
      }
      std::println("{}", event_to_json(out).dump(
                             -1, ' ', false, json::error_handler_t::replace));
      if (std::holds_alternative<http::StreamEnd>(out)) {
        return false;
      }
      out = parser.pull();
    }
  }

  [[nodiscard]] auto failed() const noexcept -> bool {
    return failed_;
  }

private:
  bool failed_{false};
};

}  // namespace

auto event_to_json(const http::RequestOutput& output) -> json {
  json j = {{"event", std::string(http::output_name(output))}};
  std::visit(
      [&j](const auto& ev) {
        using T = std::decay_t<decltype(ev)>;
        if constexpr (std::is_same_v<T, http::RequestStart>) {
          j["method"] = std::string(ev.method.name());
          j["target"] = ev.raw_target;
          j["form"] = std::string(http::target_form_name(ev.uri.form));
          j["uri"] = ev.uri.to_string();
          j["protocol"] = std::string(http::protocol_name(ev.protocol));
          j["headers"] = headers_to_json(ev.headers);
          j["entity"] = entity_to_json(ev.entity);
          j["expect_100_continue"] = ev.expect_100_continue;
          j["close_after_response"] = ev.close_after_response;
        } else if constexpr (std::is_same_v<T, http::EntityPart>) {
          j["size"] = ev.data.size();
          j["data"] = ev.data.to_string();
          if (!ev.extension.empty()) {
            j["extension"] = ev.extension;
          }
        } else if constexpr (std::is_same_v<T, http::EntityEnd>) {
          if (!ev.trailer.empty()) {
            j["trailer"] = headers_to_json(ev.trailer);
          }
        } else if constexpr (std::is_same_v<T, http::MessageFailure>) {
          j["status"] = static_cast<std::uint16_t>(ev.status);
          j["reason"] = std::string(http::status_reason_phrase(ev.status));
          j["error"] = ev.code.message();
          j["summary"] = ev.summary;
          if (!ev.detail.empty()) {
            j["detail"] = ev.detail;
          }
          j["during_entity"] = ev.during_entity;
        }
      },
      output);
  return j;
}

auto cmd_dump(const DumpOptions& opts) -> int {
  Config config;
  if (!opts.config_file.empty()) {
    auto result = ConfigLoader::load_from_file(opts.config_file);
    if (!result) {
      std::println(stderr, "Error: {}", result.error().message());
      return 1;
    }
    config = std::move(*result);
  }
  log::set_level(opts.log_level.empty() ? config.log.level : opts.log_level);

  auto input = read_input(opts.input_file);
  if (!input) {
    std::println(stderr, "Error: cannot read {}", opts.input_file);
    return 1;
  }
  log::debug("Read {} bytes, fragment size {}", input->size(),
             opts.fragment_size);

  auto settings =
      std::make_shared<const ParserSettings>(std::move(config.parsing));
  http::RequestParser parser(settings);
  EventPrinter printer;

  std::string_view rest = *input;
  auto step = opts.fragment_size == 0 ? rest.size() : opts.fragment_size;
  bool open = true;
  while (open && !rest.empty()) {
    auto n = std::min(step, rest.size());
    open = printer.drain(parser, parser.push(rest.substr(0, n)));
    rest.remove_prefix(n);
  }
  if (open) {
    printer.drain(parser, parser.finish());
  }

  return printer.failed() ? 1 : 0;
}

}  // namespace h1stream::cli
