#include "h1stream/http/request_output.hpp"

namespace h1stream::http {

auto framing_name(const EntityFraming& framing) -> std::string_view {
  constexpr std::string_view names[] = {"empty", "strict", "deferred_fixed",
                                        "deferred_chunked"};
  return names[framing.index()];
}

auto output_name(const RequestOutput& output) -> std::string_view {
  constexpr std::string_view names[] = {"request_start", "entity_part",
                                        "entity_end",    "need_more_data",
                                        "stream_end",    "failure"};
  return names[output.index()];
}

}  // namespace h1stream::http
