#include "h1stream/io/byte_view.hpp"

#include <algorithm>

namespace h1stream::io {

auto ByteView::copy_of(std::span<const std::uint8_t> bytes) -> ByteView {
  return adopt(Storage(bytes.begin(), bytes.end()));
}

auto ByteView::copy_of(std::string_view text) -> ByteView {
  return copy_of(as_bytes(text));
}

auto ByteView::adopt(Storage bytes) -> ByteView {
  auto size = bytes.size();
  return ByteView{std::make_shared<const Storage>(std::move(bytes)), 0, size};
}

auto ByteView::slice(std::size_t from, std::size_t to) const noexcept
    -> ByteView {
  to = std::min(to, size_);
  from = std::min(from, to);
  if (from == to) {
    return {};
  }
  return ByteView{storage_, offset_ + from, to - from};
}

auto ByteView::append(std::span<const std::uint8_t> more) const -> ByteView {
  if (more.empty()) {
    return *this;
  }
  Storage combined;
  combined.reserve(size_ + more.size());
  auto current = span();
  combined.insert(combined.end(), current.begin(), current.end());
  combined.insert(combined.end(), more.begin(), more.end());
  return adopt(std::move(combined));
}

}  // namespace h1stream::io
