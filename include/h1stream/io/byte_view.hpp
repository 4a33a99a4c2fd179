#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace h1stream::io {

// ============================================================================
// ByteView - immutable window over shared byte storage
// ============================================================================

/// Offset+length view over reference-counted storage. Slicing never copies,
/// and every slice keeps the underlying storage alive, so a view handed out
/// in an event stays valid after the parser has moved on.
class ByteView {
public:
  using Storage = std::vector<std::uint8_t>;

  ByteView() noexcept = default;

  /// Copy bytes into fresh storage
  [[nodiscard]] static auto copy_of(std::span<const std::uint8_t> bytes)
      -> ByteView;

  [[nodiscard]] static auto copy_of(std::string_view text) -> ByteView;

  /// Take ownership of an existing vector without copying
  [[nodiscard]] static auto adopt(Storage bytes) -> ByteView;

  [[nodiscard]] auto size() const noexcept -> std::size_t {
    return size_;
  }

  [[nodiscard]] auto empty() const noexcept -> bool {
    return size_ == 0;
  }

  /// Unchecked access, callers bounds-check against size()
  [[nodiscard]] auto operator[](std::size_t ix) const noexcept
      -> std::uint8_t {
    return (*storage_)[offset_ + ix];
  }

  [[nodiscard]] auto data() const noexcept -> const std::uint8_t* {
    return storage_ ? storage_->data() + offset_ : nullptr;
  }

  /// Bytes [from, to), clamped to the view
  [[nodiscard]] auto slice(std::size_t from, std::size_t to) const noexcept
      -> ByteView;

  /// Bytes [from, size())
  [[nodiscard]] auto drop(std::size_t from) const noexcept -> ByteView {
    return slice(from, size_);
  }

  [[nodiscard]] auto span() const noexcept -> std::span<const std::uint8_t> {
    return {data(), size_};
  }

  [[nodiscard]] auto as_string_view() const noexcept -> std::string_view {
    return {reinterpret_cast<const char*>(data()), size_};
  }

  [[nodiscard]] auto to_string() const -> std::string {
    return std::string{as_string_view()};
  }

  /// New view holding this view's bytes followed by `more`. Only the
  /// unconsumed remainder is copied; existing slices keep the old storage.
  [[nodiscard]] auto append(std::span<const std::uint8_t> more) const
      -> ByteView;

  /// Number of views currently sharing the storage (diagnostics only)
  [[nodiscard]] auto use_count() const noexcept -> long {
    return storage_.use_count();
  }

private:
  ByteView(std::shared_ptr<const Storage> storage, std::size_t offset,
           std::size_t size) noexcept
      : storage_(std::move(storage)), offset_(offset), size_(size) {}

  std::shared_ptr<const Storage> storage_;
  std::size_t offset_ = 0;
  std::size_t size_ = 0;
};

[[nodiscard]] inline auto as_bytes(std::string_view text) noexcept
    -> std::span<const std::uint8_t> {
  return {reinterpret_cast<const std::uint8_t*>(text.data()), text.size()};
}

}  // namespace h1stream::io
