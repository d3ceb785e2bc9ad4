#pragma once
#include <raceswap/schema/primitives.hpp>
#include <cstdint>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

namespace raceswap::storage {

using key_value_entry_t =
    std::pair<raceswap::schema::bytes_t, raceswap::schema::bytes_t>;

/// Last committed ledger checkpoint persisted by the storage backend.
struct committed_state final {
  uint64_t transaction_count{};
  raceswap::schema::hash32_t state_root{};
};

template <typename Library>
struct storage {
  /// Decode and return value at key, or std::nullopt when missing.
  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const raceswap::schema::bytes_view_t& key);

  /// Encode and persist value at key.
  template <typename T, typename Encoder>
  void put(Encoder& encoder,
           const raceswap::schema::bytes_view_t& key,
           const T& value);

  /// Load the most recent committed checkpoint.
  std::optional<committed_state> load_committed_state() const;

  /// Return all key-value pairs that share the provided key prefix.
  std::vector<key_value_entry_t> list_by_prefix(
      const raceswap::schema::bytes_view_t& prefix) const;

  /// Atomically write all entries together with the new checkpoint.
  void commit(const std::vector<key_value_entry_t>& entries,
              const committed_state& state) const;
};

/// Construct a concrete storage backend rooted at filesystem path.
template <typename Library>
storage<Library> make_storage(const std::string_view& path);

}  // namespace raceswap::storage
