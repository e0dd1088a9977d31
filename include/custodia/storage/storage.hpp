#pragma once
#include <custodia/schema/allocation.hpp>
#include <custodia/schema/primitives.hpp>
#include <optional>
#include <vector>

namespace custodia::storage {

/// Allocation store and identifier counter, selected by library tag.
template <typename Library>
struct storage {
  /// Return the record for id, or std::nullopt when missing.
  std::optional<custodia::schema::allocation_t> load(
      custodia::schema::allocation_id_t id) const;

  bool contains(custodia::schema::allocation_id_t id) const;

  /// Last identifier issued by a committed creation; 0 before the first.
  custodia::schema::allocation_id_t last_identifier() const;

  /// Identifier the next creation will receive, or std::nullopt when the
  /// counter is exhausted. Does not advance the counter.
  std::optional<custodia::schema::allocation_id_t> next_identifier() const;

  /// Persist a new record and advance the counter to its identifier.
  ///
  /// Returns false when the identifier is not the next one or is taken.
  bool insert(const custodia::schema::allocation_t& allocation);

  /// Replace the record for `replacement.allocation_id` only if the stored
  /// record still equals `expected`.
  bool compare_and_swap(const custodia::schema::allocation_t& expected,
                        const custodia::schema::allocation_t& replacement);

  /// All records in identifier order.
  std::vector<custodia::schema::allocation_t> list() const;
};

template <typename Library>
storage<Library> make_storage();

}  // namespace custodia::storage
