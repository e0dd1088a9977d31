#pragma once
#include <custodia/storage/storage.hpp>
#include <limits>
#include <map>

namespace custodia::storage {

struct memory_storage_tag {};

template <>
struct storage<memory_storage_tag> final {
  std::map<custodia::schema::allocation_id_t, custodia::schema::allocation_t>
      records;
  custodia::schema::allocation_id_t last{};

  std::optional<custodia::schema::allocation_t> load(
      custodia::schema::allocation_id_t id) const;
  bool contains(custodia::schema::allocation_id_t id) const;
  custodia::schema::allocation_id_t last_identifier() const;
  std::optional<custodia::schema::allocation_id_t> next_identifier() const;
  bool insert(const custodia::schema::allocation_t& allocation);
  bool compare_and_swap(const custodia::schema::allocation_t& expected,
                        const custodia::schema::allocation_t& replacement);
  std::vector<custodia::schema::allocation_t> list() const;
};

template <>
storage<memory_storage_tag> make_storage<memory_storage_tag>();

using memory_storage_t = storage<memory_storage_tag>;

}  // namespace custodia::storage
