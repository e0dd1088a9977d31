#include <spdlog/spdlog.h>
#include <custodia/storage/memory/storage.hpp>

namespace custodia::storage {

template <>
storage<memory_storage_tag> make_storage<memory_storage_tag>() {
  spdlog::debug("Opening in-memory allocation store");
  return storage<memory_storage_tag>{};
}

std::optional<custodia::schema::allocation_t> storage<memory_storage_tag>::load(
    const custodia::schema::allocation_id_t id) const {
  auto it = records.find(id);
  if (it == std::end(records)) {
    return std::nullopt;
  }
  return it->second;
}

bool storage<memory_storage_tag>::contains(
    const custodia::schema::allocation_id_t id) const {
  return records.contains(id);
}

custodia::schema::allocation_id_t
storage<memory_storage_tag>::last_identifier() const {
  return last;
}

std::optional<custodia::schema::allocation_id_t>
storage<memory_storage_tag>::next_identifier() const {
  if (last == std::numeric_limits<custodia::schema::allocation_id_t>::max()) {
    return std::nullopt;
  }
  return last + 1;
}

bool storage<memory_storage_tag>::insert(
    const custodia::schema::allocation_t& allocation) {
  auto next = next_identifier();
  if (!next || allocation.allocation_id != *next) {
    spdlog::error("Refusing insert of allocation {} (next identifier {})",
                  allocation.allocation_id, next.value_or(0));
    return false;
  }
  auto [it, inserted] = records.emplace(allocation.allocation_id, allocation);
  if (!inserted) {
    return false;
  }
  last = allocation.allocation_id;
  return true;
}

bool storage<memory_storage_tag>::compare_and_swap(
    const custodia::schema::allocation_t& expected,
    const custodia::schema::allocation_t& replacement) {
  if (expected.allocation_id != replacement.allocation_id) {
    return false;
  }
  auto it = records.find(expected.allocation_id);
  if (it == std::end(records) || it->second != expected) {
    return false;
  }
  it->second = replacement;
  return true;
}

std::vector<custodia::schema::allocation_t> storage<memory_storage_tag>::list()
    const {
  auto result = std::vector<custodia::schema::allocation_t>{};
  result.reserve(records.size());
  for (const auto& [id, allocation] : records) {
    result.push_back(allocation);
  }
  return result;
}

}  // namespace custodia::storage
