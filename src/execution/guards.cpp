#include <custodia/execution/guards.hpp>

namespace custodia::execution::guards {

role_mask_t roles_of(const custodia::schema::allocation_t& allocation,
                     const custodia::schema::account_id_t& caller,
                     const custodia::schema::account_id_t& supervisor) {
  auto mask = role_mask_t{};
  if (caller == supervisor) {
    mask |= role_bit(custodia::schema::role_id_t::supervisor);
  }
  if (caller == allocation.originator) {
    mask |= role_bit(custodia::schema::role_id_t::originator);
  }
  if (caller == allocation.beneficiary) {
    mask |= role_bit(custodia::schema::role_id_t::beneficiary);
  }
  return mask;
}

bool valid_beneficiary(const custodia::schema::account_id_t& beneficiary,
                       const custodia::schema::account_id_t& originator,
                       const custodia::schema::account_id_t& custodian) {
  return !custodia::schema::is_zero_hash(beneficiary) &&
         beneficiary != originator && beneficiary != custodian;
}

}  // namespace custodia::execution::guards
