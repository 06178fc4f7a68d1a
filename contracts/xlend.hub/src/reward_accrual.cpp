#include <xlend.hub/reward_accrual.hpp>
#include <xlend.hub/pool_account.hpp>

namespace xlend {

using namespace xlend::math;

static uint64_t to_reward_units(const uint128_t& v) {
   CHECKC( v <= (uint128_t)UINT64_MAX, err::MATH_OVERFLOW, "reward overflow" )
   return (uint64_t)v;
}

void reward_accrual::update_loan_pool_indexes(const uint8_t& loan_type_id, const uint8_t& pool_id) {
   auto& lp     = _state.loan_pool(loan_type_id, pool_id);
   auto& reward = lp.reward;
   if (_now <= reward.last_update_at) return;

   uint64_t dt = _now.sec_since_epoch() - reward.last_update_at.sec_since_epoch();

   auto collateral_used = (uint128_t)lp.collateral_used.amount;
   auto borrow_used     = (uint128_t)lp.borrow_used.amount;
   auto collateral_base = collateral_used > reward.minimum_amount ? collateral_used : reward.minimum_amount;
   auto borrow_base     = borrow_used > reward.minimum_amount ? borrow_used : reward.minimum_amount;

   if (reward.collateral_speed > 0 && collateral_base > 0)
      reward.collateral_reward_index += mul_scale(dt, reward.collateral_speed, collateral_base);
   if (reward.borrow_speed > 0 && borrow_base > 0)
      reward.borrow_reward_index += mul_scale(dt, reward.borrow_speed, borrow_base);
   reward.last_update_at = _now;

   _events.reward_indexes_updated({ loan_type_id, pool_id, reward.collateral_reward_index, reward.borrow_reward_index });
}

uint128_t reward_accrual::accrue_collateral(user_loan_t& loan, const uint8_t& pool_id) {
   update_loan_pool_indexes(loan.loan_type_id, pool_id);
   const auto& index = _state.loan_pool(loan.loan_type_id, pool_id).reward.collateral_reward_index;

   auto itr = loan.collaterals.find(pool_id);
   if (itr == loan.collaterals.end()) return index;

   auto& pos = itr->second;
   if (index > pos.reward_index) {
      auto accrued = mul_scale(amount_of(pos.balance), index - pos.reward_index, ONE_18DP);
      _credit(loan, pool_id, accrued, 0);
   }
   pos.reward_index = index;
   return index;
}

uint128_t reward_accrual::accrue_borrow(user_loan_t& loan, const uint8_t& pool_id) {
   update_loan_pool_indexes(loan.loan_type_id, pool_id);
   const auto& index = _state.loan_pool(loan.loan_type_id, pool_id).reward.borrow_reward_index;

   auto itr = loan.borrows.find(pool_id);
   if (itr == loan.borrows.end()) return index;

   auto& pos = itr->second;
   if (index > pos.reward_index) {
      auto accrued = mul_scale(amount_of(pos.amount), index - pos.reward_index, ONE_18DP);
      _credit(loan, pool_id, 0, accrued);
   }
   pos.reward_index = index;
   return index;
}

void reward_accrual::update_user_loan(user_loan_t& loan) {
   for (auto& item : loan.collaterals) accrue_collateral(loan, item.first);
   for (auto& item : loan.borrows)     accrue_borrow(loan, item.first);
}

void reward_accrual::credit_interest_paid(const name& account, const uint8_t& pool_id, const asset& interest) {
   if (interest.amount <= 0) return;
   auto& rewards = _state.user_rewards(account, pool_id);
   rewards.interest_paid += (uint64_t)interest.amount;
}

void reward_accrual::_credit(const user_loan_t& loan, const uint8_t& pool_id,
                             const uint128_t& collateral, const uint128_t& borrow) {
   if (collateral == 0 && borrow == 0) return;

   auto& rewards = _state.user_rewards(loan.account, pool_id);
   rewards.collateral += to_reward_units(collateral);
   rewards.borrow     += to_reward_units(borrow);

   _events.user_rewards_updated({ loan.id, loan.account, pool_id,
                                  to_reward_units(collateral), to_reward_units(borrow) });
}

} // namespace xlend
