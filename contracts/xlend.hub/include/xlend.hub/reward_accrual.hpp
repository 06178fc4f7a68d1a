#pragma once

#include <eosio/time.hpp>

#include <xlend.hub/hub_events.hpp>
#include <xlend.hub/hub_state.hpp>
#include <xlend.hub/xlend.hub.db.hpp>

namespace xlend {

/**
 * Per (loan type, pool) reward indices and the per-account reward ledgers.
 *
 * Every collateral or borrow balance change goes through accrue_*() first, so a position is
 * always credited with exactly (balance * index delta) for the time it held that balance.
 * Calling update_*() repeatedly at the same time is a no-op.
 */
class reward_accrual {
public:
   reward_accrual(hub_state& state, hub_events& events, const time_point_sec& now)
   : _state(state), _events(events), _now(now) {}

   void update_loan_pool_indexes(const uint8_t& loan_type_id, const uint8_t& pool_id);

   /// 结算一个抵押仓位的奖励并推进快照，返回当前的全局指数
   uint128_t accrue_collateral(user_loan_t& loan, const uint8_t& pool_id);
   uint128_t accrue_borrow(user_loan_t& loan, const uint8_t& pool_id);

   void update_user_loan(user_loan_t& loan);

   void credit_interest_paid(const name& account, const uint8_t& pool_id, const asset& interest);

private:
   void _credit(const user_loan_t& loan, const uint8_t& pool_id, const uint128_t& collateral, const uint128_t& borrow);

   hub_state&           _state;
   hub_events&          _events;
   time_point_sec       _now;
};

} // namespace xlend
