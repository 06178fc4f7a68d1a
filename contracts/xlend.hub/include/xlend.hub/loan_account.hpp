#pragma once

#include <eosio/asset.hpp>
#include <eosio/time.hpp>

#include <xlend.hub/hub_events.hpp>
#include <xlend.hub/hub_state.hpp>
#include <xlend.hub/pool_account.hpp>
#include <xlend.hub/reward_accrual.hpp>
#include <xlend.hub/xlend.hub.db.hpp>

namespace xlend {

// 18dp USD，已乘上抵押/借款系数
struct loan_health {
   uint128_t            effective_collateral_value = 0;
   uint128_t            effective_borrow_value = 0;

   bool is_over_collateralized() const { return effective_collateral_value >= effective_borrow_value; }
};

struct repay_result {
   asset                principal;
   asset                interest;
   asset                excess;
};

struct liquidation_result {
   asset                repaid;
   asset                seized;          // 清算人获得的 f-token
   asset                reserved;        // 清算费 f-token
   name                 fee_recipient;
};

class loan_account {
public:
   loan_account(user_loan_t& loan, hub_state& state, reward_accrual& rewards,
                hub_events& events, const time_point_sec& now)
   : _loan(loan), _state(state), _rewards(rewards), _events(events), _now(now) {}

   const user_loan_t& loan() const { return _loan; }

   void check_owner(const name& account) const;

   loan_health health();
   bool        is_over_collateralized() { return health().is_over_collateralized(); }

   asset           deposit(const uint8_t& pool_id, const asset& amount);
   void            deposit_famount(const uint8_t& pool_id, const asset& famount);
   withdraw_result withdraw(const uint8_t& pool_id, const asset& amount, const bool& is_famount,
                            const bool& check_over_collateralization);
   void            withdraw_famount(const uint8_t& pool_id, const asset& famount);
   void            borrow(const uint8_t& pool_id, const asset& amount, const uint128_t& max_stable_rate);
   repay_result    repay(const uint8_t& pool_id, const asset& amount, const asset& max_over_repayment);
   repay_result    repay_with_collateral(const uint8_t& pool_id, const asset& amount);
   void            switch_borrow_type(const uint8_t& pool_id, const uint128_t& max_stable_rate);
   void            rebalance_up(const uint8_t& pool_id);
   void            rebalance_down(const uint8_t& pool_id);

   static liquidation_result liquidate(loan_account& violator, loan_account& liquidator,
                                       const uint8_t& col_pool_id, const uint8_t& bor_pool_id,
                                       const asset& max_repay, const asset& min_seized);

private:
   loan_pool_t&     _active_loan_pool(const uint8_t& pool_id);
   loan_borrow_st&  _borrow_position(const uint8_t& pool_id);
   uint128_t        _borrow_index(const loan_borrow_st& pos, const pool_account& pool) const;
   void             _update_borrow_balance(loan_borrow_st& pos, const pool_account& pool);
   void             _credit_collateral(const uint8_t& pool_id, const asset& famount);
   void             _debit_collateral(const uint8_t& pool_id, const asset& famount);
   void             _log(const name& type, const uint8_t& pool_id, const asset& amount, const asset& famount,
                         const uint128_t& stable_rate = 0);

   user_loan_t&         _loan;
   hub_state&           _state;
   reward_accrual&      _rewards;
   hub_events&          _events;
   time_point_sec       _now;
};

} // namespace xlend
