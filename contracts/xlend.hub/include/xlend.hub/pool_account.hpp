#pragma once

#include <eosio/asset.hpp>
#include <eosio/time.hpp>

#include <xlend.hub/fixed_point_math.hpp>
#include <xlend.hub/hub_events.hpp>
#include <xlend.hub/hub_state.hpp>
#include <xlend.hub/xlend.hub.db.hpp>

namespace xlend {

inline uint128_t amount_of(const asset& quantity) {
   CHECKC( quantity.amount >= 0, err::NOT_POSITIVE, "negative amount: " + quantity.to_string() )
   return (uint128_t)quantity.amount;
}

inline asset to_asset(const uint128_t& amount, const symbol& sym) {
   CHECKC( amount <= (uint128_t)asset::max_amount, err::MATH_OVERFLOW, "amount overflow" )
   return asset((int64_t)amount, sym);
}

struct deposit_result {
   asset                famount;
   uint128_t            deposit_interest_index;
};

struct withdraw_result {
   asset                underlying;
   asset                famount;
};

struct borrow_params {
   uint128_t            variable_borrow_interest_index;
   uint128_t            stable_borrow_interest_rate;
};

/**
 * Ledger of a single pool: deposit/borrow totals, interest indices and the rate curves.
 * The only writer of pool rows.
 */
class pool_account {
public:
   pool_account(pool_t& pool, hub_events& events, const time_point_sec& now)
   : _pool(pool), _events(events), _now(now) {}

   const pool_t& pool() const { return _pool; }

   uint128_t updated_deposit_index() const;
   uint128_t updated_variable_borrow_index() const;
   uint128_t utilisation_ratio() const;
   uint128_t stable_to_total_debt_ratio() const;
   asset     total_debt() const;
   asset     available_liquidity() const;
   asset     flash_loan_fee(const asset& amount) const;

   void refresh_indices();
   void recompute_rates();

   deposit_result  apply_deposit(const asset& amount, const price_feed_t& price);
   withdraw_result prepare_withdraw(const asset& amount, const bool& is_famount);
   void            apply_withdraw(const asset& underlying);

   borrow_params   prepare_borrow(const asset& amount, const bool& is_stable,
                                  const uint128_t& max_stable_rate, const price_feed_t& price);
   void            apply_borrow(const asset& amount, const bool& is_stable, const uint128_t& stable_rate);

   void            apply_repay(const asset& principal, const asset& interest, const bool& is_stable,
                               const uint128_t& loan_stable_rate, const asset& excess);
   void            apply_repay_with_collateral(const asset& principal, const bool& is_stable,
                                               const uint128_t& loan_stable_rate);
   void            apply_liquidation();

   borrow_params   prepare_switch_borrow_type(const asset& amount, const bool& to_stable,
                                              const uint128_t& max_stable_rate);
   void            apply_switch_borrow_type(const asset& amount, const bool& to_stable,
                                            const uint128_t& old_stable_rate, const uint128_t& new_stable_rate);

   uint128_t       prepare_rebalance_up();
   uint128_t       rebalance_down_threshold();
   void            apply_rebalance(const asset& amount, const uint128_t& old_rate, const uint128_t& new_rate);

   asset           clear_fees();

private:
   void _check_stable_borrow(const asset& amount, const uint128_t& max_stable_rate) const;

   pool_t&              _pool;
   hub_events&          _events;
   time_point_sec       _now;
};

} // namespace xlend
