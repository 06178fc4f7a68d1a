#include <xlend.hub/pool_account.hpp>

namespace xlend {

using namespace xlend::math;

static uint64_t elapsed(const time_point_sec& from, const time_point_sec& to) {
   return to > from ? uint64_t(to.sec_since_epoch() - from.sec_since_epoch()) : 0;
}

static asset sub_floor(const asset& a, const asset& b) {
   return a > b ? a - b : asset(0, a.symbol);
}

uint128_t pool_account::updated_deposit_index() const {
   return compound_index(_pool.deposit.interest_rate, _pool.deposit.interest_index,
                         elapsed(_pool.last_update_at, _now), false);
}

uint128_t pool_account::updated_variable_borrow_index() const {
   return compound_index(_pool.variable_borrow.interest_rate, _pool.variable_borrow.interest_index,
                         elapsed(_pool.last_update_at, _now), true);
}

asset pool_account::total_debt() const {
   return _pool.variable_borrow.total_amount + _pool.stable_borrow.total_amount;
}

asset pool_account::available_liquidity() const {
   return sub_floor(_pool.deposit.total_amount, total_debt());
}

uint128_t pool_account::utilisation_ratio() const {
   return math::utilisation_ratio(amount_of(total_debt()), amount_of(_pool.deposit.total_amount));
}

uint128_t pool_account::stable_to_total_debt_ratio() const {
   return stable_debt_to_total_debt_ratio(amount_of(_pool.stable_borrow.total_amount), amount_of(total_debt()));
}

asset pool_account::flash_loan_fee(const asset& amount) const {
   return to_asset(flash_loan_fee_amount(amount_of(amount), _pool.fee.flash_loan_fee), amount.symbol);
}

void pool_account::refresh_indices() {
   auto dt = elapsed(_pool.last_update_at, _now);
   if (dt == 0) return;

   const auto& var  = _pool.variable_borrow;
   const auto& stbl = _pool.stable_borrow;

   // 未分配给存款人的那部分利息留作协议费
   auto debt    = amount_of(total_debt());
   auto overall = overall_borrow_interest_rate(amount_of(var.total_amount), amount_of(stbl.total_amount),
                                               var.interest_rate, stbl.average_interest_rate);
   auto retained = mul_scale(mul_scale(mul_scale(debt, overall, ONE_18DP), _pool.fee.retention_rate, ONE_6DP),
                             dt, SECONDS_IN_YEAR);

   _pool.deposit.interest_index          = updated_deposit_index();
   _pool.variable_borrow.interest_index  = updated_variable_borrow_index();
   _pool.fee.total_retained_amount      += to_asset(retained, _pool.sym);
   _pool.last_update_at                  = _now;

   _events.indexes_updated({ _pool.pool_id, _pool.deposit.interest_index,
                             _pool.variable_borrow.interest_index, _now });
}

void pool_account::recompute_rates() {
   auto& dep  = _pool.deposit;
   auto& var  = _pool.variable_borrow;
   auto& stbl = _pool.stable_borrow;

   auto ut     = utilisation_ratio();
   auto ratiot = stable_to_total_debt_ratio();

   var.interest_rate  = variable_borrow_interest_rate(var.vr0, var.vr1, var.vr2, ut, dep.optimal_utilisation_ratio);
   stbl.interest_rate = stable_borrow_interest_rate(var.vr1, stbl.sr0, stbl.sr1, stbl.sr2, stbl.sr3, ut,
                                                    dep.optimal_utilisation_ratio, ratiot,
                                                    stbl.optimal_stable_to_total_debt_ratio);
   auto overall = overall_borrow_interest_rate(amount_of(var.total_amount), amount_of(stbl.total_amount),
                                               var.interest_rate, stbl.average_interest_rate);
   dep.interest_rate = deposit_interest_rate(ut, overall, _pool.fee.retention_rate);

   _events.rates_updated({ _pool.pool_id, var.interest_rate, stbl.interest_rate, dep.interest_rate });
}

deposit_result pool_account::apply_deposit(const asset& amount, const price_feed_t& price) {
   CHECKC( !_pool.config.deprecated, err::DEPRECATED_POOL, "deprecated pool" )
   refresh_indices();

   auto new_total = _pool.deposit.total_amount + amount;
   if (_pool.caps.deposit > 0) {
      auto value = dollar_value(amount_of(new_total), price.price, price.decimals);
      auto cap   = (uint128_t)_pool.caps.deposit * ONE_18DP;
      CHECKC( value <= cap, err::DEPOSIT_CAP_REACHED, "deposit cap reached: "
              + to_string_u128(value) + " > " + to_string_u128(cap) )
   }
   _pool.deposit.total_amount = new_total;

   auto famount = to_receipt_amount(amount_of(amount), _pool.deposit.interest_index);
   recompute_rates();
   return { to_asset(famount, _pool.fsym), _pool.deposit.interest_index };
}

withdraw_result pool_account::prepare_withdraw(const asset& amount, const bool& is_famount) {
   refresh_indices();

   const auto& index = _pool.deposit.interest_index;
   withdraw_result res;
   if (is_famount) {
      res.famount    = asset(amount.amount, _pool.fsym);
      res.underlying = to_asset(to_underlying_amount(amount_of(amount), index), _pool.sym);
   } else {
      res.underlying = asset(amount.amount, _pool.sym);
      res.famount    = to_asset(to_receipt_amount(amount_of(amount), index, true), _pool.fsym);
   }

   auto available = available_liquidity();
   CHECKC( res.underlying <= available, err::INSUFFICIENT_LIQUIDITY, "insufficient liquidity: "
           + res.underlying.to_string() + " > " + available.to_string() )
   return res;
}

void pool_account::apply_withdraw(const asset& underlying) {
   _pool.deposit.total_amount = sub_floor(_pool.deposit.total_amount, underlying);
   recompute_rates();
}

void pool_account::_check_stable_borrow(const asset& amount, const uint128_t& max_stable_rate) const {
   CHECKC( _pool.config.stable_borrow_supported, err::STABLE_BORROW_NOT_SUPPORTED, "stable borrow not supported" )

   auto limit = mul_scale(amount_of(available_liquidity()), _pool.caps.stable_borrow_percentage, ONE_18DP);
   CHECKC( amount_of(amount) <= limit, err::STABLE_BORROW_PERCENTAGE_CAP_EXCEEDED,
           "stable borrow percentage cap exceeded: " + amount.to_string() + " > " + to_string_u128(limit) )

   const auto& current = _pool.stable_borrow.interest_rate;
   CHECKC( current <= max_stable_rate, err::MAX_STABLE_RATE_EXCEEDED, "max stable rate exceeded: "
           + to_string_u128(current) + " > " + to_string_u128(max_stable_rate) )
}

borrow_params pool_account::prepare_borrow(const asset& amount, const bool& is_stable,
                                           const uint128_t& max_stable_rate, const price_feed_t& price) {
   refresh_indices();
   CHECKC( !_pool.config.deprecated, err::DEPRECATED_POOL, "deprecated pool" )

   auto available = available_liquidity();
   CHECKC( amount <= available, err::INSUFFICIENT_LIQUIDITY, "insufficient liquidity: "
           + amount.to_string() + " > " + available.to_string() )

   if (is_stable) _check_stable_borrow(amount, max_stable_rate);

   if (_pool.caps.borrow > 0) {
      auto value = dollar_value(amount_of(total_debt() + amount), price.price, price.decimals);
      auto cap   = (uint128_t)_pool.caps.borrow * ONE_18DP;
      CHECKC( value <= cap, err::BORROW_CAP_REACHED, "borrow cap reached: "
              + to_string_u128(value) + " > " + to_string_u128(cap) )
   }
   return { _pool.variable_borrow.interest_index, _pool.stable_borrow.interest_rate };
}

void pool_account::apply_borrow(const asset& amount, const bool& is_stable, const uint128_t& stable_rate) {
   if (is_stable) {
      auto& stbl = _pool.stable_borrow;
      stbl.average_interest_rate = increasing_average_stable_rate(amount_of(amount), stable_rate,
                                                                  amount_of(stbl.total_amount),
                                                                  stbl.average_interest_rate);
      stbl.total_amount += amount;
   } else {
      _pool.variable_borrow.total_amount += amount;
   }
   recompute_rates();
}

void pool_account::apply_repay(const asset& principal, const asset& interest, const bool& is_stable,
                               const uint128_t& loan_stable_rate, const asset& excess) {
   if (is_stable) {
      auto& stbl = _pool.stable_borrow;
      stbl.average_interest_rate = decreasing_average_stable_rate(amount_of(principal), loan_stable_rate,
                                                                  amount_of(stbl.total_amount),
                                                                  stbl.average_interest_rate);
      stbl.total_amount = sub_floor(stbl.total_amount, principal);
   } else {
      _pool.variable_borrow.total_amount = sub_floor(_pool.variable_borrow.total_amount, principal);
   }
   _pool.deposit.total_amount      += interest;
   _pool.fee.total_retained_amount += excess;
   recompute_rates();
}

void pool_account::apply_repay_with_collateral(const asset& principal, const bool& is_stable,
                                               const uint128_t& loan_stable_rate) {
   if (is_stable) {
      auto& stbl = _pool.stable_borrow;
      stbl.average_interest_rate = decreasing_average_stable_rate(amount_of(principal), loan_stable_rate,
                                                                  amount_of(stbl.total_amount),
                                                                  stbl.average_interest_rate);
      stbl.total_amount = sub_floor(stbl.total_amount, principal);
   } else {
      _pool.variable_borrow.total_amount = sub_floor(_pool.variable_borrow.total_amount, principal);
   }
   _pool.deposit.total_amount = sub_floor(_pool.deposit.total_amount, principal);
   recompute_rates();
}

void pool_account::apply_liquidation() {
   refresh_indices();
   recompute_rates();
}

borrow_params pool_account::prepare_switch_borrow_type(const asset& amount, const bool& to_stable,
                                                       const uint128_t& max_stable_rate) {
   refresh_indices();
   CHECKC( !_pool.config.deprecated, err::DEPRECATED_POOL, "deprecated pool" )

   if (to_stable) _check_stable_borrow(amount, max_stable_rate);
   return { _pool.variable_borrow.interest_index, _pool.stable_borrow.interest_rate };
}

void pool_account::apply_switch_borrow_type(const asset& amount, const bool& to_stable,
                                            const uint128_t& old_stable_rate, const uint128_t& new_stable_rate) {
   auto& var  = _pool.variable_borrow;
   auto& stbl = _pool.stable_borrow;
   if (to_stable) {
      var.total_amount = sub_floor(var.total_amount, amount);
      stbl.average_interest_rate = increasing_average_stable_rate(amount_of(amount), new_stable_rate,
                                                                  amount_of(stbl.total_amount),
                                                                  stbl.average_interest_rate);
      stbl.total_amount += amount;
   } else {
      stbl.average_interest_rate = decreasing_average_stable_rate(amount_of(amount), old_stable_rate,
                                                                  amount_of(stbl.total_amount),
                                                                  stbl.average_interest_rate);
      stbl.total_amount = sub_floor(stbl.total_amount, amount);
      var.total_amount += amount;
   }
   recompute_rates();
}

uint128_t pool_account::prepare_rebalance_up() {
   refresh_indices();

   const auto& stbl = _pool.stable_borrow;
   const auto& var  = _pool.variable_borrow;

   auto ut  = utilisation_ratio();
   auto min = (uint128_t)stbl.rebalance_up_utilisation_ratio * 100'000'000'000'000ULL;
   CHECKC( ut >= min, err::REBALANCE_UP_UTILISATION_NOT_REACHED, "rebalance up utilisation ratio not reached: "
           + to_string_u128(ut) + " < " + to_string_u128(min) )

   auto threshold = rebalance_up_threshold(stbl.rebalance_up_deposit_interest_rate, var.vr0, var.vr1, var.vr2);
   CHECKC( _pool.deposit.interest_rate <= threshold, err::REBALANCE_UP_THRESHOLD_NOT_REACHED,
           "rebalance up threshold not reached: " + to_string_u128(_pool.deposit.interest_rate)
           + " > " + to_string_u128(threshold) )
   return stbl.interest_rate;
}

uint128_t pool_account::rebalance_down_threshold() {
   refresh_indices();
   return math::rebalance_down_threshold(_pool.stable_borrow.rebalance_down_delta, _pool.stable_borrow.interest_rate);
}

void pool_account::apply_rebalance(const asset& amount, const uint128_t& old_rate, const uint128_t& new_rate) {
   auto& stbl   = _pool.stable_borrow;
   auto total   = amount_of(stbl.total_amount);
   auto removed = amount_of(amount) > total ? total : amount_of(amount);

   auto avg = decreasing_average_stable_rate(removed, old_rate, total, stbl.average_interest_rate);
   stbl.average_interest_rate = increasing_average_stable_rate(removed, new_rate, total - removed, avg);
   recompute_rates();
}

asset pool_account::clear_fees() {
   refresh_indices();
   auto retained = _pool.fee.total_retained_amount;
   _pool.fee.total_retained_amount = asset(0, _pool.sym);
   return retained;
}

} // namespace xlend
