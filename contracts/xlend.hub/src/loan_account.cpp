#include <xlend.hub/loan_account.hpp>

namespace xlend {

using namespace xlend::math;

static uint64_t elapsed(const time_point_sec& from, const time_point_sec& to) {
   return to > from ? uint64_t(to.sec_since_epoch() - from.sec_since_epoch()) : 0;
}

static asset sub_floor(const asset& a, const asset& b) {
   return a > b ? a - b : asset(0, a.symbol);
}

static void check_collateral_cap(const loan_pool_t& lp, const pool_account& pool, const price_feed_t& price) {
   if (lp.collateral_cap == 0) return;

   auto underlying = to_underlying_amount(amount_of(lp.collateral_used), pool.pool().deposit.interest_index);
   auto value      = dollar_value(underlying, price.price, price.decimals);
   auto cap        = (uint128_t)lp.collateral_cap * ONE_18DP;
   CHECKC( value <= cap, err::COLLATERAL_CAP_REACHED, "collateral cap reached: "
           + to_string_u128(value) + " > " + to_string_u128(cap) )
}

void loan_account::check_owner(const name& account) const {
   CHECKC( _loan.account == account, err::NOT_ACCOUNT_OWNER, "not account owner: " + account.to_string() )
}

loan_pool_t& loan_account::_active_loan_pool(const uint8_t& pool_id) {
   auto& lp = _state.loan_pool(_loan.loan_type_id, pool_id);
   CHECKC( !lp.deprecated, err::LOAN_POOL_DEPRECATED, "loan pool deprecated: " + std::to_string(pool_id) )
   return lp;
}

loan_borrow_st& loan_account::_borrow_position(const uint8_t& pool_id) {
   auto itr = _loan.borrows.find(pool_id);
   CHECKC( itr != _loan.borrows.end(), err::NO_BORROW_IN_LOAN_FOR_POOL,
           "no borrow in loan for pool: " + std::to_string(pool_id) )
   return itr->second;
}

// 稳定利率仓位按自己的利率复利，浮动利率仓位跟随池子指数
uint128_t loan_account::_borrow_index(const loan_borrow_st& pos, const pool_account& pool) const {
   if (pos.is_stable)
      return compound_index(pos.stable_interest_rate, pos.last_interest_index,
                            elapsed(pos.last_stable_update_at, _now), true);
   return pool.updated_variable_borrow_index();
}

void loan_account::_update_borrow_balance(loan_borrow_st& pos, const pool_account& pool) {
   auto index = _borrow_index(pos, pool);
   pos.balance = to_asset(borrow_balance(amount_of(pos.balance), index, pos.last_interest_index), pos.balance.symbol);
   pos.last_interest_index = index;
   if (pos.is_stable) pos.last_stable_update_at = _now;
}

void loan_account::_credit_collateral(const uint8_t& pool_id, const asset& famount) {
   auto& lp   = _state.loan_pool(_loan.loan_type_id, pool_id);
   auto  itr  = _loan.collaterals.find(pool_id);
   if (itr == _loan.collaterals.end()) {
      loan_collateral_st pos;
      pos.balance      = asset(0, famount.symbol);
      pos.reward_index = lp.reward.collateral_reward_index;
      itr = _loan.collaterals.emplace(pool_id, pos).first;
   }
   itr->second.balance += famount;
   lp.collateral_used  += famount;
}

void loan_account::_debit_collateral(const uint8_t& pool_id, const asset& famount) {
   auto& lp  = _state.loan_pool(_loan.loan_type_id, pool_id);
   auto  itr = _loan.collaterals.find(pool_id);
   CHECKC( itr != _loan.collaterals.end(), err::NO_COLLATERAL_IN_LOAN_FOR_POOL,
           "no collateral in loan for pool: " + std::to_string(pool_id) )
   CHECKC( famount <= itr->second.balance, err::INSUFFICIENT_COLLATERAL, "insufficient collateral: "
           + famount.to_string() + " > " + itr->second.balance.to_string() )

   itr->second.balance -= famount;
   lp.collateral_used   = sub_floor(lp.collateral_used, famount);
   if (itr->second.balance.amount == 0)
      _loan.collaterals.erase(itr);
}

void loan_account::_log(const name& type, const uint8_t& pool_id, const asset& amount, const asset& famount,
                        const uint128_t& stable_rate) {
   _events.loan_updated({ type, _loan.id, _loan.account, pool_id, amount, famount, stable_rate });
}

loan_health loan_account::health() {
   loan_health h;
   for (const auto& item : _loan.collaterals) {
      const auto& lp    = _state.loan_pool(_loan.loan_type_id, item.first);
      const auto& price = _state.price(item.first);
      pool_account pool(_state.pool(item.first), _events, _now);

      auto underlying = to_underlying_amount(amount_of(item.second.balance), pool.updated_deposit_index());
      auto value      = dollar_value(underlying, price.price, price.decimals);
      h.effective_collateral_value += mul_scale(value, lp.collateral_factor, ONE_4DP);
   }
   for (const auto& item : _loan.borrows) {
      const auto& lp    = _state.loan_pool(_loan.loan_type_id, item.first);
      const auto& price = _state.price(item.first);
      pool_account pool(_state.pool(item.first), _events, _now);

      const auto& pos = item.second;
      auto balance = borrow_balance(amount_of(pos.balance), _borrow_index(pos, pool), pos.last_interest_index);
      auto value   = dollar_value(balance, price.price, price.decimals, true);
      h.effective_borrow_value += mul_scale_round_up(value, lp.borrow_factor, ONE_4DP);
   }
   return h;
}

asset loan_account::deposit(const uint8_t& pool_id, const asset& amount) {
   CHECKC( amount.amount > 0, err::NOT_POSITIVE, "deposit amount must be positive" )
   const auto& lp = _active_loan_pool(pool_id);
   pool_account pool(_state.pool(pool_id), _events, _now);
   CHECKC( amount.symbol == pool.pool().sym, err::SYMBOL_MISMATCH, "symbol mismatch: " + amount.to_string() )
   const auto& price = _state.price(pool_id);

   _rewards.accrue_collateral(_loan, pool_id);
   auto res = pool.apply_deposit(amount, price);
   CHECKC( res.famount.amount > 0, err::NOT_POSITIVE, "deposit amount too small" )
   _credit_collateral(pool_id, res.famount);
   check_collateral_cap(lp, pool, price);

   _log("deposit"_n, pool_id, amount, res.famount);
   return res.famount;
}

void loan_account::deposit_famount(const uint8_t& pool_id, const asset& famount) {
   CHECKC( famount.amount > 0, err::NOT_POSITIVE, "deposit amount must be positive" )
   const auto& lp = _active_loan_pool(pool_id);
   pool_account pool(_state.pool(pool_id), _events, _now);
   CHECKC( famount.symbol == pool.pool().fsym, err::SYMBOL_MISMATCH, "symbol mismatch: " + famount.to_string() )
   CHECKC( !pool.pool().config.deprecated, err::DEPRECATED_POOL, "deprecated pool" )
   const auto& price = _state.price(pool_id);

   pool.refresh_indices();
   _rewards.accrue_collateral(_loan, pool_id);
   _credit_collateral(pool_id, famount);
   check_collateral_cap(lp, pool, price);

   auto underlying = to_asset(to_underlying_amount(amount_of(famount), pool.pool().deposit.interest_index), pool.pool().sym);
   _log("depositf"_n, pool_id, underlying, famount);
}

withdraw_result loan_account::withdraw(const uint8_t& pool_id, const asset& amount, const bool& is_famount,
                                       const bool& check_over_collateralization) {
   CHECKC( amount.amount > 0, err::NOT_POSITIVE, "withdraw amount must be positive" )
   auto itr = _loan.collaterals.find(pool_id);
   CHECKC( itr != _loan.collaterals.end(), err::NO_COLLATERAL_IN_LOAN_FOR_POOL,
           "no collateral in loan for pool: " + std::to_string(pool_id) )

   pool_account pool(_state.pool(pool_id), _events, _now);
   const auto& expected = is_famount ? pool.pool().fsym : pool.pool().sym;
   CHECKC( amount.symbol == expected, err::SYMBOL_MISMATCH, "symbol mismatch: " + amount.to_string() )

   auto res = pool.prepare_withdraw(amount, is_famount);
   CHECKC( res.famount <= itr->second.balance, err::INSUFFICIENT_COLLATERAL, "insufficient collateral: "
           + res.famount.to_string() + " > " + itr->second.balance.to_string() )

   _rewards.accrue_collateral(_loan, pool_id);
   _debit_collateral(pool_id, res.famount);
   if (check_over_collateralization)
      CHECKC( is_over_collateralized(), err::UNDER_COLLATERALIZED, "under collateralized loan" )

   pool.apply_withdraw(res.underlying);
   _log("withdraw"_n, pool_id, res.underlying, res.famount);
   return res;
}

void loan_account::withdraw_famount(const uint8_t& pool_id, const asset& famount) {
   CHECKC( famount.amount > 0, err::NOT_POSITIVE, "withdraw amount must be positive" )
   auto itr = _loan.collaterals.find(pool_id);
   CHECKC( itr != _loan.collaterals.end(), err::NO_COLLATERAL_IN_LOAN_FOR_POOL,
           "no collateral in loan for pool: " + std::to_string(pool_id) )

   pool_account pool(_state.pool(pool_id), _events, _now);
   CHECKC( pool.pool().config.can_mint_ftoken, err::CANNOT_MINT_FTOKEN, "cannot mint ftoken" )
   CHECKC( famount.symbol == pool.pool().fsym, err::SYMBOL_MISMATCH, "symbol mismatch: " + famount.to_string() )

   pool.refresh_indices();
   _rewards.accrue_collateral(_loan, pool_id);
   _debit_collateral(pool_id, famount);
   CHECKC( is_over_collateralized(), err::UNDER_COLLATERALIZED, "under collateralized loan" )

   auto underlying = to_asset(to_underlying_amount(amount_of(famount), pool.pool().deposit.interest_index), pool.pool().sym);
   _log("withdrawf"_n, pool_id, underlying, famount);
}

void loan_account::borrow(const uint8_t& pool_id, const asset& amount, const uint128_t& max_stable_rate) {
   CHECKC( amount.amount > 0, err::NOT_POSITIVE, "borrow amount must be positive" )
   auto& lp = _active_loan_pool(pool_id);
   pool_account pool(_state.pool(pool_id), _events, _now);
   CHECKC( amount.symbol == pool.pool().sym, err::SYMBOL_MISMATCH, "symbol mismatch: " + amount.to_string() )
   const auto& price = _state.price(pool_id);

   const bool is_stable = max_stable_rate > 0;
   auto params = pool.prepare_borrow(amount, is_stable, max_stable_rate, price);

   if (lp.borrow_cap > 0) {
      auto value = dollar_value(amount_of(lp.borrow_used + amount), price.price, price.decimals);
      auto cap   = (uint128_t)lp.borrow_cap * ONE_18DP;
      CHECKC( value <= cap, err::LOAN_BORROW_CAP_REACHED, "loan pool borrow cap reached: "
              + to_string_u128(value) + " > " + to_string_u128(cap) )
   }

   auto reward_index = _rewards.accrue_borrow(_loan, pool_id);
   auto itr = _loan.borrows.find(pool_id);
   if (itr == _loan.borrows.end()) {
      loan_borrow_st pos;
      pos.amount                = asset(0, amount.symbol);
      pos.balance               = asset(0, amount.symbol);
      pos.is_stable             = is_stable;
      pos.last_interest_index   = is_stable ? HIGH_PRECISION : params.variable_borrow_interest_index;
      pos.stable_interest_rate  = is_stable ? params.stable_borrow_interest_rate : 0;
      pos.last_stable_update_at = _now;
      pos.reward_index          = reward_index;
      itr = _loan.borrows.emplace(pool_id, pos).first;
   } else {
      CHECKC( itr->second.is_stable == is_stable, err::BORROW_TYPE_MISMATCH, "borrow type mismatch" )
      _update_borrow_balance(itr->second, pool);
      if (is_stable) {
         itr->second.stable_interest_rate = loan_stable_rate_after_increase(
            amount_of(itr->second.balance), itr->second.stable_interest_rate,
            amount_of(amount), params.stable_borrow_interest_rate);
      }
   }

   auto& pos = itr->second;
   pos.amount    += amount;
   pos.balance   += amount;
   lp.borrow_used += amount;

   pool.apply_borrow(amount, is_stable, params.stable_borrow_interest_rate);
   CHECKC( is_over_collateralized(), err::UNDER_COLLATERALIZED, "under collateralized loan" )

   _log("borrow"_n, pool_id, amount, asset(0, pool.pool().fsym), pos.stable_interest_rate);
}

repay_result loan_account::repay(const uint8_t& pool_id, const asset& amount, const asset& max_over_repayment) {
   CHECKC( amount.amount > 0, err::NOT_POSITIVE, "repay amount must be positive" )
   auto& lp  = _state.loan_pool(_loan.loan_type_id, pool_id);
   auto& pos = _borrow_position(pool_id);
   pool_account pool(_state.pool(pool_id), _events, _now);
   CHECKC( amount.symbol == pool.pool().sym && max_over_repayment.symbol == pool.pool().sym,
           err::SYMBOL_MISMATCH, "symbol mismatch: " + amount.to_string() )

   pool.refresh_indices();
   _rewards.accrue_borrow(_loan, pool_id);
   _update_borrow_balance(pos, pool);

   // 先还利息再还本金
   const auto owed = pos.balance;
   CHECKC( amount <= owed + max_over_repayment, err::EXCESS_REPAYMENT_EXCEEDED, "excess repayment exceeded: "
           + amount.to_string() + " > " + (owed + max_over_repayment).to_string() )

   auto paid     = amount < owed ? amount : owed;
   auto accrued  = sub_floor(pos.balance, pos.amount);
   repay_result res;
   res.excess    = amount - paid;
   res.interest  = paid < accrued ? paid : accrued;
   res.principal = paid - res.interest;

   const bool is_stable   = pos.is_stable;
   const auto stable_rate = pos.stable_interest_rate;

   pos.balance   -= paid;
   pos.amount     = sub_floor(pos.amount, res.principal);
   lp.borrow_used = sub_floor(lp.borrow_used, res.principal);
   if (pos.balance.amount == 0)
      _loan.borrows.erase(pool_id);

   pool.apply_repay(res.principal, res.interest, is_stable, stable_rate, res.excess);
   _rewards.credit_interest_paid(_loan.account, pool_id, res.interest);

   _log("repay"_n, pool_id, amount, asset(0, pool.pool().fsym), stable_rate);
   return res;
}

repay_result loan_account::repay_with_collateral(const uint8_t& pool_id, const asset& amount) {
   CHECKC( amount.amount > 0, err::NOT_POSITIVE, "repay amount must be positive" )
   auto& lp  = _state.loan_pool(_loan.loan_type_id, pool_id);
   auto& pos = _borrow_position(pool_id);
   auto col_itr = _loan.collaterals.find(pool_id);
   CHECKC( col_itr != _loan.collaterals.end(), err::NO_COLLATERAL_IN_LOAN_FOR_POOL,
           "no collateral in loan for pool: " + std::to_string(pool_id) )

   pool_account pool(_state.pool(pool_id), _events, _now);
   CHECKC( amount.symbol == pool.pool().sym, err::SYMBOL_MISMATCH, "symbol mismatch: " + amount.to_string() )

   pool.refresh_indices();
   _rewards.accrue_collateral(_loan, pool_id);
   _rewards.accrue_borrow(_loan, pool_id);
   _update_borrow_balance(pos, pool);

   auto paid    = amount < pos.balance ? amount : pos.balance;
   auto accrued = sub_floor(pos.balance, pos.amount);
   repay_result res;
   res.excess    = asset(0, amount.symbol);
   res.interest  = paid < accrued ? paid : accrued;
   res.principal = paid - res.interest;

   auto famount = to_asset(to_receipt_amount(amount_of(paid), pool.pool().deposit.interest_index, true),
                           pool.pool().fsym);
   _debit_collateral(pool_id, famount);

   const bool is_stable   = pos.is_stable;
   const auto stable_rate = pos.stable_interest_rate;

   pos.balance   -= paid;
   pos.amount     = sub_floor(pos.amount, res.principal);
   lp.borrow_used = sub_floor(lp.borrow_used, res.principal);
   if (pos.balance.amount == 0)
      _loan.borrows.erase(pool_id);

   pool.apply_repay_with_collateral(res.principal, is_stable, stable_rate);
   _rewards.credit_interest_paid(_loan.account, pool_id, res.interest);

   _log("repaywithcol"_n, pool_id, paid, famount, stable_rate);
   return res;
}

void loan_account::switch_borrow_type(const uint8_t& pool_id, const uint128_t& max_stable_rate) {
   auto& pos = _borrow_position(pool_id);
   const bool to_stable = max_stable_rate > 0;
   if (to_stable) {
      CHECKC( !pos.is_stable, err::NO_VARIABLE_BORROW_IN_LOAN_FOR_POOL,
              "no variable borrow in loan for pool: " + std::to_string(pool_id) )
   } else {
      CHECKC( pos.is_stable, err::NO_STABLE_BORROW_IN_LOAN_FOR_POOL,
              "no stable borrow in loan for pool: " + std::to_string(pool_id) )
   }

   pool_account pool(_state.pool(pool_id), _events, _now);
   auto params = pool.prepare_switch_borrow_type(pos.amount, to_stable, max_stable_rate);
   _update_borrow_balance(pos, pool);

   const auto old_rate = pos.stable_interest_rate;
   pool.apply_switch_borrow_type(pos.amount, to_stable, old_rate, params.stable_borrow_interest_rate);

   pos.is_stable = to_stable;
   if (to_stable) {
      pos.stable_interest_rate  = params.stable_borrow_interest_rate;
      pos.last_interest_index   = HIGH_PRECISION;
      pos.last_stable_update_at = _now;
   } else {
      pos.stable_interest_rate  = 0;
      pos.last_interest_index   = params.variable_borrow_interest_index;
   }

   _log("switchbor"_n, pool_id, pos.amount, asset(0, pool.pool().fsym), pos.stable_interest_rate);
}

void loan_account::rebalance_up(const uint8_t& pool_id) {
   auto& pos = _borrow_position(pool_id);
   CHECKC( pos.is_stable, err::NO_STABLE_BORROW_IN_LOAN_FOR_POOL,
           "no stable borrow in loan for pool: " + std::to_string(pool_id) )

   pool_account pool(_state.pool(pool_id), _events, _now);
   auto new_rate = pool.prepare_rebalance_up();
   _update_borrow_balance(pos, pool);

   pool.apply_rebalance(pos.amount, pos.stable_interest_rate, new_rate);
   pos.stable_interest_rate = new_rate;

   _log("rebalanceup"_n, pool_id, pos.amount, asset(0, pool.pool().fsym), new_rate);
}

void loan_account::rebalance_down(const uint8_t& pool_id) {
   auto& pos = _borrow_position(pool_id);
   CHECKC( pos.is_stable, err::NO_STABLE_BORROW_IN_LOAN_FOR_POOL,
           "no stable borrow in loan for pool: " + std::to_string(pool_id) )

   pool_account pool(_state.pool(pool_id), _events, _now);
   auto threshold = pool.rebalance_down_threshold();
   CHECKC( pos.stable_interest_rate > threshold, err::REBALANCE_DOWN_THRESHOLD_NOT_REACHED,
           "rebalance down threshold not reached: " + to_string_u128(pos.stable_interest_rate)
           + " <= " + to_string_u128(threshold) )
   _update_borrow_balance(pos, pool);

   auto new_rate = pool.pool().stable_borrow.interest_rate;
   pool.apply_rebalance(pos.amount, pos.stable_interest_rate, new_rate);
   pos.stable_interest_rate = new_rate;

   _log("rebalancedn"_n, pool_id, pos.amount, asset(0, pool.pool().fsym), new_rate);
}

liquidation_result loan_account::liquidate(loan_account& violator, loan_account& liquidator,
                                           const uint8_t& col_pool_id, const uint8_t& bor_pool_id,
                                           const asset& max_repay, const asset& min_seized) {
   auto& vloan = violator._loan;
   auto& lloan = liquidator._loan;
   auto& state = violator._state;
   const auto& now = violator._now;

   CHECKC( vloan.id != lloan.id, err::SAME_LOAN, "same loan" )
   CHECKC( vloan.loan_type_id == lloan.loan_type_id, err::LOAN_TYPE_MISMATCH, "loan type mismatch" )
   CHECKC( max_repay.amount > 0, err::NOT_POSITIVE, "max repay amount must be positive" )

   auto vhealth = violator.health();
   CHECKC( !vhealth.is_over_collateralized(), err::OVER_COLLATERALIZED, "over collateralized loan" )

   auto col_itr = vloan.collaterals.find(col_pool_id);
   CHECKC( col_itr != vloan.collaterals.end(), err::NO_COLLATERAL_IN_LOAN_FOR_POOL,
           "no collateral in loan for pool: " + std::to_string(col_pool_id) )
   auto& vbor = violator._borrow_position(bor_pool_id);

   const auto& col_lp    = state.loan_pool(vloan.loan_type_id, col_pool_id);
   const auto& bor_lp    = state.loan_pool(vloan.loan_type_id, bor_pool_id);
   const auto& col_price = state.price(col_pool_id);
   const auto& bor_price = state.price(bor_pool_id);
   const auto  target    = (uint128_t)state.loan_type(vloan.loan_type_id).loan_target_health;

   pool_account col_pool(state.pool(col_pool_id), violator._events, now);
   pool_account bor_pool(state.pool(bor_pool_id), violator._events, now);
   CHECKC( max_repay.symbol == bor_pool.pool().sym, err::SYMBOL_MISMATCH, "symbol mismatch: " + max_repay.to_string() )
   CHECKC( min_seized.symbol == col_pool.pool().fsym, err::SYMBOL_MISMATCH, "symbol mismatch: " + min_seized.to_string() )
   col_pool.refresh_indices();
   bor_pool.refresh_indices();

   violator._rewards.accrue_collateral(vloan, col_pool_id);
   violator._rewards.accrue_borrow(vloan, bor_pool_id);
   liquidator._rewards.accrue_collateral(lloan, col_pool_id);
   auto lreward_index = liquidator._rewards.accrue_borrow(lloan, bor_pool_id);
   violator._update_borrow_balance(vbor, bor_pool);

   // 还款上限：不超过把借款人拉回目标健康度所需的量
   auto repay = amount_of(max_repay) < amount_of(vbor.balance) ? amount_of(max_repay) : amount_of(vbor.balance);
   const uint128_t bonus = bor_lp.liquidation_bonus;
   auto wanted_borrow   = mul_scale(vhealth.effective_borrow_value, target, ONE_4DP);
   auto borrow_weight   = (uint128_t)bor_lp.borrow_factor * target / ONE_4DP;
   auto collat_weight   = (uint128_t)col_lp.collateral_factor * (ONE_4DP + bonus) / ONE_4DP;
   if (borrow_weight > collat_weight && wanted_borrow > vhealth.effective_collateral_value) {
      auto max_value = mul_div(wanted_borrow - vhealth.effective_collateral_value, ONE_4DP,
                               borrow_weight - collat_weight);
      auto limit = asset_amount(max_value, bor_price.price, bor_price.decimals);
      if (limit < repay) repay = limit;
   }
   CHECKC( repay > 0, err::NOT_POSITIVE, "nothing to repay" )

   const auto col_index = col_pool.pool().deposit.interest_index;
   auto repay_in_col = convert_asset_amount(repay, bor_price.price, bor_price.decimals,
                                            col_price.price, col_price.decimals);
   auto col_f   = to_receipt_amount(repay_in_col, col_index);
   auto seize_f = to_receipt_amount(mul_scale(repay_in_col, ONE_4DP + bonus, ONE_4DP), col_index);

   auto available_f = amount_of(col_itr->second.balance);
   if (seize_f > available_f) {
      seize_f      = available_f;
      repay_in_col = div_scale(to_underlying_amount(seize_f, col_index), ONE_4DP + bonus, ONE_4DP);
      col_f        = to_receipt_amount(repay_in_col, col_index);
      repay        = convert_asset_amount(repay_in_col, col_price.price, col_price.decimals,
                                          bor_price.price, bor_price.decimals);
      if (repay > amount_of(vbor.balance)) repay = amount_of(vbor.balance);
   }

   auto reserve_f    = seize_f > col_f ? mul_scale(seize_f - col_f, col_lp.liquidation_fee, ONE_4DP) : 0;
   auto liquidator_f = seize_f - reserve_f;
   CHECKC( liquidator_f >= amount_of(min_seized), err::INSUFFICIENT_SEIZED, "insufficient seized: "
           + to_string_u128(liquidator_f) + " < " + min_seized.to_string() )

   const auto& fsym = col_pool.pool().fsym;
   violator._debit_collateral(col_pool_id, to_asset(seize_f, fsym));
   if (liquidator_f > 0) {
      liquidator._credit_collateral(col_pool_id, to_asset(liquidator_f, fsym));
      check_collateral_cap(col_lp, col_pool, col_price);
   }
   // 清算费以 f-token 形式铸给手续费账户，不再计入 loan pool 的抵押量

   // 清算人按比例承接本金与利息
   const auto& sym        = bor_pool.pool().sym;
   const bool  is_stable  = vbor.is_stable;
   const auto  vrate      = vbor.stable_interest_rate;
   auto repaid            = to_asset(repay, sym);
   auto principal_moved   = repaid >= vbor.balance ? vbor.amount
                          : to_asset(mul_div(repay, amount_of(vbor.amount), amount_of(vbor.balance)), sym);

   vbor.balance -= repaid;
   vbor.amount   = sub_floor(vbor.amount, principal_moved);
   if (vbor.balance.amount == 0)
      vloan.borrows.erase(bor_pool_id);

   auto litr = lloan.borrows.find(bor_pool_id);
   if (litr == lloan.borrows.end()) {
      loan_borrow_st pos;
      pos.amount                = asset(0, sym);
      pos.balance               = asset(0, sym);
      pos.is_stable             = is_stable;
      pos.last_interest_index   = is_stable ? HIGH_PRECISION : bor_pool.pool().variable_borrow.interest_index;
      pos.stable_interest_rate  = vrate;
      pos.last_stable_update_at = now;
      pos.reward_index          = lreward_index;
      litr = lloan.borrows.emplace(bor_pool_id, pos).first;
   } else {
      CHECKC( litr->second.is_stable == is_stable, err::BORROW_TYPE_MISMATCH, "borrow type mismatch" )
      liquidator._update_borrow_balance(litr->second, bor_pool);
      if (is_stable) {
         litr->second.stable_interest_rate = loan_stable_rate_after_increase(
            amount_of(litr->second.balance), litr->second.stable_interest_rate, repay, vrate);
      }
   }
   litr->second.amount  += principal_moved;
   litr->second.balance += repaid;

   col_pool.apply_liquidation();
   bor_pool.apply_liquidation();

   CHECKC( liquidator.is_over_collateralized(), err::UNDER_COLLATERALIZED, "under collateralized loan" )

   liquidation_result res;
   res.repaid        = repaid;
   res.seized        = to_asset(liquidator_f, fsym);
   res.reserved      = to_asset(reserve_f, fsym);
   res.fee_recipient = col_pool.pool().fee.fee_recipient;

   violator._events.liquidated({ vloan.id, lloan.id, col_pool_id, bor_pool_id, res.repaid, res.seized, res.reserved });
   return res;
}

} // namespace xlend
