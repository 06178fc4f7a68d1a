#include <xlend.hub/xlend.hub.hpp>
#include <xlend.hub/loan_account.hpp>
#include <xlend.hub/pool_account.hpp>
#include <xlend.hub/reward_accrual.hpp>
#include <xlend.ftoken/xlend.ftoken.hpp>

namespace xlend {

namespace math {

void fail(math_err code, const char* msg) {
   switch (code) {
      case math_err::RATIO_EXCEEDS_ONE: CHECKC( false, err::RATIO_EXCEEDS_ONE, msg ) break;
      case math_err::MUL_OVERFLOW:      CHECKC( false, err::MATH_OVERFLOW, msg ) break;
      default:                          CHECKC( false, err::MATH_DIVIDE_BY_ZERO, msg ) break;
   }
}

} // namespace math

#define NOTIFY_ACTION(wrapper, item) \
     { xlend_hub::wrapper act{ _self, { {_self, active_perm} } };\
	        act.send( item );}

//============================ admin ============================

void xlend_hub::init(const name& admin, const name& bridge, const name& oracle_contract, const name& ftoken_contract) {
   require_auth( get_self() );
   CHECKC( is_account(admin), err::ACCOUNT_INVALID, "admin account does not exist" )
   CHECKC( is_account(bridge), err::ACCOUNT_INVALID, "bridge account does not exist" )
   CHECKC( is_account(oracle_contract), err::ACCOUNT_INVALID, "oracle contract does not exist" )
   CHECKC( is_account(ftoken_contract), err::ACCOUNT_INVALID, "ftoken contract does not exist" )

   _gstate.admin           = admin;
   _gstate.bridge          = bridge;
   _gstate.oracle_contract = oracle_contract;
   _gstate.ftoken_contract = ftoken_contract;
}

void xlend_hub::setpause(const bool& paused) {
   require_auth( _gstate.admin );
   _gstate.paused = paused;
}

void xlend_hub::addpool(const uint8_t& pool_id, const symbol& sym, const symbol& fsym, const name& fee_recipient) {
   require_auth( _gstate.admin );
   CHECKC( sym.is_valid() && fsym.is_valid(), err::PARAM_ERROR, "invalid symbol" )
   CHECKC( sym.precision() == fsym.precision(), err::SYMBOL_MISMATCH, "ftoken precision must match underlying" )
   CHECKC( is_account(fee_recipient), err::ACCOUNT_INVALID, "fee recipient does not exist" )

   pool_tbl pools( _self, _self.value );
   CHECKC( pools.find(pool_id) == pools.end(), err::RECORD_EXISTING, "pool already exists: " + std::to_string(pool_id) )
   pools.emplace( _self, [&]( auto& p ) {
      p.pool_id                           = pool_id;
      p.sym                               = sym;
      p.fsym                              = fsym;
      p.last_update_at                    = _now;
      p.deposit.total_amount              = asset(0, sym);
      p.variable_borrow.total_amount      = asset(0, sym);
      p.stable_borrow.total_amount        = asset(0, sym);
      p.fee.fee_recipient                 = fee_recipient;
      p.fee.total_retained_amount         = asset(0, sym);
   });

   pool_account pool( _state.pool(pool_id), _events, _now );
   pool.recompute_rates();

   FTOKEN_CREATE( _gstate.ftoken_contract, fsym )
}

void xlend_hub::setfeedata(const uint8_t& pool_id, const uint64_t& flash_loan_fee, const uint64_t& retention_rate,
                           const name& fee_recipient) {
   require_auth( _gstate.admin );
   CHECKC( is_account(fee_recipient), err::ACCOUNT_INVALID, "fee recipient does not exist" )

   auto& row = _state.pool(pool_id);
   pool_account pool( row, _events, _now );
   pool.refresh_indices();
   row.fee.flash_loan_fee = flash_loan_fee;
   row.fee.retention_rate = retention_rate;
   row.fee.fee_recipient  = fee_recipient;
   _check_pool_params(row);
   pool.recompute_rates();
}

void xlend_hub::setdepdata(const uint8_t& pool_id, const uint64_t& optimal_utilisation_ratio) {
   require_auth( _gstate.admin );

   auto& row = _state.pool(pool_id);
   pool_account pool( row, _events, _now );
   pool.refresh_indices();
   row.deposit.optimal_utilisation_ratio = optimal_utilisation_ratio;
   _check_pool_params(row);
   pool.recompute_rates();
}

void xlend_hub::setvardata(const uint8_t& pool_id, const uint64_t& vr0, const uint64_t& vr1, const uint64_t& vr2) {
   require_auth( _gstate.admin );

   auto& row = _state.pool(pool_id);
   pool_account pool( row, _events, _now );
   pool.refresh_indices();
   row.variable_borrow.vr0 = vr0;
   row.variable_borrow.vr1 = vr1;
   row.variable_borrow.vr2 = vr2;
   _check_pool_params(row);
   pool.recompute_rates();
}

void xlend_hub::setstbldata(const uint8_t& pool_id, const uint64_t& sr0, const uint64_t& sr1, const uint64_t& sr2,
                            const uint64_t& sr3, const uint64_t& optimal_stable_to_total_debt_ratio,
                            const uint64_t& rebalance_up_utilisation_ratio,
                            const uint64_t& rebalance_up_deposit_interest_rate,
                            const uint64_t& rebalance_down_delta) {
   require_auth( _gstate.admin );

   auto& row = _state.pool(pool_id);
   pool_account pool( row, _events, _now );
   pool.refresh_indices();

   auto& stbl = row.stable_borrow;
   stbl.sr0                                 = sr0;
   stbl.sr1                                 = sr1;
   stbl.sr2                                 = sr2;
   stbl.sr3                                 = sr3;
   stbl.optimal_stable_to_total_debt_ratio  = optimal_stable_to_total_debt_ratio;
   stbl.rebalance_up_utilisation_ratio      = rebalance_up_utilisation_ratio;
   stbl.rebalance_up_deposit_interest_rate  = rebalance_up_deposit_interest_rate;
   stbl.rebalance_down_delta                = rebalance_down_delta;
   _check_pool_params(row);
   pool.recompute_rates();
}

void xlend_hub::setcaps(const uint8_t& pool_id, const uint64_t& deposit, const uint64_t& borrow,
                        const uint128_t& stable_borrow_percentage) {
   require_auth( _gstate.admin );

   auto& row = _state.pool(pool_id);
   row.caps.deposit                  = deposit;
   row.caps.borrow                   = borrow;
   row.caps.stable_borrow_percentage = stable_borrow_percentage;
   _check_pool_params(row);
}

void xlend_hub::setpoolcfg(const uint8_t& pool_id, const bool& deprecated, const bool& stable_borrow_supported,
                           const bool& can_mint_ftoken, const bool& flash_loan_supported) {
   require_auth( _gstate.admin );

   auto& row = _state.pool(pool_id);
   row.config.deprecated              = deprecated;
   row.config.stable_borrow_supported = stable_borrow_supported;
   row.config.can_mint_ftoken         = can_mint_ftoken;
   row.config.flash_loan_supported    = flash_loan_supported;
}

void xlend_hub::clearfees(const uint8_t& pool_id) {
   require_auth( _gstate.admin );

   pool_account pool( _state.pool(pool_id), _events, _now );
   auto fees = pool.clear_fees();
   CHECKC( fees.amount > 0, err::NOT_POSITIVE, "no fees to clear" )
   _transfer_out( pool.pool().fee.fee_recipient, fees, "clearfees" );
}

void xlend_hub::_check_pool_params(const pool_t& pool) {
   const auto& var  = pool.variable_borrow;
   const auto& stbl = pool.stable_borrow;

   CHECKC( pool.fee.flash_loan_fee <= RATE_BOOST / 10, err::PARAM_ERROR, "flash loan fee too high" )
   CHECKC( pool.fee.retention_rate <= RATE_BOOST, err::PARAM_ERROR, "retention rate too high" )
   CHECKC( pool.deposit.optimal_utilisation_ratio > 0 && pool.deposit.optimal_utilisation_ratio < PCT_BOOST,
           err::PARAM_ERROR, "optimal utilisation ratio must be within (0, 1)" )
   CHECKC( var.vr0 + var.vr1 + var.vr2 <= 100 * RATE_BOOST, err::PARAM_ERROR, "variable borrow rate too high" )
   CHECKC( var.vr1 + stbl.sr0 + stbl.sr1 + stbl.sr2 + stbl.sr3 <= 100 * RATE_BOOST, err::PARAM_ERROR,
           "stable borrow rate too high" )
   CHECKC( stbl.optimal_stable_to_total_debt_ratio < PCT_BOOST, err::PARAM_ERROR,
           "optimal stable to total debt ratio must be below 1" )
   CHECKC( stbl.rebalance_up_utilisation_ratio <= PCT_BOOST, err::PARAM_ERROR, "rebalance up utilisation ratio too high" )
   CHECKC( stbl.rebalance_up_deposit_interest_rate <= PCT_BOOST, err::PARAM_ERROR,
           "rebalance up deposit interest rate too high" )
   CHECKC( pool.caps.stable_borrow_percentage <= HIGH_PRECISION, err::PARAM_ERROR, "stable borrow percentage too high" )
}

void xlend_hub::addloantype(const uint8_t& loan_type_id, const uint64_t& loan_target_health) {
   require_auth( _gstate.admin );
   CHECKC( loan_target_health >= PCT_BOOST, err::PARAM_ERROR, "loan target health must be at least 1" )

   loan_type_tbl loan_types( _self, _self.value );
   CHECKC( loan_types.find(loan_type_id) == loan_types.end(), err::RECORD_EXISTING,
           "loan type already exists: " + std::to_string(loan_type_id) )
   loan_types.emplace( _self, [&]( auto& lt ) {
      lt.loan_type_id       = loan_type_id;
      lt.deprecated         = false;
      lt.loan_target_health = loan_target_health;
   });
}

void xlend_hub::deprectype(const uint8_t& loan_type_id) {
   require_auth( _gstate.admin );
   auto& lt = _state.loan_type(loan_type_id);
   CHECKC( !lt.deprecated, err::LOAN_TYPE_DEPRECATED, "loan type deprecated: " + std::to_string(loan_type_id) )
   lt.deprecated = true;
}

void xlend_hub::sethealth(const uint8_t& loan_type_id, const uint64_t& loan_target_health) {
   require_auth( _gstate.admin );
   CHECKC( loan_target_health >= PCT_BOOST, err::PARAM_ERROR, "loan target health must be at least 1" )
   _state.loan_type(loan_type_id).loan_target_health = loan_target_health;
}

void xlend_hub::addloanpool(const uint8_t& loan_type_id, const uint8_t& pool_id,
                            const uint64_t& collateral_factor, const uint64_t& collateral_cap,
                            const uint64_t& borrow_factor, const uint64_t& borrow_cap,
                            const uint64_t& liquidation_bonus, const uint64_t& liquidation_fee) {
   require_auth( _gstate.admin );
   const auto& lt   = _state.loan_type(loan_type_id);
   const auto& pool = _state.pool(pool_id);
   CHECKC( !lt.deprecated, err::LOAN_TYPE_DEPRECATED, "loan type deprecated: " + std::to_string(loan_type_id) )

   loan_pool_tbl loan_pools( _self, loan_type_id );
   CHECKC( loan_pools.find(pool_id) == loan_pools.end(), err::RECORD_EXISTING, "loan pool already exists" )

   loan_pool_t lp;
   lp.pool_id               = pool_id;
   lp.collateral_factor     = collateral_factor;
   lp.collateral_cap        = collateral_cap;
   lp.borrow_factor         = borrow_factor;
   lp.borrow_cap            = borrow_cap;
   lp.liquidation_bonus     = liquidation_bonus;
   lp.liquidation_fee       = liquidation_fee;
   lp.collateral_used       = asset(0, pool.fsym);
   lp.borrow_used           = asset(0, pool.sym);
   lp.reward.last_update_at = _now;
   _check_loan_pool_params(lp);

   loan_pools.emplace( _self, [&]( auto& row ) { row = lp; });
}

void xlend_hub::deprecloanpl(const uint8_t& loan_type_id, const uint8_t& pool_id) {
   require_auth( _gstate.admin );
   auto& lp = _state.loan_pool(loan_type_id, pool_id);
   CHECKC( !lp.deprecated, err::LOAN_POOL_DEPRECATED, "loan pool deprecated: " + std::to_string(pool_id) )
   lp.deprecated = true;
}

void xlend_hub::setloanpcaps(const uint8_t& loan_type_id, const uint8_t& pool_id,
                             const uint64_t& collateral_cap, const uint64_t& borrow_cap) {
   require_auth( _gstate.admin );
   auto& lp = _state.loan_pool(loan_type_id, pool_id);
   lp.collateral_cap = collateral_cap;
   lp.borrow_cap     = borrow_cap;
}

void xlend_hub::setloanpfac(const uint8_t& loan_type_id, const uint8_t& pool_id,
                            const uint64_t& collateral_factor, const uint64_t& borrow_factor) {
   require_auth( _gstate.admin );
   auto& lp = _state.loan_pool(loan_type_id, pool_id);
   lp.collateral_factor = collateral_factor;
   lp.borrow_factor     = borrow_factor;
   _check_loan_pool_params(lp);
}

void xlend_hub::setloanpliq(const uint8_t& loan_type_id, const uint8_t& pool_id,
                            const uint64_t& liquidation_bonus, const uint64_t& liquidation_fee) {
   require_auth( _gstate.admin );
   auto& lp = _state.loan_pool(loan_type_id, pool_id);
   lp.liquidation_bonus = liquidation_bonus;
   lp.liquidation_fee   = liquidation_fee;
   _check_loan_pool_params(lp);
}

void xlend_hub::setloanprwd(const uint8_t& loan_type_id, const uint8_t& pool_id,
                            const uint128_t& collateral_speed, const uint128_t& borrow_speed,
                            const uint128_t& minimum_amount) {
   require_auth( _gstate.admin );

   // 先按旧速度结算到当前时间
   reward_accrual rewards( _state, _events, _now );
   rewards.update_loan_pool_indexes(loan_type_id, pool_id);

   auto& lp = _state.loan_pool(loan_type_id, pool_id);
   lp.reward.collateral_speed = collateral_speed;
   lp.reward.borrow_speed     = borrow_speed;
   lp.reward.minimum_amount   = minimum_amount;
}

void xlend_hub::_check_loan_pool_params(const loan_pool_t& lp) {
   CHECKC( lp.collateral_factor <= PCT_BOOST, err::PARAM_ERROR, "collateral factor too high" )
   CHECKC( lp.borrow_factor >= PCT_BOOST, err::PARAM_ERROR, "borrow factor too low" )
   CHECKC( lp.liquidation_bonus <= PCT_BOOST, err::PARAM_ERROR, "liquidation bonus too high" )
   CHECKC( lp.liquidation_fee <= PCT_BOOST, err::PARAM_ERROR, "liquidation fee too high" )
}

//============================ bridge ============================

void xlend_hub::_check_bridge() {
   require_auth( _gstate.bridge );
   CHECKC( !_gstate.paused, err::PAUSED, "hub paused" )
}

uint64_t xlend_hub::_new_loan_id() {
   if (_gidx.loan_id == 0 || _gidx.loan_id == std::numeric_limits<uint64_t>::max()) {
      _gidx.loan_id = 1;
   } else {
      _gidx.loan_id++;
   }
   return _gidx.loan_id;
}

void xlend_hub::createloan(const name& account, const uint64_t& nonce, const uint8_t& loan_type_id,
                           const string& loan_name) {
   _check_bridge();
   CHECKC( loan_name.size() <= 64, err::OVERSIZED, "loan name too long" )

   const auto& lt = _state.loan_type(loan_type_id);
   CHECKC( !lt.deprecated, err::LOAN_TYPE_DEPRECATED, "loan type deprecated: " + std::to_string(loan_type_id) )

   user_loan_tbl loans( _self, _self.value );
   auto idx = loans.get_index<"accountnonce"_n>();
   CHECKC( idx.find((uint128_t(account.value) << 64) | nonce) == idx.end(), err::USER_LOAN_ALREADY_CREATED,
           "user loan already created: " + account.to_string() + "/" + std::to_string(nonce) )

   user_loan_t loan;
   loan.id            = _new_loan_id();
   loan.account       = account;
   loan.nonce         = nonce;
   loan.loan_type_id  = loan_type_id;
   loan.loan_name     = loan_name;
   loan.created_at    = _now;
   _state.add_loan(loan);

   _events.loan_updated({ "createloan"_n, loan.id, account, 0, asset(), asset(), 0 });
}

void xlend_hub::deleteloan(const name& account, const uint64_t& loan_id) {
   _check_bridge();

   const auto& loan = _state.loan(loan_id);
   CHECKC( loan.account == account, err::NOT_ACCOUNT_OWNER, "not account owner: " + account.to_string() )
   CHECKC( loan.is_empty(), err::LOAN_NOT_EMPTY, "loan not empty: " + std::to_string(loan_id) )
   _state.erase_loan(loan_id);

   _events.loan_updated({ "deleteloan"_n, loan_id, account, 0, asset(), asset(), 0 });
}

void xlend_hub::deposit(const name& account, const uint64_t& loan_id, const uint8_t& pool_id, const asset& quantity) {
   _check_bridge();

   reward_accrual rewards( _state, _events, _now );
   loan_account loan( _state.loan(loan_id), _state, rewards, _events, _now );
   loan.check_owner(account);
   loan.deposit(pool_id, quantity);
}

void xlend_hub::depositf(const name& account, const uint64_t& loan_id, const uint8_t& pool_id, const asset& fquantity) {
   _check_bridge();

   reward_accrual rewards( _state, _events, _now );
   loan_account loan( _state.loan(loan_id), _state, rewards, _events, _now );
   loan.check_owner(account);
   loan.deposit_famount(pool_id, fquantity);

   FTOKEN_BURN( _gstate.ftoken_contract, account, fquantity, "depositf" )
}

void xlend_hub::withdraw(const name& account, const uint64_t& loan_id, const uint8_t& pool_id,
                         const asset& quantity, const bool& is_famount) {
   _check_bridge();

   reward_accrual rewards( _state, _events, _now );
   loan_account loan( _state.loan(loan_id), _state, rewards, _events, _now );
   loan.check_owner(account);
   auto res = loan.withdraw(pool_id, quantity, is_famount, true);

   _transfer_out( account, res.underlying, "withdraw" );
}

void xlend_hub::withdrawf(const name& account, const uint64_t& loan_id, const uint8_t& pool_id, const asset& fquantity) {
   _check_bridge();

   reward_accrual rewards( _state, _events, _now );
   loan_account loan( _state.loan(loan_id), _state, rewards, _events, _now );
   loan.check_owner(account);
   loan.withdraw_famount(pool_id, fquantity);

   FTOKEN_MINT( _gstate.ftoken_contract, account, fquantity, "withdrawf" )
}

void xlend_hub::borrow(const name& account, const uint64_t& loan_id, const uint8_t& pool_id,
                       const asset& quantity, const uint128_t& max_stable_rate) {
   _check_bridge();

   reward_accrual rewards( _state, _events, _now );
   loan_account loan( _state.loan(loan_id), _state, rewards, _events, _now );
   loan.check_owner(account);
   loan.borrow(pool_id, quantity, max_stable_rate);

   _transfer_out( account, quantity, "borrow" );
}

void xlend_hub::repay(const name& account, const uint64_t& loan_id, const uint8_t& pool_id,
                      const asset& quantity, const asset& max_over_repayment) {
   _check_bridge();

   reward_accrual rewards( _state, _events, _now );
   loan_account loan( _state.loan(loan_id), _state, rewards, _events, _now );
   loan.check_owner(account);
   loan.repay(pool_id, quantity, max_over_repayment);
}

void xlend_hub::repaywithcol(const name& account, const uint64_t& loan_id, const uint8_t& pool_id,
                             const asset& quantity) {
   _check_bridge();

   reward_accrual rewards( _state, _events, _now );
   loan_account loan( _state.loan(loan_id), _state, rewards, _events, _now );
   loan.check_owner(account);
   loan.repay_with_collateral(pool_id, quantity);
}

void xlend_hub::liquidate(const name& account, const uint64_t& violator_loan_id, const uint64_t& liquidator_loan_id,
                          const uint8_t& col_pool_id, const uint8_t& bor_pool_id,
                          const asset& max_repay, const asset& min_seized) {
   _check_bridge();
   CHECKC( violator_loan_id != liquidator_loan_id, err::SAME_LOAN, "same loan" )

   reward_accrual rewards( _state, _events, _now );
   loan_account violator( _state.loan(violator_loan_id), _state, rewards, _events, _now );
   loan_account liquidator( _state.loan(liquidator_loan_id), _state, rewards, _events, _now );
   liquidator.check_owner(account);

   auto res = loan_account::liquidate(violator, liquidator, col_pool_id, bor_pool_id, max_repay, min_seized);
   if (res.reserved.amount > 0) {
      CHECKC( is_account(res.fee_recipient), err::ACCOUNT_INVALID, "fee recipient does not exist" )
      FTOKEN_MINT( _gstate.ftoken_contract, res.fee_recipient, res.reserved, "liquidation fee" )
   }
}

void xlend_hub::switchbor(const name& account, const uint64_t& loan_id, const uint8_t& pool_id,
                          const uint128_t& max_stable_rate) {
   _check_bridge();

   reward_accrual rewards( _state, _events, _now );
   loan_account loan( _state.loan(loan_id), _state, rewards, _events, _now );
   loan.check_owner(account);
   loan.switch_borrow_type(pool_id, max_stable_rate);
}

//============================ anyone ============================

void xlend_hub::rebalanceup(const uint64_t& loan_id, const uint8_t& pool_id) {
   CHECKC( !_gstate.paused, err::PAUSED, "hub paused" )

   reward_accrual rewards( _state, _events, _now );
   loan_account loan( _state.loan(loan_id), _state, rewards, _events, _now );
   loan.rebalance_up(pool_id);
}

void xlend_hub::rebalancedn(const uint64_t& loan_id, const uint8_t& pool_id) {
   CHECKC( !_gstate.paused, err::PAUSED, "hub paused" )

   reward_accrual rewards( _state, _events, _now );
   loan_account loan( _state.loan(loan_id), _state, rewards, _events, _now );
   loan.rebalance_down(pool_id);
}

void xlend_hub::updindexes(const uint8_t& pool_id) {
   pool_account pool( _state.pool(pool_id), _events, _now );
   pool.refresh_indices();
}

void xlend_hub::updrwdidx(const vector<loan_pool_ref>& loan_pools) {
   CHECKC( !loan_pools.empty(), err::PARAM_ERROR, "loan pools must not be empty" )

   reward_accrual rewards( _state, _events, _now );
   for (const auto& ref : loan_pools) {
      rewards.update_loan_pool_indexes(ref.loan_type_id, ref.pool_id);
   }
}

void xlend_hub::upduserrwd(const vector<uint64_t>& loan_ids) {
   CHECKC( !loan_ids.empty(), err::PARAM_ERROR, "loan ids must not be empty" )

   reward_accrual rewards( _state, _events, _now );
   for (const auto& loan_id : loan_ids) {
      rewards.update_user_loan(_state.loan(loan_id));
   }
}

void xlend_hub::getpool(const uint8_t& pool_id) {
   pool_account pool( _state.pool(pool_id), _events, _now );
   const auto& p = pool.pool();

   print( "deposit_index=",          to_string_u128(pool.updated_deposit_index()),
          " variable_index=",        to_string_u128(pool.updated_variable_borrow_index()),
          " deposit_rate=",          to_string_u128(p.deposit.interest_rate),
          " variable_rate=",         to_string_u128(p.variable_borrow.interest_rate),
          " stable_rate=",           to_string_u128(p.stable_borrow.interest_rate),
          " stable_avg_rate=",       to_string_u128(p.stable_borrow.average_interest_rate),
          " available=",             pool.available_liquidity().to_string(),
          " retained=",              p.fee.total_retained_amount.to_string() );
}

void xlend_hub::getflashfee(const uint8_t& pool_id, const asset& quantity) {
   pool_account pool( _state.pool(pool_id), _events, _now );
   CHECKC( pool.pool().config.flash_loan_supported, err::PARAM_ERROR, "flash loan not supported" )
   CHECKC( quantity.symbol == pool.pool().sym, err::SYMBOL_MISMATCH, "symbol mismatch: " + quantity.to_string() )

   print( "flash_loan_fee=", pool.flash_loan_fee(quantity).to_string() );
}

void xlend_hub::gethealth(const uint64_t& loan_id) {
   reward_accrual rewards( _state, _events, _now );
   loan_account loan( _state.loan(loan_id), _state, rewards, _events, _now );
   auto h = loan.health();

   print( "effective_collateral=", to_string_u128(h.effective_collateral_value),
          " effective_borrow=",     to_string_u128(h.effective_borrow_value),
          " over_collateralized=",  h.is_over_collateralized() ? "true" : "false" );
}

//============================ notify ============================

void xlend_hub::notifyrates(const rates_log_t& log) {
   require_auth( get_self() );
   require_recipient( _gstate.bridge );
}

void xlend_hub::notifyidx(const indexes_log_t& log) {
   require_auth( get_self() );
   require_recipient( _gstate.bridge );
}

void xlend_hub::notifyloan(const loan_log_t& log) {
   require_auth( get_self() );
   require_recipient( _gstate.bridge );
}

void xlend_hub::notifyliq(const liq_log_t& log) {
   require_auth( get_self() );
   require_recipient( _gstate.bridge );
}

void xlend_hub::notifyrwdidx(const reward_index_log_t& log) {
   require_auth( get_self() );
   require_recipient( _gstate.bridge );
}

void xlend_hub::notifyusrrwd(const user_reward_log_t& log) {
   require_auth( get_self() );
   require_recipient( _gstate.bridge );
}

void xlend_hub::notifyxfer(const transfer_log_t& log) {
   require_auth( get_self() );
   require_recipient( _gstate.bridge );
}

void xlend_hub::_transfer_out(const name& to, const asset& quantity, const string& memo) {
   if (quantity.amount <= 0) return;
   _events.transferred({ to, quantity, memo });
}

void xlend_hub::_flush_events() {
   if (_events.empty()) return;

   for (const auto& item : _events._indexes)        NOTIFY_ACTION(notifyidx_action, item)
   for (const auto& item : _events._rates)          NOTIFY_ACTION(notifyrates_action, item)
   for (const auto& item : _events._reward_indexes) NOTIFY_ACTION(notifyrwdidx_action, item)
   for (const auto& item : _events._user_rewards)   NOTIFY_ACTION(notifyusrrwd_action, item)
   for (const auto& item : _events._loans)          NOTIFY_ACTION(notifyloan_action, item)
   for (const auto& item : _events._liqs)           NOTIFY_ACTION(notifyliq_action, item)
   for (const auto& item : _events._transfers)      NOTIFY_ACTION(notifyxfer_action, item)
   _events = hub_events{};
}

} // namespace xlend
