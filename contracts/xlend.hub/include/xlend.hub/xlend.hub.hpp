#pragma once

#include <eosio/action.hpp>
#include <eosio/asset.hpp>
#include <eosio/eosio.hpp>
#include <eosio/singleton.hpp>
#include <string>
#include <vector>

#include <xlend.hub/xlend.hub.db.hpp>
#include <xlend.hub/hub_events.hpp>
#include <xlend.hub/hub_state.hpp>

namespace xlend {

using std::string;
using std::vector;

using namespace eosio;

/**
 * The lending hub.
 *
 * User actions arrive from spoke chains through the `bridge` account, which has already
 * authenticated the user and moved the tokens on the spoke side; outbound token releases are
 * published as `notifyxfer` for the bridge to deliver. Pool and loan rows touched by an action
 * are held in `hub_state` and written once when the action ends.
 */
class [[eosio::contract("xlend.hub")]] xlend_hub : public contract {
public:
   using contract::contract;

   xlend_hub(eosio::name receiver, eosio::name code, datastream<const char*> ds)
   : contract(receiver, code, ds),
     _global(get_self(), get_self().value),
     _gstate(_global.exists() ? _global.get() : global_t{}),
     _global_idx(get_self(), get_self().value),
     _gidx(_global_idx.exists() ? _global_idx.get() : global_idx_t{}),
     _state(get_self(), _gstate.oracle_contract),
     _now(current_time_point()) {}

   ~xlend_hub() {
      _state.commit();
      _flush_events();
      _global.set( _gstate, get_self() );
      _global_idx.set( _gidx, get_self() );
   }

   //admin
   ACTION init(const name& admin, const name& bridge, const name& oracle_contract, const name& ftoken_contract);
   ACTION setpause(const bool& paused);

   ACTION addpool(const uint8_t& pool_id, const symbol& sym, const symbol& fsym, const name& fee_recipient);
   ACTION setfeedata(const uint8_t& pool_id, const uint64_t& flash_loan_fee, const uint64_t& retention_rate,
                     const name& fee_recipient);
   ACTION setdepdata(const uint8_t& pool_id, const uint64_t& optimal_utilisation_ratio);
   ACTION setvardata(const uint8_t& pool_id, const uint64_t& vr0, const uint64_t& vr1, const uint64_t& vr2);
   ACTION setstbldata(const uint8_t& pool_id, const uint64_t& sr0, const uint64_t& sr1, const uint64_t& sr2,
                      const uint64_t& sr3, const uint64_t& optimal_stable_to_total_debt_ratio,
                      const uint64_t& rebalance_up_utilisation_ratio,
                      const uint64_t& rebalance_up_deposit_interest_rate,
                      const uint64_t& rebalance_down_delta);
   ACTION setcaps(const uint8_t& pool_id, const uint64_t& deposit, const uint64_t& borrow,
                  const uint128_t& stable_borrow_percentage);
   ACTION setpoolcfg(const uint8_t& pool_id, const bool& deprecated, const bool& stable_borrow_supported,
                     const bool& can_mint_ftoken, const bool& flash_loan_supported);
   ACTION clearfees(const uint8_t& pool_id);

   ACTION addloantype(const uint8_t& loan_type_id, const uint64_t& loan_target_health);
   ACTION deprectype(const uint8_t& loan_type_id);
   ACTION sethealth(const uint8_t& loan_type_id, const uint64_t& loan_target_health);

   ACTION addloanpool(const uint8_t& loan_type_id, const uint8_t& pool_id,
                      const uint64_t& collateral_factor, const uint64_t& collateral_cap,
                      const uint64_t& borrow_factor, const uint64_t& borrow_cap,
                      const uint64_t& liquidation_bonus, const uint64_t& liquidation_fee);
   ACTION deprecloanpl(const uint8_t& loan_type_id, const uint8_t& pool_id);
   ACTION setloanpcaps(const uint8_t& loan_type_id, const uint8_t& pool_id,
                       const uint64_t& collateral_cap, const uint64_t& borrow_cap);
   ACTION setloanpfac(const uint8_t& loan_type_id, const uint8_t& pool_id,
                      const uint64_t& collateral_factor, const uint64_t& borrow_factor);
   ACTION setloanpliq(const uint8_t& loan_type_id, const uint8_t& pool_id,
                      const uint64_t& liquidation_bonus, const uint64_t& liquidation_fee);
   ACTION setloanprwd(const uint8_t& loan_type_id, const uint8_t& pool_id,
                      const uint128_t& collateral_speed, const uint128_t& borrow_speed,
                      const uint128_t& minimum_amount);

   //bridge
   ACTION createloan(const name& account, const uint64_t& nonce, const uint8_t& loan_type_id, const string& loan_name);
   ACTION deleteloan(const name& account, const uint64_t& loan_id);
   ACTION deposit(const name& account, const uint64_t& loan_id, const uint8_t& pool_id, const asset& quantity);
   ACTION depositf(const name& account, const uint64_t& loan_id, const uint8_t& pool_id, const asset& fquantity);
   ACTION withdraw(const name& account, const uint64_t& loan_id, const uint8_t& pool_id,
                   const asset& quantity, const bool& is_famount);
   ACTION withdrawf(const name& account, const uint64_t& loan_id, const uint8_t& pool_id, const asset& fquantity);
   ACTION borrow(const name& account, const uint64_t& loan_id, const uint8_t& pool_id,
                 const asset& quantity, const uint128_t& max_stable_rate);
   ACTION repay(const name& account, const uint64_t& loan_id, const uint8_t& pool_id,
                const asset& quantity, const asset& max_over_repayment);
   ACTION repaywithcol(const name& account, const uint64_t& loan_id, const uint8_t& pool_id, const asset& quantity);
   ACTION liquidate(const name& account, const uint64_t& violator_loan_id, const uint64_t& liquidator_loan_id,
                    const uint8_t& col_pool_id, const uint8_t& bor_pool_id,
                    const asset& max_repay, const asset& min_seized);
   ACTION switchbor(const name& account, const uint64_t& loan_id, const uint8_t& pool_id,
                    const uint128_t& max_stable_rate);

   //anyone
   ACTION rebalanceup(const uint64_t& loan_id, const uint8_t& pool_id);
   ACTION rebalancedn(const uint64_t& loan_id, const uint8_t& pool_id);
   ACTION updindexes(const uint8_t& pool_id);
   ACTION updrwdidx(const vector<loan_pool_ref>& loan_pools);
   ACTION upduserrwd(const vector<uint64_t>& loan_ids);

   ACTION getpool(const uint8_t& pool_id);
   ACTION getflashfee(const uint8_t& pool_id, const asset& quantity);
   ACTION gethealth(const uint64_t& loan_id);

   ACTION notifyrates(const rates_log_t& log);
   using notifyrates_action  = action_wrapper<"notifyrates"_n,  &xlend_hub::notifyrates>;
   ACTION notifyidx(const indexes_log_t& log);
   using notifyidx_action    = action_wrapper<"notifyidx"_n,    &xlend_hub::notifyidx>;
   ACTION notifyloan(const loan_log_t& log);
   using notifyloan_action   = action_wrapper<"notifyloan"_n,   &xlend_hub::notifyloan>;
   ACTION notifyliq(const liq_log_t& log);
   using notifyliq_action    = action_wrapper<"notifyliq"_n,    &xlend_hub::notifyliq>;
   ACTION notifyrwdidx(const reward_index_log_t& log);
   using notifyrwdidx_action = action_wrapper<"notifyrwdidx"_n, &xlend_hub::notifyrwdidx>;
   ACTION notifyusrrwd(const user_reward_log_t& log);
   using notifyusrrwd_action = action_wrapper<"notifyusrrwd"_n, &xlend_hub::notifyusrrwd>;
   ACTION notifyxfer(const transfer_log_t& log);
   using notifyxfer_action   = action_wrapper<"notifyxfer"_n,   &xlend_hub::notifyxfer>;

private:
   global_singleton        _global;
   global_t                _gstate;
   global_idx_singleton    _global_idx;
   global_idx_t            _gidx;
   hub_state               _state;
   hub_events              _events;
   time_point_sec          _now;

   void _check_bridge();
   void _check_pool_params(const pool_t& pool);
   void _check_loan_pool_params(const loan_pool_t& lp);
   uint64_t _new_loan_id();
   void _transfer_out(const name& to, const asset& quantity, const string& memo);
   void _flush_events();
};

} // namespace xlend
