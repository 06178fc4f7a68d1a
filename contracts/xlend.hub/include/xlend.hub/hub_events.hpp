#pragma once

#include <eosio/asset.hpp>
#include <eosio/eosio.hpp>
#include <eosio/time.hpp>

#include <string>
#include <vector>

namespace xlend {

using namespace eosio;
using std::string;

struct rates_log_t {
   uint8_t              pool_id;
   uint128_t            variable_borrow_interest_rate;
   uint128_t            stable_borrow_interest_rate;
   uint128_t            deposit_interest_rate;
};

struct indexes_log_t {
   uint8_t              pool_id;
   uint128_t            deposit_interest_index;
   uint128_t            variable_borrow_interest_index;
   time_point_sec       updated_at;
};

// type: createloan / deleteloan / deposit / withdraw / borrow / repay / repaywithcol /
//       switchbor / rebalanceup / rebalancedn
struct loan_log_t {
   name                 type;
   uint64_t             loan_id;
   name                 account;
   uint8_t              pool_id;
   asset                amount;
   asset                famount;
   uint128_t            stable_rate = 0;
};

struct liq_log_t {
   uint64_t             violator_loan_id;
   uint64_t             liquidator_loan_id;
   uint8_t              col_pool_id;
   uint8_t              bor_pool_id;
   asset                repaid;
   asset                seized;         // 清算人获得
   asset                reserved;       // 清算费
};

struct reward_index_log_t {
   uint8_t              loan_type_id;
   uint8_t              pool_id;
   uint128_t            collateral_reward_index;
   uint128_t            borrow_reward_index;
};

struct user_reward_log_t {
   uint64_t             loan_id;
   name                 account;
   uint8_t              pool_id;
   uint64_t             collateral;
   uint64_t             borrow;
};

struct transfer_log_t {
   name                 to;
   asset                quantity;
   string               memo;
};

/**
 * Audit records collected during one action, flushed after the rows are written.
 */
class hub_events {
public:
   void rates_updated(const rates_log_t& log)              { _rates.push_back(log); }
   void indexes_updated(const indexes_log_t& log)          { _indexes.push_back(log); }
   void loan_updated(const loan_log_t& log)                { _loans.push_back(log); }
   void liquidated(const liq_log_t& log)                   { _liqs.push_back(log); }
   void reward_indexes_updated(const reward_index_log_t& log) { _reward_indexes.push_back(log); }
   void user_rewards_updated(const user_reward_log_t& log) { _user_rewards.push_back(log); }
   void transferred(const transfer_log_t& log)             { _transfers.push_back(log); }

   bool empty() const {
      return _rates.empty() && _indexes.empty() && _loans.empty() && _liqs.empty()
          && _reward_indexes.empty() && _user_rewards.empty() && _transfers.empty();
   }

   std::vector<rates_log_t>         _rates;
   std::vector<indexes_log_t>       _indexes;
   std::vector<loan_log_t>          _loans;
   std::vector<liq_log_t>           _liqs;
   std::vector<reward_index_log_t>  _reward_indexes;
   std::vector<user_reward_log_t>   _user_rewards;
   std::vector<transfer_log_t>      _transfers;
};

} // namespace xlend
