#include <xlend.hub/hub_state.hpp>

namespace xlend {

pool_t& hub_state::pool(const uint8_t& pool_id) {
   auto itr = _pools.find(pool_id);
   if (itr != _pools.end()) return itr->second;

   pool_tbl pools(_self, _self.value);
   auto row = pools.find(pool_id);
   CHECKC( row != pools.end(), err::RECORD_NOT_FOUND, "unknown pool: " + std::to_string(pool_id) )
   return _pools.emplace(pool_id, *row).first->second;
}

loan_type_t& hub_state::loan_type(const uint8_t& loan_type_id) {
   auto itr = _loan_types.find(loan_type_id);
   if (itr != _loan_types.end()) return itr->second;

   loan_type_tbl loan_types(_self, _self.value);
   auto row = loan_types.find(loan_type_id);
   CHECKC( row != loan_types.end(), err::LOAN_TYPE_UNKNOWN, "loan type unknown: " + std::to_string(loan_type_id) )
   return _loan_types.emplace(loan_type_id, *row).first->second;
}

loan_pool_t& hub_state::loan_pool(const uint8_t& loan_type_id, const uint8_t& pool_id) {
   auto key = std::make_pair(loan_type_id, pool_id);
   auto itr = _loan_pools.find(key);
   if (itr != _loan_pools.end()) return itr->second;

   loan_pool_tbl loan_pools(_self, loan_type_id);
   auto row = loan_pools.find(pool_id);
   CHECKC( row != loan_pools.end(), err::LOAN_POOL_UNKNOWN, "loan pool unknown: "
           + std::to_string(loan_type_id) + "/" + std::to_string(pool_id) )
   return _loan_pools.emplace(key, *row).first->second;
}

user_loan_t& hub_state::loan(const uint64_t& loan_id) {
   CHECKC( _erased_loans.count(loan_id) == 0, err::UNKNOWN_USER_LOAN, "unknown user loan: " + std::to_string(loan_id) )
   auto itr = _loans.find(loan_id);
   if (itr != _loans.end()) return itr->second;

   user_loan_tbl loans(_self, _self.value);
   auto row = loans.find(loan_id);
   CHECKC( row != loans.end(), err::UNKNOWN_USER_LOAN, "unknown user loan: " + std::to_string(loan_id) )
   return _loans.emplace(loan_id, *row).first->second;
}

user_pool_rewards_t& hub_state::user_rewards(const name& account, const uint8_t& pool_id) {
   auto key = std::make_pair(account.value, pool_id);
   auto itr = _user_rewards.find(key);
   if (itr != _user_rewards.end()) return itr->second;

   user_pool_rewards_tbl rewards(_self, account.value);
   auto row = rewards.find(pool_id);
   user_pool_rewards_t rewards_row;
   if (row != rewards.end()) {
      rewards_row = *row;
   } else {
      rewards_row.pool_id = pool_id;
   }
   return _user_rewards.emplace(key, rewards_row).first->second;
}

const price_feed_t& hub_state::price(const uint8_t& pool_id) {
   auto itr = _prices.find(pool_id);
   if (itr != _prices.end()) return itr->second;

   price_feed_t::idx_t feeds(_oracle_contract, _oracle_contract.value);
   auto row = feeds.find(pool_id);
   CHECKC( row != feeds.end() && row->price > 0, err::PRICE_FEED_NOT_FOUND,
           "price feed not found: " + std::to_string(pool_id) )
   CHECKC( row->decimals == pool(pool_id).sym.precision(), err::PARAM_ERROR,
           "price feed decimals mismatch: " + std::to_string(pool_id) )
   return _prices.emplace(pool_id, *row).first->second;
}

user_loan_t& hub_state::add_loan(const user_loan_t& loan) {
   _new_loans.insert(loan.id);
   _erased_loans.erase(loan.id);
   return _loans[loan.id] = loan;
}

void hub_state::erase_loan(const uint64_t& loan_id) {
   _loans.erase(loan_id);
   if (_new_loans.erase(loan_id) == 0)
      _erased_loans.insert(loan_id);
}

void hub_state::commit() {
   pool_tbl pools(_self, _self.value);
   for (const auto& item : _pools) {
      auto itr = pools.find(item.first);
      pools.modify(itr, same_payer, [&](auto& row) { row = item.second; });
   }

   loan_type_tbl loan_types(_self, _self.value);
   for (const auto& item : _loan_types) {
      auto itr = loan_types.find(item.first);
      loan_types.modify(itr, same_payer, [&](auto& row) { row = item.second; });
   }

   for (const auto& item : _loan_pools) {
      loan_pool_tbl loan_pools(_self, item.first.first);
      auto itr = loan_pools.find(item.first.second);
      loan_pools.modify(itr, same_payer, [&](auto& row) { row = item.second; });
   }

   user_loan_tbl loans(_self, _self.value);
   for (const auto& loan_id : _erased_loans) {
      auto itr = loans.find(loan_id);
      if (itr != loans.end()) loans.erase(itr);
   }
   for (const auto& item : _loans) {
      if (_new_loans.count(item.first)) {
         loans.emplace(_self, [&](auto& row) { row = item.second; });
      } else {
         auto itr = loans.find(item.first);
         loans.modify(itr, same_payer, [&](auto& row) { row = item.second; });
      }
   }

   for (const auto& item : _user_rewards) {
      user_pool_rewards_tbl rewards(_self, item.first.first);
      auto itr = rewards.find(item.first.second);
      if (itr == rewards.end()) {
         rewards.emplace(_self, [&](auto& row) { row = item.second; });
      } else {
         rewards.modify(itr, same_payer, [&](auto& row) { row = item.second; });
      }
   }

   _pools.clear();
   _loan_types.clear();
   _loan_pools.clear();
   _loans.clear();
   _new_loans.clear();
   _erased_loans.clear();
   _user_rewards.clear();
   _prices.clear();
}

} // namespace xlend
