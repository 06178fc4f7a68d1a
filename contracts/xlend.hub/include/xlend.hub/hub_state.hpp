#pragma once

#include <eosio/eosio.hpp>

#include <map>
#include <set>
#include <utility>

#include <xlend.hub/xlend.hub.db.hpp>
#include <xlend.oracle/xlend.oracle.db.hpp>

namespace xlend {

using price_feed_t = xlend::oracle::price_feed_t;

/**
 * Rows touched by one action.
 * Each row is read from its table at most once, every component mutates the same copy,
 * and commit() writes all of them back at the end of the action.
 */
class hub_state {
public:
   hub_state(const name& self, const name& oracle_contract)
   : _self(self), _oracle_contract(oracle_contract) {}

   pool_t&                 pool(const uint8_t& pool_id);
   loan_type_t&            loan_type(const uint8_t& loan_type_id);
   loan_pool_t&            loan_pool(const uint8_t& loan_type_id, const uint8_t& pool_id);
   user_loan_t&            loan(const uint64_t& loan_id);
   user_pool_rewards_t&    user_rewards(const name& account, const uint8_t& pool_id);
   const price_feed_t&     price(const uint8_t& pool_id);

   user_loan_t&            add_loan(const user_loan_t& loan);
   void                    erase_loan(const uint64_t& loan_id);

   void                    commit();

private:
   name                                                  _self;
   name                                                  _oracle_contract;

   std::map<uint8_t, pool_t>                             _pools;
   std::map<uint8_t, loan_type_t>                        _loan_types;
   std::map<std::pair<uint8_t, uint8_t>, loan_pool_t>    _loan_pools;
   std::map<uint64_t, user_loan_t>                       _loans;
   std::set<uint64_t>                                    _new_loans;
   std::set<uint64_t>                                    _erased_loans;
   std::map<std::pair<uint64_t, uint8_t>, user_pool_rewards_t> _user_rewards;
   std::map<uint8_t, price_feed_t>                       _prices;
};

} // namespace xlend
