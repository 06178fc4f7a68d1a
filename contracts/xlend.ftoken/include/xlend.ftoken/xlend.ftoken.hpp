#pragma once

#include <eosio/asset.hpp>
#include <eosio/eosio.hpp>
#include <eosio/singleton.hpp>
#include <string>

#define FTOKEN_MINT(bank, to, quantity, memo) \
    {	xlend::ftoken::xftoken::mint_action act{ bank, { {_self, active_perm} } };\
        act.send( to, quantity, memo );}

#define FTOKEN_CREATE(bank, sym) \
    {	xlend::ftoken::xftoken::create_action act{ bank, { {_self, active_perm} } };\
        act.send( sym );}

#define FTOKEN_BURN(bank, from, quantity, memo) \
    {	xlend::ftoken::xftoken::burn_action act{ bank, { {_self, active_perm} } };\
        act.send( from, quantity, memo );}

namespace xlend { namespace ftoken {

using std::string;
using namespace eosio;

/**
 * Receipt token ledger of the lending hub.
 * Every hub pool owns one f-token symbol; balances represent a claim on the pool's deposits
 * at the pool's deposit interest index. Only the issuer (the hub) can mint and burn.
 */
class [[eosio::contract( "xlend.ftoken" )]] xftoken : public contract
{
public:
   using contract::contract;

   xftoken(eosio::name receiver, eosio::name code, datastream<const char*> ds):
      contract(receiver, code, ds), _global(_self, _self.value)
   {
      _g = _global.exists() ? _global.get() : global_t{};
   }

   ~xftoken() { _global.set( _g, get_self() ); }

   ACTION init(const name& issuer);

   /**
    * Register a new f-token symbol.
    *
    * @param sym - the f-token symbol, its precision must match the pool's underlying token.
    */
   ACTION create(const symbol& sym);

   /**
    * Credits `to` with newly minted f-tokens.
    * Issuer only.
    */
   ACTION mint(const name& to, const asset& quantity, const string& memo);

   /**
    * Debits `from` and reduces the supply.
    * Issuer only, the hub relays the owner's intent.
    */
   ACTION burn(const name& from, const asset& quantity, const string& memo);

   ACTION transfer(const name& from, const name& to, const asset& quantity, const string& memo);

   ACTION pause(const bool& paused) {
      require_auth( _g.issuer );
      _g.paused = paused;
   }

   static asset get_balance(const name& token_contract_account, const name& owner, const symbol_code& sym_code)
   {
      accounts accountstable(token_contract_account, owner.value);
      const auto& ac = accountstable.get(sym_code.raw(), "no balance object found");
      return ac.balance;
   }

   static asset get_supply(const name& token_contract_account, const symbol_code& sym_code)
   {
      stats statstable(token_contract_account, sym_code.raw());
      const auto& st = statstable.get(sym_code.raw(), "token does not exist");
      return st.supply;
   }

   using create_action   = eosio::action_wrapper<"create"_n, &xftoken::create>;
   using mint_action     = eosio::action_wrapper<"mint"_n, &xftoken::mint>;
   using burn_action     = eosio::action_wrapper<"burn"_n, &xftoken::burn>;
   using transfer_action = eosio::action_wrapper<"transfer"_n, &xftoken::transfer>;

private:
   struct [[eosio::table("global"), eosio::contract( "xlend.ftoken" )]] global_t {
      name issuer;
      bool paused = false;

      EOSLIB_SERIALIZE( global_t, (issuer)(paused) )
   };
   typedef eosio::singleton< "global"_n, global_t > global_singleton;

   struct [[eosio::table, eosio::contract( "xlend.ftoken" )]] account {
      asset balance;

      uint64_t primary_key() const { return balance.symbol.code().raw(); }
   };

   struct [[eosio::table, eosio::contract( "xlend.ftoken" )]] currency_stats {
      asset supply;

      uint64_t primary_key() const { return supply.symbol.code().raw(); }
   };

   typedef eosio::multi_index< "accounts"_n, account > accounts;
   typedef eosio::multi_index< "stat"_n, currency_stats > stats;

   global_singleton _global;
   global_t         _g;

   void sub_balance(const name& owner, const asset& quant);
   void add_balance(const name& owner, const asset& quant, const name& ram_payer);
   void check_quantity(const asset& quantity, const string& memo);
};

}} // namespace xlend::ftoken
