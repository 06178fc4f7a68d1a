#include <xlend.ftoken/xlend.ftoken.hpp>

namespace xlend { namespace ftoken {

void xftoken::init(const name& issuer)
{
    require_auth( _self );
    check( is_account(issuer), "issuer account does not exist" );
    _g.issuer = issuer;
}

void xftoken::create(const symbol& sym)
{
    require_auth( _g.issuer );
    check( sym.is_valid(), "invalid symbol name" );

    stats statstable( _self, sym.code().raw() );
    check( statstable.find(sym.code().raw()) == statstable.end(), "token with symbol already exists" );

    statstable.emplace( _self, [&]( auto& s ) {
        s.supply = asset(0, sym);
    });
}

void xftoken::check_quantity(const asset& quantity, const string& memo)
{
    check( memo.size() <= 256, "memo has more than 256 bytes" );
    check( quantity.is_valid(), "invalid quantity" );
    check( quantity.amount > 0, "must be positive quantity" );
}

void xftoken::mint(const name& to, const asset& quantity, const string& memo)
{
    require_auth( _g.issuer );
    check_quantity( quantity, memo );
    check( is_account(to), "to account does not exist" );

    stats statstable( _self, quantity.symbol.code().raw() );
    const auto& st = statstable.get( quantity.symbol.code().raw(), "token does not exist" );
    check( quantity.symbol == st.supply.symbol, "symbol precision mismatch" );

    statstable.modify( st, same_payer, [&]( auto& s ) {
        s.supply += quantity;
    });

    require_recipient( to );
    add_balance( to, quantity, _self );
}

void xftoken::burn(const name& from, const asset& quantity, const string& memo)
{
    require_auth( _g.issuer );
    check_quantity( quantity, memo );

    stats statstable( _self, quantity.symbol.code().raw() );
    const auto& st = statstable.get( quantity.symbol.code().raw(), "token does not exist" );
    check( quantity.symbol == st.supply.symbol, "symbol precision mismatch" );
    check( st.supply >= quantity, "supply over-burnt" );

    statstable.modify( st, same_payer, [&]( auto& s ) {
        s.supply -= quantity;
    });

    require_recipient( from );
    sub_balance( from, quantity );
}

void xftoken::transfer(const name& from, const name& to, const asset& quantity, const string& memo)
{
    require_auth( from );

    check( from != to, "cannot transfer to self" );
    check( is_account(to), "to account does not exist" );
    check( !_g.paused, "token transfer paused" );
    check_quantity( quantity, memo );

    stats statstable( _self, quantity.symbol.code().raw() );
    const auto& st = statstable.get( quantity.symbol.code().raw(), "token does not exist" );
    check( quantity.symbol == st.supply.symbol, "symbol precision mismatch" );

    require_recipient( from );
    require_recipient( to );

    auto payer = has_auth(to) ? to : from;

    sub_balance( from, quantity );
    add_balance( to, quantity, payer );
}

void xftoken::sub_balance(const name& owner, const asset& quant)
{
    accounts from_accts( get_self(), owner.value );
    const auto& from = from_accts.get( quant.symbol.code().raw(), "no balance object found" );
    check( from.balance >= quant, "overdrawn balance" );

    from_accts.modify( from, same_payer, [&]( auto& a ) {
        a.balance -= quant;
    });
}

void xftoken::add_balance(const name& owner, const asset& quant, const name& ram_payer)
{
    accounts to_accts( get_self(), owner.value );
    auto to = to_accts.find( quant.symbol.code().raw() );
    if (to == to_accts.end()) {
        to_accts.emplace( ram_payer, [&]( auto& a ) {
            a.balance = quant;
        });
        return;
    }

    to_accts.modify( to, same_payer, [&]( auto& a ) {
        a.balance += quant;
    });
}

}} // namespace xlend::ftoken
