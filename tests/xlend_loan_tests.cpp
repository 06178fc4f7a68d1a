#include "xlend_tester.hpp"

BOOST_AUTO_TEST_SUITE(xlend_loan_tests)

BOOST_FIXTURE_TEST_CASE( create_and_delete_loan, xlend_tester ) try {

   BOOST_REQUIRE_EQUAL( success(), createloan( N(alice), 7 ) );
   auto loan = get_loan( 1 );
   BOOST_REQUIRE( !loan.is_null() );
   BOOST_REQUIRE_EQUAL( "alice", loan["account"].as_string() );
   BOOST_REQUIRE_EQUAL( 7u, loan["nonce"].as<uint64_t>() );
   BOOST_REQUIRE_EQUAL( "main", loan["loan_name"].as_string() );

   BOOST_REQUIRE( has_error( createloan( N(alice), 7 ), hub_err::USER_LOAN_ALREADY_CREATED ) );
   BOOST_REQUIRE( has_error( createloan( N(alice), 8, 9 ), hub_err::LOAN_TYPE_UNKNOWN ) );

   // 同一 nonce 换个账户可以
   BOOST_REQUIRE_EQUAL( success(), createloan( N(bob), 7 ) );
   BOOST_REQUIRE_EQUAL( "bob", get_loan( 2 )["account"].as_string() );

   BOOST_REQUIRE( has_error( deleteloan( N(bob), 1 ), hub_err::NOT_ACCOUNT_OWNER ) );
   BOOST_REQUIRE_EQUAL( success(), deleteloan( N(alice), 1 ) );
   BOOST_REQUIRE( get_loan( 1 ).is_null() );

   produce_blocks();
   BOOST_REQUIRE( has_error( deposit( N(alice), 1, BTC_POOL, "1.00000000 XBTC" ), hub_err::UNKNOWN_USER_LOAN ) );
   BOOST_REQUIRE( !push_action( N(xlend.hub), N(alice), N(createloan), mvo()
      ("account", "alice")
      ("nonce", 9)
      ("loan_type_id", LOAN_TYPE)
      ("loan_name", "") ).empty() );

} FC_LOG_AND_RETHROW()

BOOST_FIXTURE_TEST_CASE( loan_type_admin, xlend_tester ) try {

   BOOST_REQUIRE( has_error( push_action( N(xlend.hub), N(admin), N(addloantype), mvo()
      ("loan_type_id", LOAN_TYPE)
      ("loan_target_health", 12500) ), hub_err::RECORD_EXISTING ) );
   BOOST_REQUIRE( has_error( push_action( N(xlend.hub), N(admin), N(addloantype), mvo()
      ("loan_type_id", 2)
      ("loan_target_health", 9999) ), hub_err::PARAM_ERROR ) );

   BOOST_REQUIRE_EQUAL( success(), push_action( N(xlend.hub), N(admin), N(addloantype), mvo()
      ("loan_type_id", 2)
      ("loan_target_health", 15000) ) );
   BOOST_REQUIRE_EQUAL( success(), createloan( N(alice), 1, 2 ) );

   BOOST_REQUIRE_EQUAL( success(), push_action( N(xlend.hub), N(admin), N(deprectype), mvo()
      ("loan_type_id", 2) ) );
   BOOST_REQUIRE( has_error( createloan( N(alice), 2, 2 ), hub_err::LOAN_TYPE_DEPRECATED ) );
   BOOST_REQUIRE( has_error( push_action( N(xlend.hub), N(admin), N(deprectype), mvo()
      ("loan_type_id", 2) ), hub_err::LOAN_TYPE_DEPRECATED ) );

   // 类型 2 没有配置 loan pool
   BOOST_REQUIRE( has_error( deposit( N(alice), 1, BTC_POOL, "1.00000000 XBTC" ), hub_err::LOAN_POOL_UNKNOWN ) );

   BOOST_REQUIRE( has_error( push_action( N(xlend.hub), N(admin), N(setloanpfac), mvo()
      ("loan_type_id", LOAN_TYPE)
      ("pool_id", BTC_POOL)
      ("collateral_factor", 10001)
      ("borrow_factor", 10000) ), hub_err::PARAM_ERROR ) );
   BOOST_REQUIRE( has_error( push_action( N(xlend.hub), N(admin), N(setloanpfac), mvo()
      ("loan_type_id", LOAN_TYPE)
      ("pool_id", BTC_POOL)
      ("collateral_factor", 8000)
      ("borrow_factor", 9999) ), hub_err::PARAM_ERROR ) );

   BOOST_REQUIRE_EQUAL( success(), push_action( N(xlend.hub), N(admin), N(deprecloanpl), mvo()
      ("loan_type_id", LOAN_TYPE)
      ("pool_id", BTC_POOL) ) );
   BOOST_REQUIRE_EQUAL( success(), createloan( N(bob), 1 ) );
   BOOST_REQUIRE( has_error( deposit( N(bob), 2, BTC_POOL, "1.00000000 XBTC" ), hub_err::LOAN_POOL_DEPRECATED ) );

} FC_LOG_AND_RETHROW()

BOOST_FIXTURE_TEST_CASE( deposit_borrow_repay_withdraw, xlend_tester ) try {

   BOOST_REQUIRE_EQUAL( success(), createloan( N(alice), 1 ) );
   BOOST_REQUIRE_EQUAL( success(), createloan( N(bob), 1 ) );
   BOOST_REQUIRE_EQUAL( success(), deposit( N(alice), 1, BTC_POOL, "1.00000000 XBTC" ) );
   BOOST_REQUIRE_EQUAL( success(), deposit( N(bob), 2, USD_POOL, "10000.00000000 XUSD" ) );

   BOOST_REQUIRE( has_error( deposit( N(bob), 1, BTC_POOL, "1.00000000 XBTC" ), hub_err::NOT_ACCOUNT_OWNER ) );
   BOOST_REQUIRE( has_error( borrow( N(alice), 1, USD_POOL, "800.00000001 XUSD" ), hub_err::UNDER_COLLATERALIZED ) );

   BOOST_REQUIRE_EQUAL( success(), borrow( N(alice), 1, USD_POOL, "500.00000000 XUSD" ) );
   auto pos = get_borrow( 1, USD_POOL );
   BOOST_REQUIRE( !pos["is_stable"].as<bool>() );
   BOOST_REQUIRE_EQUAL( asset::from_string("500.00000000 XUSD"), pos["amount"].as<asset>() );
   BOOST_REQUIRE_EQUAL( asset::from_string("500.00000000 XUSD"), get_loan_pool( LOAN_TYPE, USD_POOL )["borrow_used"].as<asset>() );

   BOOST_REQUIRE( has_error( deleteloan( N(alice), 1 ), hub_err::LOAN_NOT_EMPTY ) );
   produce_blocks();

   BOOST_REQUIRE( has_error( withdraw( N(alice), 1, BTC_POOL, "1.00000000 FBTC", true ), hub_err::UNDER_COLLATERALIZED ) );
   BOOST_REQUIRE( has_error( withdraw( N(alice), 1, BTC_POOL, "1.00000001 XBTC", false ), hub_err::INSUFFICIENT_LIQUIDITY ) );

   produce_block( fc::seconds(3600) );
   BOOST_REQUIRE( get_borrow( 1, USD_POOL )["balance"].as<asset>() == asset::from_string("500.00000000 XUSD") );

   // 余额在还款时才按指数滚动，最多多还 10
   BOOST_REQUIRE( has_error( repay( N(alice), 1, USD_POOL, "600.00000000 XUSD", "10.00000000 XUSD" ),
                             hub_err::EXCESS_REPAYMENT_EXCEEDED ) );
   BOOST_REQUIRE_EQUAL( success(), repay( N(alice), 1, USD_POOL, "510.00000000 XUSD", "10.00000000 XUSD" ) );
   BOOST_REQUIRE( get_borrow( 1, USD_POOL ).is_null() );
   BOOST_REQUIRE_EQUAL( 0, get_loan_pool( LOAN_TYPE, USD_POOL )["borrow_used"].as<asset>().get_amount() );
   BOOST_REQUIRE( get_user_rewards( N(alice), USD_POOL )["interest_paid"].as<uint64_t>() > 0 );

   // 利息进入存款总额，多还的部分计入协议费
   auto pool = get_pool( USD_POOL );
   BOOST_REQUIRE( pool["deposit"]["total_amount"].as<asset>() > asset::from_string("10000.00000000 XUSD") );
   BOOST_REQUIRE( pool["fee"]["total_retained_amount"].as<asset>() > asset::from_string("9.00000000 XUSD") );
   BOOST_REQUIRE_EQUAL( 0, pool["variable_borrow"]["total_amount"].as<asset>().get_amount() );

   BOOST_REQUIRE( has_error( repay( N(alice), 1, USD_POOL, "1.00000000 XUSD", "0.00000000 XUSD" ),
                             hub_err::NO_BORROW_IN_LOAN_FOR_POOL ) );

   BOOST_REQUIRE_EQUAL( success(), withdraw( N(alice), 1, BTC_POOL, "1.00000000 FBTC", true ) );
   BOOST_REQUIRE( get_collateral( 1, BTC_POOL ).is_null() );
   BOOST_REQUIRE_EQUAL( 0, get_pool( BTC_POOL )["deposit"]["total_amount"].as<asset>().get_amount() );
   BOOST_REQUIRE_EQUAL( 0, get_loan_pool( LOAN_TYPE, BTC_POOL )["collateral_used"].as<asset>().get_amount() );

   BOOST_REQUIRE_EQUAL( success(), deleteloan( N(alice), 1 ) );
   BOOST_REQUIRE( get_loan( 1 ).is_null() );

} FC_LOG_AND_RETHROW()

BOOST_FIXTURE_TEST_CASE( loan_pool_caps, xlend_tester ) try {

   BOOST_REQUIRE_EQUAL( success(), push_action( N(xlend.hub), N(admin), N(setloanpcaps), mvo()
      ("loan_type_id", LOAN_TYPE)
      ("pool_id", BTC_POOL)
      ("collateral_cap", 1500)
      ("borrow_cap", 0) ) );
   BOOST_REQUIRE_EQUAL( success(), push_action( N(xlend.hub), N(admin), N(setloanpcaps), mvo()
      ("loan_type_id", LOAN_TYPE)
      ("pool_id", USD_POOL)
      ("collateral_cap", 0)
      ("borrow_cap", 200) ) );

   BOOST_REQUIRE_EQUAL( success(), createloan( N(alice), 1 ) );
   BOOST_REQUIRE_EQUAL( success(), createloan( N(bob), 1 ) );
   BOOST_REQUIRE_EQUAL( success(), deposit( N(bob), 2, USD_POOL, "10000.00000000 XUSD" ) );

   BOOST_REQUIRE( has_error( deposit( N(alice), 1, BTC_POOL, "1.50000001 XBTC" ), hub_err::COLLATERAL_CAP_REACHED ) );
   BOOST_REQUIRE_EQUAL( success(), deposit( N(alice), 1, BTC_POOL, "1.50000000 XBTC" ) );

   BOOST_REQUIRE( has_error( borrow( N(alice), 1, USD_POOL, "200.00000001 XUSD" ), hub_err::LOAN_BORROW_CAP_REACHED ) );
   BOOST_REQUIRE_EQUAL( success(), borrow( N(alice), 1, USD_POOL, "200.00000000 XUSD" ) );

} FC_LOG_AND_RETHROW()

BOOST_FIXTURE_TEST_CASE( repay_with_collateral, xlend_tester ) try {

   BOOST_REQUIRE_EQUAL( success(), createloan( N(alice), 1 ) );
   BOOST_REQUIRE_EQUAL( success(), createloan( N(bob), 1 ) );
   BOOST_REQUIRE_EQUAL( success(), deposit( N(bob), 2, USD_POOL, "10000.00000000 XUSD" ) );
   BOOST_REQUIRE_EQUAL( success(), deposit( N(alice), 1, USD_POOL, "1000.00000000 XUSD" ) );
   BOOST_REQUIRE_EQUAL( success(), borrow( N(alice), 1, USD_POOL, "100.00000000 XUSD" ) );
   produce_blocks();
   produce_block( fc::seconds(3600) );

   BOOST_REQUIRE( has_error( repaywithcol( N(alice), 1, BTC_POOL, "1.00000000 XBTC" ), hub_err::NO_BORROW_IN_LOAN_FOR_POOL ) );

   BOOST_REQUIRE_EQUAL( success(), repaywithcol( N(alice), 1, USD_POOL, "40.00000000 XUSD" ) );
   BOOST_REQUIRE( get_borrow( 1, USD_POOL )["balance"].as<asset>() < asset::from_string("60.00100000 XUSD") );
   auto col = get_collateral( 1, USD_POOL )["balance"].as<asset>();
   BOOST_REQUIRE( col > asset::from_string("959.99000000 FUSD") );
   BOOST_REQUIRE( col < asset::from_string("960.00100000 FUSD") );

   // 超出欠款的部分不扣抵押
   BOOST_REQUIRE_EQUAL( success(), repaywithcol( N(alice), 1, USD_POOL, "150.00000000 XUSD" ) );
   BOOST_REQUIRE( get_borrow( 1, USD_POOL ).is_null() );
   col = get_collateral( 1, USD_POOL )["balance"].as<asset>();
   BOOST_REQUIRE( col < asset::from_string("900.00000000 FUSD") );
   BOOST_REQUIRE( col > asset::from_string("899.99000000 FUSD") );

   auto pool = get_pool( USD_POOL );
   BOOST_REQUIRE_EQUAL( 0, pool["variable_borrow"]["total_amount"].as<asset>().get_amount() );
   BOOST_REQUIRE_EQUAL( asset::from_string("10900.00000000 XUSD"), pool["deposit"]["total_amount"].as<asset>() );

} FC_LOG_AND_RETHROW()

BOOST_FIXTURE_TEST_CASE( switch_borrow_type, xlend_tester ) try {

   BOOST_REQUIRE_EQUAL( success(), createloan( N(alice), 1 ) );
   BOOST_REQUIRE_EQUAL( success(), createloan( N(bob), 1 ) );
   BOOST_REQUIRE_EQUAL( success(), deposit( N(alice), 1, BTC_POOL, "1.00000000 XBTC" ) );
   BOOST_REQUIRE_EQUAL( success(), deposit( N(bob), 2, USD_POOL, "10000.00000000 XUSD" ) );
   BOOST_REQUIRE_EQUAL( success(), borrow( N(alice), 1, USD_POOL, "100.00000000 XUSD" ) );
   produce_blocks();

   BOOST_REQUIRE( has_error( switchbor( N(alice), 1, USD_POOL, 0 ), hub_err::NO_STABLE_BORROW_IN_LOAN_FOR_POOL ) );
   BOOST_REQUIRE( has_error( switchbor( N(alice), 1, USD_POOL, 70'000 * (u128)1'000'000'000'000ULL ),
                             hub_err::MAX_STABLE_RATE_EXCEEDED ) );

   BOOST_REQUIRE_EQUAL( success(), switchbor( N(alice), 1, USD_POOL, E18 ) );
   auto pos = get_borrow( 1, USD_POOL );
   BOOST_REQUIRE( pos["is_stable"].as<bool>() );
   BOOST_REQUIRE( as_u128( pos["stable_interest_rate"] ) > 70'000 * (u128)1'000'000'000'000ULL );

   auto pool = get_pool( USD_POOL );
   BOOST_REQUIRE_EQUAL( 0, pool["variable_borrow"]["total_amount"].as<asset>().get_amount() );
   BOOST_REQUIRE_EQUAL( asset::from_string("100.00000000 XUSD"), pool["stable_borrow"]["total_amount"].as<asset>() );
   BOOST_REQUIRE( as_u128( pool["stable_borrow"]["average_interest_rate"] ) > 70'000 * (u128)1'000'000'000'000ULL );

   produce_blocks();
   BOOST_REQUIRE( has_error( switchbor( N(alice), 1, USD_POOL, E18 ), hub_err::NO_VARIABLE_BORROW_IN_LOAN_FOR_POOL ) );

   // 利率未偏离，不能下调；利用率低，不能上调
   BOOST_REQUIRE( has_error( rebalancedn( 1, USD_POOL ), hub_err::REBALANCE_DOWN_THRESHOLD_NOT_REACHED ) );
   BOOST_REQUIRE( has_error( rebalanceup( 1, USD_POOL ), hub_err::REBALANCE_UP_UTILISATION_NOT_REACHED ) );

   BOOST_REQUIRE_EQUAL( success(), switchbor( N(alice), 1, USD_POOL, 0 ) );
   pos = get_borrow( 1, USD_POOL );
   BOOST_REQUIRE( !pos["is_stable"].as<bool>() );
   BOOST_REQUIRE( as_u128( pos["stable_interest_rate"] ) == 0 );

   pool = get_pool( USD_POOL );
   BOOST_REQUIRE_EQUAL( 0, pool["stable_borrow"]["total_amount"].as<asset>().get_amount() );
   BOOST_REQUIRE( as_u128( pool["stable_borrow"]["average_interest_rate"] ) == 0 );

} FC_LOG_AND_RETHROW()

BOOST_FIXTURE_TEST_CASE( rebalance_stable_rate, xlend_tester ) try {

   const u128 E16 = 10'000'000'000'000'000ULL;

   BOOST_REQUIRE_EQUAL( success(), createloan( N(alice), 1 ) );
   BOOST_REQUIRE_EQUAL( success(), createloan( N(bob), 1 ) );
   BOOST_REQUIRE_EQUAL( success(), createloan( N(alice), 2 ) );
   BOOST_REQUIRE_EQUAL( success(), deposit( N(alice), 1, BTC_POOL, "1.00000000 XBTC" ) );
   BOOST_REQUIRE_EQUAL( success(), deposit( N(bob), 2, USD_POOL, "10000.00000000 XUSD" ) );
   BOOST_REQUIRE_EQUAL( success(), deposit( N(alice), 3, BTC_POOL, "13.00000000 XBTC" ) );

   BOOST_REQUIRE_EQUAL( success(), borrow( N(alice), 1, USD_POOL, "100.00000000 XUSD", E18 ) );
   BOOST_REQUIRE( as_u128( get_borrow( 1, USD_POOL )["stable_interest_rate"] ) == 7 * E16 );

   // 利用率推到 95%
   BOOST_REQUIRE_EQUAL( success(), borrow( N(alice), 3, USD_POOL, "9400.00000000 XUSD" ) );
   produce_blocks();

   // 存款利率高于阈值 0.4 * (vr0 + vr1 + vr2)
   BOOST_REQUIRE( has_error( rebalanceup( 1, USD_POOL ), hub_err::REBALANCE_UP_THRESHOLD_NOT_REACHED ) );

   BOOST_REQUIRE_EQUAL( success(), push_action( N(xlend.hub), N(admin), N(setstbldata), mvo()
      ("pool_id", USD_POOL)
      ("sr0", 20'000)
      ("sr1", 20'000)
      ("sr2", 1'000'000)
      ("sr3", 250'000)
      ("optimal_stable_to_total_debt_ratio", 2000)
      ("rebalance_up_utilisation_ratio", 9500)
      ("rebalance_up_deposit_interest_rate", 10000)
      ("rebalance_down_delta", 2000) ) );

   BOOST_REQUIRE_EQUAL( success(), rebalanceup( 1, USD_POOL ) );
   auto rate = as_u128( get_borrow( 1, USD_POOL )["stable_interest_rate"] );
   BOOST_REQUIRE( rate > 88 * E16 && rate < 90 * E16 );
   auto avg = as_u128( get_pool( USD_POOL )["stable_borrow"]["average_interest_rate"] );
   BOOST_REQUIRE( avg > 88 * E16 && avg < 90 * E16 );

   BOOST_REQUIRE_EQUAL( success(), repay( N(alice), 3, USD_POOL, "9500.00000000 XUSD", "200.00000000 XUSD" ) );
   BOOST_REQUIRE( get_borrow( 3, USD_POOL ).is_null() );
   produce_blocks();

   // 只剩稳定借款，报价 ≈ 0.07 + sr3
   BOOST_REQUIRE_EQUAL( success(), rebalancedn( 1, USD_POOL ) );
   rate = as_u128( get_borrow( 1, USD_POOL )["stable_interest_rate"] );
   BOOST_REQUIRE( rate > 31 * E16 && rate < 34 * E16 );

} FC_LOG_AND_RETHROW()

BOOST_AUTO_TEST_SUITE_END()
