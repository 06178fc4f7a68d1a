#include "xlend_tester.hpp"

BOOST_AUTO_TEST_SUITE(xlend_ftoken_tests)

BOOST_FIXTURE_TEST_CASE( pools_create_ftokens, xlend_tester ) try {

   BOOST_REQUIRE_EQUAL( asset::from_string("0.00000000 FBTC"), get_fsupply("8,FBTC") );
   BOOST_REQUIRE_EQUAL( asset::from_string("0.00000000 FUSD"), get_fsupply("8,FUSD") );

   // 只有 hub 能铸币
   BOOST_REQUIRE( !push_action( N(xlend.ftoken), N(alice), N(mint), mvo()
      ("to", "alice")
      ("quantity", "1.00000000 FBTC")
      ("memo", "") ).empty() );

} FC_LOG_AND_RETHROW()

BOOST_FIXTURE_TEST_CASE( withdrawf_and_depositf, xlend_tester ) try {

   BOOST_REQUIRE_EQUAL( success(), createloan( N(alice), 1 ) );
   BOOST_REQUIRE_EQUAL( success(), deposit( N(alice), 1, BTC_POOL, "2.00000000 XBTC" ) );
   produce_blocks();

   BOOST_REQUIRE_EQUAL( success(), withdrawf( N(alice), 1, BTC_POOL, "0.50000000 FBTC" ) );
   BOOST_REQUIRE_EQUAL( asset::from_string("0.50000000 FBTC"), get_fbalance( N(alice), "8,FBTC" ) );
   BOOST_REQUIRE_EQUAL( asset::from_string("0.50000000 FBTC"), get_fsupply("8,FBTC") );
   BOOST_REQUIRE_EQUAL( asset::from_string("1.50000000 FBTC"), get_collateral( 1, BTC_POOL )["balance"].as<asset>() );

   // 底层资产仍留在池子里
   BOOST_REQUIRE_EQUAL( asset::from_string("2.00000000 XBTC"), get_pool( BTC_POOL )["deposit"]["total_amount"].as<asset>() );

   BOOST_REQUIRE_EQUAL( success(), push_action( N(xlend.ftoken), N(alice), N(transfer), mvo()
      ("from", "alice")
      ("to", "bob")
      ("quantity", "0.20000000 FBTC")
      ("memo", "") ) );
   BOOST_REQUIRE_EQUAL( asset::from_string("0.20000000 FBTC"), get_fbalance( N(bob), "8,FBTC" ) );

   BOOST_REQUIRE_EQUAL( success(), depositf( N(alice), 1, BTC_POOL, "0.30000000 FBTC" ) );
   BOOST_REQUIRE_EQUAL( asset::from_string("0.00000000 FBTC"), get_fbalance( N(alice), "8,FBTC" ) );
   BOOST_REQUIRE_EQUAL( asset::from_string("0.20000000 FBTC"), get_fsupply("8,FBTC") );
   BOOST_REQUIRE_EQUAL( asset::from_string("1.80000000 FBTC"), get_collateral( 1, BTC_POOL )["balance"].as<asset>() );

   // 超过持有量时 burn 失败，整个 action 回滚
   BOOST_REQUIRE( !depositf( N(alice), 1, BTC_POOL, "0.10000000 FBTC" ).empty() );
   BOOST_REQUIRE_EQUAL( asset::from_string("1.80000000 FBTC"), get_collateral( 1, BTC_POOL )["balance"].as<asset>() );

} FC_LOG_AND_RETHROW()

BOOST_FIXTURE_TEST_CASE( withdrawf_gated_by_pool_config, xlend_tester ) try {

   BOOST_REQUIRE_EQUAL( success(), createloan( N(alice), 1 ) );
   BOOST_REQUIRE_EQUAL( success(), deposit( N(alice), 1, BTC_POOL, "1.00000000 XBTC" ) );
   BOOST_REQUIRE_EQUAL( success(), setpoolcfg( BTC_POOL, false, true, false, true ) );

   BOOST_REQUIRE( has_error( withdrawf( N(alice), 1, BTC_POOL, "0.10000000 FBTC" ), hub_err::CANNOT_MINT_FTOKEN ) );
   BOOST_REQUIRE( has_error( withdrawf( N(alice), 1, USD_POOL, "1.00000000 FUSD" ), hub_err::NO_COLLATERAL_IN_LOAN_FOR_POOL ) );

} FC_LOG_AND_RETHROW()

BOOST_AUTO_TEST_SUITE_END()
