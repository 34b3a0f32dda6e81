#include <boost/test/unit_test.hpp>

#include <boost/algorithm/string.hpp>

#include <sidecar/sse/exceptions.hpp>
#include <sidecar/sse/sse_data.hpp>
#include <sidecar/tests/event_fixture.hpp>

#include <limits>
#include <set>
#include <string>

using namespace sidecar;

namespace {

const std::vector< sse::event_type > all_event_types = {
   sse::event_type::api_version,
   sse::event_type::block_added,
   sse::event_type::deploy_accepted,
   sse::event_type::deploy_processed,
   sse::event_type::deploy_expired,
   sse::event_type::fault,
   sse::event_type::finality_signature,
   sse::event_type::step
};

} // anonymous

BOOST_FIXTURE_TEST_SUITE( sse_data_tests, event_fixture )

BOOST_AUTO_TEST_CASE( round_trip_test )
{
   BOOST_TEST_MESSAGE( "Every variant decodes to an equal event and re-encodes to the same bytes" );

   for ( auto t : all_event_types )
   {
      for ( int i = 0; i < 25; i++ )
      {
         auto e = testing::random_event( rng, t );
         BOOST_REQUIRE( sse::type_of( e ) == t );

         auto encoded = sse::encode( e );
         auto decoded = sse::decode( encoded );

         BOOST_REQUIRE( sse::type_of( decoded ) == t );
         BOOST_REQUIRE_MESSAGE( decoded == e, "round trip mismatch for " << encoded );
         BOOST_REQUIRE_EQUAL( sse::encode( decoded ), encoded );
      }
   }
}

BOOST_AUTO_TEST_CASE( deterministic_encoding_test )
{
   BOOST_TEST_MESSAGE( "Encoding the same event twice yields identical bytes" );
   for ( int i = 0; i < 25; i++ )
   {
      auto e = testing::random_event( rng );
      auto copy = e;
      BOOST_REQUIRE_EQUAL( sse::encode( e ), sse::encode( e ) );
      BOOST_REQUIRE_EQUAL( sse::encode( e ), sse::encode( copy ) );
   }
}

BOOST_AUTO_TEST_CASE( discriminator_test )
{
   BOOST_TEST_MESSAGE( "Each record has exactly one key naming its variant" );

   const std::vector< std::string > names = {
      "ApiVersion", "BlockAdded", "DeployAccepted", "DeployProcessed",
      "DeployExpired", "Fault", "FinalitySignature", "Step"
   };

   for ( std::size_t i = 0; i < all_event_types.size(); i++ )
   {
      BOOST_CHECK_EQUAL( sse::to_string( all_event_types[i] ), names[i] );

      auto record = sse::to_json_record( testing::random_event( rng, all_event_types[i] ) );
      BOOST_REQUIRE_EQUAL( record.size(), 1 );
      BOOST_CHECK_EQUAL( record.begin().key(), names[i] );
   }
}

BOOST_AUTO_TEST_CASE( known_encoding_test )
{
   BOOST_TEST_MESSAGE( "ApiVersion carries the version string" );
   sse::sse_data api = sse::api_version( types::protocol_version_from_string( "1.4.3" ) );
   BOOST_CHECK_EQUAL( sse::encode( api ), R"({"ApiVersion":"1.4.3"})" );

   BOOST_TEST_MESSAGE( "DeployExpired carries only the deploy hash" );
   sse::sse_data expired = sse::deploy_expired( types::deploy_hash_type( leading_byte_digest( 1 ) ) );
   BOOST_CHECK_EQUAL( sse::encode( expired ), R"({"DeployExpired":{"deploy_hash":"01)" + std::string( 62, '0' ) + R"("}})" );

   BOOST_TEST_MESSAGE( "Fault carries era, key and timestamp" );
   auto key = crypto::public_key( crypto::key_algorithm::ed25519, std::vector< char >( 32, 0 ) );
   sse::sse_data f = sse::fault( types::era_id_type( 5 ), key, types::timestamp_type( 1'600'000'000'000 ) );
   BOOST_CHECK_EQUAL( sse::encode( f ),
      R"({"Fault":{"era_id":5,"public_key":")" + key.to_hex() + R"(","timestamp":"2020-09-13T12:26:40.000Z"}})" );
}

BOOST_AUTO_TEST_CASE( payload_fields_test )
{
   auto processed = sse::to_json_record( testing::random_deploy_processed( rng ) )[ "DeployProcessed" ];
   for ( const auto& field : { "deploy_hash", "account", "timestamp", "ttl", "dependencies", "block_hash", "execution_result" } )
      BOOST_CHECK_MESSAGE( processed.contains( field ), "DeployProcessed is missing " << field );
   BOOST_CHECK_EQUAL( processed.size(), 7 );

   auto added = sse::to_json_record( testing::random_block_added( rng ) )[ "BlockAdded" ];
   BOOST_CHECK_EQUAL( added.size(), 2 );
   BOOST_CHECK_EQUAL( added[ "block_hash" ], added[ "block" ][ "hash" ] );

   auto step = sse::to_json_record( testing::random_step( rng ) )[ "Step" ];
   BOOST_CHECK( step.contains( "era_id" ) );
   BOOST_CHECK( step[ "execution_effect" ].contains( "transforms" ) );

   auto signature = sse::to_json_record( testing::random_finality_signature_event( rng ) )[ "FinalitySignature" ];
   BOOST_CHECK_EQUAL( signature.size(), 4 );
   BOOST_CHECK( signature.contains( "block_hash" ) );
}

BOOST_AUTO_TEST_CASE( flattening_test )
{
   BOOST_TEST_MESSAGE( "DeployAccepted merges the deploy fields into the event object" );

   auto e = testing::random_deploy_accepted( rng );
   auto payload = sse::to_json_record( e )[ "DeployAccepted" ];

   std::set< std::string > keys;
   for ( auto itr = payload.begin(); itr != payload.end(); ++itr )
      keys.insert( itr.key() );

   BOOST_CHECK( keys == std::set< std::string >( { "approvals", "hash", "header", "payment", "session" } ) );
   BOOST_CHECK( !payload.contains( "deploy" ) );
   BOOST_CHECK_EQUAL( payload[ "hash" ], e.hex_encoded_hash() );
   BOOST_CHECK_EQUAL( payload, types::json( *e.deploy() ) );
}

BOOST_AUTO_TEST_CASE( unknown_variant_test )
{
   BOOST_TEST_MESSAGE( "An unrecognized discriminator is reported as an unknown variant" );
   BOOST_REQUIRE_THROW( sse::decode( R"({"Shutdown":{}})" ), sse::unknown_event_variant );
   BOOST_REQUIRE_THROW( sse::decode( R"({"blockadded":{}})" ), sse::unknown_event_variant );

   try
   {
      sse::decode( R"({"TransactionAccepted":{"hash":"00"}})" );
      BOOST_FAIL( "unknown variant was decoded" );
   }
   catch ( const sse::decode_exception& e )
   {
      BOOST_CHECK( dynamic_cast< const sse::unknown_event_variant* >( &e ) != nullptr );
      BOOST_CHECK( e.get_json()[ "t" ] == "TransactionAccepted" );
   }
}

BOOST_AUTO_TEST_CASE( malformed_event_test )
{
   auto valid = types::json::parse( sse::encode( testing::random_deploy_processed( rng ) ) );

   BOOST_TEST_MESSAGE( "Records that are not a single key object are malformed" );
   BOOST_REQUIRE_THROW( sse::decode( "not json" ), sse::malformed_event );
   BOOST_REQUIRE_THROW( sse::decode( "[]" ), sse::malformed_event );
   BOOST_REQUIRE_THROW( sse::decode( "{}" ), sse::malformed_event );
   BOOST_REQUIRE_THROW( sse::decode( R"({"Step":{},"Fault":{}})" ), sse::malformed_event );

   BOOST_TEST_MESSAGE( "Known variants with bad payloads are malformed" );
   auto missing = valid;
   missing[ "DeployProcessed" ].erase( "ttl" );
   BOOST_REQUIRE_THROW( sse::decode( missing.dump() ), sse::malformed_event );

   auto bad_hex = valid;
   bad_hex[ "DeployProcessed" ][ "deploy_hash" ] = "zz";
   BOOST_REQUIRE_THROW( sse::decode( bad_hex.dump() ), sse::malformed_event );

   auto bad_time = valid;
   bad_time[ "DeployProcessed" ][ "timestamp" ] = "tomorrow";
   BOOST_REQUIRE_THROW( sse::decode( bad_time.dump() ), sse::malformed_event );

   auto bad_ttl = valid;
   bad_ttl[ "DeployProcessed" ][ "ttl" ] = 30;
   BOOST_REQUIRE_THROW( sse::decode( bad_ttl.dump() ), sse::malformed_event );

   auto bad_result = valid;
   bad_result[ "DeployProcessed" ][ "execution_result" ] = types::json::parse( R"({"Pending":{}})" );
   BOOST_REQUIRE_THROW( sse::decode( bad_result.dump() ), sse::malformed_event );

   BOOST_REQUIRE_THROW( sse::decode( R"({"ApiVersion":"1.4"})" ), sse::malformed_event );
   BOOST_REQUIRE_THROW( sse::decode( R"({"DeployAccepted":"hash"})" ), sse::malformed_event );

   BOOST_TEST_MESSAGE( "Upper case hex is accepted" );
   auto upper = valid;
   auto hash = upper[ "DeployProcessed" ][ "deploy_hash" ].get< std::string >();
   upper[ "DeployProcessed" ][ "deploy_hash" ] = boost::algorithm::to_upper_copy( hash );
   auto decoded = sse::decode( upper.dump() );
   BOOST_CHECK_EQUAL( std::get< sse::deploy_processed >( decoded ).hex_encoded_hash(), hash );
}

BOOST_AUTO_TEST_CASE( numeric_field_test )
{
   BOOST_TEST_MESSAGE( "Era ids must be unsigned integers" );
   auto fault = types::json::parse( sse::encode( testing::random_fault( rng ) ) );
   for ( const auto& bad : { types::json( -1 ), types::json( 1.75 ), types::json( "5" ), types::json( 1e30 ) } )
   {
      auto record = fault;
      record[ "Fault" ][ "era_id" ] = bad;
      BOOST_REQUIRE_THROW( sse::decode( record.dump() ), sse::malformed_event );
   }

   auto largest = fault;
   largest[ "Fault" ][ "era_id" ] = std::numeric_limits< uint64_t >::max();
   BOOST_CHECK_EQUAL( std::get< sse::fault >( sse::decode( largest.dump() ) ).era_id().t, std::numeric_limits< uint64_t >::max() );

   BOOST_TEST_MESSAGE( "Transform amounts must fit their type" );
   auto step_with = [&]( const types::json& transform )
   {
      types::json record;
      record[ "Step" ][ "era_id" ] = 1;
      record[ "Step" ][ "execution_effect" ][ "operations" ] = types::json::array();
      record[ "Step" ][ "execution_effect" ][ "transforms" ] = types::json::array( { { { "key", "hash-00" }, { "transform", transform } } } );
      return record.dump();
   };

   BOOST_REQUIRE_THROW( sse::decode( step_with( { { "AddInt32", 4294967297ull } } ) ), sse::malformed_event );
   BOOST_REQUIRE_THROW( sse::decode( step_with( { { "AddInt32", 2147483648ll } } ) ), sse::malformed_event );
   BOOST_REQUIRE_THROW( sse::decode( step_with( { { "AddInt32", -2147483649ll } } ) ), sse::malformed_event );
   BOOST_REQUIRE_THROW( sse::decode( step_with( { { "AddInt32", 1.5 } } ) ), sse::malformed_event );
   BOOST_REQUIRE_THROW( sse::decode( step_with( { { "AddUInt64", -1 } } ) ), sse::malformed_event );
   BOOST_REQUIRE_THROW( sse::decode( step_with( { { "AddUInt64", 2.0 } } ) ), sse::malformed_event );

   auto lowest = std::get< sse::step >( sse::decode( step_with( { { "AddInt32", -2147483648ll } } ) ) );
   BOOST_REQUIRE_EQUAL( lowest.execution_effect().transforms.size(), 1 );
   BOOST_CHECK( std::get< types::transform_add_int32 >( lowest.execution_effect().transforms[0].value ).value == std::numeric_limits< int32_t >::min() );

   BOOST_TEST_MESSAGE( "Block heights and reward amounts must be unsigned integers" );
   auto block = types::json::parse( sse::encode( testing::random_block_added( rng ) ) );

   auto negative_height = block;
   negative_height[ "BlockAdded" ][ "block" ][ "header" ][ "height" ] = -1;
   BOOST_REQUIRE_THROW( sse::decode( negative_height.dump() ), sse::malformed_event );

   auto fractional_height = block;
   fractional_height[ "BlockAdded" ][ "block" ][ "header" ][ "height" ] = 42.5;
   BOOST_REQUIRE_THROW( sse::decode( fractional_height.dump() ), sse::malformed_event );

   auto era_end = types::json::parse( R"({"era_report":{"equivocators":[],"rewards":[],"inactive_validators":[]},"next_era_validator_weights":[]})" );
   era_end[ "era_report" ][ "rewards" ].push_back( { { "validator", testing::random_public_key( rng ) }, { "amount", -5 } } );
   auto negative_reward = block;
   negative_reward[ "BlockAdded" ][ "block" ][ "header" ][ "era_end" ] = era_end;
   BOOST_REQUIRE_THROW( sse::decode( negative_reward.dump() ), sse::malformed_event );

   BOOST_TEST_MESSAGE( "Gas prices must be unsigned integers" );
   auto deploy = types::json::parse( sse::encode( testing::random_deploy_accepted( rng ) ) );
   deploy[ "DeployAccepted" ][ "header" ][ "gas_price" ] = 2.5;
   BOOST_REQUIRE_THROW( sse::decode( deploy.dump() ), sse::malformed_event );
}

BOOST_AUTO_TEST_CASE( invalid_utf8_test )
{
   BOOST_TEST_MESSAGE( "Invalid UTF-8 in free text is replaced instead of failing the encode" );

   types::execution_effect effect;
   effect.transforms.push_back( types::transform_entry{ "hash-00", types::transform_failure{ "bad \xff byte" } } );
   sse::sse_data e = sse::step( types::era_id_type( 1 ), effect );

   std::string encoded;
   BOOST_REQUIRE_NO_THROW( encoded = sse::encode( e ) );
   BOOST_CHECK( encoded.find( "\xEF\xBF\xBD" ) != std::string::npos );
   BOOST_CHECK_EQUAL( encoded, sse::encode( e ) );
}

BOOST_AUTO_TEST_CASE( correlation_key_test )
{
   auto added = testing::random_block_added_with_height( rng, 42 );
   BOOST_CHECK_EQUAL( sse::correlation_key( added ), added.hex_encoded_hash() + " height 42" );

   auto expired = sse::deploy_expired( types::deploy_hash_type( leading_byte_digest( 1 ) ) );
   BOOST_CHECK_EQUAL( sse::correlation_key( expired ), "01" + std::string( 62, '0' ) );

   auto api = sse::api_version( types::protocol_version_from_string( "1.4.3" ) );
   BOOST_CHECK_EQUAL( sse::correlation_key( api ), "1.4.3" );

   auto signature = testing::random_finality_signature_event( rng );
   BOOST_CHECK_EQUAL( sse::correlation_key( signature ), signature.hex_encoded_block_hash() + " " + signature.hex_encoded_public_key() );
}

BOOST_AUTO_TEST_SUITE_END()
