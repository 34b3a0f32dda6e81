#include <boost/test/unit_test.hpp>

#include <sidecar/exception.hpp>

#include <nlohmann/json.hpp>

#include <iostream>

struct exception_test_object
{
   uint32_t x = 0;
   uint32_t y = 0;
};

void to_json( nlohmann::json& j, const exception_test_object& o )
{
   j = nlohmann::json { { "x", o.x }, { "y", o.y } };
}

struct exception_fixture {};

SIDECAR_DECLARE_EXCEPTION( my_exception );
SIDECAR_DECLARE_DERIVED_EXCEPTION( my_derived_exception, my_exception );

BOOST_FIXTURE_TEST_SUITE( exception_tests, exception_fixture )

BOOST_AUTO_TEST_CASE( exception_test )
{ try {
   nlohmann::json exception_json;
   exception_json["x"] = "foo";
   exception_json["y"] = "bar";

   BOOST_TEST_MESSAGE( "Throw an exception with an initial capture and a caught capture." );
   try
   {
      try
      {
         SIDECAR_THROW( my_exception, "exception_test ${x} ${y}", ("x","foo") );
      }
      SIDECAR_CAPTURE_CATCH_AND_RETHROW( ("y","bar") )
   }
   catch( sidecar::exception& e )
   {
      auto j = e.get_json();
      BOOST_REQUIRE_EQUAL( exception_json, j );
      BOOST_REQUIRE_EQUAL( e.get_message(), "exception_test foo bar" );
      BOOST_REQUIRE_EQUAL( e.what(), e.get_message() );
   }

   BOOST_TEST_MESSAGE( "Throw an exception with no initial capture and a caught capture." );
   try
   {
      try
      {
         SIDECAR_THROW( my_exception, "exception_test ${x} ${y}" );
      }
      SIDECAR_CAPTURE_CATCH_AND_RETHROW( ("y","bar")("x","foo") )
   }
   catch( sidecar::exception& e )
   {
      auto j = e.get_json();
      BOOST_REQUIRE_EQUAL( exception_json, j );
      BOOST_REQUIRE_EQUAL( e.get_message(), "exception_test foo bar" );
   }

   BOOST_TEST_MESSAGE( "Throw an exception with an object capture and a missing capture." );
   try
   {
      try
      {
         exception_test_object obj = {1,2};
         SIDECAR_THROW( my_exception, "exception_test ${x} ${y}", ("x", obj) );
      }
      SIDECAR_CAPTURE_CATCH_AND_RETHROW( ("z",exception_test_object{3,4}) )
   }
   catch( sidecar::exception& e )
   {
      exception_json.clear();
      exception_json["x"]["x"] = 1;
      exception_json["x"]["y"] = 2;
      exception_json["z"]["x"] = 3;
      exception_json["z"]["y"] = 4;
      auto j = e.get_json();
      BOOST_REQUIRE_EQUAL( exception_json, j );
      BOOST_REQUIRE_EQUAL( e.get_message(), "exception_test {\"x\":1,\"y\":2} ${y}" );
   }

   BOOST_TEST_MESSAGE( "Catch a derived exception through its base." );
   try
   {
      SIDECAR_THROW( my_derived_exception, "derived ${d}", ("d", "value") );
   }
   catch( my_exception& e )
   {
      BOOST_REQUIRE_EQUAL( "derived value", e.what() );
   }

   BOOST_TEST_MESSAGE( "Throw an exception with an escaped message." );
   try
   {
      std::string msg = "An escaped message ${$escaped!}";
      SIDECAR_THROW( my_exception, std::move( msg ), ("escaped", 1) );
   }
   catch( sidecar::exception& e )
   {
      BOOST_REQUIRE_EQUAL( "An escaped message ${$escaped!}", e.what() );
   }

   BOOST_TEST_MESSAGE( "Throw an exception with an unterminated replacement." );
   try
   {
      SIDECAR_THROW( my_exception, "An unterminated ${key", ("key", 1) );
   }
   catch( sidecar::exception& e )
   {
      BOOST_REQUIRE_EQUAL( "An unterminated ${key", e.what() );
   }

   BOOST_TEST_MESSAGE( "Throw an exception with an embedded dollar sign." );
   try
   {
      std::string msg = "A dollar signed $ within a message";
      throw sidecar::exception( std::move( msg ) );
   }
   catch( sidecar::exception& e )
   {
      BOOST_REQUIRE_EQUAL( "A dollar signed $ within a message", e.what() );
   }

   BOOST_TEST_MESSAGE( "Throw an exception with a std::size_t replacement." );
   try
   {
      std::string msg = "My std::size_t value is ${s}";
      SIDECAR_THROW( my_exception, std::move( msg ), ("s", std::size_t(20)) );
   }
   catch( sidecar::exception& e )
   {
      BOOST_REQUIRE_EQUAL( "My std::size_t value is 20", e.what() );
   }

   BOOST_TEST_MESSAGE( "Assert a condition that does not hold." );
   try
   {
      int value = 3;
      SIDECAR_ASSERT( value == 4, my_exception, "expected 4, was ${v}", ("v", value) );
      BOOST_FAIL( "assertion did not throw" );
   }
   catch( sidecar::exception& e )
   {
      BOOST_REQUIRE_EQUAL( "expected 4, was 3", e.what() );
   }

   BOOST_TEST_MESSAGE( "Catch an exception as json." );
   nlohmann::json caught;
   try
   {
      SIDECAR_THROW( my_exception, "json ${a}", ("a", "b") );
   }
   SIDECAR_CATCH_AND_GET_JSON( caught )
   BOOST_REQUIRE_EQUAL( caught["a"], "b" );

   BOOST_TEST_MESSAGE( "Throw an exception and test for the existence of a stacktrace." );
   try
   {
      SIDECAR_THROW( my_exception, "An exception that should contain a stacktrace" );
   }
   catch( sidecar::exception& e )
   {
      BOOST_REQUIRE( e.get_stacktrace().size() > 0 );
   }

} SIDECAR_CATCH_LOG_AND_RETHROW(info) }

BOOST_AUTO_TEST_CASE( json_strpolate_test )
{ try {
   nlohmann::json j;
   j["a"] = "one";
   j["b"] = 2;
   j["quoted"] = "say \"hi\"";

   BOOST_TEST_MESSAGE( "Substitute several placeholders in one pass." );
   BOOST_REQUIRE_EQUAL( sidecar::detail::json_strpolate( "${a}-${b}-${a}", j ), "one-2-one" );
   BOOST_REQUIRE_EQUAL( sidecar::detail::json_strpolate( "${a}${b}", j ), "one2" );

   BOOST_TEST_MESSAGE( "String values are inserted as their raw text." );
   BOOST_REQUIRE_EQUAL( sidecar::detail::json_strpolate( "<${quoted}>", j ), "<say \"hi\">" );

   BOOST_TEST_MESSAGE( "Unknown, escaped and unterminated placeholders are copied." );
   BOOST_REQUIRE_EQUAL( sidecar::detail::json_strpolate( "${c} ${a}", j ), "${c} one" );
   BOOST_REQUIRE_EQUAL( sidecar::detail::json_strpolate( "${$a} ${a}", j ), "${$a} one" );
   BOOST_REQUIRE_EQUAL( sidecar::detail::json_strpolate( "${a} ${b", j ), "one ${b" );
   BOOST_REQUIRE_EQUAL( sidecar::detail::json_strpolate( "tail ${", j ), "tail ${" );
   BOOST_REQUIRE_EQUAL( sidecar::detail::json_strpolate( "", j ), "" );

} SIDECAR_CATCH_LOG_AND_RETHROW(info) }

BOOST_AUTO_TEST_SUITE_END()
