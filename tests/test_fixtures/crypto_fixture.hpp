#pragma once
#include <sidecar/crypto/digest.hpp>
#include <sidecar/crypto/public_key.hpp>

#include <cstring>
#include <iostream>
#include <string>

using namespace sidecar::crypto;
using nlohmann::json;

// SHA test vectors taken from http://www.di-mgt.com.au/sha_testvectors.html
static const std::string TEST1("abc");
static const std::string TEST2("");
static const std::string TEST3("abcdbcdecdefdefgefghfghighijhijkijkljklmklmnlmnomnopnopq");
static const std::string TEST4("abcdefghbcdefghicdefghijdefghijkefghijklfghijklmghijklmnhijklmnoijklmnopjklmnopqklmnopqrlmnopqrsmnopqrstnopqrstu");
static char TEST5[1000001];

static void init_5()
{
   memset( TEST5, 'a', sizeof(TEST5) - 1 );
   TEST5[1000000] = 0;
}

struct crypto_fixture
{
   crypto_fixture()
   {
      init_5();
   }

   void test( const char* to_hash, std::size_t len, const std::string& expected )
   {
      digest d1 = hash_str( to_hash, len );
      BOOST_CHECK_EQUAL( expected, d1.to_hex() );

      json j = d1;
      BOOST_CHECK_EQUAL( j.get< std::string >(), expected );
      BOOST_CHECK( j.get< digest >() == d1 );
   }

   void test( const std::string& to_hash, const std::string& expected )
   {
      test( to_hash.c_str(), to_hash.size(), expected );
   }

   std::vector< char > filled( std::size_t n, char c )
   {
      return std::vector< char >( n, c );
   }
};
