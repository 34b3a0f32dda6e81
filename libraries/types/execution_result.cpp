#include <sidecar/types/exceptions.hpp>
#include <sidecar/types/execution_result.hpp>

#include <sidecar/util.hpp>

#include <tuple>

#define TRANSFER_ADDRESS_PREFIX "transfer-"

namespace sidecar::types {

bool operation::operator==( const operation& other ) const
{
   return std::tie( key, kind ) == std::tie( other.key, other.kind );
}

bool transform_entry::operator==( const transform_entry& other ) const
{
   return std::tie( key, value ) == std::tie( other.key, other.value );
}

bool execution_effect::operator==( const execution_effect& other ) const
{
   return std::tie( operations, transforms ) == std::tie( other.operations, other.transforms );
}

bool execution_effect::operator!=( const execution_effect& other ) const
{
   return !( *this == other );
}

bool execution_success::operator==( const execution_success& other ) const
{
   return std::tie( effect, transfers, cost ) == std::tie( other.effect, other.transfers, other.cost );
}

bool execution_failure::operator==( const execution_failure& other ) const
{
   return std::tie( effect, transfers, cost, error_message )
      == std::tie( other.effect, other.transfers, other.cost, other.error_message );
}

const execution_effect& effect_of( const execution_result& r )
{
   return std::visit( []( const auto& result ) -> const execution_effect& { return result.effect; }, r );
}

std::string to_string( op_kind k )
{
   switch ( k )
   {
      case op_kind::read:
         return "Read";
      case op_kind::write:
         return "Write";
      case op_kind::add:
         return "Add";
      case op_kind::noop:
         return "NoOp";
   }

   return "NoOp";
}

op_kind op_kind_from_string( const std::string& s )
{
   if ( s == "Read" )  return op_kind::read;
   if ( s == "Write" ) return op_kind::write;
   if ( s == "Add" )   return op_kind::add;
   if ( s == "NoOp" )  return op_kind::noop;

   SIDECAR_THROW( unknown_variant_tag, "unknown operation kind '${k}'", ("k", s) );
}

std::string transfer_address_to_string( const crypto::digest& d )
{
   return TRANSFER_ADDRESS_PREFIX + d.to_hex();
}

crypto::digest transfer_address_from_string( const std::string& s )
{
   const std::string prefix( TRANSFER_ADDRESS_PREFIX );
   SIDECAR_ASSERT( s.compare( 0, prefix.size(), prefix ) == 0, invalid_transfer_address,
      "transfer address '${s}' does not start with '" TRANSFER_ADDRESS_PREFIX "'", ("s", s) );
   return crypto::digest::from_hex( s.substr( prefix.size() ) );
}

void to_json( json& j, const operation& o )
{
   j = json {
      { "key",  o.key },
      { "kind", to_string( o.kind ) }
   };
}

void from_json( const json& j, operation& o )
{
   j.at( "key" ).get_to( o.key );
   o.kind = op_kind_from_string( j.at( "kind" ).get< std::string >() );
}

void to_json( json& j, const transform_entry& t )
{
   j = json {
      { "key",       t.key },
      { "transform", t.value }
   };
}

void from_json( const json& j, transform_entry& t )
{
   j.at( "key" ).get_to( t.key );
   j.at( "transform" ).get_to( t.value );
}

void to_json( json& j, const execution_effect& e )
{
   j = json {
      { "operations", e.operations },
      { "transforms", e.transforms }
   };
}

void from_json( const json& j, execution_effect& e )
{
   j.at( "operations" ).get_to( e.operations );
   j.at( "transforms" ).get_to( e.transforms );
}

namespace detail {

json transfers_to_json( const std::vector< crypto::digest >& transfers )
{
   json j = json::array();
   for ( const auto& t : transfers )
      j.push_back( transfer_address_to_string( t ) );
   return j;
}

std::vector< crypto::digest > transfers_from_json( const json& j )
{
   std::vector< crypto::digest > transfers;
   for ( const auto& t : j.get< std::vector< std::string > >() )
      transfers.push_back( transfer_address_from_string( t ) );
   return transfers;
}

} // detail

void to_json( json& j, const execution_success& s )
{
   j = json {
      { "effect",    s.effect },
      { "transfers", detail::transfers_to_json( s.transfers ) },
      { "cost",      to_string( s.cost ) }
   };
}

void from_json( const json& j, execution_success& s )
{
   j.at( "effect" ).get_to( s.effect );
   s.transfers = detail::transfers_from_json( j.at( "transfers" ) );
   s.cost = uint512_from_string( j.at( "cost" ).get< std::string >() );
}

void to_json( json& j, const execution_failure& f )
{
   j = json {
      { "effect",        f.effect },
      { "transfers",     detail::transfers_to_json( f.transfers ) },
      { "cost",          to_string( f.cost ) },
      { "error_message", f.error_message }
   };
}

void from_json( const json& j, execution_failure& f )
{
   j.at( "effect" ).get_to( f.effect );
   f.transfers = detail::transfers_from_json( j.at( "transfers" ) );
   f.cost = uint512_from_string( j.at( "cost" ).get< std::string >() );
   j.at( "error_message" ).get_to( f.error_message );
}

} // sidecar::types

namespace nlohmann {

namespace types = sidecar::types;

void adl_serializer< types::transform >::to_json( json& j, const types::transform& t )
{
   std::visit( sidecar::overloaded {
      [&]( const types::transform_identity& )         { j = "Identity"; },
      [&]( const types::transform_write_cl_value& arg ) { j = json { { "WriteCLValue", arg.value } }; },
      [&]( const types::transform_add_int32& arg )      { j = json { { "AddInt32", arg.value } }; },
      [&]( const types::transform_add_uint64& arg )     { j = json { { "AddUInt64", arg.value } }; },
      [&]( const types::transform_add_uint512& arg )    { j = json { { "AddUInt512", types::to_string( arg.value ) } }; },
      [&]( const types::transform_failure& arg )        { j = json { { "Failure", arg.message } }; }
   }, t );
}

void adl_serializer< types::transform >::from_json( const json& j, types::transform& t )
{
   if ( j.is_string() )
   {
      auto tag = j.get< std::string >();
      SIDECAR_ASSERT( tag == "Identity", types::unknown_variant_tag, "unknown transform '${t}'", ("t", tag) );
      t = types::transform_identity{};
      return;
   }

   SIDECAR_ASSERT( j.is_object() && j.size() == 1, types::unknown_variant_tag, "transform must be a string or a single key object" );

   auto itr = j.begin();
   const auto& tag = itr.key();
   const auto& value = itr.value();

   if ( tag == "WriteCLValue" )
      t = types::transform_write_cl_value{ value.get< types::cl_value >() };
   else if ( tag == "AddInt32" )
      t = types::transform_add_int32{ types::int32_from_json( value ) };
   else if ( tag == "AddUInt64" )
      t = types::transform_add_uint64{ types::uint64_from_json( value ) };
   else if ( tag == "AddUInt512" )
      t = types::transform_add_uint512{ types::uint512_from_string( value.get< std::string >() ) };
   else if ( tag == "Failure" )
      t = types::transform_failure{ value.get< std::string >() };
   else
      SIDECAR_THROW( types::unknown_variant_tag, "unknown transform '${t}'", ("t", tag) );
}

void adl_serializer< types::execution_result >::to_json( json& j, const types::execution_result& r )
{
   std::visit( sidecar::overloaded {
      [&]( const types::execution_success& arg ) { j = json { { "Success", arg } }; },
      [&]( const types::execution_failure& arg ) { j = json { { "Failure", arg } }; }
   }, r );
}

void adl_serializer< types::execution_result >::from_json( const json& j, types::execution_result& r )
{
   SIDECAR_ASSERT( j.is_object() && j.size() == 1, types::unknown_variant_tag, "execution result must be a single key object" );

   if ( j.contains( "Success" ) )
      r = j.at( "Success" ).get< types::execution_success >();
   else if ( j.contains( "Failure" ) )
      r = j.at( "Failure" ).get< types::execution_failure >();
   else
      SIDECAR_THROW( types::unknown_variant_tag, "unknown execution result '${t}'", ("t", j.begin().key()) );
}

} // nlohmann
