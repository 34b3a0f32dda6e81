#pragma once
#include <sidecar/sse/events.hpp>

#include <string>
#include <variant>

namespace sidecar::sse {

/**
 * One event of the notification feed. The set of variants is closed.
 */
using sse_data = std::variant<
   api_version,
   block_added,
   deploy_accepted,
   deploy_processed,
   deploy_expired,
   fault,
   finality_signature,
   step >;

enum class event_type
{
   api_version,
   block_added,
   deploy_accepted,
   deploy_processed,
   deploy_expired,
   fault,
   finality_signature,
   step
};

event_type type_of( const sse_data& e );

/**
 * The discriminator naming the variant on the wire, e.g. "BlockAdded".
 */
std::string to_string( event_type t );

/**
 * A single line identifying the domain object an event refers to, built from
 * the variant's hex accessors.
 */
std::string correlation_key( const sse_data& e );

/**
 * Returns the wire record, an object with the discriminator as its only key.
 */
json to_json_record( const sse_data& e );

/**
 * Serializes the event as compact JSON. The same event always produces the same bytes.
 */
std::string encode( const sse_data& e );

/**
 * Throws unknown_event_variant when the discriminator is not recognized and
 * malformed_event for anything else that does not describe an event.
 */
sse_data decode( const std::string& s );
sse_data from_json_record( const json& j );

} // sidecar::sse
