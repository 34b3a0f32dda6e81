#pragma once
#include <sidecar/sse/frame.hpp>
#include <sidecar/sse/sse_data.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace sidecar::sse {

/**
 * Emitter side of a subscription. The first frame is always the ApiVersion
 * handshake, which carries no id. Every later event gets the next id.
 */
class event_stream_writer
{
   public:
      explicit event_stream_writer( types::protocol_version_type version, uint64_t first_id = 0 );

      frame handshake() const;
      frame next( const sse_data& event );

      uint64_t next_id() const;

   private:
      api_version _api_version;
      uint64_t    _next_id;
};

struct stream_event
{
   std::optional< uint64_t > id;
   sse_data                  data;
};

/**
 * Subscriber side of a subscription.
 *
 * The first frame must be an ApiVersion event without an id, otherwise
 * missing_api_version is thrown. A later ApiVersion throws unexpected_api_version.
 * When skip_unknown is set, events with an unrecognized variant are logged and
 * dropped instead of throwing unknown_event_variant.
 *
 * Frames are decoded one at a time by next(), so an error in one frame never
 * discards the events buffered before it. The failing frame is consumed.
 */
class event_stream_reader
{
   public:
      explicit event_stream_reader( bool skip_unknown = false );

      void feed( const std::string& chunk );

      /**
       * Returns the next decoded event, or nothing until more input is fed.
       */
      std::optional< stream_event > next();

      /**
       * The stream ended. Throws missing_api_version if no handshake was seen.
       */
      void finish() const;

      bool handshake_complete() const;
      const std::optional< api_version >& api() const;
      uint64_t skipped() const;

   private:
      std::optional< stream_event > accept( const frame& f );

      frame_parser                 _parser;
      bool                         _skip_unknown;
      std::optional< api_version > _api_version;
      uint64_t                     _skipped = 0;
};

} // sidecar::sse
