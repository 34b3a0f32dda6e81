#pragma once

#include <cstdint>
#include <deque>
#include <optional>
#include <string>

namespace sidecar::sse {

/**
 * One record of a text/event-stream: a data field and an optional event id.
 */
struct frame
{
   std::optional< uint64_t > id;
   std::string               data;

   bool operator==( const frame& other ) const;
   bool operator!=( const frame& other ) const;
};

/**
 * Renders "data:" lines, an "id:" line when an id is present and the blank
 * line that terminates the record.
 */
std::string to_wire( const frame& f );

/**
 * Incremental parser for a text/event-stream. Input may be split at any byte.
 */
class frame_parser
{
   public:
      void feed( const std::string& chunk );

      bool has_frame() const;
      frame pop_frame();

      /**
       * True when a record has started but has not yet been terminated by a blank line.
       */
      bool has_partial() const;

   private:
      void process_line( std::string line );
      void dispatch();

      std::string               _line;
      std::string               _data;
      bool                      _has_data = false;
      std::optional< uint64_t > _id;
      std::deque< frame >       _frames;
};

} // sidecar::sse
