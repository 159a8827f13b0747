#pragma once

#include <provenance/schema/primitives.hpp>
#include <functional>

namespace provenance::registry {

/// Current time in milliseconds since the Unix epoch, as of the call.
using time_source_t = std::function<provenance::schema::timestamp_milliseconds_t()>;

/// Wall clock backed by std::chrono::system_clock.
time_source_t system_time_source();

/// Clock that always reports timestamp; useful for replays and tests.
time_source_t fixed_time_source(
    provenance::schema::timestamp_milliseconds_t timestamp);

}  // namespace provenance::registry
