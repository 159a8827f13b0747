#pragma once

#include <provenance/schema/provenance_minted_event.hpp>
#include <functional>

namespace provenance::registry {

/// Receives audit facts. Delivery is best effort: the record manager never
/// waits on, or fails because of, a sink.
using event_sink_t =
    std::function<void(const provenance::schema::provenance_minted_event_t&)>;

}  // namespace provenance::registry
