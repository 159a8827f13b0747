#include <provenance/registry/time_source.hpp>
#include <chrono>

namespace provenance::registry {

time_source_t system_time_source() {
  return [] {
    auto now = std::chrono::system_clock::now().time_since_epoch();
    return static_cast<provenance::schema::timestamp_milliseconds_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(now).count());
  };
}

time_source_t fixed_time_source(
    const provenance::schema::timestamp_milliseconds_t timestamp) {
  return [timestamp] { return timestamp; };
}

}  // namespace provenance::registry
