#include <provenance/ledger/event_journal.hpp>
#include <provenance/schema/key/object_keys.hpp>
#include <spdlog/spdlog.h>

using namespace provenance::schema;

namespace provenance::ledger {

event_journal::event_journal(
    provenance::schema::encoding::scale_encoder_t& encoder,
    provenance::storage::storage<provenance::storage::rocksdb_storage_tag>&
        storage)
    : encoder_{encoder}, storage_{storage} {
  auto lock = std::scoped_lock{mutex_};
  next_sequence_ =
      storage_
          .get<uint64_t>(encoder_,
                         key::make_prefix_key(encoder_, key::kEventCounterKey))
          .value_or(0);
}

uint64_t event_journal::append(const provenance_minted_event_t& event) {
  auto lock = std::scoped_lock{mutex_};
  auto sequence = next_sequence_;

  auto batch = provenance::storage::write_batch{};
  batch.puts.emplace_back(key::make_event_key(encoder_, sequence),
                          encoder_.encode(event));
  batch.puts.emplace_back(key::make_prefix_key(encoder_, key::kEventCounterKey),
                          encoder_.encode(sequence + 1));
  storage_.write(batch);

  next_sequence_ = sequence + 1;
  spdlog::debug("Journaled mint event {} for record {}", sequence,
                to_hex(event.record_id));
  return sequence;
}

std::vector<journal_entry> event_journal::list() const {
  auto lock = std::scoped_lock{mutex_};
  auto entries = std::vector<journal_entry>{};
  auto prefix = key::make_prefix_key(encoder_, key::kEventKeyPrefix);
  for (const auto& [event_key, value] : storage_.list_by_prefix(prefix)) {
    auto sequence = uint64_t{};
    for (auto i = event_key.size() - sizeof(uint64_t); i < event_key.size();
         ++i) {
      sequence = (sequence << 8u) | event_key[i];
    }
    auto event = encoder_.try_decode<provenance_minted_event_t>(
        bytes_view_t{value.data(), value.size()});
    if (!event) {
      spdlog::warn("Skipping undecodable journal entry {}", sequence);
      continue;
    }
    entries.push_back(journal_entry{.sequence = sequence, .event = *event});
  }
  return entries;
}

provenance::registry::event_sink_t event_journal::sink() {
  return [this](const provenance_minted_event_t& event) { append(event); };
}

}  // namespace provenance::ledger
