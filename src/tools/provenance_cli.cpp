#include <boost/program_options.hpp>
#include <provenance/ledger/event_journal.hpp>
#include <provenance/ledger/lineage.hpp>
#include <provenance/ledger/rocksdb_object_store.hpp>
#include <provenance/registry/record_manager.hpp>
#include <provenance/schema/encoding/scale/encoder.hpp>
#include <provenance/storage/rocksdb/storage.hpp>
#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <cstdint>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace {

namespace po = boost::program_options;
using namespace provenance::schema;

struct cli_options final {
  std::string command;
  std::string target;
  std::string db_path;
  std::string sender;
  std::string log_level;
  std::string log_file;
  std::string config_file;

  std::string name;
  unsigned merkle_algo{};
  std::string merkle_root;
  std::string package_ref;
  std::string manifest_version;
  unsigned manifest_algo{};
  std::string manifest_hash;
  std::string manifest_ref;
  std::string parent;

  std::string recipient;
  std::size_t max_depth{256};
};

void configure_logging(const cli_options& options) {
  spdlog::init_thread_pool(8192, 1);

  auto sinks = std::vector<spdlog::sink_ptr>{};
  sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
  if (!options.log_file.empty()) {
    sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(
        options.log_file, false));
  }

  auto logger = std::make_shared<spdlog::async_logger>(
      "provenance", std::begin(sinks), std::end(sinks), spdlog::thread_pool(),
      spdlog::async_overflow_policy::block);
  spdlog::set_default_logger(logger);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  spdlog::set_level(spdlog::level::from_str(options.log_level));
}

std::optional<hash32_t> parse_hash(const std::string_view label,
                                   const std::string& hex) {
  auto parsed = try_hash32_from_hex(hex);
  if (!parsed) {
    std::cerr << label << " must be 32 bytes of hex, got '" << hex << "'\n";
  }
  return parsed;
}

std::optional<bytes_t> parse_bytes(const std::string_view label,
                                   const std::string& hex) {
  auto parsed = try_from_hex(hex);
  if (!parsed) {
    std::cerr << label << " must be hex, got '" << hex << "'\n";
  }
  return parsed;
}

void print_record(const provenance::registry::provenance_record& record,
                  const std::optional<address_t>& owner) {
  std::cout << "id:                      " << to_hex(record.id()) << '\n';
  if (owner) {
    std::cout << "owner:                   " << to_hex(*owner) << '\n';
  }
  std::cout << "content_package_name:    " << record.content_package_name()
            << '\n'
            << "merkle_integrity_algo:   "
            << static_cast<unsigned>(record.merkle_integrity_algo()) << '\n'
            << "merkle_root:             " << to_hex(record.merkle_root())
            << '\n'
            << "created_at:              " << record.created_at() << '\n'
            << "package_storage_blob_ref: "
            << make_string_view(record.package_storage_blob_ref()) << '\n'
            << "manifest_version:        " << record.manifest_version() << '\n'
            << "manifest_integrity_algo: "
            << static_cast<unsigned>(record.manifest_integrity_algo()) << '\n'
            << "manifest_hash:           " << to_hex(record.manifest_hash())
            << '\n'
            << "manifest_storage_blob_ref: "
            << make_string_view(record.manifest_storage_blob_ref()) << '\n'
            << "parent_manifest_id:      "
            << (record.parent_manifest_id()
                    ? to_hex(*record.parent_manifest_id())
                    : std::string{"none"})
            << '\n';
}

std::string_view describe(const provenance::ledger::lineage_end end) {
  switch (end) {
    case provenance::ledger::lineage_end::root:
      return "root";
    case provenance::ledger::lineage_end::missing_parent:
      return "missing parent";
    case provenance::ledger::lineage_end::cycle:
      return "cycle";
    case provenance::ledger::lineage_end::depth_limit:
      return "depth limit";
    case provenance::ledger::lineage_end::missing_start:
      return "missing start";
  }
  return "unknown";
}

class cli final {
 public:
  explicit cli(const cli_options& options)
      : options_{options},
        storage_{provenance::storage::make_storage<
            provenance::storage::rocksdb_storage_tag>(options.db_path)},
        store_{encoder_, storage_},
        journal_{encoder_, storage_},
        manager_{store_, journal_.sink()} {}

  int run() {
    const auto& command = options_.command;
    if (command == "mint") {
      return mint();
    }
    if (command == "show") {
      return show();
    }
    if (command == "list") {
      return list();
    }
    if (command == "transfer") {
      return transfer();
    }
    if (command == "burn") {
      return burn();
    }
    if (command == "events") {
      return events();
    }
    if (command == "lineage") {
      return lineage();
    }
    std::cerr << "unknown command '" << command << "'\n";
    return 1;
  }

 private:
  std::optional<address_t> sender() const {
    if (options_.sender.empty()) {
      std::cerr << "--sender is required for '" << options_.command << "'\n";
      return std::nullopt;
    }
    return parse_hash("--sender", options_.sender);
  }

  std::optional<object_id_t> target() const {
    if (options_.target.empty()) {
      std::cerr << "'" << options_.command << "' needs a record id\n";
      return std::nullopt;
    }
    return parse_hash("record id", options_.target);
  }

  int mint() {
    auto minter = sender();
    if (!minter) {
      return 1;
    }
    if (options_.merkle_algo > 0xFFu || options_.manifest_algo > 0xFFu) {
      std::cerr << "algorithm tags must fit in 8 bits\n";
      return 1;
    }
    auto merkle_root = parse_bytes("--merkle-root", options_.merkle_root);
    auto manifest_hash = parse_bytes("--manifest-hash", options_.manifest_hash);
    if (!merkle_root || !manifest_hash) {
      return 1;
    }

    auto request = mint_provenance_t{
        .content_package_name = options_.name,
        .merkle_integrity_algo = static_cast<uint8_t>(options_.merkle_algo),
        .merkle_root = std::move(*merkle_root),
        .package_storage_blob_ref = make_bytes(options_.package_ref),
        .manifest_version = options_.manifest_version,
        .manifest_integrity_algo = static_cast<uint8_t>(options_.manifest_algo),
        .manifest_hash = std::move(*manifest_hash),
        .manifest_storage_blob_ref = make_bytes(options_.manifest_ref),
        .parent_manifest_id = std::nullopt};
    if (!options_.parent.empty()) {
      request.parent_manifest_id = parse_hash("--parent", options_.parent);
      if (!request.parent_manifest_id) {
        return 1;
      }
    }

    auto result = manager_.mint_and_send_to_sender(
        request, provenance::registry::system_time_source(), *minter);
    return std::visit(
        overloaded{[](const object_id_t& id) {
                     spdlog::info("Minted record {}", to_hex(id));
                     std::cout << to_hex(id) << '\n';
                     return 0;
                   },
                   [](const mint_error_code_t code) {
                     spdlog::error("Mint rejected: {}", to_string(code));
                     std::cerr << to_string(code) << '\n';
                     return 1;
                   }},
        result);
  }

  int show() {
    auto id = target();
    if (!id) {
      return 1;
    }
    auto stored = store_.load(*id);
    auto record = manager_.load(*id);
    if (!stored || !record) {
      std::cerr << "record " << to_hex(*id) << " not found\n";
      return 1;
    }
    print_record(*record, stored->owner);
    return 0;
  }

  int list() {
    auto owner = sender();
    if (!owner) {
      return 1;
    }
    for (const auto& id : store_.owned_by(*owner)) {
      auto record = manager_.load(id);
      if (!record) {
        continue;
      }
      std::cout << to_hex(id) << ' ' << record->content_package_name() << '\n';
    }
    return 0;
  }

  /// Load id for the calling owner, refusing records owned by anyone else.
  std::optional<provenance::registry::provenance_record> take_owned(
      const object_id_t& id,
      const address_t& owner) {
    auto stored = store_.load(id);
    if (!stored) {
      std::cerr << "record " << to_hex(id) << " not found\n";
      return std::nullopt;
    }
    if (stored->owner != owner) {
      std::cerr << "record " << to_hex(id) << " is not owned by "
                << to_hex(owner) << '\n';
      return std::nullopt;
    }
    return manager_.load(id);
  }

  int transfer() {
    auto owner = sender();
    auto id = target();
    if (!owner || !id) {
      return 1;
    }
    auto recipient = parse_hash("--to", options_.recipient);
    if (!recipient) {
      return 1;
    }
    auto record = take_owned(*id, *owner);
    if (!record) {
      return 1;
    }
    if (!manager_.transfer(std::move(*record), *recipient)) {
      std::cerr << "record " << to_hex(*id)
                << " can no longer be transferred\n";
      return 1;
    }
    spdlog::info("Transferred record {} to {}", to_hex(*id),
                 to_hex(*recipient));
    return 0;
  }

  int burn() {
    auto owner = sender();
    auto id = target();
    if (!owner || !id) {
      return 1;
    }
    auto record = take_owned(*id, *owner);
    if (!record) {
      return 1;
    }
    manager_.burn(std::move(*record));
    spdlog::info("Burned record {}", to_hex(*id));
    return 0;
  }

  int events() {
    for (const auto& entry : journal_.list()) {
      std::cout << entry.sequence << ' ' << to_hex(entry.event.record_id)
                << ' ' << to_hex(entry.event.minter) << ' '
                << entry.event.minted_at << ' ' << entry.event.package_name
                << '\n';
    }
    return 0;
  }

  int lineage() {
    auto id = target();
    if (!id) {
      return 1;
    }
    auto walk = provenance::ledger::walk_lineage(store_, *id, options_.max_depth);
    for (const auto& link : walk.chain) {
      std::cout << to_hex(link) << '\n';
    }
    std::cout << "end: " << describe(walk.end);
    if (walk.dangling) {
      std::cout << " (" << to_hex(*walk.dangling) << ')';
    }
    std::cout << '\n';
    return walk.end == provenance::ledger::lineage_end::missing_start ? 1 : 0;
  }

  const cli_options& options_;
  provenance::schema::encoding::scale_encoder_t encoder_;
  provenance::storage::storage<provenance::storage::rocksdb_storage_tag>
      storage_;
  provenance::ledger::rocksdb_object_store store_;
  provenance::ledger::event_journal journal_;
  provenance::registry::record_manager manager_;
};

}  // namespace

int main(int argc, char* argv[]) {
  auto options = cli_options{};

  auto general = po::options_description{"General"};
  general.add_options()("help,h", "Show the help message")(
      "config,c", po::value<std::string>(&options.config_file),
      "INI file providing any of these options")(
      "db,d",
      po::value<std::string>(&options.db_path)->default_value("provenance.db"),
      "RocksDB ledger path")(
      "sender,s", po::value<std::string>(&options.sender),
      "Calling principal address (hex)")(
      "log-level",
      po::value<std::string>(&options.log_level)->default_value("info"),
      "trace, debug, info, warn, error, critical or off")(
      "log-file", po::value<std::string>(&options.log_file),
      "Also write logs to this file");

  auto mint = po::options_description{"mint"};
  mint.add_options()("name", po::value<std::string>(&options.name),
                     "Content package name")(
      "merkle-algo", po::value<unsigned>(&options.merkle_algo)->default_value(0),
      "Merkle root algorithm tag")(
      "merkle-root", po::value<std::string>(&options.merkle_root),
      "Merkle root (hex)")(
      "package-ref", po::value<std::string>(&options.package_ref),
      "Package storage reference")(
      "manifest-version", po::value<std::string>(&options.manifest_version),
      "Manifest version")(
      "manifest-algo",
      po::value<unsigned>(&options.manifest_algo)->default_value(0),
      "Manifest hash algorithm tag")(
      "manifest-hash", po::value<std::string>(&options.manifest_hash),
      "Manifest hash (hex)")(
      "manifest-ref", po::value<std::string>(&options.manifest_ref),
      "Manifest storage reference")(
      "parent", po::value<std::string>(&options.parent),
      "Parent record id (hex)");

  auto other = po::options_description{"transfer / lineage"};
  other.add_options()("to", po::value<std::string>(&options.recipient),
                      "Recipient address (hex)")(
      "max-depth",
      po::value<std::size_t>(&options.max_depth)->default_value(256),
      "Maximum records visited by lineage");

  auto hidden = po::options_description{};
  hidden.add_options()("command", po::value<std::string>(&options.command))(
      "target", po::value<std::string>(&options.target));

  auto positional = po::positional_options_description{};
  positional.add("command", 1).add("target", 1);

  auto visible = po::options_description{
      "provenance-cli <mint|show|list|transfer|burn|events|lineage> [id]"};
  visible.add(general).add(mint).add(other);
  auto all = po::options_description{};
  all.add(visible).add(hidden);

  auto vm = po::variables_map{};
  try {
    po::store(po::command_line_parser(argc, argv)
                  .options(all)
                  .positional(positional)
                  .run(),
              vm);
    if (vm.contains("config")) {
      auto config = std::ifstream{vm["config"].as<std::string>()};
      if (!config) {
        std::cerr << "cannot read config file '"
                  << vm["config"].as<std::string>() << "'\n";
        return 1;
      }
      po::store(po::parse_config_file(config, visible), vm);
    }
    po::notify(vm);
  } catch (const po::error& ex) {
    std::cerr << ex.what() << '\n' << visible << std::endl;
    return 1;
  }

  if (vm.contains("help") || options.command.empty()) {
    std::cout << visible << std::endl;
    return vm.contains("help") ? 0 : 1;
  }

  configure_logging(options);
  auto status = cli{options}.run();
  spdlog::shutdown();
  return status;
}
