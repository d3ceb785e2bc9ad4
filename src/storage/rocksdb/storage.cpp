#include <raceswap/common/critical.hpp>
#include <raceswap/storage/rocksdb/storage.hpp>

namespace raceswap::storage {

namespace {

// One ledger per process, small account records rewritten on every commit.
ROCKSDB_NAMESPACE::Options ledger_options() {
  auto options = ROCKSDB_NAMESPACE::Options{};
  options.create_if_missing = true;
  options.paranoid_checks = true;
  options.keep_log_file_num = 4;
  options.OptimizeForSmallDb();
  options.IncreaseParallelism(2);
  return options;
}

}  // namespace

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path) {
  ROCKSDB_NAMESPACE::DB* database{nullptr};
  auto status = ROCKSDB_NAMESPACE::DB::Open(ledger_options(), std::string{path},
                                            &database);
  if (!status.ok()) {
    raceswap::common::critical("cannot open ledger database at {}: {}", path,
                               status.ToString());
  }
  auto store = storage<rocksdb_storage_tag>{};
  store.database.reset(database);

  auto committed = store.load_committed_state();
  spdlog::info("Opened ledger database at {} ({} committed transactions)",
               path, committed ? committed->transaction_count : 0);
  return store;
}

}  // namespace raceswap::storage
