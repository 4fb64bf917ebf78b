#include <sanidate/common/critical.hpp>
#include <sanidate/storage/rocksdb/storage.hpp>

namespace sanidate::storage {

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path) {
  auto store = storage<rocksdb_storage_tag>{};

  // Point lookups and short prefix scans over small documents.
  auto options = ROCKSDB_NAMESPACE::Options{};
  options.create_if_missing = true;
  options.IncreaseParallelism();
  options.OptimizeForSmallDb();

  ROCKSDB_NAMESPACE::DB* database{nullptr};
  auto status =
      ROCKSDB_NAMESPACE::DB::Open(options, std::string{path}, &database);
  if (!status.ok()) {
    sanidate::common::critical("failed to open document store at {}: {}",
                               path, status.ToString());
  }
  store.database.reset(database);
  spdlog::info("Opened document store at {}", path);

  return store;
}

}  // namespace sanidate::storage
