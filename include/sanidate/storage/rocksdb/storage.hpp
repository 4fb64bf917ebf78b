#pragma once
#include <rocksdb/db.h>
#include <rocksdb/iterator.h>
#include <rocksdb/options.h>
#include <rocksdb/slice.h>
#include <rocksdb/write_batch.h>
#include <spdlog/spdlog.h>
#include <scale/scale.hpp>
#include <iterator>
#include <memory>
#include <sanidate/common/critical.hpp>
#include <sanidate/schema/encoding/scale/encoder.hpp>
#include <sanidate/storage/storage.hpp>
#include <string>
#include <string_view>
#include <tuple>

namespace sanidate::storage {

namespace detail {

using encoder_t = sanidate::schema::encoding::encoder<
    sanidate::schema::encoding::scale_encoder_tag>;

/// Encoded body: version, collection, id, (field, value) pairs.
using document_row_t =
    std::tuple<uint16_t,
               std::string,
               std::string,
               std::vector<std::tuple<std::string, std::string>>>;

inline constexpr auto kDocumentBodyPrefix = std::string_view{"DOC|BODY|"};
inline constexpr auto kDocumentIndexPrefix = std::string_view{"DOC|INDEX|"};

template <typename T>
std::string make_key(const std::string_view prefix, const T& parts) {
  auto encoder = encoder_t{};
  auto key = std::string{prefix};
  encoder.append(parts, key);
  return key;
}

inline std::string make_body_prefix(const std::string_view collection) {
  return make_key(kDocumentBodyPrefix, std::tuple{std::string{collection}});
}

inline std::string make_body_key(const std::string_view collection,
                                 const std::string_view id) {
  return make_key(kDocumentBodyPrefix,
                  std::tuple{std::string{collection}, std::string{id}});
}

inline std::string make_index_prefix(const std::string_view collection,
                                     const std::string_view field,
                                     const std::string_view value) {
  return make_key(kDocumentIndexPrefix,
                  std::tuple{std::string{collection}, std::string{field},
                             std::string{value}});
}

inline std::string make_index_key(const std::string_view collection,
                                  const std::string_view field,
                                  const std::string_view value,
                                  const std::string_view id) {
  return make_key(kDocumentIndexPrefix,
                  std::tuple{std::string{collection}, std::string{field},
                             std::string{value}, std::string{id}});
}

inline std::string encode_document(const sanidate::schema::document_t& document) {
  auto fields = std::vector<std::tuple<std::string, std::string>>{};
  fields.reserve(document.fields.size());
  for (const auto& [name, value] : document.fields) {
    fields.emplace_back(name, value);
  }
  auto encoder = encoder_t{};
  auto row = std::string{};
  encoder.append(document_row_t{document.version, document.collection,
                                document.id, std::move(fields)},
                 row);
  return row;
}

inline std::optional<sanidate::schema::document_t> decode_document(
    const std::string_view raw) {
  auto encoder = encoder_t{};
  auto decoded = encoder.try_decode<document_row_t>(
      sanidate::schema::make_bytes_view(raw));
  if (!decoded.has_value()) {
    return std::nullopt;
  }
  auto document = sanidate::schema::document_t{};
  document.version = std::get<0>(decoded.value());
  document.collection = std::get<1>(decoded.value());
  document.id = std::get<2>(decoded.value());
  for (auto& [name, value] : std::get<3>(decoded.value())) {
    document.fields.emplace(std::move(name), std::move(value));
  }
  return document;
}

inline std::string_view to_string_view(const ROCKSDB_NAMESPACE::Slice& slice) {
  return std::string_view{slice.data(), slice.size()};
}

}  // namespace detail

struct rocksdb_storage_tag {};

template <>
struct storage<rocksdb_storage_tag> final {
  std::unique_ptr<ROCKSDB_NAMESPACE::DB> database;

  void save_document(const sanidate::schema::document_t& document) const;
  std::optional<sanidate::schema::document_t> find_document(
      std::string_view collection,
      std::string_view key,
      std::string_view value) const;
  std::optional<sanidate::schema::document_t> load_document(
      std::string_view collection,
      std::string_view id) const;
  bool remove_document(std::string_view collection, std::string_view id) const;
  std::vector<sanidate::schema::document_t> list_documents(
      std::string_view collection) const;

 private:
  void require_database() const;
  std::optional<sanidate::schema::document_t> read_document(
      const std::string& body_key) const;
  void delete_document(ROCKSDB_NAMESPACE::WriteBatch& batch,
                       const sanidate::schema::document_t& document) const;
};

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path);

inline void storage<rocksdb_storage_tag>::require_database() const {
  if (!database) {
    sanidate::common::critical("RocksDB database is not initialized");
  }
}

inline std::optional<sanidate::schema::document_t>
storage<rocksdb_storage_tag>::read_document(const std::string& body_key) const {
  auto raw = std::string{};
  auto status = database->Get(ROCKSDB_NAMESPACE::ReadOptions{}, body_key, &raw);
  if (status.IsNotFound()) {
    return std::nullopt;
  }
  if (!status.ok()) {
    spdlog::error("Failed to read document from RocksDB: {}",
                  status.ToString());
    throw storage_error{"failed to read document: " + status.ToString()};
  }
  auto document = detail::decode_document(raw);
  if (!document) {
    spdlog::warn("Failed decoding document body for key '{}'",
                 sanidate::schema::to_hex(
                     sanidate::schema::make_bytes_view(body_key)));
  }
  return document;
}

inline void storage<rocksdb_storage_tag>::delete_document(
    ROCKSDB_NAMESPACE::WriteBatch& batch,
    const sanidate::schema::document_t& document) const {
  auto status = batch.Delete(
      detail::make_body_key(document.collection, document.id));
  if (!status.ok()) {
    sanidate::common::critical("failed deleting document body: {}",
                               status.ToString());
  }
  for (const auto& [name, value] : document.fields) {
    auto index_status = batch.Delete(detail::make_index_key(
        document.collection, name, value, document.id));
    if (!index_status.ok()) {
      sanidate::common::critical("failed deleting index entry {}: {}", name,
                                 index_status.ToString());
    }
  }
}

inline void storage<rocksdb_storage_tag>::save_document(
    const sanidate::schema::document_t& document) const {
  require_database();
  auto batch = ROCKSDB_NAMESPACE::WriteBatch{};

  auto body_key = detail::make_body_key(document.collection, document.id);
  auto previous = std::optional<sanidate::schema::document_t>{};
  try {
    previous = read_document(body_key);
  } catch (const storage_error& ex) {
    sanidate::common::critical("{}", ex.what());
  }
  if (previous) {
    delete_document(batch, *previous);
  }

  auto put_status = batch.Put(body_key, detail::encode_document(document));
  if (!put_status.ok()) {
    sanidate::common::critical("failed writing document body: {}",
                               put_status.ToString());
  }
  for (const auto& [name, value] : document.fields) {
    auto index_status = batch.Put(
        detail::make_index_key(document.collection, name, value, document.id),
        document.id);
    if (!index_status.ok()) {
      sanidate::common::critical("failed writing index entry {}: {}", name,
                                 index_status.ToString());
    }
  }

  auto write_status =
      database->Write(ROCKSDB_NAMESPACE::WriteOptions{}, &batch);
  if (!write_status.ok()) {
    sanidate::common::critical("failed to save document {}/{}: {}",
                               document.collection, document.id,
                               write_status.ToString());
  }
}

inline std::optional<sanidate::schema::document_t>
storage<rocksdb_storage_tag>::find_document(const std::string_view collection,
                                            const std::string_view key,
                                            const std::string_view value) const {
  require_database();
  auto prefix = detail::make_index_prefix(collection, key, value);

  auto read_options = ROCKSDB_NAMESPACE::ReadOptions{};
  auto iterator = std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
      database->NewIterator(read_options)};
  iterator->Seek(prefix);
  while (iterator->Valid()) {
    auto key_view = detail::to_string_view(iterator->key());
    if (!key_view.starts_with(prefix)) {
      break;
    }
    auto id = std::string{detail::to_string_view(iterator->value())};
    auto document = read_document(detail::make_body_key(collection, id));
    if (document) {
      return document;
    }
    spdlog::warn("Index entry in '{}' points at missing document '{}'",
                 collection, id);
    iterator->Next();
  }
  if (!iterator->status().ok()) {
    spdlog::error("Failed to scan RocksDB index: {}",
                  iterator->status().ToString());
    throw storage_error{"failed to scan index: " +
                        iterator->status().ToString()};
  }
  return std::nullopt;
}

inline std::optional<sanidate::schema::document_t>
storage<rocksdb_storage_tag>::load_document(const std::string_view collection,
                                            const std::string_view id) const {
  require_database();
  return read_document(detail::make_body_key(collection, id));
}

inline bool storage<rocksdb_storage_tag>::remove_document(
    const std::string_view collection,
    const std::string_view id) const {
  require_database();
  auto existing = std::optional<sanidate::schema::document_t>{};
  try {
    existing = read_document(detail::make_body_key(collection, id));
  } catch (const storage_error& ex) {
    sanidate::common::critical("{}", ex.what());
  }
  if (!existing) {
    return false;
  }

  auto batch = ROCKSDB_NAMESPACE::WriteBatch{};
  delete_document(batch, *existing);
  auto write_status =
      database->Write(ROCKSDB_NAMESPACE::WriteOptions{}, &batch);
  if (!write_status.ok()) {
    sanidate::common::critical("failed to remove document {}/{}: {}",
                               collection, id, write_status.ToString());
  }
  return true;
}

inline std::vector<sanidate::schema::document_t>
storage<rocksdb_storage_tag>::list_documents(
    const std::string_view collection) const {
  require_database();
  auto documents = std::vector<sanidate::schema::document_t>{};
  auto prefix = detail::make_body_prefix(collection);

  auto read_options = ROCKSDB_NAMESPACE::ReadOptions{};
  auto iterator = std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
      database->NewIterator(read_options)};
  iterator->Seek(prefix);
  while (iterator->Valid()) {
    auto key_view = detail::to_string_view(iterator->key());
    if (!key_view.starts_with(prefix)) {
      break;
    }
    auto document =
        detail::decode_document(detail::to_string_view(iterator->value()));
    if (!document) {
      spdlog::warn("Failed decoding document in collection '{}'", collection);
      iterator->Next();
      continue;
    }
    documents.push_back(std::move(*document));
    iterator->Next();
  }
  return documents;
}

}  // namespace sanidate::storage
