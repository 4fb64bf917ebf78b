#pragma once
#include <optional>
#include <sanidate/schema/document.hpp>
#include <stdexcept>
#include <string_view>
#include <vector>

namespace sanidate::storage {

/// Recoverable read failure; lookups surface it as a leaf error.
struct storage_error final : std::runtime_error {
  using std::runtime_error::runtime_error;
};

template <typename Library>
struct storage {
  /// Persist a document with one index entry per field, replacing any
  /// previous document with the same collection and id.
  void save_document(const sanidate::schema::document_t& document) const;

  /// First document in collection whose `key` field equals `value`, or
  /// std::nullopt when there is none. Throws storage_error on read failure.
  std::optional<sanidate::schema::document_t> find_document(
      std::string_view collection,
      std::string_view key,
      std::string_view value) const;

  /// Document stored under (collection, id), or std::nullopt.
  std::optional<sanidate::schema::document_t> load_document(
      std::string_view collection,
      std::string_view id) const;

  /// Remove a document and its index entries; false when it did not exist.
  bool remove_document(std::string_view collection, std::string_view id) const;

  /// Every document in collection ordered by encoded id.
  std::vector<sanidate::schema::document_t> list_documents(
      std::string_view collection) const;
};

/// Construct a concrete storage backend rooted at filesystem path.
template <typename Library>
storage<Library> make_storage(const std::string_view& path);

}  // namespace sanidate::storage
