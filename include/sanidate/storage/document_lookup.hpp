#pragma once
#include <optional>
#include <sanidate/schema/document.hpp>
#include <sanidate/schema/evaluator.hpp>
#include <sanidate/storage/storage.hpp>
#include <string>
#include <utility>

namespace sanidate::storage {

/// Adapts one collection of a store to the lookup used by `isDocument` and
/// `isNotDocument`. The store must outlive every check using the lookup.
/// Lookups complete synchronously on the calling thread.
template <typename Library>
schema::document_lookup_t make_document_lookup(const storage<Library>& store,
                                               std::string collection) {
  return [&store, collection = std::move(collection)](
             const std::string& key, const schema::value_t& value,
             schema::lookup_callback_t done) {
    auto found = std::optional<schema::document_t>{};
    try {
      found = store.find_document(collection, key, schema::to_string(value));
    } catch (const storage_error& ex) {
      done(std::string{ex.what()}, schema::document_ptr_t{});
      return;
    }
    if (!found) {
      done(std::nullopt, schema::document_ptr_t{});
      return;
    }
    done(std::nullopt, schema::make_document_ptr(std::move(*found)));
  };
}

}  // namespace sanidate::storage
