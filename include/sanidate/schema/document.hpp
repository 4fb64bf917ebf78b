#pragma once
#include <cstdint>
#include <map>
#include <memory>
#include <sanidate/schema/value.hpp>
#include <string>

// Schema type: document.
// Stored record answered by document lookups (`isDocument`,
// `isNotDocument`); flat string fields keyed by field name.
namespace sanidate::schema {

template <uint16_t Version>
struct document;

template <>
struct document<1> final {
  uint16_t version{1};
  std::string collection;
  std::string id;
  std::map<std::string, std::string> fields;

  bool operator==(const document<1>&) const = default;
};

using document_t = document<1>;

inline document_ptr_t make_document_ptr(document_t document) {
  return std::make_shared<const document_t>(std::move(document));
}

}  // namespace sanidate::schema
