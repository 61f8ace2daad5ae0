#pragma once

#include <cstdint>
#include <string>

// Schema type: document content.
// Extracted text and structured fields handed over by ingestion, keyed by
// document. `fields` is a JSON object.
namespace arkive::schema {

template <uint16_t Version>
struct document_content;

template <>
struct document_content<1> final {
  uint16_t version{1};
  std::string document_id;
  std::string extracted_text;
  std::string document_type;
  std::string fields{"{}"};
  std::string indexed_at;
};

using document_content_t = document_content<1>;

}  // namespace arkive::schema
