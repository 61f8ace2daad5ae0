#pragma once

#include <cstdint>
#include <string>
#include <vector>

// Schema type: document.
// Soft deletion clears `is_active`; hard deletion removes the row and its
// search content.
namespace arkive::schema {

template <uint16_t Version>
struct document;

template <>
struct document<1> final {
  uint16_t version{1};
  std::string id;
  std::string user_id;
  std::string name;
  std::string file_path;
  std::string file_type;
  int64_t file_size{};
  std::string category{"General"};
  std::vector<std::string> tags;
  bool is_active{true};
  std::string created_at;
  std::string updated_at;
};

using document_t = document<1>;

}  // namespace arkive::schema
