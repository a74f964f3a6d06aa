#ifndef FILE_UTILS_HPP
#define FILE_UTILS_HPP

#include <arrow/result.h>

#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <string>

namespace meshlink {

arrow::Result<bool> write_to_file(const std::string& file_path,
                                  const std::string& content);

arrow::Result<std::string> read_from_file(const std::string& file_path);

// Parse failures come back as Invalid, never as exceptions.
arrow::Result<nlohmann::json> parse_json(const std::string& text);

template <typename T>
arrow::Result<T> read_json_file(const std::string& file_path) {
  ARROW_ASSIGN_OR_RAISE(auto text, read_from_file(file_path));
  ARROW_ASSIGN_OR_RAISE(auto j, parse_json(text));
  try {
    return j.template get<T>();
  } catch (const nlohmann::json::exception& e) {
    return arrow::Status::Invalid("Unexpected JSON layout in ", file_path,
                                  ": ", e.what());
  }
}

template <typename T>
arrow::Result<bool> write_json_file(const T& object,
                                    const std::string& file_path) {
  try {
    const nlohmann::json j = object;
    return write_to_file(file_path, j.dump(4));
  } catch (const nlohmann::json::exception& e) {
    return arrow::Status::Invalid("Failed to serialize JSON for ", file_path,
                                  ": ", e.what());
  }
}

}  // namespace meshlink

#endif  // FILE_UTILS_HPP
