#include "file_utils.hpp"

#include <filesystem>
#include <fstream>
#include <iterator>

namespace meshlink {

arrow::Result<bool> write_to_file(const std::string& file_path,
                                  const std::string& content) {
  try {
    if (const std::filesystem::path path(file_path);
        !path.parent_path().empty()) {
      std::filesystem::create_directories(path.parent_path());
    }

    std::ofstream file(file_path);
    if (!file.is_open()) {
      return arrow::Status::IOError("Failed to open file for writing: ",
                                    file_path);
    }
    file << content;
    file.flush();
    if (file.fail()) {
      return arrow::Status::IOError("Failed to flush file data: ", file_path);
    }
    return true;
  } catch (const std::filesystem::filesystem_error& e) {
    return arrow::Status::IOError("Error writing to file: ", e.what());
  }
}

arrow::Result<std::string> read_from_file(const std::string& file_path) {
  try {
    if (!std::filesystem::exists(file_path)) {
      return arrow::Status::IOError("File does not exist: ", file_path);
    }

    std::ifstream file(file_path);
    if (!file.is_open()) {
      return arrow::Status::IOError("Failed to open file for reading: ",
                                    file_path);
    }

    std::string content((std::istreambuf_iterator<char>(file)),
                        std::istreambuf_iterator<char>());
    if (file.bad()) {
      return arrow::Status::IOError("Failed to read file: ", file_path);
    }
    return content;
  } catch (const std::filesystem::filesystem_error& e) {
    return arrow::Status::IOError("Error reading from file: ", e.what());
  }
}

arrow::Result<nlohmann::json> parse_json(const std::string& text) {
  try {
    return nlohmann::json::parse(text);
  } catch (const nlohmann::json::parse_error& e) {
    return arrow::Status::Invalid("Failed to parse JSON: ", e.what());
  }
}

}  // namespace meshlink
