#include "markdown_loader.hpp"

#include <fstream>
#include <sstream>

std::vector<fs::path> find_markdown_files(const fs::path &dir) {
  std::vector<fs::path> files;

  if (!fs::exists(dir)) {
    return files;
  }

  for (const auto &entry : fs::recursive_directory_iterator(dir)) {
    if (entry.is_regular_file() && entry.path().extension() == ".md") {
      files.push_back(entry.path());
    }
  }

  std::sort(files.begin(), files.end());
  return files;
}

std::string read_text_file(const fs::path &path) {
  std::ifstream file(path, std::ios::binary);
  if (!file.is_open()) {
    throw std::runtime_error("Cannot open file: " + path.string());
  }
  std::stringstream buffer;
  buffer << file.rdbuf();
  return buffer.str();
}
