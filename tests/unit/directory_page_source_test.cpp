#include "internal/feed/directory_page_source.hpp"

#include <arrow/filesystem/localfs.h>

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

#include "internal/util/errors.hpp"

namespace {

using circulate::feed::DirectoryPageSource;

std::filesystem::path MakeFeed(const std::string& name) {
  const auto root = std::filesystem::temp_directory_path() / "circulate_directory_page_source_tests" / name;
  std::filesystem::remove_all(root);
  std::filesystem::create_directories(root / "users" / "nested");

  auto write = [](const std::filesystem::path& path, const std::string& body) {
    std::ofstream out(path);
    out << body;
  };
  write(root / "users" / "a.json", "A");
  write(root / "users" / "b.json", "B");
  write(root / "users" / "c.json", "C");
  write(root / "users" / "nested" / "d.json", "D");
  write(root / "users" / "e.json", "E");
  return root;
}

DirectoryPageSource MakeSource(const std::filesystem::path& root, std::size_t page_size) {
  return DirectoryPageSource(std::make_shared<arrow::fs::LocalFileSystem>(), root.string(), page_size, "out");
}

void TestPagesInPathOrder() {
  const auto root   = MakeFeed("pages");
  auto       source = MakeSource(root, 2);

  auto first = source.Fetch("users", std::nullopt);
  assert(first.records.size() == 2);
  assert(first.records[0].identifier == "a.json");
  assert(first.records[0].payload == "A");
  assert(first.records[0].output_key == "out");
  assert(first.records[1].identifier == "b.json");
  assert(first.next_cursor == "2");

  auto second = source.Fetch("users", first.next_cursor);
  assert(second.records.size() == 2);
  assert(second.records[0].identifier == "c.json");
  assert(second.records[1].identifier == "e.json");
  assert(second.next_cursor == "4");

  auto last = source.Fetch("users", second.next_cursor);
  assert(last.records.size() == 1);
  assert(last.records[0].identifier == "d.json");
  assert(last.records[0].payload == "D");
  assert(!last.next_cursor.has_value());

  std::filesystem::remove_all(root);
}

void TestExactMultipleEndsWithoutCursor() {
  const auto root   = MakeFeed("exact");
  auto       source = MakeSource(root, 5);

  auto page = source.Fetch("users", std::nullopt);
  assert(page.records.size() == 5);
  assert(!page.next_cursor.has_value());

  auto past = source.Fetch("users", std::string("9"));
  assert(past.records.empty());
  assert(!past.next_cursor.has_value());

  std::filesystem::remove_all(root);
}

void TestInvalidInput() {
  const auto root   = MakeFeed("invalid");
  auto       source = MakeSource(root, 2);

  bool bad_cursor = false;
  try {
    source.Fetch("users", std::string("not-a-number"));
  } catch (const circulate::util::PermanentError&) {
    bad_cursor = true;
  }
  assert(bad_cursor);

  bool bad_resource = false;
  try {
    source.Fetch("../users", std::nullopt);
  } catch (const std::invalid_argument&) {
    bad_resource = true;
  }
  assert(bad_resource);

  bool missing = false;
  try {
    source.Fetch("groups", std::nullopt);
  } catch (const circulate::util::ObjectStoreError&) {
    missing = true;
  }
  assert(missing);

  bool zero_page = false;
  try {
    MakeSource(root, 0);
  } catch (const std::invalid_argument&) {
    zero_page = true;
  }
  assert(zero_page);

  std::filesystem::remove_all(root);
}

} // namespace

int main() {
  TestPagesInPathOrder();
  TestExactMultipleEndsWithoutCursor();
  TestInvalidInput();

  std::cout << "circulate_unit_directory_page_source: pass\n";
  return 0;
}
