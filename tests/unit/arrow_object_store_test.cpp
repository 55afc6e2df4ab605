#include "internal/storage/object/arrow_object_store.hpp"

#include <arrow/filesystem/localfs.h>

#include <cassert>
#include <filesystem>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

#include "internal/util/errors.hpp"

namespace {

using circulate::storage::ArrowObjectStore;

struct TempRoot {
  std::filesystem::path path;

  explicit TempRoot(const std::string& name) : path(std::filesystem::temp_directory_path() / "circulate_arrow_object_store_tests" / name) {
    std::filesystem::remove_all(path);
    std::filesystem::create_directories(path);
  }

  ~TempRoot() {
    std::error_code ec;
    std::filesystem::remove_all(path, ec);
  }
};

ArrowObjectStore MakeStore(const TempRoot& root) {
  return ArrowObjectStore(std::make_shared<arrow::fs::LocalFileSystem>(), root.path.string());
}

template <typename Error, typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const Error&) {
    return true;
  }
  return false;
}

void TestStoreAndRead() {
  TempRoot root("store_read");
  auto     store = MakeStore(root);

  store.Store("users/s-1/records", "payload", "text/plain");
  assert(store.Read("users/s-1/records") == "payload");
  assert(std::filesystem::exists(root.path / "users" / "s-1" / "records"));

  store.Store("users/s-1/records", "", "text/plain");
  assert(store.Read("users/s-1/records").empty());
}

void TestMultipartAssemblesPartsInOrder() {
  TempRoot root("multipart");
  auto     store = MakeStore(root);

  const auto id = store.MultipartCreate("out/data", "application/json");
  auto       p1 = store.MultipartUpload("out/data", id, 1, "hello ");
  auto       p2 = store.MultipartUpload("out/data", id, 2, "world");
  assert(p1.part_number() == 1 && p2.part_number() == 2);
  assert(p1.etag().size() == 16);
  assert(p1.etag() != p2.etag());

  // not visible until completed
  assert(!std::filesystem::exists(root.path / "out" / "data"));

  store.MultipartComplete("out/data", id, {p1, p2});
  assert(store.Read("out/data") == "hello world");
  assert(!std::filesystem::exists(root.path / ".multipart" / id));
}

void TestCompleteRejectsGapsAndBadEtags() {
  TempRoot root("gaps");
  auto     store = MakeStore(root);

  const auto id = store.MultipartCreate("k", "");
  auto       p1 = store.MultipartUpload("k", id, 1, "a");
  auto       p2 = store.MultipartUpload("k", id, 2, "b");

  assert(Throws<std::invalid_argument>([&] { store.MultipartComplete("k", id, {p2}); }));
  assert(Throws<std::invalid_argument>([&] { store.MultipartComplete("k", id, {}); }));

  auto tampered = p2;
  tampered.set_etag("0000000000000000");
  assert(Throws<std::invalid_argument>([&] { store.MultipartComplete("k", id, {p1, tampered}); }));

  store.MultipartComplete("k", id, {p1, p2});
  assert(store.Read("k") == "ab");
}

void TestUploadValidation() {
  TempRoot root("validation");
  auto     store = MakeStore(root);

  const auto id = store.MultipartCreate("k", "");
  assert(Throws<std::invalid_argument>([&] { store.MultipartUpload("k", id, 0, "x"); }));
  assert(Throws<std::invalid_argument>([&] { store.MultipartUpload("other", id, 1, "x"); }));
  assert(Throws<std::invalid_argument>([&] { store.MultipartUpload("k", "../escape", 1, "x"); }));
  assert(Throws<circulate::util::NotFound>([&] { store.MultipartUpload("k", "00000000-0000-4000-8000-000000000000", 1, "x"); }));
  assert(Throws<std::invalid_argument>([&] { store.Store("../outside", "x", ""); }));
  assert(Throws<std::invalid_argument>([&] { store.Store("/abs", "x", ""); }));
}

void TestAbortIsIdempotent() {
  TempRoot root("abort");
  auto     store = MakeStore(root);

  const auto id = store.MultipartCreate("k", "");
  store.MultipartUpload("k", id, 1, "x");
  store.MultipartAbort("k", id);
  assert(!std::filesystem::exists(root.path / ".multipart" / id));

  store.MultipartAbort("k", id);
  assert(Throws<circulate::util::NotFound>([&] { store.MultipartUpload("k", id, 2, "y"); }));
}

void TestReadMissingObject() {
  TempRoot root("missing");
  auto     store = MakeStore(root);
  assert(Throws<circulate::util::ObjectStoreError>([&] { store.Read("nope"); }));
}

} // namespace

int main() {
  TestStoreAndRead();
  TestMultipartAssemblesPartsInOrder();
  TestCompleteRejectsGapsAndBadEtags();
  TestUploadValidation();
  TestAbortIsIdempotent();
  TestReadMissingObject();

  std::cout << "circulate_unit_arrow_object_store: pass\n";
  return 0;
}
