#pragma once

#include <arrow/filesystem/filesystem.h>

#include <cstddef>
#include <memory>
#include <optional>
#include <string>

#include "internal/task/page_source.hpp"

namespace circulate::feed {

/*
  Page source over a directory tree:

      <root>/<resource_id>/<file>   one record per regular file

  Files are ordered by path and served `page_size` at a time. The cursor is
  the offset of the next page. Each record's identifier is the file name,
  its payload the file contents and its output key `output_key`.
*/
class DirectoryPageSource final : public task::PageSource {
 public:
  DirectoryPageSource(std::shared_ptr<arrow::fs::FileSystem> fs, std::string root_path, std::size_t page_size = 100,
                      std::string output_key = "records");

  task::Page Fetch(const std::string& resource_id, const std::optional<std::string>& cursor) override;

 private:
  std::shared_ptr<arrow::fs::FileSystem> fs_;
  std::string                            root_path_;
  std::size_t                            page_size_;
  std::string                            output_key_;
};

} // namespace circulate::feed
