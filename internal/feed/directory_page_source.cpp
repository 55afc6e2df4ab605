#include "directory_page_source.hpp"

#include <algorithm>
#include <stdexcept>
#include <vector>

#include "internal/storage/common/arrow_utils.hpp"
#include "internal/storage/common/path_utils.hpp"
#include "internal/util/errors.hpp"

namespace circulate::feed {

using namespace circulate::storage::common;

DirectoryPageSource::DirectoryPageSource(std::shared_ptr<arrow::fs::FileSystem> fs, std::string root_path, std::size_t page_size,
                                         std::string output_key)
    : fs_(std::move(fs)), root_path_(std::move(root_path)), page_size_(page_size), output_key_(std::move(output_key)) {
  if (!fs_) throw std::invalid_argument("directory page source requires a filesystem");
  if (page_size_ == 0) throw std::invalid_argument("page size must be positive");
}

task::Page DirectoryPageSource::Fetch(const std::string& resource_id, const std::optional<std::string>& cursor) {
  ValidateObjectKey(resource_id);

  std::size_t offset = 0;
  if (cursor) {
    try {
      offset = std::stoull(*cursor);
    } catch (const std::exception&) {
      throw util::PermanentError("invalid cursor '" + *cursor + "' for resource " + resource_id);
    }
  }

  arrow::fs::FileSelector selector;
  selector.base_dir        = JoinPath(root_path_, resource_id);
  selector.recursive       = true;
  selector.allow_not_found = false;

  std::vector<arrow::fs::FileInfo> files;
  for (auto& info : Unwrap(fs_->GetFileInfo(selector))) {
    if (info.IsFile()) files.push_back(std::move(info));
  }
  std::sort(files.begin(), files.end(), [](const auto& a, const auto& b) { return a.path() < b.path(); });

  task::Page page;
  const auto end = std::min(files.size(), offset + page_size_);
  for (std::size_t i = offset; i < end; ++i) {
    task::Record record;
    record.identifier = files[i].base_name();
    record.output_key = output_key_;
    record.payload    = ReadAll(Unwrap(fs_->OpenInputFile(files[i].path())))->ToString();
    page.records.push_back(std::move(record));
  }

  if (end < files.size()) page.next_cursor = std::to_string(end);
  return page;
}

} // namespace circulate::feed
