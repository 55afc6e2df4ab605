#pragma once

#include <optional>
#include <string>
#include <vector>

namespace circulate::task {

/*
  One entry of an external feed.

    identifier   primary identifier; per-record import locks are keyed by it
    output_key   export output the payload is appended to
    payload      record bytes as the feed delivered them
*/
struct Record {
  std::string identifier;
  std::string output_key;
  std::string payload;
};

struct Page {
  std::vector<Record> records;

  // nullopt on the last page
  std::optional<std::string> next_cursor;
};

/*
  Paginated external resource. Cursors are opaque and only ever come from
  the previous page.

  Implementations throw util::TransientError for failures worth retrying.
*/
class PageSource {
 public:
  virtual ~PageSource() = default;

  virtual Page Fetch(const std::string& resource_id, const std::optional<std::string>& cursor) = 0;
};

} // namespace circulate::task
