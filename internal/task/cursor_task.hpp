#pragma once

#include <string>

#include "circulate/v1.hpp"
#include "internal/task/page_source.hpp"

namespace circulate::task {

// Exhaustive passes ignore "unchanged" and walk the whole feed.
inline bool Exhaustive(const v1::CursorTaskArgs& args) {
  return args.force() || args.collect_identifiers();
}

/*
  Continue iff there is a next page and either nothing on this page was
  already up to date or the caller asked for the whole feed.
*/
inline bool ShouldContinue(const Page& page, bool found_unchanged, const v1::CursorTaskArgs& args) {
  return page.next_cursor.has_value() && (!found_unchanged || Exhaustive(args));
}

// Arguments of the invocation that processes the page at `cursor`.
inline v1::CursorTaskArgs NextArgs(const v1::CursorTaskArgs& args, const std::string& cursor) {
  v1::CursorTaskArgs next = args;
  next.set_cursor(cursor);
  next.set_page_number(args.page_number() + 1);
  return next;
}

v1::TaskRequest MakeRequest(const std::string& task_name, const v1::CursorTaskArgs& args);
v1::TaskRequest MakeRequest(const std::string& task_name, const v1::ReapTaskArgs& args);

// Fills in a root id for the first invocation of a run.
void EnsureRootId(v1::CursorTaskArgs& args);

} // namespace circulate::task
