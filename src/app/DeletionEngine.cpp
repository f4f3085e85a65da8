#include "app/DeletionEngine.hpp"
#include "util/DirSize.hpp"

#include <filesystem>
#include <system_error>

namespace dustpan::app {

namespace {

bool remove_tree(const std::string& path, std::error_code& ec) {
  ec.clear();
  std::filesystem::remove_all(path, ec);
  return !ec;
}

void remove_batch(const std::vector<dustpan::model::FileItem>& items,
                  const dustpan::model::SelectionSet* marked,
                  DeletionOutcome& out) {
  for (const auto& it : items) {
    if (marked && !marked->contains(it.path)) continue;
    ++out.requested;
    std::error_code ec;
    if (!remove_tree(it.path, ec)) continue;
    out.removed.push_back({it.path, it.size});
    out.freed += it.size;
  }
}

} // namespace

DeletionOutcome delete_one(const dustpan::model::FileItem& item) {
  DeletionOutcome out;
  out.requested = 1;
  if (!dustpan::util::path_exists(item.path)) {
    out.removed.push_back({item.path, 0});
    return out;
  }
  // Sizes drift between scan and delete, measure what is there now
  const uint64_t size = dustpan::util::directory_size(item.path);
  std::error_code ec;
  if (!remove_tree(item.path, ec)) {
    out.ok = false;
    out.failed_path = item.path;
    out.error = ec.message();
    return out;
  }
  out.removed.push_back({item.path, size});
  out.freed = size;
  return out;
}

DeletionOutcome delete_marked(const dustpan::model::SelectionSet& marked,
                              const std::vector<dustpan::model::FileItem>& listing) {
  DeletionOutcome out;
  if (marked.empty()) return out;
  remove_batch(listing, &marked, out);
  return out;
}

DeletionOutcome delete_category(const dustpan::model::ScanResult& result) {
  DeletionOutcome out;
  out.category = result.category;
  out.origin = DeletionOrigin::Results;
  remove_batch(result.items, nullptr, out);
  return out;
}

} // namespace dustpan::app
