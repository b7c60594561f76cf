#include "gitsaga/snapshot.hpp"

#include "gitsaga/fs.hpp"
#include "gitsaga/util.hpp"

#include <stdexcept>

namespace gitsaga {

char status_code(FileStatus status) {
  switch (status) {
  case FileStatus::Added:
    return 'A';
  case FileStatus::Modified:
    return 'M';
  case FileStatus::Deleted:
    return 'D';
  }
  return 'M';
}

FileStatus status_from_code(std::string_view code) {
  if (code == "A")
    return FileStatus::Added;
  if (code == "D")
    return FileStatus::Deleted;
  return FileStatus::Modified;
}

std::string format_snapshot(const TreeSnapshot &snapshot) {
  std::string out = "tree: " + snapshot.tree_hash + "\n";
  if (snapshot.base_commit)
    out += "base: " + *snapshot.base_commit + "\n";
  if (snapshot.archive_url)
    out += "archive: " + *snapshot.archive_url + "\n";
  if (!snapshot.timestamp.empty())
    out += "timestamp: " + snapshot.timestamp + "\n";
  if (snapshot.interrupted)
    out += "interrupted: true\n";
  for (const auto &c : snapshot.changes) {
    out += "change: ";
    out += status_code(c.status);
    out += " " + c.path + "\n";
  }
  return out;
}

TreeSnapshot parse_snapshot(std::string_view text) {
  TreeSnapshot snap;
  for (const auto &raw : strutil::split_lines(text)) {
    const auto line = strutil::trim(raw);
    if (line.empty() || line.starts_with('#'))
      continue;
    const auto colon = line.find(':');
    if (colon == std::string::npos)
      throw std::runtime_error("snapshot: malformed line: " + line);
    const auto key = line.substr(0, colon);
    const auto value = strutil::trim(std::string_view(line).substr(colon + 1));

    if (key == "tree") {
      snap.tree_hash = value;
    } else if (key == "base") {
      snap.base_commit = value;
    } else if (key == "archive") {
      snap.archive_url = value;
    } else if (key == "timestamp") {
      snap.timestamp = value;
    } else if (key == "interrupted") {
      snap.interrupted = value == "true";
    } else if (key == "change") {
      // "<code> <path>"; the path keeps any inner spaces
      const auto sp = value.find(' ');
      if (sp == std::string::npos || sp + 1 >= value.size())
        throw std::runtime_error("snapshot: malformed change: " + value);
      snap.changes.push_back(
          FileChange{.path = value.substr(sp + 1), .status = status_from_code(value.substr(0, sp))});
    } else {
      throw std::runtime_error("snapshot: unknown key: " + key);
    }
  }
  if (snap.tree_hash.empty())
    throw std::runtime_error("snapshot: missing tree hash");
  return snap;
}

std::vector<std::uint8_t> FileApiClient::download_artifact(const std::string & /*task_id*/,
                                                           const std::string & /*run_id*/,
                                                           const std::string &archive_url) {
  std::string_view location = archive_url;
  if (location.starts_with("file://"))
    location.remove_prefix(7);
  std::filesystem::path p{std::string(location)};
  if (p.is_relative() && !root_.empty())
    p = root_ / p;
  if (!fs::exists(p))
    return {};
  return fs::read_file(p);
}

} // namespace gitsaga
