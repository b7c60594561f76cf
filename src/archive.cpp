#include "gitsaga/archive.hpp"

#include "gitsaga/consts.hpp"
#include "gitsaga/fs.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cstring>
#include <iterator>
#include <optional>
#include <system_error>

namespace gitsaga::archive {

namespace {

using consts::kTarBlock;

constexpr std::size_t kNameLen = 100;
constexpr std::size_t kPrefixLen = 155;

// ustar header field offsets
constexpr std::size_t kOffName = 0;
constexpr std::size_t kOffMode = 100;
constexpr std::size_t kOffUid = 108;
constexpr std::size_t kOffGid = 116;
constexpr std::size_t kOffSize = 124;
constexpr std::size_t kOffMtime = 136;
constexpr std::size_t kOffChksum = 148;
constexpr std::size_t kOffType = 156;
constexpr std::size_t kOffLink = 157;
constexpr std::size_t kOffMagic = 257;
constexpr std::size_t kOffVersion = 263;
constexpr std::size_t kOffPrefix = 345;

using Block = std::array<std::uint8_t, kTarBlock>;

void put_str(Block &b, std::size_t off, std::size_t len, std::string_view s) {
  std::memcpy(b.data() + off, s.data(), std::min(len, s.size()));
}

// Zero-padded octal, NUL-terminated, filling `len` bytes.
void put_octal(Block &b, std::size_t off, std::size_t len, std::uint64_t value) {
  std::string digits(len - 1, '0');
  for (std::size_t i = len - 1; i-- > 0 && value != 0;) {
    digits[i] = static_cast<char>('0' + (value & 7));
    value >>= 3;
  }
  if (value != 0)
    throw ArchiveError("tar: numeric field overflow");
  put_str(b, off, len - 1, digits);
  b[off + len - 1] = 0;
}

std::uint64_t get_octal(std::span<const std::uint8_t> field) {
  std::uint64_t v = 0;
  bool seen = false;
  for (auto c : field) {
    if (c == 0 || (seen && c == ' '))
      break;
    if (c == ' ' && !seen)
      continue;
    if (c < '0' || c > '7')
      throw ArchiveError("tar: bad octal field");
    v = (v << 3) | static_cast<std::uint64_t>(c - '0');
    seen = true;
  }
  return v;
}

std::string get_str(std::span<const std::uint8_t> field) {
  const auto nul = std::ranges::find(field, static_cast<std::uint8_t>(0));
  return {field.begin(), nul};
}

std::uint32_t checksum(const Block &b) {
  std::uint32_t sum = 0;
  for (std::size_t i = 0; i < kTarBlock; ++i)
    sum += (i >= kOffChksum && i < kOffChksum + 8) ? ' ' : b[i];
  return sum;
}

void seal(Block &b) {
  put_octal(b, kOffChksum, 7, checksum(b));
  b[kOffChksum + 7] = ' ';
}

Block header(std::string_view name, char type, std::uint32_t mode, std::uint64_t size,
             std::string_view link) {
  Block b{};
  put_str(b, kOffName, kNameLen, name);
  put_octal(b, kOffMode, 8, mode & 07777);
  put_octal(b, kOffUid, 8, 0);
  put_octal(b, kOffGid, 8, 0);
  put_octal(b, kOffSize, 12, size);
  put_octal(b, kOffMtime, 12, 0);
  b[kOffType] = static_cast<std::uint8_t>(type);
  put_str(b, kOffLink, kNameLen, link);
  put_str(b, kOffMagic, 6, std::string_view("ustar\0", 6));
  put_str(b, kOffVersion, 2, "00");
  return b;
}

void append(std::vector<std::uint8_t> &out, const Block &b) {
  out.insert(out.end(), b.begin(), b.end());
}

void append_data(std::vector<std::uint8_t> &out, std::span<const std::uint8_t> data) {
  out.insert(out.end(), data.begin(), data.end());
  const auto pad = (kTarBlock - data.size() % kTarBlock) % kTarBlock;
  out.insert(out.end(), pad, 0);
}

// "<len> key=value\n" where <len> counts the whole record including itself.
std::string pax_record(std::string_view key, std::string_view value) {
  const std::size_t body = 1 + key.size() + 1 + value.size() + 1;
  std::size_t len = body + 1;
  while (std::to_string(len).size() + body != len)
    len = std::to_string(len).size() + body;
  return std::to_string(len) + " " + std::string(key) + "=" + std::string(value) + "\n";
}

void parse_pax(std::string_view data, std::optional<std::string> &path,
               std::optional<std::string> &link) {
  std::size_t pos = 0;
  while (pos < data.size()) {
    const auto sp = data.find(' ', pos);
    if (sp == std::string_view::npos)
      throw ArchiveError("tar: malformed pax record");
    std::size_t len = 0;
    for (auto c : data.substr(pos, sp - pos)) {
      if (c < '0' || c > '9')
        throw ArchiveError("tar: malformed pax length");
      len = len * 10 + static_cast<std::size_t>(c - '0');
    }
    if (len == 0 || pos + len > data.size() || data[pos + len - 1] != '\n')
      throw ArchiveError("tar: malformed pax record");
    const auto record = data.substr(sp + 1, pos + len - 1 - (sp + 1));
    const auto eq = record.find('=');
    if (eq != std::string_view::npos) {
      const auto key = record.substr(0, eq);
      const auto value = std::string(record.substr(eq + 1));
      if (key == "path")
        path = value;
      else if (key == "linkpath")
        link = value;
    }
    pos += len;
  }
}

// Split `name` into ustar prefix/name; nullopt if it does not fit.
std::optional<std::pair<std::string, std::string>> split_ustar(const std::string &name) {
  if (name.size() <= kNameLen)
    return std::make_pair(std::string{}, name);
  for (auto slash = name.rfind('/'); slash != std::string::npos && slash > 0;
       slash = name.rfind('/', slash - 1)) {
    if (slash <= kPrefixLen && name.size() - slash - 1 <= kNameLen && name.size() - slash - 1 > 0)
      return std::make_pair(name.substr(0, slash), name.substr(slash + 1));
  }
  return std::nullopt;
}

// ".git" in any letter case; such a component would reach repository metadata
bool is_git_dir_name(std::string_view part) {
  if (part.size() != 4 || part[0] != '.')
    return false;
  return std::equal(part.begin() + 1, part.end(), "git", [](char a, char b) {
    return std::tolower(static_cast<unsigned char>(a)) == b;
  });
}

void remove_existing(const std::filesystem::path &p) {
  std::error_code ec;
  const auto st = std::filesystem::symlink_status(p, ec);
  if (st.type() == std::filesystem::file_type::not_found)
    return;
  if (st.type() == std::filesystem::file_type::directory)
    throw ArchiveError("tar: a directory is in the way of " + p.string());
  std::filesystem::remove(p, ec);
  if (ec)
    throw std::runtime_error("remove failed: " + p.string() + ": " + ec.message());
}

} // namespace

void refuse_symlinked_parent(const std::filesystem::path &root, const std::string &rel) {
  std::filesystem::path cur = root;
  const std::filesystem::path relp(rel);
  for (auto it = relp.begin(); it != relp.end(); ++it) {
    if (std::next(it) == relp.end())
      break;
    cur /= *it;
    std::error_code ec;
    if (std::filesystem::is_symlink(cur, ec))
      throw ArchiveError("path passes through a symlink: " + rel);
  }
}

bool is_safe_path(std::string_view path) {
  if (path.empty() || path.front() == '/' || path.front() == '\\')
    return false;
  if (path.size() >= 2 && path[1] == ':')
    return false;
  std::size_t pos = 0;
  while (pos <= path.size()) {
    auto end = path.find_first_of("/\\", pos);
    if (end == std::string_view::npos)
      end = path.size();
    const auto part = path.substr(pos, end - pos);
    if (part == ".." || is_git_dir_name(part))
      return false;
    pos = end + 1;
  }
  return true;
}

std::vector<std::uint8_t> write_tar(const std::vector<Entry> &entries) {
  std::vector<std::uint8_t> out;
  for (const auto &e : entries) {
    if (!is_safe_path(e.path))
      throw ArchiveError("tar: unsafe entry path: " + e.path);

    std::string name = e.path;
    if (e.type == EntryType::Directory && !name.ends_with('/'))
      name += '/';

    const auto split = split_ustar(name);
    const bool long_link = e.link_target.size() > kNameLen;
    if (!split || long_link) {
      std::string pax;
      if (!split)
        pax += pax_record("path", name);
      if (long_link)
        pax += pax_record("linkpath", e.link_target);
      const std::string pax_name = "PaxHeader/" + name.substr(0, std::min<std::size_t>(name.size(), 80));
      append(out, [&] {
        auto h = header(pax_name, 'x', 0644, pax.size(), {});
        seal(h);
        return h;
      }());
      append_data(out, std::span(reinterpret_cast<const std::uint8_t *>(pax.data()), pax.size()));
    }

    const std::string short_name = split ? split->second : name.substr(0, kNameLen);
    const std::string prefix = split ? split->first : std::string{};
    const std::string link = e.link_target.substr(0, std::min(e.link_target.size(), kNameLen));

    Block h{};
    switch (e.type) {
    case EntryType::File:
      h = header(short_name, '0', e.mode, e.data.size(), {});
      break;
    case EntryType::Directory:
      h = header(short_name, '5', e.mode, 0, {});
      break;
    case EntryType::Symlink:
      h = header(short_name, '2', 0777, 0, link);
      break;
    }
    put_str(h, kOffPrefix, kPrefixLen, prefix);
    seal(h);
    append(out, h);
    if (e.type == EntryType::File)
      append_data(out, e.data);
  }
  // End of archive: two zero blocks
  out.insert(out.end(), 2 * kTarBlock, 0);
  return out;
}

std::vector<Entry> read_tar(std::span<const std::uint8_t> tar) {
  std::vector<Entry> entries;
  std::optional<std::string> next_path;
  std::optional<std::string> next_link;
  std::size_t pos = 0;

  while (pos + kTarBlock <= tar.size()) {
    Block b{};
    std::copy_n(tar.begin() + static_cast<std::ptrdiff_t>(pos), kTarBlock, b.begin());
    pos += kTarBlock;

    if (std::ranges::all_of(b, [](std::uint8_t c) { return c == 0; }))
      return entries;

    const auto span = std::span<const std::uint8_t>(b);
    const auto stored = get_octal(span.subspan(kOffChksum, 8));
    if (stored != checksum(b))
      throw ArchiveError("tar: header checksum mismatch");

    const auto size = get_octal(span.subspan(kOffSize, 12));
    if (size > tar.size() - pos)
      throw ArchiveError("tar: entry data runs past end of archive");
    const auto data = tar.subspan(pos, static_cast<std::size_t>(size));
    pos += static_cast<std::size_t>((size + kTarBlock - 1) / kTarBlock * kTarBlock);
    pos = std::min(pos, tar.size());

    const char type = static_cast<char>(b[kOffType]);
    if (type == 'x') {
      parse_pax({reinterpret_cast<const char *>(data.data()), data.size()}, next_path, next_link);
      continue;
    }
    if (type == 'g')
      continue;
    if (type == 'L' || type == 'K') {
      auto value = get_str(data);
      (type == 'L' ? next_path : next_link) = std::move(value);
      continue;
    }

    Entry e;
    if (next_path) {
      e.path = *next_path;
    } else {
      const auto prefix = get_str(span.subspan(kOffPrefix, kPrefixLen));
      const auto name = get_str(span.subspan(kOffName, kNameLen));
      e.path = prefix.empty() ? name : prefix + "/" + name;
    }
    e.mode = static_cast<std::uint32_t>(get_octal(span.subspan(kOffMode, 8)));
    next_path.reset();

    switch (type) {
    case '0':
    case '\0':
    case '7':
      e.type = EntryType::File;
      e.data.assign(data.begin(), data.end());
      break;
    case '5':
      e.type = EntryType::Directory;
      break;
    case '2':
      e.type = EntryType::Symlink;
      e.link_target = next_link ? *next_link : get_str(span.subspan(kOffLink, kNameLen));
      break;
    default:
      throw ArchiveError("tar: unsupported entry type '" + std::string(1, type) + "' for " +
                         e.path);
    }
    next_link.reset();

    while (e.path.size() > 1 && e.path.ends_with('/'))
      e.path.pop_back();
    while (e.path.starts_with("./"))
      e.path.erase(0, 2);
    if (e.path == "." && e.type == EntryType::Directory)
      continue;
    entries.push_back(std::move(e));
  }
  throw ArchiveError("tar: missing end-of-archive marker");
}

std::vector<std::uint8_t> pack(const std::filesystem::path &root,
                               const std::vector<std::string> &paths) {
  std::vector<Entry> entries;
  entries.reserve(paths.size());
  for (const auto &rel : paths) {
    const auto full = root / rel;
    std::error_code ec;
    const auto st = std::filesystem::symlink_status(full, ec);
    if (ec || st.type() == std::filesystem::file_type::not_found)
      throw std::runtime_error("archive: no such file: " + full.string());

    Entry e;
    e.path = rel;
    if (st.type() == std::filesystem::file_type::symlink) {
      e.type = EntryType::Symlink;
      e.link_target = std::filesystem::read_symlink(full).generic_string();
    } else if (st.type() == std::filesystem::file_type::directory) {
      continue;
    } else {
      e.type = EntryType::File;
      const auto perms = st.permissions();
      e.mode = (perms & std::filesystem::perms::owner_exec) != std::filesystem::perms::none
                   ? 0755
                   : 0644;
      e.data = fs::read_file(full);
    }
    entries.push_back(std::move(e));
  }
  return fs::gzip_compress(write_tar(entries));
}

std::vector<std::string> extract(std::span<const std::uint8_t> tar_gz,
                                 const std::filesystem::path &dest) {
  std::vector<std::uint8_t> tar;
  try {
    tar = fs::gzip_decompress(tar_gz);
  } catch (const std::runtime_error &e) {
    throw ArchiveError(std::string("archive: ") + e.what());
  }
  const auto entries = read_tar(tar);

  // Validate everything before touching the destination
  for (const auto &e : entries) {
    if (!is_safe_path(e.path))
      throw ArchiveError("archive: unsafe entry path: " + e.path);
  }

  std::vector<std::string> written;
  for (const auto &e : entries) {
    const auto target = dest / e.path;
    refuse_symlinked_parent(dest, e.path);
    std::error_code ec;
    switch (e.type) {
    case EntryType::Directory:
      std::filesystem::create_directories(target, ec);
      if (ec)
        throw std::runtime_error("mkdir failed: " + target.string() + ": " + ec.message());
      break;
    case EntryType::File:
      fs::write_file_atomic(target, e.data);
      std::filesystem::permissions(target, static_cast<std::filesystem::perms>(e.mode & 0777),
                                   ec);
      if (ec)
        throw std::runtime_error("chmod failed: " + target.string() + ": " + ec.message());
      break;
    case EntryType::Symlink:
      fs::ensure_parent_dir(target);
      remove_existing(target);
      std::filesystem::create_symlink(e.link_target, target, ec);
      if (ec)
        throw std::runtime_error("symlink failed: " + target.string() + ": " + ec.message());
      break;
    }
    written.push_back(e.path);
  }
  return written;
}

} // namespace gitsaga::archive
