#include "gitsaga/fs.hpp"

#include <algorithm>
#include <fstream>
#include <stdexcept>
#include <system_error>

#include <zlib.h>

namespace gitsaga::fs {

bool exists(const std::filesystem::path &p) {
  std::error_code ec;
  return std::filesystem::exists(p, ec);
}

void ensure_parent_dir(const std::filesystem::path &p) {
  if (p.parent_path().empty())
    return;
  std::error_code ec;
  std::filesystem::create_directories(p.parent_path(), ec);
  if (ec)
    throw std::runtime_error("mkdir -p failed: " + p.parent_path().string() + ": " + ec.message());
}

std::vector<std::uint8_t> read_file(const std::filesystem::path &p) {
  std::ifstream ifs(p, std::ios::binary);
  if (!ifs) {
    throw std::runtime_error("open for read failed: " + p.string());
  }
  ifs.seekg(0, std::ios::end);
  auto n = static_cast<std::size_t>(ifs.tellg());
  ifs.seekg(0);
  std::vector<std::uint8_t> buf(n);
  if (n)
    ifs.read(reinterpret_cast<char *>(buf.data()), static_cast<std::streamsize>(n));
  return buf;
}

void write_file_atomic(const std::filesystem::path &p, std::span<const std::uint8_t> data) {
  ensure_parent_dir(p);
  auto tmp = p;
  tmp += ".tmp";
  {
    std::ofstream ofs(tmp, std::ios::binary | std::ios::trunc);
    if (!ofs) {
      throw std::runtime_error("open temp for write failed: " + tmp.string());
    }
    if (!data.empty()) {
      ofs.write(reinterpret_cast<const char *>(data.data()),
                static_cast<std::streamsize>(data.size()));
    }
    ofs.flush();
    if (!ofs)
      throw std::runtime_error("flush temp failed: " + tmp.string());
  }
  std::error_code ec;
  std::filesystem::rename(tmp, p, ec);
  if (ec) {
    std::filesystem::remove(p, ec);
    std::filesystem::rename(tmp, p, ec);
    if (ec) {
      std::filesystem::remove(tmp, ec);
      throw std::runtime_error("atomic replace failed: " + p.string() + ": " + ec.message());
    }
  }
}

std::string read_text(const std::filesystem::path &p) {
  const auto bytes = read_file(p);
  return {bytes.begin(), bytes.end()};
}

void write_text_atomic(const std::filesystem::path &p, std::string_view text) {
  const auto *data = reinterpret_cast<const std::uint8_t *>(text.data());
  write_file_atomic(p, std::span<const std::uint8_t>(data, text.size()));
}

namespace {

// windowBits 15 plus 16 selects the gzip wrapper instead of zlib's
constexpr int kGzipWindowBits = 15 + 16;
constexpr std::size_t kChunk = 64 * 1024;

} // namespace

std::vector<std::uint8_t> gzip_compress(std::span<const std::uint8_t> data) {
  z_stream zs{};
  if (deflateInit2(&zs, Z_BEST_SPEED, Z_DEFLATED, kGzipWindowBits, 8, Z_DEFAULT_STRATEGY) != Z_OK)
    throw std::runtime_error("zlib deflateInit2 failed");

  std::vector<std::uint8_t> out(deflateBound(&zs, static_cast<uLong>(data.size())) + 32);
  zs.next_in = const_cast<Bytef *>(reinterpret_cast<const Bytef *>(data.data()));
  zs.avail_in = static_cast<uInt>(data.size());
  zs.next_out = out.data();
  zs.avail_out = static_cast<uInt>(out.size());

  const int rc = deflate(&zs, Z_FINISH);
  const auto produced = zs.total_out;
  deflateEnd(&zs);
  if (rc != Z_STREAM_END)
    throw std::runtime_error("zlib gzip compress failed");
  out.resize(produced);
  return out;
}

std::vector<std::uint8_t> gzip_decompress(std::span<const std::uint8_t> data) {
  z_stream zs{};
  if (inflateInit2(&zs, kGzipWindowBits) != Z_OK)
    throw std::runtime_error("zlib inflateInit2 failed");

  zs.next_in = const_cast<Bytef *>(reinterpret_cast<const Bytef *>(data.data()));
  zs.avail_in = static_cast<uInt>(data.size());

  std::vector<std::uint8_t> out;
  std::vector<std::uint8_t> chunk(kChunk);
  int rc = Z_OK;
  while (rc != Z_STREAM_END) {
    zs.next_out = chunk.data();
    zs.avail_out = static_cast<uInt>(chunk.size());
    rc = inflate(&zs, Z_NO_FLUSH);
    if (rc != Z_OK && rc != Z_STREAM_END) {
      inflateEnd(&zs);
      throw std::runtime_error("zlib gzip decompress failed");
    }
    const auto have = chunk.size() - zs.avail_out;
    out.insert(out.end(), chunk.begin(), chunk.begin() + static_cast<std::ptrdiff_t>(have));
    if (rc == Z_OK && zs.avail_in == 0 && have == 0) {
      inflateEnd(&zs);
      throw std::runtime_error("zlib gzip decompress: truncated input");
    }
  }
  inflateEnd(&zs);
  return out;
}

std::filesystem::path normalize(const std::filesystem::path &p) {
  std::error_code ec;
  auto abs = std::filesystem::absolute(p, ec);
  if (ec)
    abs = p;
  auto canon = std::filesystem::weakly_canonical(abs, ec);
  if (ec)
    canon = abs.lexically_normal();
  // Drop a trailing separator so "a/b/" and "a/b" compare equal
  if (!canon.has_filename() && canon.has_parent_path() && canon != canon.root_path())
    canon = canon.parent_path();
  return canon;
}

bool is_same_or_ancestor(const std::filesystem::path &ancestor, const std::filesystem::path &p) {
  const auto a = normalize(ancestor);
  const auto b = normalize(p);
  auto ai = a.begin();
  auto bi = b.begin();
  for (; ai != a.end(); ++ai, ++bi) {
    if (bi == b.end() || *ai != *bi)
      return false;
  }
  return true;
}

bool safe_symlink(const std::filesystem::path &source, const std::filesystem::path &target) {
  if (!fs::exists(source))
    return false;
  std::error_code ec;
  if (std::filesystem::symlink_status(target, ec).type() != std::filesystem::file_type::not_found)
    return false;
  if (std::filesystem::is_directory(source, ec))
    std::filesystem::create_directory_symlink(source, target, ec);
  else
    std::filesystem::create_symlink(source, target, ec);
  if (ec)
    throw std::runtime_error("symlink failed: " + target.string() + ": " + ec.message());
  return true;
}

TempFile::~TempFile() {
  std::error_code ec;
  std::filesystem::remove(path_, ec);
}

} // namespace gitsaga::fs
