#include "bloomdb/storage/backend.hpp"

#include <fnmatch.h>

#include <algorithm>
#include <atomic>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <mutex>
#include <shared_mutex>
#include <unordered_map>

namespace bloomdb::storage {

namespace fs = std::filesystem;

namespace {

// Bare and file:// locations are served here; the scheme prefix is kept in
// listed locations so callers can hand them back unchanged.
auto local_path(const std::string& location) -> fs::path {
  return fs::path(std::string(split_location(location).path));
}

struct Registry {
  std::shared_mutex mutex;
  std::unordered_map<std::string, BackendFactory> factories;
};

auto registry() -> Registry& {
  static Registry r;
  return r;
}

} // namespace

auto split_location(std::string_view location) noexcept -> SplitLocation {
  const auto pos = location.find("://");
  if (pos == std::string_view::npos || pos == 0) return {{}, location};
  for (std::size_t i = 0; i < pos; ++i) {
    const char c = location[i];
    const bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
                    c == '+' || c == '-' || c == '.';
    if (!ok) return {{}, location};
  }
  return {location.substr(0, pos), location.substr(pos + 3)};
}

auto join_location(std::string_view base, std::string_view child) -> std::string {
  std::string out(base);
  while (!child.empty() && child.front() == '/') child.remove_prefix(1);
  if (!out.empty() && out.back() != '/') out.push_back('/');
  out.append(child);
  return out;
}

auto glob_match(const std::string& pattern, const std::string& name) noexcept -> bool {
  return ::fnmatch(pattern.c_str(), name.c_str(), FNM_PERIOD) == 0;
}

auto LocalBackend::get(const std::string& location) -> std::expected<std::vector<std::uint8_t>, core::error> {
  using core::error; using core::error_code;
  const auto path = local_path(location);
  std::error_code ec;
  if (!fs::is_regular_file(path, ec)) {
    return std::unexpected(error{error_code::not_found, "no such object: " + location, "storage.local"});
  }
  std::ifstream is(path, std::ios::binary);
  if (!is) {
    return std::unexpected(error{error_code::io_failed, "cannot open " + location, "storage.local"});
  }
  std::vector<std::uint8_t> bytes((std::istreambuf_iterator<char>(is)), std::istreambuf_iterator<char>());
  if (is.bad()) {
    return std::unexpected(error{error_code::io_failed, "read failed for " + location, "storage.local"});
  }
  return bytes;
}

auto LocalBackend::put(const std::string& location, std::span<const std::uint8_t> bytes)
    -> std::expected<void, core::error> {
  using core::error; using core::error_code;
  static std::atomic<std::uint64_t> seq{0};
  const auto path = local_path(location);
  std::error_code ec;
  if (path.has_parent_path()) {
    fs::create_directories(path.parent_path(), ec);
    if (ec) {
      return std::unexpected(error{error_code::io_failed,
          "cannot create " + path.parent_path().string() + ": " + ec.message(), "storage.local"});
    }
  }
  auto tmp = path;
  tmp += ".tmp." + std::to_string(seq.fetch_add(1));
  {
    std::ofstream os(tmp, std::ios::binary | std::ios::trunc);
    if (!os) {
      return std::unexpected(error{error_code::io_failed, "cannot open " + tmp.string() + " for writing", "storage.local"});
    }
    os.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    os.flush();
    if (!os) {
      fs::remove(tmp, ec);
      return std::unexpected(error{error_code::io_failed, "write failed for " + tmp.string(), "storage.local"});
    }
  }
  fs::rename(tmp, path, ec);
  if (ec) {
    std::error_code ignore;
    fs::remove(tmp, ignore);
    return std::unexpected(error{error_code::io_failed, "rename to " + location + " failed: " + ec.message(), "storage.local"});
  }
  return {};
}

auto LocalBackend::list(const std::string& prefix, const std::string& pattern)
    -> std::expected<std::vector<std::string>, core::error> {
  using core::error; using core::error_code;
  const auto dir = local_path(prefix);
  std::error_code ec;
  if (!fs::is_directory(dir, ec)) {
    return std::unexpected(error{error_code::not_found, "no such directory: " + prefix, "storage.local"});
  }
  std::vector<std::string> names;
  for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
    if (!it->is_regular_file(ec)) continue;
    auto name = it->path().filename().string();
    if (glob_match(pattern, name)) names.push_back(std::move(name));
  }
  if (ec) {
    return std::unexpected(error{error_code::io_failed, "cannot list " + prefix + ": " + ec.message(), "storage.local"});
  }
  std::sort(names.begin(), names.end());
  std::vector<std::string> out;
  out.reserve(names.size());
  for (const auto& n : names) out.push_back(join_location(prefix, n));
  return out;
}

auto register_backend(std::string scheme, BackendFactory factory) -> void {
  auto& r = registry();
  std::unique_lock lock(r.mutex);
  r.factories[std::move(scheme)] = std::move(factory);
}

auto open_backend(std::string_view location) -> std::expected<std::shared_ptr<StorageBackend>, core::error> {
  const auto scheme = split_location(location).scheme;
  if (scheme.empty() || scheme == "file") {
    static const auto local = std::make_shared<LocalBackend>();
    return local;
  }
  auto& r = registry();
  std::shared_lock lock(r.mutex);
  auto it = r.factories.find(std::string(scheme));
  if (it == r.factories.end()) {
    return std::unexpected(core::error{core::error_code::unsupported,
        "no storage backend registered for scheme '" + std::string(scheme) + "'", "storage.registry"});
  }
  return it->second();
}

} // namespace bloomdb::storage
