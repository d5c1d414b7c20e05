#ifndef GLANCELAB_CORE_FS_UTILS_HPP_
#define GLANCELAB_CORE_FS_UTILS_HPP_

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <string_view>
#include <system_error>

namespace glancelab::core {

namespace detail {

inline std::filesystem::path StagingPathFor(const std::filesystem::path& target) {
  static std::atomic<std::uint64_t> sequence{0};
  const auto tick = std::chrono::steady_clock::now().time_since_epoch().count();
  std::string name = target.filename().string();
  name += ".partial.";
  name += std::to_string(tick);
  name += ".";
  name += std::to_string(sequence.fetch_add(1U, std::memory_order_relaxed));
  return target.parent_path() / name;
}

inline void DiscardQuietly(const std::filesystem::path& path) {
  std::error_code ignored;
  std::filesystem::remove(path, ignored);
}

// Moves `staged` over `target`. Some filesystems refuse to rename over an
// existing file, so a second attempt is made after removing the target.
inline bool Publish(const std::filesystem::path& staged, const std::filesystem::path& target,
                    std::string& error) {
  std::error_code ec;
  std::filesystem::rename(staged, target, ec);
  if (!ec) {
    return true;
  }
  DiscardQuietly(target);
  ec.clear();
  std::filesystem::rename(staged, target, ec);
  if (!ec) {
    return true;
  }
  DiscardQuietly(staged);
  error = "failed to publish output file '" + target.string() + "': " + ec.message();
  return false;
}

} // namespace detail

// Creates `dir` and any missing parents. Existing directories are fine.
inline bool EnsureDirectory(const std::filesystem::path& dir, std::string& error) {
  if (dir.empty()) {
    error = "output directory cannot be empty";
    return false;
  }
  std::error_code ec;
  std::filesystem::create_directories(dir, ec);
  if (ec) {
    error = "failed to create output directory '" + dir.string() + "': " + ec.message();
    return false;
  }
  return true;
}

inline bool EnsureParentDirectory(const std::filesystem::path& output_path, std::string& error) {
  if (output_path.empty()) {
    error = "output path cannot be empty";
    return false;
  }
  const std::filesystem::path parent = output_path.parent_path();
  return parent.empty() || EnsureDirectory(parent, error);
}

inline bool ReadTextFile(const std::filesystem::path& input_path, std::string& contents,
                         std::string& error) {
  std::ifstream input(input_path, std::ios::binary);
  if (!input) {
    error = "unable to open file: " + input_path.string();
    return false;
  }
  contents.assign(std::istreambuf_iterator<char>(input), std::istreambuf_iterator<char>());
  if (input.bad()) {
    error = "failed while reading file: " + input_path.string();
    return false;
  }
  return true;
}

// Readers of `output_path` see either the previous file or the complete new
// one. A failed write leaves no staging file behind.
inline bool WriteTextFileAtomic(const std::filesystem::path& output_path, std::string_view text,
                                std::string& error) {
  if (!EnsureParentDirectory(output_path, error)) {
    return false;
  }

  const std::filesystem::path staged = detail::StagingPathFor(output_path);
  bool written = false;
  {
    std::ofstream out(staged, std::ios::binary | std::ios::trunc);
    if (!out) {
      error = "failed to open temp output file '" + staged.string() + "'";
      return false;
    }
    out.write(text.data(), static_cast<std::streamsize>(text.size()));
    out.flush();
    written = static_cast<bool>(out);
  }
  if (!written) {
    detail::DiscardQuietly(staged);
    error = "failed while writing temp output file '" + staged.string() + "'";
    return false;
  }
  return detail::Publish(staged, output_path, error);
}

} // namespace glancelab::core

#endif // GLANCELAB_CORE_FS_UTILS_HPP_
