#include "io/audio_file_source.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <filesystem>

namespace fs = std::filesystem;

namespace bandprint {

namespace {

const char* const kAudioExtensions[] = {".wav", ".wave", ".mp3"};

bool is_hidden(const fs::path& path) {
  const std::string name = path.filename().string();
  return !name.empty() && name[0] == '.';
}

}  // namespace

bool is_audio_file(const std::string& path) {
  std::string ext = fs::path(path).extension().string();
  std::transform(ext.begin(), ext.end(), ext.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  for (const char* candidate : kAudioExtensions) {
    if (ext == candidate) return true;
  }
  return false;
}

std::vector<std::string> DirectoryAudioFileSource::list(const std::string& folder,
                                                        bool recursive) const {
  std::vector<std::string> files;
  std::error_code ec;
  if (!fs::is_directory(folder, ec)) {
    spdlog::warn("Not a directory: {}", folder);
    return files;
  }

  auto accept = [&files](const fs::directory_entry& entry) {
    std::error_code check;
    if (entry.is_regular_file(check) && !is_hidden(entry.path()) &&
        is_audio_file(entry.path().string())) {
      files.push_back(entry.path().lexically_normal().string());
    }
  };

  if (recursive) {
    fs::recursive_directory_iterator it(folder, fs::directory_options::skip_permission_denied, ec);
    const fs::recursive_directory_iterator end;
    while (!ec && it != end) {
      if (is_hidden(it->path())) {
        std::error_code check;
        if (it->is_directory(check)) it.disable_recursion_pending();
      } else {
        accept(*it);
      }
      it.increment(ec);
    }
  } else {
    for (fs::directory_iterator it(folder, ec), end; !ec && it != end; it.increment(ec)) {
      accept(*it);
    }
  }
  if (ec) {
    spdlog::warn("Listing {} stopped early: {}", folder, ec.message());
  }
  std::sort(files.begin(), files.end());
  return files;
}

}  // namespace bandprint
