#include "treegraft_utils.hpp"

#include <absl/container/flat_hash_map.h>
#include <boost/filesystem.hpp>
#include <boost/iostreams/copy.hpp>
#include <boost/iostreams/filter/gzip.hpp>
#include <boost/iostreams/filter/lzma.hpp>
#include <boost/iostreams/filtering_streambuf.hpp>

#include <fstream>
#include <sstream>
#include <stdexcept>

namespace fs = boost::filesystem;

namespace treegraftUtils {

std::string readTextFile(const std::string &path) {
  std::ifstream ifs(path, std::ios::in | std::ios::binary);
  if (!ifs.is_open()) {
    throw std::runtime_error("Cannot open file: " + path);
  }

  const std::string ext = fs::path(path).extension().string();
  std::ostringstream out;
  try {
    boost::iostreams::filtering_streambuf<boost::iostreams::input> in;
    if (ext == ".gz") {
      in.push(boost::iostreams::gzip_decompressor());
    } else if (ext == ".xz") {
      in.push(boost::iostreams::lzma_decompressor());
    }
    in.push(ifs);
    boost::iostreams::copy(in, out);
  } catch (const boost::iostreams::gzip_error &e) {
    throw std::runtime_error("Cannot decompress " + path + ": " + e.what());
  } catch (const boost::iostreams::lzma_error &e) {
    throw std::runtime_error("Cannot decompress " + path + ": " + e.what());
  }
  return out.str();
}

void writeTextFile(const std::string &path, const std::string &contents) {
  std::ofstream ofs(path, std::ios::out | std::ios::binary | std::ios::trunc);
  if (!ofs.is_open()) {
    throw std::runtime_error("Cannot open file for writing: " + path);
  }
  ofs << contents;
  if (!ofs) {
    throw std::runtime_error("Failed writing to " + path);
  }
}

std::string fileStem(const std::string &path) {
  fs::path p(path);
  if (p.extension() == ".gz" || p.extension() == ".xz") {
    p = p.stem();
  }
  return p.stem().string();
}

void requireDistinctStems(const std::vector<std::string> &paths) {
  absl::flat_hash_map<std::string, const std::string *> seen;
  for (const auto &path : paths) {
    auto [it, inserted] = seen.try_emplace(fileStem(path), &path);
    if (!inserted) {
      throw std::runtime_error("inputs " + *it->second + " and " + path + " share the output name '" +
                               it->first + "'");
    }
  }
}

std::string replaceExtension(const std::string &path, const std::string &extension) {
  fs::path p(path);
  p.replace_extension(extension);
  return p.string();
}

std::string resolvePath(const std::string &baseDir, const std::string &path) {
  fs::path p(path);
  if (p.is_absolute() || baseDir.empty()) {
    return p.string();
  }
  return (fs::path(baseDir) / p).string();
}

bool fileExists(const std::string &path) {
  return fs::exists(fs::path(path));
}

void ensureDirectory(const std::string &dir) {
  if (dir.empty() || fs::exists(dir)) {
    return;
  }
  boost::system::error_code ec;
  fs::create_directories(dir, ec);
  if (ec) {
    throw std::runtime_error("Cannot create directory " + dir + ": " + ec.message());
  }
}

} // namespace treegraftUtils
