#pragma once

#include <string>
#include <vector>

namespace treegraftUtils {

// Whole file as a string; ".gz" and ".xz" files are decompressed on the fly.
// Throws std::runtime_error when the file cannot be opened or decoded.
std::string readTextFile(const std::string &path);

void writeTextFile(const std::string &path, const std::string &contents);

// "dir/Amorphea.PHY" -> "Amorphea", also dropping a compression suffix
std::string fileStem(const std::string &path);

// Throws std::runtime_error naming the first two paths that share a fileStem.
// Outputs are named by stem, so such inputs would overwrite each other.
void requireDistinctStems(const std::vector<std::string> &paths);

// path with its extension replaced ("X.phy" -> "X.mrca")
std::string replaceExtension(const std::string &path, const std::string &extension);

// path resolved against baseDir unless absolute
std::string resolvePath(const std::string &baseDir, const std::string &path);

bool fileExists(const std::string &path);

// Create dir (and parents) if missing
void ensureDirectory(const std::string &dir);

} // namespace treegraftUtils
