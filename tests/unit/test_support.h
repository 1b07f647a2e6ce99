#pragma once
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <string>
#include <unistd.h>

namespace kyc_test {

// Fresh empty file under /tmp; the caller unlinks it.
inline std::string temp_path(const char* tag) {
  std::string tmpl = std::string("/tmp/kyc_") + tag + "_XXXXXX";
  int fd = ::mkstemp(&tmpl[0]);
  if (fd >= 0) ::close(fd);
  return tmpl;
}

inline void write_file(const std::string& path, const std::string& text) {
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  out << text;
}

inline std::string read_file(const std::string& path) {
  std::ifstream in(path, std::ios::binary);
  std::ostringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

inline bool near(double a, double b, double eps = 1e-9) {
  return a - b < eps && b - a < eps;
}

} // namespace kyc_test
