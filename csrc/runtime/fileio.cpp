#include "fileio.hpp"
#include "../common.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace farstore {

static std::string os_error(const std::string& what, const std::string& path, int err) {
  return what + " " + path + ": " + std::strerror(err);
}

std::string with_far_extension(const std::string& path) {
  const std::string ext(kArchiveExtension);
  if (path.size() >= ext.size() && path.compare(path.size() - ext.size(), ext.size(), ext) == 0) return path;
  return path + ext;
}

std::vector<uint8_t> slurp(const std::string& path) {
  std::ifstream f(path, std::ios::binary);
  if (!f) FARSTORE_THROW(Io, os_error("cannot open file", path, errno));
  f.seekg(0, std::ios::end);
  size_t n = (size_t)f.tellg();
  f.seekg(0, std::ios::beg);
  std::vector<uint8_t> buf(n);
  if (n) f.read(reinterpret_cast<char*>(buf.data()), (std::streamsize)n);
  if (!f) FARSTORE_THROW(Io, "short read from " + path);
  return buf;
}

void atomic_write(const std::string& path, const std::vector<uint8_t>& bytes) {
  std::string tmpl = path + ".XXXXXX";
  std::vector<char> tmp_path(tmpl.begin(), tmpl.end());
  tmp_path.push_back('\0');

  int fd = mkstemp(tmp_path.data());
  if (fd < 0) FARSTORE_THROW(Io, os_error("cannot create temporary file for", path, errno));

  auto fail = [&](const std::string& what) {
    int err = errno;
    close(fd);
    unlink(tmp_path.data());  // never leave a partial archive behind
    FARSTORE_THROW(Io, os_error(what, path, err));
  };

  size_t written = 0;
  while (written < bytes.size()) {
    ssize_t n = write(fd, bytes.data() + written, bytes.size() - written);
    if (n < 0) {
      if (errno == EINTR) continue;
      fail("write failed for");
    }
    written += static_cast<size_t>(n);
  }
  // mkstemp creates 0600; archives get the usual umask-governed mode
  mode_t mask = umask(0);
  umask(mask);
  if (fchmod(fd, 0666 & ~mask) != 0) fail("chmod failed for");
  if (fsync(fd) != 0) fail("fsync failed for");
  if (close(fd) != 0) {
    int err = errno;
    unlink(tmp_path.data());
    FARSTORE_THROW(Io, os_error("close failed for", path, err));
  }
  if (std::rename(tmp_path.data(), path.c_str()) != 0) {
    int err = errno;
    unlink(tmp_path.data());
    FARSTORE_THROW(Io, os_error("cannot replace", path, err));
  }
}

} // namespace farstore
