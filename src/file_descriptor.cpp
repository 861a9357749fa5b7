#include "file_descriptor.h"
#include "errors.h"

#include <openssl/crypto.h>

#include <cerrno>
#include <cstring>
#include <vector>

#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

namespace {

std::string errno_msg(const std::string& what, const std::string& path, int err) {
    return what + " '" + path + "': " + std::strerror(err);
}

std::string parent_dir(const std::string& path) {
    auto pos = path.find_last_of('/');
    if (pos == std::string::npos) return ".";
    if (pos == 0) return "/";
    return path.substr(0, pos);
}

void write_all(int fd, const std::string& data, const std::string& path) {
    std::size_t off = 0;
    while (off < data.size()) {
        ssize_t n = ::write(fd, data.data() + off, data.size() - off);
        if (n < 0) {
            if (errno == EINTR) continue;
            throw PersistenceFailure(errno_msg("write failed", path, errno));
        }
        if (n == 0) throw PersistenceFailure("write failed '" + path + "': short write");
        off += static_cast<std::size_t>(n);
    }
}

void sync_fd(int fd, const std::string& path) {
    while (::fsync(fd) != 0) {
        if (errno == EINTR) continue;
        throw PersistenceFailure(errno_msg("fsync failed", path, errno));
    }
}

} // namespace

namespace fsutil {

void ensure_dir(const std::string& dir, unsigned mode) {
    if (dir.empty()) throw PersistenceFailure("empty directory path");

    std::string cur;
    std::size_t pos = 0;
    while (pos != std::string::npos) {
        pos = dir.find('/', pos + 1);
        cur = dir.substr(0, pos);
        if (cur.empty() || cur == "/") continue;
        if (::mkdir(cur.c_str(), static_cast<mode_t>(mode)) == 0) {
            // mkdir honours umask; set the exact mode explicitly
            if (::chmod(cur.c_str(), static_cast<mode_t>(mode)) != 0) {
                throw PersistenceFailure(errno_msg("chmod failed", cur, errno));
            }
            continue;
        }
        if (errno != EEXIST) {
            throw PersistenceFailure(errno_msg("mkdir failed", cur, errno));
        }
    }

    struct stat st{};
    if (::stat(dir.c_str(), &st) != 0 || !S_ISDIR(st.st_mode)) {
        throw PersistenceFailure("not a directory: '" + dir + "'");
    }
}

bool read_file(const std::string& path, std::string& out) {
    FileDescriptor fd(::open(path.c_str(), O_RDONLY | O_CLOEXEC));
    if (!fd) {
        if (errno == ENOENT) return false;
        throw PersistenceFailure(errno_msg("open failed", path, errno));
    }

    out.clear();
    std::vector<char> buf(4096);
    for (;;) {
        ssize_t n = ::read(fd.get(), buf.data(), buf.size());
        if (n < 0) {
            if (errno == EINTR) continue;
            throw PersistenceFailure(errno_msg("read failed", path, errno));
        }
        if (n == 0) break;
        out.append(buf.data(), static_cast<std::size_t>(n));
    }
    // the buffer may have held key material
    OPENSSL_cleanse(buf.data(), buf.size());
    return true;
}

void write_file_atomic(const std::string& path, const std::string& data, unsigned mode) {
    std::string tmpl = path + ".tmp.XXXXXX";
    std::vector<char> name(tmpl.begin(), tmpl.end());
    name.push_back('\0');

    FileDescriptor fd(::mkstemp(name.data()));
    if (!fd) throw PersistenceFailure(errno_msg("mkstemp failed", tmpl, errno));
    const std::string tmp_path(name.data());

    try {
        if (::fchmod(fd.get(), static_cast<mode_t>(mode)) != 0) {
            throw PersistenceFailure(errno_msg("fchmod failed", tmp_path, errno));
        }
        write_all(fd.get(), data, tmp_path);
        sync_fd(fd.get(), tmp_path);
        if (::close(fd.release()) != 0) {
            throw PersistenceFailure(errno_msg("close failed", tmp_path, errno));
        }
        if (::rename(tmp_path.c_str(), path.c_str()) != 0) {
            throw PersistenceFailure(errno_msg("rename failed", path, errno));
        }
    } catch (...) {
        ::unlink(tmp_path.c_str());
        throw;
    }

    const std::string dir = parent_dir(path);
    FileDescriptor dfd(::open(dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC));
    if (!dfd) throw PersistenceFailure(errno_msg("open failed", dir, errno));
    sync_fd(dfd.get(), dir);
}

bool remove_file(const std::string& path) {
    if (::unlink(path.c_str()) == 0) return true;
    if (errno == ENOENT) return false;
    throw PersistenceFailure(errno_msg("unlink failed", path, errno));
}

std::string encode_name(const std::string& name) {
    static const char hex[] = "0123456789ABCDEF";
    std::string out;
    out.reserve(name.size());
    for (unsigned char c : name) {
        if ((c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9')) {
            out.push_back(static_cast<char>(c));
        } else {
            out.push_back('%');
            out.push_back(hex[c >> 4]);
            out.push_back(hex[c & 0x0F]);
        }
    }
    return out;
}

} // namespace fsutil
