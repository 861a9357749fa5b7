// include/file_descriptor.h
#pragma once
#include <string>
#include <unistd.h>

// Owning POSIX descriptor; closes on destruction.
class FileDescriptor {
public:
    explicit FileDescriptor(int fd = -1) : fd_(fd) {}
    ~FileDescriptor() { reset(); }

    FileDescriptor(const FileDescriptor&) = delete;
    FileDescriptor& operator=(const FileDescriptor&) = delete;

    FileDescriptor(FileDescriptor&& other) noexcept : fd_(other.fd_) { other.fd_ = -1; }
    FileDescriptor& operator=(FileDescriptor&& other) noexcept {
        if (this != &other) {
            reset();
            fd_ = other.fd_;
            other.fd_ = -1;
        }
        return *this;
    }

    int get() const noexcept { return fd_; }
    bool valid() const noexcept { return fd_ >= 0; }
    explicit operator bool() const noexcept { return valid(); }

    int release() noexcept {
        int tmp = fd_;
        fd_ = -1;
        return tmp;
    }

    void reset(int fd = -1) noexcept {
        if (fd_ >= 0) ::close(fd_);
        fd_ = fd;
    }

private:
    int fd_;
};

// Small POSIX helpers shared by the on-disk stores. All throw PersistenceFailure.
namespace fsutil {

// mkdir -p with the given mode on every created component.
void ensure_dir(const std::string& dir, unsigned mode);

// Reads the whole file. Returns false if it does not exist.
bool read_file(const std::string& path, std::string& out);

// Writes data to a temp file next to path, fsyncs it, renames it over path
// and fsyncs the directory.
void write_file_atomic(const std::string& path, const std::string& data, unsigned mode);

// Removes path. Returns false if it did not exist.
bool remove_file(const std::string& path);

// Percent-encodes everything outside [A-Za-z0-9] so a principal is a safe file name.
std::string encode_name(const std::string& name);

} // namespace fsutil
