#pragma once
#include <fcntl.h>
#include <unistd.h>

#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <string>

namespace tcplat {
// Owning file descriptor, shared by the data files and the TCP probe sockets.
class Fd {
   public:
    Fd() : fd_(-1) {}
    explicit Fd(int fd) : fd_(fd) {}
    ~Fd() {
        reset();
    }
    Fd(const Fd&) = delete;
    Fd& operator=(const Fd&) = delete;
    Fd(Fd&& o) noexcept : fd_(o.fd_) {
        o.fd_ = -1;
    }
    Fd& operator=(Fd&& o) noexcept {
        if (this != &o) {
            reset(o.fd_);
            o.fd_ = -1;
        }
        return *this;
    }

    static Fd open_append(const std::string& path) {
        return Fd(::open(path.c_str(), O_WRONLY | O_APPEND | O_CREAT | O_CLOEXEC, 0644));
    }

    // Retries short writes and EINTR; false leaves errno set by the failing write.
    bool write_all(const uint8_t* data, size_t len) const {
        while (len > 0) {
            ssize_t n = ::write(fd_, data, len);
            if (n < 0) {
                if (errno == EINTR) continue;
                return false;
            }
            data += n;
            len -= static_cast<size_t>(n);
        }
        return true;
    }

    int get() const {
        return fd_;
    }
    void reset(int fd = -1) {
        if (fd_ >= 0) ::close(fd_);
        fd_ = fd;
    }
    explicit operator bool() const {
        return fd_ >= 0;
    }

   private:
    int fd_;
};
}  // namespace tcplat
