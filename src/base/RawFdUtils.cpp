#include "RawFdUtils.hpp"

namespace cpa {
void RawFdUtils::writeAll(int fd, const char* buf, size_t count) {
  if (fd < 0) {
    throw std::runtime_error("Invalid file descriptor for writeAll");
  }
  if (count == 0) {
    return;
  }

  size_t bytesWritten = 0;
  do {
    ssize_t rc = ::write(fd, buf + bytesWritten, count - bytesWritten);
    if (rc < 0) {
      auto localErrno = GetErrno();
      if (localErrno == EINTR) {
        continue;
      }
      if (localErrno == EAGAIN || localErrno == EWOULDBLOCK) {
        // This is fine, just keep retrying
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
        continue;
      }
      LOG(ERROR) << "Cannot write to descriptor " << fd << ": "
                 << strerror(localErrno);
      throw std::runtime_error(string("Cannot write to descriptor: ") +
                               strerror(localErrno));
    }
    if (rc == 0) {
      throw std::runtime_error("Cannot write to descriptor: closed");
    }
    bytesWritten += rc;
  } while (bytesWritten != count);
}

bool RawFdUtils::waitForData(int fd, int timeoutMs) {
  if (fd < 0) {
    return false;
  }
  fd_set fdset;
  FD_ZERO(&fdset);
  FD_SET(fd, &fdset);
  timeval tv;
  tv.tv_sec = timeoutMs / 1000;
  tv.tv_usec = (timeoutMs % 1000) * 1000;
  VLOG(4) << "Before selecting fd " << fd;
  int rc = ::select(fd + 1, &fdset, NULL, NULL, &tv);
  if (rc < 0) {
    if (GetErrno() != EINTR) {
      LOG(WARNING) << "select() on fd " << fd
                   << " failed: " << strerror(GetErrno());
    }
    return false;
  }
  return FD_ISSET(fd, &fdset);
}

void RawFdUtils::setCloseOnExec(int fd) {
  int flags = ::fcntl(fd, F_GETFD, 0);
  if (flags != -1) {
    ::fcntl(fd, F_SETFD, flags | FD_CLOEXEC);
  }
}
}  // namespace cpa
