#include "../include/namedlock.hpp"

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

#include <cerrno>
#include <system_error>

#include "sky/compositelogger.hpp"

std::mutex NamedLock::registryMutex_;
std::map<std::string, std::unique_ptr<NamedLock>> NamedLock::registry_;
std::filesystem::path NamedLock::lockDirectory_;

NamedLock::NamedLock(std::string name) : name_(std::move(name)) {}

NamedLock::~NamedLock() {
  if (fd_ != -1) close(fd_);
}

NamedLock &NamedLock::get(const std::string &name) {
  std::lock_guard lock(registryMutex_);
  auto it = registry_.find(name);
  if (it == registry_.end()) {
    it = registry_.emplace(name, std::unique_ptr<NamedLock>(new NamedLock(name)))
             .first;
  }
  return *it->second;
}

void NamedLock::setLockDirectory(const std::filesystem::path &dir) {
  std::lock_guard lock(registryMutex_);
  lockDirectory_ = dir;
}

void NamedLock::lock() {
  mutex_.lock();
  if (++depth_ > 1) return;

  std::filesystem::path dir;
  {
    std::lock_guard lock(registryMutex_);
    dir = lockDirectory_;
  }
  if (dir.empty()) return;

  const auto path = dir / ("." + name_ + ".lock");
  fd_ = ::open(path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
  if (fd_ == -1) {
    sky::CompositeLogger::instance().warning(
        "NamedLock: cannot open " + path.string() + ": " +
        std::error_code(errno, std::system_category()).message() +
        ", falling back to in-process lock");
    return;
  }
  while (flock(fd_, LOCK_EX) == -1) {
    if (errno == EINTR) continue;
    int err = errno;
    close(fd_);
    fd_ = -1;
    --depth_;
    mutex_.unlock();
    throw std::system_error(err, std::system_category(),
                            "flock failed on " + path.string());
  }
}

void NamedLock::unlock() {
  if (--depth_ == 0 && fd_ != -1) {
    flock(fd_, LOCK_UN);
    close(fd_);
    fd_ = -1;
  }
  mutex_.unlock();
}
