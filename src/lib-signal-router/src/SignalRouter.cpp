#include "sky/SignalRouter.hpp"

#include <sys/epoll.h>
#include <sys/eventfd.h>
#include <sys/signalfd.h>
#include <unistd.h>

#include <cerrno>
#include <cstdint>
#include <stdexcept>
#include <system_error>

#include "sky/compositelogger.hpp"

namespace sky {

SignalRouter::SignalRouter() {
  sigemptyset(&blocked_mask_);
  if (pthread_sigmask(SIG_SETMASK, nullptr, &original_mask_) != 0) {
    throw std::system_error(errno, std::system_category(),
                            "pthread_sigmask(GET) failed");
  }
  if ((signal_fd_ = signalfd(-1, &blocked_mask_, SFD_NONBLOCK | SFD_CLOEXEC)) ==
      -1)
    throw std::system_error(errno, std::system_category(),
                            "signalfd create failed");
}

void SignalRouter::registerHandler(int signum, Handler handler) {
  if (signum <= 0 || signum >= NSIG || signum == SIGKILL || signum == SIGSTOP) {
    throw std::invalid_argument("Invalid signal number: " + std::to_string(signum));
  }

  std::lock_guard<std::mutex> lock(handlers_mutex_);

  sigaddset(&blocked_mask_, signum);
  if (pthread_sigmask(SIG_BLOCK, &blocked_mask_, nullptr) != 0) {
    throw std::system_error(errno, std::system_category(),
                            "pthread_sigmask(BLOCK) failed");
  }

  if (signalfd(signal_fd_, &blocked_mask_, 0) == -1) {
    throw std::system_error(errno, std::system_category(),
                            "signalfd configure failed");
  }

  handlers_[signum].push_back(std::move(handler));
}

void SignalRouter::unregisterHandler(int signum) {
  std::lock_guard lock(handlers_mutex_);
  handlers_.erase(signum);
}

void SignalRouter::start() {
  std::lock_guard lifecycle(lifecycle_mutex_);
  if (running_.load()) return;

  epoll_fd_ = epoll_create1(EPOLL_CLOEXEC);
  if (epoll_fd_ == -1) {
    throw std::system_error(errno, std::system_category(),
                            "epoll_create1 failed");
  }
  wake_fd_ = eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
  if (wake_fd_ == -1) {
    int err = errno;
    close(epoll_fd_);
    epoll_fd_ = -1;
    throw std::system_error(err, std::system_category(), "eventfd failed");
  }

  struct epoll_event ev {};
  ev.events = EPOLLIN;
  ev.data.fd = signal_fd_;
  struct epoll_event wake {};
  wake.events = EPOLLIN;
  wake.data.fd = wake_fd_;
  if (epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, signal_fd_, &ev) == -1 ||
      epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, wake_fd_, &wake) == -1) {
    int err = errno;
    close(wake_fd_);
    close(epoll_fd_);
    wake_fd_ = epoll_fd_ = -1;
    throw std::system_error(err, std::system_category(), "epoll_ctl failed");
  }

  running_ = true;
  worker_thread_ = std::thread(&SignalRouter::processSignals, this);
}

void SignalRouter::processSignals() {
  constexpr int MAX_EVENTS = 4;
  struct epoll_event events[MAX_EVENTS];

  while (running_) {
    int nfds = epoll_wait(epoll_fd_, events, MAX_EVENTS, -1);
    if (nfds == -1) {
      if (errno == EINTR) continue;
      CompositeLogger::instance().error(
          "SignalRouter: epoll_wait failed: " +
          std::error_code(errno, std::system_category()).message());
      break;
    }

    for (int i = 0; i < nfds; ++i) {
      if (events[i].data.fd != signal_fd_) continue;

      struct signalfd_siginfo fdsi;
      while (read(signal_fd_, &fdsi, sizeof(fdsi)) == sizeof(fdsi)) {
        std::vector<Handler> toCall;
        {
          std::lock_guard lock(handlers_mutex_);
          if (auto it = handlers_.find(static_cast<int>(fdsi.ssi_signo));
              it != handlers_.end()) {
            toCall = it->second;
          }
        }
        // Обработчик может вызвать stop()/unregisterHandler(): вызываем без блокировки
        for (auto& handler : toCall) {
          try {
            handler(static_cast<int>(fdsi.ssi_signo));
          } catch (const std::exception& e) {
            CompositeLogger::instance().error(
                std::string("SignalRouter: handler threw: ") + e.what());
          }
        }
      }
    }
  }
}

void SignalRouter::stop() noexcept {
  std::lock_guard lifecycle(lifecycle_mutex_);
  if (!running_.exchange(false)) return;

  if (wake_fd_ != -1) {
    std::uint64_t one = 1;
    ssize_t written = write(wake_fd_, &one, sizeof(one));
    (void)written;
  }
  if (worker_thread_.joinable()) {
    if (worker_thread_.get_id() == std::this_thread::get_id()) {
      // stop() из обработчика: поток завершится сам после возврата
      worker_thread_.detach();
      return;
    }
    worker_thread_.join();
  }
  close(wake_fd_);
  close(epoll_fd_);
  wake_fd_ = epoll_fd_ = -1;
}

SignalRouter::~SignalRouter() {
  stop();
  close(signal_fd_);
  pthread_sigmask(SIG_SETMASK, &original_mask_, nullptr);
}

}  // namespace sky
