#include "steward/SignalRouter.hpp"

#include <sys/epoll.h>
#include <sys/signalfd.h>
#include <unistd.h>

#include <cerrno>
#include <stdexcept>
#include <system_error>

namespace steward {

SignalRouter& SignalRouter::instance() {
  static SignalRouter router;
  return router;
}

SignalRouter::SignalRouter() {
  sigemptyset(&blockedMask_);
  if (pthread_sigmask(SIG_SETMASK, nullptr, &originalMask_) != 0) {
    throw std::system_error(errno, std::system_category(),
                            "SignalRouter: pthread_sigmask(GET) failed");
  }
  signalFd_ = signalfd(-1, &blockedMask_, SFD_NONBLOCK | SFD_CLOEXEC);
  if (signalFd_ == -1) {
    throw std::system_error(errno, std::system_category(),
                            "SignalRouter: signalfd create failed");
  }
}

SignalRouter::~SignalRouter() {
  stop();
  if (signalFd_ != -1) close(signalFd_);
  pthread_sigmask(SIG_SETMASK, &originalMask_, nullptr);
}

void SignalRouter::registerHandler(int signum, Handler handler) {
  if (signum <= 0 || signum >= NSIG) {
    throw std::invalid_argument("SignalRouter: Invalid signal number " +
                                std::to_string(signum));
  }

  std::lock_guard lock(handlersMutex_);

  sigaddset(&blockedMask_, signum);
  if (int rc = pthread_sigmask(SIG_BLOCK, &blockedMask_, nullptr); rc != 0) {
    throw std::system_error(rc, std::system_category(),
                            "SignalRouter: pthread_sigmask(BLOCK) failed");
  }
  if (signalfd(signalFd_, &blockedMask_, 0) == -1) {
    throw std::system_error(errno, std::system_category(),
                            "SignalRouter: signalfd configure failed");
  }

  handlers_[signum].push_back(std::move(handler));
}

void SignalRouter::unregisterHandler(int signum) {
  std::lock_guard lock(handlersMutex_);
  handlers_.erase(signum);
}

void SignalRouter::start() {
  if (running_.exchange(true)) return;

  int epollFd = epoll_create1(EPOLL_CLOEXEC);
  if (epollFd == -1) {
    running_ = false;
    throw std::system_error(errno, std::system_category(),
                            "SignalRouter: epoll_create1 failed");
  }

  epoll_event ev{};
  ev.events = EPOLLIN;
  ev.data.fd = signalFd_;
  if (epoll_ctl(epollFd, EPOLL_CTL_ADD, signalFd_, &ev) == -1) {
    int err = errno;
    close(epollFd);
    running_ = false;
    throw std::system_error(err, std::system_category(),
                            "SignalRouter: epoll_ctl failed");
  }

  worker_ = std::thread([this, epollFd] { dispatchLoop(epollFd); });
}

void SignalRouter::dispatchLoop(int epollFd) {
  constexpr int kMaxEvents = 8;
  epoll_event events[kMaxEvents];

  while (running_) {
    int nfds = epoll_wait(epollFd, events, kMaxEvents, 200);
    if (nfds == -1) {
      if (errno == EINTR) continue;
      break;
    }

    for (int i = 0; i < nfds; ++i) {
      if (events[i].data.fd != signalFd_) continue;

      signalfd_siginfo info{};
      while (read(signalFd_, &info, sizeof(info)) == sizeof(info)) {
        std::vector<Handler> toCall;
        {
          std::lock_guard lock(handlersMutex_);
          if (auto it = handlers_.find(static_cast<int>(info.ssi_signo));
              it != handlers_.end()) {
            toCall = it->second;
          }
        }
        for (auto& handler : toCall) {
          handler(static_cast<int>(info.ssi_signo));
        }
      }
    }
  }

  close(epollFd);
}

void SignalRouter::stop() noexcept {
  running_ = false;
  if (worker_.joinable() && worker_.get_id() != std::this_thread::get_id()) {
    worker_.join();
  }
}

}  // namespace steward
