#include "epoll.hh"

#include <sys/epoll.h>

#include "int.hh"

namespace portal::epoll {

namespace {

struct State {
  static constexpr int kMaxEvents = 16;

  FD fd;
  int listeners = 0;

  // Events fetched by the current `Loop` iteration. Entries of removed
  // Listeners are cleared so that they are skipped.
  epoll_event pending[kMaxEvents];
  int pending_count = 0;

  void Forget(Listener *l) {
    for (int i = 0; i < pending_count; ++i) {
      if (pending[i].data.ptr == l) {
        pending[i].data.ptr = nullptr;
      }
    }
  }
};

thread_local State state;

epoll_event EventFor(Listener *l) {
  epoll_event ev = {.events = 0, .data = {.ptr = l}};
  if (l->notify_read) {
    ev.events |= EPOLLIN;
  }
  if (l->notify_write) {
    ev.events |= EPOLLOUT;
  }
  return ev;
}

void Control(int op, const char *op_name, Listener *l, Status &status) {
  if (!state.fd.Valid()) {
    AppendErrorMessage(status) += "epoll::Init() was not called";
    return;
  }
  epoll_event ev = EventFor(l);
  if (epoll_ctl(state.fd, op, l->fd, op == EPOLL_CTL_DEL ? nullptr : &ev) ==
      -1) {
    AppendErrorMessage(status) += Str(op_name) + " of " + l->Name();
  }
}

void Dispatch(int i, Status &status) {
  Listener *l = (Listener *)state.pending[i].data.ptr;
  U32 events = state.pending[i].events;
  if (events & (EPOLLIN | EPOLLHUP | EPOLLERR)) {
    l->NotifyRead(status);
    if (!OK(status)) {
      if (state.pending[i].data.ptr != nullptr) {
        AppendErrorMessage(status) += l->Name();
      }
      return;
    }
    // Removed by its own callback.
    if (state.pending[i].data.ptr == nullptr) {
      return;
    }
  }
  if (events & EPOLLOUT) {
    l->NotifyWrite(status);
    if (!OK(status) && state.pending[i].data.ptr != nullptr) {
      AppendErrorMessage(status) += l->Name();
    }
  }
}

} // namespace

void Init(Status &status) {
  state.fd = epoll_create1(EPOLL_CLOEXEC);
  if (!state.fd.Valid()) {
    AppendErrorMessage(status) += "epoll_create1";
  }
}

void Add(Listener *l, Status &status) {
  Control(EPOLL_CTL_ADD, "EPOLL_CTL_ADD", l, status);
  RETURN_ON_ERROR(status);
  ++state.listeners;
}

void Mod(Listener *l, Status &status) {
  Control(EPOLL_CTL_MOD, "EPOLL_CTL_MOD", l, status);
}

void Del(Listener *l, Status &status) {
  if (!state.fd.Valid()) {
    return;
  }
  state.Forget(l);
  Control(EPOLL_CTL_DEL, "EPOLL_CTL_DEL", l, status);
  RETURN_ON_ERROR(status);
  --state.listeners;
}

int Count() { return state.listeners; }

void Loop(Status &status) {
  while (state.listeners > 0) {
    state.pending_count =
        epoll_wait(state.fd, state.pending, State::kMaxEvents, -1);
    if (state.pending_count == -1) {
      state.pending_count = 0;
      if (errno == EINTR) {
        errno = 0;
        continue;
      }
      AppendErrorMessage(status) += "epoll_wait";
      return;
    }
    for (int i = 0; i < state.pending_count; ++i) {
      if (state.pending[i].data.ptr == nullptr) {
        continue;
      }
      Dispatch(i, status);
      if (!OK(status)) {
        state.pending_count = 0;
        return;
      }
    }
    state.pending_count = 0;
  }
}

} // namespace portal::epoll
