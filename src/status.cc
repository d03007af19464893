#include "status.hh"

#include <cerrno>
#include <cstring>

#include "format.hh"

namespace portal {

Status::Status() : errsv(0) {}

Str &Status::operator()(const std::source_location location_arg) {
  if (errsv == 0 && entry == nullptr) {
    errsv = errno;
    errno = 0;
  }
  entry.reset(new Entry{
      .next = std::move(entry), .location = location_arg, .message = {}});
  return entry->message;
}

bool Status::Ok() const { return errsv == 0 && entry == nullptr; }

StrView Status::Message() const {
  if (entry == nullptr) {
    return {};
  }
  return entry->message;
}

Str Status::ToStr() const {
  Str ret;
  for (Entry *i = entry.get(); i != nullptr; i = i->next.get()) {
    if (!ret.empty()) {
      ret += " ";
    }
    ret += i->message;
    if (!i->message.empty()) {
      ret += " ";
    }
    auto &location = i->location;
    ret += f("(%s:%d).", location.file_name(), (int)location.line());
  }
  if (errsv) {
    if (!ret.empty()) {
      ret += " ";
    }
    ret += strerror(errsv);
    ret += '.';
  }
  return ret;
}

void Status::Reset() {
  errsv = 0;
  entry.reset();
}

} // namespace portal
