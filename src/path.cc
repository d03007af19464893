#include "path.hh"

#include <climits>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include "int.hh"

namespace portal {

Path Path::ExecutablePath() {
  static Path executable_path = []() {
    char path[PATH_MAX];
    SSize len = readlink("/proc/self/exe", path, sizeof(path));
    if (len < 0) {
      return Path();
    }
    return Path(StrView(path, len));
  }();
  return executable_path;
}

Path Path::Parent() const {
  auto slash_pos = str.rfind(kSeparator);
  if (slash_pos == StrView::npos) {
    return Path();
  } else if (slash_pos == 0) {
    return Path("/");
  } else {
    return Path(str.substr(0, slash_pos));
  }
}

Path Path::operator/(StrView rhs) const {
  Path ret(str);
  if (!ret.str.empty() && !ret.str.ends_with(kSeparator)) {
    ret.str.append(1, kSeparator);
  }
  ret.str.append(rhs);
  return ret;
}

Str Path::Name() const {
  auto slash_pos = str.rfind(kSeparator);
  if (slash_pos == StrView::npos) {
    return str;
  } else {
    return str.substr(slash_pos + 1);
  }
}

Str Path::Suffix() const {
  auto name = Name();
  auto dot_pos = name.rfind(".");
  if (dot_pos == StrView::npos || dot_pos == 0) {
    return "";
  }
  return name.substr(dot_pos);
}

bool Path::IsDirectory() const {
  struct stat st;
  return stat(str.c_str(), &st) == 0 && S_ISDIR(st.st_mode);
}

bool Path::IsRegularFile() const {
  struct stat st;
  return stat(str.c_str(), &st) == 0 && S_ISREG(st.st_mode);
}

Str Path::Read(Status& status) const {
  int f = open(str.c_str(), O_RDONLY | O_CLOEXEC);
  if (f == -1) {
    AppendErrorMessage(status) += "Failed to open " + str;
    return "";
  }
  Str ret;
  while (true) {
    char buf[4096];
    SSize n = read(f, buf, sizeof(buf));
    if (n == -1) {
      AppendErrorMessage(status) += "Failed to read " + str;
      close(f);
      return "";
    }
    if (n == 0) {
      break;
    }
    ret += StrView(buf, n);
  }
  close(f);
  return ret;
}

}  // namespace portal
