#include "http.hh"

#include <arpa/inet.h>
#include <charconv>
#include <cstring>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/socket.h>
#include <unistd.h>

#include "log.hh"
#include "status.hh"

using namespace portal;

namespace http {

static const char *kRequestHeaderEnding = "\r\n\r\n";

static char LowerASCII(char c) {
  return (c >= 'A' && c <= 'Z') ? c - 'A' + 'a' : c;
}

size_t HeaderNameHash::operator()(StrView name) const {
  // FNV-1a over the lowercased name.
  size_t hash = 14695981039346656037ull;
  for (char c : name) {
    hash ^= (unsigned char)LowerASCII(c);
    hash *= 1099511628211ull;
  }
  return hash;
}

bool HeaderNameEqual::operator()(StrView a, StrView b) const {
  if (a.size() != b.size()) {
    return false;
  }
  for (size_t i = 0; i < a.size(); ++i) {
    if (LowerASCII(a[i]) != LowerASCII(b[i])) {
      return false;
    }
  }
  return true;
}

static int HexValue(char c) {
  if (c >= '0' && c <= '9')
    return c - '0';
  if (c >= 'a' && c <= 'f')
    return c - 'a' + 10;
  if (c >= 'A' && c <= 'F')
    return c - 'A' + 10;
  return -1;
}

Str URLDecode(StrView s) {
  Str out;
  out.reserve(s.size());
  for (size_t i = 0; i < s.size(); ++i) {
    char c = s[i];
    if (c == '+') {
      out += ' ';
    } else if (c == '%' && i + 2 < s.size()) {
      int hi = HexValue(s[i + 1]), lo = HexValue(s[i + 2]);
      if (hi < 0 || lo < 0) {
        out += c;
        continue;
      }
      out += (char)(hi * 16 + lo);
      i += 2;
    } else {
      out += c;
    }
  }
  return out;
}

void ParseForm(StrView s, std::map<Str, Str> &out) {
  while (!s.empty()) {
    size_t amp = s.find('&');
    StrView pair = s.substr(0, amp);
    s.remove_prefix(amp == StrView::npos ? s.size() : amp + 1);
    if (pair.empty()) {
      continue;
    }
    size_t eq = pair.find('=');
    if (eq == StrView::npos) {
      out[URLDecode(pair)] = "";
    } else {
      out[URLDecode(pair.substr(0, eq))] = URLDecode(pair.substr(eq + 1));
    }
  }
}

Request::Request(StrView head, StrView body) : body(body) {
  size_t line_end = head.find("\r\n");
  if (line_end == StrView::npos) {
    return;
  }
  StrView request_line = head.substr(0, line_end);
  size_t method_end = request_line.find(' ');
  if (method_end == StrView::npos) {
    return;
  }
  method = request_line.substr(0, method_end);
  StrView target = request_line.substr(method_end + 1);
  target = target.substr(0, target.find(' '));
  size_t question = target.find('?');
  path = target.substr(0, question);
  if (question != StrView::npos) {
    ParseForm(target.substr(question + 1), params);
  }

  size_t pos = line_end;
  while (true) {
    if (head.substr(pos, 4) == kRequestHeaderEnding)
      break;
    size_t key_start = pos + 2;
    if (key_start >= head.size())
      break;
    size_t key_end = head.find(':', key_start);
    if (key_end == StrView::npos)
      break;
    size_t val_start = head.find_first_not_of(' ', key_end + 1);
    if (val_start == StrView::npos)
      break;
    size_t val_end = head.find("\r\n", key_end);
    if (val_end == StrView::npos)
      break;
    if (val_start > val_end)
      val_start = val_end;
    headers[head.substr(key_start, key_end - key_start)] =
        head.substr(val_start, val_end - val_start);
    pos = val_end;
  }

  if ((*this)["Content-Type"].starts_with(
          "application/x-www-form-urlencoded")) {
    ParseForm(body, params);
  }
}

StrView Request::operator[](StrView key) const {
  auto it = headers.find(key);
  if (it == headers.end()) {
    return "";
  }
  return it->second;
}

Response::Response(Str &response_buffer) : buffer(response_buffer) {}

void Response::WriteStatus(StrView status) {
  if (status_written)
    return;
  buffer.append("HTTP/1.1 ", 9);
  buffer.append(status);
  buffer.append("\r\n", 2);
  status_written = true;
}

void Response::WriteHeader(StrView key, StrView value) {
  WriteStatus("200 OK");
  buffer.append(key);
  buffer.append(": ", 2);
  buffer.append(value);
  buffer.append("\r\n", 2);
}

void Response::Write(StrView data) {
  WriteHeader("Content-Length", std::to_string(data.size()));
  buffer.append("\r\n", 2);
  buffer.append(data);
}

// Returns the length of the body announced by the request head or -1 if the
// header is malformed.
static long ContentLength(StrView head) {
  Request request(head, {});
  StrView value = request["Content-Length"];
  if (value.empty()) {
    return 0;
  }
  long length = 0;
  auto [ptr, ec] =
      std::from_chars(value.data(), value.data() + value.size(), length);
  if (ec != std::errc() || ptr != value.data() + value.size() || length < 0) {
    return -1;
  }
  return length;
}

static void Reject(Connection &c, StrView status) {
  Response response(c.response_buffer);
  response.WriteStatus(status);
  response.WriteHeader("Connection", "close");
  response.Write("");
  c.request_buffer.clear();
  c.Close();
}

// Returns number of consumed bytes
static size_t ConsumeHttpRequest(Connection &c) {
  size_t pos = c.request_buffer.find(kRequestHeaderEnding);
  if (pos == Str::npos) {
    if (c.request_buffer.size() > c.server->max_request_size) {
      Reject(c, "431 Request Header Fields Too Large");
    }
    // We must read more data to get the full header.
    return 0;
  }
  size_t head_size = pos + strlen(kRequestHeaderEnding);
  StrView head = StrView(c.request_buffer).substr(0, head_size);
  long content_length = ContentLength(head);
  if (content_length < 0) {
    Reject(c, "400 Bad Request");
    return 0;
  }
  if ((size_t)content_length > c.server->max_request_size) {
    Reject(c, "413 Content Too Large");
    return 0;
  }
  if (c.request_buffer.size() < head_size + content_length) {
    // Body is still incomplete.
    return 0;
  }
  StrView body = StrView(c.request_buffer).substr(head_size, content_length);

  Request request(head, body);
  Response response(c.response_buffer);
  VERBOSE << c.addr << " " << request.method << " " << request.path;
  c.server->handler(c, request, response);
  return head_size + content_length;
}

static void ConsumeRequests(Connection &c) {
  while (!c.closed && !c.closing && !c.awaiting_response) {
    size_t consumed_bytes = ConsumeHttpRequest(c);
    if (consumed_bytes == 0) {
      break;
    }
    c.request_buffer.erase(0, consumed_bytes);
  }
}

static void UpdateEpoll(Connection &c) {
  bool &current = c.listening_to_write_availability;
  bool desired = !c.response_buffer.empty();
  if (current != desired) {
    c.notify_write = desired;
    epoll::Mod(&c, c.status);
    current = desired;
  }
}

static void TryWriting(Connection &c) {
  if (c.closed) {
    return;
  }
  if (c.response_buffer.empty()) {
    if (c.closing) {
      c.CloseTCP();
    }
    return;
  }
  if (c.write_buffer_full) {
    return;
  }
  ssize_t count = send(c.fd, c.response_buffer.data(), c.response_buffer.size(),
                       MSG_NOSIGNAL);
  if (count == -1) {
    if (errno == EWOULDBLOCK || errno == EAGAIN) {
      // We must wait for the data to be sent before writing more.
      errno = 0;
      c.write_buffer_full = true;
      UpdateEpoll(c);
      return;
    }
    AppendErrorMessage(c.status) += "send()";
    c.CloseTCP();
    return;
  }
  c.response_buffer.erase(0, count);
  if (c.closing && c.response_buffer.empty()) {
    c.CloseTCP();
    return;
  }
  if (!c.response_buffer.empty()) {
    // Kernel was unable to accept whole buffer - it's probably full.
    c.write_buffer_full = true;
  }
  UpdateEpoll(c);
}

static void TryReading(Connection &c) {
  char read_buffer[16 * 1024];
  ssize_t count = read(c.fd, read_buffer, sizeof(read_buffer));
  if (count == 0) { // EOF
    c.CloseTCP();
    return;
  }
  if (count == -1) {
    if (errno == EWOULDBLOCK || errno == EAGAIN) {
      // We must wait for more data to arrive to process this request.
      errno = 0;
      return;
    }
    // Connection is broken. Discard it.
    AppendErrorMessage(c.status) += "read()";
    c.CloseTCP();
    return;
  }
  c.request_buffer.append(read_buffer, count);
  ConsumeRequests(c);
  TryWriting(c);
}

// Destroys the connection if it was closed.
static void Reap(Connection &c) {
  if (!OK(c.status)) {
    VERBOSE << "Connection error: " << c.status;
  }
  if (c.closed) {
    Server *server = c.server;
    if (server->on_close) {
      server->on_close(c);
    }
    server->connections.erase(&c);
    delete &c;
  }
}

void Connection::Defer() { awaiting_response = true; }

void Connection::Respond(StrView status_line, StrView content_type,
                         StrView body) {
  if (closed) {
    return;
  }
  Response response(response_buffer);
  response.WriteStatus(status_line);
  response.WriteHeader("Content-Type", content_type);
  response.WriteHeader("Cache-Control", "no-store");
  response.Write(body);
  awaiting_response = false;
  ConsumeRequests(*this);
  TryWriting(*this);
  Reap(*this);
}

void Connection::Close() {
  closing = true;
  TryWriting(*this);
}

void Connection::CloseTCP() {
  if (closed) {
    return;
  }
  closed = true;
  Status ignored;
  epoll::Del(this, ignored);
  fd.Close();
}

void Connection::NotifyRead(Status &epoll_status) {
  TryReading(*this);
  Reap(*this);
}

void Connection::NotifyWrite(Status &epoll_status) {
  write_buffer_full = false;
  TryWriting(*this);
  Reap(*this);
}

const char *Connection::Name() const { return "Connection"; }

Server::~Server() { StopListening(); }

void Server::Listen(Endpoint endpoint, Status &status) {
  fd = socket(AF_INET, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC,
              /*protocol*/ 0);
  if (fd == -1) {
    AppendErrorMessage(status) += "socket() failed";
    return;
  }

  int opt = 1;
  if (setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt))) {
    AppendErrorMessage(status) += "setsockopt() failed";
    fd.Close();
    return;
  }

  sockaddr_in address = {.sin_family = AF_INET,
                         .sin_port = htons(endpoint.port),
                         .sin_addr = {.s_addr = endpoint.ip.addr}};
  if (int r = bind(fd, (sockaddr *)&address, sizeof(address)); r < 0) {
    AppendErrorMessage(status) += "bind(" + endpoint.ToStr() + ") failed";
    fd.Close();
    return;
  }

  if (int r = listen(fd, SOMAXCONN); r < 0) {
    AppendErrorMessage(status) += "listen() failed";
    fd.Close();
    return;
  }

  epoll::Add(this, status);
  if (!OK(status)) {
    fd.Close();
    return;
  }
}

void Server::StopListening() {
  if (fd != -1) {
    Status ignored;
    epoll::Del(this, ignored);
    shutdown(fd, SHUT_RDWR);
    fd.Close();
  }
  while (!connections.empty()) {
    Connection *c = *connections.begin();
    c->CloseTCP();
    Reap(*c);
  }
}

void Server::NotifyRead(Status &status) {
  while (true) {
    sockaddr_in addr;
    socklen_t addrlen = sizeof(addr);
    int conn_fd = accept4(fd, (struct sockaddr *)&addr, &addrlen,
                          SOCK_NONBLOCK | SOCK_CLOEXEC);
    if (conn_fd == -1) {
      if ((errno == EAGAIN) || (errno == EWOULDBLOCK)) {
        // We have processed all incoming connections.
        errno = 0;
        break;
      }
      // Clients that reset the connection before it was accepted don't stop
      // the server.
      if (errno == ECONNABORTED || errno == EMFILE || errno == ENFILE) {
        WARNING << "accept() failed: " << strerror(errno);
        errno = 0;
        break;
      }
      AppendErrorMessage(status) += "accept() failed";
      return;
    }
    int opt = 1;
    if (setsockopt(conn_fd, IPPROTO_TCP, TCP_NODELAY, &opt, sizeof(opt))) {
      AppendErrorMessage(status) += "setsockopt(TCP_NODELAY) failed";
      close(conn_fd);
      return;
    }
    Connection *conn = new Connection();
    connections.insert(conn);
    conn->server = this;
    conn->fd = conn_fd;
    char addr_str[INET_ADDRSTRLEN];
    inet_ntop(AF_INET, &(addr.sin_addr), addr_str, INET_ADDRSTRLEN);
    conn->addr = addr_str;
    epoll::Add(conn, conn->status);
    if (!OK(conn->status)) {
      ERROR << "Couldn't register connection from " << conn->addr << ": "
            << conn->status;
      connections.erase(conn);
      delete conn;
      continue;
    }
    conn->NotifyRead(status);
  }
}

const char *Server::Name() const { return "Server"; }

} // namespace http
