#pragma once

#include "epoll.hh"
#include "fn.hh"
#include "ip.hh"

#include <map>
#include <set>
#include <string>
#include <string_view>
#include <unordered_map>

namespace http {

using portal::Str;
using portal::StrView;

// Header names compare without regard to ASCII case.
struct HeaderNameHash {
  size_t operator()(StrView name) const;
};

struct HeaderNameEqual {
  bool operator()(StrView a, StrView b) const;
};

// Request parses the head & body of a single HTTP request.
struct Request {
  // Request method, for example "GET" or "POST".
  StrView method;

  // HTTP path, without the query string.
  //
  // For a request that looks like:
  //  http://www.example.com/questions/3456/my-document?page=10
  // The path will be:
  //  /questions/3456/my-document
  //
  // See: https://en.wikipedia.org/wiki/URL
  StrView path;

  // Mapping of all request headers & their values.
  //
  // Names are looked up case-insensitively. Values are kept verbatim.
  std::unordered_map<StrView, StrView, HeaderNameHash, HeaderNameEqual>
      headers;

  // Decoded URL query parameters, followed by the fields of a
  // "application/x-www-form-urlencoded" body. Body fields override query
  // parameters with the same name.
  std::map<Str, Str> params;

  StrView body;

  // Parses `head` (everything up to & including "\r\n\r\n"). `head` & `body`
  // must outlive the Request.
  Request(StrView head, StrView body);

  // Convenient access to the `headers` map. Returns "" for missing headers.
  StrView operator[](StrView key) const;
};

// Decodes "%XX" escapes & '+' (as space). Malformed escapes are kept
// verbatim.
Str URLDecode(StrView);

// Parses "a=1&b=2" into `out`. Keys without '=' get an empty value.
void ParseForm(StrView, std::map<Str, Str> &out);

// Wrapper around the HTTP response buffer. Provides methods for easy
// construction of HTTP responses.
struct Response {

  // Reference to the outgoing network buffer for this connection. It may
  // actually contain other (not yet sent) respones before this one - so be
  // careful not to overwrite them!
  Str &buffer;

  // Flag recording whether the status line for this response has already been
  // written. It's set by the `WriteStatus` function.
  bool status_written = false;

  Response(Str &response_buffer);

  // Writes the HTTP status code to the response buffer.
  //
  // Status codes look like "200 OK" or "404 Not Found".
  //
  // See: https://datatracker.ietf.org/doc/html/rfc7231#section-6.1
  void WriteStatus(StrView status);

  // Appends arbitrary header to the HTTP response.
  void WriteHeader(StrView key, StrView value);

  // Writes the HTTP response data. This function should be called exactly once
  // for each Response instance.
  void Write(StrView data);
};

struct Server;

// Connection stores all of the data related to a single network
// connection.
struct Connection : portal::epoll::Listener {
  // Pointer to the Server instance that this Connection belongs to.
  Server *server;

  // Flag indicating whether this Connection is closed or not.
  bool closed = false;

  // Flag indicating that when all of the data is written, this connection
  // should be closed.
  bool closing = false;

  // Flag indicating whether kernel write buffer is full or not.
  bool write_buffer_full = false;

  // Set when the handler deferred its response. Further requests on this
  // connection wait in `request_buffer` until `Respond` is called.
  bool awaiting_response = false;

  // Whether this Connection is listening to write availability notifications
  // from epoll.
  bool listening_to_write_availability = false;

  // Buffer used to store data received from this Connection.
  Str request_buffer;

  // Buffer used to store data to be sent over this Connection.
  Str response_buffer;

  // Description of the last error.
  portal::Status status;

  // Textual representation of the remote IP address of this Connection.
  Str addr;

  // Marks the response to the current request as deferred. The caller must
  // eventually call `Respond` (or the connection must close).
  void Defer();

  // Sends a complete response to the current request & resumes processing of
  // queued requests.
  void Respond(StrView status, StrView content_type, StrView body);

  // Close after the buffered data has been sent.
  void Close();

  // Close the TCP connection immediately.
  void CloseTCP();

  void NotifyRead(portal::Status &) override;
  void NotifyWrite(portal::Status &) override;
  const char *Name() const override;
};

// Server stores the data related to a single HTTP server.
//
// In order to accept new connections, receive & send data, epoll::Loop() must
// be called.
struct Server : portal::epoll::Listener {
  // Handler called whenever a HTTP request is made. It can either fill the
  // Response immediately or call `Connection::Defer` & respond later.
  portal::Fn<void(Connection &, Request &, Response &)> handler;

  // Called before a Connection is destroyed.
  portal::Fn<void(Connection &)> on_close;

  std::set<Connection *> connections;

  // Requests with a larger head or body are rejected.
  size_t max_request_size = 64 * 1024;

  ~Server();

  // Start listening on a given address.
  //
  // To actually accept new connections, make sure to run the epoll loop after
  // listening.
  void Listen(portal::Endpoint, portal::Status &);

  // Stop listening & close all open connections.
  void StopListening();

  // Accepts new connection whenever they arrive.
  void NotifyRead(portal::Status &) override;

  const char *Name() const override;
};

} // namespace http
