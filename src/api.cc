#include "api.hh"

#include "format.hh"
#include "json.hh"
#include "log.hh"
#include "variant.hh"

using namespace portal;

namespace api {

static constexpr StrView kJSON = "application/json";
static constexpr StrView kText = "text/plain; charset=utf-8";

StrView ContentTypeFor(StrView suffix) {
  if (suffix == ".html" || suffix == ".htm")
    return "text/html; charset=utf-8";
  if (suffix == ".js")
    return "text/javascript; charset=utf-8";
  if (suffix == ".css")
    return "text/css; charset=utf-8";
  if (suffix == ".json")
    return kJSON;
  if (suffix == ".svg")
    return "image/svg+xml";
  if (suffix == ".png")
    return "image/png";
  if (suffix == ".ico")
    return "image/x-icon";
  if (suffix == ".woff2")
    return "font/woff2";
  return "application/octet-stream";
}

Optional<Path> ResolveStatic(const Path &root, StrView request_path) {
  if (request_path.find("..") != StrView::npos) {
    return std::nullopt;
  }
  while (request_path.starts_with("/")) {
    request_path.remove_prefix(1);
  }
  if (request_path.empty()) {
    request_path = "index.html";
  }
  return root / request_path;
}

static void Write(http::Response &response, StrView status,
                  StrView content_type, StrView body) {
  response.WriteStatus(status);
  response.WriteHeader("Content-Type", content_type);
  response.WriteHeader("Cache-Control", "no-store");
  response.Write(body);
}

PortalAPI::PortalAPI(const Config &config, Sink<Command> &commands)
    : config(config), commands(commands), responses("Responses") {
  server.handler = [this](http::Connection &c, http::Request &request,
                          http::Response &response) {
    HandleRequest(c, request, response);
  };
  server.on_close = [this](http::Connection &c) {
    std::erase_if(pending,
                  [&](const auto &entry) { return entry.second.connection == &c; });
  };
  responses.handler = [this](Response response) {
    Deliver(std::move(response));
  };
}

PortalAPI::~PortalAPI() { Stop(); }

void PortalAPI::Start(Status &status) {
  responses.Open(status);
  RETURN_ON_ERROR(status);
  server.Listen(config.listening, status);
  if (!OK(status)) {
    responses.Close();
    return;
  }
  LOG << "HTTP server listening on " << config.listening;
}

void PortalAPI::Stop() {
  server.StopListening();
  responses.Close();
}

template <typename T, typename MakeCommand>
void PortalAPI::Await(http::Connection &c, http::Response &response,
                      MakeCommand make_command) {
  static_assert(is_variant_member<T, Response>::value);
  Ticket ticket = next_ticket++;
  if (!commands.Send(make_command(ticket))) {
    Write(response, "503 Service Unavailable", kText, "Shutting down");
    return;
  }
  pending[ticket] = Pending{
      .connection = &c,
      .matches = [](const Response &r) { return std::holds_alternative<T>(r); },
  };
  c.Defer();
}

void PortalAPI::Enqueue(http::Response &response, Command command) {
  if (!commands.Send(std::move(command))) {
    Write(response, "503 Service Unavailable", kText, "Shutting down");
    return;
  }
  Write(response, "200 OK", kText, "");
}

void PortalAPI::HandleRequest(http::Connection &c, http::Request &request,
                              http::Response &response) {
  StrView path = request.path;
  if (path == "/networks") {
    Await<response::Networks>(c, response, [](Ticket ticket) {
      return command::Activate{.ticket = ticket};
    });
  } else if (path == "/current") {
    Await<response::Current>(c, response, [](Ticket ticket) {
      return command::Current{.ticket = ticket};
    });
  } else if (path == "/has_connection") {
    Await<response::HasConnection>(c, response, [](Ticket ticket) {
      return command::HasConnection{.ticket = ticket};
    });
  } else if (path == "/enable_ap") {
    Enqueue(response, command::EnableAp{});
  } else if (path == "/disable_ap") {
    Enqueue(response, command::DisableAp{});
  } else if (path == "/restart_ap") {
    if (!commands.Send(command::DisableAp{})) {
      Write(response, "503 Service Unavailable", kText, "Shutting down");
      return;
    }
    Enqueue(response, command::EnableAp{});
  } else if (path == "/connect") {
    if (request.method != "POST") {
      response.WriteStatus("405 Method Not Allowed");
      response.WriteHeader("Allow", "POST");
      response.Write("");
      return;
    }
    command::Connect connect;
    for (auto [name, field] : {std::pair{"ssid", &connect.ssid},
                               std::pair{"identity", &connect.identity},
                               std::pair{"passphrase", &connect.passphrase}}) {
      auto it = request.params.find(name);
      if (it == request.params.end()) {
        Write(response, "500 Internal Server Error", kText,
              f("'%s' not found in request params", name));
        return;
      }
      *field = it->second;
    }
    LOG << "Connect request for \"" << connect.ssid << "\" from " << c.addr;
    Enqueue(response, std::move(connect));
  } else {
    ServeStatic(request, response);
  }
}

void PortalAPI::ServeStatic(http::Request &request, http::Response &response) {
  auto file = ResolveStatic(config.ui_directory, request.path);
  if (!file) {
    Write(response, "400 Bad Request", kText, "Invalid path");
    return;
  }
  if (request.method != "GET" || !file->IsRegularFile()) {
    // Captive portal detection probes (& everything else) land on the UI.
    response.WriteStatus("302 Found");
    response.WriteHeader("Location", "http://" + ToStr(config.gateway) + "/");
    response.Write("");
    return;
  }
  Status status;
  Str contents = file->Read(status);
  if (!OK(status)) {
    ERROR << "Couldn't serve " << file->str << ": " << status;
    Write(response, "500 Internal Server Error", kText, "Couldn't read file");
    return;
  }
  response.WriteStatus("200 OK");
  response.WriteHeader("Content-Type", ContentTypeFor(file->Suffix()));
  response.Write(contents);
}

static Str Body(const Response &response) {
  return std::visit(
      overloaded{
          [](const response::Networks &r) { return NetworksJSON(r.networks); },
          [](const response::Current &r) {
            return CurrentJSON(r.apmode, r.connected);
          },
          [](const response::HasConnection &r) { return ResultJSON(r.result); },
      },
      response);
}

void PortalAPI::Deliver(Response response) {
  Ticket ticket = TicketOf(response);
  auto it = pending.find(ticket);
  if (it == pending.end()) {
    WARNING << "Dropping response for request #" << ticket
            << " - the client is gone";
    return;
  }
  Pending waiting = it->second;
  pending.erase(it);
  if (!waiting.matches(response)) {
    waiting.connection->Respond("500 Internal Server Error", kText,
                                "Incorrect command");
    return;
  }
  waiting.connection->Respond("200 OK", kJSON, Body(response));
}

void PortalAPI::FailPending(const ExitResult &result) {
  auto waiting = std::move(pending);
  pending.clear();
  for (auto &[ticket, entry] : waiting) {
    if (result.Ok()) {
      entry.connection->Respond("503 Service Unavailable", kText,
                                "Shutting down");
    } else {
      entry.connection->Respond("500 Internal Server Error", kText,
                                Describe(result.kind));
    }
  }
}

} // namespace api
