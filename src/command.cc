#include "command.hh"

namespace portal {

StrView CommandName(const Command &command) {
  return std::visit(
      overloaded{
          [](const command::EnableAp &) { return "EnableAp"sv; },
          [](const command::DisableAp &) { return "DisableAp"sv; },
          [](const command::Current &) { return "Current"sv; },
          [](const command::HasConnection &) { return "HasConnection"sv; },
          [](const command::Activate &) { return "Activate"sv; },
          [](const command::Connect &) { return "Connect"sv; },
          [](const command::Timeout &) { return "Timeout"sv; },
          [](const command::Exit &) { return "Exit"sv; },
      },
      command);
}

Ticket TicketOf(const Response &response) {
  return std::visit([](const auto &r) { return r.ticket; }, response);
}

} // namespace portal
