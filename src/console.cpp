// -----------------------------------------------------------------------------
// console.cpp - `!command` interpreter
//
// API & reply formats: see include/mycorrhiza/console.hpp
// Tests: tests/test_console.cpp
//
// Notes for maintainers:
// - Reply keys are upper case and stable; host tools grep for them.
// - New command: add the enum value, the name in console_command(), the
//   branch in execute().
// -----------------------------------------------------------------------------
#include "mycorrhiza/console.hpp"

#include <cctype>

namespace mycorrhiza {

namespace {

// Trim leading and trailing ASCII whitespace.
std::string trim(const std::string& s) {
  size_t b = 0, e = s.size();
  while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
  while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
  return s.substr(b, e - b);
}

// Split "word rest of line" at the first run of whitespace.
void split_first(const std::string& s, std::string& word, std::string& rest) {
  size_t i = 0;
  while (i < s.size() && !std::isspace(static_cast<unsigned char>(s[i]))) ++i;
  word = s.substr(0, i);
  rest = trim(s.substr(i));
}

std::string hex(const Address& a)     { return to_hex(a).c_str(); }
std::string hex(const TransferId& t)  { return to_hex(t).c_str(); }

} // namespace

ConsoleCommand console_command(const std::string& word) {
  if (word == "!info")      return ConsoleCommand::Info;
  if (word == "!announce")  return ConsoleCommand::Announce;
  if (word == "!send")      return ConsoleCommand::Send;
  if (word == "!broadcast") return ConsoleCommand::Broadcast;
  if (word == "!peers")     return ConsoleCommand::Peers;
  if (word == "!routes")    return ConsoleCommand::Routes;
  if (word == "!transfers") return ConsoleCommand::Transfers;
  return ConsoleCommand::Unknown;
}

bool Console::execute(const std::string& raw, std::vector<std::string>& replies) {
  const std::string line = trim(raw);
  if (line.empty() || line[0] != '!') return false;

  std::string word, rest;
  split_first(line, word, rest);

  switch (console_command(word)) {
    case ConsoleCommand::Info:
      info(replies);
      break;
    case ConsoleCommand::Announce:
      replies.push_back("INFO:Sending announce...");
      replies.push_back("ANNOUNCED:" + std::to_string(node_.announce()));
      break;
    case ConsoleCommand::Send:
      send(rest, replies);
      break;
    case ConsoleCommand::Broadcast:
      broadcast(rest, replies);
      break;
    case ConsoleCommand::Peers:
      peers(replies);
      break;
    case ConsoleCommand::Routes:
      routes(replies);
      break;
    case ConsoleCommand::Transfers:
      transfers(replies);
      break;
    case ConsoleCommand::Unknown:
      replies.push_back("ERROR:Unknown command: " + line);
      replies.push_back("ERROR:Try: !info, !announce, !send, !broadcast, !peers, !routes, !transfers");
      break;
  }
  return true;
}

bool Console::render_event(const Event& ev, std::string& out) {
  switch (ev.kind) {
    case EventKind::DataDelivered:
      out = "MSG:" + (ev.peer_known ? hex(ev.peer) : std::string("unknown")) + ":" +
            std::string(ev.data.begin(), ev.data.end());
      return true;
    case EventKind::PeerDiscovered:
      out = "PEER:" + hex(ev.peer);
      return true;
    case EventKind::TransferFailed:
      out = "TRANSFER_FAILED:" + hex(ev.transfer_id) + ":" + to_string(ev.error) + ":" +
            std::to_string(ev.received) + "/" + std::to_string(ev.expected);
      return true;
    case EventKind::DeliveryFailed:
      out = "ERROR:No route: " + hex(ev.peer);
      return true;
    case EventKind::TransferProgress:
    case EventKind::TransferComplete:
      return false;                                  // file bridge frames carry these
  }
  return false;
}

// ---------- commands ----------

void Console::info(std::vector<std::string>& replies) const {
  const Counters& c = node_.counters();
  uint32_t drops = 0;
  for (uint32_t d : c.drops) drops += d;

  replies.push_back("NODE:" + hex(node_.address()));
  replies.push_back("ROUTES:" + std::to_string(node_.routes().size()));
  replies.push_back("PEERS:" + std::to_string(node_.identities().size()));
  replies.push_back("TX:" + std::to_string(c.tx) + " RX:" + std::to_string(c.rx));
  replies.push_back("DROPS:" + std::to_string(drops));
}

void Console::send(const std::string& args, std::vector<std::string>& replies) {
  std::string addr_text, message;
  split_first(args, addr_text, message);
  if (addr_text.empty() || message.empty()) {
    replies.push_back("ERROR:Usage: !send <address> <message>");
    return;
  }

  Address dest;
  if (!parse_hex(addr_text.c_str(), dest)) {
    replies.push_back("ERROR:Invalid address: " + addr_text);
    return;
  }

  const SendResult r = node_.send_data(dest, reinterpret_cast<const uint8_t*>(message.data()),
                                       message.size());
  const std::string shown = short_hex(dest).c_str();
  switch (r) {
    case SendResult::Sent:      replies.push_back("SENT:" + shown);    break;
    case SendResult::Broadcast: replies.push_back("FLOODED:" + shown); break;
    case SendResult::Failed:    replies.push_back("ERROR:Send failed: " + shown); break;
  }
}

void Console::broadcast(const std::string& text, std::vector<std::string>& replies) {
  if (text.empty()) {
    replies.push_back("ERROR:Usage: !broadcast <message>");
    return;
  }
  if (node_.identities().size() == 0) {
    replies.push_back("ERROR:No peers discovered yet");
    return;
  }

  std::vector<Address> targets;
  node_.identities().for_each([&](const Address& a, const IdentityEntry&) { targets.push_back(a); });

  size_t count = 0;
  for (const Address& a : targets) {
    if (node_.send_data(a, reinterpret_cast<const uint8_t*>(text.data()), text.size()) !=
        SendResult::Failed) {
      ++count;
    } else {
      replies.push_back("ERROR:Failed to send to " + std::string(short_hex(a).c_str()));
    }
  }
  replies.push_back("BROADCAST:" + std::to_string(count) + " peers");
}

void Console::peers(std::vector<std::string>& replies) const {
  replies.push_back("PEERS:" + std::to_string(node_.identities().size()));
  node_.identities().for_each([&](const Address& a, const IdentityEntry& e) {
    replies.push_back("PEER:" + hex(a) + ":" + std::to_string(e.meta.hop_count) + ":" +
                      std::to_string(e.meta.interface_id));
  });
}

void Console::routes(std::vector<std::string>& replies) const {
  replies.push_back("ROUTES:" + std::to_string(node_.routes().size()));
  node_.routes().for_each([&](const Route& r) {
    replies.push_back("ROUTE:" + hex(r.destination) + ":" + hex(r.next_hop) + ":" +
                      std::to_string(r.interface_id) + ":" + std::to_string(r.hop_count));
  });
}

void Console::transfers(std::vector<std::string>& replies) const {
  replies.push_back("TRANSFERS:" + std::to_string(node_.transfers().active()));
  node_.transfers().for_each([&](const TransferProgress& p) {
    replies.push_back("TRANSFER:" + hex(p.id) + ":" + std::to_string(p.received) + "/" +
                      std::to_string(p.expected));
  });
}

} // namespace mycorrhiza
