/**
 * @file console.hpp
 * @brief Text command interpreter sharing the serial stream with KISS frames.
 *
 * @details
 * PURPOSE
 * -------
 * A human (or a dumb script) on the serial port can drive the node with
 * short `!` commands and read `KEY:value` replies. The console is the glue
 * between those lines and the Node; it owns no state of its own.
 *
 * COMMANDS
 * --------
 * | line                     | replies                                         |
 * |--------------------------|-------------------------------------------------|
 * | `!info`                  | NODE, ROUTES, PEERS, `TX:n RX:n`, DROPS         |
 * | `!announce`              | `INFO:Sending announce...`, `ANNOUNCED:n`       |
 * | `!send <addr> <text>`    | `SENT:` / `FLOODED:` / `ERROR:`                 |
 * | `!broadcast <text>`      | `BROADCAST:n peers` (one send per cached peer)  |
 * | `!peers`                 | `PEERS:n` then `PEER:<addr>:<hops>:<iface>`     |
 * | `!routes`                | `ROUTES:n` then `ROUTE:<dest>:<next>:<iface>:<hops>` |
 * | `!transfers`             | `TRANSFERS:n` then `TRANSFER:<id>:<rx>/<expected>` |
 * | anything else with `!`   | `ERROR:Unknown command: <cmd>` and a hint line  |
 *
 * Lines not starting with `!` are not commands; execute() returns false.
 *
 * Node events have a text rendering too (render_event), used when a console
 * is the only client: `MSG:<sender>:<text>`, `PEER:<addr>`, and so on.
 */
#ifndef MYCORRHIZA_CONSOLE_HPP
#define MYCORRHIZA_CONSOLE_HPP

#include <string>
#include <vector>
#include "mycorrhiza/events.hpp"
#include "mycorrhiza/node.hpp"

namespace mycorrhiza {

enum class ConsoleCommand : uint8_t {
  Info,
  Announce,
  Send,
  Broadcast,
  Peers,
  Routes,
  Transfers,
  Unknown
};

/// Resolve the first word of a line ("!send") to its command.
ConsoleCommand console_command(const std::string& word);

class Console {
public:
  explicit Console(Node& node) : node_(node) {}

  /**
   * @brief Run one console line.
   * @param replies  reply lines, without terminators (appended)
   * @return false when @p line is not a `!` command (nothing appended)
   */
  bool execute(const std::string& line, std::vector<std::string>& replies);

  /// Text form of an event; false for events with no console rendering.
  static bool render_event(const Event& ev, std::string& out);

private:
  void info(std::vector<std::string>& replies) const;
  void send(const std::string& args, std::vector<std::string>& replies);
  void broadcast(const std::string& text, std::vector<std::string>& replies);
  void peers(std::vector<std::string>& replies) const;
  void routes(std::vector<std::string>& replies) const;
  void transfers(std::vector<std::string>& replies) const;

  Node& node_;
};

} // namespace mycorrhiza

#endif // MYCORRHIZA_CONSOLE_HPP
