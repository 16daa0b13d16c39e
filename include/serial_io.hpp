/**
 * @file serial_io.hpp
 * @brief Open a Linux TTY in raw mode and move KISS frames and console lines over it.
 *
 * @details
 * PURPOSE
 * -------
 * A serial-attached node speaks two dialects on one byte stream: text
 * console lines (`!info` -> `NODE:...`) and KISS-framed binary file
 * commands. This header is the host's end of that stream. It pairs with
 * serial_io.cpp for the POSIX work and with mycorrhiza/kiss.hpp for framing.
 *
 * ROLE
 * ----
 * - open_serial: acquire a descriptor, set raw mode, absorb boot noise.
 * - write_line: send one console command, newline appended.
 * - write_frame: KISS-encode one command + payload and write it.
 * - read_item: poll and demultiplex until one line or frame is complete.
 * - close_serial: release the descriptor.
 *
 * Used by mycorrhiza-ctl (one-shot commands, uploads), the device registry
 * probe, and the uploader.
 *
 * DESIGN CHOICES
 * --------------
 * - Free functions, no class hierarchy, no hidden threads.
 * - POSIX termios and poll only. Runs on laptops, Pi, thin clients.
 * - The caller owns the StreamDemux, so a line or frame that spans two
 *   read_item() calls keeps its partial state.
 *
 * EXAMPLE
 * -------
 * @code
 *   using namespace mycorrhiza;
 *   int fd = open_serial("/dev/ttyACM0");
 *   if (fd < 0) { ... }
 *   write_line(fd, "!info");
 *   kiss::StreamDemux demux;
 *   kiss::Item item;
 *   while (read_item(fd, demux, item, 1000)) {
 *     if (item.kind == kiss::Item::Kind::Line) puts(item.line.c_str());
 *   }
 *   close_serial(fd);
 * @endcode
 *
 * OPERATIONAL NOTES
 * -----------------
 * - Prefer /dev/serial/by-id/... paths; they survive re-enumeration.
 * - The runtime user needs the dialout group (or an explicit udev rule).
 * - read_item() returning false means timeout or I/O error; retry or reopen.
 * - Do not share one fd between threads without external locking.
 */
#pragma once
#include <cstdint>
#include <string>
#include <vector>
#include "mycorrhiza/kiss.hpp"

namespace mycorrhiza {

/**
 * @brief Open a TTY, configure raw 8N1, and return its descriptor.
 *
 * @param dev            device path, e.g. "/dev/serial/by-id/usb-..." or "/dev/ttyACM0"
 * @param baud           9600, 19200, 38400, 57600, 115200 (default), 230400;
 *                       anything else falls back to 115200
 * @param boot_delay_ms  sleep after open so USB CDC boards finish their reset
 * @return descriptor (>= 0, non-blocking), or -1 on failure
 */
int open_serial(const std::string& dev, int baud = 115200, int boot_delay_ms = 400);

/**
 * @brief Write @p line followed by "\n".
 * @return true once every byte was accepted by the driver
 */
bool write_line(int fd, const std::string& line);

/**
 * @brief KISS-encode one frame and write it.
 * @return true once every encoded byte was accepted by the driver
 */
bool write_frame(int fd, kiss::Command command, const std::vector<uint8_t>& payload);

/**
 * @brief Read until @p demux yields one line, frame or framing error.
 *
 * @param timeout_ms  overall deadline for this call, not per byte
 * @param hangup      if given, set true when the false return was an I/O
 *                    error or a vanished device rather than a timeout
 * @return true with @p out filled; false on timeout or I/O error
 */
bool read_item(int fd, kiss::StreamDemux& demux, kiss::Item& out, int timeout_ms = 1500,
               bool* hangup = nullptr);

/// Close @p fd; negative values are ignored.
void close_serial(int fd);

} // namespace mycorrhiza
