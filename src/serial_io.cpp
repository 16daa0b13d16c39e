// ============================================================================
// serial_io.cpp - implementation for serial_io.hpp
// For API/overview see the matching .hpp.
// ============================================================================

/**
 * @file serial_io.cpp
 */

#include "serial_io.hpp"

#include <fcntl.h>         // ::open flags (O_RDWR, O_NOCTTY, O_NONBLOCK)
#include <unistd.h>        // ::read, ::write, ::close, usleep
#include <termios.h>       // termios struct + raw mode helpers
#include <poll.h>          // poll(2) for timeouts
#include <cerrno>
#include <chrono>

namespace mycorrhiza {

// ---------------------------------------------------------------------------
// set_raw()
// ----------
// Raw 8N1 at the given speed: no echo, no line discipline, no flow control,
// VMIN=0/VTIME=0 so reads never block (poll() does the waiting).
// ---------------------------------------------------------------------------
static bool set_raw(int fd, speed_t baud) {
    termios tio{};
    if (tcgetattr(fd, &tio) != 0) return false;

    cfmakeraw(&tio);
    cfsetispeed(&tio, baud);
    cfsetospeed(&tio, baud);

    tio.c_cflag |= (CLOCAL | CREAD);              // ignore modem ctrl, enable read
    tio.c_cflag &= ~CRTSCTS;                      // no hardware flow control
    tio.c_cc[VMIN]  = 0;
    tio.c_cc[VTIME] = 0;

    if (tcsetattr(fd, TCSANOW, &tio) != 0) return false;
    tcflush(fd, TCIOFLUSH);
    return true;
}

// ---------------------------------------------------------------------------
// write_all()
// -----------
// The fd is non-blocking, so a full driver buffer shows up as EAGAIN.
// Wait for POLLOUT (bounded) and continue where the last write stopped.
// ---------------------------------------------------------------------------
static bool write_all(int fd, const uint8_t* data, size_t n) {
    static constexpr int WRITE_STALL_MS = 1000;
    size_t off = 0;
    while (off < n) {
        ssize_t w = ::write(fd, data + off, n - off);
        if (w > 0) { off += static_cast<size_t>(w); continue; }
        if (w < 0 && errno == EINTR) continue;
        if (w < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            pollfd pfd{fd, POLLOUT, 0};
            if (::poll(&pfd, 1, WRITE_STALL_MS) <= 0) return false;
            continue;
        }
        return false;
    }
    return true;
}

// ---------------------------------------------------------------------------
// open_serial()
// -------------
// O_NOCTTY so the port never becomes our controlling terminal; O_NONBLOCK so
// reads and writes never hang. Sleeps boot_delay_ms (USB CDC auto-reset) and
// flushes whatever the board printed while booting.
// ---------------------------------------------------------------------------
int open_serial(const std::string& dev, int baud, int boot_delay_ms) {
    int fd = ::open(dev.c_str(), O_RDWR | O_NOCTTY | O_NONBLOCK);
    if (fd < 0) return -1;

    speed_t sp = B115200;
    if      (baud == 9600)   sp = B9600;
    else if (baud == 19200)  sp = B19200;
    else if (baud == 38400)  sp = B38400;
    else if (baud == 57600)  sp = B57600;
    else if (baud == 230400) sp = B230400;

    if (!set_raw(fd, sp)) {                       // not a tty, or driver refused
        ::close(fd);
        return -1;
    }

    if (boot_delay_ms > 0) usleep(static_cast<useconds_t>(boot_delay_ms) * 1000);
    tcflush(fd, TCIOFLUSH);
    return fd;
}

bool write_line(int fd, const std::string& line) {
    std::string out = line;
    out.push_back('\n');
    return write_all(fd, reinterpret_cast<const uint8_t*>(out.data()), out.size());
}

bool write_frame(int fd, kiss::Command command, const std::vector<uint8_t>& payload) {
    std::vector<uint8_t> out;
    kiss::encode(command, payload.data(), payload.size(), out);
    return write_all(fd, out.data(), out.size());
}

// ---------------------------------------------------------------------------
// read_item()
// -----------
// One byte per read() so nothing past the completed item is consumed; the
// rest stays in the driver buffer for the next call. Partial lines and
// frames live in the caller's demux across calls.
// ---------------------------------------------------------------------------
bool read_item(int fd, kiss::StreamDemux& demux, kiss::Item& out, int timeout_ms,
               bool* hangup) {
    using clock = std::chrono::steady_clock;
    const auto deadline = clock::now() + std::chrono::milliseconds(timeout_ms);
    pollfd pfd{fd, POLLIN, 0};
    if (hangup) *hangup = false;

    auto fail = [hangup]() { if (hangup) *hangup = true; return false; };

    while (true) {
        const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - clock::now()).count();
        if (left <= 0) return false;

        int pr = ::poll(&pfd, 1, static_cast<int>(left));
        if (pr == 0) return false;                // timeout expired
        if (pr < 0) {
            if (errno == EINTR) continue;
            return fail();
        }
        if (!(pfd.revents & POLLIN)) return fail();  // POLLERR / POLLHUP: device gone

        uint8_t byte = 0;
        ssize_t n = ::read(fd, &byte, 1);
        if (n < 0 && (errno == EAGAIN || errno == EINTR)) continue;
        if (n <= 0) return fail();
        if (demux.feed(byte, out)) return true;
    }
}

void close_serial(int fd) {
    if (fd >= 0) ::close(fd);
}

} // namespace mycorrhiza
