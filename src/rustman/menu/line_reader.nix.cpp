#ifndef _WIN32
#include "./line_reader.hpp"

#include <rustman/util/log.hpp>
#include <rustman/util/signal.hpp>

#include <poll.h>
#include <unistd.h>

#include <cerrno>
#include <system_error>

using namespace rustman;

namespace {

void check_rc(bool b, std::string_view s) {
    if (!b) {
        throw std::system_error(std::error_code(errno, std::system_category()), std::string(s));
    }
}

}  // namespace

/**
 * Wait for input and append it to the pending buffer. Returns false if cancelled or at the end
 * of input.
 */
bool fd_line_reader::_fill() {
    pollfd pfd;
    pfd.fd     = _fd;
    pfd.events = POLLIN;

    while (true) {
        if (_cancel.is_cancelled()) {
            return false;
        }
        errno  = 0;
        auto rc = ::poll(&pfd, 1, static_cast<int>(_poll_interval.count()));
        if (rc < 0 && errno == EINTR) {
            // A signal arrived. Loop around to check the flag.
            continue;
        }
        check_rc(rc >= 0, "Failed in poll() while waiting for input");
        if (rc == 0) {
            continue;
        }
        if (pfd.revents & POLLNVAL) {
            rustman_log(warn, "Input file descriptor {} is not open. Treating it as empty.", _fd);
            _eof = true;
            return false;
        }

        char buffer[1024];
        auto nread = ::read(_fd, buffer, sizeof buffer);
        if (nread < 0 && errno == EINTR) {
            continue;
        }
        if (nread < 0) {
            auto ec = std::error_code(errno, std::system_category());
            rustman_log(warn,
                        "Failed to read input from file descriptor {}: {}. Treating it as the "
                        "end of input.",
                        _fd,
                        ec.message());
            _eof = true;
            return false;
        }
        if (nread == 0) {
            rustman_log(trace, "Reached the end of input on fd {}", _fd);
            _eof = true;
            return false;
        }
        _pending.append(buffer, static_cast<std::size_t>(nread));
        return true;
    }
}

std::optional<std::string> fd_line_reader::read_line() {
    while (true) {
        auto nl_pos = _pending.find('\n');
        if (nl_pos != std::string::npos) {
            auto line = _pending.substr(0, nl_pos);
            _pending.erase(0, nl_pos + 1);
            if (line.ends_with('\r')) {
                line.pop_back();
            }
            return line;
        }
        if (_eof || !_fill()) {
            break;
        }
    }
    if (_cancel.is_cancelled()) {
        return std::nullopt;
    }
    // A final line without a newline still counts
    if (!_pending.empty()) {
        auto line = std::move(_pending);
        _pending.clear();
        return line;
    }
    return std::nullopt;
}

#endif  // _WIN32
