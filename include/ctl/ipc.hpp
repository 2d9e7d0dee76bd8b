#pragma once
#include <functional>
#include <string>
#include <sys/socket.h>
#include <sys/un.h>

#include "util/constants.hpp"

namespace ipc
{

// Handles one control line; a non-empty result is written back to the client.
using LineHandler = std::function<std::string(const std::string &line)>;

// Serves the control socket, one line per connection, until a "QUIT" line.
// A client silent for `recv_timeout_ms` is dropped.
bool start_server(const std::string &sock_path,
                  const LineHandler &on_line,
                  int                recv_timeout_ms = constants::CTL_RECV_TIMEOUT_MS);

// Sends `line` and, when `reply` is given, collects what the server answers.
bool send_line(const std::string &sock_path, const std::string &line, std::string *reply = nullptr);

std::string expand_user(const std::string &path);

// AF_UNIX helpers shared with the socket link
bool make_unix_addr(const std::string &path, sockaddr_un &addr, socklen_t &addr_len);
int  make_unix_socket();  // SOCK_STREAM, close-on-exec; -1 on failure
void set_cloexec(int fd);

}  // namespace ipc
