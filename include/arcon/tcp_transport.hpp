// Copyright (C) 2008 James Weber
// Under the LGPL3, see COPYING
/*!
\file
\brief TCP transport for source engine servers.

\internal

\todo Get this working on windows; connect() is only non-blocking on POSIX here.
*/

#ifndef ARCON_TCP_TRANSPORT_HPP_5ab0tw3r
#define ARCON_TCP_TRANSPORT_HPP_5ab0tw3r

#include <arcon/common.hpp>
#include <arcon/packet.hpp>
#include <arcon/transport.hpp>

#include <sstream>
#include <string>

namespace arcon {
  /*!
  \brief A stream socket which hands out one message per RCON packet.

  The stream is split using the size field at the front of every packet.
  */
  class tcp_transport : public transport {
    typedef enum {state_closed, state_connecting, state_open, state_closing} state_t;

    std::string host_;
    std::string port_;
    int socket_;
    state_t state_;
    bool open_pending_;
    bool close_pending_;
    std::string error_pending_;
    std::string buffer_;

    public:
      tcp_transport(const std::string &host, int port)
      : host_(host), socket_(-1), state_(state_closed),
        open_pending_(false), close_pending_(false) {
        std::ostringstream ss;
        ss << port;
        port_ = ss.str();
      }

      ~tcp_transport() {
        if (socket_ != -1) ::close(socket_);
      }

      /*!
      \brief Resolve the host and start a non-blocking connect.

      \throws connection_error  lookup, socket() or an immediate connect() failure.
      */
      void open() {
        host server(host_.c_str(), port_.c_str());

        COMMON_DEBUG_MESSAGE("Initialising sockets.");
        socket_ = ::socket(server.family(), server.type(), 0);
        if (socket_ == -1) {
          errno_throw<connection_error>("socket() failed");
        }

        COMMON_DEBUG_MESSAGE("Setting nonblock.");
        int flags = fcntl(socket_, F_GETFL, 0);
        if (flags == -1) {
          fail_open("fcntl(): F_GETFL failed", errno);
        }
        else if (! (flags & O_NONBLOCK)) {
          if (fcntl(socket_, F_SETFL, flags | O_NONBLOCK) == -1) {
            std::cerr << "warning: couldn't set non-blocking flags on the socket.  "
                         "The connect timeout will not apply." << std::endl;
          }
        }

        COMMON_DEBUG_MESSAGE("Connecting socket.");
        int ret = connect(socket_, server.address(), server.address_len());
        if (ret == 0) {
          connected();
        }
        else if (errno == EINPROGRESS) {
          COMMON_DEBUG_MESSAGE("Connect is now in progress.");
          state_ = state_connecting;
        }
        else {
          fail_open("connect() failed", errno);
        }
      }

      void send(const std::string &bytes) {
        if (! writable()) {
          throw send_unavailable("the connection is not open.");
        }

        size_t sent = 0;
        while (sent < bytes.length()) {
          ssize_t n = ::send(socket_, bytes.data() + sent, bytes.length() - sent, MSG_NOSIGNAL);
          if (n == -1) {
            if (errno == EINTR) continue;
            errno_throw<send_error>("send() failed");
          }
          sent += n;
        }
        COMMON_DEBUG_MESSAGE("Sent " << sent << " bytes.");
      }

      bool writable() const { return state_ == state_open && socket_ != -1; }

      //! Close the socket.  poll() reports the result.
      void close() {
        if (socket_ != -1) {
          COMMON_DEBUG_MESSAGE("Closing socket.");
          int r = ::close(socket_);
          socket_ = -1;
          if (r == -1) {
            error_pending_ = std::string("close() failed: ") + strerror(errno);
          }
          else {
            close_pending_ = true;
          }
        }
        else {
          close_pending_ = true;
        }
        state_ = state_closing;
        buffer_.clear();
      }

      bool poll(long timeout_msecs) {
        if (! error_pending_.empty()) {
          std::string cause;
          cause.swap(error_pending_);
          if (state_ == state_closing) state_ = state_closed;
          listener_->on_error(cause);
          return true;
        }

        if (close_pending_) {
          close_pending_ = false;
          state_ = state_closed;
          listener_->on_close();
          return true;
        }

        if (open_pending_) {
          open_pending_ = false;
          listener_->on_open();
          return true;
        }

        if (state_ == state_connecting) {
          return poll_connect(timeout_msecs);
        }
        else if (state_ == state_open) {
          if (dispatch_buffered()) return true;
          return poll_read(timeout_msecs);
        }

        return false;
      }

    private:
      void connected() {
        COMMON_DEBUG_MESSAGE("Setting blocking again.");
        int flags = fcntl(socket_, F_GETFL, 0);
        if (flags == -1) {
          errno_throw<connection_error>("fcntl(): F_GETFL failed");
        }
        else if (flags & O_NONBLOCK) {
          if (fcntl(socket_, F_SETFL, flags & ~O_NONBLOCK) == -1) {
            errno_throw<connection_error>("could not reset the socket to blocking mode");
          }
        }

        COMMON_DEBUG_MESSAGE("Sockets all set up.");
        state_ = state_open;
        open_pending_ = true;
      }

      //! Close the half-made socket and throw.
      void fail_open(const char *message, int error_number) {
        ::close(socket_);
        socket_ = -1;
        state_ = state_closed;
        errno_throw<connection_error>(message, error_number);
      }

      bool poll_connect(long timeout_msecs) {
        COMMON_DEBUG_MESSAGE("Waiting for select.");
        if (wait_for_select(socket_, wait_writeable, timeout_msecs) == wait_for_select_timeout) {
          return false;
        }

        socklen_t option_value_size = sizeof(int);
        int option_value = 0;
        if (getsockopt(socket_, SOL_SOCKET, SO_ERROR, (void*)(&option_value), &option_value_size) < 0) {
          option_value = errno;
        }

        if (option_value) {
          ::close(socket_);
          socket_ = -1;
          state_ = state_closed;
          listener_->on_error(std::string("delayed connection failed: ") + strerror(option_value));
          return true;
        }

        try {
          connected();
        }
        catch (connection_error &e) {
          ::close(socket_);
          socket_ = -1;
          state_ = state_closed;
          listener_->on_error(e.what());
          return true;
        }

        open_pending_ = false;
        listener_->on_open();
        return true;
      }

      bool poll_read(long timeout_msecs) {
        if (wait_for_select(socket_, wait_readable, timeout_msecs) == wait_for_select_timeout) {
          return false;
        }

        char buf[max_packet_size + sizeof(int32_t)];
        ssize_t bytes = recv(socket_, buf, sizeof(buf), 0);
        if (bytes == -1) {
          if (errno == EINTR || errno == EAGAIN) return false;
          listener_->on_error(std::string("recv() failed: ") + strerror(errno));
          return true;
        }
        else if (bytes == 0) {
          COMMON_DEBUG_MESSAGE("Remote host closed the connection.");
          ::close(socket_);
          socket_ = -1;
          state_ = state_closed;
          buffer_.clear();
          listener_->on_close();
          return true;
        }

        COMMON_DEBUG_MESSAGE("Read " << bytes << " bytes.");
        buffer_.append(buf, bytes);
        return dispatch_buffered();
      }

      /*!
      \brief Hand out the first packet in the buffer if it is complete.

      A size prefix out of range reports an error and closes the connection.
      */
      bool dispatch_buffered() {
        if (buffer_.length() < sizeof(int32_t)) return false;

        size_t idx = 0;
        int32_t size = from_buffer<int32_t>(buffer_.data(), idx);
        if (size < static_cast<int32_t>(min_packet_size) || size > static_cast<int32_t>(max_packet_size)) {
          // no way to find the next packet boundary, so the stream is useless
          COMMON_DEBUG_MESSAGE("Invalid size " << size << "; closing.");
          ::close(socket_);
          socket_ = -1;
          state_ = state_closed;
          buffer_.clear();
          listener_->on_error("invalid data size.");
          listener_->on_close();
          return true;
        }

        size_t total = sizeof(int32_t) + size;
        if (buffer_.length() < total) return false;

        std::string message(buffer_, 0, total);
        buffer_.erase(0, total);
        listener_->on_message(message);
        return true;
      }
  };
}

#endif
