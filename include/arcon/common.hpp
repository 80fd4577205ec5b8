// Copyright (C) 2008 James Weber
// Under the LGPL3, see COPYING
/*!
\file
\brief Error types, debugging macros and socket helpers shared by every part of arcon.

\internal

\todo WSAGetLastError() is needed instead of errno on windows; the transport is
      only tested on POSIX systems.
*/

#ifndef ARCON_COMMON_HPP_y3dykfiu
#define ARCON_COMMON_HPP_y3dykfiu

#ifdef WIN32
#  define ARCON_WINDOWS
#endif

#ifdef ARCON_WINDOWS
#  define _WIN32_WINNT 0x501
#  include <winsock2.h>
#  include <ws2tcpip.h>
#else
#  include <sys/types.h>
#  include <sys/socket.h>
#  include <sys/select.h>
#  include <netinet/in.h>
#  include <arpa/inet.h>
#  include <netdb.h>
#  include <fcntl.h>
#  include <unistd.h>
#  include <time.h>
#endif

#ifndef ARCON_WINDOWS
#  include <endian.h>
#endif
#include <stdint.h>

#include <cerrno>
#include <cstring>

#include <string>
#include <stdexcept>
#include <iostream>

#if defined(ARCON_COMMON_DEBUG_MESSAGES) || defined(ARCON_DEBUG_MESSAGES)
#  define ARCON_DEBUG_MESSAGE(x__)\
   std::cout << __FUNCTION__ << "(): " << x__ << std::endl;
#else
#  define ARCON_DEBUG_MESSAGE(x__)
#endif

#if defined(ARCON_COMMON_DEBUG_MESSAGES)
#  define COMMON_DEBUG_MESSAGE(x__) ARCON_DEBUG_MESSAGE(x__)
#else
#  define COMMON_DEBUG_MESSAGE(x__)
#endif

/*!
\def ARCON_SYS_LITTLE_ENDIAN

Readability variable for endianness feature test.  When it is not defined, the byte
order is swapped transparently.
*/
#ifndef __BYTE_ORDER
#  warning: assuming little endian byte order because __BYTE_ORDER does not exist.
#  define ARCON_SYS_LITTLE_ENDIAN
#elif __BYTE_ORDER == __LITTLE_ENDIAN
#  define ARCON_SYS_LITTLE_ENDIAN
#elif __BYTE_ORDER == __BIG_ENDIAN
#  define ARCON_SYS_BIG_ENDIAN
#else
#  warning: assuming little endian byte order because __BYTE_ORDER is defined to something unknown.
#  define ARCON_SYS_LITTLE_ENDIAN
#endif

//! All components of the arcon library.
namespace arcon {
  //! Catch-all error class.
  struct error : public std::runtime_error {
    error(const std::string &s) : std::runtime_error(s) {}
    ~error() throw() {}
  };

  //! Transport failure of some kind.  The connection state is not changed by these.
  struct network_error : public error {
    network_error(const std::string &s) : error(s) {}
    ~network_error() throw() {}
  };

  //! General communications errors which might be recoverable.
  struct comm_error : public error {
    comm_error(const std::string &s) : error(s) {}
    ~comm_error() throw() {}
  };

  //! A failure to resolve, socket(), connect() etc.
  struct connection_error : public network_error {
    connection_error(const std::string &s) : network_error(s) {}
    ~connection_error() throw() {}
  };

  //! The connection went away while something was waiting on it.
  struct connection_closed : public network_error {
    connection_closed(const std::string &s) : network_error(s) {}
    ~connection_closed() throw() {}
  };

  //! Sending data failed.
  struct send_error : public network_error {
    send_error(const std::string &s) : network_error(s) {}
    ~send_error() throw() {}
  };

  //! The transport is not able to take a send right now.
  struct send_unavailable : public send_error {
    send_unavailable(const std::string &s) : send_error(s) {}
    ~send_unavailable() throw() {}
  };

  //! Reading data failed.
  struct recv_error : public network_error {
    recv_error(const std::string &s) : network_error(s) {}
    ~recv_error() throw() {}
  };

  //! Caused by some violation of the protocol, eg. a malformed packet.
  struct proto_error : public network_error {
    proto_error(const std::string &s) : network_error(s) {}
    ~proto_error() throw() {}
  };

  //! A possibly recoverable error with authorisation.
  struct auth_error : public comm_error {
    auth_error(const std::string &s) : comm_error(s) {}
    ~auth_error() throw() {}
  };

  //! The password was wrong.  The session is disconnected when this is thrown.
  struct bad_password : public auth_error {
    bad_password(const std::string &s) : auth_error(s) {}
    ~bad_password() throw() {}
  };

  //! authenticate() was called on an authenticated session.
  struct already_authenticated : public auth_error {
    already_authenticated(const std::string &s) : auth_error(s) {}
    ~already_authenticated() throw() {}
  };

  //! A command was sent before authenticating.
  struct not_authorised : public auth_error {
    not_authorised(const std::string &s) : auth_error(s) {}
    ~not_authorised() throw() {}
  };

  //! A command was sent on a session which is not connected.
  struct not_connected : public comm_error {
    not_connected(const std::string &s) : comm_error(s) {}
    ~not_connected() throw() {}
  };

  //! The encoded packet is bigger than the configured maximum.  Nothing was sent.
  struct packet_too_large : public comm_error {
    packet_too_large(const std::string &s) : comm_error(s) {}
    ~packet_too_large() throw() {}
  };

  //! Another request is still waiting for its reply.
  struct request_pending : public comm_error {
    request_pending(const std::string &s) : comm_error(s) {}
    ~request_pending() throw() {}
  };

  //! No reply arrived within the response timeout.
  struct timeout_error : public comm_error {
    timeout_error(const std::string &s) : comm_error(s) {}
    ~timeout_error() throw() {}
  };

  //! Throw given exception using errno to get a message
  template <typename Exception>
  void errno_throw(const char *message) {
    std::string m(message);
    m += ": ";
    m += strerror(errno);
    throw Exception(m);
  }

  //! Same as errno_throw but with an explicit error number (eg. from SO_ERROR).
  template <typename Exception>
  void errno_throw(const char *message, int error_number) {
    std::string m(message);
    m += ": ";
    m += strerror(error_number);
    throw Exception(m);
  }

  /*!
  \brief Take care of DNS and so on.

  \todo Allow AF_UNSPEC once an IPv6 server is available to test with.
  */
  class host {
    struct addrinfo *ad_info;

    // non-copyable, ad_info is owned
    host(const host &);
    host &operator=(const host &);

    public:
      //! Attributes for the constructor
      typedef enum {
        tcp   = 1 << 0,
        udp   = 1 << 1,
        is_ip = 1 << 2
      } host_attr_t;

      /*!
      \param attr  Bitmask of options from host_attr_t.  Defaults to tcp if nothing is set.

      \throws connection_error  the lookup failed.
      */
      host(const char *host, const char *port, int attr = host::tcp) : ad_info(NULL) {
        if (host == NULL || *host == '\0') throw std::invalid_argument("host must not be empty");

        if (port == NULL || *port == '\0') throw std::invalid_argument("port must be a numeric string");

        COMMON_DEBUG_MESSAGE("Host is: " << host << ":" << port << " attr:" << attr);

        struct addrinfo hints;
        memset(&hints, 0, sizeof(struct addrinfo));
        hints.ai_family = AF_INET;
        hints.ai_socktype = (attr & udp) ? SOCK_DGRAM : SOCK_STREAM;
        hints.ai_flags = AI_NUMERICSERV;
        // optimisation when we know it's an IP already.
        if (attr & is_ip) hints.ai_flags |= AI_NUMERICHOST;
        hints.ai_protocol = 0;

        COMMON_DEBUG_MESSAGE("Getting address info.");
        int r;
        if ((r = getaddrinfo(host, port, &hints, &ad_info)) != 0) {
          throw connection_error(std::string("getaddrinfo() failed: ") + gai_strerror(r));
        }

        if (ad_info->ai_addr == NULL || ad_info->ai_addrlen == 0) {
          freeaddrinfo(ad_info);
          throw connection_error("No socket address returned.");
        }
#if defined(ARCON_COMMON_DEBUG_MESSAGES)
        else if (ad_info->ai_next != NULL) {
          COMMON_DEBUG_MESSAGE("Warning: more than one socket address was returned "
                               "from gettaddrinfo().  Only the first is used.");
        }
#endif
      }

      ~host() {
        freeaddrinfo(ad_info);
      }

      //! ai_family for a socket() call.
      int family() const { return ad_info->ai_family; }

      //! Address struct for a connect() call.
      const struct sockaddr *address() const { return ad_info->ai_addr; }

      //! Length value for a connect() call.
      socklen_t address_len() const { return ad_info->ai_addrlen; }

      //! SOCK_DGRAM etc.  For socket()
      int type() const { return ad_info->ai_socktype; }
  };


  const int wait_for_select_timeout = 0;
  typedef enum {wait_readable, wait_writeable} wait_for_select_mode_t;

  //! 0 if timeout, 1 if the socket is ready.  Throws connection_error if select() fails.
  inline int wait_for_select(int socket_fd, wait_for_select_mode_t mode, long timeout_msecs) {
    fd_set fds;
    FD_ZERO(&fds);
    FD_SET(socket_fd, &fds);

    if (timeout_msecs < 0) timeout_msecs = 0;
    struct timeval timeout;
    timeout.tv_sec = timeout_msecs / 1000;
    timeout.tv_usec = (timeout_msecs % 1000) * 1000;

    int ret;
    do {
      if (mode == wait_readable) {
        ret = select(socket_fd+1, &fds, NULL, NULL, &timeout);
      }
      else {
        ret = select(socket_fd+1, NULL, &fds, NULL, &timeout);
      }
    } while (ret == -1 && errno == EINTR);

    if (ret == -1) {
      errno_throw<connection_error>("select() failed");
    }

    return (ret > 0 && FD_ISSET(socket_fd, &fds)) ? 1 : wait_for_select_timeout;
  }

  //! Milliseconds on the monotonic clock.
  inline long monotonic_msecs() {
    struct timespec ts;
    clock_gettime(CLOCK_MONOTONIC, &ts);
    return static_cast<long>(ts.tv_sec) * 1000 + ts.tv_nsec / 1000000;
  }

  //! A point in time some milliseconds from construction.
  class deadline {
    long expires_;

    public:
      explicit deadline(long msecs) : expires_(monotonic_msecs() + msecs) {}

      //! Never negative.
      long remaining() const {
        long left = expires_ - monotonic_msecs();
        return (left < 0) ? 0 : left;
      }

      bool expired() const { return remaining() == 0; }
  };

  //! Copies from little endian to system endian.
  template <typename T>
  void endian_memcpy(T &destination, const void *source) {
#ifdef ARCON_SYS_LITTLE_ENDIAN
    memcpy(&destination, source, sizeof(T));
#else
    char *dest = (char *) &destination;
    const char *src = (const char *) source;
    for (size_t i = 0; i < sizeof(T); ++i) {
      dest[sizeof(T) - 1 - i] = src[i];
    }
#endif
  }

  //! Get a value from a buffer.  Also increments idx by reference
  template<typename T>
  T from_buffer(const void *source, size_t &idx) {
    T v;
    const char *s = (const char *) source + idx;
    endian_memcpy(v, s);
    idx += sizeof(T);
    return v;
  }

  //! Append a value to a buffer in little endian order.
  template<typename T>
  void to_buffer(std::string &dest, T v) {
    T le;
    endian_memcpy(le, &v);
    dest.append(reinterpret_cast<const char *>(&le), sizeof(T));
  }
}

#endif
