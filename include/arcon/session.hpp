// Copyright (C) 2008 James Weber
// Under the LGPL3, see COPYING
/*!
\file
\brief A connection to one RCON server: authorisation and commands.

See \ref p_RCON "RCON Usage" for usage.
*/

#ifndef ARCON_SESSION_HPP_58dx55q1
#define ARCON_SESSION_HPP_58dx55q1

#include <arcon/common.hpp>
#include <arcon/packet.hpp>
#include <arcon/transport.hpp>
#include <arcon/tcp_transport.hpp>
#include <arcon/command.hpp>

#include <string>
#include <stdexcept>

namespace arcon {
  //! Connection parameters.  The defaults suit a local source server.
  struct session_options {
    std::string host;
    int port;
    //! Largest encoded packet which may be sent; 0 for no limit.
    size_t max_packet_size;
    encoding_t encoding;
    //! Milliseconds to wait for the connection, a reply or the close.
    long response_timeout;
    //! Reassemble replies split over several packets (see \link arcon::exec_command \endlink).
    bool multi_packet;

    session_options()
    : host("127.0.0.1"), port(27015), max_packet_size(4096),
      encoding(encoding_ascii), response_timeout(1000), multi_packet(false) {}
  };

  /*!
  \brief One client bound to one server.

  The transport is opened by the constructor.  Every call blocks while the
  session dispatches transport events, until the reply (or an error, the close
  or the response timeout) arrives.  Only one request can wait for a reply at a
  time.

  A session is not thread safe.
  */
  class session : private transport_listener {
    session_options options_;
    transport *transport_;
    bool connected_;
    bool authenticated_;
    //! The transport confirmed it is closed.
    bool closed_;

    //! The request which gets incoming packets, if any.
    command_base *pending_;
    int32_t last_id_;

    bool opening_;
    std::string open_error_;
    bool closing_;
    std::string close_error_;

    session(const session &);
    session &operator=(const session &);

    //! Puts a request in the slot for the lifetime of the guard.
    struct slot_guard {
      command_base *&slot_;
      slot_guard(command_base *&slot, command_base &r) : slot_(slot) { slot_ = &r; }
      ~slot_guard() { slot_ = NULL; }
    };

    public:
      /*!
      \brief Connect over TCP.

      \throws std::invalid_argument  bad options.
      \throws connection_error       the connection failed.
      \throws timeout_error          the connection did not open within the response timeout.
      */
      explicit session(const session_options &options = session_options())
      : options_(options), transport_(NULL) {
        validate(options_);
        init(new tcp_transport(options_.host, options_.port));
      }

      //! Use the given transport, which is then owned by the session.
      session(transport *t, const session_options &options = session_options())
      : options_(options), transport_(NULL) {
        if (t == NULL) throw std::invalid_argument("transport must not be null");
        try {
          validate(options_);
        }
        catch (std::invalid_argument &) {
          delete t;
          throw;
        }
        init(t);
      }

      ~session() {
        delete transport_;
      }

      /*!
      \brief Send the password and wait for the server to accept it.

      \throws already_authenticated  nothing is sent.
      \throws bad_password           the server denied it; the session is disconnected.
      \throws request_pending
      \throws packet_too_large
      \throws timeout_error
      \throws network_error          transport failures.

      \post is_authenticated()
      */
      void authenticate(const std::string &password) {
        if (authenticated_) {
          throw already_authenticated("already authenticated.");
        }

        ARCON_DEBUG_MESSAGE("Authenticating with " << options_.host << ":" << options_.port);
        auth_command a(password);
        write(a);

        if (a.accepted()) {
          authenticated_ = true;
          return;
        }

        try {
          disconnect();
        }
        catch (error &e) {
          ARCON_DEBUG_MESSAGE("Disconnecting after a denied auth failed: " << e.what());
        }
        throw bad_password("authentication denied.");
      }

      /*!
      \brief Run a command and return the server's output.

      \throws not_connected
      \throws send_unavailable
      \throws not_authorised
      \throws request_pending
      \throws packet_too_large   nothing is sent.
      \throws timeout_error
      \throws connection_closed  the server closed the connection first.
      \throws network_error      other transport failures.
      */
      std::string execute(const std::string &command) {
        if (! connected_) {
          throw not_connected("already disconnected; connect and authenticate again.");
        }

        if (! transport_->writable()) {
          throw send_unavailable("unable to write to the connection.");
        }

        if (! authenticated_) {
          throw not_authorised("not authorised.");
        }

        ARCON_DEBUG_MESSAGE("Executing '" << command << "'");
        exec_command c(next_id(), command, options_.multi_packet);
        write(c);
        return c.data();
      }

      /*!
      \brief Close the connection and wait for the transport to confirm it.

      A request still waiting for a reply fails with connection_closed.  Does
      nothing if the connection is already closed.

      \throws network_error  the transport reported an error instead of closing.
      \throws timeout_error
      */
      void disconnect() {
        authenticated_ = false;
        connected_ = false;

        if (pending_ != NULL) {
          pending_->fail(command_base::failed_closed, "the session was disconnected.");
        }

        if (closed_) return;

        ARCON_DEBUG_MESSAGE("Disconnecting from " << options_.host << ":" << options_.port);
        closing_ = true;
        close_error_.clear();
        transport_->close();

        deadline d(options_.response_timeout);
        bool in_time = pump(d, &session::close_done);
        closing_ = false;

        if (! in_time) {
          throw timeout_error("the connection did not confirm the close.");
        }

        if (! close_error_.empty()) {
          throw network_error(close_error_);
        }
      }

      bool is_connected() const { return connected_; }
      bool is_authenticated() const { return authenticated_; }

      const session_options &options() const { return options_; }

    private:
      static void validate(const session_options &o) {
        if (o.host.empty()) throw std::invalid_argument("host must not be empty");
        if (o.port <= 0 || o.port > 65535) throw std::invalid_argument("port must be between 1 and 65535");
        if (o.response_timeout <= 0) throw std::invalid_argument("response timeout must be positive");
      }

      //! Take the transport and wait for it to open.
      void init(transport *t) {
        transport_ = t;
        connected_ = false;
        authenticated_ = false;
        closed_ = false;
        pending_ = NULL;
        last_id_ = 0;
        opening_ = true;
        closing_ = false;

        try {
          transport_->set_listener(this);
          transport_->open();

          deadline d(options_.response_timeout);
          bool in_time = pump(d, &session::open_done);
          opening_ = false;

          if (! in_time) {
            throw timeout_error("timeout when connecting to host.");
          }

          if (! open_error_.empty()) {
            throw connection_error(open_error_);
          }
        }
        catch (...) {
          delete transport_;
          transport_ = NULL;
          throw;
        }

        ARCON_DEBUG_MESSAGE("Connected to " << options_.host << ":" << options_.port);
      }

      /*!
      \brief Next id for a command.

      Ids cycle through 1 to 255, so the next id never equals the id of the
      request before it and late packets of that request, its terminators
      included, are not mistaken for this reply.  Only one request is in flight
      at a time, and id_auth and the terminator ids are above the range.
      */
      int32_t next_id() {
        last_id_ = (last_id_ % 255) + 1;
        return last_id_;
      }

      //! Send the request and wait until it is done.
      void write(command_base &r) {
        if (pending_ != NULL) {
          throw request_pending("another request is waiting for its reply.");
        }

        std::string bytes = encode(r.type(), r.send_id(), r.body(), options_.encoding);
        if (options_.max_packet_size > 0 && bytes.length() > options_.max_packet_size) {
          throw packet_too_large("packet size too big.");
        }

        slot_guard guard(pending_, r);
        transport_->send(bytes);
        if (r.wants_terminator()) {
          transport_->send(encode(exec_response, r.terminator_id(), "", options_.encoding));
        }

        deadline d(options_.response_timeout);
        if (! pump(d, &session::request_done)) {
          throw timeout_error("timed out waiting for the reply.");
        }

        r.check();
      }

      //! Dispatch transport events until done() is true.  False if the deadline passed first.
      bool pump(const deadline &d, bool (session::*done)() const) {
        while (! (this->*done)()) {
          if (d.expired()) return false;
          transport_->poll(d.remaining());
        }
        return true;
      }

      bool open_done() const { return connected_ || ! open_error_.empty(); }
      bool request_done() const { return pending_ == NULL || pending_->done(); }
      bool close_done() const { return closed_ || ! close_error_.empty(); }

      void on_open() {
        connected_ = true;
      }

      void on_message(const std::string &bytes) {
        packet p;
        try {
          p = decode(bytes, options_.encoding);
        }
        catch (proto_error &e) {
          if (pending_ != NULL) {
            pending_->fail(command_base::failed_protocol, e.what());
          }
          else {
            ARCON_DEBUG_MESSAGE("Dropping a bad packet: " << e.what());
          }
          return;
        }

        if (pending_ == NULL) {
          ARCON_DEBUG_MESSAGE("Nothing is waiting; ignoring packet id " << p.id << " type " << p.type);
          return;
        }

        pending_->accept(p);
      }

      void on_error(const std::string &cause) {
        ARCON_DEBUG_MESSAGE("Transport error: " << cause);
        if (closing_) {
          close_error_ = cause;
        }
        else if (pending_ != NULL) {
          pending_->fail(command_base::failed_transport, cause);
        }
        else if (opening_) {
          open_error_ = cause;
        }
      }

      void on_close() {
        ARCON_DEBUG_MESSAGE("Connection closed.");
        closed_ = true;
        connected_ = false;
        authenticated_ = false;

        if (pending_ != NULL) {
          pending_->fail(command_base::failed_closed, "the connection was closed by the server.");
        }

        if (opening_) {
          open_error_ = "the connection was closed while connecting.";
        }
      }
  };
}

#endif
