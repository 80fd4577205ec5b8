// Copyright (C) 2008 James Weber
// Under the LGPL3, see COPYING
/*!
\file
\brief Requests which wait in a session for their reply.

\internal

These only collect packets; sending and waiting is done by \link arcon::session \endlink.
*/

#ifndef ARCON_COMMAND_HPP_0pd2hw7c
#define ARCON_COMMAND_HPP_0pd2hw7c

#include <arcon/common.hpp>
#include <arcon/packet.hpp>

#include <string>

namespace arcon {
  /*!
  \brief Non-instanciable base for a request and the reply built up for it.

  A request starts as waiting and ends either finished or failed.  Once it is
  done, later packets and failures are ignored.
  */
  class command_base {
    public:
      //! Where the request has got to.
      typedef enum {
        waiting,
        finished,
        //! The transport reported an error.
        failed_transport,
        //! A packet could not be decoded.
        failed_protocol,
        //! The connection was closed before the reply was complete.
        failed_closed
      } state_t;

    protected:
      int32_t type_;
      int32_t send_id_;
      std::string body_;
      std::string payload_;
      state_t state_;
      std::string cause_;

      command_base(int32_t type, int32_t send_id, const std::string &body)
      : type_(type), send_id_(send_id), body_(body), state_(waiting) {}

      void finish() { state_ = finished; }

    public:
      virtual ~command_base() {}

      //! Packet type sent.
      int32_t type() const { return type_; }
      //! Request id sent.
      int32_t send_id() const { return send_id_; }
      //! Text sent.
      const std::string &body() const { return body_; }
      //! The reply text collected so far.
      const std::string &data() const { return payload_; }

      state_t state() const { return state_; }
      bool done() const { return state_ != waiting; }

      //! Send the multi-packet terminator after the request.
      virtual bool wants_terminator() const { return false; }

      //! Id of that terminator.
      int32_t terminator_id() const { return id_term + send_id_; }

      //! Offer an incoming packet.  Packets not meant for this request are ignored.
      virtual void accept(const packet &p) = 0;

      void fail(state_t why, const std::string &cause) {
        if (done()) return;
        state_ = why;
        cause_ = cause;
      }

      /*!
      \brief Throw the reason the request failed; nothing if it did not.

      \throws network_error      failed_transport
      \throws proto_error        failed_protocol
      \throws connection_closed  failed_closed
      */
      void check() const {
        switch (state_) {
          case failed_transport: throw network_error(cause_);
          case failed_protocol: throw proto_error(cause_);
          case failed_closed: throw connection_closed(cause_);
          default: break;
        }
      }
  };

  /*!
  \brief Authorisation request.

  The server answers an auth request with two packets: a mirror of the request
  as an exec response with empty data, then the real auth response.  Everything
  which is not an auth response is skipped.
  */
  class auth_command : public command_base {
    bool accepted_;

    public:
      explicit auth_command(const std::string &password)
      : command_base(auth_request, id_auth, password), accepted_(false) {}

      //! \pre done()
      bool accepted() const { return accepted_; }

      void accept(const packet &p) {
        if (done()) return;

        if (p.type != auth_response) {
          ARCON_DEBUG_MESSAGE("Skipping packet of type " << p.type << " (id " << p.id
                              << ") while waiting for the auth response.");
          return;
        }

        // anything but our id (normally id_auth_denied) is a rejection
        accepted_ = (p.id == send_id());
        payload_ = p.body;
        ARCON_DEBUG_MESSAGE("Auth response id " << p.id << ": " << (accepted_ ? "accepted" : "denied"));
        finish();
      }
  };

  /*!
  \brief An arbitrary console command.

  Without multi_packet the first packet carrying our id is the whole reply.
  With it, an empty packet with terminator_id() is sent after the command; the
  server answers it only after the last fragment of the reply, so fragments are
  appended until its mirror comes back.  The server follows the mirror with a
  second packet of the same id, which is ignored once the request is done.
  */
  class exec_command : public command_base {
    bool multi_packet_;

    public:
      exec_command(int32_t send_id, const std::string &command, bool multi_packet = false)
      : command_base(exec_request, send_id, command), multi_packet_(multi_packet) {}

      bool wants_terminator() const { return multi_packet_; }

      void accept(const packet &p) {
        if (done()) return;

        if (multi_packet_ && p.id == terminator_id()) {
          ARCON_DEBUG_MESSAGE("Terminator received; reply is " << payload_.length() << " bytes.");
          finish();
          return;
        }

        if (p.id != send_id()) {
          ARCON_DEBUG_MESSAGE("Ignoring packet with id " << p.id << " (waiting for " << send_id() << ").");
          return;
        }

        payload_.append(p.body);
        if (! multi_packet_) finish();
      }
  };
}

#endif
