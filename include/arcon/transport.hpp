// Copyright (C) 2008 James Weber
// Under the LGPL3, see COPYING
/*!
\file
\brief Interface between a session and whatever carries its messages.
*/

#ifndef ARCON_TRANSPORT_HPP_c71mzq0d
#define ARCON_TRANSPORT_HPP_c71mzq0d

#include <arcon/common.hpp>

#include <string>

namespace arcon {
  /*!
  \brief Receives the events of a transport.

  Events are only ever dispatched from inside transport::poll().
  */
  class transport_listener {
    public:
      virtual ~transport_listener() {}

      //! The connection is established and sends are possible.
      virtual void on_open() = 0;
      //! One complete message (an encoded packet).
      virtual void on_message(const std::string &bytes) = 0;
      //! Some failure; the cause is a readable message.
      virtual void on_error(const std::string &cause) = 0;
      //! The connection is gone, either side closed it.
      virtual void on_close() = 0;
  };

  /*!
  \brief Duplex, message oriented connection to a fixed host and port.

  A transport is owned by exactly one session.
  */
  class transport {
    protected:
      transport_listener *listener_;

      transport() : listener_(NULL) {}

    private:
      transport(const transport &);
      transport &operator=(const transport &);

    public:
      virtual ~transport() {}

      //! The listener is not owned.
      void set_listener(transport_listener *l) { listener_ = l; }

      //! Start connecting.  The result is reported as on_open() or on_error() by poll().
      virtual void open() = 0;

      //! \throws send_error
      virtual void send(const std::string &bytes) = 0;

      //! True if send() can be called now.
      virtual bool writable() const = 0;

      //! Start shutting down.  Confirmation is on_close() (or on_error()) from poll().
      virtual void close() = 0;

      /*!
      \brief Wait at most timeout_msecs for an event and dispatch it to the listener.

      \returns true if an event was dispatched.
      */
      virtual bool poll(long timeout_msecs) = 0;
  };
}

#endif
