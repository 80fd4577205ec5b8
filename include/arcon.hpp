// Copyright (C) 2008 James Weber
// Under the LGPL3, see COPYING
/*!
\file
\brief Includes the entire arcon library.
*/

/*!
\mainpage

\section s_intro Introduction

\b arcon is a library for talking to RCON servers: authenticate once on a
connection, then run console commands and get their output back.  Also
included is a small program for running commands from a shell and an optional
Qt console.

Refer to the 'related pages' tab to see documentation for separate parts of
the library.  If you're not using doxygen to read this, all page documentation
resides in \link arcon.hpp \endlink.

\section s_layout Layout

- \link arcon/common.hpp \endlink: exceptions, debug messages, sockets helpers.
- \link arcon/packet.hpp \endlink: encoding and decoding of packets.
- \link arcon/transport.hpp \endlink: what a session needs from a connection.
- \link arcon/tcp_transport.hpp \endlink: the normal TCP connection.
- \link arcon/command.hpp \endlink: requests and how replies are matched to them.
- \link arcon/session.hpp \endlink: the client itself.

\section s_debug Debugging

Define \c ARCON_DEBUG_MESSAGES to print what the session does,
\c ARCON_COMMON_DEBUG_MESSAGES for the socket layer as well and
\c ARCON_PACKET_DEBUG_MESSAGES for every packet encoded or decoded.  The cmake
option \c ARCON_DEBUG turns on the first two.
*/

/*!
\page p_RCON RCON Usage

\section s_rcon_intro Introduction

All components are in the \link arcon \endlink namespace, included by
\link arcon.hpp \endlink.

\subsection ss_rcon_basic_usage Basic Usage

The following example connects to a server, authenticates, runs the 'status'
command and prints the data the server sends back.

\include arcon_basic_usage.cpp

\subsection ss_rcon_state Session State

- constructing a \link arcon::session \endlink opens the connection and waits
  for it; \link arcon::session::is_connected() \endlink is true afterwards.
- \link arcon::session::authenticate() \endlink once.  A denied password
  disconnects the session and throws \link arcon::bad_password \endlink.
- \link arcon::session::execute() \endlink any number of times.
- \link arcon::session::disconnect() \endlink, or the server closes the
  connection.  The session cannot be reopened; make a new one.

Only one request waits for a reply at a time; a call made while another is
waiting throws \link arcon::request_pending \endlink.  Every wait is limited
by \link arcon::session_options::response_timeout \endlink.

\subsection ss_rcon_errors Errors

\link arcon::comm_error \endlink and subclasses are conversation errors: the
session is still usable (except after \link arcon::bad_password \endlink).
\link arcon::network_error \endlink and subclasses come from the transport.
Nothing is retried by the library.
*/

/*!
\page p_RCON_proto The Rcon Protocol

\section s_rcon_proto_reimplementation RCON Protocol Implementation

\subsection ss_rcon_message_format Message Format

- int32 packet size -- size of the data \b not including the packet size int32.
- int32 request id  -- for sequencing, and sometimes used as a return value.
- int32 command     -- SERVERDATA_EXECCOMMAND = 2 / SERVERDATA_AUTH = 3,
                       or SERVERDATA_RESPONSE_VALUE = 0 / SERVERDATA_AUTH_RESPONSE = 2
- string s1 -- is the command to run or return data.
- string s2 -- always empty.

Strings are 4096 bytes max and null-terminated.  Data may be split over multiple
packets.

\subsection ss_rcon_conversation An Example Conversation

- open tcp stream to the server
- send a packet with:
  - command = SERVERDATA_AUTH
  - request id = id_auth
  - s1 = the password
- receive a packet which mirrors the request as a SERVERDATA_RESPONSE_VALUE
  with no data.  It is skipped.
- receive a packet:
  - command == SERVERDATA_AUTH_RESPONSE
  - request id == id_auth to show auth success, -1 for rejected.
- now you're authed, send commands.
  - command = SERVERDATA_EXECCOMMAND
  - request id = 1 to 255, a different one each time
  - s1 = whichever command you will run
- the return data's request id mirrors the one you sent.  Packets with any
  other id are not part of the reply.
- return data may span multiple packets.  To know when it is finished, send an
  empty SERVERDATA_RESPONSE_VALUE with id_term + request id straight after the
  command: the server answers it after the last packet of the reply, with an
  empty mirror and then a second packet of the same id whose data is
  0x00 0x01 0x00 0x00.

\subsection ss_rcon_notes Notes

- the entire protocol is little endian, not network order.
- always include both strings, even if one is null (so there will be two nulls at the
  end normally)
- if you do not auth a connection, then a null packet is returned, but the request id
  is still mirrored.

\see http://developer.valvesoftware.com/wiki/Source_RCON_Protocol for documentation
     on the RCON protocol.
*/

#ifndef ARCON_HPP_k2n8vd1e
#define ARCON_HPP_k2n8vd1e

#include <arcon/common.hpp>
#include <arcon/packet.hpp>
#include <arcon/transport.hpp>
#include <arcon/tcp_transport.hpp>
#include <arcon/command.hpp>
#include <arcon/session.hpp>

#endif
