// Copyright (C) 2008 James Weber
// Under the LGPL3, see COPYING
/*!
\file
\brief The RCON packet format.

All values taken and returned are in host order; the conversion to the
protocol's little endian order is transparent.
*/

#ifndef ARCON_PACKET_HPP_q8vn2kxe
#define ARCON_PACKET_HPP_q8vn2kxe

#include <arcon/common.hpp>

#include <string>
#include <stdexcept>

#ifdef ARCON_PACKET_DEBUG_MESSAGES
#  define PACKET_DEBUG_MESSAGE(x__) ARCON_DEBUG_MESSAGE(x__)
#else
#  define PACKET_DEBUG_MESSAGE(x__)
#endif

namespace arcon {
  //! Values sent in the packet as the command (type) field.
  typedef enum {
    auth_request = 3,
    auth_response = 2,
    exec_request = 2,
    exec_response = 0
  } packet_type_t;

  //! How the body text is converted to and from bytes.
  typedef enum {
    //! Only the low 7 bits of each byte are used.
    encoding_ascii,
    //! Bytes are passed through untouched.
    encoding_utf8
  } encoding_t;

  //! Sent with the auth request; the server mirrors it back in an 'ok' response.
  const int32_t id_auth = 0x999;

  //! Server returns this as the request id to say the password was bad.
  const int32_t id_auth_denied = -1;

  /*!
  \brief Base id of the empty packet which marks the end of a multi-packet reply.

  A request's terminator carries id_term plus the request id, so terminators of
  earlier requests (the server sends two for each) never end a later reply.
  With ids of 1 to 255 this stays clear of id_auth.
  */
  const int32_t id_term = 0x888;

  //! Maximum length of one of the string fields.
  const size_t max_string_length = 4096;

  //! int32 id, int32 type and two nulls; the size prefix is not counted.
  const size_t min_packet_size = sizeof(int32_t) * 2 + 1 + 1;

  //! Two ints, two strings.
  const size_t max_packet_size = sizeof(int32_t) * 2 + max_string_length * 2;

  //! Number of bytes encode() produces for a body of this length.
  inline size_t encoded_size(size_t body_length) {
    return sizeof(int32_t) * 3 + body_length + 2;
  }

  //! A decoded packet.
  struct packet {
    int32_t type;
    int32_t id;
    std::string body;

    packet() : type(exec_response), id(0) {}
    packet(int32_t t, int32_t i, const std::string &b) : type(t), id(i), body(b) {}

    bool operator==(const packet &o) const {
      return type == o.type && id == o.id && body == o.body;
    }
  };

  //! \throws std::invalid_argument  for an unknown name.
  inline encoding_t parse_encoding(const std::string &name) {
    if (name == "ascii") return encoding_ascii;
    else if (name == "utf8" || name == "utf-8") return encoding_utf8;
    throw std::invalid_argument("unknown encoding '" + name + "' (use ascii or utf8)");
  }

  inline const char *encoding_name(encoding_t e) {
    return (e == encoding_utf8) ? "utf8" : "ascii";
  }

  //! Apply the encoding to body bytes.  The same conversion is used in both directions.
  inline std::string convert_body(const std::string &body, encoding_t enc) {
    if (enc == encoding_utf8) return body;

    std::string out(body);
    for (std::string::iterator i = out.begin(); i != out.end(); ++i) {
      *i = static_cast<char>(static_cast<unsigned char>(*i) & 0x7F);
    }
    return out;
  }

  /*!
  \brief Serialise a packet.

  - int32 size of the rest of the packet
  - int32 request id
  - int32 type
  - body, null terminated
  - an empty string (one null)
  */
  inline std::string encode(int32_t type, int32_t id, const std::string &body, encoding_t enc = encoding_ascii) {
    std::string b(convert_body(body, enc));
    // int32 + int32 + payload.length + null + null;
    int32_t size = static_cast<int32_t>(sizeof(int32_t) * 2 + b.length() + 1 + 1);

    PACKET_DEBUG_MESSAGE("Encoding size: " << size << " id: " << id << " type: " << type);

    std::string out;
    out.reserve(size + sizeof(int32_t));
    to_buffer(out, size);
    to_buffer(out, id);
    to_buffer(out, type);
    out.append(b);
    out.push_back('\0');
    out.push_back('\0');
    return out;
  }

  inline std::string encode(const packet &p, encoding_t enc = encoding_ascii) {
    return encode(p.type, p.id, p.body, enc);
  }

  /*!
  \brief Parse one complete message.

  \throws proto_error  size prefix does not agree with the message, the size is out
                       of range or the body is not null terminated.
  */
  inline packet decode(const std::string &bytes, encoding_t enc = encoding_ascii) {
    if (bytes.length() < sizeof(int32_t)) {
      throw proto_error("packet is too short to have a size.");
    }

    size_t idx = 0;
    int32_t size = from_buffer<int32_t>(bytes.data(), idx);

    if (size < static_cast<int32_t>(min_packet_size) || size > static_cast<int32_t>(max_packet_size)) {
      throw proto_error("invalid data size.");
    }

    if (static_cast<size_t>(size) != bytes.length() - sizeof(int32_t)) {
      throw proto_error("packet size does not match the data received.");
    }

    packet p;
    p.id = from_buffer<int32_t>(bytes.data(), idx);
    p.type = from_buffer<int32_t>(bytes.data(), idx);

    if (bytes[bytes.length() - 1] != '\0') {
      throw proto_error("packet is not null terminated.");
    }

    // the body is the first string; the second is always empty from source servers.
    std::string::size_type end = bytes.find('\0', idx);
    p.body = convert_body(bytes.substr(idx, end - idx), enc);

    PACKET_DEBUG_MESSAGE("Decoded size: " << size << " id: " << p.id << " type: " << p.type
                         << " body: '" << p.body << "'");
    return p;
  }
}

#endif
