// Copyright (C) 2008 James Weber
// Under the GPL3, see COPYING
/*!
\file
\brief Client application to execute rcon commands.

\internal

\todo More options, eg don't print any output -- especially relevant for a scripted
      session.
*/

#include <arcon.hpp>

#include <cstdio>
#include <cstdlib> // exit_failure etc.
#include <cstring>
#include <unistd.h> // isatty

//! Run one command and handle errors. >0 on error.
int single_command(arcon::session &conn, const std::string &command);
//! Run multiple commands from an istream.  >0 on error.
int stream_command(arcon::session &conn, std::istream &in, const std::string &host, int port);

void print_usage(const char *pname) {
  std::cout
      << pname << " -p password [OPTIONS] command [args]...\n"
      "Executes command with args on an RCON server and retrieve the output.  Command\n"
      "can be a dash (-) to trigger reading from stdin.  The program automatically\n"
      "reads from stdin if it was redirected.\n\n"
      "  -p  password (required argument)\n"
      "  -P  port (default: 27015)\n"
      "  -s  server (default: localhost)\n"
      "  -t  timeout for connecting and each reply in milliseconds (default: 1000)\n"
      "  -m  maximum packet size in bytes, 0 for no limit (default: 4096)\n"
      "  -e  body encoding: ascii or utf8 (default: ascii)\n"
      "  -M  wait for replies which span multiple packets\n"
      "  -h  this message and exit.\n\n"
      "arcon Copyright (C) 2008 James Weber\n"
      "This program comes with ABSOLUTELY NO WARRANTY.  This is free software, and you\n"
      "are welcome to distribute it under the terms of the GPLv3.\n"
      << std::flush;
}

bool check_required_arg(int argc, const char * const argv[], int i, const char *arg) {
  if (i >= argc || argv[i][0] == '-') {
    std::cerr << "Error: option " << arg << " requires an argument." << std::endl;
    print_usage(argv[0]);
    return false;
  }
  else {
    return true;
  }
}

//! Parse a whole string as a number in [min, max].
bool parse_number(const char *s, long min, long max, long &out) {
  char *end = NULL;
  errno = 0;
  long v = strtol(s, &end, 10);
  if (errno != 0 || end == s || *end != '\0' || v < min || v > max) {
    return false;
  }
  out = v;
  return true;
}

//! Read a list of commands from some stream
int stream_command(arcon::session &conn, std::istream &in, const std::string &host, int port) {
  std::string cmd;
  while (std::getline(in, cmd)) {
    if (cmd == "") continue;

    std::cout << host << ":" << port << " > rcon " << cmd << std::endl;
    if (int r = single_command(conn, cmd)) return r;
  }

  return EXIT_SUCCESS;
}

int single_command(arcon::session &conn, const std::string &command) {
  try {
    std::string data = conn.execute(command);
    if (data.length() == 0 || data[data.length() - 1] != '\n') {
      std::cout << data << std::endl;
    }
    else {
      std::cout << data << std::flush;
    }
  }
  catch (arcon::error &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return EXIT_FAILURE;
  }
  return EXIT_SUCCESS;
}

int main(const int argc, const char *const argv[]) {
  arcon::session_options options;
  options.host = "localhost";
  const char *pass = "";
  bool read_from_stdin = false;

  int i = 1;
  while (i < argc) {
    if (strcmp(argv[i], "-h") == 0) {
      print_usage(argv[0]);
      return 0;
    }
    else if (strcmp(argv[i], "-p") == 0) {
      ++i;
      if (! check_required_arg(argc, argv, i, "-p")) return EXIT_FAILURE;

      pass = argv[i];
    }
    else if (strcmp(argv[i], "-P") == 0) {
      ++i;
      if (! check_required_arg(argc, argv, i, "-P")) return EXIT_FAILURE;

      long port;
      if (! parse_number(argv[i], 1, 65535, port)) {
        std::cerr << "Error: -P must be a port number." << std::endl;
        return EXIT_FAILURE;
      }
      options.port = static_cast<int>(port);
    }
    else if (strcmp(argv[i], "-s") == 0) {
      ++i;
      if (! check_required_arg(argc, argv, i, "-s")) return EXIT_FAILURE;

      options.host = argv[i];
    }
    else if (strcmp(argv[i], "-t") == 0) {
      ++i;
      if (! check_required_arg(argc, argv, i, "-t")) return EXIT_FAILURE;

      if (! parse_number(argv[i], 1, 3600 * 1000, options.response_timeout)) {
        std::cerr << "Error: -t must be a positive number of milliseconds." << std::endl;
        return EXIT_FAILURE;
      }
    }
    else if (strcmp(argv[i], "-m") == 0) {
      ++i;
      if (! check_required_arg(argc, argv, i, "-m")) return EXIT_FAILURE;

      long size;
      if (! parse_number(argv[i], 0, 1024 * 1024, size)) {
        std::cerr << "Error: -m must be a size in bytes." << std::endl;
        return EXIT_FAILURE;
      }
      options.max_packet_size = static_cast<size_t>(size);
    }
    else if (strcmp(argv[i], "-e") == 0) {
      ++i;
      if (! check_required_arg(argc, argv, i, "-e")) return EXIT_FAILURE;

      try {
        options.encoding = arcon::parse_encoding(argv[i]);
      }
      catch (std::invalid_argument &e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return EXIT_FAILURE;
      }
    }
    else if (strcmp(argv[i], "-M") == 0) {
      options.multi_packet = true;
    }
    else if (strcmp(argv[i], "-") == 0) {
      read_from_stdin = true;
    }
    else if (*argv[i] != '-') {
      // end of arguments
      break;
    }
    else {
      std::cerr << "Error: unknown option " << argv[i] << "." << std::endl;
      print_usage(argv[0]);
      return EXIT_FAILURE;
    }
    ++i;
  }

  read_from_stdin = read_from_stdin || ! isatty(fileno(stdin));

  if (pass[0] == '\0') {
    std::cerr << "Error: no password parameter." << std::endl;
    print_usage(argv[0]);
    return EXIT_FAILURE;
  }

  if (i >= argc && ! read_from_stdin) {
    std::cerr << "Error: no command given." << std::endl;
    print_usage(argv[0]);
    return EXIT_FAILURE;
  }

  int result = EXIT_SUCCESS;
  try {
    arcon::session conn(options);
    conn.authenticate(pass);

    if (read_from_stdin && i >= argc) {
      result = stream_command(conn, std::cin, options.host, options.port);
    }
    else {
      std::string command = argv[i++];
      while (i < argc) {
        command += " ";
        command += argv[i++];
      }
      std::cout << options.host << ":" << options.port << " > rcon " << command << std::endl;
      result = single_command(conn, command);
    }

    if (conn.is_connected()) conn.disconnect();
  }
  catch (std::invalid_argument &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return EXIT_FAILURE;
  }
  catch (arcon::error &e) {
    std::cerr << "Connection failure: " << e.what() << std::endl;
    return EXIT_FAILURE;
  }

  return result;
}
