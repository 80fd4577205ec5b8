#include <arcon.hpp>

int main() {
  arcon::session_options options;
  options.response_timeout = 2000;
  options.multi_packet = true;

  try {
    arcon::session conn(options);

    size_t retries = 3;
    while (true) {
      try {
        conn.authenticate("password");
        break;
      }
      catch (arcon::timeout_error &e) {
        if (--retries == 0) {
          std::cerr << "Authorisation retries limit reached: " << e.what() << std::endl;
          return 1;
        }
      }
    }

    retries = 3;
    while (retries--) {
      try {
        std::cout << conn.execute("status") << std::endl;
        break;
      }
      catch (arcon::timeout_error &e) {
        std::cerr << "There was an error: " << e.what() << std::endl;
      }
    }
  }
  catch (arcon::connection_error &e) {
    std::cerr << "Unable to connect: " << e.what() << std::endl;
    return 1;
  }
  catch (arcon::bad_password &e) {
    std::cerr << "Authorisation was denied: " << e.what() << std::endl;
    return 1;
  }
  catch (arcon::proto_error &e) {
    std::cerr << "There was an error in protocol: " << e.what() << std::endl;
    return 1;
  }
  catch (arcon::error &e) {
    std::cerr << e.what() << std::endl;
    return 1;
  }
  return 0;
}
