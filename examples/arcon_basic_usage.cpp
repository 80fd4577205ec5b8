#include <arcon.hpp>

int main() {
  try {
    arcon::session_options options;
    options.host = "127.0.0.1";
    options.port = 27015;

    arcon::session conn(options);
    conn.authenticate("password");
    std::cout << conn.execute("status") << std::endl;
    conn.disconnect();
  }
  catch (arcon::bad_password &e) {
    std::cerr << "Authorisation was denied: " << e.what() << std::endl;
    return 1;
  }
  catch (arcon::error &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }
  return 0;
}
