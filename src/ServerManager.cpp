#include "ServerManager.hpp"

#include <QString>

ServerManager::~ServerManager() {
  delete session_;
}

void ServerManager::commandEntered() {
  if (command_.text().length() == 0) {
    return;
  }

  if (port_.text().length() == 0 || host_.text().length() == 0) {
    generalError("Incomplete server details.", "Please give the server name and port number.");
    return;
  }

  arcon::session *conn = ensureSession();
  if (conn == NULL) return;

  std::string command(command_.text().toUtf8().constData());
  output_.append(QString("<b>&gt; ") + command_.text().toHtmlEscaped() + "</b>");
  QARCON_DEBUG_MESSAGE("sending " << command_.text());

  try {
    std::string data = conn->execute(command);
    output_.append(QString::fromUtf8(data.c_str()).toHtmlEscaped());
  }
  catch (arcon::connection_closed &e) {
    dropSession();
    generalError("The server closed the connection.", e.what());
  }
  catch (arcon::not_connected &e) {
    dropSession();
    generalError("The connection was lost.", e.what());
  }
  catch (arcon::error &e) {
    generalError("The command returned an error.", e.what());
  }
}

void ServerManager::disconnectServer() {
  if (session_ == NULL) return;

  try {
    if (session_->is_connected()) session_->disconnect();
  }
  catch (arcon::error &e) {
    generalError("Disconnecting failed.", e.what());
  }
  dropSession();
}

arcon::session *ServerManager::ensureSession() {
  std::string host(host_.text().toUtf8().constData());
  std::string password(password_.text().toUtf8().constData());
  bool port_ok = false;
  int port = port_.text().toInt(&port_ok);
  if (! port_ok) {
    generalError("Invalid port.", "The port must be a number.");
    return NULL;
  }

  if (session_ != NULL) {
    if (session_->is_connected() && host == session_host_ && port == session_port_
        && password == session_password_) {
      return session_;
    }
    disconnectServer();
  }

  arcon::session_options options;
  options.host = host;
  options.port = port;

  try {
    QARCON_DEBUG_MESSAGE("opening " << QString::fromStdString(host) << ":" << port);
    session_ = new arcon::session(options);
    session_host_ = host;
    session_port_ = port;
    session_password_ = password;

    session_->authenticate(password);
  }
  catch (std::invalid_argument &e) {
    dropSession();
    generalError("Invalid server details.", e.what());
    return NULL;
  }
  catch (arcon::bad_password &e) {
    dropSession();
    generalError("The password was not accepted.", e.what());
    return NULL;
  }
  catch (arcon::error &e) {
    dropSession();
    generalError("Unable to connect.", e.what());
    return NULL;
  }

  emit connectionChanged(true);
  return session_;
}

void ServerManager::dropSession() {
  if (session_ == NULL) return;

  delete session_;
  session_ = NULL;
  emit connectionChanged(false);
}

void ServerManager::generalError(const char *header, const char *text, QMessageBox::Icon icon) {
  QMessageBox msg_box;
  msg_box.setIcon(icon);
  msg_box.setText(header);
  msg_box.setInformativeText(text);
  msg_box.exec();
}
