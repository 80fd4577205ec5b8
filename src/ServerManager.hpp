#ifndef SERVERMANAGER_HPP_sdfsdf
#define SERVERMANAGER_HPP_sdfsdf

#include <arcon.hpp>

#include <QMessageBox>
#include <QObject>
#include <QLineEdit>
#include <QTextEdit>

#include <string>

#if defined(QARCON_DEBUG_MESSAGES)
#  include <QDebug>
#  define QARCON_DEBUG_MESSAGE(words___) qDebug().nospace() << "qarcon: " << words___
#else
#  define QARCON_DEBUG_MESSAGE(words___)
#endif

/*!
\brief Runs the commands typed into the window.

The session is kept between commands and only replaced when the server details
change or the server dropped the connection.
*/
class ServerManager : public QObject {
  Q_OBJECT
  public:
    const QLineEdit &host_;
    const QLineEdit &port_;
    const QLineEdit &password_;
    const QLineEdit &command_;
    QTextEdit &output_;

    ServerManager(const QLineEdit &host, const QLineEdit &port,
                  const QLineEdit &password, const QLineEdit &command, QTextEdit &output)
    : host_(host), port_(port), password_(password), command_(command), output_(output),
      session_(NULL), session_port_(0) { }

    ~ServerManager();

  public slots:
    void commandEntered();
    void disconnectServer();

  signals:
    //! True once authenticated, false when the session is dropped.
    void connectionChanged(bool connected);

  private:
    arcon::session *session_;
    std::string session_host_;
    int session_port_;
    std::string session_password_;

    //! Connect and authenticate unless the current session is still good.  NULL on failure.
    arcon::session *ensureSession();
    void dropSession();
    void generalError(const char *header, const char *text, QMessageBox::Icon i = QMessageBox::Warning);
};

#endif
