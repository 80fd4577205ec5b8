// Copyright (C) 2008 James Weber
// Under the GPL3, see COPYING
/*!
\file
\brief Qt console for an RCON server.

\internal

\todo
- save and subsequently reload window size and the last server details
- up arrow on the command box shows previous commands
*/

#include <arcon.hpp>

#include <QObject>
#include <QApplication>
#include <QPushButton>
#include <QTextEdit>
#include <QLineEdit>
#include <QHBoxLayout>
#include <QVBoxLayout>
#include <QGridLayout>
#include <QLabel>
#include <QFontMetrics>
#include <QWidget>

#include "ServerManager.hpp"

int main(int argc, char *argv[]) {
  QApplication app(argc, argv);

  QWidget main_window;
  main_window.setWindowTitle("qarcon");
  main_window.resize(500, 600);

  QLabel *server_name_label(new QLabel("<b>Server Name:</b>", &main_window));
  QLineEdit *server_name(new QLineEdit("127.0.0.1", &main_window));
  QLabel *server_port_label(new QLabel("<b>Port:</b>", &main_window));
  QLineEdit *server_port(new QLineEdit("27015", &main_window));
  QLabel *server_password_label(new QLabel("<b>Password:</b>", &main_window));
  QLineEdit *server_password(new QLineEdit(&main_window));
  server_password->setEchoMode(QLineEdit::Password);
  server_password->setMaxLength(arcon::max_string_length - 1);
  QFontMetrics f = server_password->fontMetrics();
  QSize s(server_password->minimumSizeHint());
  s.setWidth(f.averageCharWidth() * 15); /// <-- not exact at all
  server_password->setMaximumSize(s);

  server_port->setSizePolicy(QSizePolicy(QSizePolicy::Minimum, QSizePolicy::Minimum));
  f = server_port->fontMetrics();
  server_port->setMaxLength(5);
  s = server_port->minimumSizeHint();
  s.setWidth(f.averageCharWidth() * 7); /// <-- 7 is about the right width for 5 0s
  server_port->setMaximumSize(s);

  QHBoxLayout *server_details(new QHBoxLayout());
  server_details->addWidget(server_name_label);
  server_details->addWidget(server_name);
  server_details->addWidget(server_port_label);
  server_details->addWidget(server_port);
  server_details->addWidget(server_password_label);
  server_details->addWidget(server_password);

  QTextEdit *server_output(new QTextEdit(&main_window));
  server_output->setReadOnly(true);

  QLabel *send_command_label(new QLabel("<b>Command:</b>", &main_window));
  QLineEdit *command_input(new QLineEdit(&main_window));
  command_input->setMaxLength(arcon::max_string_length - 1);
  QPushButton *send_button(new QPushButton("Send", &main_window));
  QPushButton *disconnect_button(new QPushButton("Disconnect", &main_window));
  QPushButton *quit_button(new QPushButton("Quit", &main_window));
  disconnect_button->setEnabled(false);

  QHBoxLayout *send_panel(new QHBoxLayout());
  send_panel->addWidget(send_command_label);
  send_panel->addWidget(command_input);
  send_panel->addWidget(send_button);
  send_panel->addWidget(disconnect_button);
  send_panel->addWidget(quit_button);

  QGridLayout *main_layout(new QGridLayout());
  main_layout->addLayout(server_details, 0, 0);
  main_layout->addWidget(server_output, 1, 0);
  main_layout->addLayout(send_panel, 2, 0);

  ServerManager mgr(*server_name, *server_port, *server_password, *command_input, *server_output);

  QObject::connect(send_button, SIGNAL(clicked()),
                   &mgr, SLOT(commandEntered()));

  QObject::connect(command_input, SIGNAL(returnPressed()),
                   &mgr, SLOT(commandEntered()));

  QObject::connect(command_input, SIGNAL(returnPressed()),
                   command_input, SLOT(clear()));

  QObject::connect(disconnect_button, SIGNAL(clicked()),
                   &mgr, SLOT(disconnectServer()));

  QObject::connect(&mgr, SIGNAL(connectionChanged(bool)),
                   disconnect_button, SLOT(setEnabled(bool)));

  QObject::connect(quit_button, SIGNAL(clicked()),
                   &app, SLOT(quit()));

  main_window.setLayout(main_layout);
  main_window.show();

  return app.exec();
}
