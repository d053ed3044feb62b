/**
 * @file smoothwrite_main.cpp
 * @brief SmoothWrite command-line entry point
 *
 * Usage:
 *   smoothwrite list             # Notes, most recently modified first
 *   smoothwrite new "<p>Hi</p>"  # Create a note
 *   smoothwrite --help           # Show help
 */

#include "SmoothWrite/app/launcher.hpp"
#include <QGuiApplication>
#include <iostream>

int main(int argc, char* argv[]) {
  // Titles are rendered with QTextDocument; no window is ever shown
  if (qEnvironmentVariableIsEmpty("QT_QPA_PLATFORM")) {
    qputenv("QT_QPA_PLATFORM", "offscreen");
  }

  QGuiApplication app(argc, argv);
  QGuiApplication::setApplicationName(QStringLiteral("SmoothWrite"));

  SmoothWrite::app::Launcher launcher(std::cout, std::cerr);
  return launcher.run(argc, argv);
}
