#ifndef LOG_HPP
#define LOG_HPP

#include <chrono>
#include <iostream>
#include <string>
#include <termcolor/termcolor.hpp>

inline void log_success(const std::string &message) {
  std::cout << termcolor::bright_green << "✓ " << termcolor::reset << message
            << "\n";
}

inline void log_warning(const std::string &message) {
  std::cerr << termcolor::yellow << "⚠ Warning: " << termcolor::reset
            << message << "\n";
}

inline void log_error(const std::string &message) {
  std::cerr << termcolor::bright_red << "✗ Error: " << termcolor::reset
            << message << "\n";
}

inline void log_file_result(const std::string &file, const std::string &note,
                            std::chrono::milliseconds elapsed) {
  std::cout << termcolor::bright_green << "  ✓ " << termcolor::reset
            << termcolor::white << file << termcolor::reset
            << termcolor::bright_blue << " " << note << " in "
            << elapsed.count() << "ms" << termcolor::reset << "\n";
}

#endif // LOG_HPP
