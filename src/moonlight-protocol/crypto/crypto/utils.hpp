#pragma once

#include <string>

/**
 * @brief prints the OpenSSL error queue and throws a std::runtime_error with the given message
 */
[[noreturn]] void handle_openssl_error(const std::string &msg);
