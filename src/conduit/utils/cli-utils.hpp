
#pragma once

#include <cstdint>
#include <string>

/**
 * @defgroup cli Command Line Utils
 * @ingroup conduit-utils
 *
 * The `conduit` method for parsing command-line arguments.
 *
 * @include echo-client_ex.cpp
 */

namespace conduit::cli
{
std::string safe_arg_str(int argc, char** argv, int& i);
int safe_arg_int(int argc, char** argv, int& i);
uint16_t safe_arg_port(int argc, char** argv, int& i);

} // namespace conduit::cli
