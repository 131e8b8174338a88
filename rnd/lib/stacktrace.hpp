#pragma once

#include <string>

namespace rnd
{
/**
 * Generates the current stacktrace
 */
std::string generate_stacktrace ();
}
