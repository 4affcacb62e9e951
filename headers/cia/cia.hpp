#ifndef CIA_CIA_HPP
#define CIA_CIA_HPP

/**
 * @file cia.hpp
 * @brief Main header for the Change Impact Analyzer library.
 *
 * Pulls in the session API and the types it returns. Include specific
 * headers for narrower dependencies.
 */

#include "version.hpp"
#include "error.hpp"
#include "result.hpp"
#include "types.hpp"
#include "config.hpp"
#include "session.hpp"

#endif //CIA_CIA_HPP
