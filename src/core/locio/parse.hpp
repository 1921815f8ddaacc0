#ifndef LOCIO_PARSE_H
#define LOCIO_PARSE_H

#include "Location.hpp"
#include <string>

namespace locio {

/**
 * Parses a GenBank location expression.
 *
 * Accepts single positions ("5", "<5", ">5", "?", "?5"), ranges ("2..40"),
 * sites between bases ("5^6"), remote locations ("J00194.1:1..10") and the
 * operators complement(), join() and order(), nested to any depth.
 * Whitespace between tokens is ignored. Nested joins are flattened.
 *
 * \throws LocationSyntaxError if the text is not a valid location
 */
Location parseLocation(const std::string& raw);

} // namespace locio

#endif // LOCIO_PARSE_H
