#ifndef LOCIO_H
#define LOCIO_H

#include "locio/FeatureTable.hpp"
#include "locio/Location.hpp"
#include "locio/Position.hpp"
#include "locio/errors.hpp"
#include "locio/parse.hpp"
#include "locio/resolve.hpp"

/** Parses GenBank location expressions and resolves them against sequences. */
namespace locio {}

#endif /* LOCIO_H */
