#ifndef GBIO_H
#define GBIO_H

#include "gbio/GenbankReader.hpp"
#include "gbio/GenbankRecord.hpp"
#include "gbio/Metadata.hpp"

/** Reading of GenBank flat files (header, feature table, sequence). */
namespace gbio {}

#endif /* GBIO_H */
