#pragma once

#include <string>

#include "domain/ObjectStore.hpp"

namespace adapters::s3 {

// Parses a ListObjectsV2 response body. Throws domain::ListingError.
domain::ListObjectsPage parseListBucketResult(const std::string& xml);

}  // namespace adapters::s3
