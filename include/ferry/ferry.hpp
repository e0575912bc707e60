#pragma once

#include <string>

#include "ferry/core/config.hpp"
#include "ferry/core/error.hpp"
#include "ferry/core/types.hpp"
#include "ferry/core/waker.hpp"
#include "ferry/net/body.hpp"
#include "ferry/net/headers.hpp"
#include "ferry/net/http_client.hpp"
#include "ferry/net/metrics.hpp"
#include "ferry/net/pipe.hpp"
#include "ferry/net/request.hpp"
#include "ferry/net/response.hpp"

namespace ferry {

// Set up logging from the config and initialize libcurl. Call once from the
// main thread before creating any client.
void init(const ClientConfig& config = {});

// "ferry/<version> libcurl/<version> ..."
std::string version();

}  // namespace ferry
