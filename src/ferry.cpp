#include "ferry/ferry.hpp"

#include <curl/curl.h>

#include "core/version.hpp"
#include "engine/curl_engine.hpp"
#include "log/log.h"

namespace ferry {

void init(const ClientConfig& config) {
  init_log(config.log_level, config.log_file ? config.log_file->string() : "");
  CurlEngine::global_init();
}

std::string version() {
  return std::string("ferry/") + FERRY_VERSION_STRING + " " + curl_version();
}

}  // namespace ferry
