#include <chrono>
#include <iostream>
#include <string>
#include <vector>

#include "ferry/ferry.hpp"
#include "spdlog/cfg/env.h"
#include "spdlog/spdlog.h"

using namespace ferry;

// Fetch every URL given on the command line concurrently and print a summary
// line for each. Config comes from the user config file and FERRY_* env vars.
int main(int argc, char* argv[]) {
  if (argc < 2) {
    std::cerr << "Usage: " << argv[0] << " <url> [url...]\n";
    return 2;
  }

  auto config = ClientConfig::from_env();
  config.request.metrics = true;
  init(config);

  // SPDLOG_LEVEL overrides the configured level
  spdlog::cfg::load_env_levels();

  spdlog::info("{}", version());

  HttpClient client(config);
  std::vector<std::pair<std::string, ResponseFuture>> pending;

  try {
    for (int i = 1; i < argc; i++) {
      pending.emplace_back(argv[i], client.send_async(Request::get(argv[i])));
    }
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  }

  int failures = 0;
  for (auto& [url, future] : pending) {
    auto result = future.get();
    if (result.failed()) {
      std::cout << url << "  [" << to_string(result.error->kind()) << "] " << result.error->message() << "\n";
      failures++;
      continue;
    }

    Response& response = *result.value;
    uint64_t size = 0;
    try {
      size = response.body().consume();
    } catch (const std::system_error& e) {
      std::cout << url << "  " << response.status() << "  body error: " << e.what() << "\n";
      failures++;
      continue;
    }

    std::cout << url << "  " << response.status() << " " << to_string(response.version()) << "  " << size
              << " bytes";
    if (response.metrics()) {
      auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(response.metrics()->total_time());
      std::cout << "  " << ms.count() << "ms";
    }
    std::cout << "\n";
  }

  return failures == 0 ? 0 : 1;
}
