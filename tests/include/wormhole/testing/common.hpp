#pragma once

#include <wormhole/schema/chain.hpp>

#include <array>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <limits>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <boost/algorithm/string/replace.hpp>

#include <sys/wait.h>

namespace wormhole::testing {

// Every chain_t value, in numeric order.
inline std::vector<wormhole::schema::chain_t> all_chains() {
  auto out = std::vector<wormhole::schema::chain_t>{};
  out.reserve(std::numeric_limits<uint16_t>::max() + 1u);
  for (auto id = uint32_t{0}; id <= std::numeric_limits<uint16_t>::max();
       ++id) {
    out.push_back(wormhole::schema::from_u16(static_cast<uint16_t>(id)));
  }
  return out;
}

// Single-quotes a value for /bin/sh.
inline std::string shell_quote(const std::string_view value) {
  return "'" + boost::algorithm::replace_all_copy(std::string{value}, "'",
                                                  "'\\''") +
         "'";
}

// {exit code, stdout} of a shell command; exit code -1 when it could not
// be started or was killed by a signal.
inline std::pair<int, std::string> run_capture(const std::string& command) {
  auto* pipe = popen(command.c_str(), "r");
  if (pipe == nullptr) {
    return {-1, {}};
  }
  auto output = std::string{};
  auto chunk = std::array<char, 512>{};
  auto read = std::size_t{0};
  while ((read = std::fread(chunk.data(), 1, chunk.size(), pipe)) > 0) {
    output.append(chunk.data(), read);
  }
  const auto status = pclose(pipe);
  const auto exited = status != -1 && WIFEXITED(status) != 0;
  return {exited ? WEXITSTATUS(status) : -1, output};
}

}  // namespace wormhole::testing
