#pragma once
#include <string>
#include <string_view>
#include <vector>

namespace gitsaga {

// Validate 40-char lowercase/uppercase hex
auto looks_hex40(std::string_view str) -> bool;

// String helpers
namespace strutil {
  // Strip trailing CR/LF characters in place
  void rstrip_newlines(std::string& str);

  // Copy without leading/trailing spaces, tabs, CR and LF
  auto trim(std::string_view sv) -> std::string;

  // Split on '\n'; drops a trailing empty line and strips CR
  auto split_lines(std::string_view text) -> std::vector<std::string>;

  // Replace every occurrence of `from` (non-empty) with `to`
  auto replace_all(std::string str, std::string_view from, std::string_view to) -> std::string;
}

}
