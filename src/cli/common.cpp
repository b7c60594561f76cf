#include "cli/common.hpp"

#include "gitsaga/saga.hpp"

#include <algorithm>
#include <iostream>
#include <iterator>

namespace gitsaga::cli {

std::vector<std::string> collect_args(int argc, char **argv) {
  std::vector<std::string> args;
  for (int i = 1; i < argc; ++i)
    args.emplace_back(argv[i]);
  return args;
}

std::optional<std::string> take_option(std::vector<std::string> &args, std::string_view flag) {
  const auto it = std::ranges::find(args, flag);
  if (it == args.end() || std::next(it) == args.end())
    return std::nullopt;
  std::string value = *std::next(it);
  args.erase(it, std::next(it, 2));
  return value;
}

std::filesystem::path repo_root() { return std::filesystem::current_path(); }

std::shared_ptr<Logger> make_logger(const Settings &settings) {
  return std::make_shared<SpdLogger>(settings.log_level);
}

int report_error(std::string_view command, const std::exception &e) {
  std::cerr << command << ": " << e.what() << "\n";
  if (const auto *saga = dynamic_cast<const SagaError *>(&e)) {
    for (const auto &f : saga->rollback_failures())
      std::cerr << "  rollback of '" << f.step << "' failed: " << f.message << "\n";
  }
  return 1;
}

} // namespace gitsaga::cli
