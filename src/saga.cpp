#include "gitsaga/saga.hpp"

namespace gitsaga {

namespace {

std::string describe(const std::string &saga_name, const std::string &failed_step,
                     const std::string &cause, const std::string &context,
                     const std::vector<RollbackFailure> &failures, std::size_t attempted) {
  std::string msg = saga_name + " failed at step '" + failed_step + "'";
  if (!context.empty())
    msg += " in " + context;
  msg += ": " + cause;
  if (attempted > 0 && failures.size() == attempted) {
    msg += " (rollback failed: " + failures.front().step + ": " + failures.front().message;
    if (failures.size() > 1)
      msg += ", and " + std::to_string(failures.size() - 1) + " more";
    msg += ")";
  }
  return msg;
}

} // namespace

SagaError::SagaError(std::string saga_name, std::string failed_step, std::string cause,
                     std::string context, std::vector<RollbackFailure> rollback_failures,
                     std::size_t rollbacks_attempted, std::exception_ptr original)
    : std::runtime_error(describe(saga_name, failed_step, cause, context, rollback_failures,
                                  rollbacks_attempted)),
      saga_name_(std::move(saga_name)), failed_step_(std::move(failed_step)),
      cause_(std::move(cause)), context_(std::move(context)),
      rollback_failures_(std::move(rollback_failures)), rollbacks_attempted_(rollbacks_attempted),
      original_(std::move(original)) {}

} // namespace gitsaga
