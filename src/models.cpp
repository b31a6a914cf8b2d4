#include <showlink/models.h>

namespace showlink {

std::string EntryStateName(EntryState state) {
  switch (state) {
  case EntryState::kPending:
    return "pending";
  case EntryState::kClassifying:
    return "classifying";
  case EntryState::kResolving:
    return "resolving";
  case EntryState::kLinkChecking:
    return "link-checking";
  case EntryState::kSkipped:
    return "skipped";
  case EntryState::kLinked:
    return "linked";
  case EntryState::kErrored:
    return "errored";
  }
  return "unknown";
}

} // namespace showlink
