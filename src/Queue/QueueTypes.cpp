#include "QueueTypes.hpp"

namespace dlqueue {

ActiveEntryView mergeEntryStatus(const BacklogSnapshot& entry,
                                 const std::optional<TaskHandle>& handle,
                                 const std::optional<TaskSnapshot>& live) {
  ActiveEntryView view;
  view.entry = entry;
  view.handle = handle;
  if (!handle) {
    return view;
  }
  if (live) {
    view.live = live;
    view.liveState = taskStateName(live->state);
  } else {
    view.liveState = kUnknownAtDownloader;
  }
  return view;
}

}  // namespace dlqueue
