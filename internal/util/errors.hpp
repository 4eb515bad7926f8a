#pragma once

#include <stdexcept>
#include <string>

namespace uploader::util {

/*
  A RunAborted error ends the whole run with FAILED; the checkpoint is
  kept so the task can resume. Per-file errors are plain std::exception
  and only count as a failed entry.
*/
class RunAborted : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// task root missing, or vanished while files were being read
class PathNotFound : public RunAborted {
 public:
  using RunAborted::RunAborted;
};

class PermissionDenied : public RunAborted {
 public:
  using RunAborted::RunAborted;
};

// bucket unreachable, or credentials rejected
class RemoteStoreUnreachable : public RunAborted {
 public:
  using RunAborted::RunAborted;
};

// Worker control call that is not legal in the current state.
class InvalidState : public std::logic_error {
 public:
  using std::logic_error::logic_error;
};

} // namespace uploader::util
