#pragma once

#include <functional>

namespace taglimit {
namespace executor {

using Task = std::function<void()>;

// Boundary to whatever actually runs work asynchronously to the caller.
class TaskRunner {
public:
    virtual ~TaskRunner() = default;

    // Hands the task over for asynchronous execution.
    // Returns false if the runner does not accept it (e.g. already shut down);
    // ownership of a rejected task stays with the caller's copy.
    virtual bool Execute(Task task) = 0;
};

} // namespace executor
} // namespace taglimit
