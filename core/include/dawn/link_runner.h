#pragma once

#include "dawn/link_api.h"
#include "dawn/sandbox.h"

#include <string>
#include <vector>

namespace dawn {

struct LinkRunOutcome {
    bool timed_out{false};
    // The child died without handing back a result (signal, _exit, crash).
    bool crashed{false};
    int exit_code{0};
    // what() of an exception thrown by the link function
    std::string exception;
    // internal runner failure (pipe/fork); the link never ran
    std::string error;

    LinkResult result;
    std::vector<PublishedArtifact> published;

    double cpu_sec{0.0};
    double mem_mb_peak{0.0};
};

// Runs fn(ctx) in a forked child whose working directory is the sandbox
// root, in its own process group. On deadline expiry the whole group is
// SIGKILLed. Published records travel back over a pipe; the caller is
// responsible for re-registering (and so re-digesting) them.
//
// timeout_sec <= 0 disables the deadline.
LinkRunOutcome run_link_isolated(const LinkFn& fn, LinkContext& ctx, Sandbox& sandbox, int timeout_sec);

} // namespace dawn
