#pragma once

#include <optional>
#include <string>

namespace ds::preview::job {

// Wake-up hint for the worker. Never authoritative: the worker re-reads the
// store before acting, so a dropped or stale task costs nothing but latency.
struct Task {
    std::string file_id;
    std::optional<std::string> requested_by_id;
};

}
