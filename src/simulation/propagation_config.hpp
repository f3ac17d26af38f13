#pragma once

/// @file propagation_config.hpp
/// @brief Per-circuit propagation settings, fixed at construction

#include "timing/event_queue.hpp"

#include <cstddef>

namespace trilogic {

struct PropagationConfig {
    /// Defer each changed gate output by gate_delay on the circuit's event
    /// queue instead of writing it immediately
    bool delay_enabled = false;

    /// Uniform delay given to every gate created by the circuit
    Duration gate_delay{0};

    /// A wire warns when it has more writers than this. 1 warns on any
    /// contention; 2 tolerates a second writer silently.
    std::size_t contention_threshold = 1;

    /// Maximum nesting of wire updates within one cascade before it is
    /// treated as a feedback loop. Each level costs four native frames
    /// (update, set_from_wire, recompute, set_from_write), roughly 1 KiB
    /// unoptimised and several KiB under AddressSanitizer, so the default
    /// stays well inside an 8 MiB stack in every build.
    std::size_t max_cascade_depth = 1024;

    /// Print warnings to stderr as well as recording them
    bool log_to_stderr = true;

    /// Most recent warnings kept by the circuit's Diagnostics; older ones
    /// are dropped but still counted. 0 keeps no history.
    std::size_t warning_history = 256;
};

} // namespace trilogic
