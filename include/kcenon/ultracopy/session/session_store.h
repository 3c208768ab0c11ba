/**
 * @file session_store.h
 * @brief Sink for finished transfer sessions
 */

#ifndef KCENON_ULTRACOPY_SESSION_SESSION_STORE_H
#define KCENON_ULTRACOPY_SESSION_SESSION_STORE_H

#include <string>
#include <vector>

#include "kcenon/ultracopy/core/transfer_types.h"

namespace kcenon::ultracopy {

/**
 * @brief Everything known about one finished run
 */
struct session_record {
    std::string session_id;
    std::string operation;  ///< "copy", "mirror", "pull", "push", ...
    std::string source;
    std::string destination;
    transfer_outcome outcome;
    /// Speeds (MB/s) seen in progress snapshots, in arrival order
    std::vector<double> speed_samples;
};

/**
 * @brief Receives one record per finished run
 *
 * Called on the worker thread that finished the run.
 */
class session_store {
public:
    virtual ~session_store() = default;

    virtual void record_session(const session_record& record) = 0;
};

/**
 * @brief Timestamp-based id, "YYYYMMDD_HHMMSS_uuuuuu"
 */
[[nodiscard]] auto generate_session_id() -> std::string;

}  // namespace kcenon::ultracopy

#endif  // KCENON_ULTRACOPY_SESSION_SESSION_STORE_H
