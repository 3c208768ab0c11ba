/**
 * @file ultracopy.h
 * @brief Main header for the ultracopy library
 * @version 0.1.0
 *
 * Primary include file for ultracopy: drives a robocopy-compatible bulk
 * copy utility, stages transfers from and to portable devices, and
 * archives trees before or after a transfer.
 *
 * @code
 * #include <kcenon/ultracopy/ultracopy.h>
 *
 * using namespace kcenon::ultracopy;
 *
 * auto engine = transfer_engine::builder()
 *     .with_session_store(std::make_shared<session_history>())
 *     .build();
 *
 * transfer_request request;
 * request.source = "C:\\Data";
 * request.destination = "\\\\backup\\share\\Data";
 * engine.value().start(request);
 * @endcode
 */

#ifndef KCENON_ULTRACOPY_ULTRACOPY_H
#define KCENON_ULTRACOPY_ULTRACOPY_H

#include <string>

#include "kcenon/ultracopy/config/feature_flags.h"

// Core pipeline
#include "kcenon/ultracopy/core/types.h"
#include "kcenon/ultracopy/core/transfer_types.h"
#include "kcenon/ultracopy/core/command_builder.h"
#include "kcenon/ultracopy/core/output_parser.h"
#include "kcenon/ultracopy/core/statistics_accumulator.h"
#include "kcenon/ultracopy/process/process_supervisor.h"
#include "kcenon/ultracopy/network/path_classifier.h"

// Devices
#include "kcenon/ultracopy/device/device_automation.h"
#include "kcenon/ultracopy/device/breadcrumb_navigator.h"
#include "kcenon/ultracopy/device/mounted_device.h"
#include "kcenon/ultracopy/device/staged_copy_coordinator.h"

// Archives and sessions
#include "kcenon/ultracopy/archive/archive_engine.h"
#include "kcenon/ultracopy/session/session_history.h"

// Facade
#include "kcenon/ultracopy/engine/transfer_engine.h"

namespace kcenon::ultracopy {

/**
 * @brief Library version information
 */
struct version {
    static constexpr int major = 0;
    static constexpr int minor = 1;
    static constexpr int patch = 0;

    /**
     * @brief Get version string
     * @return Version string in format "major.minor.patch"
     */
    static std::string to_string() {
        return std::to_string(major) + "." +
               std::to_string(minor) + "." +
               std::to_string(patch);
    }
};

}  // namespace kcenon::ultracopy

#endif  // KCENON_ULTRACOPY_ULTRACOPY_H
