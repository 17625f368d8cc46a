/* SPDX-License-Identifier: LGPL-2.1-or-later */
/* SPDX-FileCopyrightText: Copyright SUSE LLC */

/*
  Scoped translation of termination signals into a cancellation request
 */

#ifndef U_K_SIGNALCANCELLATION_H
#define U_K_SIGNALCANCELLATION_H

#include "UpdateOrchestrator.hpp"
#include <signal.h>

namespace UpdateKit {

/**
 * @brief Routes SIGINT, SIGHUP and SIGTERM to a CancellationToken while alive
 *
 * The previous dispositions are restored on destruction, so commands outside
 * of the guarded scope keep the default signal behaviour. Only one instance
 * may exist at a time.
 */
class SignalCancellation {
public:
    explicit SignalCancellation(CancellationToken &token);
    ~SignalCancellation();
    SignalCancellation(const SignalCancellation&) = delete;
    SignalCancellation& operator=(const SignalCancellation&) = delete;
private:
    static const int signals[3];
    struct sigaction previous[3];
};

} // namespace UpdateKit

#endif // U_K_SIGNALCANCELLATION_H
