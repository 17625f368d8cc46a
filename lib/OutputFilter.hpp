/* SPDX-License-Identifier: LGPL-2.1-or-later */
/* SPDX-FileCopyrightText: Copyright SUSE LLC */

/*
  Classification of the manager's streamed install output
 */

#ifndef U_K_OUTPUTFILTER_H
#define U_K_OUTPUTFILTER_H

#include <string>

namespace UpdateKit {

enum class LineKind {
    Blank,          // nothing visible
    Spinner,        // animation frame: only - \ | / and whitespace
    ByteProgress,   // download progress: "12.0 MB / 50.3 MB", block glyph bars, "45%"
    Text            // anything worth showing
};

struct OutputFilter {
    static LineKind classify(const std::string &line);
};

} // namespace UpdateKit

#endif // U_K_OUTPUTFILTER_H
