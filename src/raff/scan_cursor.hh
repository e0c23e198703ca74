//
// Internal scan position bookkeeping shared by the 32-bit scanners
//

#pragma once

#include <cstdint>
#include <optional>
#include <vector>
#include <raff/fourcc.hh>

namespace raff {

    // A chunk header as read from the file, before size resolution
    struct raw_header {
        fourcc id;
        std::uint32_t size = 0;
        std::uint64_t offset = 0;   // Offset of the header itself
    };

    // An entered LIST/FORM/CAT/PROP
    struct container_frame {
        fourcc id;
        fourcc type;
        std::uint64_t end = 0;      // One past the last content byte
        std::uint64_t padding = 0;  // Pad bytes following the container
        int depth = 0;
    };

    struct scan_cursor {
        std::uint64_t master_offset = 0;
        std::uint64_t container_end = 0;    // Declared end of the master container
        std::vector<container_frame> frames; // Innermost last
        std::optional<raw_header> pending;  // Header read ahead and not yet reported
    };
}
