/**
 * @file byte_order.hh
 * @brief Byte order of size fields in a container
 */

#pragma once

#include <raff/endian.hh>

namespace raff {
    /**
     * @enum byte_order
     * @brief Byte order used for multi-byte header fields
     */
    enum class byte_order {
        little, ///< RIFF, RF64, BW64, Wave64
        big     ///< IFF-85, RIFX
    };

    inline bool byte_order_native(byte_order bo) {
        switch (bo) {
            case byte_order::little:
                return is_little_endian;
            case byte_order::big:
                return is_big_endian;
        }
        // make compiler happy
        return false;
    }

    inline const char* to_string(byte_order bo) {
        return bo == byte_order::big ? "big" : "little";
    }
}
