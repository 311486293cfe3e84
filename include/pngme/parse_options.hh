/**
 * @file parse_options.hh
 * @brief Parsing options and configuration for PNG containers
 */

#pragma once

#include <functional>
#include <string_view>
#include <cstdint>

namespace pngme {

    /**
     * @struct parse_options
     * @brief Configuration options for parsing PNG containers
     *
     * Controls the payload size limit and how non-fatal findings are
     * reported. Structural rules (signature, framing, checksums, type codes)
     * are always enforced.
     */
    struct parse_options {
        /**
         * @brief Strict parsing mode
         *
         * When true, a chunk whose declared length exceeds max_chunk_size
         * fails the parse. When false, it is reported as a warning and
         * parsed normally.
         */
        bool strict = true;

        /**
         * @brief Maximum allowed chunk payload in bytes
         *
         * Default is 2^31 - 1, the largest length a PNG chunk may declare.
         */
        std::uint32_t max_chunk_size = 0x7FFFFFFFu;

        /**
         * @typedef warning_handler
         * @brief Callback function type for handling warnings
         * @param offset Byte offset of the chunk the warning refers to
         * @param category Warning category ("reserved_bit", "size_limit",
         *                 "missing_iend", "after_iend")
         * @param message Human-readable warning message
         */
        using warning_handler = std::function<void(
            std::uint64_t offset,
            std::string_view category,
            std::string_view message
        )>;

        /**
         * @brief Optional warning handler callback
         *
         * If not set, warnings are silently ignored.
         */
        warning_handler on_warning;
    };

} // namespace pngme
