/**
 * @file payload_dispatcher.hh
 * @brief Replaces raw chunk payloads with decoded values
 */

#pragma once

#include <any>
#include <cstddef>
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include <raff/export_raff.h>
#include <raff/chunk_record.hh>
#include <raff/chunk_scanner.hh>
#include <raff/decoder_registry.hh>

namespace raff {

    /**
     * @struct decode_failure
     * @brief A decoder rejected one chunk's payload
     */
    struct decode_failure {
        std::string message;
    };

    /**
     * @typedef chunk_value
     * @brief What a dispatched chunk carries
     *
     * - std::monostate: the payload was not materialized
     * - std::vector<std::byte>: no decoder is registered, raw bytes passed through
     * - std::any: the decoder's result
     * - decode_failure: the decoder threw
     */
    using chunk_value = std::variant<std::monostate, std::vector<std::byte>, std::any, decode_failure>;

    /**
     * @struct decoded_chunk
     * @brief A chunk record with its payload moved into value
     */
    struct decoded_chunk {
        chunk_record record;
        chunk_value value;

        [[nodiscard]] bool is_decoded() const { return std::holds_alternative<std::any>(value); }
        [[nodiscard]] bool is_raw() const { return std::holds_alternative<std::vector<std::byte>>(value); }
        [[nodiscard]] bool failed() const { return std::holds_alternative<decode_failure>(value); }

        /// Decoded value cast to T; throws std::bad_any_cast or std::bad_variant_access on mismatch
        template<typename T>
        [[nodiscard]] T as() const {
            return std::any_cast<T>(std::get<std::any>(value));
        }
    };

    /**
     * @class payload_dispatcher
     * @brief Wraps a chunk_scanner and decodes each materialized payload
     *
     * Fatal scan errors propagate from next() exactly as from the scanner;
     * decoder errors never do.
     */
    class RAFF_EXPORT payload_dispatcher {
    public:
        /**
         * @param scanner Scanner to pull from; should materialize payloads
         * @param decoders Registry consulted per chunk; must outlive the dispatcher
         */
        payload_dispatcher(chunk_scanner& scanner, const decoder_registry& decoders);

        /**
         * @brief Pull and decode the next chunk
         * @return The decoded chunk, or nullopt at the clean end
         */
        std::optional<decoded_chunk> next();

        [[nodiscard]] const master_header& master() const { return m_scanner.master(); }

    private:
        decoded_chunk dispatch(chunk_record record) const;

        chunk_scanner& m_scanner;
        const decoder_registry& m_decoders;
    };

} // namespace raff
