/**
 * @file decoder_registry.hh
 * @brief Payload decoders keyed by chunk identifier
 */

#pragma once

#include <any>
#include <cstddef>
#include <functional>
#include <optional>
#include <unordered_map>
#include <vector>
#include <raff/export_raff.h>
#include <raff/fourcc.hh>

namespace raff {

    /**
     * @typedef chunk_decoder
     * @brief Turns a chunk's raw payload into a structured value
     *
     * Decoders report bad input by throwing (decode_error or any other
     * std::exception); the dispatcher records the failure on that chunk only.
     */
    using chunk_decoder = std::function<std::any(const std::vector<std::byte>& payload)>;

    /**
     * @class decoder_registry
     * @brief Registry of chunk decoders with precedence rules
     *
     * Two levels of specificity:
     * 1. Decoders registered for a chunk id inside a given form type
     * 2. Global decoders for a chunk id
     *
     * Registering again for the same key replaces the earlier decoder.
     */
    class RAFF_EXPORT decoder_registry {
    public:
        /**
         * @brief Register a decoder for chunks inside a specific form type
         * @param form_type Form type to match, e.g. "WAVE" or "AIFF"
         * @param chunk_id Chunk id to decode
         * @param decoder Decoder function
         */
        decoder_registry& on_chunk_in_form(fourcc form_type, fourcc chunk_id, chunk_decoder decoder);

        /**
         * @brief Register a decoder for a chunk id regardless of form type
         */
        decoder_registry& on_chunk(fourcc chunk_id, chunk_decoder decoder);

        /**
         * @brief Find the decoder for a chunk
         * @param form Innermost form type of the chunk, if any
         * @param chunk_id Chunk id
         * @return The form-specific decoder, else the global one, else nullptr
         */
        [[nodiscard]] const chunk_decoder* find(const std::optional<fourcc>& form, fourcc chunk_id) const;

        [[nodiscard]] bool empty() const {
            return form_decoders_.empty() && global_decoders_.empty();
        }

    private:
        struct chunk_key {
            fourcc scope;
            fourcc id;

            bool operator==(const chunk_key& other) const;
        };

        struct chunk_key_hash {
            std::size_t operator()(const chunk_key& key) const noexcept;
        };

        std::unordered_map<chunk_key, chunk_decoder, chunk_key_hash> form_decoders_;
        std::unordered_map<fourcc, chunk_decoder> global_decoders_;
    };

} // namespace raff
