//
// Per-chunk decoder dispatch
//

#include <raff/payload_dispatcher.hh>

#include <exception>

namespace raff {

    payload_dispatcher::payload_dispatcher(chunk_scanner& scanner, const decoder_registry& decoders)
        : m_scanner(scanner)
        , m_decoders(decoders) {
    }

    std::optional<decoded_chunk> payload_dispatcher::next() {
        auto record = m_scanner.next();
        if (!record) {
            return std::nullopt;
        }
        return dispatch(std::move(*record));
    }

    decoded_chunk payload_dispatcher::dispatch(chunk_record record) const {
        decoded_chunk result;

        if (!record.payload) {
            result.record = std::move(record);
            return result;
        }

        std::vector<std::byte> payload = std::move(*record.payload);
        record.payload.reset();

        const chunk_decoder* decoder = m_decoders.find(record.current_form, record.id);
        if (!decoder) {
            result.value.emplace<std::vector<std::byte>>(std::move(payload));
        } else {
            // A failing decoder only marks its own chunk
            try {
                result.value.emplace<std::any>((*decoder)(payload));
            } catch (const std::exception& e) {
                result.value.emplace<decode_failure>(decode_failure{e.what()});
            }
        }

        result.record = std::move(record);
        return result;
    }

} // namespace raff
