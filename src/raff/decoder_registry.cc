//
// Decoder lookup with form-specific precedence
//

#include <raff/decoder_registry.hh>

namespace raff {

    bool decoder_registry::chunk_key::operator==(const chunk_key& other) const {
        return scope == other.scope && id == other.id;
    }

    std::size_t decoder_registry::chunk_key_hash::operator()(const chunk_key& key) const noexcept {
        return std::hash<std::uint32_t>{}(key.scope.to_uint32()) ^
               (std::hash<std::uint32_t>{}(key.id.to_uint32()) << 1);
    }

    decoder_registry& decoder_registry::on_chunk_in_form(fourcc form_type, fourcc chunk_id, chunk_decoder decoder) {
        form_decoders_.insert_or_assign(chunk_key{form_type, chunk_id}, std::move(decoder));
        return *this;
    }

    decoder_registry& decoder_registry::on_chunk(fourcc chunk_id, chunk_decoder decoder) {
        global_decoders_.insert_or_assign(chunk_id, std::move(decoder));
        return *this;
    }

    const chunk_decoder* decoder_registry::find(const std::optional<fourcc>& form, fourcc chunk_id) const {
        if (form) {
            auto it = form_decoders_.find(chunk_key{*form, chunk_id});
            if (it != form_decoders_.end()) {
                return &it->second;
            }
        }

        auto it = global_decoders_.find(chunk_id);
        return it != global_decoders_.end() ? &it->second : nullptr;
    }

} // namespace raff
