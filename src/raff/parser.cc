//
// Whole-container helpers
//

#include <raff/parser.hh>

#include <algorithm>

namespace raff {

    const chunk_record* container_info::find(const fourcc& id) const {
        auto it = std::find_if(chunks.begin(), chunks.end(),
                               [&id](const chunk_record& c) { return c.id == id; });
        return it != chunks.end() ? &*it : nullptr;
    }

    std::vector<fourcc> container_info::identifiers() const {
        std::vector<fourcc> ids;
        ids.reserve(chunks.size());
        for (const auto& c : chunks) {
            ids.push_back(c.id);
        }
        return ids;
    }

    container_info read_container(byte_source& source, const scan_options& options) {
        auto scanner = chunk_scanner::create(source, options);

        container_info info;
        while (auto chunk = scanner->next()) {
            info.chunks.push_back(std::move(*chunk));
        }
        info.master = scanner->master();
        info.order = scanner->order();
        return info;
    }

    container_info read_container(byte_source& source) {
        return read_container(source, scan_options{});
    }

} // namespace raff
