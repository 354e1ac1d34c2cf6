#include "core/conflict.hpp"

namespace larder {

std::vector<Conflict> diverging_fields(const Conflict& proto,
                                       const Fields& local_payload,
                                       const Fields& base_fields,
                                       const Fields& remote_fields) {
    std::vector<Conflict> out;
    for (const auto& [name, local_value] : local_payload) {
        const auto& remote_value = field_or_null(remote_fields, name);
        if (same_value(local_value, remote_value)) {
            continue;
        }

        Conflict c = proto;
        c.id = Uuid::generate();
        c.field = name;
        c.local_value = local_value;
        c.remote_value = remote_value;
        if (auto it = base_fields.find(name); it != base_fields.end()) {
            c.base_value = it->second;
        } else {
            c.base_value.reset();
        }
        out.push_back(std::move(c));
    }
    return out;
}

} // namespace larder
