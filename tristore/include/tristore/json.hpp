#pragma once
// JSON rendering of terms and triples (nlohmann::json, found by ADL)

#include "triple.hpp"
#include <nlohmann/json.hpp>

namespace tristore {

using json = nlohmann::json;

inline void to_json(json& j, const Id128& id) {
    j = id.to_string();
}

inline void to_json(json& j, const Entity& e) {
    j = json{{"kind", "entity"}, {"id", e.id().to_string()}};
    if (e.name()) j["name"] = *e.name();
    if (e.url()) j["url"] = *e.url();
}

inline void to_json(json& j, const Predicate& p) {
    j = json{{"id", p.id().to_string()}, {"name", p.name()}};
}

inline void to_json(json& j, const Triple& t);

inline void to_json(json& j, const Value& v) {
    const char* kind = Value::kind_name(v.kind());
    switch (v.kind()) {
        case Value::Kind::Entity:
            to_json(j, *v.entity());
            return;
        case Value::Kind::String:
            j = json{{"kind", kind}, {"value", *v.string()}};
            return;
        case Value::Kind::Bool:
            j = json{{"kind", kind}, {"value", *v.boolean()}};
            return;
        case Value::Kind::Integer:
            j = json{{"kind", kind}, {"value", *v.integer()}};
            return;
        case Value::Kind::Real:
            // NaN and infinities have no JSON number form
            if (std::isfinite(*v.real())) {
                j = json{{"kind", kind}, {"value", *v.real()}};
            } else {
                j = json{{"kind", kind}, {"value", v.to_string()}};
            }
            return;
        case Value::Kind::Triple:
            to_json(j, *v.triple());
            j["kind"] = kind;
            return;
    }
}

inline void to_json(json& j, const Subject& s) {
    to_json(j, s.value());
}

inline void to_json(json& j, const Triple& t) {
    json s, p, o;
    to_json(s, t.s());
    to_json(p, t.p());
    to_json(o, t.o());
    j = json{{"s", std::move(s)}, {"p", std::move(p)}, {"o", std::move(o)}};
}

} // namespace tristore
