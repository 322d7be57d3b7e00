/// @file json.hpp
/// @brief nlohmann/json export of decoded graphs and typed records.
///
/// Intended for inspection and diffing; there is no import path.

#pragma once

#include <marshal-cpp/graph.hpp>
#include <marshal-cpp/rgss.hpp>
#include <marshal-cpp/schema.hpp>
#include <marshal-cpp/table.hpp>

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <tuple>
#include <type_traits>

namespace marshal_cpp {

// =============================================================================
// Graph export
// =============================================================================

/// Export a decoded graph as JSON.
///
/// nil, booleans, integers, finite floats and arrays map directly.
/// Strings become JSON strings when they hold valid UTF-8. Everything
/// else is an object tagged with "__type" (and "__class" where the
/// wire carries a class name):
///
/// | Wire value        | JSON                                               |
/// |-------------------|----------------------------------------------------|
/// | symbol            | {"__type":"symbol","value":name}                   |
/// | bignum            | {"__type":"bignum","value":"-0x1234..."}           |
/// | nan / inf         | {"__type":"float","value":"nan"}                   |
/// | non-UTF-8 string  | {"__type":"bytes","value":base64}                  |
/// | hash              | {"__type":"hash","entries":[[k,v],...]}            |
/// | object            | {"__class":name,"@ivar":value,...}                 |
/// | user data         | {"__type":"user_data","__class":name,"value":b64}  |
///
/// A node reached a second time, through an alias or a cycle, is
/// written as {"__ref": node index}.
auto export_json(const Graph& graph, const Value& v) -> nlohmann::json;

/// Export a document's root value.
inline auto export_json(const Document& doc) -> nlohmann::json {
    return export_json(doc.graph, doc.root);
}

// =============================================================================
// ADL serialization of typed values
// =============================================================================

/// {"xsize":x,"ysize":y,"zsize":z,"data":[...]}
void to_json(nlohmann::json& j, const Table& table);

namespace detail {

template <typename M>
auto member_json(const M& member) -> nlohmann::json {
    return member;
}

template <typename M>
auto member_json(const std::optional<M>& member) -> nlohmann::json {
    if (!member) return nullptr;
    return *member;
}

}  // namespace detail

namespace rpg {

void to_json(nlohmann::json& j, const Color& color);
void to_json(nlohmann::json& j, const Tone& tone);
void to_json(nlohmann::json& j, const Parameter& parameter);
void to_json(nlohmann::json& j, const Script& script);

/// Records export as {"__class": name} plus one entry per schema field,
/// keyed by the wire name and holding the decoded (shifted) value.
template <Record T>
void to_json(nlohmann::json& j, const T& record) {
    j = nlohmann::json::object();
    j["__class"] = std::string{Schema<T>::class_name};
    std::apply([&](const auto&... field) {
        ((j[std::string{field.key}] =
              detail::member_json(record.*(std::remove_cvref_t<decltype(field)>::member))), ...);
    }, Schema<T>::fields);
}

}  // namespace rpg

}  // namespace marshal_cpp
