#pragma once

// Symbol and object reference tables.
//
// Both tables are append-only logs scoped to a single decode or encode
// call. A link may only name an entry that already exists; there are no
// forward references.
//
// Internal header — not installed.

#include <marshal-cpp/error.hpp>
#include <marshal-cpp/value.hpp>

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace marshal_cpp::wire {

// Decode side: resolves link indices back to previously read entries.
template <typename T>
class ReferenceTable {
public:
    explicit ReferenceTable(std::string_view name) : name_{name} {}

    auto push(T entry) -> std::size_t {
        entries_.push_back(std::move(entry));
        return entries_.size() - 1;
    }

    auto get(std::int64_t index) const -> const T& {
        if (index < 0 || static_cast<std::uint64_t>(index) >= entries_.size()) {
            throw Exception{ErrorKind::bad_reference,
                            std::string{name_} + " link " + std::to_string(index) +
                            " out of range (table holds " +
                            std::to_string(entries_.size()) + " entries)"};
        }
        return entries_[static_cast<std::size_t>(index)];
    }

    auto size() const -> std::size_t { return entries_.size(); }

private:
    std::string_view name_;
    std::vector<T> entries_;
};

// Encode side: remembers which keys were already written and at which
// index. Slots can also be consumed anonymously for values that have no
// identity but still occupy an index on the wire.
template <typename Key>
class ReferenceIndex {
public:
    auto find(const Key& key) const -> std::optional<std::size_t> {
        auto it = index_.find(key);
        if (it == index_.end()) return std::nullopt;
        return it->second;
    }

    auto insert(Key key) -> std::size_t {
        auto slot = next_++;
        index_.emplace(std::move(key), slot);
        return slot;
    }

    auto skip() -> std::size_t { return next_++; }

    auto size() const -> std::size_t { return next_; }

private:
    std::map<Key, std::size_t> index_;
    std::size_t next_{0};
};

using SymbolTable = ReferenceTable<Symbol>;
using ObjectTable = ReferenceTable<Value>;
using SymbolIndex = ReferenceIndex<std::string>;
using ObjectIndex = ReferenceIndex<std::uint32_t>;

}  // namespace marshal_cpp::wire
