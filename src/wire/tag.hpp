#pragma once

// Tag protocol for the Marshal 4.8 binary format.
//
// A stream is:
//   major version (1 byte: 0x04)
//   minor version (1 byte: 0x08)
//   value
//
// and every value starts with one tag byte:
//   '0' 'T' 'F'        nil, true, false
//   'i' long           fixnum
//   ':' bytes          symbol (registers a symbol slot)
//   ';' long           symbol link
//   '"' bytes          string
//   '/' bytes byte     regexp
//   'f' bytes          float as text
//   'l' sign long raw  bignum, length in 16-bit words
//   '[' long values    array
//   '{' long pairs     hash
//   '}' long pairs val hash with default value
//   'o' sym long ivars object
//   'S' sym long pairs struct
//   'u' sym bytes      user-defined dump
//   'U' sym value      user marshal
//   'd' sym value      data object
//   'c' 'm' 'M' bytes  class, module, legacy module
//   'e' sym value      value extended by a module
//   'C' sym value      instance of a builtin subclass
//   'I' value ivars    value carrying instance variables
//   '@' long           object link
//
// "bytes" is a long length followed by that many raw bytes.
//
// Internal header — not installed.

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>

namespace marshal_cpp::wire {

inline constexpr std::uint8_t major_version = 4;
inline constexpr std::uint8_t minor_version = 8;

inline constexpr std::array<std::byte, 2> version_header = {
    std::byte{major_version}, std::byte{minor_version}
};

enum class Tag : std::uint8_t {
    nil           = '0',
    true_         = 'T',
    false_        = 'F',
    fixnum        = 'i',
    symbol        = ':',
    symbol_link   = ';',
    string        = '"',
    regexp        = '/',
    float_        = 'f',
    bignum        = 'l',
    array         = '[',
    hash          = '{',
    hash_default  = '}',
    object        = 'o',
    struct_       = 'S',
    user_defined  = 'u',
    user_marshal  = 'U',
    data          = 'd',
    class_        = 'c',
    module        = 'm',
    module_old    = 'M',
    extended      = 'e',
    user_class    = 'C',
    ivar          = 'I',
    object_link   = '@',
};

// Classify a raw byte, or nullopt if it is not a known tag.
constexpr auto to_tag(std::byte b) noexcept -> std::optional<Tag> {
    switch (static_cast<Tag>(b)) {
        case Tag::nil:
        case Tag::true_:
        case Tag::false_:
        case Tag::fixnum:
        case Tag::symbol:
        case Tag::symbol_link:
        case Tag::string:
        case Tag::regexp:
        case Tag::float_:
        case Tag::bignum:
        case Tag::array:
        case Tag::hash:
        case Tag::hash_default:
        case Tag::object:
        case Tag::struct_:
        case Tag::user_defined:
        case Tag::user_marshal:
        case Tag::data:
        case Tag::class_:
        case Tag::module:
        case Tag::module_old:
        case Tag::extended:
        case Tag::user_class:
        case Tag::ivar:
        case Tag::object_link:
            return static_cast<Tag>(b);
    }
    return std::nullopt;
}

// Whether a value with this tag occupies a slot in the object table.
// Wrappers and links never do; their inner value may.
constexpr auto registers_object(Tag tag) noexcept -> bool {
    switch (tag) {
        case Tag::string:
        case Tag::regexp:
        case Tag::float_:
        case Tag::bignum:
        case Tag::array:
        case Tag::hash:
        case Tag::hash_default:
        case Tag::object:
        case Tag::struct_:
        case Tag::user_defined:
        case Tag::user_marshal:
        case Tag::data:
        case Tag::class_:
        case Tag::module:
        case Tag::module_old:
            return true;
        default:
            return false;
    }
}

// Check the two-byte version header at the front of a buffer.
constexpr auto has_version_header(std::span<const std::byte> data) noexcept -> bool {
    return data.size() >= 2 &&
           data[0] == version_header[0] &&
           data[1] == version_header[1];
}

}  // namespace marshal_cpp::wire
