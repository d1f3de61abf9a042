// Tag.hpp
//
// The default tag type of the items: an opaque label compared by its name.
// Any copyable, equality-comparable and std::hash-able type can be used instead
// (see the Tag_Type parameter of Item and Tagged_Stack).

#ifndef TAG_HPP
#define TAG_HPP

#include <cstddef>
#include <string>
#include <string_view>
#include <ostream>
#include <functional>
#include <utility>

namespace TS_Concurrency {
    class Tag {
        std::string _name;

    public:
        explicit Tag(std::string name) : _name(std::move(name)) {};
        explicit Tag(std::string_view name) : _name(name) {};
        explicit Tag(const char* name) : _name(name) {};

        const std::string& name() const noexcept { return _name; }

        bool operator==(const Tag&) const = default;

        friend std::ostream& operator<<(std::ostream& os, const Tag& tag) {
            return os << tag._name;
        }
    };
} // namespace TS_Concurrency

template <>
struct std::hash<TS_Concurrency::Tag> {
    std::size_t operator()(const TS_Concurrency::Tag& tag) const noexcept {
        return std::hash<std::string>{}(tag.name());
    }
};

#endif // TAG_HPP
