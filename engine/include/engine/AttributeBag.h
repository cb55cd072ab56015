#ifndef STBGEOM_ATTRIBUTE_BAG_H
#define STBGEOM_ATTRIBUTE_BAG_H

#include "engine/engine_export.h"

#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace StbGeom::Engine {

    using AttributeValue = std::variant<double, std::string>;

    // Ordered name -> scalar record as it arrives from the parser (XML attributes
    // or a JSON dimension object). Key casing is whatever the source used.
    class STBGEOM_ENGINE_API AttributeBag {
    public:
        using Entry = std::pair<std::string, AttributeValue>;

        AttributeBag() = default;
        AttributeBag(std::initializer_list<Entry> entries);

        // Replaces the value of an existing key, otherwise appends.
        void set(std::string name, AttributeValue value);

        bool contains(std::string_view name) const;
        const AttributeValue* find(std::string_view name) const;

        // Numeric view of a value. Strings are parsed with a leading-number parse
        // ("400", "400.5mm"); non-finite or non-numeric values yield nullopt.
        std::optional<double> number(std::string_view name) const;
        std::optional<std::string> text(std::string_view name) const;

        // First key of the list that has a numeric value.
        std::optional<double> firstNumber(std::initializer_list<std::string_view> names) const;

        const std::vector<Entry>& entries() const { return entries_; }
        bool empty() const { return entries_.empty(); }
        size_t size() const { return entries_.size(); }

        bool operator==(const AttributeBag& other) const { return entries_ == other.entries_; }
        bool operator!=(const AttributeBag& other) const { return !(*this == other); }

    private:
        std::vector<Entry> entries_;
    };

    // Converts one attribute value to a finite number.
    STBGEOM_ENGINE_API std::optional<double> toFiniteNumber(const AttributeValue& value);

} // namespace StbGeom::Engine

#endif // STBGEOM_ATTRIBUTE_BAG_H
