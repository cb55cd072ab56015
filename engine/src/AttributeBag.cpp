#include "engine/AttributeBag.h"

#include <algorithm>
#include <cmath>
#include <cstdlib>

namespace StbGeom::Engine {

    AttributeBag::AttributeBag(std::initializer_list<Entry> entries) {
        for (const auto& entry : entries) {
            set(entry.first, entry.second);
        }
    }

    void AttributeBag::set(std::string name, AttributeValue value) {
        auto it = std::find_if(entries_.begin(), entries_.end(),
            [&](const Entry& e) { return e.first == name; });
        if (it != entries_.end()) {
            it->second = std::move(value);
            return;
        }
        entries_.emplace_back(std::move(name), std::move(value));
    }

    bool AttributeBag::contains(std::string_view name) const {
        return find(name) != nullptr;
    }

    const AttributeValue* AttributeBag::find(std::string_view name) const {
        for (const auto& entry : entries_) {
            if (entry.first == name) {
                return &entry.second;
            }
        }
        return nullptr;
    }

    std::optional<double> AttributeBag::number(std::string_view name) const {
        const AttributeValue* value = find(name);
        if (!value) return std::nullopt;
        return toFiniteNumber(*value);
    }

    std::optional<std::string> AttributeBag::text(std::string_view name) const {
        const AttributeValue* value = find(name);
        if (!value) return std::nullopt;
        if (const auto* s = std::get_if<std::string>(value)) {
            return *s;
        }
        return std::nullopt;
    }

    std::optional<double> AttributeBag::firstNumber(std::initializer_list<std::string_view> names) const {
        for (std::string_view name : names) {
            if (auto n = number(name)) {
                return n;
            }
        }
        return std::nullopt;
    }

    std::optional<double> toFiniteNumber(const AttributeValue& value) {
        if (const auto* d = std::get_if<double>(&value)) {
            if (!std::isfinite(*d)) return std::nullopt;
            return *d;
        }
        const std::string& s = std::get<std::string>(value);
        if (s.empty()) return std::nullopt;

        // Leading-number parse, trailing units are ignored.
        const char* begin = s.c_str();
        char* end = nullptr;
        double parsed = std::strtod(begin, &end);
        if (end == begin || !std::isfinite(parsed)) {
            return std::nullopt;
        }
        return parsed;
    }

} // namespace StbGeom::Engine
