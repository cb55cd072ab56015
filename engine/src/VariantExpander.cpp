#include "engine/VariantExpander.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <string_view>

namespace StbGeom::Engine {

    namespace {

        const std::vector<std::string_view> kSameTags = {
            "StbSecSteelColumn_S_Same",
            "StbSecSteelColumn_CFT_Same",
            "StbSecSteelColumn_SRC_Same",
            "StbSecSteelBeam_S_Same",
            "StbSecSteelBeam_S_Straight",
            "StbSecSteelBrace_S_Same",
            "StbSecSteelGirder_S_Same",
            "StbSecSteelColumnSame",
            "StbSecSteelBeamStraight",
            "StbSecSteelBraceSame",
            "StbSecSteelGirderSame"
        };

        const std::vector<std::string_view> kNotSameTags = {
            "StbSecSteelColumn_S_NotSame",
            "StbSecSteelColumn_CFT_NotSame",
            "StbSecSteelColumn_SRC_NotSame",
            "StbSecSteelBeam_S_NotSame",
            "StbSecSteelBrace_S_NotSame",
            "StbSecSteelGirder_S_NotSame",
            "StbSecSteel_Column_NotSame_NotSame",
            "StbSecSteelColumnNotSame",
            "StbSecSteelBeamNotSame",
            "StbSecSteelBraceNotSame",
            "StbSecSteelGirderNotSame"
        };

        const std::vector<std::string_view> kMultiSectionTags = {
            "StbSecSteelBeam_S_Haunch",
            "StbSecSteelBeam_S_Joint",
            "StbSecSteelBeam_S_FiveTypes",
            "StbSecSteelBeam_S_Taper",
            "StbSecSteelBeamHaunch",
            "StbSecSteelBeamJoint",
            "StbSecSteelBeamFiveTypes",
            "StbSecSteelBeamTaper"
        };

        // STB 2.1.0 ordered shape wrappers, one shape element inside each.
        const std::vector<std::string_view> kShapeWrapperTags = {
            "StbSecSteelBeam_S_Shape",
            "StbSecSteelColumn_S_Shape",
            "StbSecSteelBrace_S_Shape",
            "StbSecSteelGirder_S_Shape"
        };

        bool inList(const std::vector<std::string_view>& list, std::string_view tag) {
            return std::find(list.begin(), list.end(), tag) != list.end();
        }

        // Depth-first, document order. Shape wrappers are left to expandNested.
        void collect(const std::vector<MarkupNode>& nodes, std::string_view tag, std::vector<const MarkupNode*>& out) {
            for (const auto& node : nodes) {
                if (node.tag == tag) out.push_back(&node);
                if (!inList(kShapeWrapperTags, node.tag)) collect(node.children, tag, out);
            }
        }

        void collectWrappers(const std::vector<MarkupNode>& nodes, std::string_view tag, std::vector<const MarkupNode*>& out) {
            for (const auto& node : nodes) {
                if (node.tag == tag) {
                    out.push_back(&node);
                } else {
                    collectWrappers(node.children, tag, out);
                }
            }
        }

        const MarkupNode* firstWithAttribute(const std::vector<MarkupNode>& nodes, std::string_view name) {
            for (const auto& node : nodes) {
                auto value = node.attributes.text(name);
                if (value && !value->empty()) return &node;
                if (const MarkupNode* nested = firstWithAttribute(node.children, name)) return nested;
            }
            return nullptr;
        }

        // Taper elements carry start_shape/end_shape instead of shape.
        std::optional<SectionDescriptor> makeDescriptor(const MarkupNode& node, VariantCategory category,
            AxialPosition::Kind defaultPosition) {
            auto shape = node.attributes.text("shape");
            std::optional<std::string> endShape;
            if (!shape || shape->empty()) {
                shape = node.attributes.text("start_shape");
                endShape = node.attributes.text("end_shape");
            }
            if (!shape || shape->empty()) return std::nullopt;

            SectionDescriptor descriptor;
            descriptor.category = category;
            descriptor.tag = node.tag;
            descriptor.shape = *shape;
            if (endShape && !endShape->empty()) descriptor.endShape = *endShape;
            descriptor.attributes = node.attributes;
            descriptor.position = AxialPosition::named(defaultPosition);
            if (auto pos = node.attributes.text("pos")) {
                if (auto parsed = parseAxialPosition(*pos)) descriptor.position = *parsed;
            }
            descriptor.strengthMain = node.attributes.text("strength_main");
            if (!descriptor.strengthMain) descriptor.strengthMain = node.attributes.text("strength");
            return descriptor;
        }

        // A taper descriptor becomes a START and an END section.
        void appendTaper(SectionDescriptor descriptor, std::vector<SectionDescriptor>& out) {
            SectionDescriptor end = descriptor;
            end.shape = *descriptor.endShape;
            end.position = AxialPosition::named(AxialPosition::Kind::End);
            descriptor.position = AxialPosition::named(AxialPosition::Kind::Start);
            out.push_back(std::move(descriptor));
            out.push_back(std::move(end));
        }

        bool isEndPosition(AxialPosition::Kind kind) {
            using Kind = AxialPosition::Kind;
            return kind == Kind::Start || kind == Kind::Bottom || kind == Kind::End || kind == Kind::Top;
        }

        // Drops a section repeating the shape before it, then renames the ends
        // START and END. Inner sections keep an explicit HAUNCH_S/HAUNCH_E or
        // numeric position and are CENTER otherwise.
        std::vector<SectionDescriptor> dedupeAndNormalize(std::vector<SectionDescriptor> sections) {
            std::vector<SectionDescriptor> out;
            for (auto& section : sections) {
                if (!out.empty() && out.back().shape == section.shape) continue;
                out.push_back(std::move(section));
            }
            if (out.size() < 2) return out;

            using Kind = AxialPosition::Kind;
            for (size_t i = 0; i < out.size(); ++i) {
                if (i == 0) {
                    out[i].position = AxialPosition::named(Kind::Start);
                } else if (i + 1 == out.size()) {
                    out[i].position = AxialPosition::named(Kind::End);
                } else if (isEndPosition(out[i].position.kind)) {
                    out[i].position = AxialPosition::named(Kind::Center);
                }
            }
            return out;
        }

        struct OrderedSection {
            double order = 0.0;
            SectionDescriptor descriptor;
        };

        // <StbSecSteel*_S_Shape order="n"> wrappers, sorted by order. A wrapper
        // without an order takes its place among its siblings.
        std::vector<SectionDescriptor> expandNested(const std::vector<MarkupNode>& markup) {
            std::vector<OrderedSection> ordered;
            for (std::string_view tag : kShapeWrapperTags) {
                std::vector<const MarkupNode*> wrappers;
                collectWrappers(markup, tag, wrappers);
                for (size_t w = 0; w < wrappers.size(); ++w) {
                    const MarkupNode& wrapper = *wrappers[w];
                    const double order = wrapper.attributes.number("order").value_or(static_cast<double>(w + 1));
                    for (const auto& child : wrapper.children) {
                        auto descriptor = makeDescriptor(child, VariantCategory::MultiSection, AxialPosition::Kind::Center);
                        if (!descriptor) continue;
                        if (descriptor->endShape) {
                            std::vector<SectionDescriptor> ends;
                            appendTaper(std::move(*descriptor), ends);
                            ordered.push_back({ order, std::move(ends[0]) });
                            ordered.push_back({ order + 0.5, std::move(ends[1]) });
                        } else {
                            ordered.push_back({ order, std::move(*descriptor) });
                        }
                    }
                }
            }
            std::stable_sort(ordered.begin(), ordered.end(),
                [](const OrderedSection& a, const OrderedSection& b) { return a.order < b.order; });

            std::vector<SectionDescriptor> out;
            out.reserve(ordered.size());
            for (auto& section : ordered) out.push_back(std::move(section.descriptor));
            return out;
        }

        // A multi-section reduced to one shape is a uniform member.
        bool settleMultiSection(std::vector<SectionDescriptor> sections, VariantExpansion& out) {
            sections = dedupeAndNormalize(std::move(sections));
            if (sections.empty()) return false;
            if (sections.size() == 1) {
                out.uniform = std::move(sections.front());
            } else {
                out.multiSection = std::move(sections);
            }
            return true;
        }

    } // namespace

    std::optional<AxialPosition> parseAxialPosition(std::string_view text) {
        std::string key(text);
        std::transform(key.begin(), key.end(), key.begin(),
            [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

        using Kind = AxialPosition::Kind;
        if (key == "START") return AxialPosition::named(Kind::Start);
        if (key == "BOTTOM") return AxialPosition::named(Kind::Bottom);
        if (key == "HAUNCH_S") return AxialPosition::named(Kind::HaunchStart);
        if (key == "CENTER") return AxialPosition::named(Kind::Center);
        if (key == "HAUNCH_E") return AxialPosition::named(Kind::HaunchEnd);
        if (key == "END") return AxialPosition::named(Kind::End);
        if (key == "TOP") return AxialPosition::named(Kind::Top);

        if (key.empty()) return std::nullopt;
        char* end = nullptr;
        const double value = std::strtod(key.c_str(), &end);
        if (end == key.c_str() || *end != '\0' || !std::isfinite(value)) {
            return std::nullopt;
        }
        return AxialPosition::at(value);
    }

    const char* axialPositionName(AxialPosition::Kind kind) {
        switch (kind) {
            case AxialPosition::Kind::Start: return "START";
            case AxialPosition::Kind::Bottom: return "BOTTOM";
            case AxialPosition::Kind::HaunchStart: return "HAUNCH_S";
            case AxialPosition::Kind::Center: return "CENTER";
            case AxialPosition::Kind::HaunchEnd: return "HAUNCH_E";
            case AxialPosition::Kind::End: return "END";
            case AxialPosition::Kind::Top: return "TOP";
            case AxialPosition::Kind::Numeric: return "NUMERIC";
        }
        return "CENTER";
    }

    bool isSameTag(const std::string& tag) { return inList(kSameTags, tag); }
    bool isNotSameTag(const std::string& tag) { return inList(kNotSameTags, tag); }
    bool isMultiSectionTag(const std::string& tag) { return inList(kMultiSectionTags, tag); }

    bool isJointTag(const std::string& tag) {
        return tag == "StbSecSteelBeam_S_Joint" || tag == "StbSecSteelBeamJoint";
    }

    std::string VariantExpansion::primaryShape() const {
        if (uniform) return uniform->shape;
        if (!variants.empty()) return variants.front().shape;
        if (!multiSection.empty()) return multiSection.front().shape;
        return {};
    }

    VariantExpansion expandSectionVariants(const std::vector<MarkupNode>& markup) {
        VariantExpansion out;

        for (std::string_view tag : kSameTags) {
            std::vector<const MarkupNode*> nodes;
            collect(markup, tag, nodes);
            for (const MarkupNode* node : nodes) {
                if (auto descriptor = makeDescriptor(*node, VariantCategory::Same, AxialPosition::Kind::Center)) {
                    out.uniform = std::move(descriptor);
                    return out;
                }
            }
        }

        for (std::string_view tag : kNotSameTags) {
            std::vector<const MarkupNode*> nodes;
            collect(markup, tag, nodes);
            for (const MarkupNode* node : nodes) {
                if (auto descriptor = makeDescriptor(*node, VariantCategory::NotSame, AxialPosition::Kind::Top)) {
                    out.variants.push_back(std::move(*descriptor));
                }
            }
        }
        if (!out.variants.empty()) {
            return out;
        }

        std::vector<SectionDescriptor> multiSection;
        for (std::string_view tag : kMultiSectionTags) {
            std::vector<const MarkupNode*> nodes;
            collect(markup, tag, nodes);
            for (const MarkupNode* node : nodes) {
                auto descriptor = makeDescriptor(*node, VariantCategory::MultiSection, AxialPosition::Kind::Center);
                if (!descriptor) continue;
                if (descriptor->endShape) {
                    appendTaper(std::move(*descriptor), multiSection);
                } else {
                    multiSection.push_back(std::move(*descriptor));
                }
            }
        }
        if (settleMultiSection(std::move(multiSection), out)) {
            return out;
        }

        if (settleMultiSection(expandNested(markup), out)) {
            return out;
        }

        const MarkupNode* node = firstWithAttribute(markup, "shape");
        if (!node) node = firstWithAttribute(markup, "start_shape");
        if (node) {
            out.uniform = makeDescriptor(*node, VariantCategory::Fallback, AxialPosition::Kind::Center);
        }
        return out;
    }

} // namespace StbGeom::Engine
